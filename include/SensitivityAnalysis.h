#pragma once

#include <string>
#include <vector>

#include "ScreenConfig.h"
#include "UncertaintyQuantification.h"

namespace chroma {

// One-at-a-time sweeps of a screening parameter. Each grid point runs a small
// simulated cohort of positive and negative subjects and records how well the final
// posteriors separate the two.
class SensitivityAnalyzer {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct ScenarioConfig {
        ScreenConfig screen{};
        std::string category = "male";
        double decision_threshold = 0.15;
        int subjects_per_point = 50;
    };

    struct SampleResult {
        double mean_posterior_positive = 0.0;
        double mean_posterior_negative = 0.0;
        // mean_posterior_positive - mean_posterior_negative
        double separation = 0.0;
        double sensitivity = 0.0;
        double specificity = 0.0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        SampleResult metrics{};
    };

    SensitivityAnalyzer();

    void setScenario(const ScenarioConfig& scenario);
    void clearResults();

    // Trial counts are rounded to the nearest integer >= 1.
    void analyzeTrialCount(const ParameterRange& range);
    void analyzeRampDecay(const ParameterRange& range);
    void analyzeRampFloor(const ParameterRange& range);
    // Negative band intercept; values that would let the negative band drop below the
    // positive band are skipped.
    void analyzeNegativeIntercept(const ParameterRange& range);

    // False if the file could not be opened.
    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

private:
    ScenarioConfig scenario_{};
    std::vector<SensitivityRow> results_{};

    SampleResult runScenario(const ScreenConfig& screen) const;
    std::vector<double> sampleValues(const ParameterRange& range) const;
};

} // namespace chroma
