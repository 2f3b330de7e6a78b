#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "ScreenConfig.h"

namespace chroma {

// Operating characteristics of a screening configuration, estimated by running
// simulated condition-positive and condition-negative subjects through complete
// sessions. Subject responses are Bernoulli draws from the trial likelihoods.
// Optionally the band intercepts and ramp decay are Latin-hypercube sampled per
// subject to propagate uncertainty in the model constants.
class MonteCarloUQ {
public:
    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct ScenarioConfig {
        ScreenConfig screen{};
        std::string category = "male";
        // Final posterior at or above this flags the subject as positive.
        double decision_threshold = 0.15;
        bool vary_model_constants = false;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct CohortSummary {
        int subjects = 0;
        UQResult final_posterior{};
        UQResult conjugate_mean{};
        UQResult correct_fraction{};
        // Fraction of subjects whose final posterior reached the decision threshold.
        double flagged_rate = 0.0;
        // Mean posterior after each trial (length N+1).
        std::vector<double> mean_trajectory;
    };

    struct UQSummary {
        CohortSummary positive{};
        CohortSummary negative{};
        double decision_threshold = 0.0;
        double sensitivity = 0.0;
        double specificity = 0.0;
    };

    // Applied only when ScenarioConfig::vary_model_constants is set.
    struct UQRanges {
        ParameterRange positive_intercept{0.33, 0.37};
        ParameterRange negative_intercept{0.43, 0.47};
        ParameterRange decay_per_trial{0.02, 0.06};
    };

    struct SubjectRun {
        std::vector<double> trajectory;
        int correct = 0;
        double conjugate_mean = 0.0;
    };

    MonteCarloUQ();

    void setScenario(const ScenarioConfig& scenario);
    void setRanges(const UQRanges& ranges);
    void setSeed(std::uint32_t seed) { seed_ = seed; }

    UQSummary runMonteCarlo(const ScenarioConfig& scenario, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

    // One full session for a subject with known condition status.
    static SubjectRun simulateSubject(const ScreenConfig& screen,
                                      const std::string& category,
                                      bool condition_positive,
                                      std::uint32_t response_seed);

    static UQResult summarize(const std::vector<double>& values);

private:
    ScenarioConfig scenario_{};
    UQRanges ranges_{};
    std::uint32_t seed_ = 1337u;

    CohortSummary runCohort(const ScenarioConfig& scenario, bool condition_positive,
                            int samples, std::uint32_t seed) const;
};

} // namespace chroma
