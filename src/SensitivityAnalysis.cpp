#include "SensitivityAnalysis.h"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>

namespace chroma {

SensitivityAnalyzer::SensitivityAnalyzer() = default;

void SensitivityAnalyzer::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void SensitivityAnalyzer::clearResults() {
    results_.clear();
}

std::vector<double> SensitivityAnalyzer::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

SensitivityAnalyzer::SampleResult SensitivityAnalyzer::runScenario(const ScreenConfig& screen) const {
    MonteCarloUQ uq;
    MonteCarloUQ::ScenarioConfig mc;
    mc.screen = screen;
    mc.category = scenario_.category;
    mc.decision_threshold = scenario_.decision_threshold;

    const MonteCarloUQ::UQSummary s = uq.runMonteCarlo(mc, scenario_.subjects_per_point);

    SampleResult m{};
    m.mean_posterior_positive = s.positive.final_posterior.mean;
    m.mean_posterior_negative = s.negative.final_posterior.mean;
    m.separation = m.mean_posterior_positive - m.mean_posterior_negative;
    m.sensitivity = s.sensitivity;
    m.specificity = s.specificity;
    return m;
}

void SensitivityAnalyzer::analyzeTrialCount(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScreenConfig screen = scenario_.screen;
        screen.trial_count = std::max(1, static_cast<int>(std::lround(value)));
        const auto metrics = runScenario(screen);
        results_.push_back({"trial_count", static_cast<double>(screen.trial_count), metrics});
    }
}

void SensitivityAnalyzer::analyzeRampDecay(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScreenConfig screen = scenario_.screen;
        screen.ramp.decay_per_trial = value;
        const auto metrics = runScenario(screen);
        results_.push_back({"ramp_decay_per_trial", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeRampFloor(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScreenConfig screen = scenario_.screen;
        screen.ramp.floor_0_1 = value;
        const auto metrics = runScenario(screen);
        results_.push_back({"ramp_floor_0_1", value, metrics});
    }
}

void SensitivityAnalyzer::analyzeNegativeIntercept(const ParameterRange& range) {
    clearResults();
    for (double value : sampleValues(range)) {
        ScreenConfig screen = scenario_.screen;
        if (value <= screen.positive.intercept || value >= 1.0) continue;
        if (value + screen.negative.slope < screen.positive.intercept + screen.positive.slope) continue;
        screen.negative.intercept = value;
        screen.negative.cap = std::max(screen.negative.cap, value);
        const auto metrics = runScenario(screen);
        results_.push_back({"negative_intercept", value, metrics});
    }
}

bool SensitivityAnalyzer::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,mean_posterior_positive,mean_posterior_negative,separation,sensitivity,specificity\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.mean_posterior_positive << ','
            << row.metrics.mean_posterior_negative << ','
            << row.metrics.separation << ','
            << row.metrics.sensitivity << ','
            << row.metrics.specificity << '\n';
    }
    return true;
}

const std::vector<SensitivityAnalyzer::SensitivityRow>& SensitivityAnalyzer::results() const {
    return results_;
}

} // namespace chroma
