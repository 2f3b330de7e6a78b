#include "UncertaintyQuantification.h"

#include "PriorModel.h"
#include "ScreenErrors.h"
#include "Session.h"
#include "StimulusGenerator.h"

#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>
#include <random>
#include <utility>

namespace chroma {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}

// Plates depend only on (trial index, seed material), so a cohort sharing one
// prior sees the same plates. Precompute them once and replay.
class ReplayStimulusGenerator final : public StimulusGenerator {
public:
    ReplayStimulusGenerator(const PlateStimulusGenerator& source, int trial_count, std::int64_t seed_material)
        : source_(source), seed_material_(seed_material) {
        draws_.reserve(static_cast<std::size_t>(trial_count));
        for (int i = 0; i < trial_count; ++i) {
            draws_.push_back(source_.draw(i, seed_material_));
        }
    }

    StimulusDraw draw(int trial_index, std::int64_t seed_material) const override {
        if (seed_material == seed_material_ && trial_index >= 0 &&
            trial_index < static_cast<int>(draws_.size())) {
            return draws_[static_cast<std::size_t>(trial_index)];
        }
        return source_.draw(trial_index, seed_material);
    }

private:
    PlateStimulusGenerator source_;
    std::int64_t seed_material_ = 0;
    std::vector<StimulusDraw> draws_;
};

MonteCarloUQ::SubjectRun runSession(const ScreenConfig& screen,
                                    const std::string& category,
                                    bool condition_positive,
                                    std::uint32_t response_seed,
                                    std::shared_ptr<const StimulusGenerator> stimulus) {
    ScreeningSession session(screen, std::move(stimulus));
    session.begin(category);

    std::mt19937 rng(response_seed);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);

    MonteCarloUQ::SubjectRun run;
    while (session.state() == SessionState::InProgress) {
        const TrialParameters& p = session.currentTrial().params;
        const double p_correct = condition_positive ? p.p_correct_if_positive : p.p_correct_if_negative;
        const bool correct = unit_dist(rng) < p_correct;
        if (correct) ++run.correct;
        session.recordOutcome(correct);
    }

    run.trajectory = session.trajectory();
    run.conjugate_mean = session.conjugateSummary().mean;
    return run;
}
} // namespace

MonteCarloUQ::MonteCarloUQ() = default;

void MonteCarloUQ::setScenario(const ScenarioConfig& scenario) {
    scenario_ = scenario;
}

void MonteCarloUQ::setRanges(const UQRanges& ranges) {
    ranges_ = ranges;
}

MonteCarloUQ::SubjectRun MonteCarloUQ::simulateSubject(const ScreenConfig& screen,
                                                       const std::string& category,
                                                       bool condition_positive,
                                                       std::uint32_t response_seed) {
    return runSession(screen, category, condition_positive, response_seed, nullptr);
}

MonteCarloUQ::UQResult MonteCarloUQ::summarize(const std::vector<double>& values) {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

MonteCarloUQ::CohortSummary MonteCarloUQ::runCohort(const ScenarioConfig& scenario,
                                                    bool condition_positive,
                                                    int samples,
                                                    std::uint32_t seed) const {
    validateConfig(scenario.screen);
    const ScreenConfig& base = scenario.screen;

    const double prior = PriorModel(base.priors).priorFor(scenario.category);
    const std::int64_t seed_material = (base.stimulus.fixed_seed_material >= 0)
        ? base.stimulus.fixed_seed_material
        : seedMaterialForPrior(prior);
    const auto stimulus = std::make_shared<ReplayStimulusGenerator>(
        PlateStimulusGenerator(base.stimulus.background_dots), base.trial_count, seed_material);

    std::mt19937 rng(seed);
    std::vector<double> pos_intercepts;
    std::vector<double> neg_intercepts;
    std::vector<double> decays;
    if (scenario.vary_model_constants) {
        pos_intercepts = latinHypercubeSamples(ranges_.positive_intercept.min,
                                               ranges_.positive_intercept.max,
                                               samples,
                                               rng);
        neg_intercepts = latinHypercubeSamples(ranges_.negative_intercept.min,
                                               ranges_.negative_intercept.max,
                                               samples,
                                               rng);
        decays = latinHypercubeSamples(ranges_.decay_per_trial.min,
                                       ranges_.decay_per_trial.max,
                                       samples,
                                       rng);
    }

    std::vector<double> final_posterior;
    std::vector<double> conjugate_mean;
    std::vector<double> correct_fraction;
    final_posterior.reserve(static_cast<std::size_t>(samples));
    conjugate_mean.reserve(static_cast<std::size_t>(samples));
    correct_fraction.reserve(static_cast<std::size_t>(samples));

    CohortSummary out;
    out.subjects = samples;
    out.mean_trajectory.assign(static_cast<std::size_t>(base.trial_count) + 1, 0.0);

    int flagged = 0;
    for (int i = 0; i < samples; ++i) {
        ScreenConfig varied = base;
        if (scenario.vary_model_constants) {
            varied.positive.intercept = pos_intercepts[i];
            varied.negative.intercept = neg_intercepts[i];
            varied.ramp.decay_per_trial = decays[i];
        }

        const std::uint32_t response_seed = seed + 7919u * static_cast<std::uint32_t>(i + 1);
        const SubjectRun run = runSession(varied, scenario.category, condition_positive,
                                          response_seed, stimulus);

        const double fp = run.trajectory.back();
        final_posterior.push_back(fp);
        conjugate_mean.push_back(run.conjugate_mean);
        correct_fraction.push_back(static_cast<double>(run.correct) / static_cast<double>(base.trial_count));
        if (fp >= scenario.decision_threshold) ++flagged;

        for (std::size_t k = 0; k < run.trajectory.size() && k < out.mean_trajectory.size(); ++k) {
            out.mean_trajectory[k] += run.trajectory[k];
        }
    }

    for (double& v : out.mean_trajectory) {
        v /= static_cast<double>(samples);
    }
    out.final_posterior = summarize(final_posterior);
    out.conjugate_mean = summarize(conjugate_mean);
    out.correct_fraction = summarize(correct_fraction);
    out.flagged_rate = static_cast<double>(flagged) / static_cast<double>(samples);
    return out;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(const ScenarioConfig& scenario, int num_samples) const {
    if (!std::isfinite(scenario.decision_threshold) ||
        scenario.decision_threshold <= 0.0 || scenario.decision_threshold >= 1.0) {
        throwInvalidArgument("decision threshold must lie in (0,1)");
    }
    const int samples = clampSamples(num_samples);

    UQSummary summary{};
    summary.decision_threshold = scenario.decision_threshold;
    summary.positive = runCohort(scenario, true, samples, seed_);
    summary.negative = runCohort(scenario, false, samples, seed_ + 1u);
    summary.sensitivity = summary.positive.flagged_rate;
    summary.specificity = 1.0 - summary.negative.flagged_rate;
    return summary;
}

MonteCarloUQ::UQSummary MonteCarloUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(scenario_, num_samples);
}

} // namespace chroma
