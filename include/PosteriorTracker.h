#pragma once

#include <cstddef>
#include <vector>

namespace chroma {

struct TrialObservation {
    bool correct = false;
    double p_correct_if_positive = 0.5;
    double p_correct_if_negative = 0.5;
};

// Likelihood-ratio posterior over {condition-positive, condition-negative}.
//
// Every record() recomputes the posterior from the prior and the full stored history
// (product of per-trial likelihoods), so any trajectory entry can be reproduced from
// the history alone. A zero or non-finite denominator (underflow on very long or
// extreme histories) keeps the previous posterior instead of producing NaN.
class SequentialPosteriorTracker {
public:
    SequentialPosteriorTracker() = default;
    explicit SequentialPosteriorTracker(double prior);

    // Starts a fresh trajectory. InvalidArgument unless prior is in (0,1);
    // InvalidState if observations were already recorded (reset() first).
    void setPrior(double prior);
    bool hasPrior() const noexcept { return has_prior_; }

    // InvalidState without a prior; InvalidArgument for likelihoods outside (0,1).
    double record(bool correct, double p_correct_if_positive, double p_correct_if_negative);
    double record(const TrialObservation& obs);

    // NotStarted without a prior.
    double prior() const;
    double currentPosterior() const;
    const std::vector<double>& trajectory() const;

    const std::vector<TrialObservation>& history() const noexcept { return history_; }
    std::size_t recordedCount() const noexcept { return history_.size(); }
    int correctCount() const noexcept;

    // Replays the first `count` observations. Equals trajectory()[count].
    double posteriorAfter(std::size_t count) const;

    void reset();

    // Product-of-likelihoods posterior over observations [0, count).
    // Returns `fallback` when the denominator degenerates.
    static double computePosterior(double prior,
                                   const std::vector<TrialObservation>& history,
                                   std::size_t count,
                                   double fallback);

private:
    bool has_prior_ = false;
    double prior_ = 0.0;
    std::vector<TrialObservation> history_;
    std::vector<double> trajectory_;
};

} // namespace chroma
