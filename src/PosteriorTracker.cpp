#include "PosteriorTracker.h"

#include "ScreenErrors.h"

#include <cmath>
#include <string>

namespace chroma {

namespace {
bool openUnit(double x) {
    return std::isfinite(x) && x > 0.0 && x < 1.0;
}
} // namespace

SequentialPosteriorTracker::SequentialPosteriorTracker(double prior) {
    setPrior(prior);
}

void SequentialPosteriorTracker::setPrior(double prior) {
    if (!openUnit(prior)) {
        throwInvalidArgument("prior must lie in (0,1)");
    }
    if (!history_.empty()) {
        throwInvalidState("prior cannot change after outcomes were recorded; reset first");
    }
    prior_ = prior;
    has_prior_ = true;
    trajectory_.assign(1, prior);
}

double SequentialPosteriorTracker::computePosterior(double prior,
                                                    const std::vector<TrialObservation>& history,
                                                    std::size_t count,
                                                    double fallback) {
    double likelihood_pos = 1.0;
    double likelihood_neg = 1.0;
    for (std::size_t t = 0; t < count && t < history.size(); ++t) {
        const TrialObservation& o = history[t];
        if (o.correct) {
            likelihood_pos *= o.p_correct_if_positive;
            likelihood_neg *= o.p_correct_if_negative;
        } else {
            likelihood_pos *= (1.0 - o.p_correct_if_positive);
            likelihood_neg *= (1.0 - o.p_correct_if_negative);
        }
    }

    const double numerator = prior * likelihood_pos;
    const double denominator = numerator + (1.0 - prior) * likelihood_neg;
    if (!(denominator > 0.0) || !std::isfinite(denominator)) {
        return fallback;
    }

    // An underflowed term would pin the posterior to exactly 0 or 1; treat it like a
    // degenerate denominator so the trajectory stays inside (0,1).
    const double posterior = numerator / denominator;
    if (!openUnit(posterior)) {
        return fallback;
    }
    return posterior;
}

double SequentialPosteriorTracker::record(bool correct,
                                          double p_correct_if_positive,
                                          double p_correct_if_negative) {
    if (!has_prior_) {
        throwInvalidState("cannot record an outcome before a prior is set");
    }
    if (!openUnit(p_correct_if_positive) || !openUnit(p_correct_if_negative)) {
        throwInvalidArgument("trial likelihoods must lie strictly inside (0,1)");
    }

    history_.push_back({correct, p_correct_if_positive, p_correct_if_negative});

    const double previous = trajectory_.back();
    const double posterior = computePosterior(prior_, history_, history_.size(), previous);
    trajectory_.push_back(posterior);
    return posterior;
}

double SequentialPosteriorTracker::record(const TrialObservation& obs) {
    return record(obs.correct, obs.p_correct_if_positive, obs.p_correct_if_negative);
}

double SequentialPosteriorTracker::prior() const {
    if (!has_prior_) {
        throwNotStarted("no prior has been set");
    }
    return prior_;
}

double SequentialPosteriorTracker::currentPosterior() const {
    if (!has_prior_) {
        throwNotStarted("no prior has been set");
    }
    return trajectory_.back();
}

const std::vector<double>& SequentialPosteriorTracker::trajectory() const {
    if (!has_prior_) {
        throwNotStarted("no prior has been set");
    }
    return trajectory_;
}

int SequentialPosteriorTracker::correctCount() const noexcept {
    int k = 0;
    for (const auto& o : history_) {
        if (o.correct) ++k;
    }
    return k;
}

double SequentialPosteriorTracker::posteriorAfter(std::size_t count) const {
    if (!has_prior_) {
        throwNotStarted("no prior has been set");
    }
    if (count > history_.size()) {
        throwInvalidArgument("only " + std::to_string(history_.size()) +
                             " outcomes recorded, requested " + std::to_string(count));
    }
    // Chain the fallback through each prefix exactly as record() did.
    double posterior = prior_;
    for (std::size_t k = 1; k <= count; ++k) {
        posterior = computePosterior(prior_, history_, k, posterior);
    }
    return posterior;
}

void SequentialPosteriorTracker::reset() {
    has_prior_ = false;
    prior_ = 0.0;
    history_.clear();
    trajectory_.clear();
}

} // namespace chroma
