#include "ConjugateSummary.h"

#include "ScreenErrors.h"

#include <cmath>
#include <string>

namespace chroma {

ConjugateSummary::ConjugateSummary(double virtual_sample_size) : w_(virtual_sample_size) {
    if (!std::isfinite(w_) || w_ <= 0.0) {
        throwInvalidArgument("virtual sample size must be finite and > 0");
    }
}

BetaPosterior ConjugateSummary::summarize(double prior, int trials, int correct) const {
    if (!std::isfinite(prior) || prior <= 0.0 || prior >= 1.0) {
        throwInvalidArgument("prior must lie in (0,1)");
    }
    if (trials < 0 || correct < 0 || correct > trials) {
        throwInvalidArgument("invalid counts: trials=" + std::to_string(trials) +
                             " correct=" + std::to_string(correct));
    }
    if (trials == 0) {
        throwInsufficientData("conjugate summary needs at least one completed trial");
    }

    BetaPosterior b;
    b.trials = trials;
    b.correct = correct;
    b.alpha_prior = prior * w_;
    b.beta_prior = (1.0 - prior) * w_;
    b.alpha_post = b.alpha_prior + static_cast<double>(correct);
    b.beta_post = b.beta_prior + static_cast<double>(trials - correct);

    const double s = b.alpha_post + b.beta_post;
    b.mean = b.alpha_post / s;
    b.variance = (b.alpha_post * b.beta_post) / (s * s * (s + 1.0));
    b.std_dev = std::sqrt(b.variance);
    return b;
}

} // namespace chroma
