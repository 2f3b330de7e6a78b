#pragma once

namespace chroma {

struct BetaPosterior {
    int trials = 0;
    int correct = 0;
    double alpha_prior = 0.0;
    double beta_prior = 0.0;
    double alpha_post = 0.0;
    double beta_post = 0.0;
    double mean = 0.0;
    double variance = 0.0;
    double std_dev = 0.0;
};

// Beta-Bernoulli cross-check estimator. The prior is spread over a fixed virtual
// sample of size w: alpha = prior * w, beta = (1 - prior) * w; then k correct and
// n - k incorrect outcomes are added. Independent of the likelihood-ratio tracker;
// the two estimates are allowed to disagree.
//
// Zero trials is reported as InsufficientData rather than echoing the prior.
class ConjugateSummary {
public:
    static constexpr double kDefaultVirtualSampleSize = 10.0;

    ConjugateSummary() = default;
    explicit ConjugateSummary(double virtual_sample_size);

    BetaPosterior summarize(double prior, int trials, int correct) const;

    double virtualSampleSize() const { return w_; }

private:
    double w_ = kDefaultVirtualSampleSize;
};

} // namespace chroma
