#pragma once

#include "ScreenConfig.h"

namespace chroma {

struct TrialParameters {
    int index = 0;
    // Raw discriminability supplied by the stimulus source, in [0,1].
    double discriminability = 0.0;
    // After the per-trial difficulty ramp.
    double effective_discriminability = 0.0;
    double p_correct_if_positive = 0.5;
    double p_correct_if_negative = 0.5;
};

// Maps (trial index, discriminability) to the two conditional correct-response
// probabilities. Pure and immutable after construction; both outputs are
// non-decreasing in discriminability, non-increasing in trial index, and stay
// inside [intercept, cap] of their band, so never reach 0 or 1.
class TrialDifficultyModel {
public:
    TrialDifficultyModel();
    TrialDifficultyModel(const DifficultyRamp& ramp,
                         const LikelihoodBand& positive,
                         const LikelihoodBand& negative);
    explicit TrialDifficultyModel(const ScreenConfig& cfg);

    // Multiplier in [floor, 1]; InvalidArgument for a negative index.
    double rampFactor(int trial_index) const;

    // InvalidArgument for a negative index or a discriminability outside [0,1].
    TrialParameters parametersFor(int trial_index, double discriminability) const;

    const DifficultyRamp& ramp() const { return ramp_; }
    const LikelihoodBand& positiveBand() const { return positive_; }
    const LikelihoodBand& negativeBand() const { return negative_; }

private:
    DifficultyRamp ramp_{};
    LikelihoodBand positive_{0.35, 0.20, 0.60};
    LikelihoodBand negative_{0.45, 0.25, 0.70};

    static double evalBand(const LikelihoodBand& band, double effective);
};

} // namespace chroma
