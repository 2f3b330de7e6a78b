#include "TrialDifficulty.h"

#include "ScreenErrors.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace chroma {

TrialDifficultyModel::TrialDifficultyModel() {
    validateRamp(ramp_);
    validateBands(positive_, negative_);
}

TrialDifficultyModel::TrialDifficultyModel(const DifficultyRamp& ramp,
                                           const LikelihoodBand& positive,
                                           const LikelihoodBand& negative)
    : ramp_(ramp), positive_(positive), negative_(negative) {
    validateRamp(ramp_);
    validateBands(positive_, negative_);
}

TrialDifficultyModel::TrialDifficultyModel(const ScreenConfig& cfg)
    : TrialDifficultyModel(cfg.ramp, cfg.positive, cfg.negative) {}

double TrialDifficultyModel::rampFactor(int trial_index) const {
    if (trial_index < 0) {
        throwInvalidArgument("trial index must be >= 0, got " + std::to_string(trial_index));
    }
    const double linear = 1.0 - ramp_.decay_per_trial * static_cast<double>(trial_index);
    return std::clamp(linear, ramp_.floor_0_1, 1.0);
}

double TrialDifficultyModel::evalBand(const LikelihoodBand& band, double effective) {
    return std::clamp(band.intercept + band.slope * effective, band.intercept, band.cap);
}

TrialParameters TrialDifficultyModel::parametersFor(int trial_index, double discriminability) const {
    if (!std::isfinite(discriminability) || discriminability < 0.0 || discriminability > 1.0) {
        throwInvalidArgument("discriminability must lie in [0,1]");
    }

    TrialParameters p;
    p.index = trial_index;
    p.discriminability = discriminability;
    p.effective_discriminability = discriminability * rampFactor(trial_index);
    p.p_correct_if_positive = evalBand(positive_, p.effective_discriminability);
    p.p_correct_if_negative = evalBand(negative_, p.effective_discriminability);
    return p;
}

} // namespace chroma
