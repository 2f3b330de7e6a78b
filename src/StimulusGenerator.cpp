#include "StimulusGenerator.h"

#include "ScreenErrors.h"

#include <algorithm>
#include <cmath>
#include <random>
#include <string>

namespace chroma {

PlateStimulusGenerator::PlateStimulusGenerator(int background_dots)
    : background_dots_(background_dots) {
    if (background_dots_ <= 0) {
        throwInvalidArgument("background dot count must be positive");
    }
}

StimulusDraw PlateStimulusGenerator::draw(int trial_index, std::int64_t seed_material) const {
    if (trial_index < 0) {
        throwInvalidArgument("trial index must be >= 0, got " + std::to_string(trial_index));
    }

    // Generator scoped to this call; nothing is shared between draws.
    const std::uint64_t seed = static_cast<std::uint64_t>(trial_index) * 42u +
                               static_cast<std::uint64_t>(seed_material);
    std::mt19937 rng(static_cast<std::mt19937::result_type>(seed & 0xFFFFFFFFu));
    std::uniform_int_distribution<int> target_dist(0, kTargetMax);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);

    StimulusDraw out;
    out.trial_index = trial_index;
    out.target_value = target_dist(rng);

    // Background: RGB per dot. Only the mean brightness matters here; positions are a
    // rendering concern and are not drawn.
    double bg_sum = 0.0;
    const int channels = background_dots_ * 3;
    for (int i = 0; i < channels; ++i) {
        bg_sum += unit_dist(rng);
    }
    const double bg_brightness = bg_sum / static_cast<double>(channels);

    double fig_sum = 0.0;
    for (int c = 0; c < 3; ++c) {
        fig_sum += unit_dist(rng);
    }
    const double fig_brightness = fig_sum / 3.0;

    out.discriminability = std::clamp(std::fabs(fig_brightness - bg_brightness), 0.0, 1.0);
    return out;
}

std::int64_t seedMaterialForPrior(double prior) {
    if (!std::isfinite(prior) || prior <= 0.0 || prior >= 1.0) {
        throwInvalidArgument("prior must lie in (0,1)");
    }
    return static_cast<std::int64_t>(prior * 10000.0);
}

} // namespace chroma
