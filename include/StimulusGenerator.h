#pragma once

#include <cstdint>

namespace chroma {

struct StimulusDraw {
    int trial_index = 0;
    // Separation of figure from background, clamped to [0,1].
    double discriminability = 0.0;
    // Ground-truth response the subject should give.
    int target_value = 0;
};

// Supplies per-trial discriminability and ground truth. Implementations must be
// stateless: draw() is a pure function of its arguments, so a trial re-derived with
// the same inputs is bit-identical and generators can be shared between sessions.
class StimulusGenerator {
public:
    virtual ~StimulusGenerator() = default;

    virtual StimulusDraw draw(int trial_index, std::int64_t seed_material) const = 0;
};

// Pseudo-isochromatic plate model: a two-digit figure in a random colour over a dense
// field of random-coloured dots. Discriminability is the brightness contrast between
// the figure colour and the mean background colour. Seeded per call with
// trial_index * 42 + seed_material.
class PlateStimulusGenerator final : public StimulusGenerator {
public:
    static constexpr int kDefaultBackgroundDots = 15000;
    static constexpr int kTargetMax = 99;

    PlateStimulusGenerator() = default;
    explicit PlateStimulusGenerator(int background_dots);

    StimulusDraw draw(int trial_index, std::int64_t seed_material) const override;

    int backgroundDots() const { return background_dots_; }

private:
    int background_dots_ = kDefaultBackgroundDots;
};

// Seed material derived from the prior: int(prior * 10000).
std::int64_t seedMaterialForPrior(double prior);

} // namespace chroma
