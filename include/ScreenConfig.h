#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chroma {

// ============================================================
// Screening configuration contract
//
// Rules:
// - Every tunable lives here with an explicit default.
// - The config is immutable once a session has started.
// - configHash() covers every effective parameter in a fixed order, so two
//   sessions with the same hash were run under the same model.
// ============================================================

struct MixtureComponent {
    std::string category;
    double weight = 0.0;
};

// A category either carries a base rate directly, or (when `mixture` is non-empty)
// is a fixed-weight average of other base categories.
struct PriorCategory {
    std::string name;
    double base_rate = 0.0;
    std::vector<MixtureComponent> mixture;
};

struct PriorTable {
    std::vector<PriorCategory> categories;
};

// male 0.08, female 0.005, unspecified = 0.33 * male + 0.67 * female
PriorTable defaultPriorTable();

// Effective discriminability = d * max(1 - decay_per_trial * i, floor_0_1).
struct DifficultyRamp {
    double decay_per_trial = 0.04;
    double floor_0_1 = 0.70;
};

// p(correct) = clamp(intercept + slope * effective, intercept, cap)
struct LikelihoodBand {
    double intercept = 0.0;
    double slope = 0.0;
    double cap = 0.0;
};

struct ConjugateConfig {
    double virtual_sample_size = 10.0;
};

// Final-posterior interpretation bands (upper bounds, exclusive).
struct VerdictThresholds {
    double very_likely_negative = 0.01;
    double probably_negative = 0.05;
    double uncertain = 0.15;
};

struct StimulusConfig {
    // Background dot count for the plate model.
    int background_dots = 15000;
    // If non-negative, used as seed material instead of the prior-derived value.
    std::int64_t fixed_seed_material = -1;
};

enum class ModelPreset : int {
    DenseField   = 0, // 45-70% / 35-60%, slow ramp
    Moderate     = 1, // 50-75% / 40-65%
    HighContrast = 2, // 70-95% / 50-80%, steep ramp
};

struct ScreenConfig {
    std::uint32_t version_u32 = 1;
    std::uint32_t size_bytes_u32 = sizeof(ScreenConfig);

    ModelPreset preset = ModelPreset::DenseField;

    PriorTable priors = defaultPriorTable();
    int trial_count = 5;
    DifficultyRamp ramp{};
    LikelihoodBand positive{0.35, 0.20, 0.60};
    LikelihoodBand negative{0.45, 0.25, 0.70};
    ConjugateConfig conjugate{};
    VerdictThresholds verdict{};
    StimulusConfig stimulus{};
};

// Named default-parameter set per historical model variant.
ScreenConfig presetConfig(ModelPreset preset);

const char* presetName(ModelPreset preset);

// Case-insensitive; accepts "dense", "dense_field", "moderate", "high", "high_contrast".
// Unknown names raise InvalidArgument.
ModelPreset parsePreset(const std::string& name);

// Throws ScreenError(InvalidArgument) describing the first violated constraint.
void validateConfig(const ScreenConfig& cfg);

void validateRamp(const DifficultyRamp& ramp);
void validateBands(const LikelihoodBand& positive, const LikelihoodBand& negative);

std::uint32_t configHash(const ScreenConfig& cfg);

// Deterministic text dump. Returns bytes written (excluding NUL), 0 on a bad buffer.
int exportConfigText(const ScreenConfig& cfg, char* buf, int cap);

} // namespace chroma
