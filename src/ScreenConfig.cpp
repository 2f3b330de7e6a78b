#include "ScreenConfig.h"

#include "ScreenErrors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <string>

namespace chroma {

namespace {

inline std::uint32_t fnv1a32_update(std::uint32_t h, const void* data, std::size_t len) {
    const std::uint8_t* p = reinterpret_cast<const std::uint8_t*>(data);
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint32_t>(p[i]);
        h *= 16777619u;
    }
    return h;
}

inline std::uint32_t fnv1a32_begin() { return 2166136261u; }

inline std::uint32_t fnv1a32_add_u32(std::uint32_t h, std::uint32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_i32(std::uint32_t h, std::int32_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_i64(std::uint32_t h, std::int64_t v) {
    return fnv1a32_update(h, &v, sizeof(v));
}
inline std::uint32_t fnv1a32_add_f64(std::uint32_t h, double v) {
    std::uint64_t bits = 0;
    static_assert(sizeof(bits) == sizeof(v), "unexpected double size");
    std::memcpy(&bits, &v, sizeof(v));
    return fnv1a32_update(h, &bits, sizeof(bits));
}
inline std::uint32_t fnv1a32_add_str(std::uint32_t h, const std::string& s) {
    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(s.size()));
    return fnv1a32_update(h, s.data(), s.size());
}

std::uint32_t hashBand(std::uint32_t h, const LikelihoodBand& b) {
    h = fnv1a32_add_f64(h, b.intercept);
    h = fnv1a32_add_f64(h, b.slope);
    h = fnv1a32_add_f64(h, b.cap);
    return h;
}

bool openUnit(double x) {
    return std::isfinite(x) && x > 0.0 && x < 1.0;
}

std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

// snprintf into the remaining window; keeps `used` at the NUL position on truncation.
template <typename... Args>
void appendf(char* buf, int cap, int& used, const char* fmt, Args... args) {
    if (used >= cap - 1) return;
    const int n = std::snprintf(buf + used, static_cast<std::size_t>(cap - used), fmt, args...);
    if (n < 0) return;
    used = std::min(cap - 1, used + n);
}

} // namespace

PriorTable defaultPriorTable() {
    PriorTable t;
    t.categories.push_back({"male", 0.08, {}});
    t.categories.push_back({"female", 0.005, {}});
    t.categories.push_back({"unspecified", 0.0, {{"male", 0.33}, {"female", 0.67}}});
    return t;
}

ScreenConfig presetConfig(ModelPreset preset) {
    ScreenConfig cfg;
    cfg.preset = preset;
    cfg.priors = defaultPriorTable();

    switch (preset) {
        case ModelPreset::DenseField:
            cfg.ramp = {0.04, 0.70};
            cfg.positive = {0.35, 0.20, 0.60};
            cfg.negative = {0.45, 0.25, 0.70};
            break;
        case ModelPreset::Moderate:
            cfg.ramp = {0.05, 0.60};
            cfg.positive = {0.40, 0.20, 0.65};
            cfg.negative = {0.50, 0.25, 0.75};
            break;
        case ModelPreset::HighContrast:
            cfg.ramp = {0.10, 0.50};
            cfg.positive = {0.50, 0.25, 0.80};
            cfg.negative = {0.70, 0.25, 0.95};
            break;
        default:
            throwInvalidArgument("unknown model preset " + std::to_string(static_cast<int>(preset)));
    }
    return cfg;
}

const char* presetName(ModelPreset preset) {
    switch (preset) {
        case ModelPreset::DenseField:   return "dense_field";
        case ModelPreset::Moderate:     return "moderate";
        case ModelPreset::HighContrast: return "high_contrast";
    }
    return "unknown";
}

ModelPreset parsePreset(const std::string& name) {
    const std::string v = toLower(name);
    if (v == "dense" || v == "dense_field" || v == "0") return ModelPreset::DenseField;
    if (v == "moderate" || v == "1") return ModelPreset::Moderate;
    if (v == "high" || v == "high_contrast" || v == "2") return ModelPreset::HighContrast;
    throwInvalidArgument("unknown model preset '" + name + "'");
}

void validateRamp(const DifficultyRamp& ramp) {
    if (!std::isfinite(ramp.decay_per_trial) || ramp.decay_per_trial < 0.0) {
        throwInvalidArgument("ramp decay must be finite and >= 0");
    }
    // Floor > 0 keeps some signal in every trial.
    if (!std::isfinite(ramp.floor_0_1) || ramp.floor_0_1 <= 0.0 || ramp.floor_0_1 > 1.0) {
        throwInvalidArgument("ramp floor must lie in (0,1]");
    }
}

void validateBands(const LikelihoodBand& positive, const LikelihoodBand& negative) {
    auto checkBand = [](const LikelihoodBand& b, const char* which) {
        if (!openUnit(b.intercept) || !openUnit(b.cap)) {
            throwInvalidArgument(std::string(which) + " band intercept/cap must lie in (0,1)");
        }
        if (!std::isfinite(b.slope) || b.slope < 0.0) {
            throwInvalidArgument(std::string(which) + " band slope must be finite and >= 0");
        }
        if (b.cap < b.intercept) {
            throwInvalidArgument(std::string(which) + " band cap below intercept");
        }
    };
    checkBand(positive, "positive");
    checkBand(negative, "negative");

    // Both bands are linear then capped; dominance at both ends plus a dominant cap
    // gives pNeg >= pPos everywhere on [0,1].
    if (!(negative.intercept > positive.intercept)) {
        throwInvalidArgument("negative band intercept must exceed positive band intercept");
    }
    if (negative.intercept + negative.slope < positive.intercept + positive.slope) {
        throwInvalidArgument("negative band falls below positive band at full discriminability");
    }
    if (negative.cap < positive.cap) {
        throwInvalidArgument("negative band cap below positive band cap");
    }
}

void validateConfig(const ScreenConfig& cfg) {
    if (cfg.trial_count <= 0) {
        throwInvalidArgument("trial count must be a positive integer, got " +
                             std::to_string(cfg.trial_count));
    }
    if (cfg.priors.categories.empty()) {
        throwInvalidArgument("prior table has no categories");
    }
    validateRamp(cfg.ramp);
    validateBands(cfg.positive, cfg.negative);

    const double w = cfg.conjugate.virtual_sample_size;
    if (!std::isfinite(w) || w <= 0.0) {
        throwInvalidArgument("conjugate virtual sample size must be finite and > 0");
    }

    const VerdictThresholds& v = cfg.verdict;
    if (!(openUnit(v.very_likely_negative) && openUnit(v.probably_negative) && openUnit(v.uncertain)) ||
        !(v.very_likely_negative <= v.probably_negative && v.probably_negative <= v.uncertain)) {
        throwInvalidArgument("verdict thresholds must be ordered and lie in (0,1)");
    }

    if (cfg.stimulus.background_dots <= 0) {
        throwInvalidArgument("stimulus background dot count must be positive");
    }
}

std::uint32_t configHash(const ScreenConfig& cfg) {
    std::uint32_t h = fnv1a32_begin();
    h = fnv1a32_add_u32(h, cfg.version_u32);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.preset));

    h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(cfg.priors.categories.size()));
    for (const auto& c : cfg.priors.categories) {
        h = fnv1a32_add_str(h, c.name);
        h = fnv1a32_add_f64(h, c.base_rate);
        h = fnv1a32_add_u32(h, static_cast<std::uint32_t>(c.mixture.size()));
        for (const auto& m : c.mixture) {
            h = fnv1a32_add_str(h, m.category);
            h = fnv1a32_add_f64(h, m.weight);
        }
    }

    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.trial_count));
    h = fnv1a32_add_f64(h, cfg.ramp.decay_per_trial);
    h = fnv1a32_add_f64(h, cfg.ramp.floor_0_1);
    h = hashBand(h, cfg.positive);
    h = hashBand(h, cfg.negative);
    h = fnv1a32_add_f64(h, cfg.conjugate.virtual_sample_size);
    h = fnv1a32_add_f64(h, cfg.verdict.very_likely_negative);
    h = fnv1a32_add_f64(h, cfg.verdict.probably_negative);
    h = fnv1a32_add_f64(h, cfg.verdict.uncertain);
    h = fnv1a32_add_i32(h, static_cast<std::int32_t>(cfg.stimulus.background_dots));
    h = fnv1a32_add_i64(h, cfg.stimulus.fixed_seed_material);
    return h;
}

int exportConfigText(const ScreenConfig& cfg, char* buf, int cap) {
    if (!buf || cap <= 0) return 0;
    buf[0] = '\0';

    int used = 0;
    appendf(buf, cap, used, "[ScreenConfigV%u]\n", static_cast<unsigned>(cfg.version_u32));
    appendf(buf, cap, used, "fnv_hash_u32=0x%08X\n", static_cast<unsigned>(configHash(cfg)));
    appendf(buf, cap, used, "preset=%s\n", presetName(cfg.preset));
    appendf(buf, cap, used, "trial_count=%d\n", cfg.trial_count);

    for (const auto& c : cfg.priors.categories) {
        if (c.mixture.empty()) {
            appendf(buf, cap, used, "prior.%s=%.6f\n", c.name.c_str(), c.base_rate);
        } else {
            appendf(buf, cap, used, "prior.%s=mixture(", c.name.c_str());
            for (std::size_t i = 0; i < c.mixture.size(); ++i) {
                appendf(buf, cap, used, "%s%s:%.4f", (i ? "," : ""),
                        c.mixture[i].category.c_str(), c.mixture[i].weight);
            }
            appendf(buf, cap, used, ")\n");
        }
    }

    appendf(buf, cap, used, "ramp.decay_per_trial=%.6f\n", cfg.ramp.decay_per_trial);
    appendf(buf, cap, used, "ramp.floor_0_1=%.6f\n", cfg.ramp.floor_0_1);
    appendf(buf, cap, used, "positive.intercept=%.6f\npositive.slope=%.6f\npositive.cap=%.6f\n",
            cfg.positive.intercept, cfg.positive.slope, cfg.positive.cap);
    appendf(buf, cap, used, "negative.intercept=%.6f\nnegative.slope=%.6f\nnegative.cap=%.6f\n",
            cfg.negative.intercept, cfg.negative.slope, cfg.negative.cap);
    appendf(buf, cap, used, "conjugate.virtual_sample_size=%.6f\n", cfg.conjugate.virtual_sample_size);
    appendf(buf, cap, used, "verdict.very_likely_negative=%.6f\nverdict.probably_negative=%.6f\nverdict.uncertain=%.6f\n",
            cfg.verdict.very_likely_negative, cfg.verdict.probably_negative, cfg.verdict.uncertain);
    appendf(buf, cap, used, "stimulus.background_dots=%d\n", cfg.stimulus.background_dots);
    appendf(buf, cap, used, "stimulus.fixed_seed_material=%lld\n",
            static_cast<long long>(cfg.stimulus.fixed_seed_material));
    return used;
}

} // namespace chroma
