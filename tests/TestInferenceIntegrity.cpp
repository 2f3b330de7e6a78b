#include <cmath>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "ConjugateSummary.h"
#include "PosteriorTracker.h"
#include "PriorModel.h"
#include "ScreenConfig.h"
#include "ScreenErrors.h"
#include "SensitivityAnalysis.h"
#include "Session.h"
#include "StimulusGenerator.h"
#include "TrialDifficulty.h"
#include "UncertaintyQuantification.h"
#include "session_frame.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline double absd(double x) { return x < 0 ? -x : x; }
static inline double maxd(double a, double b) { return (a > b) ? a : b; }

static void requireCloseAbsOrRel(const char* name, double a, double b, double absTol, double relTol) {
    REQUIRE_FINITE(a, name);
    REQUIRE_FINITE(b, name);

    const double diff = absd(a - b);
    const double denom = maxd(absd(a), absd(b));
    const double rel = (denom > 0.0) ? (diff / denom) : diff;

    if (!(diff <= absTol || rel <= relTol)) {
        std::cerr << "[FAIL] " << name
                  << " a=" << a << " b=" << b
                  << " diff=" << diff << " (absTol=" << absTol << ")"
                  << " rel=" << rel << " (relTol=" << relTol << ")\n";
        std::exit(1);
    }
}

static void requireExact(const char* label, double a, double b) {
    REQUIRE_FINITE(a, label);
    REQUIRE_FINITE(b, label);
    if (!(a == b)) {
        std::cerr << "[FAIL] " << label << " changed unexpectedly: a=" << a << " b=" << b << "\n";
        std::exit(1);
    }
}

static void requireOpenUnit(const char* label, double p) {
    REQUIRE_FINITE(p, label);
    if (!(p > 0.0 && p < 1.0)) {
        std::cerr << "[FAIL] " << label << " outside (0,1): " << p << "\n";
        std::exit(1);
    }
}

template <typename Fn>
static void requireThrowsCode(const char* label, chroma::ErrorCode expected, Fn&& fn) {
    try {
        fn();
    } catch (const chroma::ScreenError& e) {
        if (e.code() != expected) {
            std::cerr << "[FAIL] " << label << " raised " << chroma::errorCodeName(e.code())
                      << " (expected " << chroma::errorCodeName(expected) << "): " << e.what() << "\n";
            std::exit(1);
        }
        return;
    }
    std::cerr << "[FAIL] " << label << " did not raise " << chroma::errorCodeName(expected) << "\n";
    std::exit(1);
}

template <typename Fn>
static void requireNoThrow(const char* label, Fn&& fn) {
    try {
        fn();
    } catch (const chroma::ScreenError& e) {
        std::cerr << "[FAIL] " << label << " raised " << chroma::errorCodeName(e.code())
                  << ": " << e.what() << "\n";
        std::exit(1);
    }
}

// Small plate fields keep the stochastic tests fast.
static chroma::ScreenConfig smallConfig(chroma::ModelPreset preset = chroma::ModelPreset::DenseField) {
    chroma::ScreenConfig cfg = chroma::presetConfig(preset);
    cfg.stimulus.background_dots = 200;
    return cfg;
}

// Flat bands give the same (0.4, 0.6) pair on every trial.
static chroma::ScreenConfig flatBandConfig(int trials) {
    chroma::ScreenConfig cfg = smallConfig();
    cfg.trial_count = trials;
    cfg.positive = {0.4, 0.0, 0.4};
    cfg.negative = {0.6, 0.0, 0.6};
    return cfg;
}

class FixedStimulus final : public chroma::StimulusGenerator {
public:
    explicit FixedStimulus(double d) : d_(d) {}
    chroma::StimulusDraw draw(int trial_index, std::int64_t) const override {
        chroma::StimulusDraw s;
        s.trial_index = trial_index;
        s.discriminability = d_;
        s.target_value = 12;
        return s;
    }

private:
    double d_;
};

/* =======================
 * Priors
 * ======================= */

static void runPriorTable_P1() {
    const chroma::PriorModel priors;
    requireExact("P1 male", priors.priorFor("male"), 0.08);
    requireExact("P1 female", priors.priorFor("female"), 0.005);
    requireCloseAbsOrRel("P1 unspecified mixture", priors.priorFor("unspecified"), 0.02975, 1e-12, 1e-9);

    for (const auto& name : priors.categories()) {
        requireOpenUnit(("P1 prior " + name).c_str(), priors.priorFor(name));
    }
    REQUIRE(priors.categories().size() == 3, "P1 expected three default categories");
    REQUIRE(priors.hasCategory("female") && !priors.hasCategory("Female"), "P1 lookup must be case-sensitive");

    requireThrowsCode("P1 unknown category", chroma::ErrorCode::InvalidArgument,
                      [&] { (void)priors.priorFor("martian"); });
    requireThrowsCode("P1 empty category", chroma::ErrorCode::InvalidArgument,
                      [&] { (void)priors.priorFor(""); });

    std::cout << "[PASS] P1 default prior table + unknown category rejection\n";
}

static void runPriorTableValidation_P2() {
    chroma::PriorTable dup;
    dup.categories.push_back({"a", 0.1, {}});
    dup.categories.push_back({"a", 0.2, {}});
    requireThrowsCode("P2 duplicate", chroma::ErrorCode::InvalidArgument, [&] { chroma::PriorModel m(dup); });

    chroma::PriorTable zero;
    zero.categories.push_back({"a", 0.0, {}});
    requireThrowsCode("P2 zero rate", chroma::ErrorCode::InvalidArgument, [&] { chroma::PriorModel m(zero); });

    chroma::PriorTable one;
    one.categories.push_back({"a", 1.0, {}});
    requireThrowsCode("P2 unit rate", chroma::ErrorCode::InvalidArgument, [&] { chroma::PriorModel m(one); });

    chroma::PriorTable dangling;
    dangling.categories.push_back({"a", 0.1, {}});
    dangling.categories.push_back({"mix", 0.0, {{"b", 1.0}}});
    requireThrowsCode("P2 unknown component", chroma::ErrorCode::InvalidArgument,
                      [&] { chroma::PriorModel m(dangling); });

    chroma::PriorTable weightless;
    weightless.categories.push_back({"a", 0.1, {}});
    weightless.categories.push_back({"mix", 0.0, {{"a", 0.0}}});
    requireThrowsCode("P2 zero weight", chroma::ErrorCode::InvalidArgument,
                      [&] { chroma::PriorModel m(weightless); });

    chroma::PriorTable unnormalised;
    unnormalised.categories.push_back({"a", 0.1, {}});
    unnormalised.categories.push_back({"b", 0.3, {}});
    unnormalised.categories.push_back({"mix", 0.0, {{"a", 2.0}, {"b", 2.0}}});
    const chroma::PriorModel m(unnormalised);
    requireCloseAbsOrRel("P2 normalised mixture", m.priorFor("mix"), 0.2, 1e-12, 1e-9);

    std::cout << "[PASS] P2 prior table validation (duplicates, rates, mixtures)\n";
}

/* =======================
 * Trial difficulty
 * ======================= */

static void runLikelihoodBoundsAllPresets_D1() {
    const chroma::ModelPreset presets[] = {chroma::ModelPreset::DenseField,
                                           chroma::ModelPreset::Moderate,
                                           chroma::ModelPreset::HighContrast};
    for (chroma::ModelPreset preset : presets) {
        const chroma::ScreenConfig cfg = chroma::presetConfig(preset);
        const chroma::TrialDifficultyModel model(cfg);
        for (int i = 0; i <= 40; ++i) {
            for (int s = 0; s <= 20; ++s) {
                const double d = s / 20.0;
                const chroma::TrialParameters p = model.parametersFor(i, d);
                requireOpenUnit("D1 pPos", p.p_correct_if_positive);
                requireOpenUnit("D1 pNeg", p.p_correct_if_negative);
                REQUIRE(p.p_correct_if_positive <= p.p_correct_if_negative,
                        "D1 pPos > pNeg for preset " << chroma::presetName(preset) << " i=" << i << " d=" << d);
                REQUIRE(p.p_correct_if_positive >= cfg.positive.intercept &&
                        p.p_correct_if_positive <= cfg.positive.cap, "D1 pPos outside its band");
                REQUIRE(p.p_correct_if_negative >= cfg.negative.intercept &&
                        p.p_correct_if_negative <= cfg.negative.cap, "D1 pNeg outside its band");
                REQUIRE(p.effective_discriminability <= d, "D1 ramp increased discriminability");
            }
        }
    }
    std::cout << "[PASS] D1 0 < pPos <= pNeg < 1 over (trial, discriminability) grid, all presets\n";
}

static void runRampMonotonicAndFloor_D2() {
    const chroma::TrialDifficultyModel model;
    requireExact("D2 ramp(0)", model.rampFactor(0), 1.0);
    requireCloseAbsOrRel("D2 ramp(1)", model.rampFactor(1), 0.96, 1e-12, 1e-12);

    double prev = model.rampFactor(0);
    for (int i = 1; i < 200; ++i) {
        const double f = model.rampFactor(i);
        REQUIRE(f <= prev, "D2 ramp increased at i=" << i);
        REQUIRE(f >= model.ramp().floor_0_1, "D2 ramp below floor at i=" << i);
        prev = f;
    }
    requireExact("D2 ramp floor", model.rampFactor(1000), 0.70);

    // Monotone in discriminability for a fixed trial; non-increasing in trial index for fixed d.
    for (int i = 0; i < 20; ++i) {
        double prev_pos = 0.0;
        double prev_neg = 0.0;
        for (int s = 0; s <= 50; ++s) {
            const auto p = model.parametersFor(i, s / 50.0);
            REQUIRE(p.p_correct_if_positive >= prev_pos, "D2 pPos decreased with d");
            REQUIRE(p.p_correct_if_negative >= prev_neg, "D2 pNeg decreased with d");
            prev_pos = p.p_correct_if_positive;
            prev_neg = p.p_correct_if_negative;
        }
        const auto now = model.parametersFor(i, 0.8);
        const auto next = model.parametersFor(i + 1, 0.8);
        REQUIRE(next.p_correct_if_positive <= now.p_correct_if_positive, "D2 pPos rose with trial index");
        REQUIRE(next.p_correct_if_negative <= now.p_correct_if_negative, "D2 pNeg rose with trial index");
    }

    // Trial 0 at full discriminability: pos = 0.35 + 0.20, neg = 0.45 + 0.25 (at cap).
    const auto top = model.parametersFor(0, 1.0);
    requireCloseAbsOrRel("D2 pPos(0,1)", top.p_correct_if_positive, 0.55, 1e-12, 1e-12);
    requireCloseAbsOrRel("D2 pNeg(0,1)", top.p_correct_if_negative, 0.70, 1e-12, 1e-12);

    std::cout << "[PASS] D2 ramp monotone with floor + band monotonicity\n";
}

static void runDifficultyInputValidation_D3() {
    const chroma::TrialDifficultyModel model;
    requireThrowsCode("D3 d > 1", chroma::ErrorCode::InvalidArgument, [&] { (void)model.parametersFor(0, 1.5); });
    requireThrowsCode("D3 d < 0", chroma::ErrorCode::InvalidArgument, [&] { (void)model.parametersFor(0, -0.01); });
    requireThrowsCode("D3 d NaN", chroma::ErrorCode::InvalidArgument,
                      [&] { (void)model.parametersFor(0, std::numeric_limits<double>::quiet_NaN()); });
    requireThrowsCode("D3 negative index", chroma::ErrorCode::InvalidArgument,
                      [&] { (void)model.parametersFor(-1, 0.5); });

    // Pure function: identical inputs, bit-identical outputs.
    for (int i = 0; i < 10; ++i) {
        const auto a = model.parametersFor(i, 0.37);
        const auto b = model.parametersFor(i, 0.37);
        requireExact("D3 determinism pPos", a.p_correct_if_positive, b.p_correct_if_positive);
        requireExact("D3 determinism pNeg", a.p_correct_if_negative, b.p_correct_if_negative);
    }

    requireThrowsCode("D3 inverted bands", chroma::ErrorCode::InvalidArgument, [] {
        chroma::TrialDifficultyModel bad(chroma::DifficultyRamp{}, {0.5, 0.2, 0.7}, {0.4, 0.2, 0.7});
    });
    requireThrowsCode("D3 crossing bands", chroma::ErrorCode::InvalidArgument, [] {
        chroma::TrialDifficultyModel bad(chroma::DifficultyRamp{}, {0.35, 0.40, 0.80}, {0.45, 0.10, 0.90});
    });
    requireThrowsCode("D3 cap reaches 1", chroma::ErrorCode::InvalidArgument, [] {
        chroma::TrialDifficultyModel bad(chroma::DifficultyRamp{}, {0.35, 0.20, 0.60}, {0.45, 0.25, 1.0});
    });
    requireThrowsCode("D3 zero floor", chroma::ErrorCode::InvalidArgument, [] {
        chroma::TrialDifficultyModel bad(chroma::DifficultyRamp{0.04, 0.0}, {0.35, 0.20, 0.60}, {0.45, 0.25, 0.70});
    });

    std::cout << "[PASS] D3 difficulty input validation + determinism\n";
}

/* =======================
 * Stimulus
 * ======================= */

static void runStimulusDeterminism_S1() {
    const chroma::PlateStimulusGenerator gen(500);
    for (int i = 0; i < 8; ++i) {
        const auto a = gen.draw(i, 800);
        const auto b = gen.draw(i, 800);
        requireExact("S1 discriminability", a.discriminability, b.discriminability);
        REQUIRE(a.target_value == b.target_value, "S1 target changed between identical draws");
        REQUIRE(a.target_value >= 0 && a.target_value <= chroma::PlateStimulusGenerator::kTargetMax,
                "S1 target out of [0,99]");
        REQUIRE(a.discriminability >= 0.0 && a.discriminability <= 1.0, "S1 discriminability out of [0,1]");
        REQUIRE(a.trial_index == i, "S1 trial index not echoed");
    }

    REQUIRE(chroma::seedMaterialForPrior(0.08) == 800, "S1 seed material for 0.08");
    REQUIRE(chroma::seedMaterialForPrior(0.005) == 50, "S1 seed material for 0.005");
    requireThrowsCode("S1 seed from prior 0", chroma::ErrorCode::InvalidArgument,
                      [] { (void)chroma::seedMaterialForPrior(0.0); });
    requireThrowsCode("S1 zero dots", chroma::ErrorCode::InvalidArgument,
                      [] { chroma::PlateStimulusGenerator g(0); });
    requireThrowsCode("S1 negative index", chroma::ErrorCode::InvalidArgument, [&] { (void)gen.draw(-1, 800); });

    std::cout << "[PASS] S1 plate draws deterministic + bounded\n";
}

/* =======================
 * Posterior tracker
 * ======================= */

static void runConcreteScenarios_T1() {
    chroma::SequentialPosteriorTracker t(0.08);
    requireCloseAbsOrRel("T1 one correct", t.record(true, 0.4, 0.6), 0.032 / 0.584, 1e-12, 1e-12);
    requireCloseAbsOrRel("T1 one correct (rounded)", t.currentPosterior(), 0.0548, 5e-5, 0.0);
    requireCloseAbsOrRel("T1 two correct", t.record(true, 0.4, 0.6), 0.0128 / 0.344, 1e-12, 1e-12);
    requireCloseAbsOrRel("T1 two correct (rounded)", t.currentPosterior(), 0.0372, 5e-5, 0.0);
    REQUIRE(t.trajectory().size() == 3, "T1 trajectory length != n+1");
    requireExact("T1 trajectory[0] is prior", t.trajectory()[0], 0.08);

    chroma::SequentialPosteriorTracker w(0.08);
    requireCloseAbsOrRel("T1 one wrong", w.record(false, 0.4, 0.6), 0.048 / 0.416, 1e-12, 1e-12);

    std::cout << "[PASS] T1 hand-worked posterior scenarios (0.0548, 0.0372)\n";
}

static void runUpdateDirection_T2() {
    for (double prior : {0.005, 0.02975, 0.08, 0.5}) {
        chroma::SequentialPosteriorTracker c(prior);
        REQUIRE(c.record(true, 0.45, 0.65) < prior, "T2 correct answer did not lower posterior");
        chroma::SequentialPosteriorTracker w(prior);
        REQUIRE(w.record(false, 0.45, 0.65) > prior, "T2 wrong answer did not raise posterior");
        chroma::SequentialPosteriorTracker e(prior);
        requireCloseAbsOrRel("T2 uninformative trial", e.record(true, 0.5, 0.5), prior, 1e-15, 1e-12);
    }
    std::cout << "[PASS] T2 update direction (correct lowers, wrong raises, equal likelihoods neutral)\n";
}

static void runReplayIdempotence_T3() {
    chroma::SequentialPosteriorTracker t(0.08);
    const bool pattern[] = {true, false, true, true, false, false, true, false};
    for (int i = 0; i < 8; ++i) {
        t.record(pattern[i], 0.35 + 0.02 * i, 0.50 + 0.03 * i);
    }

    for (std::size_t k = 0; k <= t.recordedCount(); ++k) {
        requireExact("T3 posteriorAfter == trajectory", t.posteriorAfter(k), t.trajectory()[k]);
        requireExact("T3 posteriorAfter repeatable", t.posteriorAfter(k), t.posteriorAfter(k));
        requireOpenUnit("T3 trajectory entry", t.trajectory()[k]);
    }

    chroma::SequentialPosteriorTracker replay(0.08);
    for (const auto& o : t.history()) {
        replay.record(o);
    }
    REQUIRE(replay.trajectory() == t.trajectory(), "T3 replayed history produced a different trajectory");
    REQUIRE(t.correctCount() == 4, "T3 correct count");

    // Same tracker: reset, re-seed and replay the identical sequence.
    const std::vector<chroma::TrialObservation> saved_history(t.history().begin(), t.history().end());
    const std::vector<double> saved_trajectory = t.trajectory();
    t.reset();
    t.setPrior(0.08);
    for (const auto& o : saved_history) {
        t.record(o);
    }
    REQUIRE(t.trajectory() == saved_trajectory, "T3 reset + replay produced a different trajectory");

    requireThrowsCode("T3 posteriorAfter beyond history", chroma::ErrorCode::InvalidArgument,
                      [&] { (void)t.posteriorAfter(9); });

    std::cout << "[PASS] T3 full-history recomputation is idempotent\n";
}

static void runTrackerMisuse_T4() {
    chroma::SequentialPosteriorTracker t;
    REQUIRE(!t.hasPrior(), "T4 default tracker has a prior");
    requireThrowsCode("T4 posterior before prior", chroma::ErrorCode::NotStarted, [&] { (void)t.currentPosterior(); });
    requireThrowsCode("T4 trajectory before prior", chroma::ErrorCode::NotStarted, [&] { (void)t.trajectory(); });
    requireThrowsCode("T4 prior before prior", chroma::ErrorCode::NotStarted, [&] { (void)t.prior(); });
    requireThrowsCode("T4 record before prior", chroma::ErrorCode::InvalidState, [&] { t.record(true, 0.4, 0.6); });

    requireThrowsCode("T4 prior 0", chroma::ErrorCode::InvalidArgument, [&] { t.setPrior(0.0); });
    requireThrowsCode("T4 prior 1", chroma::ErrorCode::InvalidArgument, [&] { t.setPrior(1.0); });
    requireThrowsCode("T4 prior NaN", chroma::ErrorCode::InvalidArgument,
                      [&] { t.setPrior(std::numeric_limits<double>::quiet_NaN()); });

    t.setPrior(0.08);
    t.record(true, 0.4, 0.6);
    const std::vector<double> before = t.trajectory();
    requireThrowsCode("T4 likelihood 1", chroma::ErrorCode::InvalidArgument, [&] { t.record(true, 1.0, 0.6); });
    requireThrowsCode("T4 likelihood 0", chroma::ErrorCode::InvalidArgument, [&] { t.record(false, 0.4, 0.0); });
    REQUIRE(t.recordedCount() == 1 && t.trajectory() == before, "T4 rejected record mutated history");

    requireThrowsCode("T4 prior change mid-session", chroma::ErrorCode::InvalidState, [&] { t.setPrior(0.2); });

    t.reset();
    REQUIRE(!t.hasPrior() && t.recordedCount() == 0, "T4 reset incomplete");
    requireThrowsCode("T4 posterior after reset", chroma::ErrorCode::NotStarted, [&] { (void)t.currentPosterior(); });

    std::cout << "[PASS] T4 tracker misuse raises the right error class\n";
}

static void runDegenerateFallback_T5() {
    // Hundreds of low-likelihood trials drive both products to zero.
    chroma::SequentialPosteriorTracker t(0.5);
    requireNoThrow("T5 long history", [&] {
        for (int i = 0; i < 400; ++i) {
            t.record(true, 0.01, 0.02);
        }
    });

    const auto& traj = t.trajectory();
    REQUIRE(traj.size() == 401, "T5 trajectory length");
    for (double p : traj) {
        requireOpenUnit("T5 trajectory entry", p);
    }
    requireExact("T5 posterior frozen after underflow", traj[400], traj[399]);
    requireExact("T5 replay with fallback", t.posteriorAfter(400), traj[400]);

    const double direct = chroma::SequentialPosteriorTracker::computePosterior(0.5, t.history(), 400, 0.123);
    requireExact("T5 fallback returned on degenerate denominator", direct, 0.123);

    std::cout << "[PASS] T5 degenerate denominator keeps previous posterior\n";
}

/* =======================
 * Conjugate summary
 * ======================= */

static void runConjugateSummary_C1() {
    const chroma::ConjugateSummary cs;
    const chroma::BetaPosterior b = cs.summarize(0.08, 3, 1);
    requireCloseAbsOrRel("C1 alpha_prior", b.alpha_prior, 0.8, 1e-12, 1e-12);
    requireCloseAbsOrRel("C1 beta_prior", b.beta_prior, 9.2, 1e-12, 1e-12);
    requireCloseAbsOrRel("C1 alpha_post", b.alpha_post, 1.8, 1e-12, 1e-12);
    requireCloseAbsOrRel("C1 beta_post", b.beta_post, 11.2, 1e-12, 1e-12);
    requireCloseAbsOrRel("C1 mean", b.mean, 1.8 / 13.0, 1e-12, 1e-12);
    requireCloseAbsOrRel("C1 mean (rounded)", b.mean, 0.1385, 5e-5, 0.0);
    requireCloseAbsOrRel("C1 variance", b.variance, (1.8 * 11.2) / (13.0 * 13.0 * 14.0), 1e-12, 1e-9);
    requireCloseAbsOrRel("C1 std_dev", b.std_dev * b.std_dev, b.variance, 1e-15, 1e-9);

    requireThrowsCode("C1 zero trials", chroma::ErrorCode::InsufficientData, [&] { (void)cs.summarize(0.08, 0, 0); });
    requireThrowsCode("C1 k > n", chroma::ErrorCode::InvalidArgument, [&] { (void)cs.summarize(0.08, 2, 3); });
    requireThrowsCode("C1 negative n", chroma::ErrorCode::InvalidArgument, [&] { (void)cs.summarize(0.08, -1, 0); });
    requireThrowsCode("C1 bad prior", chroma::ErrorCode::InvalidArgument, [&] { (void)cs.summarize(1.0, 3, 1); });
    requireThrowsCode("C1 bad w", chroma::ErrorCode::InvalidArgument, [] { chroma::ConjugateSummary bad(0.0); });

    std::cout << "[PASS] C1 Beta-Bernoulli summary (1.8, 11.2, 0.1385) + zero-trial policy\n";
}

/* =======================
 * Session state machine
 * ======================= */

static void runSessionLifecycle_SM1() {
    chroma::ScreeningSession s(smallConfig());
    REQUIRE(s.state() == chroma::SessionState::AwaitingPrior, "SM1 initial state");
    requireThrowsCode("SM1 posterior before begin", chroma::ErrorCode::NotStarted, [&] { (void)s.currentPosterior(); });
    requireThrowsCode("SM1 trajectory before begin", chroma::ErrorCode::NotStarted, [&] { (void)s.trajectory(); });
    requireThrowsCode("SM1 seed before begin", chroma::ErrorCode::NotStarted, [&] { (void)s.seedMaterial(); });
    requireThrowsCode("SM1 record before begin", chroma::ErrorCode::InvalidState, [&] { s.recordOutcome(true); });
    requireThrowsCode("SM1 trial before begin", chroma::ErrorCode::InvalidState, [&] { (void)s.trial(0); });

    requireThrowsCode("SM1 unknown category", chroma::ErrorCode::InvalidArgument, [&] { s.begin("martian"); });
    REQUIRE(s.state() == chroma::SessionState::AwaitingPrior, "SM1 failed begin changed state");

    s.begin("male");
    REQUIRE(s.state() == chroma::SessionState::InProgress, "SM1 begin did not start session");
    REQUIRE(s.category() == "male", "SM1 category not kept");
    requireExact("SM1 prior", s.prior(), 0.08);
    REQUIRE(s.seedMaterial() == 800, "SM1 seed material from prior");
    requireThrowsCode("SM1 second begin", chroma::ErrorCode::InvalidState, [&] { s.begin("female"); });
    requireThrowsCode("SM1 conjugate with zero trials", chroma::ErrorCode::InsufficientData,
                      [&] { (void)s.conjugateSummary(); });

    requireThrowsCode("SM1 out-of-order record", chroma::ErrorCode::InvalidArgument, [&] { s.recordOutcome(2, true); });
    requireThrowsCode("SM1 out-of-range record", chroma::ErrorCode::InvalidArgument, [&] { s.recordOutcome(5, true); });
    requireThrowsCode("SM1 out-of-range trial", chroma::ErrorCode::InvalidArgument, [&] { (void)s.trial(-1); });

    s.recordOutcome(0, true);
    requireThrowsCode("SM1 re-record", chroma::ErrorCode::InvalidState, [&] { s.recordOutcome(0, false); });
    REQUIRE(s.completedTrials() == 1, "SM1 rejected re-record was counted");

    while (s.state() == chroma::SessionState::InProgress) {
        s.recordOutcome(false);
    }
    REQUIRE(s.state() == chroma::SessionState::Completed, "SM1 session did not complete after N outcomes");
    REQUIRE(s.completedTrials() == 5, "SM1 completed count");
    REQUIRE(s.trajectory().size() == 6, "SM1 trajectory length");
    requireThrowsCode("SM1 record after completion", chroma::ErrorCode::InvalidState, [&] { s.recordOutcome(true); });
    requireThrowsCode("SM1 current trial after completion", chroma::ErrorCode::InvalidState,
                      [&] { (void)s.currentTrial(); });

    const chroma::SessionReport r = s.report();
    REQUIRE(r.completed == 5 && r.correct == 1 && r.rows.size() == 5, "SM1 report counts");
    REQUIRE(r.has_conjugate && r.conjugate.trials == 5, "SM1 report conjugate");
    for (const auto& row : r.rows) {
        requireExact("SM1 row before", row.posterior_before, s.trajectory()[row.index]);
        requireExact("SM1 row after", row.posterior_after, s.trajectory()[row.index + 1]);
    }
    requireExact("SM1 report final", r.final_posterior, s.currentPosterior());
    REQUIRE(r.config_hash_u32 == chroma::configHash(s.config()), "SM1 report config hash");

    s.reset();
    REQUIRE(s.state() == chroma::SessionState::AwaitingPrior, "SM1 reset state");
    requireThrowsCode("SM1 posterior after reset", chroma::ErrorCode::NotStarted, [&] { (void)s.currentPosterior(); });
    s.beginWithPrior(0.3);
    requireExact("SM1 external prior", s.prior(), 0.3);

    std::cout << "[PASS] SM1 session state machine AwaitingPrior -> InProgress -> Completed\n";
}

static void runSessionConcreteScenario_SM2() {
    chroma::ScreeningSession two(flatBandConfig(2));
    two.begin("male");
    const auto& t0 = two.currentTrial();
    requireCloseAbsOrRel("SM2 flat pPos", t0.params.p_correct_if_positive, 0.4, 1e-15, 0.0);
    requireCloseAbsOrRel("SM2 flat pNeg", t0.params.p_correct_if_negative, 0.6, 1e-15, 0.0);
    requireCloseAbsOrRel("SM2 after one", two.recordOutcome(true), 0.0548, 5e-5, 0.0);
    requireCloseAbsOrRel("SM2 after two", two.recordOutcome(true), 0.0372, 5e-5, 0.0);
    REQUIRE(two.verdict() == chroma::Verdict::ProbablyNegative, "SM2 verdict for 0.0372");

    chroma::ScreeningSession three(flatBandConfig(3));
    three.begin("male");
    three.recordOutcome(true);
    three.recordOutcome(false);
    three.recordOutcome(false);
    const chroma::BetaPosterior b = three.conjugateSummary();
    requireCloseAbsOrRel("SM2 alpha_post", b.alpha_post, 1.8, 1e-12, 1e-12);
    requireCloseAbsOrRel("SM2 beta_post", b.beta_post, 11.2, 1e-12, 1e-12);
    requireCloseAbsOrRel("SM2 conjugate mean", b.mean, 0.1385, 5e-5, 0.0);

    std::cout << "[PASS] SM2 session reproduces hand-worked scenarios\n";
}

static void runSessionTrialDeterminism_SM3() {
    const chroma::ScreenConfig cfg = smallConfig();
    chroma::ScreeningSession a(cfg);
    chroma::ScreeningSession b(cfg);
    a.begin("female");
    b.begin("female");

    // Lazy generation out of order must match in-order generation.
    const int lastTarget = a.trial(4).target_value;
    for (int i = 0; i < cfg.trial_count; ++i) {
        const auto& ta = a.trial(i);
        const auto& tb = b.trial(i);
        requireExact("SM3 discriminability", ta.params.discriminability, tb.params.discriminability);
        requireExact("SM3 pPos", ta.params.p_correct_if_positive, tb.params.p_correct_if_positive);
        requireExact("SM3 pNeg", ta.params.p_correct_if_negative, tb.params.p_correct_if_negative);
        REQUIRE(ta.target_value == tb.target_value, "SM3 target differs between identical sessions");
        REQUIRE(&a.trial(i) == &ta, "SM3 trial regenerated instead of cached");
    }
    REQUIRE(a.trial(4).target_value == lastTarget, "SM3 cached trial changed");

    // Sessions sharing one generator do not share state.
    auto shared = std::make_shared<FixedStimulus>(0.5);
    chroma::ScreeningSession x(cfg, shared);
    chroma::ScreeningSession y(cfg, shared);
    x.begin("male");
    y.begin("male");
    x.recordOutcome(false);
    y.recordOutcome(true);
    REQUIRE(x.currentPosterior() > y.currentPosterior(), "SM3 sessions interfered through shared generator");
    REQUIRE(x.completedTrials() == 1 && y.completedTrials() == 1, "SM3 shared generator leaked history");

    std::cout << "[PASS] SM3 trial generation deterministic + cached + isolated\n";
}

static void runDashboardFrameAfterReset_SM5() {
    chroma::ScreeningSession s(smallConfig());
    bool pending_reset = false;

    chroma::vis::SessionFrame f = chroma::vis::beginSessionFrame(s, pending_reset);
    REQUIRE(!f.started && f.trajectory.empty(), "SM5 idle frame reports a started session");

    s.begin("male");
    s.recordOutcome(true);
    f = chroma::vis::beginSessionFrame(s, pending_reset);
    REQUIRE(f.started && f.state == chroma::SessionState::InProgress, "SM5 frame missed the started session");
    REQUIRE(f.trajectory.size() == 2 && f.report.completed == 1, "SM5 frame snapshot counts");
    requireExact("SM5 frame posterior", f.report.final_posterior, f.trajectory.back());

    // Reset requested while the frame above is still being drawn: the snapshot stays
    // usable and the live session would now refuse these queries.
    pending_reset = true;
    REQUIRE(f.trajectory.size() == 2, "SM5 snapshot changed before the next frame");
    requireNoThrow("SM5 next frame applies reset", [&] { f = chroma::vis::beginSessionFrame(s, pending_reset); });
    REQUIRE(!pending_reset, "SM5 reset request not cleared");
    REQUIRE(!f.started && f.state == chroma::SessionState::AwaitingPrior, "SM5 reset not applied");
    REQUIRE(f.trajectory.empty() && f.report.rows.empty(), "SM5 stale rows after reset");
    requireThrowsCode("SM5 trajectory after reset", chroma::ErrorCode::NotStarted, [&] { (void)s.trajectory(); });
    requireThrowsCode("SM5 report after reset", chroma::ErrorCode::NotStarted, [&] { (void)s.report(); });

    // Completed session reset the same way.
    s.begin("female");
    while (s.state() == chroma::SessionState::InProgress) {
        s.recordOutcome(false);
    }
    f = chroma::vis::beginSessionFrame(s, pending_reset);
    REQUIRE(f.state == chroma::SessionState::Completed && f.report.has_conjugate, "SM5 completed frame");
    pending_reset = true;
    requireNoThrow("SM5 reset after completion", [&] { f = chroma::vis::beginSessionFrame(s, pending_reset); });
    REQUIRE(!f.started && f.completed == 0, "SM5 completed session not reset");

    std::cout << "[PASS] SM5 dashboard frame snapshot survives a reset request\n";
}

static void runVerdictBands_SM4() {
    const chroma::VerdictThresholds v;
    REQUIRE(chroma::classifyPosterior(0.005, v) == chroma::Verdict::VeryLikelyNegative, "SM4 0.005");
    REQUIRE(chroma::classifyPosterior(0.01, v) == chroma::Verdict::ProbablyNegative, "SM4 0.01 boundary");
    REQUIRE(chroma::classifyPosterior(0.03, v) == chroma::Verdict::ProbablyNegative, "SM4 0.03");
    REQUIRE(chroma::classifyPosterior(0.10, v) == chroma::Verdict::Uncertain, "SM4 0.10");
    REQUIRE(chroma::classifyPosterior(0.20, v) == chroma::Verdict::PossiblyPositive, "SM4 0.20");
    REQUIRE(std::strlen(chroma::verdictText(chroma::Verdict::Uncertain)) > 0, "SM4 empty verdict text");
    std::cout << "[PASS] SM4 verdict bands\n";
}

/* =======================
 * Configuration
 * ======================= */

static void runConfigValidationAndHash_CF1() {
    requireNoThrow("CF1 default config", [] { chroma::validateConfig(chroma::ScreenConfig{}); });
    requireNoThrow("CF1 presets", [] {
        chroma::validateConfig(chroma::presetConfig(chroma::ModelPreset::DenseField));
        chroma::validateConfig(chroma::presetConfig(chroma::ModelPreset::Moderate));
        chroma::validateConfig(chroma::presetConfig(chroma::ModelPreset::HighContrast));
    });

    REQUIRE(chroma::parsePreset("HIGH") == chroma::ModelPreset::HighContrast, "CF1 parsePreset case");
    REQUIRE(chroma::parsePreset("moderate") == chroma::ModelPreset::Moderate, "CF1 parsePreset moderate");
    requireThrowsCode("CF1 unknown preset", chroma::ErrorCode::InvalidArgument, [] { (void)chroma::parsePreset("bogus"); });

    chroma::ScreenConfig zero;
    zero.trial_count = 0;
    requireThrowsCode("CF1 zero trials", chroma::ErrorCode::InvalidArgument, [&] { chroma::ScreeningSession s(zero); });

    chroma::ScreenConfig inverted;
    inverted.negative.intercept = 0.30;
    requireThrowsCode("CF1 inverted bands", chroma::ErrorCode::InvalidArgument, [&] { chroma::validateConfig(inverted); });

    chroma::ScreenConfig thresholds;
    thresholds.verdict.probably_negative = 0.005;
    requireThrowsCode("CF1 unordered thresholds", chroma::ErrorCode::InvalidArgument,
                      [&] { chroma::validateConfig(thresholds); });

    const chroma::ScreenConfig a;
    chroma::ScreenConfig b;
    REQUIRE(chroma::configHash(a) == chroma::configHash(b), "CF1 equal configs hash differently");
    b.trial_count = 6;
    REQUIRE(chroma::configHash(a) != chroma::configHash(b), "CF1 trial count not covered by hash");
    chroma::ScreenConfig c;
    c.negative.slope = 0.26;
    REQUIRE(chroma::configHash(a) != chroma::configHash(c), "CF1 band slope not covered by hash");

    char buf[4096];
    const int n = chroma::exportConfigText(a, buf, static_cast<int>(sizeof(buf)));
    REQUIRE(n > 0 && n == static_cast<int>(std::strlen(buf)), "CF1 exportConfigText length");
    REQUIRE(std::strstr(buf, "trial_count=5") != nullptr, "CF1 export missing trial_count");
    REQUIRE(chroma::exportConfigText(a, nullptr, 0) == 0, "CF1 export with null buffer");
    char tiny[16];
    const int t = chroma::exportConfigText(a, tiny, static_cast<int>(sizeof(tiny)));
    REQUIRE(t == 15 && tiny[15] == '\0', "CF1 truncated export not NUL-terminated at cap");

    std::cout << "[PASS] CF1 config validation, preset parsing, hash coverage, text export\n";
}

/* =======================
 * Monte Carlo + sensitivity
 * ======================= */

static void runMonteCarloCohorts_MC1() {
    chroma::MonteCarloUQ uq;
    chroma::MonteCarloUQ::ScenarioConfig scenario;
    scenario.screen = smallConfig(chroma::ModelPreset::HighContrast);
    scenario.category = "male";
    uq.setScenario(scenario);

    const auto s = uq.runMonteCarlo(40);
    REQUIRE(s.positive.subjects == 40 && s.negative.subjects == 40, "MC1 cohort sizes");
    REQUIRE(s.positive.final_posterior.mean > s.negative.final_posterior.mean,
            "MC1 positive cohort did not end with higher mean posterior");
    REQUIRE(s.positive.correct_fraction.mean < s.negative.correct_fraction.mean,
            "MC1 positive cohort answered more trials correctly");

    for (const auto* c : {&s.positive, &s.negative}) {
        REQUIRE_FINITE(c->final_posterior.mean, "MC1 final_posterior.mean");
        REQUIRE(c->final_posterior.ci_lower_95 <= c->final_posterior.median &&
                c->final_posterior.median <= c->final_posterior.ci_upper_95, "MC1 percentile ordering");
        REQUIRE(c->mean_trajectory.size() == 6, "MC1 mean trajectory length");
        requireCloseAbsOrRel("MC1 trajectory starts at prior", c->mean_trajectory[0], 0.08, 1e-12, 1e-9);
        REQUIRE(c->flagged_rate >= 0.0 && c->flagged_rate <= 1.0, "MC1 flagged rate");
    }
    REQUIRE(s.sensitivity >= 0.0 && s.sensitivity <= 1.0, "MC1 sensitivity");
    REQUIRE(s.specificity >= 0.0 && s.specificity <= 1.0, "MC1 specificity");

    const auto again = uq.runMonteCarlo(40);
    requireExact("MC1 seeded rerun", again.positive.final_posterior.mean, s.positive.final_posterior.mean);

    chroma::MonteCarloUQ::ScenarioConfig bad = scenario;
    bad.decision_threshold = 1.5;
    requireThrowsCode("MC1 bad threshold", chroma::ErrorCode::InvalidArgument, [&] { (void)uq.runMonteCarlo(bad, 2); });

    std::cout << "[PASS] MC1 Monte Carlo cohorts separate + deterministic under seed\n";
}

static void runMonteCarloVariedConstants_MC2() {
    chroma::MonteCarloUQ uq;
    chroma::MonteCarloUQ::ScenarioConfig scenario;
    scenario.screen = smallConfig();
    scenario.vary_model_constants = true;

    const auto s = uq.runMonteCarlo(scenario, 20);
    REQUIRE_FINITE(s.positive.final_posterior.mean, "MC2 positive mean");
    REQUIRE_FINITE(s.negative.final_posterior.mean, "MC2 negative mean");
    REQUIRE(s.positive.final_posterior.std_dev >= 0.0, "MC2 std_dev");

    const auto run = chroma::MonteCarloUQ::simulateSubject(smallConfig(), "female", true, 99u);
    REQUIRE(run.trajectory.size() == 6, "MC2 single subject trajectory length");
    for (double p : run.trajectory) {
        requireOpenUnit("MC2 single subject posterior", p);
    }

    const auto empty = chroma::MonteCarloUQ::summarize({});
    requireExact("MC2 empty summary", empty.mean, 0.0);

    std::cout << "[PASS] MC2 Latin-hypercube varied constants stay finite\n";
}

static void runSensitivitySweeps_SA1() {
    chroma::SensitivityAnalyzer analyzer;
    chroma::SensitivityAnalyzer::ScenarioConfig scenario;
    scenario.screen = smallConfig();
    scenario.subjects_per_point = 10;
    analyzer.setScenario(scenario);

    analyzer.analyzeTrialCount({5.0, 2.0, 6.0, 3});
    REQUIRE(analyzer.results().size() == 3, "SA1 trial-count sweep rows");
    requireExact("SA1 first trial count", analyzer.results()[0].parameter_value, 2.0);
    requireExact("SA1 last trial count", analyzer.results()[2].parameter_value, 6.0);

    analyzer.analyzeRampDecay({0.04, 0.02, 0.06, 2});
    REQUIRE(analyzer.results().size() == 2, "SA1 decay sweep rows");

    // 0.30 would not sit above the positive band (intercept 0.35).
    analyzer.analyzeNegativeIntercept({0.45, 0.30, 0.50, 3});
    REQUIRE(analyzer.results().size() == 2, "SA1 negative-intercept sweep did not skip invalid values");
    for (const auto& row : analyzer.results()) {
        REQUIRE_FINITE(row.metrics.separation, "SA1 separation");
        REQUIRE(row.parameter_name == "negative_intercept", "SA1 row name");
    }

    REQUIRE(!analyzer.exportSensitivityMatrixCSV("/nonexistent-dir/sweep.csv"), "SA1 export to bad path succeeded");

    std::cout << "[PASS] SA1 sensitivity sweeps row counts + invalid-value skipping\n";
}

} // namespace

int main() {
    // =======================
    // Priors
    // =======================
    runPriorTable_P1();
    runPriorTableValidation_P2();

    // =======================
    // Trial difficulty + stimulus
    // =======================
    runLikelihoodBoundsAllPresets_D1();
    runRampMonotonicAndFloor_D2();
    runDifficultyInputValidation_D3();
    runStimulusDeterminism_S1();

    // =======================
    // Posterior tracker + conjugate summary
    // =======================
    runConcreteScenarios_T1();
    runUpdateDirection_T2();
    runReplayIdempotence_T3();
    runTrackerMisuse_T4();
    runDegenerateFallback_T5();
    runConjugateSummary_C1();

    // =======================
    // Session
    // =======================
    runSessionLifecycle_SM1();
    runSessionConcreteScenario_SM2();
    runSessionTrialDeterminism_SM3();
    runVerdictBands_SM4();
    runDashboardFrameAfterReset_SM5();

    // =======================
    // Configuration
    // =======================
    runConfigValidationAndHash_CF1();

    // =======================
    // Operating characteristics
    // =======================
    runMonteCarloCohorts_MC1();
    runMonteCarloVariedConstants_MC2();
    runSensitivitySweeps_SA1();

    std::cout << "\nAll inference integrity checks passed.\n";
    return 0;
}
