#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "ConjugateSummary.h"
#include "PosteriorTracker.h"
#include "PriorModel.h"
#include "ScreenConfig.h"
#include "StimulusGenerator.h"
#include "TrialDifficulty.h"

namespace chroma {

enum class SessionState : int {
    AwaitingPrior = 0,
    InProgress    = 1,
    Completed     = 2,
};

enum class Verdict : int {
    VeryLikelyNegative = 0,
    ProbablyNegative   = 1,
    Uncertain          = 2,
    PossiblyPositive   = 3,
};

// One generated trial. Created on first request and never regenerated.
struct TrialRecord {
    TrialParameters params{};
    int target_value = 0;
};

struct TrialHistoryRow {
    int index = 0;
    bool correct = false;
    double p_correct_if_positive = 0.0;
    double p_correct_if_negative = 0.0;
    double posterior_before = 0.0;
    double posterior_after = 0.0;
};

struct SessionReport {
    std::uint32_t config_hash_u32 = 0;
    std::string category;
    double prior = 0.0;
    int trial_count = 0;
    int completed = 0;
    int correct = 0;
    double final_posterior = 0.0;
    std::vector<TrialHistoryRow> rows;

    // Only filled once at least one trial is recorded.
    bool has_conjugate = false;
    BetaPosterior conjugate{};

    Verdict verdict = Verdict::Uncertain;
};

// A single subject's screening session.
//
// State machine:
//   AwaitingPrior --begin()--> InProgress --N outcomes--> Completed
//   reset() from any state returns to AwaitingPrior.
//
// Each session owns its prior, history and trajectory; nothing mutable is shared.
// The stimulus generator is stateless and may be shared between sessions.
// Not thread-safe: one operation at a time per session.
class ScreeningSession {
public:
    ScreeningSession();
    explicit ScreeningSession(const ScreenConfig& cfg);
    ScreeningSession(const ScreenConfig& cfg, std::shared_ptr<const StimulusGenerator> stimulus);

    // Prior from the category table. InvalidState unless AwaitingPrior.
    void begin(const std::string& category);
    // Externally supplied prior in (0,1).
    void beginWithPrior(double prior);

    SessionState state() const noexcept { return state_; }
    int trialCount() const noexcept { return cfg_.trial_count; }
    int completedTrials() const noexcept { return static_cast<int>(tracker_.recordedCount()); }
    const std::string& category() const noexcept { return category_; }

    // Lazily generated trial parameters for index in [0, N).
    const TrialRecord& trial(int index);
    // The next trial awaiting an outcome. InvalidState unless InProgress.
    const TrialRecord& currentTrial();

    double recordOutcome(bool correct);
    double recordOutcome(int trial_index, bool correct);

    double prior() const;
    double currentPosterior() const;
    const std::vector<double>& trajectory() const;
    const std::vector<TrialObservation>& history() const noexcept { return tracker_.history(); }

    BetaPosterior conjugateSummary() const;
    Verdict verdict() const;
    SessionReport report() const;

    void reset();

    std::int64_t seedMaterial() const;

    const ScreenConfig& config() const noexcept { return cfg_; }
    const PriorModel& priorModel() const noexcept { return priors_; }
    const TrialDifficultyModel& difficulty() const noexcept { return difficulty_; }

private:
    ScreenConfig cfg_{};
    PriorModel priors_;
    TrialDifficultyModel difficulty_;
    ConjugateSummary conjugate_;
    std::shared_ptr<const StimulusGenerator> stimulus_;

    SessionState state_ = SessionState::AwaitingPrior;
    std::string category_;
    std::int64_t seed_material_ = 0;
    SequentialPosteriorTracker tracker_;
    std::map<int, TrialRecord> trials_;

    void startWithPrior(double prior);
};

Verdict classifyPosterior(double posterior, const VerdictThresholds& thresholds);

const char* verdictName(Verdict v);
// Operator-facing sentence for the final result.
const char* verdictText(Verdict v);
const char* sessionStateName(SessionState s);

} // namespace chroma
