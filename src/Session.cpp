#include "Session.h"

#include "ScreenErrors.h"

#include <string>
#include <utility>

namespace chroma {

namespace {
const ScreenConfig& validated(const ScreenConfig& cfg) {
    validateConfig(cfg);
    return cfg;
}
} // namespace

ScreeningSession::ScreeningSession() : ScreeningSession(ScreenConfig{}) {}

ScreeningSession::ScreeningSession(const ScreenConfig& cfg)
    : ScreeningSession(cfg, nullptr) {}

ScreeningSession::ScreeningSession(const ScreenConfig& cfg,
                                   std::shared_ptr<const StimulusGenerator> stimulus)
    : cfg_(validated(cfg)),
      priors_(cfg_.priors),
      difficulty_(cfg_),
      conjugate_(cfg_.conjugate.virtual_sample_size),
      stimulus_(std::move(stimulus)) {
    if (!stimulus_) {
        stimulus_ = std::make_shared<PlateStimulusGenerator>(cfg_.stimulus.background_dots);
    }
}

void ScreeningSession::begin(const std::string& category) {
    if (state_ != SessionState::AwaitingPrior) {
        throwInvalidState(std::string("session already started (state ") +
                          sessionStateName(state_) + ")");
    }
    const double p = priors_.priorFor(category);
    startWithPrior(p);
    category_ = category;
}

void ScreeningSession::beginWithPrior(double prior) {
    if (state_ != SessionState::AwaitingPrior) {
        throwInvalidState(std::string("session already started (state ") +
                          sessionStateName(state_) + ")");
    }
    startWithPrior(prior);
    category_.clear();
}

void ScreeningSession::startWithPrior(double prior) {
    tracker_.setPrior(prior);
    seed_material_ = (cfg_.stimulus.fixed_seed_material >= 0)
        ? cfg_.stimulus.fixed_seed_material
        : seedMaterialForPrior(prior);
    trials_.clear();
    state_ = SessionState::InProgress;
}

const TrialRecord& ScreeningSession::trial(int index) {
    if (state_ == SessionState::AwaitingPrior) {
        throwInvalidState("trials cannot be generated before the prior is set");
    }
    if (index < 0 || index >= cfg_.trial_count) {
        throwInvalidArgument("trial index " + std::to_string(index) + " outside [0," +
                             std::to_string(cfg_.trial_count) + ")");
    }

    const auto it = trials_.find(index);
    if (it != trials_.end()) {
        return it->second;
    }

    const StimulusDraw d = stimulus_->draw(index, seed_material_);
    TrialRecord rec;
    rec.params = difficulty_.parametersFor(index, d.discriminability);
    rec.target_value = d.target_value;
    return trials_.emplace(index, rec).first->second;
}

const TrialRecord& ScreeningSession::currentTrial() {
    if (state_ != SessionState::InProgress) {
        throwInvalidState(std::string("no open trial (state ") + sessionStateName(state_) + ")");
    }
    return trial(completedTrials());
}

double ScreeningSession::recordOutcome(bool correct) {
    if (state_ != SessionState::InProgress) {
        throwInvalidState(std::string("cannot record in state ") + sessionStateName(state_));
    }
    return recordOutcome(completedTrials(), correct);
}

double ScreeningSession::recordOutcome(int trial_index, bool correct) {
    if (state_ != SessionState::InProgress) {
        throwInvalidState(std::string("cannot record in state ") + sessionStateName(state_));
    }
    if (trial_index < 0 || trial_index >= cfg_.trial_count) {
        throwInvalidArgument("trial index " + std::to_string(trial_index) + " outside [0," +
                             std::to_string(cfg_.trial_count) + ")");
    }
    const int next = completedTrials();
    if (trial_index < next) {
        throwInvalidState("trial " + std::to_string(trial_index) + " already has an outcome");
    }
    if (trial_index > next) {
        throwInvalidArgument("trial " + std::to_string(trial_index) +
                             " is not open; next trial is " + std::to_string(next));
    }

    const TrialParameters& p = trial(trial_index).params;
    const double posterior = tracker_.record(correct, p.p_correct_if_positive, p.p_correct_if_negative);
    if (completedTrials() >= cfg_.trial_count) {
        state_ = SessionState::Completed;
    }
    return posterior;
}

double ScreeningSession::prior() const {
    return tracker_.prior();
}

double ScreeningSession::currentPosterior() const {
    return tracker_.currentPosterior();
}

const std::vector<double>& ScreeningSession::trajectory() const {
    return tracker_.trajectory();
}

BetaPosterior ScreeningSession::conjugateSummary() const {
    return conjugate_.summarize(tracker_.prior(),
                                completedTrials(),
                                tracker_.correctCount());
}

Verdict ScreeningSession::verdict() const {
    return classifyPosterior(tracker_.currentPosterior(), cfg_.verdict);
}

SessionReport ScreeningSession::report() const {
    SessionReport r;
    r.config_hash_u32 = configHash(cfg_);
    r.category = category_;
    r.prior = tracker_.prior();
    r.trial_count = cfg_.trial_count;
    r.completed = completedTrials();
    r.correct = tracker_.correctCount();
    r.final_posterior = tracker_.currentPosterior();
    r.verdict = verdict();

    const auto& hist = tracker_.history();
    const auto& traj = tracker_.trajectory();
    r.rows.reserve(hist.size());
    for (std::size_t i = 0; i < hist.size(); ++i) {
        TrialHistoryRow row;
        row.index = static_cast<int>(i);
        row.correct = hist[i].correct;
        row.p_correct_if_positive = hist[i].p_correct_if_positive;
        row.p_correct_if_negative = hist[i].p_correct_if_negative;
        row.posterior_before = traj[i];
        row.posterior_after = traj[i + 1];
        r.rows.push_back(row);
    }

    if (r.completed > 0) {
        r.conjugate = conjugateSummary();
        r.has_conjugate = true;
    }
    return r;
}

void ScreeningSession::reset() {
    tracker_.reset();
    trials_.clear();
    category_.clear();
    seed_material_ = 0;
    state_ = SessionState::AwaitingPrior;
}

std::int64_t ScreeningSession::seedMaterial() const {
    if (state_ == SessionState::AwaitingPrior) {
        throwNotStarted("seed material is derived from the prior; session not started");
    }
    return seed_material_;
}

Verdict classifyPosterior(double posterior, const VerdictThresholds& thresholds) {
    if (posterior < thresholds.very_likely_negative) return Verdict::VeryLikelyNegative;
    if (posterior < thresholds.probably_negative) return Verdict::ProbablyNegative;
    if (posterior < thresholds.uncertain) return Verdict::Uncertain;
    return Verdict::PossiblyPositive;
}

const char* verdictName(Verdict v) {
    switch (v) {
        case Verdict::VeryLikelyNegative: return "very_likely_negative";
        case Verdict::ProbablyNegative:   return "probably_negative";
        case Verdict::Uncertain:          return "uncertain";
        case Verdict::PossiblyPositive:   return "possibly_positive";
    }
    return "unknown";
}

const char* verdictText(Verdict v) {
    switch (v) {
        case Verdict::VeryLikelyNegative:
            return "Based on the responses, the subject is very likely NOT colour-vision deficient.";
        case Verdict::ProbablyNegative:
            return "Based on the responses, the subject is probably NOT colour-vision deficient, with some uncertainty.";
        case Verdict::Uncertain:
            return "Results are uncertain. Consider a consultation with an eye specialist.";
        case Verdict::PossiblyPositive:
            return "The responses suggest a possible colour-vision deficiency. Consider a consultation with an eye specialist.";
    }
    return "";
}

const char* sessionStateName(SessionState s) {
    switch (s) {
        case SessionState::AwaitingPrior: return "AwaitingPrior";
        case SessionState::InProgress:    return "InProgress";
        case SessionState::Completed:     return "Completed";
    }
    return "Unknown";
}

} // namespace chroma
