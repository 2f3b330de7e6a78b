// ScreenConsole: line-oriented presentation layer for a screening session.
// Plates are shown out of band (printed or physical); this tool only collects the
// subject's answers, grades them against the ground truth and reports the update.

#include "ScreenErrors.h"
#include "Session.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>

namespace {

void printUsage() {
    std::cout << "ScreenConsole usage:\n"
              << "  ScreenConsole [--preset dense|moderate|high] [--category name] [--trials n]\n"
              << "                [--seed n] [--reveal] [--config]\n"
              << "Answers are read from stdin, one per line.\n";
}

std::string trim(const std::string& s) {
    const auto b = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    const auto e = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return (b < e) ? std::string(b, e) : std::string();
}

// Digits only; anything else is rejected here and never reaches the session.
bool parseResponse(const std::string& raw, int& out) {
    const std::string s = trim(raw);
    if (s.empty() || s.size() > 6) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    out = std::stoi(s);
    return true;
}

bool readLine(const char* prompt, std::string& line) {
    std::cout << prompt << std::flush;
    return static_cast<bool>(std::getline(std::cin, line));
}

void printHistory(const chroma::SessionReport& r) {
    std::cout << "\n### Test History\n";
    for (const auto& row : r.rows) {
        std::cout << "Test " << (row.index + 1) << ": " << (row.correct ? "correct" : "wrong  ")
                  << " | P(deficient): " << std::setprecision(6) << row.posterior_before
                  << " -> " << row.posterior_after << "\n";
    }
}

} // namespace

int main(int argc, char** argv) {
    std::string preset = "dense";
    std::string category;
    int trials = -1;
    long long seed = -1;
    bool reveal = false;
    bool dump_config = false;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--preset" && i + 1 < argc) {
            preset = argv[++i];
        } else if (arg == "--category" && i + 1 < argc) {
            category = argv[++i];
        } else if (arg == "--trials" && i + 1 < argc) {
            int v = 0;
            if (!parseResponse(argv[++i], v)) {
                std::cerr << "--trials expects a positive integer\n";
                return 1;
            }
            trials = v;
        } else if (arg == "--seed" && i + 1 < argc) {
            int v = 0;
            if (!parseResponse(argv[++i], v)) {
                std::cerr << "--seed expects a non-negative integer\n";
                return 1;
            }
            seed = v;
        } else if (arg == "--reveal") {
            reveal = true;
        } else if (arg == "--config") {
            dump_config = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            return 0;
        } else {
            std::cout << "Unknown argument: " << arg << "\n";
            printUsage();
            return 1;
        }
    }

    try {
        chroma::ScreenConfig cfg = chroma::presetConfig(chroma::parsePreset(preset));
        if (trials >= 0) cfg.trial_count = trials;
        if (seed >= 0) cfg.stimulus.fixed_seed_material = seed;

        chroma::ScreeningSession session(cfg);

        if (dump_config) {
            char buf[4096];
            chroma::exportConfigText(cfg, buf, static_cast<int>(sizeof(buf)));
            std::cout << buf << "\n";
        }

        std::cout << "=== Colour Vision Bayesian Screening ===\n";

        // Step 1: prior from subject category.
        while (session.state() == chroma::SessionState::AwaitingPrior) {
            if (category.empty()) {
                std::string options;
                for (const auto& c : session.priorModel().categories()) {
                    options += (options.empty() ? "" : "/") + c;
                }
                const std::string prompt = "Subject category [" + options + "]: ";
                if (!readLine(prompt.c_str(), category)) {
                    std::cerr << "\nNo category given.\n";
                    return 1;
                }
                category = trim(category);
            }
            try {
                session.begin(category);
            } catch (const chroma::ScreenError& e) {
                std::cout << "[" << chroma::errorCodeName(e.code()) << "] " << e.what() << "\n";
                category.clear();
            }
        }

        std::cout << std::fixed << std::setprecision(4)
                  << "Prior probability of colour-vision deficiency: " << session.prior() << "\n";

        // Step 2: one answer per trial.
        while (session.state() == chroma::SessionState::InProgress) {
            const chroma::TrialRecord& t = session.currentTrial();
            const int k = t.params.index;

            std::cout << "\nTest #" << (k + 1) << " of " << session.trialCount() << "\n"
                      << std::setprecision(3)
                      << "Test difficulty: contrast = " << t.params.effective_discriminability << "\n"
                      << std::setprecision(1)
                      << "- If NOT deficient: " << (100.0 * t.params.p_correct_if_negative) << "% chance of a correct answer\n"
                      << "- If deficient:     " << (100.0 * t.params.p_correct_if_positive) << "% chance of a correct answer\n";
            if (reveal) {
                std::cout << "(operator) target = " << t.target_value << "\n";
            }

            std::string line;
            int guess = 0;
            for (;;) {
                if (!readLine("What number do you see? ", line)) {
                    std::cerr << "\nInput ended before the session completed (" << session.completedTrials()
                              << "/" << session.trialCount() << ").\n";
                    return 1;
                }
                if (parseResponse(line, guess)) break;
                std::cout << "Please enter a valid number!\n";
            }

            const bool correct = (guess == t.target_value);
            const double before = session.currentPosterior();
            const double after = session.recordOutcome(k, correct);

            std::cout << (correct ? "Correct! The number was " : "Wrong. The correct number was ")
                      << t.target_value << "\n"
                      << std::setprecision(6)
                      << "- Prior (before this test): " << before << "\n"
                      << "- Posterior (after this test): " << after << "\n"
                      << "- Change: " << std::showpos << (after - before) << std::noshowpos << "\n";
        }

        const chroma::SessionReport r = session.report();
        std::cout << "\nAll tests completed!\n" << chroma::verdictText(r.verdict) << "\n";
        std::cout << std::setprecision(4)
                  << "Final P(deficient): " << (100.0 * r.final_posterior) << "%"
                  << " (change " << std::showpos << (100.0 * (r.final_posterior - r.prior)) << std::noshowpos << "%)\n";
        printHistory(r);

        if (r.has_conjugate) {
            std::cout << std::setprecision(4)
                      << "\nBeta cross-check: alpha=" << r.conjugate.alpha_post
                      << " beta=" << r.conjugate.beta_post
                      << " mean=" << r.conjugate.mean
                      << " sd=" << r.conjugate.std_dev << "\n";
        }
        std::printf("Tests completed: %d / %d  (config 0x%08X)\n",
                    r.completed, r.trial_count, static_cast<unsigned>(r.config_hash_u32));
    } catch (const chroma::ScreenError& e) {
        std::cerr << "[" << chroma::errorCodeName(e.code()) << "] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
