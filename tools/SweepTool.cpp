#include "SensitivityAnalysis.h"
#include "ScreenErrors.h"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

void printUsage() {
    std::cout << "SweepTool usage:\n"
              << "  SweepTool --param <trials|decay|floor|neg_intercept> [--min v] [--max v] [--samples n]\n"
              << "            [--preset dense|moderate|high] [--category name] [--subjects n]\n"
              << "            [--threshold p] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    std::string param;
    std::string preset = "dense";
    std::string category = "male";
    double min_val = 0.0;
    double max_val = 0.0;
    double threshold = 0.15;
    int samples = 5;
    int subjects = 100;
    std::string out = "sensitivity.csv";
    bool min_set = false;
    bool max_set = false;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--subjects" && i + 1 < argc) {
                subjects = std::stoi(argv[++i]);
            } else if (arg == "--threshold" && i + 1 < argc) {
                threshold = std::stod(argv[++i]);
            } else if (arg == "--preset" && i + 1 < argc) {
                preset = argv[++i];
            } else if (arg == "--category" && i + 1 < argc) {
                category = argv[++i];
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }
    } catch (const std::logic_error& e) {
        // std::stod / std::stoi reject non-numeric or out-of-range values.
        std::cerr << "Invalid numeric argument: " << e.what() << "\n";
        printUsage();
        return 1;
    }

    if (param.empty()) {
        printUsage();
        return 1;
    }

    try {
        chroma::SensitivityAnalyzer analyzer;
        chroma::SensitivityAnalyzer::ScenarioConfig scenario;
        scenario.screen = chroma::presetConfig(chroma::parsePreset(preset));
        scenario.category = category;
        scenario.decision_threshold = threshold;
        scenario.subjects_per_point = subjects;
        analyzer.setScenario(scenario);

        chroma::SensitivityAnalyzer::ParameterRange range;
        range.samples = samples;

        if (param == "trials" || param == "trial_count") {
            range.nominal = static_cast<double>(scenario.screen.trial_count);
        } else if (param == "decay" || param == "ramp_decay") {
            range.nominal = scenario.screen.ramp.decay_per_trial;
        } else if (param == "floor" || param == "ramp_floor") {
            range.nominal = scenario.screen.ramp.floor_0_1;
        } else if (param == "neg_intercept" || param == "negative_intercept") {
            range.nominal = scenario.screen.negative.intercept;
        } else {
            std::cout << "Unsupported parameter: " << param << "\n";
            printUsage();
            return 1;
        }

        if (!min_set) {
            min_val = range.nominal * 0.75;
        }
        if (!max_set) {
            max_val = range.nominal * 1.25;
        }

        range.min = min_val;
        range.max = max_val;

        if (param == "trials" || param == "trial_count") {
            analyzer.analyzeTrialCount(range);
        } else if (param == "decay" || param == "ramp_decay") {
            analyzer.analyzeRampDecay(range);
        } else if (param == "floor" || param == "ramp_floor") {
            analyzer.analyzeRampFloor(range);
        } else {
            analyzer.analyzeNegativeIntercept(range);
        }

        if (!analyzer.exportSensitivityMatrixCSV(out)) {
            std::cerr << "Could not write: " << out << "\n";
            return 1;
        }
        std::cout << "Wrote " << analyzer.results().size() << " sweep rows to: " << out << "\n";
    } catch (const chroma::ScreenError& e) {
        std::cerr << "[" << chroma::errorCodeName(e.code()) << "] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
