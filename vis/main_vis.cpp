// main_vis.cpp: operator dashboard for a screening session.
// - One live ScreeningSession driven by Correct / Wrong buttons or a typed answer
// - Posterior trajectory plot with the verdict bands drawn as reference lines
// - Simulated cohorts (MonteCarloUQ) overlaid as mean trajectories
// Plates are not rendered here; the operator shows printed plates and may reveal the target.

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>
#include <random>

#include "ScreenErrors.h"
#include "Session.h"
#include "UncertaintyQuantification.h"
#include "session_frame.h"

#include "imgui.h"
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
// Include <windows.h> first to avoid syntax errors in the Windows SDK gl.h.
#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#endif

#include <GLFW/glfw3.h>

#ifdef __APPLE__
#  include <OpenGL/gl.h>
#else
#  include <GL/gl.h>
#endif

static void glfw_error_callback(int error, const char* description) {
    std::fprintf(stderr, "GLFW Error %d: %s\n", error, description ? description : "(null)");
}

static int fail(const char* msg) {
    std::fprintf(stderr, "FATAL: %s\n", msg ? msg : "(null)");
    std::fprintf(stderr, "\n");
    return EXIT_FAILURE;
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_plots = true;
    bool show_history = true;

    bool reveal_target = false;
    bool show_verdict_bands = true;
    bool show_cohorts = true;
};

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 0)
        return;

    if (ImPlot::BeginPlot(title)) {

        // Axis setup needs the ImPlot 0.13+ Setup API.
#if defined(IMPLOT_VERSION)
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
        ImPlot::SetupAxisLimits(ImAxis_Y1, 0.0, 1.0, ImGuiCond_Once);
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

static ImVec4 verdict_color(chroma::Verdict v) {
    switch (v) {
        case chroma::Verdict::VeryLikelyNegative: return ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        case chroma::Verdict::ProbablyNegative:   return ImVec4(0.6f, 1.0f, 0.2f, 1.0f);
        case chroma::Verdict::Uncertain:          return ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        case chroma::Verdict::PossiblyPositive:   return ImVec4(1.0f, 0.3f, 0.2f, 1.0f);
    }
    return ImVec4(1.0f, 1.0f, 1.0f, 1.0f);
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "ChromaScreen", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

    // Validate OpenGL context exists.
    const GLubyte* gl_version = glGetString(GL_VERSION);
    if (!gl_version) {
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("OpenGL context validation failed (glGetString(GL_VERSION) returned null)");
    }
    std::fprintf(stderr, "OpenGL Vendor:   %s\n", glGetString(GL_VENDOR));
    std::fprintf(stderr, "OpenGL Renderer: %s\n", glGetString(GL_RENDERER));
    std::fprintf(stderr, "OpenGL Version:  %s\n", gl_version);

    bool imgui_ctx = false;
    bool implot_ctx = false;
    bool imgui_glfw = false;
    bool imgui_gl3 = false;

    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    imgui_ctx = true;

    ImGuiIO& io = ImGui::GetIO();
#ifdef IMGUI_HAS_DOCK
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    ImGui::GetStyle().ScaleAllSizes(1.5f);
    io.FontGlobalScale = 1.25f;

    ImPlot::CreateContext();
    implot_ctx = true;

    ImGui::StyleColorsDark();

    if (!ImGui_ImplGlfw_InitForOpenGL(window, true)) {
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplGlfw_InitForOpenGL failed");
    }
    imgui_glfw = true;

    if (!ImGui_ImplOpenGL3_Init(glsl_version)) {
        if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
        if (implot_ctx) ImPlot::DestroyContext();
        if (imgui_ctx) ImGui::DestroyContext();
        glfwDestroyWindow(window);
        glfwTerminate();
        return fail("ImGui_ImplOpenGL3_Init failed");
    }
    imgui_gl3 = true;

    // --- CLI flags ---
    int preset_idx = 0;
    for (int i = 1; i < argc; ++i) {
        if (!argv[i]) continue;
        const std::string arg = argv[i];
        if (arg == "--preset" && i + 1 < argc) {
            try {
                preset_idx = static_cast<int>(chroma::parsePreset(argv[++i]));
            } catch (const chroma::ScreenError& e) {
                std::fprintf(stderr, "%s (using dense)\n", e.what());
            }
        }
    }

    VisualUIState ui;

    const char* preset_labels[] = {"Dense field", "Moderate", "High contrast"};
    int category_idx = 0;
    int trial_count = 5;

    chroma::ScreenConfig cfg = chroma::presetConfig(static_cast<chroma::ModelPreset>(preset_idx));
    chroma::ScreeningSession session(cfg);
    const std::vector<std::string> categories = session.priorModel().categories();

    std::string last_error;
    std::string last_feedback;
    // Reset is applied at the start of the next frame.
    bool pending_reset = false;
    int typed_answer = 0;

    std::mt19937 auto_rng(20240601u);
    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);

    // Cohort overlay (recomputed on demand; the cohorts take a moment at full plate size).
    chroma::MonteCarloUQ::UQSummary cohorts{};
    bool have_cohorts = false;
    int cohort_subjects = 100;

    // Every core call goes through here so a rejected action shows up in the UI instead of
    // terminating the dashboard.
    auto guarded = [&](auto&& fn) {
        try {
            fn();
            last_error.clear();
        } catch (const chroma::ScreenError& e) {
            last_error = std::string("[") + chroma::errorCodeName(e.code()) + "] " + e.what();
        }
    };

    auto rebuild_session = [&]() {
        guarded([&] {
            chroma::ScreenConfig next = chroma::presetConfig(static_cast<chroma::ModelPreset>(preset_idx));
            next.trial_count = trial_count;
            chroma::ScreeningSession fresh(next);
            cfg = next;
            session = fresh;
            have_cohorts = false;
            last_feedback.clear();
        });
    };

    auto record = [&](bool correct) {
        guarded([&] {
            const int k = session.currentTrial().params.index;
            const double before = session.currentPosterior();
            const double after = session.recordOutcome(k, correct);
            char buf[160];
            std::snprintf(buf, sizeof(buf), "Test %d %s: %.4f -> %.4f (%+.4f)",
                          k + 1, correct ? "correct" : "wrong", before, after, after - before);
            last_feedback = buf;
        });
    };

    auto answer_as_subject = [&](bool positive) {
        guarded([&] {
            const chroma::TrialParameters& p = session.currentTrial().params;
            const double pc = positive ? p.p_correct_if_positive : p.p_correct_if_negative;
            record(unit_dist(auto_rng) < pc);
        });
    };

    auto run_cohorts = [&]() {
        guarded([&] {
            chroma::MonteCarloUQ uq;
            chroma::MonteCarloUQ::ScenarioConfig scenario;
            scenario.screen = cfg;
            scenario.category = categories[static_cast<std::size_t>(category_idx)];
            cohorts = uq.runMonteCarlo(scenario, cohort_subjects);
            have_cohorts = true;
        });
    };

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifdef IMGUI_HAS_DOCK
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

        const chroma::vis::SessionFrame frame = chroma::vis::beginSessionFrame(session, pending_reset);
        const chroma::SessionState state = frame.state;
        const bool started = frame.started;

        // Status overlay (top-right)
        if (ui.show_hud) {
            ImGuiWindowFlags dashboard_flags =
                ImGuiWindowFlags_NoDecoration |
                ImGuiWindowFlags_AlwaysAutoResize |
                ImGuiWindowFlags_NoSavedSettings |
                ImGuiWindowFlags_NoFocusOnAppearing |
                ImGuiWindowFlags_NoNav;

            ImVec2 viewport_size = ImGui::GetMainViewport()->Size;
            ImGui::SetNextWindowPos(ImVec2(viewport_size.x - 12, 12), ImGuiCond_Always, ImVec2(1.0f, 0.0f));
            ImGui::SetNextWindowBgAlpha(0.85f);

            if (ImGui::Begin("##Dashboard", &ui.show_hud, dashboard_flags)) {
                const ImVec4 header_col = ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
                ImGui::TextColored(header_col, "[ CHROMA SCREEN ]");
                ImGui::Separator();
                ImGui::Text("STATE: %s", chroma::sessionStateName(state));
                ImGui::Text("PRESET: %s", chroma::presetName(cfg.preset));
                ImGui::Text("TESTS: %d / %d", frame.completed, frame.trial_count);
                if (started) {
                    const double post = frame.report.final_posterior;
                    const chroma::Verdict v = frame.report.verdict;
                    ImGui::Text("Prior:     %.4f", frame.report.prior);
                    ImGui::Text("Posterior: %.4f", post);
                    ImGui::SameLine(220);
                    ImGui::ProgressBar((float)std::clamp(post, 0.0, 1.0), ImVec2(160, 12), "");
                    ImGui::TextColored(verdict_color(v), "%s", chroma::verdictName(v));
                }
                ImGui::Text("CONFIG: 0x%08X", static_cast<unsigned>(chroma::configHash(cfg)));
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::Begin(">> CONTROL CONSOLE", &ui.show_controls);

            ImGui::BeginDisabled(started);
            if (ImGui::Combo("Preset", &preset_idx, preset_labels, IM_ARRAYSIZE(preset_labels))) {
                rebuild_session();
            }
            if (ImGui::SliderInt("Tests", &trial_count, 1, 30)) {
                rebuild_session();
            }
            if (ImGui::BeginCombo("Category", categories[static_cast<std::size_t>(category_idx)].c_str())) {
                for (int i = 0; i < static_cast<int>(categories.size()); ++i) {
                    const bool selected = (i == category_idx);
                    if (ImGui::Selectable(categories[static_cast<std::size_t>(i)].c_str(), selected)) {
                        category_idx = i;
                    }
                }
                ImGui::EndCombo();
            }
            if (ImGui::Button("Start session")) {
                guarded([&] { session.begin(categories[static_cast<std::size_t>(category_idx)]); });
            }
            ImGui::EndDisabled();
            ImGui::SameLine();
            if (ImGui::Button("Reset")) {
                pending_reset = true;
                last_feedback.clear();
                last_error.clear();
            }

            ImGui::Separator();
            if (state == chroma::SessionState::InProgress) {
                const chroma::TrialRecord* trial = nullptr;
                guarded([&] { trial = &session.currentTrial(); });
                if (trial) {
                    ImGui::Text("Test #%d of %d", trial->params.index + 1, session.trialCount());
                    ImGui::Text("Contrast: %.3f (raw %.3f)", trial->params.effective_discriminability,
                                trial->params.discriminability);
                    ImGui::Text("P(correct | not deficient): %.1f%%", 100.0 * trial->params.p_correct_if_negative);
                    ImGui::Text("P(correct | deficient):     %.1f%%", 100.0 * trial->params.p_correct_if_positive);
                    ImGui::Checkbox("Reveal target", &ui.reveal_target);
                    if (ui.reveal_target) {
                        ImGui::SameLine();
                        ImGui::Text("= %d", trial->target_value);
                    }

                    const int target = trial->target_value;
                    ImGui::SetNextItemWidth(120);
                    ImGui::InputInt("Answer", &typed_answer);
                    ImGui::SameLine();
                    if (ImGui::Button("Grade")) {
                        if (typed_answer < 0) {
                            last_error = "Please enter a valid number!";
                        } else {
                            record(typed_answer == target);
                        }
                    }

                    if (ImGui::Button("Correct")) record(true);
                    ImGui::SameLine();
                    if (ImGui::Button("Wrong")) record(false);

                    if (ImGui::Button("Answer as deficient subject")) answer_as_subject(true);
                    ImGui::SameLine();
                    if (ImGui::Button("Answer as typical subject")) answer_as_subject(false);
                }
            } else if (state == chroma::SessionState::Completed) {
                const chroma::Verdict v = frame.report.verdict;
                ImGui::TextColored(verdict_color(v), "All tests completed.");
                ImGui::TextWrapped("%s", chroma::verdictText(v));
                if (frame.report.has_conjugate) {
                    const chroma::BetaPosterior& b = frame.report.conjugate;
                    ImGui::Text("Beta cross-check: a=%.2f b=%.2f mean=%.4f sd=%.4f",
                                b.alpha_post, b.beta_post, b.mean, b.std_dev);
                }
            } else {
                ImGui::TextUnformatted("Choose a category and start the session.");
            }

            if (!last_feedback.empty()) {
                ImGui::TextUnformatted(last_feedback.c_str());
            }
            if (!last_error.empty()) {
                ImGui::TextColored(ImVec4(1.0f, 0.3f, 0.3f, 1.0f), "%s", last_error.c_str());
            }

            ImGui::Separator();
            ImGui::SliderInt("Cohort size", &cohort_subjects, 10, 1000);
            if (ImGui::Button("Simulate cohorts")) run_cohorts();
            if (have_cohorts) {
                ImGui::Text("Sensitivity %.3f  Specificity %.3f  @ %.2f",
                            cohorts.sensitivity, cohorts.specificity, cohorts.decision_threshold);
            }

            ImGui::Separator();
            ImGui::Checkbox("Dashboard", &ui.show_hud);
            ImGui::SameLine();
            ImGui::Checkbox("Plots", &ui.show_plots);
            ImGui::SameLine();
            ImGui::Checkbox("History", &ui.show_history);

            ImGui::End();
        }

        if (ui.show_plots) {
            ImGui::Begin("Posterior", &ui.show_plots);
            ImGui::Checkbox("Verdict bands", &ui.show_verdict_bands);
            ImGui::SameLine();
            ImGui::Checkbox("Cohort means", &ui.show_cohorts);

            const double x_max = static_cast<double>(frame.trial_count);
            if (started) {
                const std::vector<double>& traj = frame.trajectory;
                std::vector<double> xs(traj.size());
                for (std::size_t i = 0; i < xs.size(); ++i) xs[i] = static_cast<double>(i);
                plot_line_with_xlimits("P(deficient) by test", "session",
                                       xs.data(), traj.data(), static_cast<int>(traj.size()), 0.0, x_max);
            }

            if (ImPlot::BeginPlot("Reference")) {
#if defined(IMPLOT_VERSION)
                ImPlot::SetupAxisLimits(ImAxis_X1, 0.0, x_max, ImGuiCond_Always);
#endif
                if (ui.show_verdict_bands) {
                    const double xs[2] = {0.0, x_max};
                    const double t1[2] = {cfg.verdict.very_likely_negative, cfg.verdict.very_likely_negative};
                    const double t2[2] = {cfg.verdict.probably_negative, cfg.verdict.probably_negative};
                    const double t3[2] = {cfg.verdict.uncertain, cfg.verdict.uncertain};
                    ImPlot::PlotLine("very likely negative", xs, t1, 2);
                    ImPlot::PlotLine("probably negative", xs, t2, 2);
                    ImPlot::PlotLine("uncertain", xs, t3, 2);
                }
                if (ui.show_cohorts && have_cohorts) {
                    const int n = static_cast<int>(cohorts.positive.mean_trajectory.size());
                    std::vector<double> xs(static_cast<std::size_t>(n));
                    for (int i = 0; i < n; ++i) xs[static_cast<std::size_t>(i)] = static_cast<double>(i);
                    ImPlot::PlotLine("deficient cohort", xs.data(), cohorts.positive.mean_trajectory.data(), n);
                    ImPlot::PlotLine("typical cohort", xs.data(), cohorts.negative.mean_trajectory.data(), n);
                }
                if (started) {
                    const std::vector<double>& traj = frame.trajectory;
                    std::vector<double> xs(traj.size());
                    for (std::size_t i = 0; i < xs.size(); ++i) xs[i] = static_cast<double>(i);
                    ImPlot::PlotLine("session", xs.data(), traj.data(), static_cast<int>(traj.size()));
                }
                ImPlot::EndPlot();
            }
            ImGui::End();
        }

        if (ui.show_history) {
            ImGui::Begin("Test History", &ui.show_history);
            if (started) {
                const chroma::SessionReport& r = frame.report;
                if (ImGui::BeginTable("history", 6, ImGuiTableFlags_Borders | ImGuiTableFlags_RowBg)) {
                    ImGui::TableSetupColumn("Test");
                    ImGui::TableSetupColumn("Result");
                    ImGui::TableSetupColumn("P(c|def)");
                    ImGui::TableSetupColumn("P(c|typ)");
                    ImGui::TableSetupColumn("Before");
                    ImGui::TableSetupColumn("After");
                    ImGui::TableHeadersRow();
                    for (const auto& row : r.rows) {
                        ImGui::TableNextRow();
                        ImGui::TableSetColumnIndex(0); ImGui::Text("%d", row.index + 1);
                        ImGui::TableSetColumnIndex(1); ImGui::TextUnformatted(row.correct ? "correct" : "wrong");
                        ImGui::TableSetColumnIndex(2); ImGui::Text("%.3f", row.p_correct_if_positive);
                        ImGui::TableSetColumnIndex(3); ImGui::Text("%.3f", row.p_correct_if_negative);
                        ImGui::TableSetColumnIndex(4); ImGui::Text("%.5f", row.posterior_before);
                        ImGui::TableSetColumnIndex(5); ImGui::Text("%.5f", row.posterior_after);
                    }
                    ImGui::EndTable();
                }
            } else {
                ImGui::TextUnformatted("No session in progress.");
            }
            ImGui::End();
        }

        ImGui::Render();

        int display_w = 0, display_h = 0;
        glfwGetFramebufferSize(window, &display_w, &display_h);
        glViewport(0, 0, display_w, display_h);
        glClearColor(0.08f, 0.08f, 0.10f, 1.0f);
        glClear(GL_COLOR_BUFFER_BIT);
        ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());

        glfwSwapBuffers(window);
    }

    // Cleanup
    if (implot_ctx) ImPlot::DestroyContext();
    if (imgui_gl3) ImGui_ImplOpenGL3_Shutdown();
    if (imgui_glfw) ImGui_ImplGlfw_Shutdown();
    if (imgui_ctx) ImGui::DestroyContext();

    glfwDestroyWindow(window);
    glfwTerminate();
    return 0;
}
