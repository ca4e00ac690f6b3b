// main_vis.cpp
// - Live view of one checkpoint run: spindle poles, sister pairs and k-fibers
//   drawn from world/spindle_layout (model-backed geometry, no UI state).
// - Dashboard overlay mirrors TickObservation; plots are driven by the tick
//   counter, never by wall time.
// - Stepping uses a wall-time accumulator with a per-frame cap, so a slow
//   frame cannot stall the UI.

#include <vector>
#include <string>
#include <cmath>
#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstdint>

#include "Simulation.h"
#include "Scenarios.h"

#include "../world/spindle_layout.h"

#include "imgui.h"
// ---- Docking compatibility shim (older ImGui builds do not define docking flags/APIs)
#ifndef ImGuiConfigFlags_DockingEnable
#define CKPT_NO_IMGUI_DOCKING 1
#endif
#include "implot.h"
#include "imgui_impl_glfw.h"
#include "imgui_impl_opengl3.h"
#include "imgui_internal.h"  // DockSpaceOverViewport

// Platform GL headers: on Windows, <GL/gl.h> requires Windows types/macros (APIENTRY/WINGDIAPI).
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

// ============================================================
// Fixed-pipeline spindle view (deterministic, no assets)
// ============================================================

struct Vec3f { float x, y, z; };

static Vec3f v3(float x, float y, float z) { return {x,y,z}; }

static Vec3f to_v3f(const ckpt::world::Vec3d& v) {
    return v3((float)v.x, (float)v.y, (float)v.z);
}

static Vec3f sub(Vec3f a, Vec3f b) { return {a.x-b.x, a.y-b.y, a.z-b.z}; }
static Vec3f mul(Vec3f a, float s)  { return {a.x*s, a.y*s, a.z*s}; }

static float clampf(float x, float lo, float hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

static float dot(Vec3f a, Vec3f b) { return a.x*b.x + a.y*b.y + a.z*b.z; }
static Vec3f cross(Vec3f a, Vec3f b) { return { a.y*b.z - a.z*b.y, a.z*b.x - a.x*b.z, a.x*b.y - a.y*b.x }; }
static float len(Vec3f a) { return std::sqrt(dot(a,a)); }

static void set_perspective(float fovy_deg, float aspect, float znear, float zfar) {
    // OpenGL fixed pipeline expects column-major matrix.
    const float fovy_rad = fovy_deg * 3.1415926535f / 180.0f;
    const float f = 1.0f / std::tan(0.5f * fovy_rad);

    float m[16] = {};
    m[0]  = f / aspect;
    m[5]  = f;
    m[10] = (zfar + znear) / (znear - zfar);
    m[11] = -1.0f;
    m[14] = (2.0f * zfar * znear) / (znear - zfar);

    glMatrixMode(GL_PROJECTION);
    glLoadMatrixf(m);
}

static void look_at(Vec3f eye, Vec3f center, Vec3f up) {
    Vec3f fwd = sub(center, eye);
    float fl = len(fwd);
    if (fl > 1e-6f) fwd = mul(fwd, 1.0f / fl);

    float ul = len(up);
    if (ul > 1e-6f) up = mul(up, 1.0f / ul);

    Vec3f s = cross(fwd, up);
    float sl = len(s);
    if (sl > 1e-6f) s = mul(s, 1.0f / sl);

    Vec3f u = cross(s, fwd);

    float m[16] = {
        s.x,  u.x,  -fwd.x, 0.0f,
        s.y,  u.y,  -fwd.y, 0.0f,
        s.z,  u.z,  -fwd.z, 0.0f,
        0.0f, 0.0f, 0.0f,   1.0f
    };

    glMatrixMode(GL_MODELVIEW);
    glLoadMatrixf(m);
    glTranslatef(-eye.x, -eye.y, -eye.z);
}

static void draw_wire_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_LINES);
    // bottom
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1);
    glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y0,z0);
    // top
    glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // verticals
    glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0);
    glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0);
    glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1);
    glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1);
    glEnd();
}

static void draw_solid_box(Vec3f c, Vec3f half) {
    const float x0 = c.x - half.x, x1 = c.x + half.x;
    const float y0 = c.y - half.y, y1 = c.y + half.y;
    const float z0 = c.z - half.z, z1 = c.z + half.z;

    glBegin(GL_QUADS);
    // +Z
    glVertex3f(x0,y0,z1); glVertex3f(x1,y0,z1); glVertex3f(x1,y1,z1); glVertex3f(x0,y1,z1);
    // -Z
    glVertex3f(x1,y0,z0); glVertex3f(x0,y0,z0); glVertex3f(x0,y1,z0); glVertex3f(x1,y1,z0);
    // +X
    glVertex3f(x1,y0,z1); glVertex3f(x1,y0,z0); glVertex3f(x1,y1,z0); glVertex3f(x1,y1,z1);
    // -X
    glVertex3f(x0,y0,z0); glVertex3f(x0,y0,z1); glVertex3f(x0,y1,z1); glVertex3f(x0,y1,z0);
    // +Y
    glVertex3f(x0,y1,z1); glVertex3f(x1,y1,z1); glVertex3f(x1,y1,z0); glVertex3f(x0,y1,z0);
    // -Y
    glVertex3f(x0,y0,z0); glVertex3f(x1,y0,z0); glVertex3f(x1,y0,z1); glVertex3f(x0,y0,z1);
    glEnd();
}

static void draw_line(Vec3f a, Vec3f b) {
    glBegin(GL_LINES);
    glVertex3f(a.x,a.y,a.z);
    glVertex3f(b.x,b.y,b.z);
    glEnd();
}

static void state_to_color(ckpt::KinetochoreState s, float& r, float& g, float& b) {
    switch (s) {
        case ckpt::KinetochoreState::Detached:          r = 0.55f; g = 0.55f; b = 0.58f; break;
        case ckpt::KinetochoreState::AttachedRelaxed:   r = 0.95f; g = 0.80f; b = 0.20f; break;
        case ckpt::KinetochoreState::AttachedTensioned: r = 0.20f; g = 0.90f; b = 0.35f; break;
        case ckpt::KinetochoreState::Misattached:       r = 0.95f; g = 0.20f; b = 0.20f; break;
        default:                                        r = 1.00f; g = 0.00f; b = 1.00f; break;
    }
}

static void fiber_to_color(ckpt::world::FiberKind k, float& r, float& g, float& b) {
    switch (k) {
        case ckpt::world::FiberKind::Taut:      r = 0.35f; g = 0.85f; b = 0.45f; break;
        case ckpt::world::FiberKind::Merotelic: r = 0.85f; g = 0.25f; b = 0.25f; break;
        default:                                r = 0.55f; g = 0.55f; b = 0.35f; break;
    }
}

static ImVec4 outcome_color(ckpt::MitosisOutcome o) {
    switch (o) {
        case ckpt::MitosisOutcome::AnaphaseCompleted: return ImVec4(0.0f, 1.0f, 0.0f, 1.0f);
        case ckpt::MitosisOutcome::MitoticArrest:     return ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
        case ckpt::MitosisOutcome::Apoptosis:         return ImVec4(1.0f, 0.2f, 0.2f, 1.0f);
        default:                                      return ImVec4(0.5f, 0.8f, 1.0f, 1.0f);
    }
}

struct VisualUIState {
    bool show_hud = true;
    bool show_controls = true;
    bool show_plots = true;
    bool show_events = true;

    bool draw_poles = true;
    bool draw_plate = true;
    bool draw_fibers = true;
    bool draw_sites = true;
};

static void plot_line_with_xlimits(const char* title,
                                  const char* label,
                                  const double* xs,
                                  const double* ys,
                                  int count,
                                  double t0,
                                  double t1)
{
    if (count <= 1)
        return;

    if (ImPlot::BeginPlot(title)) {

        // --- X-axis handling (robust across ImPlot versions) ---
#if defined(ImAxis_X1)
        ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
        ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#else
        // Very old ImPlot: auto-fit fallback.
#endif

        ImPlot::PlotLine(label, xs, ys, count);

        ImPlot::EndPlot();
    }
}

int main(int argc, char** argv) {
    glfwSetErrorCallback(glfw_error_callback);
    if (!glfwInit()) return fail("glfwInit failed");

    const char* glsl_version = "#version 130";
    glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
    glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 0);

    GLFWwindow* window = glfwCreateWindow(1280, 720, "Checkpoint Kernel Visualizer", nullptr, nullptr);
    if (!window) {
        glfwTerminate();
        return fail("glfwCreateWindow failed");
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1); // vsync

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
#ifndef CKPT_NO_IMGUI_DOCKING
    io.ConfigFlags |= ImGuiConfigFlags_DockingEnable;
#endif
    (void)io;

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
    int scenario_idx = static_cast<int>(ckpt::ScenarioId::Default);
    for (int i = 1; i < argc; ++i) {
        if (argv[i] && std::string(argv[i]) == "--scenario" && i + 1 < argc) {
            ckpt::ScenarioId id = ckpt::ScenarioId::Default;
            if (ckpt::parseScenarioName(argv[++i], &id)) {
                scenario_idx = static_cast<int>(id);
            } else {
                std::fprintf(stderr, "Unknown scenario '%s', using default\n", argv[i]);
            }
        }
    }

    ckpt::Simulation sim;
    bool running = false;
    int seed_ui = 1337;
    bool sequential_ui = false;
    std::string reset_error;

    VisualUIState ui;

    // --- camera (deterministic, ImGui-controlled) ---
    float cam_yaw_deg   = 20.0f;
    float cam_pitch_deg = 15.0f;
    float cam_dist      = 22.0f;
    Vec3f cam_target    = v3(0.0f, 0.0f, 0.0f);

    ckpt::world::SpindleLayout layout;
    std::vector<ckpt::KinetochoreState> states;
    std::vector<ckpt::world::Fiber> fibers;

    float ticks_per_s = 10.0f;
    double wall_prev = glfwGetTime();
    double accum_s = 0.0;
    int last_substeps = 0;

    // History buffers (indexed by tick)
    std::vector<double> tick_hist, mcc_hist, ready_hist, mis_hist;
    constexpr int kPlotWindowN = 400;

    std::vector<ckpt::SimEvent> event_log;
    std::size_t events_seen = 0;
    std::uint32_t event_bits_accum = 0;

    ckpt::TickObservation last_obs = sim.observe();

    auto clear_history = [&]() {
        tick_hist.clear();
        mcc_hist.clear();
        ready_hist.clear();
        mis_hist.clear();
        event_log.clear();
        events_seen = 0;
        event_bits_accum = 0;
    };

    auto push_sample = [&](const ckpt::TickObservation& o) {
        tick_hist.push_back((double)o.tick);
        mcc_hist.push_back(o.bus_concentration);
        ready_hist.push_back((double)o.ready_count);
        mis_hist.push_back((double)o.misattached_count);
    };

    // One canonical refresh point so we cannot miss an update site.
    auto refresh_obs = [&]() {
        last_obs = sim.observe();
        const auto& ev = sim.events();
        for (; events_seen < ev.size(); ++events_seen) {
            event_log.push_back(ev[events_seen]);
        }
        event_bits_accum |= sim.getLatestEvents();
    };

    auto restart = [&]() {
        ckpt::RunConfig cfg = ckpt::makeScenarioConfig(static_cast<ckpt::ScenarioId>(scenario_idx));
        cfg.seed_u32 = static_cast<std::uint32_t>(std::max(seed_ui, 0));
        cfg.sibling_policy = sequential_ui ? ckpt::SiblingPolicy::Sequential : ckpt::SiblingPolicy::PreTickSnapshot;

        ckpt::ConfigError err;
        if (!sim.reset(cfg, &err)) {
            reset_error = err.message;
            return;
        }
        reset_error.clear();
        running = false;
        accum_s = 0.0;
        clear_history();
        layout.recompute(sim.config().population.chromosome_count);
        refresh_obs();
    };

    restart();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        // --- advance sim (wall-time accumulator) ---
        const double wall_now = glfwGetTime();
        double wall_dt = wall_now - wall_prev;
        wall_prev = wall_now;
        wall_dt = std::clamp(wall_dt, 0.0, 0.1);
        ticks_per_s = clampf(ticks_per_s, 1.0f, 240.0f);

        if (running && !sim.finished()) {
            accum_s += wall_dt;
            const double tick_s = 1.0 / (double)ticks_per_s;

            constexpr int kMaxSubstepsPerFrame = 20;
            int substeps = 0;
            while (accum_s >= tick_s && substeps < kMaxSubstepsPerFrame && sim.step()) {
                refresh_obs();
                push_sample(last_obs);
                accum_s -= tick_s;
                ++substeps;
            }
            last_substeps = substeps;
            if (substeps == kMaxSubstepsPerFrame) accum_s = 0.0;
        } else {
            last_substeps = 0;
        }
        if (sim.finished()) running = false;

        // --- ImGui frame ---
        ImGui_ImplOpenGL3_NewFrame();
        ImGui_ImplGlfw_NewFrame();
        ImGui::NewFrame();

#ifndef CKPT_NO_IMGUI_DOCKING
        ImGui::DockSpaceOverViewport(ImGui::GetMainViewport());
#endif

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
                const ImVec4 status_warn = ImVec4(1.0f, 1.0f, 0.0f, 1.0f);
                const ImVec4 status_fail = ImVec4(1.0f, 0.2f, 0.2f, 1.0f);

                ImGui::TextColored(header_col, "[ SPINDLE ASSEMBLY CHECKPOINT ]");
                ImGui::Separator();

                const char* run_txt = sim.finished() ? "FINISHED" : (running ? "RUNNING" : "PAUSED");
                ImGui::Text("TICK: %d / %d", last_obs.tick, sim.lastTick());
                ImGui::SameLine(180);
                ImGui::TextColored(outcome_color(last_obs.outcome), "[%s]", ckpt::outcomeName(last_obs.outcome));
                ImGui::Text("Run: %s", run_txt);
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== SIGNAL ===");
                const double thr = sim.controller().activationThreshold();
                const double c0 = std::max(sim.config().bus.initial_concentration, thr);
                const float mcc_ratio = (c0 > 0.0) ? (float)std::clamp(last_obs.bus_concentration / c0, 0.0, 1.0) : 0.0f;
                ImGui::Text("MCC:   %.2f (APC/C at < %.2f)", last_obs.bus_concentration, thr);
                ImGui::ProgressBar(mcc_ratio, ImVec2(260, 12), "");
                ImGui::Text("Flux:  %.2f", last_obs.total_flux);
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== KINETOCHORES ===");
                const float ready_ratio = (last_obs.agent_count > 0)
                    ? (float)last_obs.ready_count / (float)last_obs.agent_count : 0.0f;
                ImGui::Text("Ready: %d/%d", last_obs.ready_count, last_obs.agent_count);
                ImGui::ProgressBar(ready_ratio, ImVec2(260, 12), "");
                if (last_obs.misattached_count > 0) {
                    ImGui::TextColored(status_warn, "Misattached: %d", last_obs.misattached_count);
                } else {
                    ImGui::Text("Misattached: 0");
                }
                ImGui::Spacing();

                ImGui::TextColored(header_col, "=== SAFETY ===");
                const ckpt::SafetyReport rep = sim.monitor().summarize();
                if (rep.passed) {
                    ImGui::Text("Monitor: PASS");
                } else {
                    ImGui::TextColored(status_fail, "Monitor: %d violation(s), first at tick %d",
                                       rep.violation_count, rep.first_violation_tick);
                }
                ImGui::Text("Misattachment events: %d (%d agents)",
                            rep.misattachment_event_count, rep.affected_agent_count);
                if (sim.commitTick() >= 0) ImGui::Text("Commit at tick %d", sim.commitTick());
                if (sim.arrestTick() >= 0) ImGui::TextColored(status_warn, "Arrest at tick %d", sim.arrestTick());
                if (sim.budgetExhausted()) ImGui::TextColored(status_warn, "Tick budget exhausted");
            }
            ImGui::End();
        }

        if (ui.show_controls) {
            ImGui::Begin("Controls", &ui.show_controls);

            if (ImGui::BeginCombo("Scenario", ckpt::scenarioName(static_cast<ckpt::ScenarioId>(scenario_idx)))) {
                for (int i = 0; i < static_cast<int>(ckpt::ScenarioId::Count); ++i) {
                    const bool selected = (i == scenario_idx);
                    if (ImGui::Selectable(ckpt::scenarioName(static_cast<ckpt::ScenarioId>(i)), selected)) {
                        scenario_idx = i;
                    }
                    if (selected) ImGui::SetItemDefaultFocus();
                }
                ImGui::EndCombo();
            }
            ImGui::TextWrapped("%s", ckpt::scenarioDescription(static_cast<ckpt::ScenarioId>(scenario_idx)));
            ImGui::InputInt("Seed", &seed_ui);
            ImGui::Checkbox("Sequential sibling reads", &sequential_ui);

            if (ImGui::Button("Reset")) restart();
            ImGui::SameLine();
            if (ImGui::Button(running ? "Pause" : "Run")) running = !running && !sim.finished();
            ImGui::SameLine();
            if (ImGui::Button("Step") && !sim.finished()) {
                running = false;
                if (sim.step()) {
                    refresh_obs();
                    push_sample(last_obs);
                }
            }
            ImGui::SameLine();
            if (ImGui::Button("Finish")) {
                running = false;
                while (sim.step()) {
                    refresh_obs();
                    push_sample(last_obs);
                }
            }
            if (!reset_error.empty()) {
                ImGui::TextColored(ImVec4(1.0f, 0.2f, 0.2f, 1.0f), "Reset rejected: %s", reset_error.c_str());
            }

            ImGui::SliderFloat("Ticks / s", &ticks_per_s, 1.0f, 240.0f, "%.0f");
            ImGui::Text("Substeps last frame: %d", last_substeps);

            const ckpt::RunSignatures sig = sim.getRunSignatures();
            ImGui::Text("param 0x%08X", (unsigned)sig.run_param_hash_u32);
            ImGui::Text("telem 0x%08X", (unsigned)sig.telemetry_crc_u32);
            ImGui::Text("state 0x%08X", (unsigned)sig.state_digest_u32);

            ImGui::Separator();
            ImGui::Checkbox("HUD", &ui.show_hud);
            ImGui::SameLine();
            ImGui::Checkbox("Plots", &ui.show_plots);
            ImGui::SameLine();
            ImGui::Checkbox("Events", &ui.show_events);
            ImGui::Checkbox("Poles", &ui.draw_poles);
            ImGui::SameLine();
            ImGui::Checkbox("Plate", &ui.draw_plate);
            ImGui::SameLine();
            ImGui::Checkbox("Fibers", &ui.draw_fibers);
            ImGui::SameLine();
            ImGui::Checkbox("Kinetochores", &ui.draw_sites);

            ImGui::SliderFloat("Yaw", &cam_yaw_deg, -180.0f, 180.0f);
            ImGui::SliderFloat("Pitch", &cam_pitch_deg, -80.0f, 80.0f);
            ImGui::SliderFloat("Distance", &cam_dist, 5.0f, 60.0f);

            ImGui::End();
        }

        if (ui.show_plots) {
            ImGui::Begin("Plots", &ui.show_plots);
            const int n = (int)tick_hist.size();
            const int count = std::min(n, kPlotWindowN);
            const int start = n - count;
            ImGui::Text("Samples: %d", n);
            if (count > 1) {
                const double t0 = tick_hist[(size_t)start];
                const double t1 = tick_hist[(size_t)(n - 1)];

                if (ImPlot::BeginPlot("MCC concentration")) {
#if defined(ImAxis_X1)
                    ImPlot::SetupAxisLimits(ImAxis_X1, t0, t1, ImGuiCond_Always);
#elif defined(ImPlotAxis_X1)
                    ImPlot::SetupAxisLimits(ImPlotAxis_X1, t0, t1, ImGuiCond_Always);
#endif
                    ImPlot::PlotLine("MCC", tick_hist.data() + start, mcc_hist.data() + start, count);
                    const double thr_x[2] = {t0, t1};
                    const double thr_y[2] = {sim.controller().activationThreshold(), sim.controller().activationThreshold()};
                    ImPlot::PlotLine("APC/C threshold", thr_x, thr_y, 2);
                    ImPlot::EndPlot();
                }

                plot_line_with_xlimits("Ready kinetochores", "ready",
                                       tick_hist.data() + start, ready_hist.data() + start, count, t0, t1);
                plot_line_with_xlimits("Misattached kinetochores", "misattached",
                                       tick_hist.data() + start, mis_hist.data() + start, count, t0, t1);
            }
            ImGui::End();
        }

        if (ui.show_events) {
            ImGui::Begin("Events", &ui.show_events);
            ImGui::Text("Flags seen: 0x%08X", (unsigned)event_bits_accum);
            ImGui::Separator();
            for (const ckpt::SimEvent& e : event_log) {
                ImGui::Text("T=%03d [%s] %s", e.tick, ckpt::simEventKindName(e.kind), e.text.c_str());
            }
            ImGui::End();
        }

        // --- model-backed geometry ---
        const auto& agents = sim.agents();
        states.resize(agents.size());
        for (size_t i = 0; i < agents.size(); ++i) states[i] = agents[i].state();
        layout.buildFibers(states, &fibers);

        ImGui::Render();

        int fb_w = 0, fb_h = 0;
        glfwGetFramebufferSize(window, &fb_w, &fb_h);

        if (fb_w > 0 && fb_h > 0) {
            glViewport(0, 0, fb_w, fb_h);

            glEnable(GL_DEPTH_TEST);
            glDepthFunc(GL_LESS);
            glDisable(GL_CULL_FACE);

            glClearColor(0.06f, 0.06f, 0.07f, 1.0f);
            glClear(GL_COLOR_BUFFER_BIT | GL_DEPTH_BUFFER_BIT);

            const float aspect = (fb_h > 0) ? (float)fb_w / (float)fb_h : 1.0f;
            set_perspective(45.0f, aspect, 0.1f, 200.0f);

            const float yaw   = cam_yaw_deg   * 3.1415926535f / 180.0f;
            const float pitch = cam_pitch_deg * 3.1415926535f / 180.0f;

            Vec3f eye = v3(
                cam_target.x + cam_dist * std::cos(pitch) * std::sin(yaw),
                cam_target.y + cam_dist * std::sin(pitch),
                cam_target.z + cam_dist * std::cos(pitch) * std::cos(yaw)
            );
            look_at(eye, cam_target, v3(0.0f, 1.0f, 0.0f));

            if (layout.isValid()) {
                const ckpt::world::SpindleLayoutConfig& lc = layout.config();

                if (ui.draw_plate) {
                    glColor3f(0.25f, 0.25f, 0.28f);
                    draw_wire_box(v3(0.0f, 0.0f, 0.0f),
                                  v3(0.5f * (float)lc.sister_gap_um + 0.3f, 0.5f * (float)lc.plate_height_um + 0.6f, 1.0f));
                }

                if (ui.draw_poles) {
                    const bool committed = last_obs.committed;
                    for (const auto& p : layout.poles()) {
                        if (committed) glColor3f(0.30f, 0.85f, 0.95f);
                        else glColor3f(0.70f, 0.70f, 0.75f);
                        draw_solid_box(to_v3f(p), v3(0.35f, 0.35f, 0.35f));
                    }
                }

                if (ui.draw_fibers) {
                    for (const auto& f : fibers) {
                        float r, g, b;
                        fiber_to_color(f.kind, r, g, b);
                        glColor3f(r, g, b);
                        draw_line(to_v3f(f.from_um), to_v3f(f.to_um));
                    }
                }

                if (ui.draw_sites) {
                    const float h = 0.15f;
                    for (const auto& site : layout.sites()) {
                        const size_t idx = (size_t)site.uid;
                        if (idx >= states.size()) continue;
                        float r, g, b;
                        state_to_color(states[idx], r, g, b);
                        glColor3f(r, g, b);
                        const Vec3f c = to_v3f(layout.sitePosition(site.uid, states[idx]));
                        draw_solid_box(c, v3(h, h, h));
                        if (agents[idx].variant() != ckpt::AgentVariant::None) {
                            glColor3f(0.85f, 0.45f, 0.95f);
                            draw_wire_box(c, v3(h * 1.6f, h * 1.6f, h * 1.6f));
                        }
                    }
                }
            }

            glDisable(GL_DEPTH_TEST);
            ImGui_ImplOpenGL3_RenderDrawData(ImGui::GetDrawData());
        }

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
