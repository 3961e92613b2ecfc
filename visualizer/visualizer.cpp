#include "visualizer.hpp"
#include "logging.hpp"

#ifdef CLOTHSIM_HAS_VISUALIZATION

#include <GLFW/glfw3.h>
#include <algorithm>
#include <cmath>
#include <cstdint>

namespace clothsim {

// Global state for callbacks
static SimulationConfig g_config;
static bool g_paused = false;
static bool g_request_reset = false;
static bool g_show_particles = true;

template <typename T>
static void adjust(T& value, T delta, T lo, T hi, const char* name) {
    T updated = std::clamp(value + delta, lo, hi);
    if (updated != value) {
        value = updated;
        auto log = clothsim::logging::get_logger();
        log->info("{} = {}", name, value);
    }
}

static void adjust_grid(uint32_t& value, int delta, const char* name) {
    int updated = std::clamp(static_cast<int>(value) + delta,
                             static_cast<int>(config_range::kMinGridSize),
                             static_cast<int>(config_range::kMaxGridSize));
    if (static_cast<uint32_t>(updated) != value) {
        value = static_cast<uint32_t>(updated);
        auto log = clothsim::logging::get_logger();
        log->info("{} = {}", name, value);
    }
}

static void key_callback(GLFWwindow* window, int key, int scancode, int action, int mods) {
    (void)scancode;
    (void)mods;
    if (action != GLFW_PRESS && action != GLFW_REPEAT) {
        return;
    }

    using namespace config_range;
    switch (key) {
        case GLFW_KEY_ESCAPE:
        case GLFW_KEY_Q:
            glfwSetWindowShouldClose(window, GLFW_TRUE);
            break;
        case GLFW_KEY_SPACE:
            g_paused = !g_paused;
            break;
        case GLFW_KEY_R:
            g_request_reset = true;
            break;
        case GLFW_KEY_P:
            g_show_particles = !g_show_particles;
            break;
        case GLFW_KEY_W:
            adjust_grid(g_config.width, 1, "width");
            break;
        case GLFW_KEY_S:
            adjust_grid(g_config.width, -1, "width");
            break;
        case GLFW_KEY_H:
            adjust_grid(g_config.height, 1, "height");
            break;
        case GLFW_KEY_J:
            adjust_grid(g_config.height, -1, "height");
            break;
        case GLFW_KEY_I:
            adjust(g_config.iterations, 1, kMinIterations, kMaxIterations, "iterations");
            break;
        case GLFW_KEY_K:
            adjust(g_config.iterations, -1, kMinIterations, kMaxIterations, "iterations");
            break;
        case GLFW_KEY_T:
            adjust(g_config.tear_threshold, 0.1f, kMinTearThreshold, kMaxTearThreshold, "tear_threshold");
            break;
        case GLFW_KEY_G:
            adjust(g_config.tear_threshold, -0.1f, kMinTearThreshold, kMaxTearThreshold, "tear_threshold");
            break;
        case GLFW_KEY_F:
            adjust(g_config.stiffness, 0.05f, kMinStiffness, kMaxStiffness, "stiffness");
            break;
        case GLFW_KEY_V:
            adjust(g_config.stiffness, -0.05f, kMinStiffness, kMaxStiffness, "stiffness");
            break;
        case GLFW_KEY_UP:
            adjust(g_config.gravity.y, 50.0f, kMinGravity, kMaxGravity, "gravity");
            break;
        case GLFW_KEY_DOWN:
            adjust(g_config.gravity.y, -50.0f, kMinGravity, kMaxGravity, "gravity");
            break;
        case GLFW_KEY_RIGHT_BRACKET:
            adjust(g_config.cut_radius, 1.0f, kMinCutRadius, kMaxCutRadius, "cut_radius");
            break;
        case GLFW_KEY_LEFT_BRACKET:
            adjust(g_config.cut_radius, -1.0f, kMinCutRadius, kMaxCutRadius, "cut_radius");
            break;
        default:
            break;
    }
}

// Tracks button edges between frames
struct ButtonEdges {
    bool last_down = false;

    void sample(bool down, bool& pressed, bool& held, bool& released) {
        pressed = down && !last_down;
        released = !down && last_down;
        held = down;
        last_down = down;
    }
};

// Select edges are only sampled while the simulation consumes them, so a
// release during pause is reported on the first running frame.
static PointerState poll_pointer(GLFWwindow* window, ButtonEdges& select, bool track_select) {
    PointerState pointer;

    double mx, my;
    glfwGetCursorPos(window, &mx, &my);
    pointer.position = Vec2(static_cast<float>(mx), static_cast<float>(my));

    if (track_select) {
        bool select_down = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_LEFT) == GLFW_PRESS;
        select.sample(select_down, pointer.select_pressed, pointer.select_held,
                      pointer.select_released);
    }

    pointer.cut_held = glfwGetMouseButton(window, GLFW_MOUSE_BUTTON_RIGHT) == GLFW_PRESS;

    // No on-screen panel covers the cloth
    pointer.over_ui = false;
    return pointer;
}

static void render_snapshot(const RenderSnapshot& snapshot, const VisualizerConfig& config) {
    glLineWidth(config.line_width);
    glColor3f(1.0f, 1.0f, 1.0f);
    glBegin(GL_LINES);
    for (const auto& segment : snapshot.segments) {
        glVertex2f(segment.a.x, segment.a.y);
        glVertex2f(segment.b.x, segment.b.y);
    }
    glEnd();

    if (!g_show_particles) {
        return;
    }

    // Free particles first so pinned ones draw on top
    glPointSize(config.free_point_size);
    glColor3f(0.2f, 0.4f, 1.0f);
    glBegin(GL_POINTS);
    for (const auto& p : snapshot.particles) {
        if (!p.pinned) glVertex2f(p.position.x, p.position.y);
    }
    glEnd();

    glPointSize(config.pinned_point_size);
    glColor3f(1.0f, 0.2f, 0.2f);
    glBegin(GL_POINTS);
    for (const auto& p : snapshot.particles) {
        if (p.pinned) glVertex2f(p.position.x, p.position.y);
    }
    glEnd();
}

static void render_cut_cursor(const Vec2& center, float radius) {
    constexpr int kSegments = 32;
    glColor3f(0.9f, 0.8f, 0.2f);
    glBegin(GL_LINE_LOOP);
    for (int i = 0; i < kSegments; ++i) {
        float angle = 2.0f * 3.14159265f * static_cast<float>(i) / kSegments;
        glVertex2f(center.x + radius * std::cos(angle), center.y + radius * std::sin(angle));
    }
    glEnd();
}

VisualizerResult run_visualizer(
    const SimulationConfig& initial_config,
    const VisualizerConfig& viz_config) {

    auto log = clothsim::logging::get_logger();
    VisualizerResult result;

    if (!glfwInit()) {
        log->error("Failed to initialize GLFW");
        return result;
    }

    glfwWindowHint(GLFW_VISIBLE, GLFW_TRUE);
    glfwWindowHint(GLFW_FOCUSED, GLFW_TRUE);

    GLFWwindow* window = glfwCreateWindow(
        viz_config.window_width,
        viz_config.window_height,
        viz_config.window_title.c_str(),
        nullptr, nullptr);

    if (!window) {
        log->error("Failed to create GLFW window");
        glfwTerminate();
        return result;
    }

    glfwMakeContextCurrent(window);
    glfwSwapInterval(1);  // Enable vsync
    glfwSetKeyCallback(window, key_callback);

    g_config = initial_config;
    g_paused = viz_config.start_paused;
    g_request_reset = false;
    g_show_particles = viz_config.show_particles;

    Simulation simulation(g_config);
    ButtonEdges select_edges;

    glClearColor(0.0f, 0.0f, 0.0f, 1.0f);
    glDisable(GL_DEPTH_TEST);

    log->info("Viewer started. Controls:");
    log->info("  left mouse=drag, right mouse=cut");
    log->info("  space=pause/resume, r=reset, p=toggle particles, q=quit");
    log->info("  w/s=width, h/j=height, i/k=iterations");
    log->info("  t/g=tear threshold, f/v=stiffness, up/down=gravity, [/]=cut radius");

    double last_time = glfwGetTime();

    while (!glfwWindowShouldClose(window)) {
        glfwPollEvents();

        double now = glfwGetTime();
        float dt = static_cast<float>(now - last_time);
        last_time = now;

        // Window pixels, y down
        int width, height;
        glfwGetFramebufferSize(window, &width, &height);
        glViewport(0, 0, width, height);
        int win_width, win_height;
        glfwGetWindowSize(window, &win_width, &win_height);
        glMatrixMode(GL_PROJECTION);
        glLoadIdentity();
        glOrtho(0.0, win_width, win_height, 0.0, -1.0, 1.0);
        glMatrixMode(GL_MODELVIEW);
        glLoadIdentity();

        if (g_request_reset) {
            simulation.reset(g_config);
            g_request_reset = false;
        }

        PointerState pointer = poll_pointer(window, select_edges, !g_paused);

        if (!g_paused) {
            FrameStats stats = simulation.update(g_config, pointer, dt);
            if (stats.torn > 0 || stats.cut > 0) {
                log->debug("Frame {}: torn={}, cut={}, live={}",
                           simulation.frame_count(), stats.torn, stats.cut,
                           stats.live_constraints);
            }
        }

        glClear(GL_COLOR_BUFFER_BIT);
        render_snapshot(simulation.render_snapshot(), viz_config);
        if (pointer.cut_held) {
            render_cut_cursor(pointer.position, g_config.cut_radius);
        }

        glfwSwapBuffers(window);
    }

    result.completed = true;
    result.frames = simulation.frame_count();
    result.live_constraints = simulation.cloth().constraint_count();
    result.final_config = g_config;

    glfwDestroyWindow(window);
    glfwTerminate();

    log->info("Viewer closed after {} frames, {} constraints left",
              result.frames, result.live_constraints);

    return result;
}

bool visualization_available() {
    return true;
}

}  // namespace clothsim

#else  // CLOTHSIM_HAS_VISUALIZATION not defined

namespace clothsim {

VisualizerResult run_visualizer(const SimulationConfig&, const VisualizerConfig&) {
    auto log = clothsim::logging::get_logger();
    log->error("Visualization not available - compile with GLFW and OpenGL");
    return VisualizerResult{};
}

bool visualization_available() {
    return false;
}

}  // namespace clothsim

#endif  // CLOTHSIM_HAS_VISUALIZATION
