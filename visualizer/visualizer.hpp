#ifndef CLOTHSIM_VISUALIZER_HPP
#define CLOTHSIM_VISUALIZER_HPP

#include <simulation/simulation.hpp>
#include <simulation/simulation_config.hpp>
#include <cstdint>
#include <string>

namespace clothsim {

// Configuration for the viewer window
struct VisualizerConfig {
    int window_width = 1200;
    int window_height = 800;
    std::string window_title = "2D Cloth Simulator";

    // Rendering options
    float pinned_point_size = 6.0f;
    float free_point_size = 4.0f;
    float line_width = 1.0f;
    bool show_particles = true;

    bool start_paused = false;
};

// Result of a viewer session
struct VisualizerResult {
    bool completed = false;           // User closed window normally
    uint64_t frames = 0;              // Frames simulated
    size_t live_constraints = 0;      // Constraints left when closed
    SimulationConfig final_config;    // Config after interactive edits
};

// Run the interactive viewer. Left mouse drags particles, right mouse
// cuts, keys adjust the configuration. Returns when the window closes.
VisualizerResult run_visualizer(
    const SimulationConfig& initial_config,
    const VisualizerConfig& viz_config = VisualizerConfig{}
);

// Check if visualization is available (GLFW/OpenGL compiled in)
bool visualization_available();

}  // namespace clothsim

#endif // CLOTHSIM_VISUALIZER_HPP
