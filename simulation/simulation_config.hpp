#ifndef CLOTHSIM_SIMULATION_CONFIG_HPP
#define CLOTHSIM_SIMULATION_CONFIG_HPP

#include <cloth/cloth_builder.hpp>
#include <solver/cloth_solver.hpp>
#include <math/vec2.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace clothsim {

// Everything the simulation reads from the outside each frame.
// Changing width/height rebuilds the cloth; spacing, origin and
// particle_mass take effect at the next rebuild; the rest apply
// on the next frame.
struct SimulationConfig {
    // Topology
    uint32_t width = 40;
    uint32_t height = 25;
    float spacing = 15.0f;
    Vec2 origin{300.0f, 50.0f};
    float particle_mass = 1.0f;

    // Physics
    Vec2 gravity{0.0f, 980.0f};
    float stiffness = 0.9f;
    float tear_threshold = 4.5f;
    int iterations = 5;

    // Interaction
    float cut_radius = 10.0f;

    ClothBuildConfig build_config() const {
        ClothBuildConfig build;
        build.width = width;
        build.height = height;
        build.spacing = spacing;
        build.origin = origin;
        build.particle_mass = particle_mass;
        return build;
    }

    SolverParams solver_params() const {
        SolverParams params;
        params.gravity = gravity;
        params.stiffness = stiffness;
        params.tear_threshold = tear_threshold;
        params.iterations = iterations;
        return params;
    }
};

// Ranges offered by interactive controls
namespace config_range {
    constexpr uint32_t kMinGridSize = 4;
    constexpr uint32_t kMaxGridSize = 64;
    constexpr float kMinCutRadius = 10.0f;
    constexpr float kMaxCutRadius = 50.0f;
    constexpr float kMinGravity = 0.0f;
    constexpr float kMaxGravity = 2000.0f;
    constexpr float kMinStiffness = 0.1f;
    constexpr float kMaxStiffness = 1.0f;
    constexpr float kMinTearThreshold = 1.1f;
    constexpr float kMaxTearThreshold = 10.0f;
    constexpr int kMinIterations = 1;
    constexpr int kMaxIterations = 20;
}

// Check the input contract of the core. Returns one message per
// violated field; an empty vector means the config is usable.
std::vector<std::string> validate_config(const SimulationConfig& config);

}  // namespace clothsim

#endif // CLOTHSIM_SIMULATION_CONFIG_HPP
