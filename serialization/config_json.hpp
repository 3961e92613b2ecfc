#ifndef CLOTHSIM_SERIALIZATION_CONFIG_JSON_HPP
#define CLOTHSIM_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <simulation/simulation_config.hpp>
#include <simulation/simulation.hpp>
#include <solver/cloth_solver.hpp>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace clothsim {

// Vec2 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
}

// Grid sizes are read signed so a negative value is rejected rather than
// wrapped to a huge unsigned count.
inline uint32_t grid_size_from_json(const nlohmann::json& j, const char* key, uint32_t fallback) {
    if (!j.contains(key)) {
        return fallback;
    }
    int64_t value = j.at(key).get<int64_t>();
    if (value < 2 || static_cast<uint64_t>(value) > kMaxParticleCount) {
        throw std::invalid_argument(std::string(key) + " must be in [2, " +
                                    std::to_string(kMaxParticleCount) + "], got " +
                                    std::to_string(value));
    }
    return static_cast<uint32_t>(value);
}

// SimulationConfig serialization; missing fields keep their defaults
inline void to_json(nlohmann::json& j, const SimulationConfig& config) {
    j = {
        {"width", config.width},
        {"height", config.height},
        {"spacing", config.spacing},
        {"origin", config.origin},
        {"particle_mass", config.particle_mass},
        {"gravity", config.gravity},
        {"stiffness", config.stiffness},
        {"tear_threshold", config.tear_threshold},
        {"iterations", config.iterations},
        {"cut_radius", config.cut_radius}
    };
}

inline void from_json(const nlohmann::json& j, SimulationConfig& config) {
    const SimulationConfig defaults;
    config.width = grid_size_from_json(j, "width", defaults.width);
    config.height = grid_size_from_json(j, "height", defaults.height);
    config.spacing = j.value("spacing", defaults.spacing);
    config.origin = defaults.origin;
    if (j.contains("origin")) {
        config.origin = j["origin"].get<Vec2>();
    }
    config.particle_mass = j.value("particle_mass", defaults.particle_mass);
    config.gravity = defaults.gravity;
    if (j.contains("gravity")) {
        config.gravity = j["gravity"].get<Vec2>();
    }
    config.stiffness = j.value("stiffness", defaults.stiffness);
    config.tear_threshold = j.value("tear_threshold", defaults.tear_threshold);
    config.iterations = j.value("iterations", defaults.iterations);
    config.cut_radius = j.value("cut_radius", defaults.cut_radius);
}

// SolverParams serialization
inline void to_json(nlohmann::json& j, const SolverParams& params) {
    j = {
        {"gravity", params.gravity},
        {"stiffness", params.stiffness},
        {"tear_threshold", params.tear_threshold},
        {"iterations", params.iterations}
    };
}

// FrameStats serialization
inline void to_json(nlohmann::json& j, const FrameStats& stats) {
    j = {
        {"torn", stats.torn},
        {"cut", stats.cut},
        {"live_constraints", stats.live_constraints},
        {"rebuilt", stats.rebuilt},
        {"dragging", stats.dragging}
    };
}

}  // namespace clothsim

#endif // CLOTHSIM_SERIALIZATION_CONFIG_JSON_HPP
