#include "simulation_config.hpp"
#include <cmath>

namespace clothsim {

std::vector<std::string> validate_config(const SimulationConfig& config) {
    std::vector<std::string> errors;

    if (config.width < 2) {
        errors.push_back("width must be at least 2, got " + std::to_string(config.width));
    }
    if (config.height < 2) {
        errors.push_back("height must be at least 2, got " + std::to_string(config.height));
    }
    if (static_cast<uint64_t>(config.width) * config.height > kMaxParticleCount) {
        errors.push_back("width * height must be at most " + std::to_string(kMaxParticleCount) +
                         ", got " + std::to_string(config.width) + "x" +
                         std::to_string(config.height));
    }
    if (!(config.spacing > 0.0f) || !std::isfinite(config.spacing)) {
        errors.push_back("spacing must be positive, got " + std::to_string(config.spacing));
    }
    if (!(config.particle_mass > 0.0f)) {
        errors.push_back("particle_mass must be positive, got " +
                         std::to_string(config.particle_mass));
    }
    if (!(config.stiffness > 0.0f && config.stiffness <= 1.0f)) {
        errors.push_back("stiffness must be in (0, 1], got " + std::to_string(config.stiffness));
    }
    if (!(config.tear_threshold > 1.0f)) {
        errors.push_back("tear_threshold must be greater than 1, got " +
                         std::to_string(config.tear_threshold));
    }
    if (config.iterations < 1) {
        errors.push_back("iterations must be at least 1, got " +
                         std::to_string(config.iterations));
    }
    if (!(config.cut_radius > 0.0f)) {
        errors.push_back("cut_radius must be positive, got " + std::to_string(config.cut_radius));
    }

    return errors;
}

}  // namespace clothsim
