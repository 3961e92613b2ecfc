#include "cloth_builder.hpp"
#include "logging.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace clothsim {

Cloth ClothBuilder::build(const ClothBuildConfig& config) {
    if (config.width < 2 || config.height < 2) {
        throw std::invalid_argument("ClothBuilder: grid must be at least 2x2, got " +
                                    std::to_string(config.width) + "x" +
                                    std::to_string(config.height));
    }
    if (static_cast<uint64_t>(config.width) * config.height > kMaxParticleCount) {
        throw std::invalid_argument("ClothBuilder: grid " + std::to_string(config.width) + "x" +
                                    std::to_string(config.height) + " exceeds " +
                                    std::to_string(kMaxParticleCount) + " particles");
    }
    if (!(config.spacing > 0.0f) || !std::isfinite(config.spacing)) {
        throw std::invalid_argument("ClothBuilder: spacing must be positive");
    }
    if (!(config.particle_mass > 0.0f)) {
        throw std::invalid_argument("ClothBuilder: particle mass must be positive");
    }

    ClothBuilder builder(config);
    builder.create_particles();
    builder.create_constraints();

    auto log = clothsim::logging::get_logger();
    log->debug("ClothBuilder: created {}x{} cloth with {} particles, {} constraints "
               "({} structural, {} bending, {} shear)",
               config.width, config.height,
               builder.cloth_.particle_count(),
               builder.cloth_.constraint_count(),
               builder.cloth_.count_constraints(ConstraintType::Structural),
               builder.cloth_.count_constraints(ConstraintType::Bending),
               builder.cloth_.count_constraints(ConstraintType::Shear));

    return std::move(builder.cloth_);
}

ClothBuilder::ClothBuilder(const ClothBuildConfig& config)
    : config_(config),
      cloth_(config.width, config.height, config.spacing, config.origin) {
}

void ClothBuilder::create_particles() {
    for (uint32_t y = 0; y < config_.height; ++y) {
        for (uint32_t x = 0; x < config_.width; ++x) {
            Particle p;
            p.position = config_.origin + Vec2(static_cast<float>(x) * config_.spacing,
                                               static_cast<float>(y) * config_.spacing);
            p.previous_position = p.position;
            p.mass = config_.particle_mass;
            p.is_pinned = (y == 0);
            cloth_.add_particle(p);
        }
    }
}

void ClothBuilder::create_constraints() {
    const uint32_t w = config_.width;
    const uint32_t h = config_.height;
    const float s = config_.spacing;
    const float diagonal = s * std::sqrt(2.0f);

    // Emission order per cell is observable through Gauss-Seidel relaxation
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            ParticleId i = y * w + x;
            if (x + 1 < w) {
                add(i, i + 1, ConstraintType::Structural, s);
                if (x + 2 < w) {
                    add(i, i + 2, ConstraintType::Bending, 2.0f * s);
                }
            }
            if (y + 1 < h) {
                add(i, i + w, ConstraintType::Structural, s);
                if (y + 2 < h) {
                    add(i, i + 2 * w, ConstraintType::Bending, 2.0f * s);
                }
            }
            if (x + 1 < w && y + 1 < h) {
                add(i, i + w + 1, ConstraintType::Shear, diagonal);
                add(i + 1, i + w, ConstraintType::Shear, diagonal);
            }
        }
    }
}

void ClothBuilder::add(ParticleId a, ParticleId b, ConstraintType type, float rest_length) {
    Constraint c;
    c.particle_a = a;
    c.particle_b = b;
    c.type = type;
    c.rest_length = rest_length;
    cloth_.add_constraint(c);
}

}  // namespace clothsim
