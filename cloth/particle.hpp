#ifndef CLOTHSIM_CLOTH_PARTICLE_HPP
#define CLOTHSIM_CLOTH_PARTICLE_HPP

#include <math/vec2.hpp>
#include <cstdint>

namespace clothsim {

using ParticleId = uint32_t;

// A mass point of the cloth.
// Velocity is implicit: position - previous_position.
struct Particle {
    Vec2 position;
    Vec2 previous_position;
    Vec2 force;                   // Accumulated forces, cleared every step

    float mass = 1.0f;

    bool is_pinned = false;       // Never moved by integration or correction

    Vec2 velocity() const {
        return position - previous_position;
    }

    void clear_force() {
        force = vec2::zero();
    }

    void add_force(const Vec2& f) {
        force += f;
    }
};

}  // namespace clothsim

#endif // CLOTHSIM_CLOTH_PARTICLE_HPP
