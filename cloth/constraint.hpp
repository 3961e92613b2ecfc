#ifndef CLOTHSIM_CLOTH_CONSTRAINT_HPP
#define CLOTHSIM_CLOTH_CONSTRAINT_HPP

#include "particle.hpp"
#include <cstdint>

namespace clothsim {

using ConstraintId = uint32_t;

// Which topology rule produced a constraint
enum class ConstraintType {
    Structural,   // Adjacent grid neighbours, resists stretch
    Bending,      // Neighbours two cells apart, resists folding
    Shear         // Diagonal neighbours, resists skew
};

// A distance constraint (spring) between two particles.
// Stiffness is global and applied by the solver.
struct Constraint {
    ParticleId particle_a = 0;
    ParticleId particle_b = 0;

    ConstraintType type = ConstraintType::Structural;
    float rest_length = 1.0f;
};

const char* to_string(ConstraintType type);

}  // namespace clothsim

#endif // CLOTHSIM_CLOTH_CONSTRAINT_HPP
