#ifndef CLOTHSIM_CLOTH_CLOTH_HPP
#define CLOTHSIM_CLOTH_CLOTH_HPP

#include "particle.hpp"
#include "constraint.hpp"
#include <cstddef>
#include <functional>
#include <vector>

namespace clothsim {

// Container for the particle store and the live constraint list.
// Constraints keep their insertion order; removal is permanent.
class Cloth {
public:
    Cloth() = default;
    Cloth(uint32_t width, uint32_t height, float spacing, const Vec2& origin);

    // Grid layout used to generate the topology
    uint32_t width() const { return width_; }
    uint32_t height() const { return height_; }
    float spacing() const { return spacing_; }
    const Vec2& origin() const { return origin_; }

    // Particle management
    ParticleId add_particle(const Particle& particle);
    Particle& particle(ParticleId id);
    const Particle& particle(ParticleId id) const;
    bool has_particle(ParticleId id) const { return id < particles_.size(); }
    size_t particle_count() const { return particles_.size(); }
    std::vector<Particle>& particles() { return particles_; }
    const std::vector<Particle>& particles() const { return particles_; }

    // Row-major grid lookup
    ParticleId particle_at(uint32_t x, uint32_t y) const;

    // Constraint management.
    // add_constraint rejects unknown or identical endpoints and a
    // non-positive rest length, so the solver can rely on them.
    ConstraintId add_constraint(const Constraint& constraint);
    const Constraint& constraint(ConstraintId id) const;
    size_t constraint_count() const { return constraints_.size(); }
    const std::vector<Constraint>& constraints() const { return constraints_; }

    // Current endpoint distance of a constraint
    float constraint_length(const Constraint& constraint) const;

    // Permanently remove every constraint matching the predicate.
    // Survivors keep their relative order. Returns the number removed.
    size_t remove_constraints_if(const std::function<bool(const Constraint&)>& pred);

    size_t count_constraints(ConstraintType type) const;
    size_t pinned_count() const;

    void clear_all_forces();

private:
    std::vector<Particle> particles_;
    std::vector<Constraint> constraints_;

    uint32_t width_ = 0;
    uint32_t height_ = 0;
    float spacing_ = 0.0f;
    Vec2 origin_;
};

}  // namespace clothsim

#endif // CLOTHSIM_CLOTH_CLOTH_HPP
