#include "cloth.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace clothsim {

const char* to_string(ConstraintType type) {
    switch (type) {
        case ConstraintType::Structural: return "Structural";
        case ConstraintType::Bending: return "Bending";
        case ConstraintType::Shear: return "Shear";
    }
    return "Unknown";
}

Cloth::Cloth(uint32_t width, uint32_t height, float spacing, const Vec2& origin)
    : width_(width), height_(height), spacing_(spacing), origin_(origin) {
    particles_.reserve(static_cast<size_t>(width) * height);
}

ParticleId Cloth::add_particle(const Particle& particle) {
    ParticleId id = static_cast<ParticleId>(particles_.size());
    particles_.push_back(particle);
    return id;
}

Particle& Cloth::particle(ParticleId id) {
    if (id >= particles_.size()) {
        throw std::out_of_range("Cloth::particle: invalid particle id");
    }
    return particles_[id];
}

const Particle& Cloth::particle(ParticleId id) const {
    if (id >= particles_.size()) {
        throw std::out_of_range("Cloth::particle: invalid particle id");
    }
    return particles_[id];
}

ParticleId Cloth::particle_at(uint32_t x, uint32_t y) const {
    if (x >= width_ || y >= height_) {
        throw std::out_of_range("Cloth::particle_at: grid coordinate out of range");
    }
    return y * width_ + x;
}

ConstraintId Cloth::add_constraint(const Constraint& constraint) {
    if (constraint.particle_a >= particles_.size() ||
        constraint.particle_b >= particles_.size()) {
        throw std::out_of_range("Cloth::add_constraint: invalid particle id");
    }
    if (constraint.particle_a == constraint.particle_b) {
        throw std::invalid_argument("Cloth::add_constraint: endpoints must be distinct");
    }
    if (!(constraint.rest_length > 0.0f)) {
        throw std::invalid_argument("Cloth::add_constraint: rest length must be positive");
    }
    ConstraintId id = static_cast<ConstraintId>(constraints_.size());
    constraints_.push_back(constraint);
    return id;
}

const Constraint& Cloth::constraint(ConstraintId id) const {
    if (id >= constraints_.size()) {
        throw std::out_of_range("Cloth::constraint: invalid constraint id");
    }
    return constraints_[id];
}

float Cloth::constraint_length(const Constraint& constraint) const {
    return particles_[constraint.particle_a].position.distance_to(
        particles_[constraint.particle_b].position);
}

size_t Cloth::remove_constraints_if(const std::function<bool(const Constraint&)>& pred) {
    auto it = std::remove_if(constraints_.begin(), constraints_.end(), pred);
    size_t removed = static_cast<size_t>(std::distance(it, constraints_.end()));
    constraints_.erase(it, constraints_.end());
    return removed;
}

size_t Cloth::count_constraints(ConstraintType type) const {
    return static_cast<size_t>(std::count_if(constraints_.begin(), constraints_.end(),
        [type](const Constraint& c) { return c.type == type; }));
}

size_t Cloth::pinned_count() const {
    return static_cast<size_t>(std::count_if(particles_.begin(), particles_.end(),
        [](const Particle& p) { return p.is_pinned; }));
}

void Cloth::clear_all_forces() {
    for (auto& particle : particles_) {
        particle.clear_force();
    }
}

}  // namespace clothsim
