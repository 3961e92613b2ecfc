#include "cloth_solver.hpp"
#include "logging.hpp"
#include <algorithm>

namespace clothsim {

StepResult ClothSolver::step(Cloth& cloth, const SolverParams& params, float dt) {
    StepResult result;

    // 1. External forces
    apply_gravity(cloth, params.gravity);

    // 2. Integrate using Verlet
    integrate_verlet(cloth, dt);

    // 3. Tear and relax. Tearing runs once per iteration, so tear
    //    sensitivity grows with the iteration count.
    for (int iter = 0; iter < params.iterations; ++iter) {
        result.torn += tear_constraints(cloth, params.tear_threshold);
        relax_constraints(cloth, params.stiffness);
    }

    result.live_constraints = cloth.constraint_count();

    if (result.torn > 0) {
        auto log = clothsim::logging::get_logger();
        log->debug("ClothSolver: {} constraints torn, {} remaining",
                   result.torn, result.live_constraints);
    }

    return result;
}

float ClothSolver::clamp_frame_time(float dt) {
    return std::clamp(dt, 0.0f, kMaxFrameTime);
}

void ClothSolver::apply_gravity(Cloth& cloth, const Vec2& gravity) {
    for (auto& particle : cloth.particles()) {
        particle.add_force(gravity);
    }
}

void ClothSolver::integrate_verlet(Cloth& cloth, float dt) {
    // x' = x + (x - x_prev) + a * dt^2
    const float h = clamp_frame_time(dt);
    const float h_sq = h * h;

    for (auto& particle : cloth.particles()) {
        if (particle.is_pinned) {
            particle.clear_force();
            continue;
        }

        Vec2 acceleration = particle.force / particle.mass;
        Vec2 velocity = particle.velocity();

        particle.previous_position = particle.position;
        particle.position += velocity + acceleration * h_sq;
        particle.clear_force();
    }
}

size_t ClothSolver::tear_constraints(Cloth& cloth, float tear_threshold) {
    const auto& particles = cloth.particles();
    return cloth.remove_constraints_if([&](const Constraint& c) {
        float dist = particles[c.particle_a].position.distance_to(
            particles[c.particle_b].position);
        return dist >= c.rest_length * tear_threshold;
    });
}

void ClothSolver::relax_constraints(Cloth& cloth, float stiffness) {
    for (const auto& constraint : cloth.constraints()) {
        relax_constraint(cloth, constraint, stiffness);
    }
}

void ClothSolver::relax_constraint(Cloth& cloth, const Constraint& constraint, float stiffness) {
    // Endpoints are distinct and in range (checked by Cloth::add_constraint)
    auto& particles = cloth.particles();
    Particle& p1 = particles[constraint.particle_a];
    Particle& p2 = particles[constraint.particle_b];

    Vec2 delta = p2.position - p1.position;
    float dist = delta.length();

    if (dist == 0.0f) {
        return;  // Degenerate, no direction to correct along
    }

    float diff = (dist - constraint.rest_length) / dist;
    Vec2 correction = delta * 0.5f * diff * stiffness;

    if (!p1.is_pinned) {
        p1.position += correction;
    }
    if (!p2.is_pinned) {
        p2.position -= correction;
    }
}

}  // namespace clothsim
