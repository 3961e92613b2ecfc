#ifndef CLOTHSIM_CLOTH_SOLVER_HPP
#define CLOTHSIM_CLOTH_SOLVER_HPP

#include <cloth/cloth.hpp>
#include <cstddef>

namespace clothsim {

// Largest frame time the integrator accepts (seconds).
// Slow frames are clamped to this to bound numerical instability.
constexpr float kMaxFrameTime = 1.0f / 30.0f;

// Per-frame physics parameters
struct SolverParams {
    // Uniform external force applied to every particle
    Vec2 gravity{0.0f, 980.0f};

    // Fraction of the constraint error corrected per relaxation, in (0, 1]
    float stiffness = 0.9f;

    // Strain ratio (length / rest_length) at which a constraint tears, > 1
    float tear_threshold = 4.5f;

    // Relaxation iterations per frame; each runs a tear pass first
    int iterations = 5;
};

// Result of a single solver step
struct StepResult {
    size_t torn = 0;              // Constraints removed by tearing this step
    size_t live_constraints = 0;  // Constraints left after the step
};

// Position-based cloth solver: Verlet integration followed by
// sequential (Gauss-Seidel) distance constraint relaxation with tearing.
class ClothSolver {
public:
    // One frame: forces, integration, then `iterations` tear/relax passes
    static StepResult step(Cloth& cloth, const SolverParams& params, float dt);

    static float clamp_frame_time(float dt);

    // Add gravity to every particle's force accumulator
    static void apply_gravity(Cloth& cloth, const Vec2& gravity);

    // Verlet step; clears force accumulators. dt is clamped.
    static void integrate_verlet(Cloth& cloth, float dt);

    // Remove every constraint stretched to >= rest_length * tear_threshold
    static size_t tear_constraints(Cloth& cloth, float tear_threshold);

    // One correction pass over all constraints, in list order
    static void relax_constraints(Cloth& cloth, float stiffness);

private:
    static void relax_constraint(Cloth& cloth, const Constraint& constraint, float stiffness);
};

}  // namespace clothsim

#endif // CLOTHSIM_CLOTH_SOLVER_HPP
