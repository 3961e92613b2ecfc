#include "simulation.hpp"
#include "logging.hpp"
#include <cloth/cloth_builder.hpp>
#include <interaction/cut_processor.hpp>
#include <solver/cloth_solver.hpp>
#include <utility>

namespace clothsim {

Simulation::Simulation(const SimulationConfig& config) {
    rebuild(config);
}

void Simulation::reset(const SimulationConfig& config) {
    rebuild(config);
}

void Simulation::rebuild(const SimulationConfig& config) {
    // Build first; nothing is committed if the builder rejects the config
    Cloth next = ClothBuilder::build(config.build_config());

    config_ = config;
    cloth_ = std::move(next);
    interaction_.clear();

    auto log = clothsim::logging::get_logger();
    log->info("Simulation: built {}x{} cloth ({} particles, {} constraints)",
              cloth_.width(), cloth_.height(),
              cloth_.particle_count(), cloth_.constraint_count());
}

FrameStats Simulation::update(const SimulationConfig& config,
                              const PointerState& pointer,
                              float dt) {
    FrameStats stats;

    bool resized = config.width != cloth_.width() || config.height != cloth_.height();
    if (resized) {
        rebuild(config);
        stats.rebuilt = true;
    } else {
        config_ = config;
    }

    StepResult step = ClothSolver::step(cloth_, config_.solver_params(), dt);
    stats.torn = step.torn;

    if (pointer.cut_held) {
        stats.cut = cut_constraints(cloth_, pointer.position, config_.cut_radius);
    }

    interaction_.update(cloth_, pointer);

    stats.live_constraints = cloth_.constraint_count();
    stats.dragging = interaction_.is_dragging();
    ++frame_count_;
    return stats;
}

RenderSnapshot Simulation::render_snapshot() const {
    RenderSnapshot snapshot;
    const auto& particles = cloth_.particles();

    snapshot.segments.reserve(cloth_.constraint_count());
    for (const auto& c : cloth_.constraints()) {
        RenderSegment segment;
        segment.a = particles[c.particle_a].position;
        segment.b = particles[c.particle_b].position;
        segment.type = c.type;
        snapshot.segments.push_back(segment);
    }

    snapshot.particles.reserve(particles.size());
    for (const auto& p : particles) {
        snapshot.particles.push_back(RenderParticle{p.position, p.is_pinned});
    }

    return snapshot;
}

}  // namespace clothsim
