#ifndef CLOTHSIM_SIMULATION_HPP
#define CLOTHSIM_SIMULATION_HPP

#include "simulation_config.hpp"
#include "render_snapshot.hpp"
#include <cloth/cloth.hpp>
#include <interaction/interaction_controller.hpp>
#include <interaction/pointer_state.hpp>
#include <cstddef>
#include <cstdint>

namespace clothsim {

// What happened during one call to Simulation::update
struct FrameStats {
    size_t torn = 0;              // Removed by strain
    size_t cut = 0;               // Removed by the cut disc
    size_t live_constraints = 0;
    bool rebuilt = false;         // Topology was regenerated this frame
    bool dragging = false;        // A particle is selected after the frame
};

// Owner of the live cloth and the interaction state.
// Order per frame: rebuild check, forces, integration, tear/relax,
// cut, drag.
class Simulation {
public:
    explicit Simulation(const SimulationConfig& config = SimulationConfig{});

    FrameStats update(const SimulationConfig& config, const PointerState& pointer, float dt);

    // Discard the cloth and rebuild it from `config`
    void reset(const SimulationConfig& config);

    RenderSnapshot render_snapshot() const;

    const Cloth& cloth() const { return cloth_; }
    Cloth& cloth() { return cloth_; }
    const SimulationConfig& config() const { return config_; }
    const InteractionController& interaction() const { return interaction_; }
    uint64_t frame_count() const { return frame_count_; }

private:
    void rebuild(const SimulationConfig& config);

    SimulationConfig config_;
    Cloth cloth_;
    InteractionController interaction_;
    uint64_t frame_count_ = 0;
};

}  // namespace clothsim

#endif // CLOTHSIM_SIMULATION_HPP
