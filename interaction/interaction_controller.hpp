#ifndef CLOTHSIM_INTERACTION_CONTROLLER_HPP
#define CLOTHSIM_INTERACTION_CONTROLLER_HPP

#include "pointer_state.hpp"
#include <cloth/cloth.hpp>
#include <optional>

namespace clothsim {

// Squared pick radius (20 units) for selecting a particle under the pointer
constexpr float kPickRadiusSquared = 400.0f;

// Maps pointer state to selection and dragging of a single particle.
// Idle when no particle is selected, Dragging otherwise.
class InteractionController {
public:
    enum class State {
        Idle,
        Dragging
    };

    void update(Cloth& cloth, const PointerState& pointer);

    State state() const { return selected_ ? State::Dragging : State::Idle; }
    bool is_dragging() const { return selected_.has_value(); }
    std::optional<ParticleId> selected() const { return selected_; }

    // Drop the selection (the cloth it referred to is gone)
    void clear() { selected_.reset(); }

    // Closest particle to `point` within the pick radius, if any
    static std::optional<ParticleId> pick(const Cloth& cloth, const Vec2& point);

private:
    std::optional<ParticleId> selected_;
};

}  // namespace clothsim

#endif // CLOTHSIM_INTERACTION_CONTROLLER_HPP
