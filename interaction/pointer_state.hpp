#ifndef CLOTHSIM_INTERACTION_POINTER_STATE_HPP
#define CLOTHSIM_INTERACTION_POINTER_STATE_HPP

#include <math/vec2.hpp>

namespace clothsim {

// Pointer input for one frame, in simulation coordinates
struct PointerState {
    Vec2 position;

    bool select_pressed = false;   // Select trigger went down this frame
    bool select_held = false;      // Select trigger is down
    bool select_released = false;  // Select trigger went up this frame
    bool cut_held = false;         // Cut trigger is down

    // Pointer is over a UI surface that suppresses selection
    bool over_ui = false;
};

}  // namespace clothsim

#endif // CLOTHSIM_INTERACTION_POINTER_STATE_HPP
