#include "interaction_controller.hpp"
#include "logging.hpp"
#include <limits>

namespace clothsim {

std::optional<ParticleId> InteractionController::pick(const Cloth& cloth, const Vec2& point) {
    float best_dist_sq = std::numeric_limits<float>::max();
    std::optional<ParticleId> best;

    const auto& particles = cloth.particles();
    for (size_t i = 0; i < particles.size(); ++i) {
        float dist_sq = particles[i].position.distance_squared_to(point);
        if (dist_sq < best_dist_sq) {
            best_dist_sq = dist_sq;
            best = static_cast<ParticleId>(i);
        }
    }

    if (best && best_dist_sq < kPickRadiusSquared) {
        return best;
    }
    return std::nullopt;
}

void InteractionController::update(Cloth& cloth, const PointerState& pointer) {
    auto log = clothsim::logging::get_logger();

    if (pointer.select_pressed && !pointer.over_ui) {
        // A press that misses drops any lingering selection
        selected_ = pick(cloth, pointer.position);
        if (selected_) {
            log->trace("InteractionController: selected particle {}", *selected_);
        }
    }

    if (pointer.select_held && selected_) {
        if (!cloth.has_particle(*selected_)) {
            log->debug("InteractionController: dropping stale selection {}", *selected_);
            selected_.reset();
        } else {
            // Direct assignment; pinned particles are dragged too.
            // The old position becomes previous_position so a release
            // carries the last frame's drag velocity.
            Particle& p = cloth.particle(*selected_);
            p.previous_position = p.position;
            p.position = pointer.position;
        }
    }

    if (pointer.select_released) {
        selected_.reset();
    }
}

}  // namespace clothsim
