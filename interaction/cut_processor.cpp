#include "cut_processor.hpp"
#include "logging.hpp"
#include <math/segment.hpp>

namespace clothsim {

size_t cut_constraints(Cloth& cloth, const Vec2& center, float radius) {
    const auto& particles = cloth.particles();
    size_t removed = cloth.remove_constraints_if([&](const Constraint& c) {
        float dist = distance_point_to_segment(center,
                                               particles[c.particle_a].position,
                                               particles[c.particle_b].position);
        return dist <= radius;
    });

    if (removed > 0) {
        auto log = clothsim::logging::get_logger();
        log->debug("cut_constraints: removed {} constraints near ({:.1f}, {:.1f})",
                   removed, center.x, center.y);
    }
    return removed;
}

}  // namespace clothsim
