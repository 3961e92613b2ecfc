#ifndef CLOTHSIM_RENDER_SNAPSHOT_HPP
#define CLOTHSIM_RENDER_SNAPSHOT_HPP

#include <cloth/constraint.hpp>
#include <math/vec2.hpp>
#include <vector>

namespace clothsim {

// Line to draw for one live constraint
struct RenderSegment {
    Vec2 a;
    Vec2 b;
    ConstraintType type = ConstraintType::Structural;
};

// Point to draw for one particle
struct RenderParticle {
    Vec2 position;
    bool pinned = false;
};

// Renderable geometry of the cloth, in constraint and particle order
struct RenderSnapshot {
    std::vector<RenderSegment> segments;
    std::vector<RenderParticle> particles;
};

}  // namespace clothsim

#endif // CLOTHSIM_RENDER_SNAPSHOT_HPP
