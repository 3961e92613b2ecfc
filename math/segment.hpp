#ifndef CLOTHSIM_MATH_SEGMENT_HPP
#define CLOTHSIM_MATH_SEGMENT_HPP

#include "vec2.hpp"
#include <algorithm>

namespace clothsim {

// Parameter of the projection of p onto segment [a, b], clamped to [0, 1].
// A degenerate segment (a == b) projects to t = 0.
inline float project_onto_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    Vec2 ab = b - a;
    float len_sq = ab.length_squared();
    if (len_sq == 0.0f) {
        return 0.0f;
    }
    return std::clamp((p - a).dot(ab) / len_sq, 0.0f, 1.0f);
}

// Closest point to p on segment [a, b]
inline Vec2 closest_point_on_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    return a + (b - a) * project_onto_segment(p, a, b);
}

// Euclidean distance from p to segment [a, b].
// Falls back to point-to-point distance when a == b.
inline float distance_point_to_segment(const Vec2& p, const Vec2& a, const Vec2& b) {
    if ((b - a).length_squared() == 0.0f) {
        return p.distance_to(a);
    }
    return p.distance_to(closest_point_on_segment(p, a, b));
}

}  // namespace clothsim

#endif // CLOTHSIM_MATH_SEGMENT_HPP
