#include <gtest/gtest.h>
#include <math/segment.hpp>

using namespace clothsim;

TEST(SegmentTest, PerpendicularFootInsideSegment) {
    Vec2 a(0.0f, 0.0f);
    Vec2 b(10.0f, 0.0f);
    EXPECT_FLOAT_EQ(distance_point_to_segment(Vec2(5.0f, 3.0f), a, b), 3.0f);
    EXPECT_FLOAT_EQ(project_onto_segment(Vec2(5.0f, 3.0f), a, b), 0.5f);
}

TEST(SegmentTest, FootBeyondEndpointsClampsToEndpoint) {
    Vec2 a(0.0f, 0.0f);
    Vec2 b(10.0f, 0.0f);

    // Before a: nearest point is a
    EXPECT_FLOAT_EQ(distance_point_to_segment(Vec2(-3.0f, 4.0f), a, b), 5.0f);
    EXPECT_EQ(closest_point_on_segment(Vec2(-3.0f, 4.0f), a, b), a);

    // Past b: nearest point is b
    EXPECT_FLOAT_EQ(distance_point_to_segment(Vec2(13.0f, 4.0f), a, b), 5.0f);
    EXPECT_EQ(closest_point_on_segment(Vec2(13.0f, 4.0f), a, b), b);
}

TEST(SegmentTest, PointOnSegmentHasZeroDistance) {
    Vec2 a(1.0f, 1.0f);
    Vec2 b(5.0f, 1.0f);
    EXPECT_FLOAT_EQ(distance_point_to_segment(Vec2(3.0f, 1.0f), a, b), 0.0f);
    EXPECT_FLOAT_EQ(distance_point_to_segment(a, a, b), 0.0f);
}

TEST(SegmentTest, DegenerateSegmentUsesPointDistance) {
    Vec2 a(1.0f, 1.0f);
    EXPECT_FLOAT_EQ(project_onto_segment(Vec2(4.0f, 5.0f), a, a), 0.0f);
    EXPECT_FLOAT_EQ(distance_point_to_segment(Vec2(4.0f, 5.0f), a, a), 5.0f);
}
