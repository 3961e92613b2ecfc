#include <gtest/gtest.h>
#include <cloth/cloth.hpp>
#include <stdexcept>

using namespace clothsim;

class ClothTest : public ::testing::Test {
protected:
    Cloth cloth{3, 1, 1.0f, Vec2(0.0f, 0.0f)};

    void SetUp() override {
        for (int i = 0; i < 3; ++i) {
            Particle p;
            p.position = Vec2(static_cast<float>(i), 0.0f);
            p.previous_position = p.position;
            p.is_pinned = (i == 0);
            cloth.add_particle(p);
        }
    }

    void connect(ParticleId a, ParticleId b, ConstraintType type, float rest = 1.0f) {
        Constraint c;
        c.particle_a = a;
        c.particle_b = b;
        c.type = type;
        c.rest_length = rest;
        cloth.add_constraint(c);
    }
};

TEST_F(ClothTest, ParticleAccess) {
    EXPECT_EQ(cloth.particle_count(), 3u);
    EXPECT_TRUE(cloth.has_particle(2));
    EXPECT_FALSE(cloth.has_particle(3));
    EXPECT_FLOAT_EQ(cloth.particle(2).position.x, 2.0f);
    EXPECT_EQ(cloth.pinned_count(), 1u);
    EXPECT_EQ(cloth.particle_at(1, 0), 1u);
}

TEST_F(ClothTest, OutOfRangeAccessThrows) {
    EXPECT_THROW(cloth.particle(3), std::out_of_range);
    EXPECT_THROW(cloth.constraint(0), std::out_of_range);
    EXPECT_THROW(cloth.particle_at(3, 0), std::out_of_range);
    EXPECT_THROW(cloth.particle_at(0, 1), std::out_of_range);
}

TEST_F(ClothTest, AddConstraintValidatesEndpoints) {
    Constraint bad_range;
    bad_range.particle_a = 0;
    bad_range.particle_b = 7;
    EXPECT_THROW(cloth.add_constraint(bad_range), std::out_of_range);

    Constraint self_loop;
    self_loop.particle_a = 1;
    self_loop.particle_b = 1;
    EXPECT_THROW(cloth.add_constraint(self_loop), std::invalid_argument);

    Constraint zero_rest;
    zero_rest.particle_a = 0;
    zero_rest.particle_b = 1;
    zero_rest.rest_length = 0.0f;
    EXPECT_THROW(cloth.add_constraint(zero_rest), std::invalid_argument);

    EXPECT_EQ(cloth.constraint_count(), 0u);
}

TEST_F(ClothTest, ConstraintLength) {
    connect(0, 2, ConstraintType::Bending, 2.0f);
    EXPECT_FLOAT_EQ(cloth.constraint_length(cloth.constraint(0)), 2.0f);
}

TEST_F(ClothTest, RemoveConstraintsIfKeepsSurvivorOrder) {
    connect(0, 1, ConstraintType::Structural);
    connect(1, 2, ConstraintType::Structural);
    connect(0, 2, ConstraintType::Bending, 2.0f);
    connect(2, 0, ConstraintType::Structural, 2.0f);

    size_t removed = cloth.remove_constraints_if([](const Constraint& c) {
        return c.particle_a == 1;
    });

    EXPECT_EQ(removed, 1u);
    ASSERT_EQ(cloth.constraint_count(), 3u);
    EXPECT_EQ(cloth.constraint(0).particle_b, 1u);
    EXPECT_EQ(cloth.constraint(1).type, ConstraintType::Bending);
    EXPECT_EQ(cloth.constraint(2).particle_a, 2u);
}

TEST_F(ClothTest, CountConstraintsByType) {
    connect(0, 1, ConstraintType::Structural);
    connect(1, 2, ConstraintType::Structural);
    connect(0, 2, ConstraintType::Bending, 2.0f);

    EXPECT_EQ(cloth.count_constraints(ConstraintType::Structural), 2u);
    EXPECT_EQ(cloth.count_constraints(ConstraintType::Bending), 1u);
    EXPECT_EQ(cloth.count_constraints(ConstraintType::Shear), 0u);
}

TEST_F(ClothTest, ClearAllForces) {
    cloth.particle(1).add_force(Vec2(1.0f, 2.0f));
    cloth.clear_all_forces();
    EXPECT_EQ(cloth.particle(1).force, vec2::zero());
}

TEST(ConstraintTypeTest, ToString) {
    EXPECT_STREQ(to_string(ConstraintType::Structural), "Structural");
    EXPECT_STREQ(to_string(ConstraintType::Bending), "Bending");
    EXPECT_STREQ(to_string(ConstraintType::Shear), "Shear");
}
