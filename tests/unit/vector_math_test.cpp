#include <gtest/gtest.h>
#include "rrect/math/vector_math.hpp"

TEST(VectorMathTest, VectorConstruction) {
    Vector v1;  // Default constructor
    EXPECT_DOUBLE_EQ(v1.x, 0.0);
    EXPECT_DOUBLE_EQ(v1.y, 0.0);

    Vector v2(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v2.x, 3.0);
    EXPECT_DOUBLE_EQ(v2.y, 4.0);

    Vector v3 = Vector::splat(2.5);
    EXPECT_DOUBLE_EQ(v3.x, 2.5);
    EXPECT_DOUBLE_EQ(v3.y, 2.5);
}

TEST(VectorMathTest, ComponentWiseProduct) {
    Vector v(2.0, -3.0);
    Vector result = v * Vector(0.5, 2.0);
    EXPECT_DOUBLE_EQ(result.x, 1.0);
    EXPECT_DOUBLE_EQ(result.y, -6.0);

    v *= Vector(2.0, 0.0);
    EXPECT_DOUBLE_EQ(v.x, 4.0);
    EXPECT_DOUBLE_EQ(v.y, 0.0);
}

TEST(VectorMathTest, AbsAndSignum) {
    Vector v(-1.5, 2.0);
    EXPECT_EQ(v.abs(), Vector(1.5, 2.0));
    EXPECT_EQ(v.signum(), Vector(-1.0, 1.0));

    // Zero pushes in the positive direction
    EXPECT_DOUBLE_EQ(signum(0.0), 1.0);
    EXPECT_DOUBLE_EQ(signum(-0.0), -1.0);
}

TEST(VectorMathTest, ClampLengthKeepsDirection) {
    Vector v(30.0, 40.0);
    Vector clamped = v.clampLength(5.0);
    EXPECT_NEAR(clamped.length(), 5.0, 1e-12);
    EXPECT_NEAR(clamped.x, 3.0, 1e-12);
    EXPECT_NEAR(clamped.y, 4.0, 1e-12);

    Vector shortVec(0.3, 0.4);
    EXPECT_EQ(shortVec.clampLength(5.0), shortVec);

    EXPECT_EQ(Vector().clampLength(0.0), Vector());
}

TEST(VectorMathTest, PositionArithmetic) {
    Position p(1.0, 2.0);
    Position moved = p + Vector(0.5, -1.0);
    EXPECT_DOUBLE_EQ(moved.x, 1.5);
    EXPECT_DOUBLE_EQ(moved.y, 1.0);

    Vector offset = moved - p;
    EXPECT_DOUBLE_EQ(offset.x, 0.5);
    EXPECT_DOUBLE_EQ(offset.y, -1.0);

    p -= Vector(1.0, 2.0);
    EXPECT_EQ(p, Position(0.0, 0.0));
    EXPECT_DOUBLE_EQ(Position(3.0, 4.0).dist(Position()), 5.0);
}

TEST(VectorMathTest, LengthAndDot) {
    Vector v(3.0, 4.0);
    EXPECT_DOUBLE_EQ(v.length(), 5.0);
    EXPECT_DOUBLE_EQ(v.lengthSquared(), 25.0);
    EXPECT_DOUBLE_EQ(v.dotProduct(Vector(1.0, 1.0)), 7.0);
    EXPECT_TRUE(nearlyEqual((v / 5.0).length(), 1.0));
}
