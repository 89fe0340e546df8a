#include <gtest/gtest.h>
#include "starplan/geometry.h"
#include <limits>

using namespace starplan;

TEST(Geometry, DistanceIsEuclidean) {
    EXPECT_DOUBLE_EQ(distance(Point2D(0, 0), Point2D(3, 4)), 5.0);
    EXPECT_DOUBLE_EQ(Point2D(-1, 2).distance(Point2D(2, -2)), 5.0);
}

TEST(Geometry, DistanceIsSymmetricAndZeroOnlyForEqualPoints) {
    const Point2D a(1.5, -7.25);
    const Point2D b(-3.0, 11.0);
    EXPECT_EQ(distance(a, b), distance(b, a));
    EXPECT_EQ(distance(a, a), 0.0);
    EXPECT_GT(distance(a, Point2D(1.5, -7.25 + 1e-9)), 0.0);
}

TEST(Geometry, IndexedAccess) {
    Point2D p(4, 5);
    EXPECT_EQ(p[0], 4);
    EXPECT_EQ(p[1], 5);
    p[1] = 6;
    EXPECT_EQ(p.y, 6);
    EXPECT_THROW(p[2], std::out_of_range);
}

TEST(Geometry, Arithmetic) {
    const Point2D a(1, 2);
    const Point2D b(3, 5);
    EXPECT_EQ(a + b, Point2D(4, 7));
    EXPECT_EQ(b - a, Point2D(2, 3));
    EXPECT_EQ(a * 2.0, Point2D(2, 4));
    EXPECT_NE(a, b);
}

TEST(Geometry, BoundsAreHalfOpen) {
    const Bounds bounds(0, 10, -5, 5);
    EXPECT_TRUE(bounds.valid());
    EXPECT_TRUE(bounds.contains(Point2D(0, -5)));
    EXPECT_FALSE(bounds.contains(Point2D(10, 0)));
    EXPECT_FALSE(bounds.contains(Point2D(5, 5)));

    EXPECT_FALSE(Bounds(0, 0, 0, 1).valid());
    EXPECT_FALSE(Bounds(1, 0, 0, 1).valid());
    EXPECT_FALSE(Bounds(0, 1, 0, std::numeric_limits<double>::infinity()).valid());
}
