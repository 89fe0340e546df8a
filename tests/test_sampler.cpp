#include <gtest/gtest.h>
#include "starplan/sampler.h"

using namespace starplan;

TEST(UniformSampler, StaysInsideBounds) {
    UniformSampler sampler(7);
    const Bounds bounds(-20, 30, 100, 101);
    for (int i = 0; i < 10000; ++i) {
        const auto p = sampler.sample(bounds);
        ASSERT_TRUE(bounds.contains(p)) << "(" << p.x << ", " << p.y << ")";
    }
}

TEST(UniformSampler, SameSeedSameSequence) {
    UniformSampler a(1234);
    UniformSampler b(1234);
    const Bounds bounds(0, 400, 0, 400);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(a.sample(bounds), b.sample(bounds));
    }
}

TEST(UniformSampler, CoversTheRegion) {
    UniformSampler sampler(99);
    const Bounds bounds(0, 1, 0, 1);
    int quadrant[4] = {0, 0, 0, 0};
    for (int i = 0; i < 4000; ++i) {
        const auto p = sampler.sample(bounds);
        ++quadrant[(p.x < 0.5 ? 0 : 1) + (p.y < 0.5 ? 0 : 2)];
    }
    for (int q : quadrant) {
        EXPECT_GT(q, 800);
    }
}

TEST(UniformSampler, RejectsInvalidBounds) {
    UniformSampler sampler(1);
    EXPECT_THROW(sampler.sample(Bounds(5, 5, 0, 1)), std::invalid_argument);
    EXPECT_THROW(sampler.sample(Bounds(0, 1, 3, 2)), std::invalid_argument);
}
