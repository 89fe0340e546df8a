#include <gtest/gtest.h>
#include "starplan/path_tracker.h"
#include <cmath>

using namespace starplan;

TEST(PathTracker, StartsSearchingWithInfiniteCost) {
    const PathTracker tracker(Point2D(50, 0), 5.0);
    EXPECT_EQ(tracker.state(), PathTracker::SEARCHING);
    EXPECT_TRUE(std::isinf(tracker.best_cost()));
    EXPECT_TRUE(tracker.best_path().empty());
}

TEST(PathTracker, ThresholdIsStrict) {
    const PathTracker tracker(Point2D(50, 0), 5.0);
    EXPECT_TRUE(tracker.reaches_goal(Point2D(46, 0)));
    EXPECT_FALSE(tracker.reaches_goal(Point2D(45, 0)));
}

TEST(PathTracker, RecordsFirstQualifyingNode) {
    PathTracker tracker(Point2D(50, 0), 5.0);
    Tree tree(Point2D(0, 0));
    tree.add_node(Point2D(40, 0), 0);
    EXPECT_FALSE(tracker.update(tree));

    const size_t reached = tree.add_node(Point2D(48, 0), 1);
    EXPECT_TRUE(tracker.update(tree));
    EXPECT_EQ(tracker.state(), PathTracker::PATH_FOUND);
    EXPECT_DOUBLE_EQ(tracker.best_cost(), 48.0);
    EXPECT_EQ(tracker.best_node(), reached);
    EXPECT_EQ(tracker.best_path(), tree.trace_path(reached));

    // Same newest node again is not an improvement.
    EXPECT_FALSE(tracker.update(tree));
}

TEST(PathTracker, OnlyStrictImprovementsReplaceThePath) {
    PathTracker tracker(Point2D(50, 0), 5.0);
    Tree tree(Point2D(0, 0));
    const size_t first = tree.add_node(Point2D(47, 0), 0);
    ASSERT_TRUE(tracker.update(tree));

    tree.add_node(Point2D(49, 0), first);   // reaches goal but costs more
    EXPECT_FALSE(tracker.update(tree));
    EXPECT_DOUBLE_EQ(tracker.best_cost(), 47.0);
    EXPECT_EQ(tracker.best_path().size(), 2u);

    tree.add_node(Point2D(46, 0), 0);       // cheaper, straight from the root
    EXPECT_TRUE(tracker.update(tree));
    EXPECT_DOUBLE_EQ(tracker.best_cost(), 46.0);
    EXPECT_EQ(tracker.state(), PathTracker::PATH_FOUND);
}

TEST(PathTracker, ExaminesOnlyTheNewestNode) {
    PathTracker tracker(Point2D(50, 0), 5.0);
    Tree tree(Point2D(0, 0));
    tree.add_node(Point2D(48, 0), 0);
    tree.add_node(Point2D(0, 30), 0);

    EXPECT_FALSE(tracker.update(tree));
    EXPECT_EQ(tracker.state(), PathTracker::SEARCHING);
}
