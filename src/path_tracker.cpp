#include "starplan/path_tracker.h"
#include <limits>

using namespace starplan;

PathTracker::PathTracker(const Point2D& goal, double goal_threshold)
    : goal_(goal),
      goal_threshold_(goal_threshold),
      state_(SEARCHING),
      best_cost_(std::numeric_limits<double>::infinity()),
      best_node_(Node::kNoParent) {}

bool PathTracker::reaches_goal(const Point2D& point) const {
    return point.distance(goal_) < goal_threshold_;
}

bool PathTracker::update(const Tree& tree) {
    if (tree.empty()) return false;

    const size_t last = tree.newest();
    const Node& last_node = tree[last];
    if (!reaches_goal(last_node.point) || !(last_node.cost < best_cost_))
        return false;

    best_cost_ = last_node.cost;
    best_node_ = last;
    best_path_ = tree.trace_path(last);
    state_ = PATH_FOUND;
    return true;
}
