#ifndef STARPLAN_PATH_TRACKER_H
#define STARPLAN_PATH_TRACKER_H

#include <vector>
#include "starplan/geometry.h"
#include "starplan/tree.h"

namespace starplan {

// Keeps the best goal-reaching path seen so far. Only the newest node of the
// tree is examined on each update; the cached path is a snapshot taken when
// it was found and is not refreshed by later rewiring.
class PathTracker {
public:
    enum State { SEARCHING, PATH_FOUND };

    PathTracker(const Point2D& goal, double goal_threshold);

    // Returns true when the newest node improved the best cost.
    bool update(const Tree& tree);

    bool reaches_goal(const Point2D& point) const;

    State state() const { return state_; }
    double best_cost() const { return best_cost_; }
    const std::vector<Point2D>& best_path() const { return best_path_; }
    size_t best_node() const { return best_node_; }
    const Point2D& goal() const { return goal_; }
    double goal_threshold() const { return goal_threshold_; }

private:
    Point2D goal_;
    double goal_threshold_;
    State state_;
    double best_cost_;
    size_t best_node_;
    std::vector<Point2D> best_path_;
};

} // namespace starplan

#endif // STARPLAN_PATH_TRACKER_H
