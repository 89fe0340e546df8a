#ifndef STARPLAN_RRT_STAR_H
#define STARPLAN_RRT_STAR_H

#include <vector>
#include <memory>
#include <functional>
#include "starplan/geometry.h"
#include "starplan/tree.h"
#include "starplan/sampler.h"
#include "starplan/path_tracker.h"

namespace starplan {

// Answers whether a configuration is free of obstacles. Must be pure.
using CollisionPredicate = std::function<bool(const Point2D&)>;

// Polled before every sample in RRTStar::plan(); true stops planning.
using StopPredicate = std::function<bool()>;

// Predicate for obstacle-free planning.
CollisionPredicate always_free();

// Point exactly `step_size` from `from` along the bearing to `to`. When the
// two points coincide the bearing is 0 radians (+x).
Point2D steer(const Point2D& from, const Point2D& to, double step_size);

class RRTStar {
public:
    struct Config {
        double step_size;
        double goal_threshold;
        double search_radius;
        // Push cost reductions from a rewired node down to its descendants.
        // When false only the rewired node itself is updated.
        bool propagate_costs;

        Config()
            : step_size(10.0),
            goal_threshold(10.0),
            search_radius(15.0),
            propagate_costs(true) {}

        Config(double step_size, double goal_threshold, double search_radius)
            : step_size(step_size),
            goal_threshold(goal_threshold),
            search_radius(search_radius),
            propagate_costs(true) {}
    };

    struct StepOutcome {
        bool node_added;
        bool path_improved;
    };

    // Throws ConfigError if any distance parameter is not a positive finite
    // number. Without a sampler a UniformSampler seeded from
    // std::random_device is used.
    RRTStar(const Point2D& start,
           const Point2D& goal,
           const Config& config = Config(),
           std::unique_ptr<Sampler> sampler = nullptr);

    // One iteration: sample, nearest, steer, collision check, insert, rewire,
    // path update.
    StepOutcome step(const Bounds& bounds, const CollisionPredicate& is_free);

    // Runs up to max_iterations steps, polling should_stop before each one.
    // Returns the best path found (empty if none).
    std::vector<Point2D> plan(const Bounds& bounds,
                              const CollisionPredicate& is_free,
                              size_t max_iterations,
                              const StopPredicate& should_stop = StopPredicate());

    // Reparents every neighbor of new_index that becomes strictly cheaper
    // through it. Returns the number of rewired neighbors.
    size_t rewire(size_t new_index);

    const std::vector<Point2D>& best_path() const { return tracker_.best_path(); }
    double best_cost() const { return tracker_.best_cost(); }
    PathTracker::State state() const { return tracker_.state(); }

    const Tree& tree() const { return tree_; }
    const std::vector<Node>& nodes() const { return tree_.nodes(); }
    const Point2D& start() const { return start_; }
    const Point2D& goal() const { return tracker_.goal(); }
    const Config& config() const { return config_; }
    size_t iterations() const { return iterations_; }

private:
    static const Config& validated(const Config& config);

    // Member variables
    Point2D start_;
    Config config_;
    Tree tree_;
    PathTracker tracker_;
    std::unique_ptr<Sampler> sampler_;
    size_t iterations_;
};

} // namespace starplan

#endif // STARPLAN_RRT_STAR_H
