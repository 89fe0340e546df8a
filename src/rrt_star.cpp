#include "starplan/rrt_star.h"
#include "starplan/errors.h"
#include <cmath>
#include <random>
#include <string>
#include <utility>

using namespace starplan;

namespace {

void require_positive(const char* name, double value) {
    if (!(std::isfinite(value) && value > 0.0))
        throw ConfigError(std::string(name) + " must be a positive finite number, got " +
                          std::to_string(value));
}

} // namespace

CollisionPredicate starplan::always_free() {
    return [](const Point2D&) { return true; };
}

Point2D starplan::steer(const Point2D& from, const Point2D& to, double step_size) {
    const double angle = std::atan2(to.y - from.y, to.x - from.x);
    return Point2D(
        from.x + step_size * std::cos(angle),
        from.y + step_size * std::sin(angle)
    );
}

const RRTStar::Config& RRTStar::validated(const Config& config) {
    require_positive("step_size", config.step_size);
    require_positive("goal_threshold", config.goal_threshold);
    require_positive("search_radius", config.search_radius);
    return config;
}

RRTStar::RRTStar(const Point2D& start, const Point2D& goal,
               const Config& config,
               std::unique_ptr<Sampler> sampler)
    : start_(start),
      config_(validated(config)),
      tree_(start),
      tracker_(goal, config.goal_threshold),
      sampler_(std::move(sampler)),
      iterations_(0) {
    if (!sampler_) {
        std::random_device rd;
        sampler_.reset(new UniformSampler(rd()));
    }
}

RRTStar::StepOutcome RRTStar::step(const Bounds& bounds, const CollisionPredicate& is_free) {
    if (!is_free)
        throw ConfigError("collision predicate is empty");

    ++iterations_;
    StepOutcome outcome = {false, false};

    const auto q_rand = sampler_->sample(bounds);
    const auto nearest_idx = tree_.nearest(q_rand);
    const auto q_new = steer(tree_[nearest_idx].point, q_rand, config_.step_size);

    if (!is_free(q_new))
        return outcome;

    const auto new_idx = tree_.add_node(q_new, nearest_idx);
    outcome.node_added = true;

    rewire(new_idx);

    // Check goal proximity
    outcome.path_improved = tracker_.update(tree_);
    return outcome;
}

size_t RRTStar::rewire(size_t new_index) {
    const auto neighbors = tree_.near(new_index, config_.search_radius);
    const Node new_node = tree_.at(new_index);

    size_t rewired = 0;
    for (const auto idx : neighbors) {
        const Node& neighbor = tree_[idx];
        const double cost_via_new = new_node.cost + new_node.point.distance(neighbor.point);
        if (cost_via_new < neighbor.cost) {
            tree_.reparent(idx, new_index, cost_via_new);
            if (config_.propagate_costs)
                tree_.propagate_cost(idx);
            ++rewired;
        }
    }
    return rewired;
}

std::vector<Point2D> RRTStar::plan(const Bounds& bounds,
                                   const CollisionPredicate& is_free,
                                   size_t max_iterations,
                                   const StopPredicate& should_stop) {
    for (size_t iter = 0; iter < max_iterations; ++iter) {
        if (should_stop && should_stop())
            break;
        step(bounds, is_free);
    }
    return best_path();
}
