#include "starplan/rrt_star.h"
#include "starplan/errors.h"
#include <iostream>
#include <limits>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

struct Box {
    starplan::Point2D min;
    starplan::Point2D max;

    bool contains(const starplan::Point2D& p) const {
        return p.x >= min.x && p.x <= max.x && p.y >= min.y && p.y <= max.y;
    }
};

// Whole-string integer in [lo, hi]; throws std::invalid_argument or
// std::out_of_range otherwise.
long long parse_integer(const std::string& text, long long lo, long long hi) {
    size_t used = 0;
    const long long value = std::stoll(text, &used);
    if (used != text.size())
        throw std::invalid_argument("trailing characters in '" + text + "'");
    if (value < lo || value > hi)
        throw std::out_of_range("'" + text + "' is out of range");
    return value;
}

} // namespace

int main(int argc, char** argv) {
    using namespace starplan;

    size_t max_iterations = 5000;
    unsigned int seed = std::random_device{}();
    try {
        if (argc > 1)
            max_iterations = static_cast<size_t>(
                parse_integer(argv[1], 1, std::numeric_limits<int>::max()));
        if (argc > 2)
            seed = static_cast<unsigned int>(
                parse_integer(argv[2], 0, std::numeric_limits<unsigned int>::max()));
    } catch (const std::exception& e) {
        std::cerr << "invalid argument: " << e.what() << "\n"
                  << "usage: " << argv[0] << " [max_iterations > 0] [seed]\n";
        return 2;
    }

    const std::vector<Box> obstacles = {
        {{120, 0}, {150, 260}},
        {{250, 140}, {280, 400}}
    };
    const CollisionPredicate is_free = [&obstacles](const Point2D& p) {
        for (const auto& box : obstacles) {
            if (box.contains(p)) return false;
        }
        return true;
    };

    const Bounds bounds(0, 400, 0, 400);
    RRTStar::Config config;

    try {
        RRTStar planner(
            {20, 20},    // Start
            {380, 380},  // Goal
            config,
            std::unique_ptr<Sampler>(new UniformSampler(seed))
        );

        for (size_t iter = 0; iter < max_iterations; ++iter) {
            const auto outcome = planner.step(bounds, is_free);
            if (outcome.path_improved) {
                std::cout << "New optimal path with cost: " << planner.best_cost()
                          << " (iteration " << planner.iterations() << ")\n";
            }
        }

        const auto& path = planner.best_path();
        std::cout << "Tree contains " << planner.tree().size() << " nodes after "
                  << planner.iterations() << " iterations (seed " << seed << ")\n";
        if (path.empty()) {
            std::cout << "No path found within iteration limit.\n";
            return 1;
        }
        std::cout << "Path contains " << path.size() << " points, cost "
                  << planner.best_cost() << "\n";
        std::cout << "Final point: (" << path.back().x << ", " << path.back().y << ")\n";
    } catch (const ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n";
        return 2;
    }
    return 0;
}
