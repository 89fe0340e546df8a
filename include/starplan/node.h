#ifndef STARPLAN_NODE_H
#define STARPLAN_NODE_H

#include <cstddef>
#include <limits>
#include "starplan/geometry.h"

namespace starplan {

struct Node {
    static constexpr size_t kNoParent = std::numeric_limits<size_t>::max();

    Point2D point;
    size_t parent;
    double cost;

    bool is_root() const { return parent == kNoParent; }
};

} // namespace starplan

#endif // STARPLAN_NODE_H
