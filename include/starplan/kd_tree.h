#ifndef STARPLAN_KD_TREE_H
#define STARPLAN_KD_TREE_H

#include <vector>
#include <memory>
#include "nanoflann.hpp"
#include "starplan/node.h"

namespace starplan {

// Incremental nanoflann index over a node arena. The arena is read in place;
// nodes become searchable once passed to add().
class KDTree {
    // Dataset adaptor reading node positions straight from the arena.
    struct NodeCloud {
        const std::vector<Node>* nodes;

        inline size_t kdtree_get_point_count() const { return nodes->size(); }

        inline double kdtree_get_pt(const size_t idx, const size_t dim) const {
            return (*nodes)[idx].point[dim];
        }

        template <class BBOX>
        bool kdtree_get_bbox(BBOX&) const { return false; }
    };

    using Metric = nanoflann::L2_Simple_Adaptor<double, NodeCloud, double, size_t>;
    using DynamicIndex = nanoflann::KDTreeSingleIndexDynamicAdaptor<Metric, NodeCloud, 2, size_t>;

    NodeCloud cloud_;
    std::unique_ptr<DynamicIndex> index_;

public:
    // Indexes every node already in `nodes`. The vector must outlive the index.
    explicit KDTree(const std::vector<Node>& nodes);
    KDTree(const KDTree&) = delete;
    KDTree& operator=(const KDTree&) = delete;

    void add(size_t index);

    // Indexed nodes whose squared distance to `point` is below radius^2, in
    // no particular order.
    std::vector<size_t> radius_search(const Point2D& point, double radius) const;
};

} // namespace starplan

#endif // STARPLAN_KD_TREE_H
