#ifndef STARPLAN_TREE_H
#define STARPLAN_TREE_H

#include <vector>
#include <memory>
#include "starplan/geometry.h"
#include "starplan/node.h"

namespace starplan {

class KDTree;

// Append-only arena of nodes. Indices are stable for the lifetime of the
// tree; the root, when present, is index 0 and is the only node without a
// parent. Parent links may be reassigned through reparent().
class Tree {
public:
    Tree();
    explicit Tree(const Point2D& root);
    ~Tree();
    Tree(const Tree&) = delete;
    Tree& operator=(const Tree&) = delete;

    size_t size() const { return nodes_.size(); }
    bool empty() const { return nodes_.empty(); }
    size_t newest() const;

    const Node& at(size_t index) const;
    const Node& operator[](size_t index) const { return nodes_[index]; }
    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<size_t>& children(size_t index) const;

    // Appends a node with cost = parent cost + edge length.
    size_t add_node(const Point2D& point, size_t parent);

    // Linear scan; the lowest index wins ties. Throws InvariantViolation on an
    // empty tree.
    size_t nearest(const Point2D& point) const;

    // Indices (ascending, excluding `index`) strictly within `radius` of
    // node `index`.
    std::vector<size_t> near(size_t index, double radius) const;

    // Moves `index` under `new_parent` and assigns `cost`. Descendant costs
    // are left untouched.
    void reparent(size_t index, size_t new_parent, double cost);

    // Recomputes the costs of every descendant of `index` from its own cost.
    // Returns the number of nodes updated.
    size_t propagate_cost(size_t index);

    // Points from the root to `index`, root first.
    std::vector<Point2D> trace_path(size_t index) const;

private:
    void check_index(size_t index) const;
    bool is_ancestor(size_t ancestor, size_t index) const;

    std::vector<Node> nodes_;
    std::vector<std::vector<size_t>> children_;

    // Spatial index over nodes_, grown by add_node().
    std::unique_ptr<KDTree> kd_tree_;
};

} // namespace starplan

#endif // STARPLAN_TREE_H
