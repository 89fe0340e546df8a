#include "starplan/tree.h"
#include "starplan/kd_tree.h"
#include "starplan/errors.h"
#include <algorithm>
#include <deque>
#include <limits>
#include <string>

namespace starplan {

constexpr size_t Node::kNoParent;

namespace {

// Padding applied to kd-tree queries so that rounding in the squared-distance
// comparison cannot drop a candidate the exact test would accept.
const double kRadiusPadding = 1e-9;

} // namespace

Tree::Tree() : kd_tree_(new KDTree(nodes_)) {}

Tree::Tree(const Point2D& root) : kd_tree_(new KDTree(nodes_)) {
    nodes_.push_back({root, Node::kNoParent, 0.0});
    children_.emplace_back();
    kd_tree_->add(0);
}

Tree::~Tree() = default;

size_t Tree::newest() const {
    if (nodes_.empty())
        throw InvariantViolation("tree has no nodes");
    return nodes_.size() - 1;
}

const Node& Tree::at(size_t index) const {
    check_index(index);
    return nodes_[index];
}

const std::vector<size_t>& Tree::children(size_t index) const {
    check_index(index);
    return children_[index];
}

void Tree::check_index(size_t index) const {
    if (index >= nodes_.size())
        throw std::out_of_range("node index " + std::to_string(index) +
                                " out of range (size " + std::to_string(nodes_.size()) + ")");
}

size_t Tree::add_node(const Point2D& point, size_t parent) {
    check_index(parent);
    const double cost = nodes_[parent].cost + point.distance(nodes_[parent].point);
    nodes_.push_back({point, parent, cost});
    children_.emplace_back();
    const size_t index = nodes_.size() - 1;
    children_[parent].push_back(index);
    kd_tree_->add(index);
    return index;
}

size_t Tree::nearest(const Point2D& point) const {
    if (nodes_.empty())
        throw InvariantViolation("nearest() called on a tree without a root");

    size_t best_idx = 0;
    double best_dist = std::numeric_limits<double>::infinity();
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const double d = nodes_[i].point.distance(point);
        if (d < best_dist) {
            best_dist = d;
            best_idx = i;
        }
    }
    return best_idx;
}

std::vector<size_t> Tree::near(size_t index, double radius) const {
    check_index(index);
    const Point2D& center = nodes_[index].point;
    std::vector<size_t> result;
    if (!(radius > 0.0))
        return result;

    const auto accept = [&](size_t i) {
        return i != index && nodes_[i].point.distance(center) < radius;
    };

    const double padded = radius * (1.0 + kRadiusPadding);
    for (const auto i : kd_tree_->radius_search(center, padded)) {
        if (accept(i))
            result.push_back(i);
    }

    std::sort(result.begin(), result.end());
    return result;
}

bool Tree::is_ancestor(size_t ancestor, size_t index) const {
    size_t current = index;
    for (size_t hops = 0; hops <= nodes_.size(); ++hops) {
        if (current == ancestor)
            return true;
        if (nodes_[current].is_root())
            return false;
        current = nodes_[current].parent;
    }
    throw InvariantViolation("parent chain of node " + std::to_string(index) + " does not reach the root");
}

void Tree::reparent(size_t index, size_t new_parent, double cost) {
    check_index(index);
    check_index(new_parent);
    if (nodes_[index].is_root())
        throw InvariantViolation("the root cannot be reparented");
    if (is_ancestor(index, new_parent))
        throw InvariantViolation("reparenting node " + std::to_string(index) +
                                 " under " + std::to_string(new_parent) + " would create a cycle");

    auto& siblings = children_[nodes_[index].parent];
    siblings.erase(std::remove(siblings.begin(), siblings.end(), index), siblings.end());
    children_[new_parent].push_back(index);

    nodes_[index].parent = new_parent;
    nodes_[index].cost = cost;
}

size_t Tree::propagate_cost(size_t index) {
    check_index(index);
    size_t updated = 0;
    std::deque<size_t> open(children_[index].begin(), children_[index].end());
    while (!open.empty()) {
        const size_t current = open.front();
        open.pop_front();
        Node& node = nodes_[current];
        const Node& parent = nodes_[node.parent];
        node.cost = parent.cost + node.point.distance(parent.point);
        ++updated;
        open.insert(open.end(), children_[current].begin(), children_[current].end());
    }
    return updated;
}

std::vector<Point2D> Tree::trace_path(size_t index) const {
    check_index(index);
    std::vector<Point2D> path;
    size_t current_idx = index;

    while (true) {
        path.push_back(nodes_[current_idx].point);
        if (nodes_[current_idx].is_root()) break;
        if (path.size() > nodes_.size())
            throw InvariantViolation("cycle in parent chain of node " + std::to_string(index));
        current_idx = nodes_[current_idx].parent;
    }

    std::reverse(path.begin(), path.end());
    return path;
}

} // namespace starplan
