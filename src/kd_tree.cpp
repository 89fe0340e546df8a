#include "starplan/kd_tree.h"

namespace starplan {

KDTree::KDTree(const std::vector<Node>& nodes) {
    cloud_.nodes = &nodes;
    index_.reset(new DynamicIndex(2, cloud_, nanoflann::KDTreeSingleIndexAdaptorParams(10)));
    if (!nodes.empty())
        index_->addPoints(0, nodes.size() - 1);
}

void KDTree::add(size_t index) {
    index_->addPoints(index, index);
}

std::vector<size_t> KDTree::radius_search(const Point2D& point, double radius) const {
    std::vector<nanoflann::ResultItem<size_t, double>> matches;
    nanoflann::RadiusResultSet<double, size_t> result(radius * radius, matches);

    const double query[2] = {point.x, point.y};
    index_->findNeighbors(result, query, nanoflann::SearchParameters());

    std::vector<size_t> indices;
    indices.reserve(matches.size());
    for (const auto& match : matches)
        indices.push_back(match.first);
    return indices;
}

} // namespace starplan
