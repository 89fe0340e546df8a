#include "starplan/geometry.h"
#include <cmath>

using namespace starplan;

Point2D::Point2D(double x, double y) : x(x), y(y) {}

double Point2D::distance(const Point2D& other) const {
    const double dx = x - other.x;
    const double dy = y - other.y;
    return std::sqrt(dx * dx + dy * dy);
}

Point2D Point2D::operator+(const Point2D& other) const {
    return Point2D(x + other.x, y + other.y);
}

Point2D Point2D::operator-(const Point2D& other) const {
    return Point2D(x - other.x, y - other.y);
}

Point2D Point2D::operator*(double scalar) const {
    return Point2D(x * scalar, y * scalar);
}

bool Point2D::operator==(const Point2D& other) const {
    return x == other.x && y == other.y;
}

bool Point2D::operator!=(const Point2D& other) const {
    return !(*this == other);
}

double starplan::distance(const Point2D& a, const Point2D& b) {
    return a.distance(b);
}

Bounds::Bounds(double min_x, double max_x, double min_y, double max_y)
    : min_x(min_x), max_x(max_x), min_y(min_y), max_y(max_y) {}

bool Bounds::valid() const {
    return std::isfinite(min_x) && std::isfinite(max_x) &&
           std::isfinite(min_y) && std::isfinite(max_y) &&
           min_x < max_x && min_y < max_y;
}

bool Bounds::contains(const Point2D& p) const {
    return p.x >= min_x && p.x < max_x && p.y >= min_y && p.y < max_y;
}
