#ifndef STARPLAN_GEOMETRY_H
#define STARPLAN_GEOMETRY_H

#include <cstddef>
#include <stdexcept>

namespace starplan {

struct Point2D {
    double x, y;

    Point2D(double x = 0, double y = 0);
    double distance(const Point2D& other) const;
    Point2D operator+(const Point2D& other) const;
    Point2D operator-(const Point2D& other) const;
    Point2D operator*(double scalar) const;
    bool operator==(const Point2D& other) const;
    bool operator!=(const Point2D& other) const;

    double& operator[](size_t index) {
        switch(index) {
            case 0: return x;
            case 1: return y;
            default: throw std::out_of_range("Invalid dimension");
        }
    }

    const double& operator[](size_t index) const {
        switch(index) {
            case 0: return x;
            case 1: return y;
            default: throw std::out_of_range("Invalid dimension");
        }
    }
};

// Euclidean distance, same as a.distance(b)
double distance(const Point2D& a, const Point2D& b);

// Axis-aligned sampling region [min_x, max_x) x [min_y, max_y)
struct Bounds {
    double min_x, max_x;
    double min_y, max_y;

    Bounds(double min_x = 0, double max_x = 0, double min_y = 0, double max_y = 0);
    bool valid() const;
    bool contains(const Point2D& p) const;
};

} // namespace starplan

#endif // STARPLAN_GEOMETRY_H
