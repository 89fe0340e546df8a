#include "starplan/sampler.h"
#include <cmath>
#include <stdexcept>

using namespace starplan;

namespace {

double scale(double u, double lo, double hi) {
    const double v = lo + u * (hi - lo);
    // keep the upper bound open when rounding lands on it
    return v < hi ? v : std::nextafter(hi, lo);
}

} // namespace

UniformSampler::UniformSampler(unsigned int seed) : gen_(seed), dis_(0.0, 1.0) {}

Point2D UniformSampler::sample(const Bounds& bounds) {
    if (!bounds.valid())
        throw std::invalid_argument("sampling bounds must be finite with min < max on both axes");

    const double x = scale(dis_(gen_), bounds.min_x, bounds.max_x);
    const double y = scale(dis_(gen_), bounds.min_y, bounds.max_y);
    return Point2D(x, y);
}
