#ifndef STARPLAN_SAMPLER_H
#define STARPLAN_SAMPLER_H

#include <random>
#include "starplan/geometry.h"

namespace starplan {

// Source of configuration-space samples. The planner owns one and calls it
// once per iteration.
class Sampler {
public:
    virtual ~Sampler() = default;
    virtual Point2D sample(const Bounds& bounds) = 0;
};

// Uniform sampling over [min_x, max_x) x [min_y, max_y), reproducible for a
// given seed.
class UniformSampler : public Sampler {
public:
    explicit UniformSampler(unsigned int seed);

    Point2D sample(const Bounds& bounds) override;

private:
    std::mt19937 gen_;
    std::uniform_real_distribution<> dis_;
};

} // namespace starplan

#endif // STARPLAN_SAMPLER_H
