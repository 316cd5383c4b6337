/**
 * @file PoissonDisk.cpp
 * @brief Poisson-disk sampling implementation
 */

#include <VxTrace/Internal/PoissonDisk.h>
#include <VxTrace/Internal/SpatialGrid.h>
#include <VxTrace/Core/Constants.h>

#include <cmath>

namespace Vx::Trace::Internal {

std::vector<Point2d> PoissonDiskSample(const Rect2d& bounds, double minDistance,
                                       size_t maxPoints, Platform::Random& rng,
                                       int32_t attempts) {
    std::vector<Point2d> samples;
    if (bounds.IsEmpty() || minDistance <= 0.0) return samples;

    // Cell of r / sqrt(2) holds at most one sample
    SpatialGrid grid(bounds, minDistance / std::sqrt(2.0));
    std::vector<size_t> active;

    auto accept = [&](const Point2d& p) {
        grid.Insert(static_cast<int32_t>(samples.size()), p);
        active.push_back(samples.size());
        samples.push_back(p);
    };

    accept(bounds.Center());

    while (!active.empty() && (maxPoints == 0 || samples.size() < maxPoints)) {
        const size_t slot = rng.Index(active.size());
        const Point2d origin = samples[active[slot]];
        bool placed = false;

        for (int32_t k = 0; k < attempts; ++k) {
            const double angle = rng.Double() * TWO_PI;
            const double radius = minDistance * (1.0 + rng.Double());
            const Point2d cand(origin.x + radius * std::cos(angle),
                               origin.y + radius * std::sin(angle));
            if (!bounds.Contains(cand)) continue;

            const bool crowded = grid.AnyWithin(cand, minDistance, [](int32_t, const Point2d&) {
                return true;
            });
            if (!crowded) {
                accept(cand);
                placed = true;
                break;
            }
        }

        if (!placed) {
            active[slot] = active.back();
            active.pop_back();
        }
    }

    return samples;
}

} // namespace Vx::Trace::Internal
