#pragma once

/**
 * @file PoissonDisk.h
 * @brief Bridson Poisson-disk sampling
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Random.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

/**
 * @brief Blue-noise points inside bounds with pairwise distance >= minDistance
 *
 * Starts from the centre of bounds and grows an active list; each active
 * point tries `attempts` candidates in the annulus [r, 2r] before retiring.
 * Stops after maxPoints samples (0 = unlimited). Deterministic for a given
 * generator state.
 */
std::vector<Point2d> PoissonDiskSample(const Rect2d& bounds, double minDistance,
                                       size_t maxPoints, Platform::Random& rng,
                                       int32_t attempts = 30);

} // namespace Vx::Trace::Internal
