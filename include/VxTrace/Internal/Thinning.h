#pragma once

/**
 * @file Thinning.h
 * @brief Topology-preserving skeletonization of binary maps
 */

#include <VxTrace/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

/**
 * @brief Guo-Hall two-subiteration parallel thinning, in place
 *
 * Produces an 8-connected skeleton one pixel wide with the same number of
 * components and holes as the input.
 *
 * @return Number of passes until convergence
 */
int32_t GuoHallThin(BinaryMap& map);

/**
 * @brief Distance-ordered homotopic thinning, in place
 *
 * Pixels are peeled one unit distance level at a time, outermost first.
 * Within a level, north, south, east and west border pixels are removed in
 * alternating subpasses while they are simple points (removal keeps
 * topology) and not end points, so opposite sides erode at the same rate.
 * Ridge pixels of the distance map (no neighbour farther from the
 * background) are kept as anchors so the result follows the medial axis.
 * A Guo-Hall pass finishes the result so it is one pixel wide.
 *
 * @param distance Distance to background per pixel (same size as map)
 */
void DistanceOrderedThin(BinaryMap& map, const std::vector<float>& distance);

/**
 * @brief Yokoi 8-connectivity number of the pixel's neighbourhood
 *
 * A foreground pixel with value 1 and at least one 4-neighbour in the
 * background is simple: removing it leaves topology unchanged.
 */
int32_t ConnectivityNumber8(const BinaryMap& map, int32_t x, int32_t y);

/// Number of 8-neighbours set
int32_t CountNeighbors8(const BinaryMap& map, int32_t x, int32_t y);

} // namespace Vx::Trace::Internal
