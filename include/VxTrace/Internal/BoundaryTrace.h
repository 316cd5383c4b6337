#pragma once

/**
 * @file BoundaryTrace.h
 * @brief Moore-neighbour boundary tracing with Jacob's stopping criterion
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

enum class TraceStatus {
    Closed,         ///< Returned to the start with the same entry direction
    Isolated,       ///< Single pixel without foreground neighbours
    Abandoned       ///< Step budget exhausted
};

struct BoundaryTraceResult {
    TraceStatus status = TraceStatus::Abandoned;
    std::vector<Point2i> contour;       ///< Boundary pixels in walking order
    int64_t steps = 0;
};

/// Default step budget for a w x h raster
int64_t DefaultTraceBudget(int32_t width, int32_t height);

/**
 * @brief Trace the boundary through start
 *
 * @param start Foreground pixel on the boundary
 * @param backtrack Background pixel 8-adjacent to start where the walk
 *        begins its clockwise neighbour search
 * @param budget Maximum steps (<= 0 selects DefaultTraceBudget)
 */
BoundaryTraceResult TraceBoundary(const BinaryMap& mask, const Point2i& start,
                                  const Point2i& backtrack, int64_t budget = 0);

/**
 * @brief Trace the outer boundary of the component containing the
 *        first foreground pixel at or after start in raster order
 *
 * start must be the raster-first pixel of its component so that its
 * west neighbour is background.
 */
BoundaryTraceResult TraceBoundary(const BinaryMap& mask, const Point2i& start,
                                  int64_t budget = 0);

/**
 * @brief Outer ring and hole rings of one label
 */
struct RegionBoundary {
    std::vector<VPath> rings;           ///< Outer ring first, then holes
    int32_t abandoned = 0;              ///< Traces that hit their budget
};

/**
 * @brief Trace every boundary of the pixels carrying label
 *
 * Only the largest 8-connected component is traced; connectivity
 * enforcement guarantees there is exactly one. Holes are background
 * components (4-connected) enclosed by the region.
 */
RegionBoundary TraceAllBoundaries(const LabelMap& labels, int32_t label,
                                  int64_t budget = 0);

} // namespace Vx::Trace::Internal
