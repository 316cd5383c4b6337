#pragma once

/**
 * @file ContourProcess.h
 * @brief Polyline cleanup, resampling and simplification
 *
 * All functions return new paths and keep the open/closed flag.
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/VPath.h>

namespace Vx::Trace::Internal {

/**
 * @brief Drop consecutive points closer than tolerance
 */
VPath RemoveDuplicatePoints(const VPath& path, double tolerance = 1e-6);

/**
 * @brief Points every `spacing` along the arc length
 *
 * The first point is kept; for open paths the last point is kept too.
 * A non-positive spacing returns a copy.
 */
VPath ResamplePath(const VPath& path, double spacing);

/**
 * @brief Ramer-Douglas-Peucker simplification
 *
 * Uses an explicit work stack. Closed paths are split at the point
 * farthest from the first and both halves simplified; at least 3 points
 * are kept for closed paths.
 */
VPath SimplifyRdp(const VPath& path, double epsilon);

/**
 * @brief Visvalingam-Whyatt simplification
 *
 * Repeatedly removes the point with the smallest effective triangle area
 * while that area is below epsilon^2. A min-heap with lazy invalidation
 * keeps this O(n log n). End points of open paths are kept; closed paths
 * keep at least 3 points.
 */
VPath SimplifyVisvalingam(const VPath& path, double epsilon);

/**
 * @brief Dispatch on the configured method
 */
VPath Simplify(const VPath& path, SimplifyMethod method, double epsilon);

/// Distance from p to segment ab
double PointSegmentDistance(const Point2d& p, const Point2d& a, const Point2d& b);

} // namespace Vx::Trace::Internal
