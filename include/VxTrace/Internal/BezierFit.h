#pragma once

/**
 * @file BezierFit.h
 * @brief Piecewise cubic Bezier fitting (Schneider)
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

/**
 * @brief Fit of one cubic to a run of points
 */
struct BezierSpanFit {
    CubicBezier curve;
    double maxError = 0.0;              ///< max |B(u_i) - P_i| over the run
};

/**
 * @brief Fit a single cubic to pts[first..last] (inclusive)
 *
 * Chord-length parameterization, least-squares handle lengths along the
 * end tangents, then up to 4 Newton-Raphson reparameterization rounds while
 * the error is within 4x maxError. Two-point runs are exact lines.
 */
BezierSpanFit FitCubic(const std::vector<Point2d>& pts, size_t first, size_t last,
                       double maxError);

/**
 * @brief Fit a piecewise cubic to a polyline
 *
 * The polyline is first split at corners turning more than splitAngleDeg.
 * Each span is then covered greedily: the longest prefix that a single cubic
 * fits within maxError is found by exponential then binary search. Segments
 * share end points, so the result is C0 continuous; each segment stays
 * within maxError of the points it covers.
 *
 * @param closed Closed input: the segment back to the first point is fitted too
 */
std::vector<CubicBezier> FitBeziers(const std::vector<Point2d>& pts, bool closed,
                                    double maxError, double splitAngleDeg);

/// Convenience overload for paths
inline std::vector<CubicBezier> FitBeziers(const VPath& path, double maxError,
                                           double splitAngleDeg) {
    return FitBeziers(path.Points(), path.IsClosed(), maxError, splitAngleDeg);
}

} // namespace Vx::Trace::Internal
