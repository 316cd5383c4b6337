#pragma once

/**
 * @file FlowTrace.h
 * @brief Polyline tracing that steps along the edge tangent flow
 *
 * An alternative to pixel linking for ETF/FDoG edges. Seeds are edge pixels,
 * strongest response first. From each seed the tracer steps a fixed
 * distance along the tangent in both directions, flipping the tangent to
 * agree with the current heading. A direction stops at the image border, on
 * a pixel already traced, where coherency drops below the minimum, where the
 * heading would turn more than the allowed angle, or after more than maxGap
 * steps without edge support. Gap steps at the end of a trace are dropped.
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Internal/EdgeTangentFlow.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct FlowTraceParams {
    double minStrength = 0.08;      ///< Seed response relative to the strongest response
    double minCoherency = 0.15;
    int32_t maxGap = 4;             ///< Consecutive steps without edge support
    int32_t maxSteps = 10000;       ///< Per direction
    double stepSize = 0.5;          ///< Pixels
    double maxAngleDeg = 30.0;      ///< Heading change allowed per step
    double closeDistance = 2.0;     ///< End-to-start distance that closes a trace
    int32_t minClosedPoints = 8;
};

struct FlowTraceStats {
    size_t seeds = 0;
    size_t traces = 0;              ///< Traces with at least 3 points
};

/**
 * @brief Trace polylines over an edge map
 * @param edges Thin edge map
 * @param flow Tangent field of the same size
 * @param response Edge response used to pick and order seeds, may be null
 *        (then every edge pixel is a seed, in raster order)
 * @return Polylines in pixel coordinates, consecutive points at least
 *         2 * stepSize apart
 */
std::vector<VPath> TraceFlowPolylines(const BinaryMap& edges, const FlowField& flow,
                                      const float* response, const FlowTraceParams& params,
                                      FlowTraceStats* stats = nullptr);

} // namespace Vx::Trace::Internal
