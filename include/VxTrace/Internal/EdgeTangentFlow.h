#pragma once

/**
 * @file EdgeTangentFlow.h
 * @brief Edge tangent flow (ETF) and flow-guided difference of Gaussians (FDoG)
 *
 * The tangent field follows edges rather than crossing them. It is seeded
 * from the smoothed structure tensor and refined iteratively by averaging
 * neighbouring tangents weighted by spatial distance, alignment and
 * coherency. FDoG filters across the flow with a 1D DoG and then integrates
 * the result along the flow lines, which suppresses isolated noise while
 * keeping coherent strokes.
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct EdgeResponse;

/**
 * @brief Unit tangent and coherency per pixel
 *
 * Coherency is in [0, 1]; pixels below the coherency threshold carry 0.
 */
struct FlowField {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<float> tx;
    std::vector<float> ty;
    std::vector<float> coherency;

    bool Empty() const { return tx.empty(); }
};

struct EtfParams {
    int32_t radius = 4;             ///< Refinement neighbourhood radius
    int32_t iterations = 4;         ///< Refinement iterations
    double coherencyTau = 0.2;      ///< Coherency below this is zeroed
    double tensorSigma = 1.0;       ///< Structure tensor smoothing
};

struct FdogParams {
    double sigmaS = 0.8;            ///< Centre Gaussian across the flow
    double sigmaC = 1.6;            ///< Surround Gaussian across the flow (> sigmaS)
    double sigmaM = 3.0;            ///< Integration length along the flow
    double rho = 0.99;              ///< Surround weight
};

/**
 * @brief Build the refined tangent field
 * @param gray Luminance, 0..255
 */
FlowField ComputeEdgeTangentFlow(const float* gray, int32_t width, int32_t height,
                                 const EtfParams& params,
                                 Platform::ThreadPool* pool = nullptr);

/**
 * @brief FDoG response (>= 0, larger on the dark side of edges and on dark lines)
 *
 * Intensities are normalized to [0, 1] before filtering, so the response is
 * in the same units.
 */
std::vector<float> ComputeFdog(const float* gray, int32_t width, int32_t height,
                               const FlowField& flow, const FdogParams& params,
                               Platform::ThreadPool* pool = nullptr);

/**
 * @brief NMS across the tangent normal followed by hysteresis
 *
 * Hysteresis thresholds are 5% and 40% of the suppressed maximum, floored
 * by nmsLow and nmsHigh, all multiplied by thresholdScale.
 *
 * @param tx,ty Unit tangent per pixel
 */
BinaryMap EdgesFromFlowResponse(const float* response, const float* tx, const float* ty,
                                int32_t width, int32_t height,
                                double nmsLow, double nmsHigh, double thresholdScale = 1.0,
                                Platform::ThreadPool* pool = nullptr);

/**
 * @brief ETF/FDoG edge map: FDoG -> NMS across flow -> hysteresis
 *
 * Expects unsmoothed luminance; FDoG carries its own smoothing.
 */
BinaryMap DetectFlowEdges(const float* gray, int32_t width, int32_t height,
                          const EtfParams& etf, const FdogParams& fdog,
                          double nmsLow, double nmsHigh,
                          Platform::ThreadPool* pool = nullptr,
                          EdgeResponse* response = nullptr);

/**
 * @brief FDoG responses for several flow rotations
 */
struct MultiDirectionResponse {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<double> orientations;
    std::vector<std::vector<float>> responses;  ///< One plane per orientation
    std::vector<float> combined;                ///< Per-pixel maximum
    std::vector<float> dominant;                ///< Orientation of the maximum
};

/**
 * @brief Evaluate FDoG with the tangent field rotated by each orientation
 *
 * The per-pixel result keeps the strongest response and its orientation
 * (selection, not sum). Ties keep the earlier orientation.
 */
MultiDirectionResponse ComputeMultiDirectionFdog(const float* gray, int32_t width, int32_t height,
                                                 const FlowField& flow,
                                                 const std::vector<double>& orientations,
                                                 const FdogParams& params,
                                                 Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
