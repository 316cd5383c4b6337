#pragma once

/**
 * @file ThresholdMapping.h
 * @brief Map the single detail knob to pixel-space thresholds
 */

#include <VxTrace/Core/Export.h>
#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Preprocess {

/**
 * @brief Thresholds derived from detail (0 sparse .. 1 detailed) and image size
 *
 * Higher detail gives lower edge thresholds, shorter minimum strokes and
 * less simplification.
 */
struct VXTRACE_API ThresholdMapping {
    double dpEpsilonPx = 0.0;           ///< Simplification tolerance
    double minStrokeLengthPx = 0.0;     ///< Shorter strokes are pruned
    double cannyHighRatio = 0.0;        ///< Fraction of max gradient
    double cannyLowRatio = 0.0;
    double minCenterlineBranchPx = 0.0;
    double slicCellSizePx = 0.0;
    int32_t slicIterations = 10;
    double slicCompactness = 10.0;
    double labMergeThreshold = 0.0;     ///< Delta E below which regions merge
    double labSplitThreshold = 0.0;
    double imageDiagonalPx = 0.0;

    /**
     * @param detail Clamped to [0, 1]
     * @param width, height Clamped to >= 1
     */
    static ThresholdMapping FromDetail(double detail, int32_t width, int32_t height);
};

// =============================================================================
// Threshold maps
// =============================================================================

/**
 * @brief Ink mask of a luminance plane (255 = dark ink)
 * @param window Sauvola window, forced odd and >= 3
 * @param k Sauvola sensitivity
 */
BinaryMap BinarizeInk(const std::vector<uint8_t>& gray, int32_t width, int32_t height,
                      BinarizeMethod method, int32_t window, double k,
                      Platform::ThreadPool* pool = nullptr);

/**
 * @brief Continuous response to binary: pixels with value >= threshold are set
 */
BinaryMap ThresholdResponse(const std::vector<float>& response, int32_t width, int32_t height,
                            float threshold);

} // namespace Vx::Trace::Preprocess
