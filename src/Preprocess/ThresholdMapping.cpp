/**
 * @file ThresholdMapping.cpp
 * @brief Detail level to detector thresholds
 */

#include <VxTrace/Preprocess/ThresholdMapping.h>
#include <VxTrace/Internal/Threshold.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Preprocess {

ThresholdMapping ThresholdMapping::FromDetail(double detail, int32_t width, int32_t height) {
    const double d = std::clamp(detail, 0.0, 1.0);
    const double w = std::max(1, width);
    const double h = std::max(1, height);
    const double diag = std::max(1.0, std::sqrt(w * w + h * h));

    ThresholdMapping m;
    m.imageDiagonalPx = diag;
    m.dpEpsilonPx = std::clamp((0.003 + 0.012 * (1.0 - d)) * diag, 0.003 * diag, 0.015 * diag);
    m.minStrokeLengthPx = 10.0 + 40.0 * (1.0 - d);
    m.cannyHighRatio = 0.1 + 0.4 * (1.0 - d);
    m.cannyLowRatio = 0.4 * m.cannyHighRatio;
    m.minCenterlineBranchPx = 12.0 + 36.0 * d;
    m.slicCellSizePx = std::clamp(600.0 + 2400.0 * d, 600.0, 3000.0);
    m.slicIterations = 10;
    m.slicCompactness = 10.0;
    m.labMergeThreshold = std::max(2.0 - 0.8 * d, 1.0);
    m.labSplitThreshold = 3.0 + d;
    return m;
}

BinaryMap BinarizeInk(const std::vector<uint8_t>& gray, int32_t width, int32_t height,
                      BinarizeMethod method, int32_t window, double k,
                      Platform::ThreadPool* pool) {
    if (gray.empty() || width <= 0 || height <= 0) return BinaryMap();

    if (method == BinarizeMethod::Otsu) {
        int32_t t = Internal::OtsuThreshold(gray.data(), gray.size());
        return Internal::ThresholdGlobal(gray.data(), width, height, t);
    }

    int32_t win = std::max(3, window);
    if (win % 2 == 0) ++win;
    return Internal::ThresholdSauvola(gray.data(), width, height, win, k, pool);
}

BinaryMap ThresholdResponse(const std::vector<float>& response, int32_t width, int32_t height,
                            float threshold) {
    BinaryMap out(width, height);
    const size_t count = std::min(response.size(), out.data.size());
    for (size_t i = 0; i < count; ++i) {
        if (response[i] >= threshold) out.data[i] = 255;
    }
    return out;
}

} // namespace Vx::Trace::Preprocess
