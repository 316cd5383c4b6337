/**
 * @file Canny.cpp
 * @brief Canny edge detection implementation
 */

#include <VxTrace/Internal/Canny.h>
#include <VxTrace/Internal/Gaussian.h>
#include <VxTrace/Internal/Gradient.h>
#include <VxTrace/Internal/NonMaxSuppression.h>

#include <algorithm>

namespace Vx::Trace::Internal {

BinaryMap EdgesFromGradient(const float* gx, const float* gy,
                            int32_t width, int32_t height,
                            double lowRatio, double highRatio,
                            Platform::ThreadPool* pool, EdgeResponse* response) {
    const size_t total = static_cast<size_t>(width) * height;

    std::vector<float> magnitude(total);
    GradientMagnitude(gx, gy, magnitude.data(), total);
    const float maxMag = MaxValue(magnitude.data(), total);

    if (response != nullptr) {
        response->width = width;
        response->height = height;
        response->magnitude = magnitude;
        response->orientation.resize(total);
        GradientOrientation(gx, gy, response->orientation.data(), total);
        response->maxMagnitude = maxMag;
    }

    if (maxMag <= 0.0f) {
        return BinaryMap(width, height, 0);
    }

    const float high = static_cast<float>(std::clamp(highRatio, 0.0, 1.0) * maxMag);
    const float low = static_cast<float>(std::clamp(lowRatio, 0.0, highRatio) * maxMag);

    std::vector<float> suppressed(total);
    NonMaxSuppress(magnitude.data(), gx, gy, suppressed.data(), width, height, low, pool);

    return HysteresisThreshold(suppressed.data(), width, height, low, high);
}

BinaryMap DetectCannyEdges(const float* gray, int32_t width, int32_t height,
                           const CannyParams& params, Platform::ThreadPool* pool,
                           EdgeResponse* response) {
    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0) return BinaryMap();

    std::vector<float> smoothed(total);
    GaussianBlur(gray, smoothed.data(), width, height, params.sigma, pool);

    std::vector<float> gx(total);
    std::vector<float> gy(total);
    SobelGradient(smoothed.data(), gx.data(), gy.data(), width, height, pool);

    return EdgesFromGradient(gx.data(), gy.data(), width, height,
                             params.lowRatio, params.highRatio, pool, response);
}

} // namespace Vx::Trace::Internal
