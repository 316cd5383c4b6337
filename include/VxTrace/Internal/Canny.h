#pragma once

/**
 * @file Canny.h
 * @brief Canny edge detection on a float luminance plane
 *
 * Pipeline: Gaussian smoothing -> Sobel gradient -> NMS with bilinear
 * sampling -> hysteresis. Thresholds are fractions of the largest gradient
 * magnitude so they are independent of image contrast.
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct CannyParams {
    double sigma = 1.5;         ///< Gaussian sigma (<= 0 disables smoothing)
    double lowRatio = 0.12;     ///< Low threshold as fraction of max magnitude
    double highRatio = 0.3;     ///< High threshold as fraction of max magnitude
};

/**
 * @brief Per-pixel gradient response (magnitude >= 0, orientation modulo pi)
 */
struct EdgeResponse {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<float> magnitude;
    std::vector<float> orientation;
    float maxMagnitude = 0.0f;
};

/**
 * @brief Detect edges and return a thin binary edge map
 *
 * @param gray Luminance plane, values 0..255
 * @param response Optional output of the gradient response
 */
BinaryMap DetectCannyEdges(const float* gray, int32_t width, int32_t height,
                           const CannyParams& params,
                           Platform::ThreadPool* pool = nullptr,
                           EdgeResponse* response = nullptr);

/**
 * @brief NMS + relative hysteresis on an existing gradient field
 *
 * Shared by the directional passes, which project gradients before
 * suppression.
 */
BinaryMap EdgesFromGradient(const float* gx, const float* gy,
                            int32_t width, int32_t height,
                            double lowRatio, double highRatio,
                            Platform::ThreadPool* pool = nullptr,
                            EdgeResponse* response = nullptr);

} // namespace Vx::Trace::Internal
