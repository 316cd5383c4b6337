#pragma once

/**
 * @file NonMaxSuppression.h
 * @brief Non-maximum suppression across a normal field and hysteresis linking
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>

namespace Vx::Trace::Internal {

/**
 * @brief Keep pixels that are ridges of response along the local normal
 *
 * The response is sampled with bilinear interpolation one pixel either side
 * of each pixel along (nx, ny). The normal does not need to be unit length;
 * pixels with a zero normal or a response below lowThreshold are cleared.
 *
 * @param response Response plane (gradient magnitude, DoG, ...)
 * @param nx, ny Normal direction per pixel (e.g. gx, gy)
 * @param output Suppressed response, same size (must not alias response)
 */
void NonMaxSuppress(const float* response, const float* nx, const float* ny,
                    float* output, int32_t width, int32_t height,
                    float lowThreshold = 0.0f,
                    Platform::ThreadPool* pool = nullptr);

/**
 * @brief Hysteresis thresholding
 *
 * Pixels >= high seed the result; pixels >= low join when 8-connected to a
 * seed through other pixels >= low.
 */
BinaryMap HysteresisThreshold(const float* response, int32_t width, int32_t height,
                              float low, float high);

} // namespace Vx::Trace::Internal
