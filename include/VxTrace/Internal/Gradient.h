#pragma once

/**
 * @file Gradient.h
 * @brief Sobel gradients and magnitude/orientation planes
 */

#include <VxTrace/Platform/Thread.h>

#include <cstddef>
#include <cstdint>

namespace Vx::Trace::Internal {

/**
 * @brief 3x3 Sobel derivatives, reflect-101 borders
 *
 * gx is positive for dark-to-bright transitions along +x.
 */
void SobelGradient(const float* src, float* gx, float* gy,
                   int32_t width, int32_t height,
                   Platform::ThreadPool* pool = nullptr);

/**
 * @brief mag[i] = hypot(gx[i], gy[i])
 */
void GradientMagnitude(const float* gx, const float* gy, float* mag, size_t count);

/**
 * @brief Orientation modulo pi, in [0, pi)
 */
void GradientOrientation(const float* gx, const float* gy, float* orientation, size_t count);

/// Largest value (0 for empty input)
float MaxValue(const float* data, size_t count);

/// Divide by the maximum so values land in [0, 1]; returns the old maximum
float NormalizeByMax(float* data, size_t count);

} // namespace Vx::Trace::Internal
