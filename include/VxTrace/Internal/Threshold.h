#pragma once

/**
 * @file Threshold.h
 * @brief Global (Otsu) and local (Sauvola) thresholds on 8-bit luminance
 *
 * Foreground convention: ink is dark, so a pixel is foreground (255) when
 * its value is at or below the threshold.
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

/// Default k for Sauvola
constexpr double DEFAULT_SAUVOLA_K = 0.4;

/// Dynamic range of the standard deviation for 8-bit data
constexpr double DEFAULT_SAUVOLA_R = 128.0;

/**
 * @brief 256-bin histogram of 8-bit samples
 */
std::vector<uint64_t> ComputeHistogram(const uint8_t* data, size_t count);

/**
 * @brief Otsu threshold (maximizes between-class variance)
 * @return t such that class 0 is v <= t; 0 for a uniform image
 */
int32_t OtsuThreshold(const std::vector<uint64_t>& histogram);

int32_t OtsuThreshold(const uint8_t* data, size_t count);

/**
 * @brief Local mean and standard deviation over a square window
 *
 * Uses integral images; the window is clipped at the borders.
 */
void LocalMeanStd(const uint8_t* gray, int32_t width, int32_t height, int32_t window,
                  float* mean, float* stddev, Platform::ThreadPool* pool = nullptr);

/**
 * @brief Per-pixel Sauvola threshold T = mean * (1 + k * (std / R - 1))
 */
void SauvolaThresholdMap(const uint8_t* gray, int32_t width, int32_t height,
                         int32_t window, double k, double R, float* thresholdMap,
                         Platform::ThreadPool* pool = nullptr);

/**
 * @brief Binarize with a single global threshold (v <= t is foreground)
 */
BinaryMap ThresholdGlobal(const uint8_t* gray, int32_t width, int32_t height, int32_t threshold);

/**
 * @brief Binarize with Sauvola's local threshold
 */
BinaryMap ThresholdSauvola(const uint8_t* gray, int32_t width, int32_t height,
                           int32_t window, double k, Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
