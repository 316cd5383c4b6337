#pragma once

/**
 * @file Gaussian.h
 * @brief Gaussian kernels and separable blur on float planes
 *
 * Used by:
 * - Edge backend (pre-smoothing, FDoG profiles)
 * - Directional passes (pass-specific blur)
 * - Denoise range/space weights
 */

#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

class Gaussian {
public:
    /**
     * @brief Kernel size 2 * ceil(cutoff * sigma) + 1, minimum 3
     */
    static int32_t ComputeKernelSize(double sigma, double cutoff = 3.0);

    /**
     * @brief Normalized 1D Gaussian (delta for sigma <= 0)
     */
    static std::vector<double> Kernel1D(double sigma, int32_t size = 0);

    /**
     * @brief Gaussian value exp(-x^2 / 2 sigma^2) / (sqrt(2 pi) sigma)
     */
    static double Value(double x, double sigma);
};

/// Mirror index into [0, n) without repeating the border sample
inline int32_t Reflect101(int32_t i, int32_t n) {
    if (n == 1) return 0;
    while (i < 0 || i >= n) {
        if (i < 0) i = -i;
        if (i >= n) i = 2 * n - 2 - i;
    }
    return i;
}

/**
 * @brief Separable Gaussian blur, reflect-101 borders
 *
 * src and dst may alias. sigma <= 0 copies.
 * Rows are processed in parallel when a pool is given.
 */
void GaussianBlur(const float* src, float* dst, int32_t width, int32_t height,
                  double sigma, Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
