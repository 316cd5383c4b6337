/**
 * @file Gaussian.cpp
 * @brief Gaussian kernel and blur implementation
 */

#include <VxTrace/Internal/Gaussian.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <numeric>

namespace Vx::Trace::Internal {

namespace {
constexpr int32_t MIN_KERNEL_SIZE = 3;
}

// ============================================================================
// Kernels
// ============================================================================

int32_t Gaussian::ComputeKernelSize(double sigma, double cutoff) {
    if (sigma <= 0.0) {
        return MIN_KERNEL_SIZE;
    }
    int32_t halfSize = static_cast<int32_t>(std::ceil(cutoff * sigma));
    return std::max(2 * halfSize + 1, MIN_KERNEL_SIZE);
}

std::vector<double> Gaussian::Kernel1D(double sigma, int32_t size) {
    if (sigma <= 0.0) {
        if (size <= 0) size = MIN_KERNEL_SIZE;
        if (size % 2 == 0) ++size;
        std::vector<double> kernel(size, 0.0);
        kernel[size / 2] = 1.0;
        return kernel;
    }

    if (size <= 0) {
        size = ComputeKernelSize(sigma);
    }
    if (size % 2 == 0) {
        ++size;
    }

    std::vector<double> kernel(size);
    int32_t center = size / 2;
    double twoSigmaSq = 2.0 * sigma * sigma;
    for (int32_t i = 0; i < size; ++i) {
        double x = static_cast<double>(i - center);
        kernel[i] = std::exp(-x * x / twoSigmaSq);
    }

    double sum = std::accumulate(kernel.begin(), kernel.end(), 0.0);
    for (double& k : kernel) {
        k /= sum;
    }
    return kernel;
}

double Gaussian::Value(double x, double sigma) {
    return std::exp(-x * x / (2.0 * sigma * sigma)) / (std::sqrt(TWO_PI) * sigma);
}

// ============================================================================
// Blur
// ============================================================================

void GaussianBlur(const float* src, float* dst, int32_t width, int32_t height,
                  double sigma, Platform::ThreadPool* pool) {
    const size_t count = static_cast<size_t>(width) * height;
    if (sigma <= 0.0) {
        if (src != dst) std::memcpy(dst, src, count * sizeof(float));
        return;
    }

    const std::vector<double> kernel = Gaussian::Kernel1D(sigma);
    const int32_t radius = static_cast<int32_t>(kernel.size()) / 2;
    std::vector<float> tmp(count);

    // Horizontal
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        const float* in = src + static_cast<size_t>(y) * width;
        float* out = tmp.data() + static_cast<size_t>(y) * width;
        for (int32_t x = 0; x < width; ++x) {
            double acc = 0.0;
            for (int32_t k = -radius; k <= radius; ++k) {
                acc += kernel[k + radius] * in[Reflect101(x + k, width)];
            }
            out[x] = static_cast<float>(acc);
        }
    });

    // Vertical
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        float* out = dst + static_cast<size_t>(y) * width;
        for (int32_t x = 0; x < width; ++x) {
            double acc = 0.0;
            for (int32_t k = -radius; k <= radius; ++k) {
                int32_t yy = Reflect101(y + k, height);
                acc += kernel[k + radius] * tmp[static_cast<size_t>(yy) * width + x];
            }
            out[x] = static_cast<float>(acc);
        }
    });
}

} // namespace Vx::Trace::Internal
