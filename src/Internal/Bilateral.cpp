/**
 * @file Bilateral.cpp
 * @brief Edge-preserving bilateral filter
 */

#include <VxTrace/Internal/Bilateral.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace Vx::Trace::Internal {

void BilateralFilter(const float* src, float* dst, int32_t width, int32_t height,
                     double spatialSigma, double rangeSigma, Platform::ThreadPool* pool) {
    const int32_t radius = std::max(1, static_cast<int32_t>(std::ceil(2.0 * spatialSigma)));
    const int32_t side = 2 * radius + 1;

    std::vector<float> spatial(static_cast<size_t>(side) * side);
    const double sInv = 1.0 / (2.0 * spatialSigma * spatialSigma);
    for (int32_t dy = -radius; dy <= radius; ++dy) {
        for (int32_t dx = -radius; dx <= radius; ++dx) {
            spatial[(dy + radius) * side + dx + radius] =
                static_cast<float>(std::exp(-(dx * dx + dy * dy) * sInv));
        }
    }

    // Range weights tabulated per integer intensity difference
    const double rInv = 1.0 / (2.0 * rangeSigma * rangeSigma);
    std::vector<float> range(256);
    for (int32_t d = 0; d < 256; ++d) {
        range[d] = static_cast<float>(std::exp(-d * d * rInv));
    }

    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < width; ++x) {
            const float center = src[static_cast<size_t>(y) * width + x];
            double acc = 0.0;
            double norm = 0.0;
            for (int32_t dy = -radius; dy <= radius; ++dy) {
                int32_t ny = y + dy;
                if (ny < 0 || ny >= height) continue;
                for (int32_t dx = -radius; dx <= radius; ++dx) {
                    int32_t nx = x + dx;
                    if (nx < 0 || nx >= width) continue;
                    float v = src[static_cast<size_t>(ny) * width + nx];
                    int32_t diff = std::min(255, static_cast<int32_t>(std::fabs(v - center)));
                    double wgt = spatial[(dy + radius) * side + dx + radius] * range[diff];
                    acc += wgt * v;
                    norm += wgt;
                }
            }
            dst[static_cast<size_t>(y) * width + x] =
                norm > 0.0 ? static_cast<float>(acc / norm) : center;
        }
    });
}

} // namespace Vx::Trace::Internal
