/**
 * @file Gradient.cpp
 * @brief Image gradient computation implementation
 */

#include <VxTrace/Internal/Gradient.h>
#include <VxTrace/Internal/Gaussian.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

void SobelGradient(const float* src, float* gx, float* gy,
                   int32_t width, int32_t height, Platform::ThreadPool* pool) {
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        const float* r0 = src + static_cast<size_t>(Reflect101(y - 1, height)) * width;
        const float* r1 = src + static_cast<size_t>(y) * width;
        const float* r2 = src + static_cast<size_t>(Reflect101(y + 1, height)) * width;
        float* outX = gx + static_cast<size_t>(y) * width;
        float* outY = gy + static_cast<size_t>(y) * width;

        for (int32_t x = 0; x < width; ++x) {
            const int32_t xl = Reflect101(x - 1, width);
            const int32_t xr = Reflect101(x + 1, width);

            outX[x] = (r0[xr] - r0[xl]) + 2.0f * (r1[xr] - r1[xl]) + (r2[xr] - r2[xl]);
            outY[x] = (r2[xl] - r0[xl]) + 2.0f * (r2[x] - r0[x]) + (r2[xr] - r0[xr]);
        }
    });
}

void GradientMagnitude(const float* gx, const float* gy, float* mag, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        mag[i] = std::sqrt(gx[i] * gx[i] + gy[i] * gy[i]);
    }
}

void GradientOrientation(const float* gx, const float* gy, float* orientation, size_t count) {
    for (size_t i = 0; i < count; ++i) {
        orientation[i] = static_cast<float>(FoldOrientation(std::atan2(gy[i], gx[i])));
    }
}

float MaxValue(const float* data, size_t count) {
    if (count == 0) return 0.0f;
    return *std::max_element(data, data + count);
}

float NormalizeByMax(float* data, size_t count) {
    float maxVal = MaxValue(data, count);
    if (maxVal > 0.0f) {
        const float inv = 1.0f / maxVal;
        for (size_t i = 0; i < count; ++i) {
            data[i] *= inv;
        }
    }
    return maxVal;
}

} // namespace Vx::Trace::Internal
