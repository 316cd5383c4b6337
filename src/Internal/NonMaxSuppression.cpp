/**
 * @file NonMaxSuppression.cpp
 * @brief Non-maximum suppression and hysteresis implementation
 */

#include <VxTrace/Internal/NonMaxSuppression.h>

#include <algorithm>
#include <cmath>
#include <vector>

namespace Vx::Trace::Internal {

namespace {

constexpr uint8_t STRONG = 255;
constexpr uint8_t WEAK = 128;

inline float SampleBilinear(const float* data, int32_t width, int32_t height,
                            double x, double y) {
    x = std::clamp(x, 0.0, static_cast<double>(width - 1));
    y = std::clamp(y, 0.0, static_cast<double>(height - 1));

    const int32_t x0 = static_cast<int32_t>(x);
    const int32_t y0 = static_cast<int32_t>(y);
    const int32_t x1 = std::min(x0 + 1, width - 1);
    const int32_t y1 = std::min(y0 + 1, height - 1);
    const double fx = x - x0;
    const double fy = y - y0;

    const double v00 = data[static_cast<size_t>(y0) * width + x0];
    const double v10 = data[static_cast<size_t>(y0) * width + x1];
    const double v01 = data[static_cast<size_t>(y1) * width + x0];
    const double v11 = data[static_cast<size_t>(y1) * width + x1];

    return static_cast<float>((1.0 - fx) * (1.0 - fy) * v00 + fx * (1.0 - fy) * v10 +
                              (1.0 - fx) * fy * v01 + fx * fy * v11);
}

} // anonymous namespace

void NonMaxSuppress(const float* response, const float* nx, const float* ny,
                    float* output, int32_t width, int32_t height,
                    float lowThreshold, Platform::ThreadPool* pool) {
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < width; ++x) {
            const size_t idx = static_cast<size_t>(y) * width + x;
            const float value = response[idx];
            output[idx] = 0.0f;

            if (value <= 0.0f || value < lowThreshold) continue;

            const double len = std::sqrt(static_cast<double>(nx[idx]) * nx[idx] +
                                         static_cast<double>(ny[idx]) * ny[idx]);
            if (len < 1e-12) continue;

            const double dx = nx[idx] / len;
            const double dy = ny[idx] / len;

            const float ahead = SampleBilinear(response, width, height, x + dx, y + dy);
            const float behind = SampleBilinear(response, width, height, x - dx, y - dy);

            // Strict on one side so a flat two-pixel ridge keeps one pixel
            if (value > ahead && value >= behind) {
                output[idx] = value;
            }
        }
    });
}

BinaryMap HysteresisThreshold(const float* response, int32_t width, int32_t height,
                              float low, float high) {
    BinaryMap result(width, height, 0);
    if (width <= 0 || height <= 0) return result;

    const size_t total = static_cast<size_t>(width) * height;
    std::vector<uint8_t> state(total, 0);
    std::vector<int32_t> stack;

    for (size_t i = 0; i < total; ++i) {
        if (response[i] >= high && response[i] > 0.0f) {
            state[i] = STRONG;
            stack.push_back(static_cast<int32_t>(i));
        } else if (response[i] >= low && response[i] > 0.0f) {
            state[i] = WEAK;
        }
    }

    while (!stack.empty()) {
        const int32_t idx = stack.back();
        stack.pop_back();
        const int32_t x = idx % width;
        const int32_t y = idx / width;

        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                if (dx == 0 && dy == 0) continue;
                const int32_t nx = x + dx;
                const int32_t ny = y + dy;
                if (nx < 0 || nx >= width || ny < 0 || ny >= height) continue;

                const size_t nidx = static_cast<size_t>(ny) * width + nx;
                if (state[nidx] == WEAK) {
                    state[nidx] = STRONG;
                    stack.push_back(static_cast<int32_t>(nidx));
                }
            }
        }
    }

    for (size_t i = 0; i < total; ++i) {
        result.data[i] = state[i] == STRONG ? 255 : 0;
    }
    return result;
}

} // namespace Vx::Trace::Internal
