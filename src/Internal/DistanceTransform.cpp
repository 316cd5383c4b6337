/**
 * @file DistanceTransform.cpp
 * @brief Meijster exact EDT
 */

#include <VxTrace/Internal/DistanceTransform.h>

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace Vx::Trace::Internal {

namespace {

// Floor division for possibly negative numerators
int64_t FloorDiv(int64_t num, int64_t den) {
    int64_t q = num / den;
    if ((num % den != 0) && ((num < 0) != (den < 0))) --q;
    return q;
}

} // namespace

std::vector<float> DistanceTransformL2(const BinaryMap& binary, Platform::ThreadPool* pool) {
    const int32_t width = binary.width;
    const int32_t height = binary.height;
    const size_t count = static_cast<size_t>(width) * height;
    std::vector<float> dist(count, 0.0f);
    if (count == 0) return dist;

    // Pixels beyond the border act as background
    const int64_t inf = static_cast<int64_t>(width) + height;

    // Phase 1: vertical distance per column
    std::vector<int64_t> g(count);
    Platform::ParallelFor(pool, 0, static_cast<size_t>(width), [&](size_t col) {
        const int32_t c = static_cast<int32_t>(col);
        g[c] = binary.data[c] ? 1 : 0;
        for (int32_t r = 1; r < height; ++r) {
            size_t idx = static_cast<size_t>(r) * width + c;
            g[idx] = binary.data[idx] ? g[idx - width] + 1 : 0;
        }
        if (g[static_cast<size_t>(height - 1) * width + c] != 0) {
            g[static_cast<size_t>(height - 1) * width + c] = 1;
        }
        for (int32_t r = height - 2; r >= 0; --r) {
            size_t idx = static_cast<size_t>(r) * width + c;
            if (g[idx + width] + 1 < g[idx]) {
                g[idx] = g[idx + width] + 1;
            }
        }
        for (int32_t r = 0; r < height; ++r) {
            size_t idx = static_cast<size_t>(r) * width + c;
            if (g[idx] > inf) g[idx] = inf;
        }
    });

    // Phase 2: lower envelope of parabolas per row
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int64_t* gr = g.data() + row * width;
        float* out = dist.data() + row * width;
        std::vector<int64_t> s(width);
        std::vector<int64_t> t(width);

        auto f = [gr](int64_t x, int64_t i) {
            return (x - i) * (x - i) + gr[i] * gr[i];
        };
        auto sep = [gr](int64_t i, int64_t u) {
            return FloorDiv(u * u - i * i + gr[u] * gr[u] - gr[i] * gr[i], 2 * (u - i));
        };

        int64_t q = 0;
        s[0] = 0;
        t[0] = 0;
        for (int64_t u = 1; u < width; ++u) {
            while (q >= 0 && f(t[q], s[q]) > f(t[q], u)) {
                --q;
            }
            if (q < 0) {
                q = 0;
                s[0] = u;
            } else {
                int64_t w = 1 + sep(s[q], u);
                if (w < width) {
                    ++q;
                    s[q] = u;
                    t[q] = w;
                }
            }
        }
        for (int64_t u = width - 1; u >= 0; --u) {
            int64_t d2 = f(u, s[q]);
            int64_t left = (u + 1) * (u + 1);
            int64_t right = (width - u) * (width - u);
            d2 = std::min(d2, std::min(left, right));
            out[u] = static_cast<float>(std::sqrt(static_cast<double>(d2)));
            if (u == t[q]) --q;
        }
    });

    return dist;
}

} // namespace Vx::Trace::Internal
