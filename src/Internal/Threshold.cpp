/**
 * @file Threshold.cpp
 * @brief Thresholding implementation
 */

#include <VxTrace/Internal/Threshold.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

// ============================================================================
// Global Thresholds
// ============================================================================

std::vector<uint64_t> ComputeHistogram(const uint8_t* data, size_t count) {
    std::vector<uint64_t> hist(256, 0);
    for (size_t i = 0; i < count; ++i) {
        ++hist[data[i]];
    }
    return hist;
}

int32_t OtsuThreshold(const std::vector<uint64_t>& histogram) {
    double total = 0.0;
    double totalSum = 0.0;
    for (int32_t i = 0; i < 256; ++i) {
        total += static_cast<double>(histogram[i]);
        totalSum += static_cast<double>(i) * histogram[i];
    }
    if (total == 0.0) {
        return 128;
    }

    double maxVariance = 0.0;
    int32_t optimalThreshold = 0;
    double w0 = 0.0;
    double sum0 = 0.0;

    for (int32_t t = 0; t < 255; ++t) {
        w0 += static_cast<double>(histogram[t]);
        if (w0 == 0.0) continue;

        double w1 = total - w0;
        if (w1 == 0.0) break;

        sum0 += static_cast<double>(t) * histogram[t];

        double mean0 = sum0 / w0;
        double mean1 = (totalSum - sum0) / w1;
        double variance = w0 * w1 * (mean0 - mean1) * (mean0 - mean1);

        if (variance > maxVariance) {
            maxVariance = variance;
            optimalThreshold = t;
        }
    }
    return optimalThreshold;
}

int32_t OtsuThreshold(const uint8_t* data, size_t count) {
    return OtsuThreshold(ComputeHistogram(data, count));
}

// ============================================================================
// Local Statistics
// ============================================================================

void LocalMeanStd(const uint8_t* gray, int32_t width, int32_t height, int32_t window,
                  float* mean, float* stddev, Platform::ThreadPool* pool) {
    const size_t stride = static_cast<size_t>(width) + 1;
    std::vector<double> sum(stride * (height + 1), 0.0);
    std::vector<double> sqSum(stride * (height + 1), 0.0);

    for (int32_t y = 0; y < height; ++y) {
        double rowSum = 0.0;
        double rowSq = 0.0;
        for (int32_t x = 0; x < width; ++x) {
            double v = gray[static_cast<size_t>(y) * width + x];
            rowSum += v;
            rowSq += v * v;
            sum[(y + 1) * stride + x + 1] = sum[y * stride + x + 1] + rowSum;
            sqSum[(y + 1) * stride + x + 1] = sqSum[y * stride + x + 1] + rowSq;
        }
    }

    const int32_t half = std::max(1, window / 2);

    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        const int32_t y0 = std::max(0, y - half);
        const int32_t y1 = std::min(height, y + half + 1);
        for (int32_t x = 0; x < width; ++x) {
            const int32_t x0 = std::max(0, x - half);
            const int32_t x1 = std::min(width, x + half + 1);
            const double n = static_cast<double>(y1 - y0) * (x1 - x0);

            double s = sum[y1 * stride + x1] - sum[y0 * stride + x1]
                     - sum[y1 * stride + x0] + sum[y0 * stride + x0];
            double sq = sqSum[y1 * stride + x1] - sqSum[y0 * stride + x1]
                      - sqSum[y1 * stride + x0] + sqSum[y0 * stride + x0];

            double m = s / n;
            double var = std::max(0.0, sq / n - m * m);
            size_t idx = static_cast<size_t>(y) * width + x;
            mean[idx] = static_cast<float>(m);
            stddev[idx] = static_cast<float>(std::sqrt(var));
        }
    });
}

void SauvolaThresholdMap(const uint8_t* gray, int32_t width, int32_t height,
                         int32_t window, double k, double R, float* thresholdMap,
                         Platform::ThreadPool* pool) {
    const size_t count = static_cast<size_t>(width) * height;
    std::vector<float> stddev(count);
    LocalMeanStd(gray, width, height, window, thresholdMap, stddev.data(), pool);

    for (size_t i = 0; i < count; ++i) {
        double m = thresholdMap[i];
        thresholdMap[i] = static_cast<float>(m * (1.0 + k * (stddev[i] / R - 1.0)));
    }
}

// ============================================================================
// Binarization
// ============================================================================

BinaryMap ThresholdGlobal(const uint8_t* gray, int32_t width, int32_t height, int32_t threshold) {
    BinaryMap out(width, height);
    const size_t count = static_cast<size_t>(width) * height;
    for (size_t i = 0; i < count; ++i) {
        out.data[i] = gray[i] <= threshold ? 255 : 0;
    }
    return out;
}

BinaryMap ThresholdSauvola(const uint8_t* gray, int32_t width, int32_t height,
                           int32_t window, double k, Platform::ThreadPool* pool) {
    const size_t count = static_cast<size_t>(width) * height;
    std::vector<float> threshold(count);
    SauvolaThresholdMap(gray, width, height, window, k, DEFAULT_SAUVOLA_R, threshold.data(), pool);

    BinaryMap out(width, height);
    for (size_t i = 0; i < count; ++i) {
        out.data[i] = gray[i] <= threshold[i] ? 255 : 0;
    }
    return out;
}

} // namespace Vx::Trace::Internal
