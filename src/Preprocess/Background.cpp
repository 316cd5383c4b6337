/**
 * @file Background.cpp
 * @brief Border-driven background detection and removal
 */

#include <VxTrace/Preprocess/Background.h>
#include <VxTrace/Internal/Threshold.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <tuple>
#include <utility>

namespace Vx::Trace::Preprocess {

namespace {

constexpr double LAB_BIN = 4.0;
constexpr int32_t ADAPTIVE_WINDOW = 31;
constexpr double ADAPTIVE_K = 0.2;

int32_t BandWidth(int32_t side, double ratio) {
    int32_t band = static_cast<int32_t>(std::lround(ratio * side));
    return std::clamp(band, 1, std::max(1, side));
}

bool InBorderBand(int32_t x, int32_t y, int32_t w, int32_t h, int32_t bandX, int32_t bandY) {
    return x < bandX || x >= w - bandX || y < bandY || y >= h - bandY;
}

/// Visit every border band pixel once
template<typename Func>
void ForEachBorderPixel(int32_t w, int32_t h, double ratio, Func&& func) {
    const int32_t bandX = BandWidth(w, ratio);
    const int32_t bandY = BandWidth(h, ratio);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (InBorderBand(x, y, w, h, bandX, bandY)) func(x, y);
        }
    }
}

/// Background is the side of the split the border mostly falls on
BinaryMap MaskFromSplit(const std::vector<uint8_t>& lum, int32_t w, int32_t h,
                        const std::vector<float>& threshold, double sampleRatio) {
    size_t light = 0;
    size_t total = 0;
    ForEachBorderPixel(w, h, sampleRatio, [&](int32_t x, int32_t y) {
        size_t idx = static_cast<size_t>(y) * w + x;
        if (lum[idx] > threshold[idx]) ++light;
        ++total;
    });
    const bool backgroundIsLight = light * 2 >= total;

    BinaryMap mask(w, h);
    for (size_t i = 0; i < lum.size(); ++i) {
        bool isLight = lum[i] > threshold[i];
        mask.data[i] = (isLight == backgroundIsLight) ? 255 : 0;
    }
    return mask;
}

} // anonymous namespace

BackgroundOptions BackgroundOptions::FromConfig(const BackgroundConfig& config) {
    BackgroundOptions opts;
    opts.algorithm = config.algorithm;
    opts.tolerance = config.tolerance;
    opts.strength = config.strength;
    opts.maxCoverage = config.maxCoverage;
    opts.sampleRatio = config.sampleRatio;
    return opts;
}

BackgroundEstimate EstimateBackground(const VImage& image, double sampleRatio) {
    BackgroundEstimate est;
    if (image.Empty()) return est;

    const int32_t w = image.Width();
    const int32_t h = image.Height();

    struct Bin {
        double L = 0.0, a = 0.0, b = 0.0;
        size_t count = 0;
    };
    std::map<std::tuple<int32_t, int32_t, int32_t>, Bin> bins;
    double lumSum = 0.0;

    ForEachBorderPixel(w, h, sampleRatio, [&](int32_t x, int32_t y) {
        Color c = Internal::CompositeOverWhite(image.PixelColor(x, y));
        Internal::Lab lab = Internal::ColorToLab(c);
        auto key = std::make_tuple(static_cast<int32_t>(std::floor(lab.L / LAB_BIN)),
                                   static_cast<int32_t>(std::floor(lab.a / LAB_BIN)),
                                   static_cast<int32_t>(std::floor(lab.b / LAB_BIN)));
        Bin& bin = bins[key];
        bin.L += lab.L;
        bin.a += lab.a;
        bin.b += lab.b;
        ++bin.count;
        lumSum += c.Luminance();
        ++est.samples;
    });

    if (est.samples == 0) return est;
    est.borderLuminance = lumSum / static_cast<double>(est.samples);

    std::vector<const Bin*> ordered;
    ordered.reserve(bins.size());
    for (const auto& kv : bins) ordered.push_back(&kv.second);
    // Stable on the key order, so ties resolve deterministically
    std::stable_sort(ordered.begin(), ordered.end(),
                     [](const Bin* x, const Bin* y) { return x->count > y->count; });
    if (ordered.size() > MAX_BACKGROUND_COLORS) ordered.resize(MAX_BACKGROUND_COLORS);

    for (const Bin* bin : ordered) {
        double n = static_cast<double>(bin->count);
        est.colors.emplace_back(bin->L / n, bin->a / n, bin->b / n);
        est.weights.push_back(n / static_cast<double>(est.samples));
    }
    return est;
}

BinaryMap DetectBackgroundMask(const VImage& image, const BackgroundOptions& options,
                               Platform::ThreadPool* pool) {
    if (image.Empty()) return BinaryMap();

    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const size_t total = static_cast<size_t>(w) * h;

    switch (options.algorithm) {
        case BackgroundAlgorithm::Otsu: {
            std::vector<uint8_t> lum = image.Luminance();
            int32_t t = Internal::OtsuThreshold(lum.data(), lum.size());
            std::vector<float> threshold(total, static_cast<float>(t));
            return MaskFromSplit(lum, w, h, threshold, options.sampleRatio);
        }
        case BackgroundAlgorithm::Adaptive: {
            std::vector<uint8_t> lum = image.Luminance();
            std::vector<float> threshold(total);
            Internal::SauvolaThresholdMap(lum.data(), w, h, ADAPTIVE_WINDOW, ADAPTIVE_K,
                                          Internal::DEFAULT_SAUVOLA_R, threshold.data(), pool);
            return MaskFromSplit(lum, w, h, threshold, options.sampleRatio);
        }
        case BackgroundAlgorithm::Auto:
        default: {
            BackgroundEstimate est = EstimateBackground(image, options.sampleRatio);
            BinaryMap mask(w, h);
            if (est.colors.empty()) return mask;

            std::vector<float> L(total), A(total), B(total);
            Internal::ImageToLab(image, L.data(), A.data(), B.data(), pool);
            const double limit = options.tolerance * 100.0;

            Platform::ParallelFor(pool, 0, static_cast<size_t>(h), [&](size_t y) {
                for (int32_t x = 0; x < w; ++x) {
                    size_t idx = y * static_cast<size_t>(w) + x;
                    Internal::Lab px(L[idx], A[idx], B[idx]);
                    for (const auto& ref : est.colors) {
                        if (Internal::DeltaE(px, ref) <= limit) {
                            mask.data[idx] = 255;
                            break;
                        }
                    }
                }
            });
            return mask;
        }
    }
}

BackgroundResult RemoveBackground(const VImage& image, const BackgroundOptions& options,
                                  Platform::ThreadPool* pool) {
    BackgroundResult result;
    result.image = image;
    if (image.Empty()) {
        result.diagnostic = "empty image";
        return result;
    }

    BinaryMap mask = DetectBackgroundMask(image, options, pool);
    const size_t total = mask.data.size();
    result.coverage = total > 0 ? static_cast<double>(mask.CountSet()) / total : 0.0;

    if (result.coverage >= options.maxCoverage) {
        result.coversImage = true;
        result.diagnostic = "background covers entire image";
        Platform::Log::Warning("background removal skipped: coverage {:.3f} >= {:.3f}",
                               result.coverage, options.maxCoverage);
        return result;
    }

    const double strength = std::clamp(options.strength, 0.0, 1.0);
    VImage out = image.Clone();
    const int32_t w = image.Width();
    const int32_t h = image.Height();

    Platform::ParallelFor(pool, 0, static_cast<size_t>(h), [&](size_t yy) {
        int32_t y = static_cast<int32_t>(yy);
        for (int32_t x = 0; x < w; ++x) {
            if (!mask.At(x, y)) continue;
            Color c = Internal::CompositeOverWhite(image.PixelColor(x, y));
            auto blend = [strength](uint8_t v) {
                return static_cast<uint8_t>(std::lround(v + (255.0 - v) * strength));
            };
            out.SetPixelColor(x, y, Color(blend(c.r), blend(c.g), blend(c.b), 255));
        }
    });

    Platform::Log::Debug("background removed: coverage {:.3f}, strength {:.2f}",
                         result.coverage, strength);
    result.image = std::move(out);
    result.mask = std::move(mask);
    result.applied = true;
    return result;
}

} // namespace Vx::Trace::Preprocess
