/**
 * @file DotsBackend.cpp
 * @brief Density map, dot placement and style effects
 */

#include <VxTrace/Backend/DotsBackend.h>
#include <VxTrace/Internal/ColorConvert.h>
#include <VxTrace/Internal/Gradient.h>
#include <VxTrace/Internal/SpatialGrid.h>
#include <VxTrace/Internal/Threshold.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Platform/Random.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Backend {

namespace {

/// Largest Sobel magnitude on 8-bit input
constexpr float MAX_SOBEL = 362.0f;
constexpr float VARIANCE_NORM = 1.0f / 10000.0f;

float LocalStrength(float magnitude, float deviation, const DotsConfig& config) {
    const float m = std::min(magnitude, MAX_SOBEL) / MAX_SOBEL;
    const float v = std::min(deviation, 255.0f) / 255.0f;
    if (config.gradientBasedSizing) {
        return std::min(1.0f, std::pow(0.6f * m + 0.4f * v, 0.8f));
    }
    if (config.adaptiveSizing) {
        return 0.7f * m + 0.3f * v;
    }
    return m;
}

constexpr int32_t MAX_JITTER_ATTEMPTS = 20;
constexpr double STYLE_SPACING_BUFFER = 1.2;

} // anonymous namespace

DotStyleEffects DotStyleEffects::ForStyle(DotStyle style) {
    DotStyleEffects e;
    switch (style) {
        case DotStyle::Custom:
        case DotStyle::TechnicalDrawing:
            break;
        case DotStyle::FineStippling:
            e.sizeVariation = 0.1;
            e.minSizeFactor = 0.9;
            e.maxSizeFactor = 1.1;
            e.opacityVariation = 0.1;
            e.minOpacity = 0.8;
            e.maxOpacity = 1.0;
            break;
        case DotStyle::BoldPointillism:
            e.maxOffset = 0.8;
            e.respectSpacing = true;
            e.sizeVariation = 0.4;
            e.minSizeFactor = 0.6;
            e.maxSizeFactor = 1.6;
            e.opacityVariation = 0.4;
            e.minOpacity = 0.6;
            e.maxOpacity = 1.0;
            break;
        case DotStyle::Sketch:
            e.maxOffset = 1.5;
            e.respectSpacing = false;
            e.sizeVariation = 0.5;
            e.minSizeFactor = 0.5;
            e.maxSizeFactor = 1.8;
            e.opacityVariation = 0.6;
            e.minOpacity = 0.4;
            e.maxOpacity = 1.0;
            break;
        case DotStyle::Watercolor:
            e.maxOffset = 2.0;
            e.respectSpacing = false;
            e.sizeVariation = 0.4;
            e.minSizeFactor = 0.7;
            e.maxSizeFactor = 1.4;
            e.opacityVariation = 0.5;
            e.minOpacity = 0.3;
            e.maxOpacity = 0.7;
            break;
    }
    return e;
}

void ApplyDotStyleEffects(DotGeometry& geometry, const DotStyleEffects& effects,
                          const Preprocess::PreparedImage& prepared, uint64_t seed) {
    auto& dots = geometry.dots;
    if (dots.empty() || !effects.Any()) return;

    Platform::Random rng(seed);
    const int32_t w = prepared.width;
    const int32_t h = prepared.height;

    if (effects.maxOffset > 0.0) {
        double maxRadius = 0.0;
        for (const auto& d : dots) maxRadius = std::max(maxRadius, d.radius);
        const double reach = std::max(geometry.minSpacing,
            effects.respectSpacing ? 2.0 * STYLE_SPACING_BUFFER * maxRadius : 0.0);
        const Rect2d bounds(0.0, 0.0, w, h);

        // Unmoved dots are checked at their original centre, moved ones at the new one
        Internal::SpatialGrid original(bounds, std::max(1.0, reach));
        Internal::SpatialGrid moved(bounds, std::max(1.0, reach));
        for (size_t i = 0; i < dots.size(); ++i) {
            original.Insert(static_cast<int32_t>(i), dots[i].center);
        }

        for (size_t i = 0; i < dots.size(); ++i) {
            const int32_t self = static_cast<int32_t>(i);
            auto tooClose = [&](int32_t j, const Point2d& q, const Point2d& p) {
                const double limit = effects.respectSpacing
                    ? std::max(geometry.minSpacing,
                               STYLE_SPACING_BUFFER * (dots[i].radius + dots[j].radius))
                    : geometry.minSpacing;
                return (q - p).SquaredNorm() < limit * limit;
            };

            for (int32_t attempt = 0; attempt < MAX_JITTER_ATTEMPTS; ++attempt) {
                const Point2d p(dots[i].center.x + rng.Double(-effects.maxOffset, effects.maxOffset),
                                dots[i].center.y + rng.Double(-effects.maxOffset, effects.maxOffset));
                if (p.x < 0.0 || p.y < 0.0 || p.x >= w || p.y >= h) continue;
                if (prepared.IsBackground(static_cast<int32_t>(p.x), static_cast<int32_t>(p.y))) {
                    continue;
                }
                const bool blocked =
                    moved.AnyWithin(p, reach, [&](int32_t j, const Point2d& q) {
                        return tooClose(j, q, p);
                    }) ||
                    original.AnyWithin(p, reach, [&](int32_t j, const Point2d& q) {
                        return j > self && tooClose(j, q, p);
                    });
                if (blocked) continue;
                dots[i].center = p;
                break;
            }
            moved.Insert(self, dots[i].center);
        }
    }

    if (effects.sizeVariation > 0.0) {
        const double spread = effects.sizeVariation * 0.33;
        for (auto& d : dots) {
            d.radius *= std::clamp(rng.Gaussian(1.0, spread), effects.minSizeFactor,
                                   effects.maxSizeFactor);
        }
    }

    if (effects.opacityVariation > 0.0) {
        const double range = effects.maxOpacity - effects.minOpacity;
        for (auto& d : dots) {
            d.opacity = std::clamp(effects.minOpacity + range * rng.Double() * effects.opacityVariation,
                                   0.0, 1.0);
        }
    }
}

DensityMap ComputeDensityMap(const std::vector<uint8_t>& gray, int32_t width, int32_t height,
                             const DotsConfig& config, Platform::ExecutionContext& ctx) {
    DensityMap map;
    map.width = width;
    map.height = height;
    const size_t count = static_cast<size_t>(width) * height;
    if (count == 0) return map;

    auto plane = ctx.FloatPool().Acquire(count);
    auto gx = ctx.FloatPool().Acquire(count);
    auto gy = ctx.FloatPool().Acquire(count);
    auto mag = ctx.FloatPool().Acquire(count);
    auto mean = ctx.FloatPool().Acquire(count);
    auto deviation = ctx.FloatPool().Acquire(count);

    for (size_t i = 0; i < count; ++i) plane[i] = gray[i];
    Internal::SobelGradient(plane.Data(), gx.Data(), gy.Data(), width, height, ctx.Pool());
    Internal::GradientMagnitude(gx.Data(), gy.Data(), mag.Data(), count);
    Internal::LocalMeanStd(gray.data(), width, height, 3, mean.Data(), deviation.Data(), ctx.Pool());

    map.strength.resize(count);
    for (size_t i = 0; i < count; ++i) {
        map.strength[i] = LocalStrength(mag[i], deviation[i], config);
    }

    // Regional analysis over tiles
    map.tilesX = (width + DOT_TILE_SIZE - 1) / DOT_TILE_SIZE;
    map.tilesY = (height + DOT_TILE_SIZE - 1) / DOT_TILE_SIZE;
    map.tileComplexity.assign(static_cast<size_t>(map.tilesX) * map.tilesY, 0.0f);

    Platform::ParallelForAdaptive(ctx, "dots.tiles", 0, map.tileComplexity.size(), [&](size_t t) {
        const int32_t tx = static_cast<int32_t>(t % map.tilesX);
        const int32_t ty = static_cast<int32_t>(t / map.tilesX);
        const int32_t x0 = tx * DOT_TILE_SIZE;
        const int32_t y0 = ty * DOT_TILE_SIZE;
        const int32_t x1 = std::min(width, x0 + DOT_TILE_SIZE);
        const int32_t y1 = std::min(height, y0 + DOT_TILE_SIZE);

        double sum = 0.0, sumSq = 0.0, varSum = 0.0;
        for (int32_t y = y0; y < y1; ++y) {
            for (int32_t x = x0; x < x1; ++x) {
                const size_t i = static_cast<size_t>(y) * width + x;
                sum += mag[i];
                sumSq += static_cast<double>(mag[i]) * mag[i];
                varSum += static_cast<double>(deviation[i]) * deviation[i];
            }
        }
        const double n = static_cast<double>((x1 - x0) * (y1 - y0));
        const double avg = sum / n;
        const double gradVar = std::max(0.0, sumSq / n - avg * avg);

        const double g = std::min(1.0, avg / 255.0);
        const double v = std::min(1.0, varSum / n * VARIANCE_NORM);
        const double gv = std::min(1.0, gradVar * VARIANCE_NORM);
        map.tileComplexity[t] = static_cast<float>(std::min(1.0, 0.4 * g + 0.3 * v + 0.3 * gv));
    });

    map.density.resize(count);
    for (int32_t y = 0; y < height; ++y) {
        const int32_t ty = y / DOT_TILE_SIZE;
        for (int32_t x = 0; x < width; ++x) {
            const size_t i = static_cast<size_t>(y) * width + x;
            const float tile = map.tileComplexity[static_cast<size_t>(ty) * map.tilesX +
                                                  x / DOT_TILE_SIZE];
            map.density[i] = std::clamp(0.7f * map.strength[i] + 0.3f * tile, 0.0f, 1.0f);
        }
    }
    return map;
}

DotGeometry PlaceDots(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                      double detail, Platform::ExecutionContext& ctx) {
    const auto& dc = config.dots;
    const int32_t w = prepared.width;
    const int32_t h = prepared.height;

    DotGeometry geometry;
    geometry.minSpacing = 2.0 * dc.minRadius;

    DensityMap density;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "dots.density");
        density = ComputeDensityMap(prepared.gray, w, h, dc, ctx);
    }
    ctx.CheckDeadline("dots.density");

    Platform::ScopedProfile profile(&ctx.GetProfiler(), "dots.place");

    const double d = std::clamp(detail, 0.0, 1.0);
    const double minSpacing = geometry.minSpacing;
    // Sparse areas spread out further at low detail
    const double maxSpacing = std::max(minSpacing, dc.maxRadius * (4.0 - 2.0 * d));
    const double step = std::max(1.0, minSpacing);

    Platform::Random rng(config.randomSeed);
    Internal::SpatialGrid grid(Rect2d(0.0, 0.0, w, h), std::max(1.0, maxSpacing));

    auto scratch = ctx.DotPool().Acquire(0);
    std::vector<DotPrimitive>& dots = scratch.Get();

    const int32_t cols = std::max(1, static_cast<int32_t>(std::floor(w / step)));
    const int32_t rows = std::max(1, static_cast<int32_t>(std::floor(h / step)));

    for (int32_t row = 0; row < rows; ++row) {
        if ((row & 31) == 0) ctx.CheckDeadline("dots.place");
        for (int32_t col = 0; col < cols; ++col) {
            // Draws happen for every cell so the sequence does not depend on acceptance
            const double jx = rng.Double(-0.35, 0.35);
            const double jy = rng.Double(-0.35, 0.35);
            const double accept = rng.Double();
            const double extraX = rng.Double(-1.0, 1.0);
            const double extraY = rng.Double(-1.0, 1.0);
            const double sizeDraw = rng.Double(-1.0, 1.0);

            Point2d p((col + 0.5 + jx) * step, (row + 0.5 + jy) * step);
            ++geometry.candidates;

            int32_t px = std::clamp(static_cast<int32_t>(p.x), 0, w - 1);
            int32_t py = std::clamp(static_cast<int32_t>(p.y), 0, h - 1);
            const size_t idx = static_cast<size_t>(py) * w + px;
            const double rho = density.density[idx];
            if (rho < dc.densityThreshold) continue;
            if (accept > std::min(1.0, 0.5 + rho)) continue;

            const double spacing = maxSpacing - (maxSpacing - minSpacing) * rho;
            if (dc.jitter) {
                p.x += extraX * dc.jitterAmount * spacing;
                p.y += extraY * dc.jitterAmount * spacing;
                p.x = std::clamp(p.x, 0.0, static_cast<double>(w) - 1e-3);
                p.y = std::clamp(p.y, 0.0, static_cast<double>(h) - 1e-3);
                px = static_cast<int32_t>(p.x);
                py = static_cast<int32_t>(p.y);
            }
            if (prepared.IsBackground(px, py)) continue;

            if (grid.AnyWithin(p, spacing - 1e-9, [](int32_t, const Point2d&) { return true; })) {
                continue;
            }

            const double strength = density.strength[static_cast<size_t>(py) * w + px];
            double radius = dc.minRadius + std::sqrt(strength) * (dc.maxRadius - dc.minRadius);
            if (dc.sizeVariation > 0.0) {
                radius *= 1.0 + 0.5 * dc.sizeVariation * sizeDraw;
            }
            radius = std::clamp(radius, dc.minRadius, dc.maxRadius);

            DotPrimitive dot;
            dot.center = p;
            dot.radius = radius;
            dot.opacity = 0.3 + 0.7 * rho;
            dot.color = dc.preserveColors
                ? Internal::CompositeOverWhite(prepared.color.PixelColor(px, py))
                : Color(0, 0, 0);

            grid.Insert(static_cast<int32_t>(dots.size()), p);
            dots.push_back(dot);
        }
    }

    geometry.dots.assign(dots.begin(), dots.end());
    if (dc.style != DotStyle::Custom) {
        ApplyDotStyleEffects(geometry, DotStyleEffects::ForStyle(dc.style), prepared,
                             config.randomSeed + 1);
    }
    Platform::Log::Debug("dots: {} of {} candidates placed, spacing {:.2f}..{:.2f}",
                         geometry.dots.size(), geometry.candidates, minSpacing, maxSpacing);
    return geometry;
}

} // namespace Vx::Trace::Backend
