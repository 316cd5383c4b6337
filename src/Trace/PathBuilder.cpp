/**
 * @file PathBuilder.cpp
 * @brief Backend geometry to simplified, fitted primitives
 */

#include <VxTrace/Trace/PathBuilder.h>
#include <VxTrace/Internal/BezierFit.h>
#include <VxTrace/Internal/ContourProcess.h>
#include <VxTrace/Preprocess/ThresholdMapping.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace Vx::Trace {

double ComputeStrokeWidth(int32_t width, int32_t height, double strokePxAt1080p) {
    const double w = std::max(0, width);
    const double h = std::max(0, height);
    const double diag = std::sqrt(w * w + h * h);
    const double scaled = strokePxAt1080p * diag / REFERENCE_DIAGONAL_1080P;
    return std::clamp(scaled, MIN_STROKE_WIDTH, MAX_STROKE_WIDTH);
}

PathBuilder::PathBuilder(const TraceConfig& config, int32_t width, int32_t height, double detail)
    : config_(config)
    , strokeWidth_(ComputeStrokeWidth(width, height, config.strokePxAt1080p)) {
    if (config.simplification.epsilon > 0.0) {
        epsilon_ = config.simplification.epsilon;
    } else {
        epsilon_ = Preprocess::ThresholdMapping::FromDetail(detail, width, height).dpEpsilonPx;
    }
}

VPath PathBuilder::Prepare(const VPath& path, double epsilon) const {
    VPath cleaned = Internal::RemoveDuplicatePoints(path);
    if (epsilon <= 0.0 || cleaned.Size() < 3) return cleaned;
    return Internal::Simplify(cleaned, config_.simplification.method, epsilon);
}

std::vector<CubicBezier> PathBuilder::Fit(const VPath& path) const {
    if (!config_.curveFitting.enabled || path.Size() < 2) return {};
    return Internal::FitBeziers(path, config_.curveFitting.maxError,
                                config_.curveFitting.splitAngleDeg);
}

std::optional<StrokePrimitive> PathBuilder::BuildStroke(const VPath& path, double minLength) const {
    VPath simplified = Prepare(path, epsilon_);
    if (simplified.Size() < 2) return std::nullopt;
    if (simplified.Length() < minLength) return std::nullopt;

    StrokePrimitive stroke;
    stroke.width = strokeWidth_;
    stroke.curves = Fit(simplified);
    stroke.path = std::move(simplified);
    return stroke;
}

std::optional<FillPrimitive> PathBuilder::BuildFill(const Backend::SuperpixelRegion& region) const {
    const auto& sp = config_.superpixel;
    const double eps = sp.simplifyBoundaries ? sp.boundaryEpsilon : 0.0;

    FillPrimitive fill;
    fill.evenOdd = true;
    if (sp.preserveColors) fill.color = region.color;

    for (size_t i = 0; i < region.rings.size(); ++i) {
        VPath ring = Prepare(region.rings[i], eps);
        ring.SetClosed(true);
        if (ring.Size() < 3 || ring.Area() <= 0.0) {
            if (i == 0) return std::nullopt;
            continue;
        }
        if (config_.curveFitting.enabled) fill.curves.push_back(Fit(ring));
        fill.rings.push_back(std::move(ring));
    }
    return fill;
}

PathBuildResult PathBuilder::Build(const Backend::BackendGeometry& geometry) const {
    PathBuildResult result;

    auto addStrokes = [&](const std::vector<VPath>& paths, double minLength) {
        for (const auto& path : paths) {
            auto stroke = BuildStroke(path, minLength);
            if (stroke) {
                result.primitives.emplace_back(std::move(*stroke));
            } else {
                ++result.pruned;
            }
        }
    };

    std::visit([&](const auto& g) {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, Backend::EdgeGeometry>) {
            addStrokes(g.chains, g.minLength);
        } else if constexpr (std::is_same_v<T, Backend::CenterlineGeometry>) {
            addStrokes(g.paths, g.minLength);
        } else if constexpr (std::is_same_v<T, Backend::SuperpixelGeometry>) {
            result.skipped += g.skippedBoundaries;
            const auto& sp = config_.superpixel;
            for (const auto& region : g.regions) {
                if (sp.fillRegions) {
                    auto fill = BuildFill(region);
                    if (fill) {
                        result.primitives.emplace_back(std::move(*fill));
                    } else {
                        ++result.skipped;
                    }
                }
                if (sp.strokeRegions) {
                    const double eps = sp.simplifyBoundaries ? sp.boundaryEpsilon : 0.0;
                    for (const auto& ring : region.rings) {
                        VPath simplified = Prepare(ring, eps);
                        if (simplified.Size() < 2) continue;
                        StrokePrimitive stroke;
                        stroke.width = strokeWidth_;
                        if (sp.preserveColors) stroke.color = region.color;
                        stroke.curves = Fit(simplified);
                        stroke.path = std::move(simplified);
                        result.primitives.emplace_back(std::move(stroke));
                    }
                }
            }
        } else {
            result.primitives.reserve(g.dots.size());
            for (const auto& dot : g.dots) result.primitives.emplace_back(dot);
        }
    }, geometry);

    return result;
}

} // namespace Vx::Trace
