#pragma once

/**
 * @file PathBuilder.h
 * @brief Backend geometry to vector primitives
 *
 * Per path: duplicate cleanup -> simplification (RDP or Visvalingam) ->
 * length pruning -> optional Bezier fitting. Superpixel rings become
 * even-odd fills and/or strokes; dots pass through.
 */

#include <VxTrace/Backend/Backend.h>
#include <VxTrace/Core/Constants.h>
#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace Vx::Trace {

constexpr double MIN_STROKE_WIDTH = 0.5;
constexpr double MAX_STROKE_WIDTH = 10.0;

/**
 * @brief Stroke width scaled by image diagonal relative to 1080p, clamped to [0.5, 10]
 */
double ComputeStrokeWidth(int32_t width, int32_t height, double strokePxAt1080p);

struct PathBuildResult {
    std::vector<Primitive> primitives;
    int32_t skipped = 0;                ///< Features that could not be turned into primitives
    int32_t pruned = 0;                 ///< Paths below the minimum length
};

class PathBuilder {
public:
    /**
     * @param width, height Working image size
     * @param detail Pass detail (drives the default simplification tolerance)
     */
    PathBuilder(const TraceConfig& config, int32_t width, int32_t height, double detail);

    PathBuildResult Build(const Backend::BackendGeometry& geometry) const;

    /// Cleanup, simplify, prune and fit a single polyline
    std::optional<StrokePrimitive> BuildStroke(const VPath& path, double minLength) const;

    /// Even-odd fill of a region; nullopt when the outer ring degenerates
    std::optional<FillPrimitive> BuildFill(const Backend::SuperpixelRegion& region) const;

    double Epsilon() const { return epsilon_; }
    double StrokeWidth() const { return strokeWidth_; }

private:
    VPath Prepare(const VPath& path, double epsilon) const;
    std::vector<CubicBezier> Fit(const VPath& path) const;

    const TraceConfig& config_;
    double epsilon_;
    double strokeWidth_;
};

} // namespace Vx::Trace
