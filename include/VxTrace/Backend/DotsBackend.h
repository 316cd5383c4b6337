#pragma once

/**
 * @file DotsBackend.h
 * @brief Stippling driven by gradient density
 */

#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Preprocess/Prepare.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Backend {

/// Side of the square tiles used for regional analysis
constexpr int32_t DOT_TILE_SIZE = 32;

/**
 * @brief Per-pixel dot density in [0, 1]
 *
 * Combines local gradient strength (Sobel magnitude and 3x3 intensity
 * deviation, weighted by the sizing mode) with the complexity of the
 * enclosing 32 px tile (mean gradient, gradient variance, intensity
 * variance).
 */
struct DensityMap {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<float> strength;        ///< Local gradient strength
    std::vector<float> density;         ///< Blend of strength and tile complexity
    std::vector<float> tileComplexity;  ///< One value per tile, row-major
    int32_t tilesX = 0;
    int32_t tilesY = 0;
};

DensityMap ComputeDensityMap(const std::vector<uint8_t>& gray, int32_t width, int32_t height,
                             const DotsConfig& config, Platform::ExecutionContext& ctx);

struct DotGeometry {
    std::vector<DotPrimitive> dots;     ///< Acceptance order
    double minSpacing = 0.0;            ///< Every pair of centres is at least this far apart
    size_t candidates = 0;
};

/**
 * @brief Jitter, size and opacity effects of a dot style
 *
 * maxOffset is the jitter range in pixels on each axis. When respectSpacing
 * is set a moved dot also keeps 1.2 * (r_i + r_j) from its neighbours.
 * Sizes are scaled by a clamped normal draw around 1, opacity is redrawn in
 * [minOpacity, minOpacity + variation * (maxOpacity - minOpacity)].
 */
struct DotStyleEffects {
    double maxOffset = 0.0;
    bool respectSpacing = true;
    double sizeVariation = 0.0;
    double minSizeFactor = 1.0;
    double maxSizeFactor = 1.0;
    double opacityVariation = 0.0;
    double minOpacity = 0.0;
    double maxOpacity = 1.0;

    static DotStyleEffects ForStyle(DotStyle style);
    bool Any() const { return maxOffset > 0.0 || sizeVariation > 0.0 || opacityVariation > 0.0; }
};

/**
 * @brief Apply style effects to placed dots
 *
 * Moves never leave the image, never land on background and never bring two
 * centres closer than geometry.minSpacing; a dot with no valid move after 20
 * draws stays where it was.
 */
void ApplyDotStyleEffects(DotGeometry& geometry, const DotStyleEffects& effects,
                          const Preprocess::PreparedImage& prepared, uint64_t seed);

/**
 * @brief Place dots on a jittered grid
 *
 * Candidates are visited in raster order of grid cells. A candidate is kept
 * when its density reaches the threshold, a seeded draw accepts it, it is
 * not background, and no accepted dot lies within the local spacing. The
 * local spacing shrinks with density but never drops below 2 * minRadius.
 * A non-Custom DotsConfig::style then applies its effects.
 */
DotGeometry PlaceDots(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                      double detail, Platform::ExecutionContext& ctx);

} // namespace Vx::Trace::Backend
