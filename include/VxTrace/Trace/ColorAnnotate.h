#pragma once

/**
 * @file ColorAnnotate.h
 * @brief Stroke colours sampled from the source and palette reduction
 */

#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/VImage.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace {

/// Distance between colour samples along a stroke
constexpr double COLOR_SAMPLE_SPACING = 2.0;

struct ColorCluster {
    Color color;                        ///< Mean of the members
    size_t members = 0;
    double meanOffset = 0.0;            ///< Mean arc-length fraction of the members
};

/**
 * @brief Leader clustering of the colours found along a path
 *
 * A sample joins the first cluster whose leader is within
 * tolerance * 100 Delta E, otherwise it starts a new cluster.
 * Returned largest first (ties keep discovery order).
 */
std::vector<ColorCluster> ClusterPathColors(const VPath& path, const VImage& image,
                                            double tolerance);

/**
 * @brief Give every stroke its dominant colour and up to maxColorsPerPath stops
 *
 * Fills keep their region colour and dots their sampled colour.
 * @return Number of strokes that received gradient stops
 */
size_t AnnotateColors(std::vector<Primitive>& primitives, const VImage& image,
                      const ColorConfig& config);

/**
 * @brief k-means in Lab over every colour in the primitives
 *
 * Initialization is deterministic: the most frequent colour first, then
 * repeatedly the colour farthest from the chosen centres. Every colour is
 * replaced by its nearest centre.
 * @return The palette actually used (at most paletteSize entries)
 */
std::vector<Color> ReducePalette(std::vector<Primitive>& primitives, int32_t paletteSize);

} // namespace Vx::Trace
