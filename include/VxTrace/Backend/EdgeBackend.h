#pragma once

/**
 * @file EdgeBackend.h
 * @brief Edge chains from Canny or ETF/FDoG responses
 *
 * Pipeline: optional bilateral denoise -> Canny (sigma = 1 + detail) or
 * ETF/FDoG on the unblurred luminance -> thinning -> chain linking ->
 * length pruning.
 *
 * Directional passes re-run the detector with a different blur, threshold
 * scale and scan order:
 * - Reverse: blur 1.2 + 0.8 * detail, thresholds x0.85, seeds scanned from
 *   the bottom-right corner
 * - DiagonalNW / DiagonalNE: gradient projected on 45 / 135 degrees, blur
 *   0.8 + 1.2 * detail, thresholds x1.15, only diagonal chains kept
 * All directional passes prune at 1.2x the usual minimum stroke length.
 * With ETF/FDoG enabled the directional passes select the strongest of
 * three rotated FDoG responses instead, with the same threshold scales and,
 * for diagonal passes, a 22.5 degree tolerance on the edge normal.
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Preprocess/Prepare.h>

#include <cstddef>
#include <vector>

namespace Vx::Trace::Backend {

enum class PassDirection {
    Standard,
    Reverse,
    DiagonalNW,
    DiagonalNE
};

const char* PassDirectionName(PassDirection direction);

struct EdgeGeometry {
    std::vector<VPath> chains;          ///< Pixel-centre polylines, pruned by length
    size_t edgePixels = 0;              ///< Edge pixels after thinning
    double minLength = 0.0;             ///< Pruning length that was applied
    PassDirection direction = PassDirection::Standard;
};

/**
 * @brief Standard edge pass
 *
 * With edge.etfFdog and edge.flowTracing set, chains come from
 * Internal::TraceFlowPolylines over the thinned FDoG edges instead of pixel
 * linking.
 */
EdgeGeometry ExtractEdges(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                          double detail, Platform::ExecutionContext& ctx);

/**
 * @brief Direction-biased edge pass (Standard falls back to ExtractEdges)
 */
EdgeGeometry DirectionalEdges(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                              double detail, PassDirection direction,
                              Platform::ExecutionContext& ctx);

/**
 * @brief True when the chord of the chain leans at least 40% diagonal
 */
bool IsDiagonalOriented(const VPath& path);

} // namespace Vx::Trace::Backend
