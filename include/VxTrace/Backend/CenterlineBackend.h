#pragma once

/**
 * @file CenterlineBackend.h
 * @brief Centerlines of inked strokes via skeletonization
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Preprocess/Prepare.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace::Backend {

struct CenterlineGeometry {
    std::vector<VPath> paths;           ///< Skeleton branches after pruning and bridging
    size_t inkPixels = 0;
    size_t skeletonPixels = 0;
    int32_t prunedBranches = 0;
    double minLength = 0.0;             ///< Minimum branch length that was applied
};

/**
 * @brief Binarize, clean, skeletonize and vectorize the ink
 *
 * Ink is dark: Sauvola (window from config, k 0.4 by default) or Otsu.
 * A 3x3 open then close removes specks and pinholes. HighPerformance thins
 * in EDT order, HighQuality runs Guo-Hall; both end 1 px wide. The skeleton
 * graph is pruned of spurs shorter than the minimum branch length
 * (config value, or 12 + 36 * detail), degree-2 nodes are collapsed and
 * aligned endpoints within maxGap are bridged.
 */
CenterlineGeometry ExtractCenterlines(const Preprocess::PreparedImage& prepared,
                                      const TraceConfig& config, double detail,
                                      Platform::ExecutionContext& ctx);

} // namespace Vx::Trace::Backend
