#pragma once

/**
 * @file SuperpixelBackend.h
 * @brief SLIC regions traced into closed rings
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Internal/Slic.h>
#include <VxTrace/Platform/ExecutionContext.h>
#include <VxTrace/Preprocess/Prepare.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Backend {

struct SuperpixelRegion {
    int32_t label = -1;
    std::vector<VPath> rings;           ///< Outer ring first, then holes (closed)
    Color color;                        ///< Mean colour over white
    int32_t area = 0;
};

struct SuperpixelGeometry {
    std::vector<SuperpixelRegion> regions;  ///< In label order
    int32_t regionCount = 0;                ///< Labels after connectivity and merging
    int32_t mergedRegions = 0;              ///< Labels absorbed by similar neighbours
    int32_t skippedBoundaries = 0;          ///< Abandoned boundary traces
};

/**
 * @brief Merge 4-adjacent regions whose mean colours differ by less than threshold
 *
 * Pairs are visited from the most similar; means are updated as sets grow.
 * Labels are compacted in raster order afterwards.
 * @return Number of labels removed
 */
int32_t MergeSimilarRegions(Internal::SlicResult& slic, double deltaEThreshold);

/**
 * @brief SLIC, similar-region merge and boundary tracing
 *
 * Regions mostly covered by the background mask are dropped. When background
 * removal fell back because the whole image is background and only one
 * region remains, no regions are returned.
 */
SuperpixelGeometry ExtractRegions(const Preprocess::PreparedImage& prepared,
                                  const TraceConfig& config, double detail,
                                  Platform::ExecutionContext& ctx);

} // namespace Vx::Trace::Backend
