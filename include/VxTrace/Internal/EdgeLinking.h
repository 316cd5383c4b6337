#pragma once

/**
 * @file EdgeLinking.h
 * @brief Link thin edge pixels into ordered chains
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct EdgeLinkParams {
    int32_t closeDistance = 2;      ///< Chebyshev distance end-to-start that closes a chain
    int32_t minClosedPixels = 8;    ///< Chains shorter than this stay open
    bool reverseScan = false;       ///< Scan seeds bottom-right to top-left
};

/**
 * @brief Link edge pixels into polylines
 *
 * Chains start at end points (one neighbour) first, then at any remaining
 * pixel, in which case the chain is grown in both directions. Steps prefer
 * 4-neighbours over diagonals. Every pixel is consumed once, so the
 * linking terminates on any input.
 */
std::vector<VPath> LinkEdgePixels(const BinaryMap& edges,
                                  const EdgeLinkParams& params = EdgeLinkParams());

} // namespace Vx::Trace::Internal
