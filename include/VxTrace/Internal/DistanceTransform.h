#pragma once

/**
 * @file DistanceTransform.h
 * @brief Exact Euclidean distance transform (Meijster et al.)
 *
 * Every foreground pixel receives its Euclidean distance to the nearest
 * background pixel; background pixels get 0. Runs in linear time.
 *
 * Reference: Meijster, Roerdink, Hesselink, "A General Algorithm for
 * Computing Distance Transforms in Linear Time" (2000).
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Platform/Thread.h>

#include <vector>

namespace Vx::Trace::Internal {

/**
 * @brief EDT of a binary map (non-zero = foreground)
 *
 * Pixels beyond the image border count as background, so foreground
 * touching the border gets distance 1 there.
 */
std::vector<float> DistanceTransformL2(const BinaryMap& binary,
                                       Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
