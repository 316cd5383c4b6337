#pragma once

/**
 * @file Morphology.h
 * @brief 3x3 binary morphology on BinaryMap
 */

#include <VxTrace/Core/Types.h>

namespace Vx::Trace::Internal {

/// 3x3 erosion (outside the image counts as background)
BinaryMap Erode3x3(const BinaryMap& src);

/// 3x3 dilation
BinaryMap Dilate3x3(const BinaryMap& src);

/// Erode then dilate: removes isolated specks
BinaryMap Open3x3(const BinaryMap& src);

/// Dilate then erode: fills pinholes and one-pixel gaps
BinaryMap Close3x3(const BinaryMap& src);

/**
 * @brief Remove 8-connected foreground components smaller than minArea
 * @return Number of removed components
 */
int32_t RemoveSmallComponents(BinaryMap& map, int32_t minArea);

} // namespace Vx::Trace::Internal
