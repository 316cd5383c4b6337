#pragma once

/**
 * @file Prepare.h
 * @brief Shared per-call preparation: downscale, background, luminance
 *
 * PrepareImage runs once per Vectorize call; every pass reads the same
 * PreparedImage.
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Platform/ExecutionContext.h>

#include <cstdint>
#include <string>
#include <vector>

namespace Vx::Trace::Preprocess {

struct DownscaleResult {
    VImage image;
    double scale = 1.0;     ///< Source pixels per working pixel (>= 1)
};

/**
 * @brief Box downsample so that neither side exceeds maxSize
 *
 * Returns the input (shallow) when it already fits.
 */
DownscaleResult DownscaleToFit(const VImage& image, int32_t maxSize);

struct PreparedImage {
    VImage source;                      ///< Downscaled input, for colour sampling
    VImage color;                       ///< Working image (downscaled, background removed)
    std::vector<uint8_t> gray;          ///< Luminance composited over white
    BinaryMap backgroundMask;           ///< Empty unless removal was applied
    int32_t width = 0;
    int32_t height = 0;
    double scale = 1.0;                 ///< Multiply working coordinates by this
    bool backgroundApplied = false;
    bool backgroundCoversImage = false; ///< Removal fell back because all of it was background
    double backgroundCoverage = 0.0;
    std::vector<std::string> diagnostics;

    bool IsBackground(int32_t x, int32_t y) const {
        return !backgroundMask.Empty() && backgroundMask.At(x, y);
    }
};

/**
 * @brief Downscale, remove background (if enabled) and extract luminance
 * @throws InvalidArgumentException on an empty image
 */
PreparedImage PrepareImage(const VImage& image, const TraceConfig& config,
                           Platform::ExecutionContext& ctx);

} // namespace Vx::Trace::Preprocess
