#pragma once

/**
 * @file Background.h
 * @brief Background detection and removal
 *
 * Three policies:
 * - Otsu: global threshold on luminance; background is the side the border
 *   pixels fall on
 * - Adaptive: local Sauvola threshold (window 31, k 0.2), same side rule
 * - Auto: border colours estimated in Lab; pixels within tolerance of a
 *   representative colour are background
 *
 * When the detected background covers (nearly) the whole image, removal
 * falls back to leaving the image untouched.
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Internal/ColorConvert.h>
#include <VxTrace/Platform/Thread.h>

#include <cstddef>
#include <string>
#include <vector>

namespace Vx::Trace::Preprocess {

/// Upper bound on representative border colours
constexpr size_t MAX_BACKGROUND_COLORS = 32;

struct BackgroundOptions {
    BackgroundAlgorithm algorithm = BackgroundAlgorithm::Auto;
    double tolerance = 0.1;
    double strength = 0.5;
    double maxCoverage = 0.98;
    double sampleRatio = 0.1;

    static BackgroundOptions FromConfig(const BackgroundConfig& config);
};

/**
 * @brief Representative border colours, most frequent first
 */
struct BackgroundEstimate {
    std::vector<Internal::Lab> colors;
    std::vector<double> weights;        ///< Share of samples per colour
    double borderLuminance = 255.0;     ///< Mean border luminance
    size_t samples = 0;
};

/**
 * @brief Sample the border band and cluster its colours
 *
 * The band is sampleRatio of each side wide (at least one pixel). Samples
 * are quantized in Lab; each occupied bin contributes its mean colour.
 */
BackgroundEstimate EstimateBackground(const VImage& image, double sampleRatio);

/**
 * @brief Per-pixel background mask (255 = background)
 */
BinaryMap DetectBackgroundMask(const VImage& image, const BackgroundOptions& options,
                               Platform::ThreadPool* pool = nullptr);

struct BackgroundResult {
    VImage image;                   ///< New buffer, or the input when not applied
    BinaryMap mask;                 ///< Empty when not applied
    double coverage = 0.0;          ///< Background share of the detected mask
    bool applied = false;
    bool coversImage = false;       ///< Coverage reached maxCoverage; nothing was removed
    std::string diagnostic;
};

/**
 * @brief Blend background pixels toward white by strength
 */
BackgroundResult RemoveBackground(const VImage& image, const BackgroundOptions& options,
                                  Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Preprocess
