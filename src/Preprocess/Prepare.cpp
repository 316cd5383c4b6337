/**
 * @file Prepare.cpp
 * @brief Resize, luminance and background mask for a run
 */

#include <VxTrace/Preprocess/Prepare.h>
#include <VxTrace/Preprocess/Background.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Preprocess {

DownscaleResult DownscaleToFit(const VImage& image, int32_t maxSize) {
    DownscaleResult result;
    result.image = image;
    if (image.Empty() || maxSize <= 0) return result;

    const int32_t srcW = image.Width();
    const int32_t srcH = image.Height();
    const int32_t longest = std::max(srcW, srcH);
    if (longest <= maxSize) return result;

    const double scale = static_cast<double>(longest) / maxSize;
    const int32_t dstW = std::max(1, static_cast<int32_t>(std::floor(srcW / scale)));
    const int32_t dstH = std::max(1, static_cast<int32_t>(std::floor(srcH / scale)));

    VImage out(dstW, dstH, image.GetChannelType());
    for (int32_t y = 0; y < dstH; ++y) {
        const int32_t y0 = static_cast<int32_t>(std::floor(y * scale));
        const int32_t y1 = std::clamp(static_cast<int32_t>(std::floor((y + 1) * scale)), y0 + 1, srcH);
        for (int32_t x = 0; x < dstW; ++x) {
            const int32_t x0 = static_cast<int32_t>(std::floor(x * scale));
            const int32_t x1 = std::clamp(static_cast<int32_t>(std::floor((x + 1) * scale)), x0 + 1, srcW);

            double r = 0, g = 0, b = 0, a = 0;
            for (int32_t sy = y0; sy < y1; ++sy) {
                for (int32_t sx = x0; sx < x1; ++sx) {
                    Color c = image.PixelColor(sx, sy);
                    r += c.r; g += c.g; b += c.b; a += c.a;
                }
            }
            const double n = static_cast<double>((x1 - x0) * (y1 - y0));
            out.SetPixelColor(x, y, Color(static_cast<uint8_t>(std::lround(r / n)),
                                          static_cast<uint8_t>(std::lround(g / n)),
                                          static_cast<uint8_t>(std::lround(b / n)),
                                          static_cast<uint8_t>(std::lround(a / n))));
        }
    }

    result.image = std::move(out);
    result.scale = scale;
    Platform::Log::Info("downscaled {}x{} to {}x{}", srcW, srcH, dstW, dstH);
    return result;
}

PreparedImage PrepareImage(const VImage& image, const TraceConfig& config,
                           Platform::ExecutionContext& ctx) {
    if (image.Empty()) {
        throw InvalidArgumentException("PrepareImage: empty image");
    }
    Platform::ScopedProfile profile(&ctx.GetProfiler(), "prepare");

    PreparedImage prepared;
    DownscaleResult down = DownscaleToFit(image, config.maxImageSize);
    prepared.source = down.image;
    prepared.color = down.image;
    prepared.scale = down.scale;
    prepared.width = down.image.Width();
    prepared.height = down.image.Height();

    if (config.background.enabled) {
        BackgroundOptions opts = BackgroundOptions::FromConfig(config.background);
        BackgroundResult bg = RemoveBackground(prepared.color, opts, ctx.Pool());
        prepared.backgroundCoverage = bg.coverage;
        prepared.backgroundApplied = bg.applied;
        prepared.backgroundCoversImage = bg.coversImage;
        if (bg.applied) {
            prepared.color = bg.image;
            prepared.backgroundMask = std::move(bg.mask);
        }
        if (!bg.diagnostic.empty()) prepared.diagnostics.push_back(bg.diagnostic);
    }

    prepared.gray = prepared.color.Luminance();
    ctx.CheckDeadline("prepare");
    return prepared;
}

} // namespace Vx::Trace::Preprocess
