/**
 * @file Directional.cpp
 * @brief Directional strength analysis and pass scheduling
 */

#include <VxTrace/Trace/Directional.h>
#include <VxTrace/Core/Constants.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace Vx::Trace {

namespace {

constexpr float STRONG_GRADIENT = 20.0f;
constexpr int32_t SAMPLE_STEP = 4;
constexpr double LIGHTING_DIFFERENCE = 20.0;

double RegionBrightness(const std::vector<uint8_t>& gray, int32_t width, int32_t height,
                        int32_t x0, int32_t y0, int32_t w, int32_t h) {
    double sum = 0.0;
    size_t count = 0;
    for (int32_t y = std::max(0, y0); y < std::min(height, y0 + h); ++y) {
        for (int32_t x = std::max(0, x0); x < std::min(width, x0 + w); ++x) {
            sum += gray[static_cast<size_t>(y) * width + x];
            ++count;
        }
    }
    return count > 0 ? sum / static_cast<double>(count) : 0.0;
}

} // anonymous namespace

std::optional<Backend::PassDirection> DetectLightingDirection(const std::vector<uint8_t>& gray,
                                                              int32_t width, int32_t height) {
    const int32_t qw = width / 4;
    const int32_t qh = height / 4;
    if (qw == 0 || qh == 0) return std::nullopt;
    const int32_t midX = width / 2;
    const int32_t midY = height / 2;

    const double left = RegionBrightness(gray, width, height, 0, midY - qh, qw, 2 * qh);
    const double right = RegionBrightness(gray, width, height, width - qw, midY - qh, qw, 2 * qh);
    const double top = RegionBrightness(gray, width, height, midX - qw, 0, 2 * qw, qh);
    const double bottom = RegionBrightness(gray, width, height, midX - qw, height - qh, 2 * qw, qh);

    const double lr = std::abs(right - left);
    const double tb = std::abs(bottom - top);
    if (lr > LIGHTING_DIFFERENCE && lr > tb * 1.5) {
        return right > left ? Backend::PassDirection::Reverse : Backend::PassDirection::Standard;
    }
    if (tb > LIGHTING_DIFFERENCE && tb > lr * 1.5) {
        return bottom > top ? Backend::PassDirection::Reverse : Backend::PassDirection::Standard;
    }
    return std::nullopt;
}

bool HasArchitecturalElements(const std::vector<Primitive>& primitives) {
    int32_t straight = 0;
    for (const auto& p : primitives) {
        const auto* stroke = std::get_if<StrokePrimitive>(&p);
        if (stroke == nullptr || stroke->path.Size() < 4) continue;

        const double length = stroke->path.Length();
        const double chord = stroke->path.Front().DistanceTo(stroke->path.Back());
        if (length > 50.0 && chord / length > 0.8) ++straight;
    }
    return straight >= 3;
}

DirectionalAnalysis AnalyzeDirections(const std::vector<uint8_t>& gray, int32_t width,
                                      int32_t height, const std::vector<Primitive>& existing) {
    DirectionalAnalysis analysis;

    auto at = [&](int32_t x, int32_t y) {
        return static_cast<float>(gray[static_cast<size_t>(y) * width + x]);
    };
    for (int32_t y = 2; y < height - 2; y += SAMPLE_STEP) {
        for (int32_t x = 2; x < width - 2; x += SAMPLE_STEP) {
            const float gx = -at(x - 1, y - 1) + at(x + 1, y - 1)
                             - 2.0f * at(x - 1, y) + 2.0f * at(x + 1, y)
                             - at(x - 1, y + 1) + at(x + 1, y + 1);
            const float gy = -at(x - 1, y - 1) - 2.0f * at(x, y - 1) - at(x + 1, y - 1)
                             + at(x - 1, y + 1) + 2.0f * at(x, y + 1) + at(x + 1, y + 1);
            if (std::sqrt(gx * gx + gy * gy) <= STRONG_GRADIENT) continue;

            double angle = std::atan2(gy, gx);
            if (angle < 0.0) angle += TWO_PI;
            const size_t bin = std::min<size_t>(7, static_cast<size_t>(angle / (PI / 4.0)));
            ++analysis.orientationHistogram[bin];
            ++analysis.strongGradients;
        }
    }

    const auto& hist = analysis.orientationHistogram;
    if (analysis.strongGradients > 0) {
        const double total = static_cast<double>(analysis.strongGradients);
        const double diagonal = hist[1] + hist[3] + hist[5] + hist[7];
        analysis.hasDiagonalContent = diagonal / total > 0.25;

        const double mean = total / 8.0;
        double variance = 0.0;
        for (uint32_t count : hist) variance += (count - mean) * (count - mean);
        variance /= 8.0;
        analysis.textureDirectionality = std::min(1.0, std::sqrt(variance) / mean);
    }

    analysis.hasArchitecturalElements = HasArchitecturalElements(existing);
    analysis.lighting = DetectLightingDirection(gray, width, height);

    auto& b = analysis.benefits;
    b[0] = 1.0;
    b[1] = analysis.lighting ? 0.8 : 0.4;
    b[2] = analysis.hasDiagonalContent ? 0.9 : 0.3;
    b[3] = b[2];
    if (analysis.hasArchitecturalElements) {
        b[2] *= 1.2;
        b[3] *= 1.2;
    }
    if (analysis.textureDirectionality > 0.6) {
        for (size_t i = 1; i < b.size(); ++i) b[i] *= 0.7;
    }

    Platform::Log::Debug("directional: diagonal={} architectural={} directionality={:.2f} "
                         "benefits=[{:.2f}, {:.2f}, {:.2f}, {:.2f}]",
                         analysis.hasDiagonalContent, analysis.hasArchitecturalElements,
                         analysis.textureDirectionality, b[0], b[1], b[2], b[3]);
    return analysis;
}

std::vector<Backend::PassDirection> ScheduleDirectionalPasses(const DirectionalAnalysis& analysis,
                                                              const TraceConfig& config,
                                                              double remainingMs) {
    using Backend::PassDirection;
    std::vector<std::pair<PassDirection, double>> candidates;
    const double threshold = config.directionalStrengthThreshold;

    auto consider = [&](PassDirection direction) {
        const double benefit = analysis.Benefit(direction);
        if (benefit >= threshold) {
            Platform::Log::Info("{} pass scheduled (benefit {:.2f} >= {:.2f})",
                                Backend::PassDirectionName(direction), benefit, threshold);
            candidates.emplace_back(direction, benefit);
        } else {
            Platform::Log::Info("{} pass skipped (benefit {:.2f} < {:.2f})",
                                Backend::PassDirectionName(direction), benefit, threshold);
        }
    };
    if (config.reversePass) consider(PassDirection::Reverse);
    if (config.diagonalPass) {
        consider(PassDirection::DiagonalNW);
        consider(PassDirection::DiagonalNE);
    }

    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    size_t maxPasses = 3;
    if (std::isfinite(remainingMs)) {
        const double perPass = std::max(50.0, remainingMs / 4.0);
        maxPasses = std::min<size_t>(3, static_cast<size_t>(std::max(0.0, remainingMs) / perPass));
    }

    std::vector<PassDirection> scheduled;
    for (size_t i = 0; i < candidates.size() && i < maxPasses; ++i) {
        scheduled.push_back(candidates[i].first);
    }
    return scheduled;
}

} // namespace Vx::Trace
