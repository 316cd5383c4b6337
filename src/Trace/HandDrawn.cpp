/**
 * @file HandDrawn.cpp
 * @brief Stroke weight, tremor, taper and overlay passes
 */

#include <VxTrace/Trace/HandDrawn.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Random.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace Vx::Trace {

namespace {

/// Points at which a stroke counts as fully confident
constexpr double CONFIDENT_POINT_COUNT = 20.0;
constexpr double OVERLAY_TREMOR_FACTOR = 0.7;
constexpr double OVERLAY_OFFSET_PX = 0.8;

double TremorScale(const HandDrawnConfig& config, int32_t width, int32_t height) {
    if (!config.adaptiveScaling) return 1.0;
    const double area = static_cast<double>(width) * height;
    return area > 0.0 ? std::sqrt(area / TREMOR_REFERENCE_AREA) : 1.0;
}

void ApplyVariableWeight(StrokePrimitive& stroke, const HandDrawnConfig& config,
                         Platform::Random& rng) {
    const double confidence = std::clamp(
        static_cast<double>(stroke.path.Size()) / CONFIDENT_POINT_COUNT, 0.0, 1.0);
    const double variation = 1.0 + config.variableWeights * (rng.Double() - 0.5) * 2.0;
    stroke.width *= config.baseWidthMultiplier * (0.7 + 0.6 * confidence) * variation;
    stroke.width = std::clamp(stroke.width, HAND_DRAWN_MIN_WIDTH, HAND_DRAWN_MAX_WIDTH);
}

Point2d Jitter(double amplitude, Platform::Random& rng) {
    return Point2d(amplitude * (rng.Double() - 0.5) * 2.0,
                   amplitude * (rng.Double() - 0.5) * 2.0);
}

/**
 * Moves every polyline point. Fitted curves move their anchors, and each
 * handle follows its anchor so segments stay joined.
 */
void ApplyTremor(StrokePrimitive& stroke, double amplitude, Platform::Random& rng) {
    if (amplitude <= 0.0) return;
    for (auto& p : stroke.path.Points()) {
        p = p + Jitter(amplitude, rng);
    }
    if (stroke.curves.empty()) return;

    Point2d anchorShift = Jitter(amplitude, rng);
    for (auto& segment : stroke.curves) {
        segment.p0 = segment.p0 + anchorShift;
        segment.p1 = segment.p1 + anchorShift;
        anchorShift = Jitter(amplitude, rng);
        segment.p2 = segment.p2 + anchorShift;
        segment.p3 = segment.p3 + anchorShift;
    }
}

void ApplyTaper(StrokePrimitive& stroke, const HandDrawnConfig& config, Platform::Random& rng) {
    if (stroke.path.Length() < TAPER_MIN_LENGTH) return;
    const double variation = 1.0 + (rng.Double() - 0.5) * 0.2;
    stroke.width *= (1.0 - 0.4 * config.tapering) * variation;
    stroke.width = std::max(stroke.width, HAND_DRAWN_MIN_WIDTH);
}

void ApplyPressure(StrokePrimitive& stroke, const HandDrawnConfig& config,
                   Platform::Random& rng) {
    stroke.width *= 1.0 + config.pressureVariation * 0.4 * (rng.Double() - 0.5);
    stroke.width = std::clamp(stroke.width, 0.2, 10.0);
}

void Translate(StrokePrimitive& stroke, const Point2d& offset) {
    stroke.path.Translate(offset.x, offset.y);
    for (auto& segment : stroke.curves) {
        segment.p0 = segment.p0 + offset;
        segment.p1 = segment.p1 + offset;
        segment.p2 = segment.p2 + offset;
        segment.p3 = segment.p3 + offset;
    }
}

} // anonymous namespace

int32_t HandDrawnPassCount(double multiPassIntensity) {
    return 1 + static_cast<int32_t>(std::floor(2.0 * std::clamp(multiPassIntensity, 0.0, 1.0)));
}

HandDrawnStats ApplyHandDrawn(std::vector<Primitive>& primitives, const HandDrawnConfig& config,
                              int32_t width, int32_t height) {
    HandDrawnStats stats;
    if (!config.Enabled() || primitives.empty()) return stats;

    Platform::Random rng(config.seed);
    const double tremor = config.tremorStrength * TREMOR_BASE_PX *
                          TremorScale(config, width, height);
    const int32_t passes = config.multiPassIntensity > 0.0
        ? HandDrawnPassCount(config.multiPassIntensity) : 1;

    std::vector<Primitive> out;
    out.reserve(primitives.size() * static_cast<size_t>(passes));

    for (auto& primitive : primitives) {
        auto* stroke = std::get_if<StrokePrimitive>(&primitive);
        if (stroke == nullptr || stroke->path.Size() < 2) {
            out.push_back(std::move(primitive));
            continue;
        }

        if (config.variableWeights > 0.0 || config.baseWidthMultiplier != 1.0) {
            ApplyVariableWeight(*stroke, config, rng);
        }
        ApplyTremor(*stroke, tremor, rng);
        if (config.tapering > 0.0) ApplyTaper(*stroke, config, rng);
        if (config.pressureVariation > 0.0) ApplyPressure(*stroke, config, rng);
        ++stats.strokes;

        StrokePrimitive source = *stroke;
        out.push_back(std::move(primitive));

        for (int32_t pass = 1; pass < passes; ++pass) {
            StrokePrimitive overlay = source;
            ApplyTremor(overlay, tremor * OVERLAY_TREMOR_FACTOR, rng);
            overlay.width = std::max(0.2, overlay.width * (0.7 - 0.1 * pass));
            const double reach = OVERLAY_OFFSET_PX * pass;
            Translate(overlay, Point2d(rng.Double(-reach, reach), rng.Double(-reach, reach)));
            out.emplace_back(std::move(overlay));
            ++stats.overlays;
        }
    }

    primitives = std::move(out);
    Platform::Log::Debug("hand-drawn: {} strokes, {} overlays", stats.strokes, stats.overlays);
    return stats;
}

} // namespace Vx::Trace
