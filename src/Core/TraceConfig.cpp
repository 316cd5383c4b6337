/**
 * @file TraceConfig.cpp
 * @brief Option names, presets and validation
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Core/Validate.h>

#include <algorithm>
#include <cctype>

namespace Vx::Trace {

const char* BackendKindName(BackendKind kind) {
    switch (kind) {
        case BackendKind::Edge:       return "edge";
        case BackendKind::Centerline: return "centerline";
        case BackendKind::Superpixel: return "superpixel";
        case BackendKind::Dots:       return "dots";
    }
    return "unknown";
}

BackendKind ParseBackendKind(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "edge") return BackendKind::Edge;
    if (lower == "centerline") return BackendKind::Centerline;
    if (lower == "superpixel") return BackendKind::Superpixel;
    if (lower == "dots") return BackendKind::Dots;
    throw InvalidArgumentException("unknown backend '" + name + "'");
}

const char* BackgroundAlgorithmName(BackgroundAlgorithm algorithm) {
    switch (algorithm) {
        case BackgroundAlgorithm::Otsu:     return "otsu";
        case BackgroundAlgorithm::Adaptive: return "adaptive";
        case BackgroundAlgorithm::Auto:     return "auto";
    }
    return "unknown";
}

const char* DotStyleName(DotStyle style) {
    switch (style) {
        case DotStyle::Custom:           return "custom";
        case DotStyle::FineStippling:    return "fine-stippling";
        case DotStyle::BoldPointillism:  return "bold-pointillism";
        case DotStyle::Sketch:           return "sketch";
        case DotStyle::TechnicalDrawing: return "technical-drawing";
        case DotStyle::Watercolor:       return "watercolor";
    }
    return "unknown";
}

const char* HandDrawnPresetName(HandDrawnPreset preset) {
    switch (preset) {
        case HandDrawnPreset::None:    return "none";
        case HandDrawnPreset::Subtle:  return "subtle";
        case HandDrawnPreset::Medium:  return "medium";
        case HandDrawnPreset::Strong:  return "strong";
        case HandDrawnPreset::Sketchy: return "sketchy";
    }
    return "unknown";
}

void ApplyDotStyle(DotsConfig& dots, DotStyle style) {
    dots.style = style;
    switch (style) {
        case DotStyle::Custom:
            return;
        case DotStyle::FineStippling:
            dots.minRadius = 0.3;
            dots.maxRadius = 1.0;
            dots.densityThreshold = 0.05;
            dots.adaptiveSizing = true;
            break;
        case DotStyle::BoldPointillism:
            dots.minRadius = 1.5;
            dots.maxRadius = 4.0;
            dots.densityThreshold = 0.15;
            dots.adaptiveSizing = true;
            break;
        case DotStyle::Sketch:
            dots.minRadius = 0.8;
            dots.maxRadius = 2.5;
            dots.densityThreshold = 0.1;
            dots.adaptiveSizing = true;
            break;
        case DotStyle::TechnicalDrawing:
            dots.minRadius = 0.5;
            dots.maxRadius = 1.5;
            dots.densityThreshold = 0.2;
            dots.adaptiveSizing = false;
            break;
        case DotStyle::Watercolor:
            dots.minRadius = 2.0;
            dots.maxRadius = 6.0;
            dots.densityThreshold = 0.08;
            dots.adaptiveSizing = true;
            break;
    }
    // The style effects replace the generic randomisation
    dots.jitter = false;
    dots.sizeVariation = 0.0;
}

HandDrawnConfig HandDrawnConfig::FromPreset(HandDrawnPreset preset) {
    HandDrawnConfig cfg;
    switch (preset) {
        case HandDrawnPreset::None:
            break;
        case HandDrawnPreset::Subtle:
            cfg.variableWeights = 0.15;
            cfg.tremorStrength = 0.05;
            cfg.tapering = 0.1;
            cfg.pressureVariation = 0.2;
            cfg.multiPassIntensity = 0.1;
            break;
        case HandDrawnPreset::Medium:
            cfg.variableWeights = 0.3;
            cfg.tremorStrength = 0.1;
            cfg.tapering = 0.2;
            cfg.pressureVariation = 0.4;
            cfg.multiPassIntensity = 0.3;
            break;
        case HandDrawnPreset::Strong:
            cfg.variableWeights = 0.5;
            cfg.tremorStrength = 0.2;
            cfg.tapering = 0.4;
            cfg.pressureVariation = 0.6;
            cfg.multiPassIntensity = 0.5;
            cfg.baseWidthMultiplier = 1.1;
            break;
        case HandDrawnPreset::Sketchy:
            cfg.variableWeights = 0.6;
            cfg.tremorStrength = 0.3;
            cfg.tapering = 0.3;
            cfg.pressureVariation = 0.7;
            cfg.multiPassIntensity = 0.8;
            cfg.baseWidthMultiplier = 1.2;
            break;
    }
    return cfg;
}

bool HandDrawnConfig::Enabled() const {
    return variableWeights > 0.0 || tremorStrength > 0.0 || tapering > 0.0 ||
           pressureVariation > 0.0 || multiPassIntensity > 0.0 || baseWidthMultiplier != 1.0;
}

void TraceConfig::Validate() const {
    static const char* FN = "TraceConfig";
    using Validate::RequirePositive;
    using Validate::RequireNonNegative;
    using Validate::RequireRange;

    RequireRange(detail, 0.0, 1.0, "detail", FN);

    // Multipass
    RequireRange(static_cast<int64_t>(multipass.passCount), 1, 10, "multipass.passCount", FN);
    if (multipass.conservativeDetail) {
        RequireRange(*multipass.conservativeDetail, 0.0, 1.0, "multipass.conservativeDetail", FN);
    }
    if (multipass.aggressiveDetail) {
        RequireRange(*multipass.aggressiveDetail, 0.0, 1.0, "multipass.aggressiveDetail", FN);
    }
    RequirePositive(multipass.mergeTolerance, "multipass.mergeTolerance", FN);
    RequireRange(multipass.supportFraction, 0.0, 1.0, "multipass.supportFraction", FN);
    RequireRange(directionalStrengthThreshold, 0.0, 1.0, "directionalStrengthThreshold", FN);

    // Background
    RequireRange(background.strength, 0.0, 1.0, "background.strength", FN);
    RequireRange(background.tolerance, 0.0, 1.0, "background.tolerance", FN);
    RequireRange(background.maxCoverage, 0.01, 1.0, "background.maxCoverage", FN);
    RequireRange(background.sampleRatio, 0.01, 0.5, "background.sampleRatio", FN);

    // Paths
    RequireNonNegative(simplification.epsilon, "simplification.epsilon", FN);
    RequirePositive(curveFitting.maxError, "curveFitting.maxError", FN);
    RequireRange(curveFitting.splitAngleDeg, 1.0, 180.0, "curveFitting.splitAngleDeg", FN);

    RequireNonNegative(maxProcessingTimeMs, "maxProcessingTimeMs", FN);
    RequireRange(strokePxAt1080p, 0.05, 50.0, "strokePxAt1080p", FN);
    RequirePositive(noiseSpatialSigma, "noiseSpatialSigma", FN);
    RequirePositive(noiseRangeSigma, "noiseRangeSigma", FN);

    // Edge
    RequireRange(static_cast<int64_t>(edge.etfRadius), 1, 16, "edge.etfRadius", FN);
    RequireRange(static_cast<int64_t>(edge.etfIterations), 1, 10, "edge.etfIterations", FN);
    RequireRange(edge.etfCoherencyTau, 0.0, 1.0, "edge.etfCoherencyTau", FN);
    RequirePositive(edge.fdogSigmaS, "edge.fdogSigmaS", FN);
    RequirePositive(edge.fdogSigmaC, "edge.fdogSigmaC", FN);
    RequirePositive(edge.fdogSigmaM, "edge.fdogSigmaM", FN);
    if (edge.fdogSigmaC <= edge.fdogSigmaS) {
        throw InvalidArgumentException(std::string(FN) +
                                       ": edge.fdogSigmaC must exceed edge.fdogSigmaS");
    }
    RequireRange(edge.fdogRho, 0.0, 1.0, "edge.fdogRho", FN);
    RequireRange(edge.nmsLow, 0.0, 1.0, "edge.nmsLow", FN);
    RequireRange(edge.nmsHigh, 0.0, 1.0, "edge.nmsHigh", FN);
    if (edge.nmsLow > edge.nmsHigh) {
        throw InvalidArgumentException(std::string(FN) +
                                       ": edge.nmsLow must not exceed edge.nmsHigh");
    }
    RequireRange(edge.traceMinGradient, 0.0, 1.0, "edge.traceMinGradient", FN);
    RequireRange(edge.traceMinCoherency, 0.0, 1.0, "edge.traceMinCoherency", FN);
    RequireRange(static_cast<int64_t>(edge.traceMaxGap), 0, 64, "edge.traceMaxGap", FN);
    RequireRange(static_cast<int64_t>(edge.traceMaxLength), 1, 1000000, "edge.traceMaxLength", FN);
    RequireRange(edge.traceStep, 0.1, 2.0, "edge.traceStep", FN);
    RequireRange(edge.traceMaxAngleDeg, 1.0, 180.0, "edge.traceMaxAngleDeg", FN);

    // Centerline
    RequireRange(static_cast<int64_t>(centerline.windowSize), 3, 255, "centerline.windowSize", FN);
    if (centerline.windowSize % 2 == 0) {
        throw InvalidArgumentException(std::string(FN) + ": centerline.windowSize must be odd, got " +
                                       std::to_string(centerline.windowSize));
    }
    RequireRange(centerline.sauvolaK, 0.0, 1.0, "centerline.sauvolaK", FN);
    RequireNonNegative(centerline.minBranchLength, "centerline.minBranchLength", FN);
    RequireNonNegative(centerline.maxGap, "centerline.maxGap", FN);

    // Superpixel
    RequireRange(static_cast<int64_t>(superpixel.numSuperpixels), 1, 10000,
                 "superpixel.numSuperpixels", FN);
    RequireRange(superpixel.compactness, 0.1, 100.0, "superpixel.compactness", FN);
    RequireRange(static_cast<int64_t>(superpixel.iterations), 1, 50, "superpixel.iterations", FN);
    RequireNonNegative(superpixel.boundaryEpsilon, "superpixel.boundaryEpsilon", FN);

    // Dots
    RequireRange(dots.densityThreshold, 0.0, 1.0, "dots.densityThreshold", FN);
    RequirePositive(dots.minRadius, "dots.minRadius", FN);
    RequirePositive(dots.maxRadius, "dots.maxRadius", FN);
    if (dots.maxRadius < dots.minRadius) {
        throw InvalidArgumentException(std::string(FN) +
                                       ": dots.maxRadius must be >= dots.minRadius");
    }
    RequireRange(dots.sizeVariation, 0.0, 1.0, "dots.sizeVariation", FN);
    RequireRange(dots.jitterAmount, 0.0, 1.0, "dots.jitterAmount", FN);

    // Colour
    RequireRange(static_cast<int64_t>(color.maxColorsPerPath), 1, 10, "color.maxColorsPerPath", FN);
    RequireRange(color.colorTolerance, 0.0, 1.0, "color.colorTolerance", FN);
    RequireRange(static_cast<int64_t>(color.paletteSize), 2, 256, "color.paletteSize", FN);

    // Hand-drawn
    RequireRange(handDrawn.variableWeights, 0.0, 1.0, "handDrawn.variableWeights", FN);
    RequireRange(handDrawn.tremorStrength, 0.0, 1.0, "handDrawn.tremorStrength", FN);
    RequireRange(handDrawn.tapering, 0.0, 1.0, "handDrawn.tapering", FN);
    RequireRange(handDrawn.pressureVariation, 0.0, 1.0, "handDrawn.pressureVariation", FN);
    RequireRange(handDrawn.multiPassIntensity, 0.0, 1.0, "handDrawn.multiPassIntensity", FN);
    RequireRange(handDrawn.baseWidthMultiplier, 0.1, 5.0, "handDrawn.baseWidthMultiplier", FN);

    RequireRange(static_cast<int64_t>(maxImageSize), 16, 16384, "maxImageSize", FN);
}

TraceConfig TraceConfig::ForBackend(BackendKind kind) {
    TraceConfig cfg;
    cfg.backend = kind;
    switch (kind) {
        case BackendKind::Edge:
            break;
        case BackendKind::Centerline:
            cfg.centerline.strategy = SkeletonStrategy::HighQuality;
            break;
        case BackendKind::Superpixel:
            cfg.superpixel.pattern = SeedPattern::Poisson;
            break;
        case BackendKind::Dots:
            cfg.background.enabled = true;
            break;
    }
    return cfg;
}

TraceConfig TraceConfig::WithDetail(double newDetail) const {
    TraceConfig copy(*this);
    copy.detail = std::clamp(newDetail, 0.0, 1.0);
    return copy;
}

} // namespace Vx::Trace
