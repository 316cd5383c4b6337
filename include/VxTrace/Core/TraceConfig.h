#pragma once

/**
 * @file TraceConfig.h
 * @brief Vectorization configuration
 *
 * TraceConfig is a plain value: construct, tweak fields, call Validate()
 * (Vectorize does it too). Passes derive modified copies; the caller's
 * instance is never changed.
 *
 * @code
 * TraceConfig cfg = TraceConfig::ForBackend(BackendKind::Centerline);
 * cfg.detail = 0.7;
 * cfg.multipass.enabled = true;
 * cfg.multipass.passCount = 2;
 * cfg.Validate();
 * @endcode
 */

#include <VxTrace/Core/Export.h>

#include <cstdint>
#include <optional>
#include <string>

namespace Vx::Trace {

// =============================================================================
// Enumerations
// =============================================================================

enum class BackendKind {
    Edge,           ///< Edge flow tracing (Canny or ETF/FDoG)
    Centerline,     ///< Skeleton of inked strokes
    Superpixel,     ///< SLIC regions
    Dots            ///< Stippling
};

enum class BackgroundAlgorithm {
    Otsu,           ///< Global Otsu split, side chosen by the border
    Adaptive,       ///< Local box threshold
    Auto            ///< Lab distance to border colours
};

enum class SimplifyMethod {
    Rdp,            ///< Ramer-Douglas-Peucker
    Visvalingam     ///< Effective-area elimination
};

enum class SkeletonStrategy {
    HighPerformance,    ///< Distance-ordered thinning on the exact EDT
    HighQuality         ///< Guo-Hall thinning
};

enum class SeedPattern {
    Square,
    Hexagonal,
    Poisson
};

enum class BinarizeMethod {
    Otsu,
    Sauvola
};

/// Artistic dot presets, Custom leaves DotsConfig as set by the caller
enum class DotStyle {
    Custom,
    FineStippling,
    BoldPointillism,
    Sketch,
    TechnicalDrawing,
    Watercolor
};

/// Hand-drawn post-pass strength for strokes
enum class HandDrawnPreset {
    None,
    Subtle,
    Medium,
    Strong,
    Sketchy
};

VXTRACE_API const char* BackendKindName(BackendKind kind);

/**
 * @brief Parse "edge", "centerline", "superpixel" or "dots" (case-insensitive)
 * @throws InvalidArgumentException on unknown names
 */
VXTRACE_API BackendKind ParseBackendKind(const std::string& name);

VXTRACE_API const char* BackgroundAlgorithmName(BackgroundAlgorithm algorithm);
VXTRACE_API const char* DotStyleName(DotStyle style);
VXTRACE_API const char* HandDrawnPresetName(HandDrawnPreset preset);

// =============================================================================
// Sections
// =============================================================================

struct MultipassConfig {
    bool enabled = false;
    int32_t passCount = 1;                       ///< 1-10
    std::optional<double> conservativeDetail;    ///< Default detail * 0.7
    std::optional<double> aggressiveDetail;      ///< Default detail * 1.3
    double mergeTolerance = 2.0;                 ///< Pixels
    double supportFraction = 0.5;                ///< Share of points near conservative geometry
};

struct BackgroundConfig {
    bool enabled = false;
    BackgroundAlgorithm algorithm = BackgroundAlgorithm::Auto;
    double strength = 0.5;          ///< Blend toward white, 1 = pure white
    double tolerance = 0.1;         ///< Lab distance / 100
    double maxCoverage = 0.98;      ///< Above this, removal is abandoned
    double sampleRatio = 0.1;       ///< Border band width relative to each side
};

struct SimplificationConfig {
    SimplifyMethod method = SimplifyMethod::Rdp;
    double epsilon = 0.0;           ///< Pixels, 0 = derived from detail
};

struct CurveFittingConfig {
    bool enabled = false;
    double maxError = 2.0;          ///< Pixels
    double splitAngleDeg = 32.0;    ///< Corners sharper than this are kept
};

struct EdgeConfig {
    bool etfFdog = false;           ///< ETF/FDoG instead of Canny
    int32_t etfRadius = 4;
    int32_t etfIterations = 4;
    double etfCoherencyTau = 0.2;
    double fdogSigmaS = 0.8;        ///< Center Gaussian across the flow
    double fdogSigmaC = 1.6;        ///< Surround Gaussian across the flow
    double fdogSigmaM = 3.0;        ///< Integration along the flow
    double fdogRho = 0.99;          ///< Surround weight
    double nmsLow = 0.04;           ///< Hysteresis floors in FDoG response units
    double nmsHigh = 0.08;

    /// Step along the flow field instead of linking edge pixels (ETF/FDoG only)
    bool flowTracing = false;
    double traceMinGradient = 0.08;     ///< Seed gradient, Sobel of the edge map / 4
    double traceMinCoherency = 0.15;
    int32_t traceMaxGap = 4;            ///< Steps bridged without edge support
    int32_t traceMaxLength = 10000;     ///< Steps per direction
    double traceStep = 0.5;             ///< Pixels
    double traceMaxAngleDeg = 30.0;     ///< Turn allowed between consecutive steps
};

struct CenterlineConfig {
    SkeletonStrategy strategy = SkeletonStrategy::HighQuality;
    BinarizeMethod binarize = BinarizeMethod::Sauvola;
    int32_t windowSize = 31;        ///< Sauvola window (odd)
    double sauvolaK = 0.4;
    double minBranchLength = 0.0;   ///< Pixels, 0 = 12 + 36 * detail
    bool bridgeGaps = true;
    double maxGap = 4.0;            ///< Pixels
};

struct SuperpixelConfig {
    int32_t numSuperpixels = 150;
    double compactness = 10.0;
    int32_t iterations = 10;
    SeedPattern pattern = SeedPattern::Poisson;
    bool fillRegions = true;
    bool strokeRegions = false;
    bool simplifyBoundaries = true;
    double boundaryEpsilon = 1.0;
    bool preserveColors = true;
};

struct DotsConfig {
    double densityThreshold = 0.1;
    double minRadius = 0.5;
    double maxRadius = 3.0;
    bool preserveColors = true;
    bool adaptiveSizing = true;
    bool gradientBasedSizing = false;
    double sizeVariation = 0.0;     ///< Random radius spread, 0-1
    bool jitter = false;
    double jitterAmount = 0.25;     ///< Fraction of local spacing
    DotStyle style = DotStyle::Custom;  ///< Set through ApplyDotStyle
};

/**
 * @brief Load a dot style preset
 *
 * Overwrites radii, density threshold and sizing mode with the preset's
 * values and records the style so the backend applies its jitter, size and
 * opacity effects after placement. Custom only records the style.
 */
VXTRACE_API void ApplyDotStyle(DotsConfig& dots, DotStyle style);

/**
 * @brief Seeded stroke perturbation applied after path building
 *
 * All strengths are 0-1. Zero strengths leave strokes untouched.
 */
struct VXTRACE_API HandDrawnConfig {
    double variableWeights = 0.0;   ///< Width spread driven by stroke confidence
    double tremorStrength = 0.0;    ///< Positional jitter, 5 px at 1 for 800x600
    double tapering = 0.0;          ///< Width reduction on strokes of 10 px or more
    double pressureVariation = 0.0; ///< Extra random width factor
    double multiPassIntensity = 0.0;///< Sketchy overlay strokes, 1 + 2 * intensity passes
    double baseWidthMultiplier = 1.0;
    bool adaptiveScaling = true;    ///< Scale tremor with image area
    uint64_t seed = 42;

    static HandDrawnConfig FromPreset(HandDrawnPreset preset);
    bool Enabled() const;
};

struct ColorConfig {
    bool preserveLineColors = false;
    int32_t maxColorsPerPath = 3;
    double colorTolerance = 0.15;   ///< Lab distance / 100
    bool paletteReduction = false;
    int32_t paletteSize = 16;
};

// =============================================================================
// TraceConfig
// =============================================================================

struct VXTRACE_API TraceConfig {
    BackendKind backend = BackendKind::Edge;
    double detail = 0.5;                        ///< 0 sparse, 1 detailed

    MultipassConfig multipass;
    bool reversePass = false;
    bool diagonalPass = false;
    double directionalStrengthThreshold = 0.3;

    BackgroundConfig background;
    SimplificationConfig simplification;
    CurveFittingConfig curveFitting;

    double maxProcessingTimeMs = 300000.0;      ///< 0 = unlimited
    double strokePxAt1080p = 1.2;

    bool noiseFiltering = false;
    double noiseSpatialSigma = 1.2;
    double noiseRangeSigma = 50.0;

    EdgeConfig edge;
    CenterlineConfig centerline;
    SuperpixelConfig superpixel;
    DotsConfig dots;
    ColorConfig color;
    HandDrawnConfig handDrawn;

    int32_t maxImageSize = 4096;
    uint64_t randomSeed = 42;

    /**
     * @brief Check every field
     * @throws InvalidArgumentException naming the first offending field
     */
    void Validate() const;

    /// Defaults for a backend
    static TraceConfig ForBackend(BackendKind kind);

    /// Copy with another detail level (clamped to [0, 1])
    TraceConfig WithDetail(double newDetail) const;
};

} // namespace Vx::Trace
