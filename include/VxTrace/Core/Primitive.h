#pragma once

/**
 * @file Primitive.h
 * @brief Vector primitives and the trace result
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Core/Export.h>

#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace Vx::Trace {

enum class PrimitiveKind {
    Stroke,
    Fill,
    Dot
};

VXTRACE_API const char* PrimitiveKindName(PrimitiveKind kind);

/**
 * @brief Colour stop along a stroke (offset in [0, 1] of arc length)
 */
struct GradientStop {
    double offset = 0.0;
    Color color;
};

/**
 * @brief Stroked polyline, optionally carrying fitted curves
 */
struct VXTRACE_API StrokePrimitive {
    VPath path;
    double width = 1.0;
    std::optional<Color> color;
    std::vector<CubicBezier> curves;      ///< Empty when curve fitting is off
    std::vector<GradientStop> gradient;   ///< Empty unless several colours were found
};

/**
 * @brief Filled region made of one or more closed rings
 */
struct VXTRACE_API FillPrimitive {
    std::vector<VPath> rings;             ///< Outer ring first, then holes
    bool evenOdd = true;
    std::optional<Color> color;
    std::vector<std::vector<CubicBezier>> curves;  ///< Per ring, empty when not fitted
};

/**
 * @brief Stipple dot
 */
struct VXTRACE_API DotPrimitive {
    Point2d center;
    double radius = 1.0;
    Color color;
    double opacity = 1.0;
};

using Primitive = std::variant<StrokePrimitive, FillPrimitive, DotPrimitive>;

VXTRACE_API PrimitiveKind KindOf(const Primitive& primitive);

/// Bounding box (dots include their radius)
VXTRACE_API Rect2d BoundsOf(const Primitive& primitive);

/// Path length, outer ring perimeter for fills, diameter for dots
VXTRACE_API double LengthOf(const Primitive& primitive);

/// Scale all geometry about the origin (dot radii and stroke widths too)
VXTRACE_API void ScalePrimitive(Primitive& primitive, double scale);

/**
 * @brief Output of Vectorize
 */
struct VXTRACE_API TraceResult {
    std::vector<Primitive> primitives;
    bool truncated = false;               ///< Time or memory budget cut the run short
    int skippedFeatures = 0;              ///< Features or passes that could not be resolved
    std::vector<std::string> diagnostics;
    int passesCompleted = 0;
    double elapsedMs = 0.0;

    size_t Count(PrimitiveKind kind) const;
};

} // namespace Vx::Trace
