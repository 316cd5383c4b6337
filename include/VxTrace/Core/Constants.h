#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants and small math helpers
 */

#include <cmath>
#include <cstddef>
#include <cstdint>

namespace Vx::Trace {

// =============================================================================
// Math Constants
// =============================================================================

constexpr double PI = 3.14159265358979323846;
constexpr double TWO_PI = 2.0 * PI;
constexpr double HALF_PI = 0.5 * PI;
constexpr double DEG_TO_RAD = PI / 180.0;
constexpr double RAD_TO_DEG = 180.0 / PI;

/// Generic floating point tolerance
constexpr double EPSILON = 1e-9;

/// Row and buffer alignment (bytes)
constexpr size_t MEMORY_ALIGNMENT = 64;

/// Reference diagonal used to scale stroke widths (1920x1080)
constexpr double REFERENCE_DIAGONAL_1080P = 2202.9071700822983;

// =============================================================================
// Helpers
// =============================================================================

inline bool ApproxEqual(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

template<typename T>
constexpr T Clamp(T value, T lo, T hi) {
    return value < lo ? lo : (value > hi ? hi : value);
}

/// Normalize angle to (-PI, PI]
inline double NormalizeAngle(double angle) {
    angle = std::fmod(angle, TWO_PI);
    if (angle > PI) angle -= TWO_PI;
    if (angle <= -PI) angle += TWO_PI;
    return angle;
}

/// Fold an orientation into [0, PI) (undirected)
inline double FoldOrientation(double angle) {
    angle = std::fmod(angle, PI);
    if (angle < 0) angle += PI;
    if (angle >= PI) angle = 0.0;
    return angle;
}

} // namespace Vx::Trace
