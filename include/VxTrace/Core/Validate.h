#pragma once

/**
 * @file Validate.h
 * @brief Validation helpers for VxTrace entry points
 *
 * Design principles:
 * - Malformed input and bad configuration throw InvalidArgumentException
 * - Messages carry the calling function and the offending value
 * - Values are formatted compactly (no long float tails)
 */

#include <VxTrace/Core/Exception.h>
#include <VxTrace/Core/VImage.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Vx::Trace::Validate {

// =============================================================================
// Internal Formatting
// =============================================================================

namespace Detail {

inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) {
    return std::to_string(val);
}

inline std::string FormatValue(int64_t val) {
    return std::to_string(val);
}

inline std::string FormatValue(size_t val) {
    return std::to_string(val);
}

} // namespace Detail

// =============================================================================
// Image Validation
// =============================================================================

/**
 * @brief Require a non-empty image with a supported layout
 * @throws InvalidArgumentException if image is empty
 */
inline void RequireImageValid(const VImage& image, const char* funcName) {
    if (image.Empty()) {
        throw InvalidArgumentException(std::string(funcName) + ": image is empty");
    }
    if (image.Width() <= 0 || image.Height() <= 0) {
        throw InvalidArgumentException(std::string(funcName) + ": image dimensions " +
                                       Detail::FormatValue(image.Width()) + "x" +
                                       Detail::FormatValue(image.Height()) +
                                       " must be positive");
    }
}

/**
 * @brief Require raw raster dimensions and buffer size to agree
 */
inline void RequireBufferSize(size_t length, int32_t width, int32_t height,
                              int channels, const char* funcName) {
    if (width <= 0 || height <= 0) {
        throw InvalidArgumentException(std::string(funcName) + ": dimensions " +
                                       Detail::FormatValue(width) + "x" +
                                       Detail::FormatValue(height) + " must be positive");
    }
    size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) *
                      static_cast<size_t>(channels);
    if (length != expected) {
        throw InvalidArgumentException(std::string(funcName) + ": buffer length " +
                                       Detail::FormatValue(length) + " != expected " +
                                       Detail::FormatValue(expected));
    }
}

// =============================================================================
// Parameter Validation
// =============================================================================

/**
 * @brief Require value > 0 (and finite)
 */
inline void RequirePositive(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw InvalidArgumentException(std::string(funcName) + ": " + paramName +
                                       " must be > 0, got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Require value >= 0 (and finite)
 */
inline void RequireNonNegative(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value) || value < 0.0) {
        throw InvalidArgumentException(std::string(funcName) + ": " + paramName +
                                       " must be >= 0, got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Require value in [minVal, maxVal]
 */
inline void RequireRange(double value, double minVal, double maxVal,
                         const char* paramName, const char* funcName) {
    if (!std::isfinite(value) || value < minVal || value > maxVal) {
        throw InvalidArgumentException(std::string(funcName) + ": " + paramName +
                                       " must be in [" + Detail::FormatValue(minVal) + ", " +
                                       Detail::FormatValue(maxVal) + "], got " +
                                       Detail::FormatValue(value));
    }
}

/**
 * @brief Require integer value in [minVal, maxVal]
 */
inline void RequireRange(int64_t value, int64_t minVal, int64_t maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(std::string(funcName) + ": " + paramName +
                                       " must be in [" + Detail::FormatValue(minVal) + ", " +
                                       Detail::FormatValue(maxVal) + "], got " +
                                       Detail::FormatValue(value));
    }
}

} // namespace Vx::Trace::Validate
