#pragma once

/**
 * @file Types.h
 * @brief Core type definitions for VxTrace
 */

#include <VxTrace/Core/Export.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

namespace Vx::Trace {

// =============================================================================
// Pixel Types
// =============================================================================

/**
 * @brief Image channel layouts (all samples are 8-bit)
 */
enum class ChannelType {
    Gray,       ///< Single channel luminance
    RGB,        ///< 3 channels RGB
    RGBA        ///< 4 channels RGBA
};

inline int ChannelCount(ChannelType type) {
    switch (type) {
        case ChannelType::Gray: return 1;
        case ChannelType::RGB:  return 3;
        case ChannelType::RGBA: return 4;
    }
    return 1;
}

// =============================================================================
// 2D Point Types
// =============================================================================

/**
 * @brief 2D point with integer coordinates
 */
struct VXTRACE_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2i& other) const { return !(*this == other); }
};

/**
 * @brief 2D point with sub-pixel precision
 */
struct VXTRACE_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}
    explicit Point2d(const Point2i& p) : x(p.x), y(p.y) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    Point2d operator+(const Point2d& other) const { return {x + other.x, y + other.y}; }
    Point2d operator-(const Point2d& other) const { return {x - other.x, y - other.y}; }
    Point2d operator*(double s) const { return {x * s, y * s}; }
    Point2d operator/(double s) const { return {x / s, y / s}; }
    Point2d operator-() const { return {-x, -y}; }

    bool operator==(const Point2d& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2d& other) const { return !(*this == other); }

    /// Euclidean norm
    double Norm() const { return std::sqrt(x * x + y * y); }

    /// Squared norm
    double SquaredNorm() const { return x * x + y * y; }

    /// Dot product
    double Dot(const Point2d& other) const { return x * other.x + y * other.y; }

    /// Cross product (2D: returns scalar)
    double Cross(const Point2d& other) const { return x * other.y - y * other.x; }

    /// Distance to another point
    double DistanceTo(const Point2d& other) const { return (*this - other).Norm(); }

    /// Unit vector (zero vector stays zero)
    Point2d Normalized() const {
        double n = Norm();
        return n > 1e-12 ? Point2d(x / n, y / n) : Point2d();
    }
};

// =============================================================================
// Rectangle Types
// =============================================================================

/**
 * @brief Axis-aligned rectangle with integer coordinates
 */
struct VXTRACE_API Rect2i {
    int32_t x = 0;      ///< Left
    int32_t y = 0;      ///< Top
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w, int32_t h)
        : x(x_), y(y_), width(w), height(h) {}

    int32_t Right() const { return x + width; }
    int32_t Bottom() const { return y + height; }
    int64_t Area() const { return static_cast<int64_t>(width) * height; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < Right() && py >= y && py < Bottom();
    }
};

/**
 * @brief Axis-aligned rectangle with double precision
 *
 * Stored as min/max corners; an empty box has minX > maxX.
 */
struct VXTRACE_API Rect2d {
    double minX = 0.0;
    double minY = 0.0;
    double maxX = -1.0;
    double maxY = -1.0;

    Rect2d() = default;
    Rect2d(double x0, double y0, double x1, double y1)
        : minX(x0), minY(y0), maxX(x1), maxY(y1) {}

    static Rect2d Empty() { return {}; }

    bool IsEmpty() const { return minX > maxX || minY > maxY; }
    double Width() const { return IsEmpty() ? 0.0 : maxX - minX; }
    double Height() const { return IsEmpty() ? 0.0 : maxY - minY; }
    Point2d Center() const { return {(minX + maxX) * 0.5, (minY + maxY) * 0.5}; }

    void Extend(const Point2d& p) {
        if (IsEmpty()) {
            minX = maxX = p.x;
            minY = maxY = p.y;
            return;
        }
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    Rect2d Expanded(double margin) const {
        if (IsEmpty()) return *this;
        return {minX - margin, minY - margin, maxX + margin, maxY + margin};
    }

    bool Contains(const Point2d& p) const {
        return p.x >= minX && p.x <= maxX && p.y >= minY && p.y <= maxY;
    }

    bool Intersects(const Rect2d& other) const {
        if (IsEmpty() || other.IsEmpty()) return false;
        return minX <= other.maxX && other.minX <= maxX &&
               minY <= other.maxY && other.minY <= maxY;
    }
};

// =============================================================================
// Color
// =============================================================================

/**
 * @brief 8-bit RGBA color
 */
struct VXTRACE_API Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    Color() = default;
    Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255)
        : r(r_), g(g_), b(b_), a(a_) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    /// "#rrggbb"
    std::string ToHex() const;

    /// Rec.601 luma
    double Luminance() const { return 0.299 * r + 0.587 * g + 0.114 * b; }
};

// =============================================================================
// Raster Maps
// =============================================================================

/**
 * @brief Binary map, 0 = background, 255 = foreground
 */
struct VXTRACE_API BinaryMap {
    int32_t width = 0;
    int32_t height = 0;
    std::vector<uint8_t> data;

    BinaryMap() = default;
    BinaryMap(int32_t w, int32_t h, uint8_t fill = 0)
        : width(w), height(h), data(static_cast<size_t>(w) * h, fill) {}

    bool Empty() const { return data.empty(); }
    bool At(int32_t x, int32_t y) const { return data[static_cast<size_t>(y) * width + x] != 0; }
    void Set(int32_t x, int32_t y, bool on) {
        data[static_cast<size_t>(y) * width + x] = on ? 255 : 0;
    }
    size_t CountSet() const {
        return static_cast<size_t>(std::count_if(data.begin(), data.end(),
                                                 [](uint8_t v) { return v != 0; }));
    }
};

/**
 * @brief Integer label map (region id per pixel, -1 = unlabeled)
 */
struct VXTRACE_API LabelMap {
    int32_t width = 0;
    int32_t height = 0;
    int32_t numLabels = 0;
    std::vector<int32_t> labels;

    LabelMap() = default;
    LabelMap(int32_t w, int32_t h)
        : width(w), height(h), labels(static_cast<size_t>(w) * h, -1) {}

    bool Empty() const { return labels.empty(); }
    int32_t At(int32_t x, int32_t y) const { return labels[static_cast<size_t>(y) * width + x]; }
};

} // namespace Vx::Trace
