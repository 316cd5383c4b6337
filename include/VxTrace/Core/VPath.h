#pragma once

/**
 * @file VPath.h
 * @brief Polyline / closed path and cubic Bezier segment
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/Export.h>

#include <cstddef>
#include <vector>

namespace Vx::Trace {

/**
 * @brief Ordered point sequence, open or closed
 *
 * A closed path does not repeat its first point at the end; the closing
 * segment is implicit. After cleanup consecutive points are distinct.
 */
class VXTRACE_API VPath {
public:
    // =========================================================================
    // Constructors
    // =========================================================================

    VPath() = default;
    explicit VPath(const std::vector<Point2d>& points, bool closed = false);
    explicit VPath(std::vector<Point2d>&& points, bool closed = false);

    // =========================================================================
    // Point Access
    // =========================================================================

    size_t Size() const { return points_.size(); }
    bool Empty() const { return points_.empty(); }

    const Point2d& operator[](size_t index) const { return points_[index]; }
    Point2d& operator[](size_t index) { return points_[index]; }

    const std::vector<Point2d>& Points() const { return points_; }
    std::vector<Point2d>& Points() { return points_; }

    const Point2d& Front() const { return points_.front(); }
    const Point2d& Back() const { return points_.back(); }

    void AddPoint(const Point2d& p) { points_.push_back(p); }
    void AddPoint(double x, double y) { points_.emplace_back(x, y); }
    void Reserve(size_t n) { points_.reserve(n); }
    void Clear() { points_.clear(); }

    bool IsClosed() const { return closed_; }
    void SetClosed(bool closed) { closed_ = closed; }

    // =========================================================================
    // Geometry
    // =========================================================================

    /// Total length, closing segment included for closed paths
    double Length() const;

    /// Bounding box (empty rect for an empty path)
    Rect2d BoundingBox() const;

    /// Shoelace signed area (positive = counter-clockwise in y-up axes)
    double SignedArea() const;

    /// Absolute area
    double Area() const;

    /// Area centroid for closed paths, mean point for open ones
    Point2d Centroid() const;

    // =========================================================================
    // Cleanup / Transform
    // =========================================================================

    /**
     * @brief Drop points within tolerance of their predecessor
     *
     * For closed paths a last point equal to the first is dropped too.
     */
    void RemoveConsecutiveDuplicates(double tolerance = 1e-9);

    /// Scale all coordinates about the origin
    void Scale(double sx, double sy);

    /// Translate all coordinates
    void Translate(double dx, double dy);

private:
    std::vector<Point2d> points_;
    bool closed_ = false;
};

/**
 * @brief Cubic Bezier segment B(t) = sum of Bernstein-weighted controls
 */
struct VXTRACE_API CubicBezier {
    Point2d p0;
    Point2d p1;
    Point2d p2;
    Point2d p3;

    CubicBezier() = default;
    CubicBezier(const Point2d& a, const Point2d& b, const Point2d& c, const Point2d& d)
        : p0(a), p1(b), p2(c), p3(d) {}

    /// Straight line as a cubic (handles at 1/3 and 2/3)
    static CubicBezier Line(const Point2d& a, const Point2d& b);

    Point2d Evaluate(double t) const;

    /// First derivative dB/dt
    Point2d Derivative(double t) const;

    /// Second derivative
    Point2d SecondDerivative(double t) const;
};

} // namespace Vx::Trace
