/**
 * @file VPath.cpp
 * @brief Path measures, cleanup and Bezier evaluation
 */

#include <VxTrace/Core/VPath.h>

#include <cmath>
#include <utility>

namespace Vx::Trace {

// =============================================================================
// VPath
// =============================================================================

VPath::VPath(const std::vector<Point2d>& points, bool closed)
    : points_(points), closed_(closed) {}

VPath::VPath(std::vector<Point2d>&& points, bool closed)
    : points_(std::move(points)), closed_(closed) {}

double VPath::Length() const {
    if (points_.size() < 2) return 0.0;

    double len = 0.0;
    for (size_t i = 1; i < points_.size(); ++i) {
        len += points_[i].DistanceTo(points_[i - 1]);
    }
    if (closed_) {
        len += points_.back().DistanceTo(points_.front());
    }
    return len;
}

Rect2d VPath::BoundingBox() const {
    Rect2d box;
    for (const auto& p : points_) {
        box.Extend(p);
    }
    return box;
}

double VPath::SignedArea() const {
    if (points_.size() < 3) {
        return 0.0;
    }

    double area = 0.0;
    size_t n = points_.size();
    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += points_[i].x * points_[j].y;
        area -= points_[j].x * points_[i].y;
    }
    return area * 0.5;
}

double VPath::Area() const {
    return std::abs(SignedArea());
}

Point2d VPath::Centroid() const {
    if (points_.empty()) {
        return {0.0, 0.0};
    }
    if (points_.size() == 1) {
        return points_[0];
    }

    auto meanPoint = [this]() {
        double sumX = 0.0, sumY = 0.0;
        for (const auto& p : points_) {
            sumX += p.x;
            sumY += p.y;
        }
        double n = static_cast<double>(points_.size());
        return Point2d(sumX / n, sumY / n);
    };

    if (!closed_ || points_.size() < 3) {
        return meanPoint();
    }

    double cx = 0.0, cy = 0.0;
    double twiceArea = 0.0;
    size_t n = points_.size();
    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        double cross = points_[i].x * points_[j].y - points_[j].x * points_[i].y;
        twiceArea += cross;
        cx += (points_[i].x + points_[j].x) * cross;
        cy += (points_[i].y + points_[j].y) * cross;
    }

    // Degenerate (collinear) ring
    if (std::abs(twiceArea) < 1e-12) {
        return meanPoint();
    }
    return {cx / (3.0 * twiceArea), cy / (3.0 * twiceArea)};
}

void VPath::RemoveConsecutiveDuplicates(double tolerance) {
    if (points_.size() < 2) return;

    const double tol2 = tolerance * tolerance;
    size_t out = 1;
    for (size_t i = 1; i < points_.size(); ++i) {
        if ((points_[i] - points_[out - 1]).SquaredNorm() > tol2) {
            points_[out++] = points_[i];
        }
    }
    points_.resize(out);

    if (closed_) {
        while (points_.size() > 1 && (points_.back() - points_.front()).SquaredNorm() <= tol2) {
            points_.pop_back();
        }
    }
}

void VPath::Scale(double sx, double sy) {
    for (auto& p : points_) {
        p.x *= sx;
        p.y *= sy;
    }
}

void VPath::Translate(double dx, double dy) {
    for (auto& p : points_) {
        p.x += dx;
        p.y += dy;
    }
}

// =============================================================================
// CubicBezier
// =============================================================================

CubicBezier CubicBezier::Line(const Point2d& a, const Point2d& b) {
    Point2d d = b - a;
    return {a, a + d * (1.0 / 3.0), a + d * (2.0 / 3.0), b};
}

Point2d CubicBezier::Evaluate(double t) const {
    double mt = 1.0 - t;
    double b0 = mt * mt * mt;
    double b1 = 3.0 * mt * mt * t;
    double b2 = 3.0 * mt * t * t;
    double b3 = t * t * t;
    return {b0 * p0.x + b1 * p1.x + b2 * p2.x + b3 * p3.x,
            b0 * p0.y + b1 * p1.y + b2 * p2.y + b3 * p3.y};
}

Point2d CubicBezier::Derivative(double t) const {
    double mt = 1.0 - t;
    return (p1 - p0) * (3.0 * mt * mt) + (p2 - p1) * (6.0 * mt * t) + (p3 - p2) * (3.0 * t * t);
}

Point2d CubicBezier::SecondDerivative(double t) const {
    double mt = 1.0 - t;
    return (p2 - p1 * 2.0 + p0) * (6.0 * mt) + (p3 - p2 * 2.0 + p1) * (6.0 * t);
}

} // namespace Vx::Trace
