/**
 * @file BezierFit.cpp
 * @brief Schneider curve fitting with corner splitting
 */

#include <VxTrace/Internal/BezierFit.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

namespace {

constexpr int32_t MAX_REPARAM_ITERATIONS = 4;

std::vector<double> ChordLengthParams(const std::vector<Point2d>& pts, size_t first, size_t last) {
    std::vector<double> u(last - first + 1, 0.0);
    for (size_t i = first + 1; i <= last; ++i) {
        u[i - first] = u[i - first - 1] + (pts[i] - pts[i - 1]).Norm();
    }
    const double total = u.back();
    if (total > 1e-12) {
        for (auto& v : u) v /= total;
    } else {
        for (size_t i = 0; i < u.size(); ++i) {
            u[i] = static_cast<double>(i) / static_cast<double>(u.size() - 1);
        }
    }
    return u;
}

// Unit direction from pts[from] to the first non-coincident point toward limit
Point2d EndTangent(const std::vector<Point2d>& pts, size_t from, size_t limit, bool forward) {
    if (forward) {
        for (size_t i = from + 1; i <= limit; ++i) {
            Point2d d = pts[i] - pts[from];
            if (d.Norm() > 1e-12) return d.Normalized();
        }
    } else {
        for (size_t i = from; i-- > limit;) {
            Point2d d = pts[i] - pts[from];
            if (d.Norm() > 1e-12) return d.Normalized();
        }
    }
    return Point2d(0.0, 0.0);
}

CubicBezier LeastSquaresCurve(const std::vector<Point2d>& pts, size_t first, size_t last,
                              const std::vector<double>& u,
                              const Point2d& t1, const Point2d& t2) {
    const Point2d p0 = pts[first];
    const Point2d p3 = pts[last];

    double c00 = 0.0, c01 = 0.0, c11 = 0.0, x0 = 0.0, x1 = 0.0;
    for (size_t i = first; i <= last; ++i) {
        const double t = u[i - first];
        const double mt = 1.0 - t;
        const double b0 = mt * mt * mt;
        const double b1 = 3.0 * t * mt * mt;
        const double b2 = 3.0 * t * t * mt;
        const double b3 = t * t * t;

        const Point2d a1 = t1 * b1;
        const Point2d a2 = t2 * b2;
        c00 += a1.Dot(a1);
        c01 += a1.Dot(a2);
        c11 += a2.Dot(a2);

        const Point2d tmp = pts[i] - (p0 * (b0 + b1) + p3 * (b2 + b3));
        x0 += a1.Dot(tmp);
        x1 += a2.Dot(tmp);
    }

    const double det = c00 * c11 - c01 * c01;
    double alpha1 = 0.0;
    double alpha2 = 0.0;
    if (std::abs(det) > 1e-12) {
        alpha1 = (x0 * c11 - x1 * c01) / det;
        alpha2 = (c00 * x1 - c01 * x0) / det;
    }

    const double segLen = (p3 - p0).Norm();
    const double eps = 1e-6 * segLen;
    if (alpha1 < eps || alpha2 < eps) {
        // Wu/Barsky heuristic
        alpha1 = alpha2 = segLen / 3.0;
    }

    return CubicBezier(p0, p0 + t1 * alpha1, p3 + t2 * alpha2, p3);
}

double MaxDeviation(const CubicBezier& curve, const std::vector<Point2d>& pts,
                    size_t first, size_t last, const std::vector<double>& u) {
    double maxErr = 0.0;
    for (size_t i = first; i <= last; ++i) {
        maxErr = std::max(maxErr, (curve.Evaluate(u[i - first]) - pts[i]).Norm());
    }
    return maxErr;
}

void Reparameterize(const CubicBezier& curve, const std::vector<Point2d>& pts,
                    size_t first, size_t last, std::vector<double>& u) {
    for (size_t i = first; i <= last; ++i) {
        double& t = u[i - first];
        const Point2d d = curve.Evaluate(t) - pts[i];
        const Point2d d1 = curve.Derivative(t);
        const Point2d d2 = curve.SecondDerivative(t);
        const double num = d.Dot(d1);
        const double den = d1.Dot(d1) + d.Dot(d2);
        if (std::abs(den) > 1e-12) {
            t = std::clamp(t - num / den, 0.0, 1.0);
        }
    }
}

// Turn angle in degrees at pts[i] between its neighbours
double TurnAngleDeg(const Point2d& a, const Point2d& b, const Point2d& c) {
    const Point2d u = (b - a).Normalized();
    const Point2d v = (c - b).Normalized();
    if (u.Norm() < 0.5 || v.Norm() < 0.5) return 0.0;
    const double cosang = std::clamp(u.Dot(v), -1.0, 1.0);
    return std::acos(cosang) * RAD_TO_DEG;
}

} // anonymous namespace

BezierSpanFit FitCubic(const std::vector<Point2d>& pts, size_t first, size_t last,
                       double maxError) {
    BezierSpanFit fit;
    if (last <= first + 1) {
        fit.curve = CubicBezier::Line(pts[first], pts[last]);
        fit.maxError = 0.0;
        return fit;
    }

    Point2d t1 = EndTangent(pts, first, last, true);
    Point2d t2 = EndTangent(pts, last, first, false);
    if (t1.Norm() < 0.5 || t2.Norm() < 0.5) {
        // All points coincide with an end point
        fit.curve = CubicBezier::Line(pts[first], pts[last]);
        std::vector<double> u = ChordLengthParams(pts, first, last);
        fit.maxError = MaxDeviation(fit.curve, pts, first, last, u);
        return fit;
    }

    std::vector<double> u = ChordLengthParams(pts, first, last);
    fit.curve = LeastSquaresCurve(pts, first, last, u, t1, t2);
    fit.maxError = MaxDeviation(fit.curve, pts, first, last, u);

    if (fit.maxError > maxError && fit.maxError < 4.0 * maxError) {
        for (int32_t it = 0; it < MAX_REPARAM_ITERATIONS; ++it) {
            Reparameterize(fit.curve, pts, first, last, u);
            CubicBezier candidate = LeastSquaresCurve(pts, first, last, u, t1, t2);
            const double err = MaxDeviation(candidate, pts, first, last, u);
            if (err < fit.maxError) {
                fit.curve = candidate;
                fit.maxError = err;
            }
            if (fit.maxError <= maxError) break;
        }
    }
    return fit;
}

std::vector<CubicBezier> FitBeziers(const std::vector<Point2d>& input, bool closed,
                                    double maxError, double splitAngleDeg) {
    std::vector<CubicBezier> curves;
    if (input.size() < 2) return curves;

    std::vector<Point2d> pts = input;
    if (closed && (pts.front() - pts.back()).Norm() > 1e-12) {
        pts.push_back(pts.front());
    }
    const size_t n = pts.size();
    maxError = std::max(maxError, 1e-6);

    // Corner split points; the first and last are always spans ends
    std::vector<size_t> breaks{0};
    for (size_t i = 1; i + 1 < n; ++i) {
        if (TurnAngleDeg(pts[i - 1], pts[i], pts[i + 1]) > splitAngleDeg) {
            breaks.push_back(i);
        }
    }
    breaks.push_back(n - 1);

    for (size_t b = 0; b + 1 < breaks.size(); ++b) {
        const size_t spanEnd = breaks[b + 1];
        size_t start = breaks[b];

        while (start < spanEnd) {
            // Exponential search for a failing end
            size_t good = start + 1;
            BezierSpanFit bestFit = FitCubic(pts, start, good, maxError);
            size_t step = 2;
            size_t bad = spanEnd + 1;

            while (true) {
                const size_t candidate = std::min(start + step, spanEnd);
                if (candidate <= good) break;
                BezierSpanFit fit = FitCubic(pts, start, candidate, maxError);
                if (fit.maxError <= maxError) {
                    good = candidate;
                    bestFit = fit;
                    if (candidate == spanEnd) break;
                    step *= 2;
                } else {
                    bad = candidate;
                    break;
                }
            }

            // Binary search in (good, bad)
            while (bad != spanEnd + 1 && bad - good > 1) {
                const size_t mid = good + (bad - good) / 2;
                BezierSpanFit fit = FitCubic(pts, start, mid, maxError);
                if (fit.maxError <= maxError) {
                    good = mid;
                    bestFit = fit;
                } else {
                    bad = mid;
                }
            }

            curves.push_back(bestFit.curve);
            start = good;
        }
    }

    return curves;
}

} // namespace Vx::Trace::Internal
