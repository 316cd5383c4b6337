/**
 * @file ContourProcess.cpp
 * @brief Path cleanup and simplification
 */

#include <VxTrace/Internal/ContourProcess.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <queue>
#include <tuple>
#include <utility>
#include <vector>

namespace Vx::Trace::Internal {

double PointSegmentDistance(const Point2d& p, const Point2d& a, const Point2d& b) {
    const Point2d ab = b - a;
    const double len2 = ab.SquaredNorm();
    if (len2 < 1e-18) {
        return (p - a).Norm();
    }
    const double t = std::clamp((p - a).Dot(ab) / len2, 0.0, 1.0);
    return (p - (a + ab * t)).Norm();
}

VPath RemoveDuplicatePoints(const VPath& path, double tolerance) {
    VPath out = path;
    out.RemoveConsecutiveDuplicates(tolerance);
    return out;
}

// ============================================================================
// Resampling
// ============================================================================

VPath ResamplePath(const VPath& path, double spacing) {
    if (spacing <= 0.0 || path.Size() < 2) {
        return path;
    }

    std::vector<Point2d> pts = path.Points();
    if (path.IsClosed()) {
        pts.push_back(pts.front());
    }

    VPath out;
    out.SetClosed(path.IsClosed());
    out.AddPoint(pts.front());

    double carried = 0.0;   // distance travelled since the last emitted point
    for (size_t i = 1; i < pts.size(); ++i) {
        const Point2d a = pts[i - 1];
        const Point2d b = pts[i];
        const double seg = (b - a).Norm();
        if (seg < 1e-12) continue;

        double along = spacing - carried;
        while (along <= seg) {
            out.AddPoint(a + (b - a) * (along / seg));
            along += spacing;
        }
        carried = seg - (along - spacing);
    }

    if (!path.IsClosed()) {
        if ((out.Back() - pts.back()).Norm() > 1e-9) {
            out.AddPoint(pts.back());
        }
    } else {
        out.RemoveConsecutiveDuplicates();
    }
    return out;
}

// ============================================================================
// Ramer-Douglas-Peucker
// ============================================================================

namespace {

// Marks the points of pts[first..last] that survive simplification
void RdpMark(const std::vector<Point2d>& pts, size_t first, size_t last,
             double epsilon, std::vector<uint8_t>& keep) {
    std::vector<std::pair<size_t, size_t>> stack;
    stack.emplace_back(first, last);
    keep[first] = 1;
    keep[last] = 1;

    while (!stack.empty()) {
        const auto [lo, hi] = stack.back();
        stack.pop_back();
        if (hi <= lo + 1) continue;

        double maxDist = -1.0;
        size_t index = lo;
        for (size_t i = lo + 1; i < hi; ++i) {
            const double d = PointSegmentDistance(pts[i], pts[lo], pts[hi]);
            if (d > maxDist) {
                maxDist = d;
                index = i;
            }
        }

        if (maxDist > epsilon) {
            keep[index] = 1;
            stack.emplace_back(index, hi);
            stack.emplace_back(lo, index);
        }
    }
}

} // anonymous namespace

VPath SimplifyRdp(const VPath& path, double epsilon) {
    const size_t n = path.Size();
    if (epsilon <= 0.0 || n < 3) {
        return path;
    }

    const auto& pts = path.Points();
    std::vector<uint8_t> keep(n + 1, 0);

    if (!path.IsClosed()) {
        RdpMark(pts, 0, n - 1, epsilon, keep);
    } else {
        // Split at the point farthest from the first
        size_t split = 1;
        double best = -1.0;
        for (size_t i = 1; i < n; ++i) {
            const double d = (pts[i] - pts[0]).SquaredNorm();
            if (d > best) {
                best = d;
                split = i;
            }
        }

        std::vector<Point2d> ring = pts;
        ring.push_back(pts.front());
        RdpMark(ring, 0, split, epsilon, keep);
        RdpMark(ring, split, n, epsilon, keep);

        size_t kept = 0;
        for (size_t i = 0; i < n; ++i) kept += keep[i];
        if (kept < 3) {
            // Keep the point farthest from the chord between 0 and split
            size_t extra = 0;
            double far = -1.0;
            for (size_t i = 1; i < n; ++i) {
                if (i == split) continue;
                const double d = PointSegmentDistance(pts[i], pts[0], pts[split]);
                if (d > far) {
                    far = d;
                    extra = i;
                }
            }
            keep[extra] = 1;
        }
    }

    VPath out;
    out.SetClosed(path.IsClosed());
    for (size_t i = 0; i < n; ++i) {
        if (keep[i]) out.AddPoint(pts[i]);
    }
    return out;
}

// ============================================================================
// Visvalingam-Whyatt
// ============================================================================

namespace {

inline double TriangleArea(const Point2d& a, const Point2d& b, const Point2d& c) {
    return 0.5 * std::abs((b.x - a.x) * (c.y - a.y) - (c.x - a.x) * (b.y - a.y));
}

} // anonymous namespace

VPath SimplifyVisvalingam(const VPath& path, double epsilon) {
    const size_t n = path.Size();
    const bool closed = path.IsClosed();
    const size_t minPoints = closed ? 3 : 2;
    if (epsilon <= 0.0 || n <= minPoints) {
        return path;
    }

    const auto& pts = path.Points();
    const double threshold = epsilon * epsilon;

    std::vector<int64_t> prev(n), next(n);
    std::vector<uint32_t> version(n, 0);
    std::vector<uint8_t> alive(n, 1);
    for (size_t i = 0; i < n; ++i) {
        prev[i] = static_cast<int64_t>(i) - 1;
        next[i] = static_cast<int64_t>(i) + 1;
    }
    if (closed) {
        prev[0] = static_cast<int64_t>(n) - 1;
        next[n - 1] = 0;
    } else {
        next[n - 1] = -1;
    }

    auto removable = [&](size_t i) {
        return closed || (prev[i] >= 0 && next[i] >= 0);
    };
    auto area = [&](size_t i) {
        return TriangleArea(pts[prev[i]], pts[i], pts[next[i]]);
    };

    // (area, index, version); smallest area first, ties by index
    using Entry = std::tuple<double, size_t, uint32_t>;
    std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;
    for (size_t i = 0; i < n; ++i) {
        if (removable(i)) heap.emplace(area(i), i, 0u);
    }

    size_t remaining = n;
    while (!heap.empty() && remaining > minPoints) {
        const auto [a, i, ver] = heap.top();
        heap.pop();
        if (!alive[i] || ver != version[i]) continue;
        if (a >= threshold) break;

        alive[i] = 0;
        --remaining;
        const int64_t p = prev[i];
        const int64_t q = next[i];
        if (p >= 0) next[p] = q;
        if (q >= 0) prev[q] = p;

        for (int64_t j : {p, q}) {
            if (j < 0 || !removable(static_cast<size_t>(j))) continue;
            const size_t k = static_cast<size_t>(j);
            ++version[k];
            // Areas never decrease below the removed one
            heap.emplace(std::max(area(k), a), k, version[k]);
        }
    }

    VPath out;
    out.SetClosed(closed);
    for (size_t i = 0; i < n; ++i) {
        if (alive[i]) out.AddPoint(pts[i]);
    }
    return out;
}

VPath Simplify(const VPath& path, SimplifyMethod method, double epsilon) {
    switch (method) {
        case SimplifyMethod::Visvalingam:
            return SimplifyVisvalingam(path, epsilon);
        case SimplifyMethod::Rdp:
        default:
            return SimplifyRdp(path, epsilon);
    }
}

} // namespace Vx::Trace::Internal
