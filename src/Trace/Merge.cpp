/**
 * @file Merge.cpp
 * @brief Near-duplicate detection and pass merging
 */

#include <VxTrace/Trace/Merge.h>
#include <VxTrace/Internal/ContourProcess.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <type_traits>

namespace Vx::Trace {

namespace {

double SampleSpacing(double tolerance) {
    return std::max(0.5, tolerance * 0.5);
}

Rect2d GridBounds(const Rect2d& bounds, double margin) {
    if (bounds.IsEmpty()) return Rect2d(0.0, 0.0, 1.0, 1.0);
    return bounds.Expanded(margin);
}

bool IsShortStroke(const Primitive& p, double minLength) {
    const auto* stroke = std::get_if<StrokePrimitive>(&p);
    return stroke != nullptr && stroke->path.Length() < minLength;
}

} // anonymous namespace

std::vector<Point2d> SamplePoints(const Primitive& primitive, double spacing) {
    return std::visit([spacing](const auto& p) -> std::vector<Point2d> {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StrokePrimitive>) {
            return Internal::ResamplePath(p.path, spacing).Points();
        } else if constexpr (std::is_same_v<T, FillPrimitive>) {
            if (p.rings.empty()) return {};
            return Internal::ResamplePath(p.rings.front(), spacing).Points();
        } else {
            return {p.center};
        }
    }, primitive);
}

Rect2d BoundsOf(const std::vector<Primitive>& primitives) {
    Rect2d bounds;
    for (const auto& p : primitives) {
        Rect2d box = BoundsOf(p);
        if (box.IsEmpty()) continue;
        bounds.Extend(Point2d(box.minX, box.minY));
        bounds.Extend(Point2d(box.maxX, box.maxY));
    }
    return bounds;
}

// =============================================================================
// PrimitiveIndex
// =============================================================================

PrimitiveIndex::PrimitiveIndex(const Rect2d& bounds, const MergeOptions& options)
    : options_(options)
    , boxes_(GridBounds(bounds, options.tolerance))
    , points_(GridBounds(bounds, options.tolerance), std::max(1.0, options.tolerance)) {
}

int32_t PrimitiveIndex::FindDuplicate(const Primitive& p) const {
    const double tol = options_.tolerance;
    const PrimitiveKind kind = KindOf(p);
    const Rect2d box = BoundsOf(p);

    std::vector<int32_t> candidates;
    boxes_.Query(box.Expanded(tol), candidates);
    if (candidates.empty()) return -1;

    if (kind == PrimitiveKind::Dot) {
        const Point2d center = std::get<DotPrimitive>(p).center;
        for (int32_t c : candidates) {
            const Entry& e = kept_[c];
            if (e.kind == PrimitiveKind::Dot && e.center.DistanceTo(center) <= tol * 0.5) {
                return c;
            }
        }
        return -1;
    }

    const double length = LengthOf(p);
    const std::vector<Point2d> samples = SamplePoints(p, SampleSpacing(tol));
    if (samples.empty()) return -1;
    const double needed = options_.pointFraction * static_cast<double>(samples.size());

    for (int32_t c : candidates) {
        const Entry& e = kept_[c];
        if (e.kind != kind || e.length <= 0.0) continue;
        const double ratio = length / e.length;
        if (ratio < options_.minLengthRatio || ratio > options_.maxLengthRatio) continue;

        size_t near = 0;
        for (size_t i = 0; i < samples.size(); ++i) {
            if (points_.AnyWithin(samples[i], tol,
                                  [c](int32_t idx, const Point2d&) { return idx == c; })) {
                ++near;
            }
            // Stop once the threshold can no longer be reached
            if (static_cast<double>(near + samples.size() - i - 1) < needed) break;
        }
        if (static_cast<double>(near) >= needed) return c;
    }
    return -1;
}

void PrimitiveIndex::Add(const Primitive& p) {
    const int32_t index = static_cast<int32_t>(kept_.size());
    Entry e;
    e.kind = KindOf(p);
    e.box = BoundsOf(p);
    e.length = LengthOf(p);
    if (e.kind == PrimitiveKind::Dot) e.center = std::get<DotPrimitive>(p).center;

    boxes_.Insert(index, e.box);
    for (const auto& pt : SamplePoints(p, SampleSpacing(options_.tolerance))) {
        points_.Insert(index, pt);
    }
    kept_.push_back(e);
}

// =============================================================================
// Merge
// =============================================================================

std::vector<Primitive> MergePrimitives(const std::vector<Primitive>& base,
                                       const std::vector<Primitive>& incoming,
                                       const MergeOptions& options,
                                       MergeStats* stats) {
    MergeStats local;
    Rect2d bounds = BoundsOf(base);
    Rect2d extra = BoundsOf(incoming);
    if (!extra.IsEmpty()) {
        bounds.Extend(Point2d(extra.minX, extra.minY));
        bounds.Extend(Point2d(extra.maxX, extra.maxY));
    }

    PrimitiveIndex index(bounds, options);
    std::vector<Primitive> merged;
    merged.reserve(base.size() + incoming.size());

    for (const auto& p : base) {
        if (IsShortStroke(p, options.minMergeLength)) {
            ++local.tooShort;
            continue;
        }
        index.Add(p);
        merged.push_back(p);
    }

    for (const auto& p : incoming) {
        if (IsShortStroke(p, options.minMergeLength)) {
            ++local.tooShort;
            continue;
        }
        if (index.FindDuplicate(p) >= 0) {
            ++local.duplicates;
            continue;
        }
        index.Add(p);
        merged.push_back(p);
    }

    local.kept = merged.size();
    Platform::Log::Debug("merge: {} + {} -> {} ({} duplicates, {} short)",
                         base.size(), incoming.size(), local.kept,
                         local.duplicates, local.tooShort);
    if (stats != nullptr) *stats = local;
    return merged;
}

// =============================================================================
// SupportIndex
// =============================================================================

SupportIndex::SupportIndex(const std::vector<Primitive>& reference, double radius)
    : radius_(radius)
    , grid_(GridBounds(BoundsOf(reference), radius), std::max(1.0, radius)) {
    for (size_t i = 0; i < reference.size(); ++i) {
        for (const auto& pt : SamplePoints(reference[i], SampleSpacing(radius))) {
            grid_.Insert(static_cast<int32_t>(i), pt);
        }
    }
}

double SupportIndex::Support(const Primitive& p) const {
    const std::vector<Point2d> samples = SamplePoints(p, SampleSpacing(radius_));
    if (samples.empty()) return 0.0;

    size_t near = 0;
    for (const auto& pt : samples) {
        if (grid_.AnyWithin(pt, radius_, [](int32_t, const Point2d&) { return true; })) ++near;
    }
    return static_cast<double>(near) / static_cast<double>(samples.size());
}

} // namespace Vx::Trace
