#pragma once

/**
 * @file Merge.h
 * @brief Pass merging with near-duplicate removal
 *
 * Earlier primitives always win: a later primitive is dropped when it
 * nearly duplicates one already kept. Two primitives are near duplicates
 * when they have the same kind, their boxes overlap within the tolerance,
 * their lengths differ by at most a factor 1.43 and at least 90% of the
 * later one's resampled points lie within tolerance of the earlier one.
 * Dots are duplicates when their centres are within half the tolerance.
 */

#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Internal/QuadTree.h>
#include <VxTrace/Internal/SpatialGrid.h>

#include <cstddef>
#include <vector>

namespace Vx::Trace {

struct MergeOptions {
    double tolerance = 2.0;             ///< Pixels
    double minMergeLength = 5.0;        ///< Shorter strokes are dropped
    double minLengthRatio = 0.7;
    double maxLengthRatio = 1.43;
    double pointFraction = 0.9;
};

struct MergeStats {
    size_t kept = 0;
    size_t duplicates = 0;
    size_t tooShort = 0;
};

/**
 * @brief Points along a primitive (strokes, fill outer rings) at the given spacing
 *
 * Dots yield their centre.
 */
std::vector<Point2d> SamplePoints(const Primitive& primitive, double spacing);

/// Union of primitive bounds (empty for no primitives)
Rect2d BoundsOf(const std::vector<Primitive>& primitives);

/**
 * @brief Incremental index answering "is this a near duplicate of something kept?"
 */
class PrimitiveIndex {
public:
    PrimitiveIndex(const Rect2d& bounds, const MergeOptions& options);

    /// Index of the first kept primitive duplicated by p, or -1
    int32_t FindDuplicate(const Primitive& p) const;

    /// Register p (the caller keeps ownership of the primitive storage)
    void Add(const Primitive& p);

    size_t Size() const { return kept_.size(); }

private:
    struct Entry {
        PrimitiveKind kind;
        Rect2d box;
        double length;
        Point2d center;                 ///< Dots only
    };

    MergeOptions options_;
    Internal::QuadTree boxes_;
    Internal::SpatialGrid points_;
    std::vector<Entry> kept_;
};

/**
 * @brief Append incoming after base, dropping near duplicates and short strokes
 *
 * Deterministic: output order is base order then incoming order.
 */
std::vector<Primitive> MergePrimitives(const std::vector<Primitive>& base,
                                       const std::vector<Primitive>& incoming,
                                       const MergeOptions& options = MergeOptions(),
                                       MergeStats* stats = nullptr);

/**
 * @brief Share of a primitive's points lying near reference geometry
 */
class SupportIndex {
public:
    SupportIndex(const std::vector<Primitive>& reference, double radius);

    /// Fraction in [0, 1]; 0 when the primitive has no sample points
    double Support(const Primitive& p) const;

private:
    double radius_;
    Internal::SpatialGrid grid_;
};

} // namespace Vx::Trace
