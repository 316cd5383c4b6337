#pragma once

/**
 * @file SpatialGrid.h
 * @brief Uniform grid over points for fixed-radius neighbour queries
 *
 * The grid stores integer indices into a caller-owned collection together
 * with a copy of the point; it never owns the objects themselves.
 */

#include <VxTrace/Core/Types.h>

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <utility>
#include <vector>

namespace Vx::Trace::Internal {

class SpatialGrid {
public:
    /**
     * @param bounds Region covered by the cells; outside points land in edge cells
     * @param cellSize Cell side in pixels (clamped to >= 1e-3)
     */
    SpatialGrid(const Rect2d& bounds, double cellSize);

    void Insert(int32_t index, const Point2d& point);

    /**
     * @brief Indices whose point lies within radius of center, ascending
     */
    void QueryRadius(const Point2d& center, double radius, std::vector<int32_t>& out) const;

    /**
     * @brief True if some stored point within radius satisfies pred(index, point)
     */
    template<typename Pred>
    bool AnyWithin(const Point2d& center, double radius, Pred&& pred) const;

    /**
     * @brief Visit every stored point within radius: fn(index, point)
     */
    template<typename Fn>
    void ForEachWithin(const Point2d& center, double radius, Fn&& fn) const;

    size_t Size() const { return size_; }
    double CellSize() const { return cellSize_; }
    void Clear();

private:
    struct Entry {
        int32_t index;
        Point2d point;
    };

    int32_t CellX(double x) const;
    int32_t CellY(double y) const;

    Rect2d bounds_;
    double cellSize_;
    int32_t cols_;
    int32_t rows_;
    size_t size_ = 0;
    std::vector<std::vector<Entry>> cells_;
};

// ============================================================================
// Template Implementations
// ============================================================================

template<typename Fn>
void SpatialGrid::ForEachWithin(const Point2d& center, double radius, Fn&& fn) const {
    if (radius < 0.0) return;
    const double r2 = radius * radius;
    const int32_t x0 = CellX(center.x - radius);
    const int32_t x1 = CellX(center.x + radius);
    const int32_t y0 = CellY(center.y - radius);
    const int32_t y1 = CellY(center.y + radius);

    for (int32_t cy = y0; cy <= y1; ++cy) {
        for (int32_t cx = x0; cx <= x1; ++cx) {
            for (const auto& e : cells_[static_cast<size_t>(cy) * cols_ + cx]) {
                if ((e.point - center).SquaredNorm() <= r2) {
                    fn(e.index, e.point);
                }
            }
        }
    }
}

template<typename Pred>
bool SpatialGrid::AnyWithin(const Point2d& center, double radius, Pred&& pred) const {
    if (radius < 0.0) return false;
    const double r2 = radius * radius;
    const int32_t x0 = CellX(center.x - radius);
    const int32_t x1 = CellX(center.x + radius);
    const int32_t y0 = CellY(center.y - radius);
    const int32_t y1 = CellY(center.y + radius);

    for (int32_t cy = y0; cy <= y1; ++cy) {
        for (int32_t cx = x0; cx <= x1; ++cx) {
            for (const auto& e : cells_[static_cast<size_t>(cy) * cols_ + cx]) {
                if ((e.point - center).SquaredNorm() <= r2 && pred(e.index, e.point)) {
                    return true;
                }
            }
        }
    }
    return false;
}

} // namespace Vx::Trace::Internal
