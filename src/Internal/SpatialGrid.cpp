/**
 * @file SpatialGrid.cpp
 * @brief Uniform grid point index
 */

#include <VxTrace/Internal/SpatialGrid.h>

namespace Vx::Trace::Internal {

namespace {
// Cap on cells per axis so a tiny cell size on a huge box stays bounded
constexpr int32_t MAX_CELLS_PER_AXIS = 4096;
}

SpatialGrid::SpatialGrid(const Rect2d& bounds, double cellSize)
    : bounds_(bounds.IsEmpty() ? Rect2d(0.0, 0.0, 1.0, 1.0) : bounds)
    , cellSize_(std::max(cellSize, 1e-3))
{
    double w = std::max(bounds_.Width(), 1e-6);
    double h = std::max(bounds_.Height(), 1e-6);
    cellSize_ = std::max(cellSize_, std::max(w, h) / MAX_CELLS_PER_AXIS);
    cols_ = std::max(1, static_cast<int32_t>(std::ceil(w / cellSize_)) + 1);
    rows_ = std::max(1, static_cast<int32_t>(std::ceil(h / cellSize_)) + 1);
    cells_.resize(static_cast<size_t>(cols_) * rows_);
}

int32_t SpatialGrid::CellX(double x) const {
    double c = std::floor((x - bounds_.minX) / cellSize_);
    return static_cast<int32_t>(std::clamp(c, 0.0, static_cast<double>(cols_ - 1)));
}

int32_t SpatialGrid::CellY(double y) const {
    double c = std::floor((y - bounds_.minY) / cellSize_);
    return static_cast<int32_t>(std::clamp(c, 0.0, static_cast<double>(rows_ - 1)));
}

void SpatialGrid::Insert(int32_t index, const Point2d& point) {
    cells_[static_cast<size_t>(CellY(point.y)) * cols_ + CellX(point.x)].push_back({index, point});
    ++size_;
}

void SpatialGrid::QueryRadius(const Point2d& center, double radius,
                              std::vector<int32_t>& out) const {
    out.clear();
    ForEachWithin(center, radius, [&out](int32_t index, const Point2d&) {
        out.push_back(index);
    });
    std::sort(out.begin(), out.end());
}

void SpatialGrid::Clear() {
    for (auto& cell : cells_) {
        cell.clear();
    }
    size_ = 0;
}

} // namespace Vx::Trace::Internal
