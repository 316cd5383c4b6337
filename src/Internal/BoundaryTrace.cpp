/**
 * @file BoundaryTrace.cpp
 * @brief Boundary tracing implementation
 */

#include <VxTrace/Internal/BoundaryTrace.h>

#include <algorithm>
#include <limits>

namespace Vx::Trace::Internal {

namespace {

// Clockwise (y down) starting west
const int32_t DX[8] = {-1, -1, 0, 1, 1, 1, 0, -1};
const int32_t DY[8] = {0, -1, -1, -1, 0, 1, 1, 1};

inline bool Fg(const BinaryMap& m, int32_t x, int32_t y) {
    return x >= 0 && y >= 0 && x < m.width && y < m.height && m.At(x, y);
}

inline int32_t DirectionOf(const Point2i& from, const Point2i& to) {
    const int32_t dx = to.x - from.x;
    const int32_t dy = to.y - from.y;
    for (int32_t d = 0; d < 8; ++d) {
        if (DX[d] == dx && DY[d] == dy) return d;
    }
    return -1;
}

} // anonymous namespace

int64_t DefaultTraceBudget(int32_t width, int32_t height) {
    // Each pixel can be entered from at most 4 sides
    return 4 * (static_cast<int64_t>(width) + height) +
           4 * static_cast<int64_t>(width) * height;
}

BoundaryTraceResult TraceBoundary(const BinaryMap& mask, const Point2i& start,
                                  const Point2i& backtrack, int64_t budget) {
    BoundaryTraceResult result;
    if (!Fg(mask, start.x, start.y)) {
        result.status = TraceStatus::Abandoned;
        return result;
    }
    if (budget <= 0) {
        budget = DefaultTraceBudget(mask.width, mask.height);
    }

    result.contour.push_back(start);

    int32_t backDir = DirectionOf(start, backtrack);
    if (backDir < 0) backDir = 0;

    Point2i current = start;
    Point2i firstNext(-1, -1);
    int32_t firstBackDir = -1;

    while (true) {
        if (result.steps >= budget) {
            result.status = TraceStatus::Abandoned;
            return result;
        }

        // Clockwise search from the backtrack position
        int32_t found = -1;
        int32_t prevDir = backDir;
        for (int32_t k = 1; k <= 8; ++k) {
            const int32_t d = (backDir + k) % 8;
            if (Fg(mask, current.x + DX[d], current.y + DY[d])) {
                found = d;
                break;
            }
            prevDir = d;
        }

        if (found < 0) {
            result.status = TraceStatus::Isolated;
            return result;
        }

        const Point2i next(current.x + DX[found], current.y + DY[found]);
        const Point2i newBack(current.x + DX[prevDir], current.y + DY[prevDir]);
        int32_t nextBackDir = DirectionOf(next, newBack);
        if (nextBackDir < 0) nextBackDir = (found + 4) % 8;
        ++result.steps;

        // Jacob's criterion: leaving start exactly as the first step did
        if (current == start) {
            if (firstBackDir < 0) {
                firstNext = next;
                firstBackDir = nextBackDir;
            } else if (next == firstNext && nextBackDir == firstBackDir) {
                result.contour.pop_back();
                result.status = TraceStatus::Closed;
                return result;
            }
        }

        current = next;
        backDir = nextBackDir;
        result.contour.push_back(current);
    }
}

BoundaryTraceResult TraceBoundary(const BinaryMap& mask, const Point2i& start, int64_t budget) {
    return TraceBoundary(mask, start, Point2i(start.x - 1, start.y), budget);
}

RegionBoundary TraceAllBoundaries(const LabelMap& labels, int32_t label, int64_t budget) {
    RegionBoundary out;
    const int32_t w = labels.width;
    const int32_t h = labels.height;

    // Bounding box of the label
    int32_t minX = w, minY = h, maxX = -1, maxY = -1;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (labels.At(x, y) != label) continue;
            minX = std::min(minX, x);
            minY = std::min(minY, y);
            maxX = std::max(maxX, x);
            maxY = std::max(maxY, y);
        }
    }
    if (maxX < 0) return out;

    // Local mask with a one pixel background frame
    const int32_t mw = maxX - minX + 3;
    const int32_t mh = maxY - minY + 3;
    BinaryMap mask(mw, mh, 0);
    for (int32_t y = minY; y <= maxY; ++y) {
        for (int32_t x = minX; x <= maxX; ++x) {
            if (labels.At(x, y) == label) {
                mask.Set(x - minX + 1, y - minY + 1, true);
            }
        }
    }

    // Keep the largest 8-connected component
    {
        std::vector<int32_t> comp(static_cast<size_t>(mw) * mh, -1);
        std::vector<int32_t> sizes;
        std::vector<int32_t> stack;
        for (int32_t i = 0; i < mw * mh; ++i) {
            if (mask.data[i] == 0 || comp[i] >= 0) continue;
            const int32_t id = static_cast<int32_t>(sizes.size());
            int32_t size = 0;
            comp[i] = id;
            stack.assign(1, i);
            while (!stack.empty()) {
                const int32_t cur = stack.back();
                stack.pop_back();
                ++size;
                const int32_t cx = cur % mw;
                const int32_t cy = cur / mw;
                for (int32_t d = 0; d < 8; ++d) {
                    const int32_t nx = cx + DX[d];
                    const int32_t ny = cy + DY[d];
                    if (!Fg(mask, nx, ny)) continue;
                    const int32_t n = ny * mw + nx;
                    if (comp[n] < 0) {
                        comp[n] = id;
                        stack.push_back(n);
                    }
                }
            }
            sizes.push_back(size);
        }
        const int32_t keep = static_cast<int32_t>(
            std::max_element(sizes.begin(), sizes.end()) - sizes.begin());
        for (int32_t i = 0; i < mw * mh; ++i) {
            if (comp[i] != keep) mask.data[i] = 0;
        }
    }

    auto toRing = [&](const std::vector<Point2i>& contour) {
        VPath ring;
        ring.Reserve(contour.size());
        for (const auto& p : contour) {
            ring.AddPoint(p.x + minX - 1, p.y + minY - 1);
        }
        ring.SetClosed(true);
        ring.RemoveConsecutiveDuplicates();
        return ring;
    };

    // Outer ring from the raster-first pixel
    Point2i first(-1, -1);
    for (int32_t i = 0; i < mw * mh && first.x < 0; ++i) {
        if (mask.data[i] != 0) first = Point2i(i % mw, i / mw);
    }

    BoundaryTraceResult outer = TraceBoundary(mask, first, budget);
    if (outer.status == TraceStatus::Abandoned) {
        ++out.abandoned;
        return out;
    }
    out.rings.push_back(toRing(outer.contour));

    // Background components (4-connected) not touching the frame are holes
    std::vector<int32_t> bg(static_cast<size_t>(mw) * mh, 0);
    std::vector<int32_t> stack;
    const int32_t D4X[4] = {1, -1, 0, 0};
    const int32_t D4Y[4] = {0, 0, 1, -1};

    auto flood = [&](int32_t seed, int32_t tag) {
        bg[seed] = tag;
        stack.assign(1, seed);
        while (!stack.empty()) {
            const int32_t cur = stack.back();
            stack.pop_back();
            const int32_t cx = cur % mw;
            const int32_t cy = cur / mw;
            for (int32_t d = 0; d < 4; ++d) {
                const int32_t nx = cx + D4X[d];
                const int32_t ny = cy + D4Y[d];
                if (nx < 0 || ny < 0 || nx >= mw || ny >= mh) continue;
                const int32_t n = ny * mw + nx;
                if (mask.data[n] == 0 && bg[n] == 0) {
                    bg[n] = tag;
                    stack.push_back(n);
                }
            }
        }
    };

    flood(0, 1);
    int32_t nextTag = 2;
    for (int32_t i = 0; i < mw * mh; ++i) {
        if (mask.data[i] != 0 || bg[i] != 0) continue;
        flood(i, nextTag++);

        // Region pixel above the hole's raster-first pixel
        const Point2i holeFirst(i % mw, i / mw);
        const Point2i start(holeFirst.x, holeFirst.y - 1);
        BoundaryTraceResult hole = TraceBoundary(mask, start, holeFirst, budget);
        if (hole.status == TraceStatus::Abandoned) {
            ++out.abandoned;
            continue;
        }
        if (hole.contour.size() >= 3) {
            out.rings.push_back(toRing(hole.contour));
        }
    }

    return out;
}

} // namespace Vx::Trace::Internal
