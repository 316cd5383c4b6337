/**
 * @file Thinning.cpp
 * @brief Guo-Hall and distance-ordered thinning
 */

#include <VxTrace/Internal/Thinning.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

namespace {

inline int32_t Px(const BinaryMap& m, int32_t x, int32_t y) {
    if (x < 0 || y < 0 || x >= m.width || y >= m.height) return 0;
    return m.data[static_cast<size_t>(y) * m.width + x] != 0 ? 1 : 0;
}

} // anonymous namespace

int32_t CountNeighbors8(const BinaryMap& map, int32_t x, int32_t y) {
    int32_t n = 0;
    for (int32_t dy = -1; dy <= 1; ++dy) {
        for (int32_t dx = -1; dx <= 1; ++dx) {
            if (dx == 0 && dy == 0) continue;
            n += Px(map, x + dx, y + dy);
        }
    }
    return n;
}

int32_t ConnectivityNumber8(const BinaryMap& map, int32_t x, int32_t y) {
    // Counter-clockwise from east: E, NE, N, NW, W, SW, S, SE
    static const int32_t DX[8] = {1, 1, 0, -1, -1, -1, 0, 1};
    static const int32_t DY[8] = {0, -1, -1, -1, 0, 1, 1, 1};

    int32_t inv[9];
    for (int32_t k = 0; k < 8; ++k) {
        inv[k] = 1 - Px(map, x + DX[k], y + DY[k]);
    }
    inv[8] = inv[0];

    int32_t count = 0;
    for (int32_t k = 0; k < 8; k += 2) {
        count += inv[k] - inv[k] * inv[k + 1] * inv[(k + 2) % 8];
    }
    return count;
}

int32_t GuoHallThin(BinaryMap& map) {
    const int32_t w = map.width;
    const int32_t h = map.height;
    if (w == 0 || h == 0) return 0;

    std::vector<size_t> marked;
    int32_t passes = 0;
    bool changed = true;

    while (changed) {
        changed = false;
        ++passes;

        for (int32_t iter = 0; iter < 2; ++iter) {
            marked.clear();

            for (int32_t y = 0; y < h; ++y) {
                for (int32_t x = 0; x < w; ++x) {
                    if (!map.At(x, y)) continue;

                    const int32_t p2 = Px(map, x, y - 1);
                    const int32_t p3 = Px(map, x + 1, y - 1);
                    const int32_t p4 = Px(map, x + 1, y);
                    const int32_t p5 = Px(map, x + 1, y + 1);
                    const int32_t p6 = Px(map, x, y + 1);
                    const int32_t p7 = Px(map, x - 1, y + 1);
                    const int32_t p8 = Px(map, x - 1, y);
                    const int32_t p9 = Px(map, x - 1, y - 1);

                    const int32_t c = ((1 - p2) & (p3 | p4)) + ((1 - p4) & (p5 | p6)) +
                                      ((1 - p6) & (p7 | p8)) + ((1 - p8) & (p9 | p2));
                    const int32_t n1 = (p9 | p2) + (p3 | p4) + (p5 | p6) + (p7 | p8);
                    const int32_t n2 = (p2 | p3) + (p4 | p5) + (p6 | p7) + (p8 | p9);
                    const int32_t n = std::min(n1, n2);
                    const int32_t m = iter == 0 ? ((p6 | p7 | (1 - p9)) & p8)
                                                : ((p2 | p3 | (1 - p5)) & p4);

                    if (c == 1 && n >= 2 && n <= 3 && m == 0) {
                        marked.push_back(static_cast<size_t>(y) * w + x);
                    }
                }
            }

            for (size_t idx : marked) {
                map.data[idx] = 0;
            }
            if (!marked.empty()) changed = true;
        }
    }
    return passes;
}

void DistanceOrderedThin(BinaryMap& map, const std::vector<float>& distance) {
    const int32_t w = map.width;
    const int32_t h = map.height;
    const size_t total = static_cast<size_t>(w) * h;
    if (total == 0 || distance.size() != total) {
        GuoHallThin(map);
        return;
    }

    // Unit-width distance levels
    int32_t maxLevel = 0;
    std::vector<int32_t> level(total, 0);
    for (size_t i = 0; i < total; ++i) {
        if (map.data[i] == 0) continue;
        level[i] = std::max(1, static_cast<int32_t>(std::lround(distance[i])));
        maxLevel = std::max(maxLevel, level[i]);
    }
    std::vector<std::vector<int32_t>> buckets(static_cast<size_t>(maxLevel) + 1);
    for (size_t i = 0; i < total; ++i) {
        if (map.data[i] != 0) buckets[level[i]].push_back(static_cast<int32_t>(i));
    }

    // Medial anchors: no 8-neighbour strictly farther from the background
    std::vector<uint8_t> anchor(total, 0);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const size_t idx = static_cast<size_t>(y) * w + x;
            const float d = distance[idx];
            if (map.data[idx] == 0 || d < 2.0f) continue;

            bool isMax = true;
            for (int32_t dy = -1; dy <= 1 && isMax; ++dy) {
                for (int32_t dx = -1; dx <= 1; ++dx) {
                    const int32_t nx = x + dx;
                    const int32_t ny = y + dy;
                    if ((dx == 0 && dy == 0) || nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
                    if (distance[static_cast<size_t>(ny) * w + nx] > d) {
                        isMax = false;
                        break;
                    }
                }
            }
            anchor[idx] = isMax ? 1 : 0;
        }
    }

    // North, south, east, west border subpasses
    static const int32_t SIDE_DX[4] = {0, 0, 1, -1};
    static const int32_t SIDE_DY[4] = {-1, 1, 0, 0};

    std::vector<int32_t> active;
    std::vector<int32_t> marked;
    for (int32_t lvl = 1; lvl <= maxLevel; ++lvl) {
        active.insert(active.end(), buckets[lvl].begin(), buckets[lvl].end());

        bool changed = true;
        while (changed) {
            changed = false;
            for (int32_t side = 0; side < 4; ++side) {
                marked.clear();
                for (int32_t idx : active) {
                    if (map.data[idx] == 0 || anchor[idx]) continue;
                    const int32_t x = idx % w;
                    const int32_t y = idx / w;
                    if (Px(map, x + SIDE_DX[side], y + SIDE_DY[side])) continue;
                    if (CountNeighbors8(map, x, y) < 2) continue;
                    if (ConnectivityNumber8(map, x, y) != 1) continue;
                    marked.push_back(idx);
                }

                // Re-check on removal so neighbouring marks cannot split a component
                for (int32_t idx : marked) {
                    const int32_t x = idx % w;
                    const int32_t y = idx / w;
                    if (CountNeighbors8(map, x, y) < 2) continue;
                    if (ConnectivityNumber8(map, x, y) != 1) continue;
                    map.data[idx] = 0;
                    changed = true;
                }
            }

            active.erase(std::remove_if(active.begin(), active.end(),
                                        [&map](int32_t idx) { return map.data[idx] == 0; }),
                         active.end());
        }
    }

    GuoHallThin(map);
}

} // namespace Vx::Trace::Internal
