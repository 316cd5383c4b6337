/**
 * @file SkeletonGraph.cpp
 * @brief Skeleton graph construction, pruning and gap bridging
 */

#include <VxTrace/Internal/SkeletonGraph.h>
#include <VxTrace/Internal/SpatialGrid.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <set>
#include <tuple>
#include <utility>

namespace Vx::Trace::Internal {

namespace {

// 4-neighbours first so chains prefer straight steps
const int32_t NB_DX[8] = {1, 0, -1, 0, 1, -1, -1, 1};
const int32_t NB_DY[8] = {0, 1, 0, -1, 1, 1, -1, -1};

double ChainLength(const std::vector<Point2i>& pixels) {
    double len = 0.0;
    for (size_t i = 1; i < pixels.size(); ++i) {
        const double dx = pixels[i].x - pixels[i - 1].x;
        const double dy = pixels[i].y - pixels[i - 1].y;
        len += std::sqrt(dx * dx + dy * dy);
    }
    return len;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

SkeletonGraph SkeletonGraph::Build(const BinaryMap& skeleton) {
    SkeletonGraph graph;
    const int32_t w = skeleton.width;
    const int32_t h = skeleton.height;
    const size_t total = static_cast<size_t>(w) * h;
    if (total == 0) return graph;

    auto isSet = [&](int32_t x, int32_t y) {
        return x >= 0 && y >= 0 && x < w && y < h && skeleton.At(x, y);
    };

    std::vector<int32_t> degree(total, 0);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            if (!skeleton.At(x, y)) continue;
            int32_t n = 0;
            for (int32_t k = 0; k < 8; ++k) {
                n += isSet(x + NB_DX[k], y + NB_DY[k]) ? 1 : 0;
            }
            degree[static_cast<size_t>(y) * w + x] = n;
        }
    }

    // Node id per pixel, -1 for chain pixels
    std::vector<int32_t> nodeOf(total, -1);

    auto newNode = [&graph](const Point2d& pos) {
        SkeletonNode node;
        node.position = pos;
        graph.nodes_.push_back(node);
        return static_cast<int32_t>(graph.nodes_.size()) - 1;
    };

    // Junction pixels that touch form one node
    std::vector<int32_t> stack;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const size_t idx = static_cast<size_t>(y) * w + x;
            if (!skeleton.At(x, y) || degree[idx] == 2 || nodeOf[idx] >= 0) continue;

            if (degree[idx] < 2) {
                nodeOf[idx] = newNode(Point2d(x, y));
                continue;
            }

            const int32_t id = newNode(Point2d(x, y));
            double sx = 0.0, sy = 0.0;
            int32_t count = 0;
            nodeOf[idx] = id;
            stack.assign(1, static_cast<int32_t>(idx));
            while (!stack.empty()) {
                const int32_t cur = stack.back();
                stack.pop_back();
                const int32_t cx = cur % w;
                const int32_t cy = cur / w;
                sx += cx;
                sy += cy;
                ++count;
                for (int32_t k = 0; k < 8; ++k) {
                    const int32_t nx = cx + NB_DX[k];
                    const int32_t ny = cy + NB_DY[k];
                    if (!isSet(nx, ny)) continue;
                    const size_t nidx = static_cast<size_t>(ny) * w + nx;
                    if (degree[nidx] >= 3 && nodeOf[nidx] < 0) {
                        nodeOf[nidx] = id;
                        stack.push_back(static_cast<int32_t>(nidx));
                    }
                }
            }
            graph.nodes_[id].position = Point2d(sx / count, sy / count);
        }
    }

    std::vector<uint8_t> visited(total, 0);
    std::set<std::pair<int32_t, int32_t>> directLinks;

    // Walk a chain starting at node pixel `start` through neighbour `first`
    auto walk = [&](int32_t start, int32_t first) {
        const int32_t startNode = nodeOf[start];
        std::vector<Point2i> pixels{Point2i(start % w, start / w)};

        if (nodeOf[first] >= 0) {
            if (nodeOf[first] == startNode) return;
            auto key = std::minmax(start, first);
            if (!directLinks.insert(key).second) return;
            pixels.emplace_back(first % w, first / w);
            graph.AddBranch(startNode, nodeOf[first], std::move(pixels));
            return;
        }
        if (visited[first]) return;

        int32_t prev = start;
        int32_t cur = first;
        int32_t chainPixels = 0;

        while (true) {
            visited[cur] = 1;
            ++chainPixels;
            pixels.emplace_back(cur % w, cur / w);

            const int32_t cx = cur % w;
            const int32_t cy = cur / w;
            int32_t nextNode = -1;
            int32_t nextChain = -1;

            for (int32_t k = 0; k < 8; ++k) {
                const int32_t nx = cx + NB_DX[k];
                const int32_t ny = cy + NB_DY[k];
                if (!isSet(nx, ny)) continue;
                const int32_t nidx = ny * w + nx;
                if (nidx == prev) continue;

                if (nodeOf[nidx] >= 0) {
                    // Returning to the start cluster right away is not a branch
                    if (nodeOf[nidx] == startNode && chainPixels < 2) continue;
                    if (nextNode < 0) nextNode = nidx;
                } else if (!visited[nidx] && nextChain < 0) {
                    nextChain = nidx;
                }
            }

            if (nextNode >= 0) {
                pixels.emplace_back(nextNode % w, nextNode / w);
                graph.AddBranch(startNode, nodeOf[nextNode], std::move(pixels));
                return;
            }
            if (nextChain < 0) {
                // Dead end inside a chain: terminate at a new end node
                const int32_t end = newNode(Point2d(cx, cy));
                nodeOf[cur] = end;
                graph.AddBranch(startNode, end, std::move(pixels));
                return;
            }
            prev = cur;
            cur = nextChain;
        }
    };

    auto traceFromNodes = [&](size_t firstIdx) {
        for (size_t idx = firstIdx; idx < total; ++idx) {
            if (nodeOf[idx] < 0) continue;
            const int32_t x = static_cast<int32_t>(idx % w);
            const int32_t y = static_cast<int32_t>(idx / w);
            for (int32_t k = 0; k < 8; ++k) {
                const int32_t nx = x + NB_DX[k];
                const int32_t ny = y + NB_DY[k];
                if (!isSet(nx, ny)) continue;
                walk(static_cast<int32_t>(idx), ny * w + nx);
            }
        }
    };

    traceFromNodes(0);

    // Pure loops have no node: anchor one at their first pixel
    for (size_t idx = 0; idx < total; ++idx) {
        if (skeleton.data[idx] == 0 || nodeOf[idx] >= 0 || visited[idx]) continue;
        const int32_t x = static_cast<int32_t>(idx % w);
        const int32_t y = static_cast<int32_t>(idx / w);
        nodeOf[idx] = newNode(Point2d(x, y));
        visited[idx] = 1;
        for (int32_t k = 0; k < 8; ++k) {
            const int32_t nx = x + NB_DX[k];
            const int32_t ny = y + NB_DY[k];
            if (!isSet(nx, ny)) continue;
            walk(static_cast<int32_t>(idx), ny * w + nx);
        }
    }

    return graph;
}

int32_t SkeletonGraph::AddBranch(int32_t from, int32_t to, std::vector<Point2i>&& pixels) {
    SkeletonBranch branch;
    branch.from = from;
    branch.to = to;
    branch.length = ChainLength(pixels);
    branch.pixels = std::move(pixels);
    branches_.push_back(std::move(branch));

    const int32_t id = static_cast<int32_t>(branches_.size()) - 1;
    nodes_[from].branches.push_back(id);
    nodes_[to].branches.push_back(id);
    return id;
}

void SkeletonGraph::RemoveBranch(int32_t id) {
    SkeletonBranch& b = branches_[id];
    b.removed = true;
    if (Degree(b.from) == 0) nodes_[b.from].removed = true;
    if (Degree(b.to) == 0) nodes_[b.to].removed = true;
}

// ============================================================================
// Queries
// ============================================================================

int32_t SkeletonGraph::Degree(int32_t node) const {
    int32_t d = 0;
    for (int32_t b : nodes_[node].branches) {
        if (!branches_[b].removed) ++d;
    }
    return d;
}

size_t SkeletonGraph::LiveBranchCount() const {
    return static_cast<size_t>(std::count_if(branches_.begin(), branches_.end(),
                                             [](const SkeletonBranch& b) { return !b.removed; }));
}

// ============================================================================
// Simplification
// ============================================================================

int32_t SkeletonGraph::Prune(double minLength) {
    int32_t removed = 0;
    bool changed = true;

    while (changed) {
        changed = false;

        std::vector<int32_t> candidates;
        for (size_t i = 0; i < branches_.size(); ++i) {
            const auto& b = branches_[i];
            if (!b.removed && b.length < minLength) {
                candidates.push_back(static_cast<int32_t>(i));
            }
        }
        std::stable_sort(candidates.begin(), candidates.end(), [this](int32_t a, int32_t b) {
            return branches_[a].length < branches_[b].length;
        });

        for (int32_t id : candidates) {
            const auto& b = branches_[id];
            if (b.removed) continue;

            bool prune;
            if (b.IsLoop()) {
                // Small isolated ring
                prune = Degree(b.from) == 2;
            } else {
                prune = Degree(b.from) == 1 || Degree(b.to) == 1;
            }
            if (prune) {
                RemoveBranch(id);
                ++removed;
                changed = true;
            }
        }
    }
    return removed;
}

int32_t SkeletonGraph::CollapseDegreeTwo() {
    int32_t collapsed = 0;

    for (size_t n = 0; n < nodes_.size(); ++n) {
        const int32_t node = static_cast<int32_t>(n);
        if (nodes_[n].removed || Degree(node) != 2) continue;

        std::vector<int32_t> live;
        for (int32_t b : nodes_[n].branches) {
            if (!branches_[b].removed) live.push_back(b);
        }
        if (live.size() != 2 || live[0] == live[1]) continue;

        SkeletonBranch a = branches_[live[0]];
        SkeletonBranch b = branches_[live[1]];

        // Orient a to end at the node and b to start at it
        if (a.to != node) {
            std::reverse(a.pixels.begin(), a.pixels.end());
            std::swap(a.from, a.to);
        }
        if (b.from != node) {
            std::reverse(b.pixels.begin(), b.pixels.end());
            std::swap(b.from, b.to);
        }

        std::vector<Point2i> pixels = std::move(a.pixels);
        size_t skip = (!b.pixels.empty() && !pixels.empty() && b.pixels.front() == pixels.back())
                      ? 1 : 0;
        pixels.insert(pixels.end(), b.pixels.begin() + static_cast<std::ptrdiff_t>(skip),
                      b.pixels.end());

        branches_[live[0]].removed = true;
        branches_[live[1]].removed = true;
        nodes_[n].removed = true;

        AddBranch(a.from, b.to, std::move(pixels));
        ++collapsed;
    }
    return collapsed;
}

std::vector<VPath> SkeletonGraph::ToPaths() const {
    std::vector<VPath> paths;
    for (const auto& b : branches_) {
        if (b.removed || b.pixels.empty()) continue;

        VPath path;
        path.Reserve(b.pixels.size());
        for (const auto& p : b.pixels) {
            path.AddPoint(p.x, p.y);
        }
        if (b.IsLoop()) {
            path.SetClosed(true);
        }
        path.RemoveConsecutiveDuplicates();
        if (path.Size() >= 2) {
            paths.push_back(std::move(path));
        }
    }
    return paths;
}

// ============================================================================
// Gap Bridging
// ============================================================================

namespace {

struct EndPoint {
    int32_t path;
    bool atStart;
    Point2d point;
    Point2d outward;
};

Point2d OutwardTangent(const VPath& path, bool atStart) {
    const size_t n = path.Size();
    const size_t k = std::min<size_t>(5, n - 1);
    Point2d tip = atStart ? path[0] : path[n - 1];
    Point2d inner = atStart ? path[k] : path[n - 1 - k];
    return (tip - inner).Normalized();
}

} // anonymous namespace

std::vector<VPath> BridgeEndpoints(const std::vector<VPath>& paths, double maxGap,
                                   double maxAngleDeg) {
    if (maxGap <= 0.0 || paths.empty()) return paths;

    std::vector<EndPoint> ends;
    Rect2d bounds;
    for (size_t i = 0; i < paths.size(); ++i) {
        const VPath& p = paths[i];
        if (p.IsClosed() || p.Size() < 2) continue;
        for (bool atStart : {true, false}) {
            EndPoint e{static_cast<int32_t>(i), atStart,
                       atStart ? p.Front() : p.Back(), OutwardTangent(p, atStart)};
            bounds.Extend(e.point);
            ends.push_back(e);
        }
    }
    if (ends.size() < 2) return paths;

    SpatialGrid grid(bounds.Expanded(maxGap), std::max(maxGap, 1.0));
    for (size_t i = 0; i < ends.size(); ++i) {
        grid.Insert(static_cast<int32_t>(i), ends[i].point);
    }

    const double cosLimit = std::cos(maxAngleDeg * DEG_TO_RAD);
    std::vector<std::tuple<double, int32_t, int32_t>> pairs;
    std::vector<int32_t> near;

    for (size_t i = 0; i < ends.size(); ++i) {
        const EndPoint& a = ends[i];
        grid.QueryRadius(a.point, maxGap, near);
        for (int32_t j : near) {
            if (j <= static_cast<int32_t>(i)) continue;
            const EndPoint& b = ends[j];

            if (a.path == b.path && paths[a.path].Length() <= 2.0 * maxGap) continue;

            const Point2d d = b.point - a.point;
            const double gap = d.Norm();
            bool aligned;
            if (gap < 1e-9) {
                aligned = a.outward.Dot(b.outward * -1.0) >= cosLimit;
            } else {
                const Point2d u = d / gap;
                aligned = a.outward.Dot(u) >= cosLimit && b.outward.Dot(u * -1.0) >= cosLimit;
            }
            if (aligned) {
                pairs.emplace_back(gap, static_cast<int32_t>(i), j);
            }
        }
    }
    std::sort(pairs.begin(), pairs.end());

    // Each end point is 2 * path + (atStart ? 0 : 1)
    auto key = [](const EndPoint& e) { return 2 * e.path + (e.atStart ? 0 : 1); };
    std::vector<int32_t> link(paths.size() * 2, -1);
    for (const auto& [gap, i, j] : pairs) {
        const int32_t ka = key(ends[i]);
        const int32_t kb = key(ends[j]);
        if (link[ka] >= 0 || link[kb] >= 0) continue;
        link[ka] = kb;
        link[kb] = ka;
    }

    std::vector<uint8_t> used(paths.size(), 0);
    std::vector<VPath> result;

    auto appendOriented = [](VPath& out, const VPath& src, bool reversed) {
        const size_t n = src.Size();
        for (size_t k = 0; k < n; ++k) {
            const Point2d& p = reversed ? src[n - 1 - k] : src[k];
            if (!out.Empty() && (out.Back() - p).Norm() < 1e-9) continue;
            out.AddPoint(p);
        }
    };

    // Walk a chain entering path `start` at end `entryKey`
    auto walkChain = [&](int32_t start, int32_t entryKey) {
        VPath out;
        int32_t pathIdx = start;
        int32_t entry = entryKey;
        bool closed = false;

        while (true) {
            used[pathIdx] = 1;
            const bool reversed = (entry % 2) == 1;
            appendOriented(out, paths[pathIdx], reversed);

            const int32_t exitKey = reversed ? 2 * pathIdx : 2 * pathIdx + 1;
            const int32_t next = link[exitKey];
            if (next < 0) break;
            const int32_t nextPath = next / 2;
            if (used[nextPath]) {
                closed = true;
                break;
            }
            pathIdx = nextPath;
            entry = next;
        }

        if (closed) {
            if (out.Size() >= 2 && (out.Front() - out.Back()).Norm() < 1e-9) {
                out.Points().pop_back();
            }
            out.SetClosed(true);
        }
        return out;
    };

    for (size_t i = 0; i < paths.size(); ++i) {
        if (used[i]) continue;
        const VPath& p = paths[i];
        if (p.IsClosed() || p.Size() < 2) {
            used[i] = 1;
            result.push_back(p);
            continue;
        }
        const int32_t s = static_cast<int32_t>(2 * i);
        const int32_t e = s + 1;
        if (link[s] < 0) {
            result.push_back(walkChain(static_cast<int32_t>(i), s));
        } else if (link[e] < 0) {
            result.push_back(walkChain(static_cast<int32_t>(i), e));
        }
    }

    // Remaining paths are on cycles
    for (size_t i = 0; i < paths.size(); ++i) {
        if (used[i]) continue;
        result.push_back(walkChain(static_cast<int32_t>(i), static_cast<int32_t>(2 * i)));
    }

    return result;
}

} // namespace Vx::Trace::Internal
