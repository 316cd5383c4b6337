/**
 * @file EdgeLinking.cpp
 * @brief Edge pixel chaining
 */

#include <VxTrace/Internal/EdgeLinking.h>

#include <algorithm>
#include <cstdlib>

namespace Vx::Trace::Internal {

namespace {

const int32_t NB_DX[8] = {1, 0, -1, 0, 1, -1, -1, 1};
const int32_t NB_DY[8] = {0, 1, 0, -1, 1, 1, -1, -1};

class ChainWalker {
public:
    ChainWalker(const BinaryMap& edges, std::vector<uint8_t>& used)
        : edges_(edges), used_(used) {}

    // Follow unused pixels from (x, y); appends the pixels stepped onto
    void Walk(int32_t x, int32_t y, std::vector<Point2i>& chain) const {
        while (true) {
            int32_t next = -1;
            for (int32_t k = 0; k < 8; ++k) {
                const int32_t nx = x + NB_DX[k];
                const int32_t ny = y + NB_DY[k];
                if (nx < 0 || ny < 0 || nx >= edges_.width || ny >= edges_.height) continue;
                const int32_t idx = ny * edges_.width + nx;
                if (edges_.data[idx] != 0 && !used_[idx]) {
                    next = idx;
                    break;
                }
            }
            if (next < 0) return;

            used_[next] = 1;
            x = next % edges_.width;
            y = next / edges_.width;
            chain.emplace_back(x, y);
        }
    }

private:
    const BinaryMap& edges_;
    std::vector<uint8_t>& used_;
};

int32_t CountNeighbors(const BinaryMap& edges, int32_t x, int32_t y) {
    int32_t n = 0;
    for (int32_t k = 0; k < 8; ++k) {
        const int32_t nx = x + NB_DX[k];
        const int32_t ny = y + NB_DY[k];
        if (nx >= 0 && ny >= 0 && nx < edges.width && ny < edges.height && edges.At(nx, ny)) {
            ++n;
        }
    }
    return n;
}

} // anonymous namespace

std::vector<VPath> LinkEdgePixels(const BinaryMap& edges, const EdgeLinkParams& params) {
    std::vector<VPath> chains;
    const int32_t w = edges.width;
    const int32_t h = edges.height;
    const size_t total = static_cast<size_t>(w) * h;
    if (total == 0) return chains;

    std::vector<uint8_t> used(total, 0);
    ChainWalker walker(edges, used);

    std::vector<int32_t> order(total);
    for (size_t i = 0; i < total; ++i) {
        order[i] = static_cast<int32_t>(i);
    }
    if (params.reverseScan) {
        std::reverse(order.begin(), order.end());
    }

    auto emit = [&](std::vector<Point2i>& chain) {
        if (chain.size() < 2) return;
        const Point2i& a = chain.front();
        const Point2i& b = chain.back();
        const int32_t cheb = std::max(std::abs(a.x - b.x), std::abs(a.y - b.y));

        VPath path;
        path.Reserve(chain.size());
        for (const auto& p : chain) {
            path.AddPoint(p.x, p.y);
        }
        path.SetClosed(cheb <= params.closeDistance &&
                       static_cast<int32_t>(chain.size()) >= params.minClosedPixels);
        chains.push_back(std::move(path));
    };

    // End points first
    for (int32_t idx : order) {
        if (edges.data[idx] == 0 || used[idx]) continue;
        const int32_t x = idx % w;
        const int32_t y = idx / w;
        if (CountNeighbors(edges, x, y) != 1) continue;

        used[idx] = 1;
        std::vector<Point2i> chain{Point2i(x, y)};
        walker.Walk(x, y, chain);
        emit(chain);
    }

    // Whatever is left: loops and segments between junctions
    for (int32_t idx : order) {
        if (edges.data[idx] == 0 || used[idx]) continue;
        const int32_t x = idx % w;
        const int32_t y = idx / w;

        used[idx] = 1;
        std::vector<Point2i> forward{Point2i(x, y)};
        walker.Walk(x, y, forward);

        std::vector<Point2i> backward;
        walker.Walk(x, y, backward);

        std::vector<Point2i> chain(backward.rbegin(), backward.rend());
        chain.insert(chain.end(), forward.begin(), forward.end());
        emit(chain);
    }

    return chains;
}

} // namespace Vx::Trace::Internal
