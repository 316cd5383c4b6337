/**
 * @file Slic.cpp
 * @brief SLIC superpixel segmentation
 */

#include <VxTrace/Internal/Slic.h>
#include <VxTrace/Internal/PoissonDisk.h>
#include <VxTrace/Internal/SpatialGrid.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Random.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <numeric>
#include <utility>

namespace Vx::Trace::Internal {

namespace {

struct Center {
    double x, y, L, a, b;
};

// Union-find over connected components
class DisjointSet {
public:
    explicit DisjointSet(size_t n) : parent_(n) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }
    int32_t Find(int32_t i) {
        while (parent_[i] != i) {
            parent_[i] = parent_[parent_[i]];
            i = parent_[i];
        }
        return i;
    }
    // Attach a's root under b's root
    void Attach(int32_t a, int32_t b) {
        parent_[Find(a)] = Find(b);
    }

private:
    std::vector<int32_t> parent_;
};

std::vector<Point2d> SquareSeeds(int32_t width, int32_t height, int32_t count) {
    const double step = std::sqrt(static_cast<double>(width) * height / count);
    int32_t cols = std::max(1, static_cast<int32_t>(std::lround(width / step)));
    int32_t rows = std::max(1, static_cast<int32_t>(std::lround(height / step)));
    while (cols * rows > count) {
        if (cols >= rows) --cols; else --rows;
    }

    std::vector<Point2d> seeds;
    const double sx = static_cast<double>(width) / cols;
    const double sy = static_cast<double>(height) / rows;
    for (int32_t r = 0; r < rows; ++r) {
        for (int32_t c = 0; c < cols; ++c) {
            seeds.emplace_back((c + 0.5) * sx, (r + 0.5) * sy);
        }
    }
    return seeds;
}

std::vector<Point2d> HexSeeds(int32_t width, int32_t height, int32_t count) {
    double step = std::sqrt(static_cast<double>(width) * height / count);
    std::vector<Point2d> seeds;

    for (int32_t attempt = 0; attempt < 64; ++attempt) {
        seeds.clear();
        const double rowStep = step * std::sqrt(3.0) * 0.5;
        int32_t row = 0;
        for (double y = rowStep * 0.5; y < height; y += rowStep, ++row) {
            const double offset = (row % 2 == 0) ? step * 0.5 : step;
            for (double x = offset; x < width; x += step) {
                seeds.emplace_back(x, y);
            }
        }
        if (static_cast<int32_t>(seeds.size()) <= count && !seeds.empty()) break;
        step *= 1.05;
    }

    if (static_cast<int32_t>(seeds.size()) > count) {
        seeds.resize(static_cast<size_t>(count));
    }
    if (seeds.empty()) {
        seeds.emplace_back(width * 0.5, height * 0.5);
    }
    return seeds;
}

} // anonymous namespace

std::vector<Point2d> GenerateSeeds(int32_t width, int32_t height, int32_t count,
                                   SeedPattern pattern, uint64_t seed) {
    if (width <= 0 || height <= 0) return {};
    count = std::clamp(count, 1, width * height);

    switch (pattern) {
        case SeedPattern::Hexagonal:
            return HexSeeds(width, height, count);
        case SeedPattern::Poisson: {
            Platform::Random rng(seed);
            const double step = std::sqrt(static_cast<double>(width) * height / count);
            std::vector<Point2d> seeds = PoissonDiskSample(
                Rect2d(0.0, 0.0, width - 1.0, height - 1.0), 0.8 * step,
                static_cast<size_t>(count), rng);
            if (seeds.empty()) {
                seeds.emplace_back(width * 0.5, height * 0.5);
            }
            return seeds;
        }
        case SeedPattern::Square:
        default:
            return SquareSeeds(width, height, count);
    }
}

// ============================================================================
// Connectivity
// ============================================================================

int32_t EnforceConnectivity(LabelMap& labels, int32_t minSize) {
    const int32_t w = labels.width;
    const int32_t h = labels.height;
    const size_t total = static_cast<size_t>(w) * h;
    if (total == 0) {
        labels.numLabels = 0;
        return 0;
    }

    // 4-connected components of equal label
    std::vector<int32_t> comp(total, -1);
    std::vector<int32_t> compSize;
    std::vector<int32_t> compLabel;
    std::vector<int32_t> stack;
    const int32_t DX[4] = {1, -1, 0, 0};
    const int32_t DY[4] = {0, 0, 1, -1};

    for (size_t i = 0; i < total; ++i) {
        if (comp[i] >= 0) continue;
        const int32_t id = static_cast<int32_t>(compSize.size());
        const int32_t lab = labels.labels[i];
        int32_t size = 0;
        comp[i] = id;
        stack.assign(1, static_cast<int32_t>(i));
        while (!stack.empty()) {
            const int32_t cur = stack.back();
            stack.pop_back();
            ++size;
            const int32_t cx = cur % w;
            const int32_t cy = cur / w;
            for (int32_t d = 0; d < 4; ++d) {
                const int32_t nx = cx + DX[d];
                const int32_t ny = cy + DY[d];
                if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
                const int32_t n = ny * w + nx;
                if (comp[n] < 0 && labels.labels[n] == lab) {
                    comp[n] = id;
                    stack.push_back(n);
                }
            }
        }
        compSize.push_back(size);
        compLabel.push_back(lab);
    }

    const int32_t numComps = static_cast<int32_t>(compSize.size());

    // Largest component per label, kept if big enough
    std::map<int32_t, int32_t> largest;
    for (int32_t c = 0; c < numComps; ++c) {
        auto it = largest.find(compLabel[c]);
        if (it == largest.end() || compSize[c] > compSize[it->second]) {
            largest[compLabel[c]] = c;
        }
    }
    std::vector<uint8_t> kept(numComps, 0);
    bool anyKept = false;
    for (const auto& [lab, c] : largest) {
        if (compSize[c] >= minSize) {
            kept[c] = 1;
            anyKept = true;
        }
    }
    if (!anyKept) {
        kept[std::max_element(compSize.begin(), compSize.end()) - compSize.begin()] = 1;
    }

    // Shared border lengths between components
    std::map<std::pair<int32_t, int32_t>, int32_t> border;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const int32_t c = comp[static_cast<size_t>(y) * w + x];
            if (x + 1 < w) {
                const int32_t r = comp[static_cast<size_t>(y) * w + x + 1];
                if (r != c) ++border[std::minmax(c, r)];
            }
            if (y + 1 < h) {
                const int32_t d = comp[static_cast<size_t>(y + 1) * w + x];
                if (d != c) ++border[std::minmax(c, d)];
            }
        }
    }
    std::vector<std::vector<std::pair<int32_t, int32_t>>> neighbors(numComps);
    for (const auto& [key, len] : border) {
        neighbors[key.first].emplace_back(key.second, len);
        neighbors[key.second].emplace_back(key.first, len);
    }

    DisjointSet sets(static_cast<size_t>(numComps));
    std::vector<uint8_t> rootKept(kept);

    // Merge every set without a kept component into a neighbour
    bool changed = true;
    while (changed) {
        changed = false;
        for (int32_t c = 0; c < numComps; ++c) {
            const int32_t root = sets.Find(c);
            if (rootKept[root]) continue;

            int32_t best = -1;
            int32_t bestLen = -1;
            bool bestKept = false;
            for (const auto& [n, len] : neighbors[c]) {
                const int32_t nr = sets.Find(n);
                if (nr == root) continue;
                const bool nk = rootKept[nr] != 0;
                if ((nk && !bestKept) || (nk == bestKept && len > bestLen)) {
                    best = nr;
                    bestLen = len;
                    bestKept = nk;
                }
            }
            if (best >= 0) {
                sets.Attach(root, best);
                rootKept[sets.Find(best)] = rootKept[sets.Find(best)] || bestKept;
                changed = true;
            }
        }
    }

    // Compact relabel in raster order
    std::vector<int32_t> remap(numComps, -1);
    int32_t next = 0;
    for (size_t i = 0; i < total; ++i) {
        const int32_t root = sets.Find(comp[i]);
        if (remap[root] < 0) remap[root] = next++;
        labels.labels[i] = remap[root];
    }
    labels.numLabels = next;
    return next;
}

// ============================================================================
// SLIC
// ============================================================================

SlicResult ComputeSlic(const VImage& image, const SlicParams& params, Platform::ThreadPool* pool) {
    SlicResult result;
    const int32_t w = image.Width();
    const int32_t h = image.Height();
    const size_t total = static_cast<size_t>(w) * h;
    if (total == 0) return result;

    std::vector<float> L(total), A(total), B(total);
    ImageToLab(image, L.data(), A.data(), B.data(), pool);

    const int32_t k = std::clamp(params.numSuperpixels, 1, static_cast<int32_t>(total));
    const double step = std::sqrt(static_cast<double>(total) / k);
    const double m = params.compactness;
    const double spatialScale = (m / step) * (m / step);

    std::vector<Point2d> seeds = GenerateSeeds(w, h, k, params.pattern, params.seed);
    result.seedCount = static_cast<int32_t>(seeds.size());

    auto gradientAt = [&](int32_t x, int32_t y) {
        const int32_t xl = std::max(x - 1, 0), xr = std::min(x + 1, w - 1);
        const int32_t yu = std::max(y - 1, 0), yd = std::min(y + 1, h - 1);
        auto at = [&](const std::vector<float>& p, int32_t px, int32_t py) {
            return static_cast<double>(p[static_cast<size_t>(py) * w + px]);
        };
        double g = 0.0;
        for (const auto* plane : {&L, &A, &B}) {
            const double dx = at(*plane, xr, y) - at(*plane, xl, y);
            const double dy = at(*plane, x, yd) - at(*plane, x, yu);
            g += dx * dx + dy * dy;
        }
        return g;
    };

    std::vector<Center> centers;
    centers.reserve(seeds.size());
    for (const auto& s : seeds) {
        int32_t sx = std::clamp(static_cast<int32_t>(s.x), 0, w - 1);
        int32_t sy = std::clamp(static_cast<int32_t>(s.y), 0, h - 1);
        int32_t bx = sx, by = sy;
        double bestG = gradientAt(sx, sy);
        for (int32_t dy = -1; dy <= 1; ++dy) {
            for (int32_t dx = -1; dx <= 1; ++dx) {
                const int32_t nx = sx + dx, ny = sy + dy;
                if (nx < 0 || ny < 0 || nx >= w || ny >= h) continue;
                const double g = gradientAt(nx, ny);
                if (g < bestG) {
                    bestG = g;
                    bx = nx;
                    by = ny;
                }
            }
        }
        const size_t idx = static_cast<size_t>(by) * w + bx;
        centers.push_back({static_cast<double>(bx), static_cast<double>(by), L[idx], A[idx], B[idx]});
    }

    LabelMap labels(w, h);
    const Rect2d bounds(0.0, 0.0, w - 1.0, h - 1.0);

    for (int32_t iter = 0; iter < std::max(1, params.iterations); ++iter) {
        SpatialGrid grid(bounds, 2.0 * step);
        for (size_t c = 0; c < centers.size(); ++c) {
            grid.Insert(static_cast<int32_t>(c), Point2d(centers[c].x, centers[c].y));
        }

        std::vector<uint8_t> rowChanged(static_cast<size_t>(h), 0);
        Platform::ParallelFor(pool, 0, static_cast<size_t>(h), [&](size_t row) {
            const int32_t y = static_cast<int32_t>(row);
            std::vector<int32_t> near;
            for (int32_t x = 0; x < w; ++x) {
                const size_t idx = static_cast<size_t>(y) * w + x;
                const Point2d p(x, y);

                grid.QueryRadius(p, 2.0 * step, near);
                if (near.empty()) grid.QueryRadius(p, 4.0 * step, near);
                if (near.empty()) {
                    near.resize(centers.size());
                    std::iota(near.begin(), near.end(), 0);
                }

                int32_t best = -1;
                double bestD = std::numeric_limits<double>::max();
                for (int32_t c : near) {
                    const Center& ct = centers[c];
                    const double dl = L[idx] - ct.L;
                    const double da = A[idx] - ct.a;
                    const double db = B[idx] - ct.b;
                    const double dx = x - ct.x;
                    const double dy = y - ct.y;
                    const double d = dl * dl + da * da + db * db +
                                     (dx * dx + dy * dy) * spatialScale;
                    if (d < bestD) {
                        bestD = d;
                        best = c;
                    }
                }
                if (labels.labels[idx] != best) {
                    labels.labels[idx] = best;
                    rowChanged[row] = 1;
                }
            }
        });

        result.iterationsRun = iter + 1;
        const bool anyChange = std::any_of(rowChanged.begin(), rowChanged.end(),
                                           [](uint8_t v) { return v != 0; });
        if (!anyChange) break;

        // Move centres to the mean of their pixels
        std::vector<Center> sums(centers.size(), Center{0, 0, 0, 0, 0});
        std::vector<int64_t> counts(centers.size(), 0);
        for (size_t i = 0; i < total; ++i) {
            const int32_t c = labels.labels[i];
            Center& s = sums[c];
            s.x += static_cast<double>(i % w);
            s.y += static_cast<double>(i / w);
            s.L += L[i];
            s.a += A[i];
            s.b += B[i];
            ++counts[c];
        }
        for (size_t c = 0; c < centers.size(); ++c) {
            if (counts[c] == 0) continue;
            const double inv = 1.0 / static_cast<double>(counts[c]);
            centers[c] = {sums[c].x * inv, sums[c].y * inv, sums[c].L * inv,
                          sums[c].a * inv, sums[c].b * inv};
        }
    }

    labels.numLabels = static_cast<int32_t>(centers.size());
    const int32_t minSize = std::max(1, static_cast<int32_t>(step * step / 4.0));
    const int32_t regions = EnforceConnectivity(labels, minSize);

    Platform::Log::Debug("SLIC: {} seeds, {} iterations, {} regions",
                         result.seedCount, result.iterationsRun, regions);

    // Region statistics from the final labels
    std::vector<double> sumL(regions, 0.0), sumA(regions, 0.0), sumB(regions, 0.0);
    std::vector<double> sumR(regions, 0.0), sumG(regions, 0.0), sumBl(regions, 0.0);
    result.area.assign(regions, 0);
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const size_t i = static_cast<size_t>(y) * w + x;
            const int32_t r = labels.labels[i];
            const Color c = CompositeOverWhite(image.PixelColor(x, y));
            sumL[r] += L[i];
            sumA[r] += A[i];
            sumB[r] += B[i];
            sumR[r] += c.r;
            sumG[r] += c.g;
            sumBl[r] += c.b;
            ++result.area[r];
        }
    }
    result.meanLab.resize(regions);
    result.meanColor.resize(regions);
    for (int32_t r = 0; r < regions; ++r) {
        const double n = std::max(1, result.area[r]);
        result.meanLab[r] = Lab(sumL[r] / n, sumA[r] / n, sumB[r] / n);
        result.meanColor[r] = Color(static_cast<uint8_t>(std::lround(sumR[r] / n)),
                                    static_cast<uint8_t>(std::lround(sumG[r] / n)),
                                    static_cast<uint8_t>(std::lround(sumBl[r] / n)));
    }

    result.labels = std::move(labels);
    return result;
}

} // namespace Vx::Trace::Internal
