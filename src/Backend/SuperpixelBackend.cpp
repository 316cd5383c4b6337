/**
 * @file SuperpixelBackend.cpp
 * @brief SLIC regions, merging and boundary extraction
 */

#include <VxTrace/Backend/SuperpixelBackend.h>
#include <VxTrace/Internal/BoundaryTrace.h>
#include <VxTrace/Internal/ColorConvert.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Preprocess/ThresholdMapping.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <tuple>
#include <utility>

namespace Vx::Trace::Backend {

namespace {

/// Running colour sums of a merged set
struct RegionSums {
    double L = 0.0, a = 0.0, b = 0.0;
    double r = 0.0, g = 0.0, bl = 0.0;
    int64_t area = 0;

    Internal::Lab MeanLab() const {
        const double n = static_cast<double>(std::max<int64_t>(1, area));
        return Internal::Lab(L / n, a / n, b / n);
    }
};

int32_t FindRoot(std::vector<int32_t>& parent, int32_t x) {
    while (parent[x] != x) {
        parent[x] = parent[parent[x]];
        x = parent[x];
    }
    return x;
}

} // anonymous namespace

int32_t MergeSimilarRegions(Internal::SlicResult& slic, double deltaEThreshold) {
    LabelMap& labels = slic.labels;
    const int32_t n = labels.numLabels;
    if (n <= 1 || deltaEThreshold <= 0.0) return 0;

    const int32_t w = labels.width;
    const int32_t h = labels.height;

    std::set<std::pair<int32_t, int32_t>> adjacency;
    for (int32_t y = 0; y < h; ++y) {
        for (int32_t x = 0; x < w; ++x) {
            const int32_t l = labels.At(x, y);
            if (x + 1 < w) {
                const int32_t r = labels.At(x + 1, y);
                if (r != l) adjacency.emplace(std::min(l, r), std::max(l, r));
            }
            if (y + 1 < h) {
                const int32_t d = labels.At(x, y + 1);
                if (d != l) adjacency.emplace(std::min(l, d), std::max(l, d));
            }
        }
    }

    std::vector<std::tuple<double, int32_t, int32_t>> pairs;
    pairs.reserve(adjacency.size());
    for (const auto& [a, b] : adjacency) {
        pairs.emplace_back(Internal::DeltaE(slic.meanLab[a], slic.meanLab[b]), a, b);
    }
    std::sort(pairs.begin(), pairs.end());

    std::vector<RegionSums> sums(n);
    for (int32_t i = 0; i < n; ++i) {
        const double area = slic.area[i];
        sums[i].L = slic.meanLab[i].L * area;
        sums[i].a = slic.meanLab[i].a * area;
        sums[i].b = slic.meanLab[i].b * area;
        sums[i].r = slic.meanColor[i].r * area;
        sums[i].g = slic.meanColor[i].g * area;
        sums[i].bl = slic.meanColor[i].b * area;
        sums[i].area = slic.area[i];
    }

    std::vector<int32_t> parent(n);
    std::iota(parent.begin(), parent.end(), 0);
    int32_t unions = 0;

    for (const auto& [initial, a, b] : pairs) {
        if (initial >= deltaEThreshold) break;
        int32_t ra = FindRoot(parent, a);
        int32_t rb = FindRoot(parent, b);
        if (ra == rb) continue;
        if (Internal::DeltaE(sums[ra].MeanLab(), sums[rb].MeanLab()) >= deltaEThreshold) continue;

        if (rb < ra) std::swap(ra, rb);
        parent[rb] = ra;
        RegionSums& dst = sums[ra];
        const RegionSums& src = sums[rb];
        dst.L += src.L; dst.a += src.a; dst.b += src.b;
        dst.r += src.r; dst.g += src.g; dst.bl += src.bl;
        dst.area += src.area;
        ++unions;
    }
    if (unions == 0) return 0;

    // Compact relabel in raster order
    std::vector<int32_t> remap(n, -1);
    int32_t next = 0;
    for (auto& l : labels.labels) {
        const int32_t root = FindRoot(parent, l);
        if (remap[root] < 0) remap[root] = next++;
        l = remap[root];
    }
    labels.numLabels = next;

    std::vector<Internal::Lab> meanLab(next);
    std::vector<Color> meanColor(next);
    std::vector<int32_t> area(next, 0);
    for (int32_t i = 0; i < n; ++i) {
        if (FindRoot(parent, i) != i) continue;
        const int32_t id = remap[i];
        const RegionSums& s = sums[i];
        const double cnt = static_cast<double>(std::max<int64_t>(1, s.area));
        meanLab[id] = s.MeanLab();
        meanColor[id] = Color(static_cast<uint8_t>(std::lround(s.r / cnt)),
                              static_cast<uint8_t>(std::lround(s.g / cnt)),
                              static_cast<uint8_t>(std::lround(s.bl / cnt)));
        area[id] = static_cast<int32_t>(s.area);
    }
    slic.meanLab = std::move(meanLab);
    slic.meanColor = std::move(meanColor);
    slic.area = std::move(area);
    return n - next;
}

SuperpixelGeometry ExtractRegions(const Preprocess::PreparedImage& prepared,
                                  const TraceConfig& config, double detail,
                                  Platform::ExecutionContext& ctx) {
    const auto& sp = config.superpixel;
    const auto mapping = Preprocess::ThresholdMapping::FromDetail(detail, prepared.width,
                                                                  prepared.height);
    SuperpixelGeometry geometry;

    Internal::SlicParams params;
    params.numSuperpixels = sp.numSuperpixels;
    params.compactness = sp.compactness;
    params.iterations = sp.iterations;
    params.pattern = sp.pattern;
    params.seed = config.randomSeed;

    Internal::SlicResult slic;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "superpixel.slic");
        slic = Internal::ComputeSlic(prepared.color, params, ctx.Pool());
    }
    ctx.CheckDeadline("superpixel.slic");

    geometry.mergedRegions = MergeSimilarRegions(slic, mapping.labMergeThreshold);
    geometry.regionCount = slic.labels.numLabels;

    // A single region spanning a background-only image is the canvas itself
    if (prepared.backgroundCoversImage && geometry.regionCount <= 1) {
        Platform::Log::Debug("superpixel: image is one background region, no fills");
        return geometry;
    }

    std::vector<int32_t> backgroundPixels(slic.labels.numLabels, 0);
    if (!prepared.backgroundMask.Empty()) {
        for (size_t i = 0; i < slic.labels.labels.size(); ++i) {
            if (prepared.backgroundMask.data[i] != 0) ++backgroundPixels[slic.labels.labels[i]];
        }
    }

    Platform::ScopedProfile profile(&ctx.GetProfiler(), "superpixel.boundaries");
    for (int32_t label = 0; label < slic.labels.numLabels; ++label) {
        if ((label & 63) == 0) ctx.CheckDeadline("superpixel.boundaries");
        if (backgroundPixels[label] * 2 > slic.area[label]) continue;

        Internal::RegionBoundary boundary = Internal::TraceAllBoundaries(slic.labels, label);
        geometry.skippedBoundaries += boundary.abandoned;
        if (boundary.rings.empty()) {
            if (boundary.abandoned == 0) ++geometry.skippedBoundaries;
            continue;
        }

        SuperpixelRegion region;
        region.label = label;
        region.rings = std::move(boundary.rings);
        region.color = slic.meanColor[label];
        region.area = slic.area[label];
        geometry.regions.push_back(std::move(region));
    }

    Platform::Log::Debug("superpixel: {} regions ({} merged), {} traced, {} skipped",
                         geometry.regionCount, geometry.mergedRegions,
                         geometry.regions.size(), geometry.skippedBoundaries);
    return geometry;
}

} // namespace Vx::Trace::Backend
