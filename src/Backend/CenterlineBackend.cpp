/**
 * @file CenterlineBackend.cpp
 * @brief Binarisation, skeletonisation and branch pruning
 */

#include <VxTrace/Backend/CenterlineBackend.h>
#include <VxTrace/Internal/DistanceTransform.h>
#include <VxTrace/Internal/Morphology.h>
#include <VxTrace/Internal/SkeletonGraph.h>
#include <VxTrace/Internal/Thinning.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Preprocess/Denoise.h>
#include <VxTrace/Preprocess/ThresholdMapping.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Backend {

namespace {

std::vector<uint8_t> InkLuminance(const Preprocess::PreparedImage& prepared,
                                  const TraceConfig& config, Platform::ThreadPool* pool) {
    if (!config.noiseFiltering) return prepared.gray;

    std::vector<float> plane(prepared.gray.begin(), prepared.gray.end());
    Preprocess::DenoiseParams params;
    params.spatialSigma = config.noiseSpatialSigma;
    params.rangeSigma = config.noiseRangeSigma;
    plane = Preprocess::Denoise(plane, prepared.width, prepared.height, params, pool);

    std::vector<uint8_t> gray(plane.size());
    for (size_t i = 0; i < plane.size(); ++i) {
        gray[i] = static_cast<uint8_t>(std::clamp(std::lround(plane[i]), 0L, 255L));
    }
    return gray;
}

} // anonymous namespace

CenterlineGeometry ExtractCenterlines(const Preprocess::PreparedImage& prepared,
                                      const TraceConfig& config, double detail,
                                      Platform::ExecutionContext& ctx) {
    const int32_t w = prepared.width;
    const int32_t h = prepared.height;
    const auto& cl = config.centerline;
    const auto mapping = Preprocess::ThresholdMapping::FromDetail(detail, w, h);

    CenterlineGeometry geometry;
    geometry.minLength = cl.minBranchLength > 0.0 ? cl.minBranchLength
                                                  : mapping.minCenterlineBranchPx;

    BinaryMap ink;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "centerline.binarize");
        std::vector<uint8_t> gray = InkLuminance(prepared, config, ctx.Pool());
        ink = Preprocess::BinarizeInk(gray, w, h, cl.binarize, cl.windowSize, cl.sauvolaK,
                                      ctx.Pool());
        if (!prepared.backgroundMask.Empty()) {
            for (size_t i = 0; i < ink.data.size(); ++i) {
                if (prepared.backgroundMask.data[i] != 0) ink.data[i] = 0;
            }
        }
        ink = Internal::Close3x3(Internal::Open3x3(ink));
    }
    geometry.inkPixels = ink.CountSet();
    ctx.CheckDeadline("centerline.binarize");

    if (geometry.inkPixels == 0) {
        Platform::Log::Debug("centerline: no ink after binarization");
        return geometry;
    }

    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "centerline.skeleton");
        if (cl.strategy == SkeletonStrategy::HighPerformance) {
            std::vector<float> distance = Internal::DistanceTransformL2(ink, ctx.Pool());
            Internal::DistanceOrderedThin(ink, distance);
        } else {
            Internal::GuoHallThin(ink);
        }
    }
    geometry.skeletonPixels = ink.CountSet();
    ctx.CheckDeadline("centerline.skeleton");

    std::vector<VPath> paths;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "centerline.graph");
        auto graph = Internal::SkeletonGraph::Build(ink);
        geometry.prunedBranches = graph.Prune(geometry.minLength);
        graph.CollapseDegreeTwo();
        paths = graph.ToPaths();
    }

    if (cl.bridgeGaps && cl.maxGap > 0.0 && paths.size() > 1) {
        paths = Internal::BridgeEndpoints(paths, cl.maxGap);
    }
    geometry.paths = std::move(paths);

    Platform::Log::Debug("centerline: {} ink px, {} skeleton px, {} pruned, {} paths",
                         geometry.inkPixels, geometry.skeletonPixels,
                         geometry.prunedBranches, geometry.paths.size());
    return geometry;
}

} // namespace Vx::Trace::Backend
