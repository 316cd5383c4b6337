/**
 * @file EdgeBackend.cpp
 * @brief Edge pass implementation
 */

#include <VxTrace/Backend/EdgeBackend.h>
#include <VxTrace/Core/Constants.h>
#include <VxTrace/Internal/Canny.h>
#include <VxTrace/Internal/EdgeLinking.h>
#include <VxTrace/Internal/EdgeTangentFlow.h>
#include <VxTrace/Internal/FlowTrace.h>
#include <VxTrace/Internal/Gaussian.h>
#include <VxTrace/Internal/Gradient.h>
#include <VxTrace/Internal/Thinning.h>
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/Profiler.h>
#include <VxTrace/Preprocess/Denoise.h>
#include <VxTrace/Preprocess/ThresholdMapping.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace Vx::Trace::Backend {

namespace {

constexpr double DIRECTIONAL_DETAIL_SCALE = 0.8;
constexpr double DIRECTIONAL_LENGTH_SCALE = 1.2;
constexpr double REVERSE_THRESHOLD_SCALE = 0.85;
constexpr double DIAGONAL_THRESHOLD_SCALE = 1.15;

/// Float luminance, bilateral-filtered when noise filtering is on
std::vector<float> WorkingLuminance(const Preprocess::PreparedImage& prepared,
                                    const TraceConfig& config, Platform::ThreadPool* pool) {
    std::vector<float> gray(prepared.gray.begin(), prepared.gray.end());
    if (!config.noiseFiltering) return gray;

    Preprocess::DenoiseParams params;
    params.spatialSigma = config.noiseSpatialSigma;
    params.rangeSigma = config.noiseRangeSigma;
    return Preprocess::Denoise(gray, prepared.width, prepared.height, params, pool);
}

/// Thin, link and prune; shared tail of every edge pass
EdgeGeometry ChainsFromEdges(BinaryMap& edges, double minLength, bool reverseScan,
                             PassDirection direction, Platform::ExecutionContext& ctx) {
    EdgeGeometry geometry;
    geometry.direction = direction;
    geometry.minLength = minLength;

    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.thin");
        Internal::GuoHallThin(edges);
    }
    geometry.edgePixels = edges.CountSet();
    ctx.CheckDeadline("edge.thin");

    Internal::EdgeLinkParams link;
    link.reverseScan = reverseScan;
    std::vector<VPath> chains;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.link");
        chains = Internal::LinkEdgePixels(edges, link);
    }

    const bool diagonalOnly = direction == PassDirection::DiagonalNW ||
                              direction == PassDirection::DiagonalNE;
    geometry.chains.reserve(chains.size());
    for (auto& chain : chains) {
        if (chain.Length() < minLength) continue;
        if (diagonalOnly && !IsDiagonalOriented(chain)) continue;
        geometry.chains.push_back(std::move(chain));
    }

    Platform::Log::Debug("edge[{}]: {} edge pixels, {} of {} chains kept (min length {:.1f})",
                         PassDirectionName(direction), geometry.edgePixels,
                         geometry.chains.size(), chains.size(), minLength);
    return geometry;
}

Internal::EtfParams EtfFromConfig(const TraceConfig& config) {
    Internal::EtfParams etf;
    etf.radius = config.edge.etfRadius;
    etf.iterations = config.edge.etfIterations;
    etf.coherencyTau = config.edge.etfCoherencyTau;
    return etf;
}

Internal::FdogParams FdogFromConfig(const TraceConfig& config) {
    Internal::FdogParams fdog;
    fdog.sigmaS = config.edge.fdogSigmaS;
    fdog.sigmaC = config.edge.fdogSigmaC;
    fdog.sigmaM = config.edge.fdogSigmaM;
    fdog.rho = config.edge.fdogRho;
    return fdog;
}

// FDoG smooths across and along the flow itself, so it gets the unblurred luminance
BinaryMap DetectWithFlow(const std::vector<float>& gray, int32_t w, int32_t h,
                         const TraceConfig& config, Platform::ExecutionContext& ctx) {
    Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.etf_fdog");
    return Internal::DetectFlowEdges(gray.data(), w, h, EtfFromConfig(config),
                                     FdogFromConfig(config), config.edge.nmsLow,
                                     config.edge.nmsHigh, ctx.Pool());
}

Internal::FlowTraceParams FlowTraceFromConfig(const TraceConfig& config) {
    Internal::FlowTraceParams trace;
    trace.minStrength = config.edge.traceMinGradient;
    trace.minCoherency = config.edge.traceMinCoherency;
    trace.maxGap = config.edge.traceMaxGap;
    trace.maxSteps = config.edge.traceMaxLength;
    trace.stepSize = config.edge.traceStep;
    trace.maxAngleDeg = config.edge.traceMaxAngleDeg;
    return trace;
}

/// ETF/FDoG edges traced along the flow instead of linked pixel by pixel
EdgeGeometry FlowTracedEdges(const std::vector<float>& gray, int32_t w, int32_t h,
                             double minLength, const TraceConfig& config,
                             Platform::ExecutionContext& ctx) {
    EdgeGeometry geometry;
    geometry.direction = PassDirection::Standard;
    geometry.minLength = minLength;

    Internal::FlowField flow;
    std::vector<float> response;
    BinaryMap edges;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.etf_fdog");
        flow = Internal::ComputeEdgeTangentFlow(gray.data(), w, h, EtfFromConfig(config),
                                                ctx.Pool());
        response = Internal::ComputeFdog(gray.data(), w, h, flow, FdogFromConfig(config),
                                         ctx.Pool());
        edges = Internal::EdgesFromFlowResponse(response.data(), flow.tx.data(), flow.ty.data(),
                                                w, h, config.edge.nmsLow, config.edge.nmsHigh,
                                                1.0, ctx.Pool());
    }
    ctx.CheckDeadline("edge.detect");

    Internal::GuoHallThin(edges);
    geometry.edgePixels = edges.CountSet();

    Internal::FlowTraceStats stats;
    std::vector<VPath> traces;
    {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.flow_trace");
        traces = Internal::TraceFlowPolylines(edges, flow, response.data(),
                                              FlowTraceFromConfig(config), &stats);
    }
    ctx.CheckDeadline("edge.flow_trace");

    geometry.chains.reserve(traces.size());
    for (auto& trace : traces) {
        if (trace.Length() < minLength) continue;
        geometry.chains.push_back(std::move(trace));
    }

    Platform::Log::Debug("edge[flow]: {} edge pixels, {} seeds, {} of {} traces kept",
                         geometry.edgePixels, stats.seeds, geometry.chains.size(), stats.traces);
    return geometry;
}

/**
 * Directional flow pass: FDoG with the tangent field rotated by -22.5, 0 and
 * +22.5 degrees, strongest response per pixel. Diagonal passes keep only
 * pixels whose edge normal lies within 22.5 degrees of the pass orientation.
 */
BinaryMap DirectionalFlowEdges(const std::vector<float>& gray, int32_t w, int32_t h,
                               PassDirection direction, double thresholdScale,
                               const TraceConfig& config, Platform::ExecutionContext& ctx) {
    const size_t count = static_cast<size_t>(w) * h;
    Internal::FlowField flow = Internal::ComputeEdgeTangentFlow(gray.data(), w, h,
                                                                EtfFromConfig(config), ctx.Pool());
    ctx.CheckDeadline("edge.etf");

    const std::vector<double> orientations = {0.0, -PI / 8.0, PI / 8.0};
    Internal::MultiDirectionResponse multi = Internal::ComputeMultiDirectionFdog(
        gray.data(), w, h, flow, orientations, FdogFromConfig(config), ctx.Pool());
    ctx.CheckDeadline("edge.fdog");

    // Tangent that produced the selected response
    std::vector<float> tx(count), ty(count);
    for (size_t i = 0; i < count; ++i) {
        const double c = std::cos(multi.dominant[i]);
        const double s = std::sin(multi.dominant[i]);
        tx[i] = static_cast<float>(flow.tx[i] * c - flow.ty[i] * s);
        ty[i] = static_cast<float>(flow.tx[i] * s + flow.ty[i] * c);
    }

    if (direction == PassDirection::DiagonalNW || direction == PassDirection::DiagonalNE) {
        const double angle = direction == PassDirection::DiagonalNW ? PI / 4.0 : 3.0 * PI / 4.0;
        const double ca = std::cos(angle);
        const double sa = std::sin(angle);
        const double minAlign = std::cos(PI / 8.0);
        for (size_t i = 0; i < count; ++i) {
            const double align = std::abs(-ty[i] * ca + tx[i] * sa);
            if (align < minAlign) multi.combined[i] = 0.0f;
        }
    }

    return Internal::EdgesFromFlowResponse(multi.combined.data(), tx.data(), ty.data(), w, h,
                                           config.edge.nmsLow, config.edge.nmsHigh,
                                           thresholdScale, ctx.Pool());
}

} // anonymous namespace

const char* PassDirectionName(PassDirection direction) {
    switch (direction) {
        case PassDirection::Standard:   return "standard";
        case PassDirection::Reverse:    return "reverse";
        case PassDirection::DiagonalNW: return "diagonal-nw";
        case PassDirection::DiagonalNE: return "diagonal-ne";
    }
    return "unknown";
}

bool IsDiagonalOriented(const VPath& path) {
    if (path.Size() < 2) return false;

    const double dx = std::abs(path.Back().x - path.Front().x);
    const double dy = std::abs(path.Back().y - path.Front().y);
    const double maxDelta = std::max(dx, dy);
    if (maxDelta < 1.0) return false;
    return std::min(dx, dy) / maxDelta > 0.4;
}

EdgeGeometry ExtractEdges(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                          double detail, Platform::ExecutionContext& ctx) {
    const int32_t w = prepared.width;
    const int32_t h = prepared.height;
    const auto mapping = Preprocess::ThresholdMapping::FromDetail(detail, w, h);
    const double sigma = 1.0 + std::clamp(detail, 0.0, 1.0);

    std::vector<float> gray = WorkingLuminance(prepared, config, ctx.Pool());
    ctx.CheckDeadline("edge.denoise");

    if (config.edge.etfFdog && config.edge.flowTracing) {
        return FlowTracedEdges(gray, w, h, mapping.minStrokeLengthPx, config, ctx);
    }

    BinaryMap edges;
    if (config.edge.etfFdog) {
        edges = DetectWithFlow(gray, w, h, config, ctx);
    } else {
        Platform::ScopedProfile profile(&ctx.GetProfiler(), "edge.canny");
        Internal::CannyParams canny;
        canny.sigma = sigma;
        canny.lowRatio = mapping.cannyLowRatio;
        canny.highRatio = mapping.cannyHighRatio;
        edges = Internal::DetectCannyEdges(gray.data(), w, h, canny, ctx.Pool());
    }
    ctx.CheckDeadline("edge.detect");

    return ChainsFromEdges(edges, mapping.minStrokeLengthPx, false, PassDirection::Standard, ctx);
}

EdgeGeometry DirectionalEdges(const Preprocess::PreparedImage& prepared, const TraceConfig& config,
                              double detail, PassDirection direction,
                              Platform::ExecutionContext& ctx) {
    if (direction == PassDirection::Standard) {
        return ExtractEdges(prepared, config, detail, ctx);
    }

    const int32_t w = prepared.width;
    const int32_t h = prepared.height;
    const size_t count = static_cast<size_t>(w) * h;
    const double d = std::clamp(detail, 0.0, 1.0);
    const auto mapping = Preprocess::ThresholdMapping::FromDetail(d * DIRECTIONAL_DETAIL_SCALE, w, h);
    const double minLength = mapping.minStrokeLengthPx * DIRECTIONAL_LENGTH_SCALE;

    std::vector<float> gray = WorkingLuminance(prepared, config, ctx.Pool());
    Platform::ScopedProfile profile(&ctx.GetProfiler(),
                                    std::string("edge.") + PassDirectionName(direction));

    BinaryMap edges;
    if (config.edge.etfFdog) {
        const double scale = direction == PassDirection::Reverse ? REVERSE_THRESHOLD_SCALE
                                                                 : DIAGONAL_THRESHOLD_SCALE;
        edges = DirectionalFlowEdges(gray, w, h, direction, scale, config, ctx);
        ctx.CheckDeadline("edge.directional");
        return ChainsFromEdges(edges, minLength, direction == PassDirection::Reverse,
                               direction, ctx);
    }

    if (direction == PassDirection::Reverse) {
        Internal::CannyParams canny;
        canny.sigma = 1.2 + 0.8 * d;
        canny.lowRatio = mapping.cannyLowRatio * REVERSE_THRESHOLD_SCALE;
        canny.highRatio = mapping.cannyHighRatio * REVERSE_THRESHOLD_SCALE;
        edges = Internal::DetectCannyEdges(gray.data(), w, h, canny, ctx.Pool());
        ctx.CheckDeadline("edge.reverse");
        return ChainsFromEdges(edges, minLength, true, direction, ctx);
    }

    // Diagonal: keep only the gradient component along the pass orientation
    const double angle = direction == PassDirection::DiagonalNW ? PI / 4.0 : 3.0 * PI / 4.0;
    const float c = static_cast<float>(std::cos(angle));
    const float s = static_cast<float>(std::sin(angle));

    auto blurred = ctx.FloatPool().Acquire(count);
    auto gx = ctx.FloatPool().Acquire(count);
    auto gy = ctx.FloatPool().Acquire(count);
    Internal::GaussianBlur(gray.data(), blurred.Data(), w, h, 0.8 + 1.2 * d, ctx.Pool());
    Internal::SobelGradient(blurred.Data(), gx.Data(), gy.Data(), w, h, ctx.Pool());

    Platform::ParallelFor(ctx.Pool(), 0, count, [&](size_t i) {
        float p = gx[i] * c + gy[i] * s;
        gx[i] = p * c;
        gy[i] = p * s;
    }, 4096);

    edges = Internal::EdgesFromGradient(gx.Data(), gy.Data(), w, h,
                                        mapping.cannyLowRatio * DIAGONAL_THRESHOLD_SCALE,
                                        std::min(1.0, mapping.cannyHighRatio * DIAGONAL_THRESHOLD_SCALE),
                                        ctx.Pool());
    ctx.CheckDeadline("edge.diagonal");
    return ChainsFromEdges(edges, minLength, false, direction, ctx);
}

} // namespace Vx::Trace::Backend
