/**
 * @file FlowTrace.cpp
 * @brief Bidirectional flow-guided tracing
 */

#include <VxTrace/Internal/FlowTrace.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

namespace {

class FlowTracer {
public:
    FlowTracer(const BinaryMap& edges, const FlowField& flow, const FlowTraceParams& params)
        : edges_(edges), flow_(flow), params_(params),
          traced_(static_cast<size_t>(edges.width) * edges.height, 0),
          minCos_(std::cos(params.maxAngleDeg * PI / 180.0)) {}

    bool Traced(size_t idx) const { return traced_[idx] != 0; }

    /**
     * @brief Step from the seed along heading (hx, hy)
     * @return Points after the seed, nearest first
     */
    std::vector<Point2d> Walk(int32_t sx, int32_t sy, double hx, double hy) {
        std::vector<Point2d> points;
        size_t supported = 0;
        int32_t gap = 0;
        double x = sx;
        double y = sy;
        size_t current = Index(sx, sy);

        for (int32_t step = 0; step < params_.maxSteps; ++step) {
            const double nx = x + hx * params_.stepSize;
            const double ny = y + hy * params_.stepSize;
            const int32_t px = static_cast<int32_t>(std::lround(nx));
            const int32_t py = static_cast<int32_t>(std::lround(ny));
            if (px < 0 || py < 0 || px >= edges_.width || py >= edges_.height) break;

            const size_t idx = Index(px, py);
            if (idx != current && traced_[idx] != 0) break;

            const float coherency = flow_.coherency[idx];
            const bool onEdge = edges_.data[idx] != 0;

            if (coherency >= params_.minCoherency) {
                double tx = flow_.tx[idx];
                double ty = flow_.ty[idx];
                double dot = hx * tx + hy * ty;
                if (dot < 0.0) {
                    tx = -tx;
                    ty = -ty;
                    dot = -dot;
                }
                if (onEdge && dot < minCos_) break;
                if (dot >= minCos_) {
                    hx = tx;
                    hy = ty;
                }
            } else if (onEdge) {
                break;
            }

            if (onEdge) {
                gap = 0;
            } else if (++gap > params_.maxGap) {
                break;
            }

            x = nx;
            y = ny;
            current = idx;
            points.emplace_back(nx, ny);
            if (onEdge) {
                supported = points.size();
                Mark(idx);
            }
        }

        points.resize(supported);
        return points;
    }

    void Mark(size_t idx) { traced_[idx] = 1; }

    size_t Index(int32_t x, int32_t y) const {
        return static_cast<size_t>(y) * edges_.width + x;
    }

private:
    const BinaryMap& edges_;
    const FlowField& flow_;
    const FlowTraceParams& params_;
    std::vector<uint8_t> traced_;
    double minCos_;
};

VPath Thinned(std::vector<Point2d>&& raw, double minSpacing) {
    VPath path;
    if (raw.empty()) return path;
    path.Reserve(raw.size());
    path.AddPoint(raw.front());
    for (size_t i = 1; i + 1 < raw.size(); ++i) {
        if (raw[i].DistanceTo(path.Back()) >= minSpacing) path.AddPoint(raw[i]);
    }
    if (raw.size() > 1) {
        if (raw.back().DistanceTo(path.Back()) >= minSpacing || path.Size() == 1) {
            path.AddPoint(raw.back());
        } else {
            path[path.Size() - 1] = raw.back();
        }
    }
    return path;
}

} // anonymous namespace

std::vector<VPath> TraceFlowPolylines(const BinaryMap& edges, const FlowField& flow,
                                      const float* response, const FlowTraceParams& params,
                                      FlowTraceStats* stats) {
    std::vector<VPath> polylines;
    const size_t total = static_cast<size_t>(edges.width) * edges.height;
    if (total == 0 || flow.tx.size() != total) return polylines;

    float maxResponse = 0.0f;
    if (response != nullptr) {
        for (size_t i = 0; i < total; ++i) maxResponse = std::max(maxResponse, response[i]);
    }

    std::vector<int32_t> seeds;
    for (size_t i = 0; i < total; ++i) {
        if (edges.data[i] == 0 || flow.coherency[i] < params.minCoherency) continue;
        if (maxResponse > 0.0f && response[i] < params.minStrength * maxResponse) continue;
        seeds.push_back(static_cast<int32_t>(i));
    }
    if (maxResponse > 0.0f) {
        std::stable_sort(seeds.begin(), seeds.end(), [&](int32_t a, int32_t b) {
            return response[a] > response[b];
        });
    }

    FlowTracer tracer(edges, flow, params);
    for (int32_t seed : seeds) {
        if (tracer.Traced(static_cast<size_t>(seed))) continue;
        const int32_t sx = seed % edges.width;
        const int32_t sy = seed / edges.width;
        const double tx = flow.tx[seed];
        const double ty = flow.ty[seed];

        tracer.Mark(static_cast<size_t>(seed));
        std::vector<Point2d> forward = tracer.Walk(sx, sy, tx, ty);
        std::vector<Point2d> backward = tracer.Walk(sx, sy, -tx, -ty);

        std::vector<Point2d> raw;
        raw.reserve(backward.size() + forward.size() + 1);
        raw.insert(raw.end(), backward.rbegin(), backward.rend());
        raw.emplace_back(sx, sy);
        raw.insert(raw.end(), forward.begin(), forward.end());
        if (raw.size() < 3) continue;

        VPath path = Thinned(std::move(raw), 2.0 * params.stepSize);
        if (path.Size() < 3) continue;
        path.SetClosed(path.Size() >= static_cast<size_t>(params.minClosedPoints) &&
                       path.Front().DistanceTo(path.Back()) <= params.closeDistance);
        polylines.push_back(std::move(path));
    }

    if (stats != nullptr) {
        stats->seeds = seeds.size();
        stats->traces = polylines.size();
    }
    return polylines;
}

} // namespace Vx::Trace::Internal
