/**
 * @file EdgeTangentFlow.cpp
 * @brief ETF refinement and FDoG filtering
 */

#include <VxTrace/Internal/EdgeTangentFlow.h>
#include <VxTrace/Internal/Canny.h>
#include <VxTrace/Internal/Gaussian.h>
#include <VxTrace/Internal/Gradient.h>
#include <VxTrace/Internal/NonMaxSuppression.h>
#include <VxTrace/Core/Constants.h>

#include <algorithm>
#include <cmath>

namespace Vx::Trace::Internal {

namespace {

constexpr double MIN_REFINE_COHERENCY = 0.1;

inline float Bilinear(const float* data, int32_t width, int32_t height, double x, double y) {
    x = std::clamp(x, 0.0, static_cast<double>(width - 1));
    y = std::clamp(y, 0.0, static_cast<double>(height - 1));
    const int32_t x0 = static_cast<int32_t>(x);
    const int32_t y0 = static_cast<int32_t>(y);
    const int32_t x1 = std::min(x0 + 1, width - 1);
    const int32_t y1 = std::min(y0 + 1, height - 1);
    const double fx = x - x0;
    const double fy = y - y0;

    const float* r0 = data + static_cast<size_t>(y0) * width;
    const float* r1 = data + static_cast<size_t>(y1) * width;
    return static_cast<float>((1.0 - fy) * ((1.0 - fx) * r0[x0] + fx * r0[x1]) +
                              fy * ((1.0 - fx) * r1[x0] + fx * r1[x1]));
}

inline size_t Nearest(int32_t width, int32_t height, double x, double y) {
    int32_t ix = std::clamp(static_cast<int32_t>(std::lround(x)), 0, width - 1);
    int32_t iy = std::clamp(static_cast<int32_t>(std::lround(y)), 0, height - 1);
    return static_cast<size_t>(iy) * width + ix;
}

// Initial tangents from the smoothed structure tensor
void SeedTangents(const float* gx, const float* gy, int32_t width, int32_t height,
                  const EtfParams& params, FlowField& flow, Platform::ThreadPool* pool) {
    const size_t total = static_cast<size_t>(width) * height;

    std::vector<float> jxx(total), jxy(total), jyy(total);
    for (size_t i = 0; i < total; ++i) {
        jxx[i] = gx[i] * gx[i];
        jxy[i] = gx[i] * gy[i];
        jyy[i] = gy[i] * gy[i];
    }
    GaussianBlur(jxx.data(), jxx.data(), width, height, params.tensorSigma, pool);
    GaussianBlur(jxy.data(), jxy.data(), width, height, params.tensorSigma, pool);
    GaussianBlur(jyy.data(), jyy.data(), width, height, params.tensorSigma, pool);

    const float tau = static_cast<float>(params.coherencyTau);

    Platform::ParallelFor(pool, 0, total, [&](size_t i) {
        const double a = jxx[i];
        const double b = jxy[i];
        const double c = jyy[i];
        const double trace = a + c;
        const double disc = std::sqrt(std::max(0.0, 0.25 * trace * trace - (a * c - b * b)));
        const double l1 = 0.5 * trace + disc;
        const double l2 = 0.5 * trace - disc;

        // Dominant gradient direction
        double vx, vy;
        if (std::abs(b) > 1e-12) {
            vx = l1 - c;
            vy = b;
        } else if (a >= c) {
            vx = 1.0;
            vy = 0.0;
        } else {
            vx = 0.0;
            vy = 1.0;
        }
        double len = std::sqrt(vx * vx + vy * vy);
        if (len < 1e-12) {
            vx = 1.0;
            vy = 0.0;
            len = 1.0;
        }

        // Tangent is the gradient rotated by 90 degrees
        flow.tx[i] = static_cast<float>(-vy / len);
        flow.ty[i] = static_cast<float>(vx / len);

        float coh = 0.0f;
        if (l1 + l2 > 1e-12) {
            coh = static_cast<float>(std::max(0.0, (l1 - l2) / (l1 + l2)));
        }
        flow.coherency[i] = coh > tau ? coh : 0.0f;
    }, static_cast<size_t>(width));
}

void RefineTangents(FlowField& flow, int32_t radius, Platform::ThreadPool* pool) {
    const int32_t width = flow.width;
    const int32_t height = flow.height;
    const double twoR2 = 2.0 * radius * radius;

    std::vector<float> curX = flow.tx;
    std::vector<float> curY = flow.ty;
    const std::vector<float>& coherency = flow.coherency;

    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < width; ++x) {
            const size_t idx = static_cast<size_t>(y) * width + x;
            if (coherency[idx] < MIN_REFINE_COHERENCY) continue;

            const double px = curX[idx];
            const double py = curY[idx];
            double sumX = 0.0;
            double sumY = 0.0;
            double totalW = 0.0;

            for (int32_t dy = -radius; dy <= radius; ++dy) {
                const int32_t ny = y + dy;
                if (ny < 0 || ny >= height) continue;
                for (int32_t dx = -radius; dx <= radius; ++dx) {
                    const int32_t nx = x + dx;
                    if (nx < 0 || nx >= width) continue;
                    const int32_t d2 = dx * dx + dy * dy;
                    if (d2 == 0 || d2 > radius * radius) continue;

                    const size_t nidx = static_cast<size_t>(ny) * width + nx;
                    const double nc = coherency[nidx];
                    if (nc < MIN_REFINE_COHERENCY) continue;

                    const double qx = curX[nidx];
                    const double qy = curY[nidx];
                    const double dot = px * qx + py * qy;
                    const double w = std::exp(-d2 / twoR2) * std::abs(dot) * nc;
                    const double sign = dot >= 0.0 ? 1.0 : -1.0;

                    sumX += sign * qx * w;
                    sumY += sign * qy * w;
                    totalW += w;
                }
            }

            if (totalW > 1e-12) {
                const double len = std::sqrt(sumX * sumX + sumY * sumY);
                if (len > 1e-12) {
                    flow.tx[idx] = static_cast<float>(sumX / len);
                    flow.ty[idx] = static_cast<float>(sumY / len);
                }
            }
        }
    });
}

// 1D DoG across the flow at every pixel
std::vector<float> CrossFlowDog(const float* intensity, int32_t width, int32_t height,
                                const float* tx, const float* ty,
                                const FdogParams& params, Platform::ThreadPool* pool) {
    const size_t total = static_cast<size_t>(width) * height;
    const int32_t radius = static_cast<int32_t>(std::ceil(3.0 * params.sigmaC));

    std::vector<double> dog(static_cast<size_t>(2 * radius + 1));
    for (int32_t t = -radius; t <= radius; ++t) {
        dog[static_cast<size_t>(t + radius)] =
            Gaussian::Value(t, params.sigmaS) - params.rho * Gaussian::Value(t, params.sigmaC);
    }

    std::vector<float> result(total, 0.0f);
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < width; ++x) {
            const size_t idx = static_cast<size_t>(y) * width + x;
            // Normal = tangent rotated by 90 degrees
            const double nx = -ty[idx];
            const double ny = tx[idx];

            double sum = 0.0;
            for (int32_t t = -radius; t <= radius; ++t) {
                sum += dog[static_cast<size_t>(t + radius)] *
                       Bilinear(intensity, width, height, x + t * nx, y + t * ny);
            }
            result[idx] = static_cast<float>(sum);
        }
    });
    return result;
}

// Gaussian-weighted integration of the DoG along the flow streamline
std::vector<float> IntegrateAlongFlow(const std::vector<float>& dog, int32_t width, int32_t height,
                                      const float* tx, const float* ty,
                                      double sigmaM, Platform::ThreadPool* pool) {
    const size_t total = static_cast<size_t>(width) * height;
    const int32_t steps = std::max(1, static_cast<int32_t>(std::ceil(2.0 * sigmaM)));

    std::vector<float> result(total, 0.0f);
    Platform::ParallelFor(pool, 0, static_cast<size_t>(height), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < width; ++x) {
            const size_t idx = static_cast<size_t>(y) * width + x;
            double sum = dog[idx];
            double weight = 1.0;

            for (int32_t dir = -1; dir <= 1; dir += 2) {
                double px = x;
                double py = y;
                double vx = dir * tx[idx];
                double vy = dir * ty[idx];

                for (int32_t s = 1; s <= steps; ++s) {
                    px += vx;
                    py += vy;
                    if (px < 0.0 || py < 0.0 || px > width - 1 || py > height - 1) break;

                    const double w = std::exp(-0.5 * s * s / (sigmaM * sigmaM));
                    sum += w * Bilinear(dog.data(), width, height, px, py);
                    weight += w;

                    // Follow the local tangent, keeping the walking direction
                    const size_t n = Nearest(width, height, px, py);
                    double nvx = tx[n];
                    double nvy = ty[n];
                    if (nvx * vx + nvy * vy < 0.0) {
                        nvx = -nvx;
                        nvy = -nvy;
                    }
                    vx = nvx;
                    vy = nvy;
                }
            }
            result[idx] = static_cast<float>(sum / weight);
        }
    });
    return result;
}

std::vector<float> NormalizedIntensity(const float* gray, size_t total) {
    std::vector<float> intensity(total);
    for (size_t i = 0; i < total; ++i) {
        intensity[i] = gray[i] / 255.0f;
    }
    return intensity;
}

std::vector<float> FdogFromTangents(const std::vector<float>& intensity,
                                    int32_t width, int32_t height,
                                    const float* tx, const float* ty,
                                    const FdogParams& params, Platform::ThreadPool* pool) {
    std::vector<float> dog = CrossFlowDog(intensity.data(), width, height, tx, ty, params, pool);
    std::vector<float> integrated = IntegrateAlongFlow(dog, width, height, tx, ty,
                                                       params.sigmaM, pool);
    // Dark-side (negative) lobe is the edge response
    for (auto& v : integrated) {
        v = v < 0.0f ? -v : 0.0f;
    }
    return integrated;
}

} // anonymous namespace

FlowField ComputeEdgeTangentFlow(const float* gray, int32_t width, int32_t height,
                                 const EtfParams& params, Platform::ThreadPool* pool) {
    FlowField flow;
    if (width <= 0 || height <= 0) return flow;

    const size_t total = static_cast<size_t>(width) * height;
    flow.width = width;
    flow.height = height;
    flow.tx.assign(total, 1.0f);
    flow.ty.assign(total, 0.0f);
    flow.coherency.assign(total, 0.0f);

    std::vector<float> intensity = NormalizedIntensity(gray, total);
    std::vector<float> gx(total), gy(total);
    SobelGradient(intensity.data(), gx.data(), gy.data(), width, height, pool);

    SeedTangents(gx.data(), gy.data(), width, height, params, flow, pool);
    for (int32_t it = 0; it < params.iterations; ++it) {
        RefineTangents(flow, std::max(1, params.radius), pool);
    }
    return flow;
}

std::vector<float> ComputeFdog(const float* gray, int32_t width, int32_t height,
                               const FlowField& flow, const FdogParams& params,
                               Platform::ThreadPool* pool) {
    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0) return {};

    std::vector<float> intensity = NormalizedIntensity(gray, total);
    return FdogFromTangents(intensity, width, height, flow.tx.data(), flow.ty.data(),
                            params, pool);
}

BinaryMap EdgesFromFlowResponse(const float* response, const float* tx, const float* ty,
                                int32_t width, int32_t height,
                                double nmsLow, double nmsHigh, double thresholdScale,
                                Platform::ThreadPool* pool) {
    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0) return BinaryMap();

    // Normal = tangent rotated by 90 degrees
    std::vector<float> nx(total), ny(total);
    for (size_t i = 0; i < total; ++i) {
        nx[i] = -ty[i];
        ny[i] = tx[i];
    }

    std::vector<float> suppressed(total);
    NonMaxSuppress(response, nx.data(), ny.data(), suppressed.data(),
                   width, height, 0.0f, pool);

    const float maxVal = MaxValue(suppressed.data(), total);
    if (maxVal <= 0.0f) {
        return BinaryMap(width, height, 0);
    }
    const float scale = static_cast<float>(thresholdScale);
    const float low = scale * std::max(0.05f * maxVal, static_cast<float>(nmsLow));
    const float high = std::min(maxVal, scale * std::max(0.40f * maxVal,
                                                         static_cast<float>(nmsHigh)));
    return HysteresisThreshold(suppressed.data(), width, height, std::min(low, high), high);
}

BinaryMap DetectFlowEdges(const float* gray, int32_t width, int32_t height,
                          const EtfParams& etf, const FdogParams& fdog,
                          double nmsLow, double nmsHigh,
                          Platform::ThreadPool* pool, EdgeResponse* response) {
    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0) return BinaryMap();

    FlowField flow = ComputeEdgeTangentFlow(gray, width, height, etf, pool);
    std::vector<float> fdogResponse = ComputeFdog(gray, width, height, flow, fdog, pool);

    if (response != nullptr) {
        response->width = width;
        response->height = height;
        response->magnitude = fdogResponse;
        response->orientation.resize(total);
        for (size_t i = 0; i < total; ++i) {
            response->orientation[i] =
                static_cast<float>(FoldOrientation(std::atan2(flow.tx[i], -flow.ty[i])));
        }
        response->maxMagnitude = MaxValue(fdogResponse.data(), total);
    }

    return EdgesFromFlowResponse(fdogResponse.data(), flow.tx.data(), flow.ty.data(),
                                 width, height, nmsLow, nmsHigh, 1.0, pool);
}

MultiDirectionResponse ComputeMultiDirectionFdog(const float* gray, int32_t width, int32_t height,
                                                 const FlowField& flow,
                                                 const std::vector<double>& orientations,
                                                 const FdogParams& params,
                                                 Platform::ThreadPool* pool) {
    MultiDirectionResponse result;
    result.width = width;
    result.height = height;
    result.orientations = orientations;

    const size_t total = static_cast<size_t>(width) * height;
    if (total == 0 || orientations.empty()) return result;

    std::vector<float> intensity = NormalizedIntensity(gray, total);
    std::vector<float> rx(total), ry(total);

    for (double theta : orientations) {
        const double c = std::cos(theta);
        const double s = std::sin(theta);
        for (size_t i = 0; i < total; ++i) {
            rx[i] = static_cast<float>(flow.tx[i] * c - flow.ty[i] * s);
            ry[i] = static_cast<float>(flow.tx[i] * s + flow.ty[i] * c);
        }
        result.responses.push_back(
            FdogFromTangents(intensity, width, height, rx.data(), ry.data(), params, pool));
    }

    result.combined.assign(total, 0.0f);
    result.dominant.assign(total, 0.0f);
    for (size_t i = 0; i < total; ++i) {
        for (size_t k = 0; k < orientations.size(); ++k) {
            if (result.responses[k][i] > result.combined[i]) {
                result.combined[i] = result.responses[k][i];
                result.dominant[i] = static_cast<float>(orientations[k]);
            }
        }
    }
    return result;
}

} // namespace Vx::Trace::Internal
