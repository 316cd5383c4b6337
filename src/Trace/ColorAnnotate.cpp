/**
 * @file ColorAnnotate.cpp
 * @brief Stroke colour sampling and palette reduction
 */

#include <VxTrace/Trace/ColorAnnotate.h>
#include <VxTrace/Internal/ColorConvert.h>
#include <VxTrace/Internal/ContourProcess.h>
#include <VxTrace/Platform/Log.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <tuple>
#include <type_traits>

namespace Vx::Trace {

namespace {

constexpr int32_t KMEANS_ITERATIONS = 20;

struct ClusterAccumulator {
    Internal::Lab leader;
    double r = 0.0, g = 0.0, b = 0.0;
    double offsetSum = 0.0;
    size_t members = 0;
    size_t order = 0;
};

Color MeanColor(const ClusterAccumulator& acc) {
    const double n = static_cast<double>(std::max<size_t>(1, acc.members));
    return Color(static_cast<uint8_t>(std::lround(acc.r / n)),
                 static_cast<uint8_t>(std::lround(acc.g / n)),
                 static_cast<uint8_t>(std::lround(acc.b / n)));
}

/// Visit every colour slot of every primitive
template<typename Fn>
void ForEachColor(std::vector<Primitive>& primitives, Fn&& fn) {
    for (auto& primitive : primitives) {
        std::visit([&](auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, StrokePrimitive>) {
                if (p.color) fn(*p.color);
                for (auto& stop : p.gradient) fn(stop.color);
            } else if constexpr (std::is_same_v<T, FillPrimitive>) {
                if (p.color) fn(*p.color);
            } else {
                fn(p.color);
            }
        }, primitive);
    }
}

size_t Nearest(const Internal::Lab& lab, const std::vector<Internal::Lab>& centers) {
    size_t best = 0;
    double bestDist = std::numeric_limits<double>::max();
    for (size_t i = 0; i < centers.size(); ++i) {
        const double d = Internal::DeltaE(lab, centers[i]);
        if (d < bestDist) {
            bestDist = d;
            best = i;
        }
    }
    return best;
}

} // anonymous namespace

std::vector<ColorCluster> ClusterPathColors(const VPath& path, const VImage& image,
                                            double tolerance) {
    std::vector<ColorCluster> clusters;
    if (path.Empty() || image.Empty()) return clusters;

    const VPath samples = path.Size() > 1 ? Internal::ResamplePath(path, COLOR_SAMPLE_SPACING)
                                          : path;
    const double radius = tolerance * 100.0;
    const size_t n = samples.Size();

    std::vector<ClusterAccumulator> acc;
    for (size_t i = 0; i < n; ++i) {
        const Point2d& p = samples[i];
        const int32_t x = std::clamp(static_cast<int32_t>(std::lround(p.x)), 0, image.Width() - 1);
        const int32_t y = std::clamp(static_cast<int32_t>(std::lround(p.y)), 0, image.Height() - 1);
        const Color c = Internal::CompositeOverWhite(image.PixelColor(x, y));
        const Internal::Lab lab = Internal::ColorToLab(c);
        const double offset = n > 1 ? static_cast<double>(i) / static_cast<double>(n - 1) : 0.0;

        auto it = std::find_if(acc.begin(), acc.end(), [&](const ClusterAccumulator& a) {
            return Internal::DeltaE(a.leader, lab) <= radius;
        });
        if (it == acc.end()) {
            ClusterAccumulator fresh;
            fresh.leader = lab;
            fresh.order = acc.size();
            acc.push_back(fresh);
            it = acc.end() - 1;
        }
        it->r += c.r;
        it->g += c.g;
        it->b += c.b;
        it->offsetSum += offset;
        ++it->members;
    }

    std::stable_sort(acc.begin(), acc.end(), [](const ClusterAccumulator& a,
                                                const ClusterAccumulator& b) {
        return a.members > b.members;
    });
    clusters.reserve(acc.size());
    for (const auto& a : acc) {
        ColorCluster cluster;
        cluster.color = MeanColor(a);
        cluster.members = a.members;
        cluster.meanOffset = a.offsetSum / static_cast<double>(a.members);
        clusters.push_back(cluster);
    }
    return clusters;
}

size_t AnnotateColors(std::vector<Primitive>& primitives, const VImage& image,
                      const ColorConfig& config) {
    size_t graded = 0;
    for (auto& primitive : primitives) {
        auto* stroke = std::get_if<StrokePrimitive>(&primitive);
        if (stroke == nullptr) continue;

        auto clusters = ClusterPathColors(stroke->path, image, config.colorTolerance);
        if (clusters.empty()) continue;
        stroke->color = clusters.front().color;
        stroke->gradient.clear();

        const size_t stops = std::min(clusters.size(),
                                      static_cast<size_t>(std::max(1, config.maxColorsPerPath)));
        if (stops < 2) continue;

        for (size_t i = 0; i < stops; ++i) {
            GradientStop stop;
            stop.offset = clusters[i].meanOffset;
            stop.color = clusters[i].color;
            stroke->gradient.push_back(stop);
        }
        std::stable_sort(stroke->gradient.begin(), stroke->gradient.end(),
                         [](const GradientStop& a, const GradientStop& b) {
                             return a.offset < b.offset;
                         });
        ++graded;
    }
    return graded;
}

std::vector<Color> ReducePalette(std::vector<Primitive>& primitives, int32_t paletteSize) {
    // Distinct colours with their frequency, in a stable order
    std::map<std::tuple<uint8_t, uint8_t, uint8_t>, size_t> histogram;
    ForEachColor(primitives, [&](Color& c) {
        ++histogram[std::make_tuple(c.r, c.g, c.b)];
    });
    if (histogram.empty() || paletteSize <= 0) return {};

    std::vector<Color> distinct;
    std::vector<Internal::Lab> labs;
    std::vector<double> weights;
    for (const auto& [key, count] : histogram) {
        Color c(std::get<0>(key), std::get<1>(key), std::get<2>(key));
        distinct.push_back(c);
        labs.push_back(Internal::ColorToLab(c));
        weights.push_back(static_cast<double>(count));
    }

    const size_t k = std::min(distinct.size(), static_cast<size_t>(paletteSize));
    std::vector<Internal::Lab> centers;
    centers.push_back(labs[std::max_element(weights.begin(), weights.end()) - weights.begin()]);
    while (centers.size() < k) {
        size_t farthest = 0;
        double farthestDist = -1.0;
        for (size_t i = 0; i < labs.size(); ++i) {
            const double d = Internal::DeltaE(labs[i], centers[Nearest(labs[i], centers)]);
            if (d > farthestDist) {
                farthestDist = d;
                farthest = i;
            }
        }
        centers.push_back(labs[farthest]);
    }

    std::vector<size_t> assignment(labs.size(), 0);
    for (int32_t iter = 0; iter < KMEANS_ITERATIONS; ++iter) {
        bool changed = iter == 0;
        for (size_t i = 0; i < labs.size(); ++i) {
            const size_t a = Nearest(labs[i], centers);
            if (a != assignment[i]) changed = true;
            assignment[i] = a;
        }
        if (!changed) break;

        std::vector<Internal::Lab> sums(k, Internal::Lab(0.0, 0.0, 0.0));
        std::vector<double> mass(k, 0.0);
        for (size_t i = 0; i < labs.size(); ++i) {
            auto& s = sums[assignment[i]];
            s.L += labs[i].L * weights[i];
            s.a += labs[i].a * weights[i];
            s.b += labs[i].b * weights[i];
            mass[assignment[i]] += weights[i];
        }
        for (size_t c = 0; c < k; ++c) {
            if (mass[c] <= 0.0) continue;
            centers[c] = Internal::Lab(sums[c].L / mass[c], sums[c].a / mass[c], sums[c].b / mass[c]);
        }
    }

    std::vector<Color> palette;
    palette.reserve(k);
    for (const auto& center : centers) palette.push_back(Internal::LabToColor(center));

    ForEachColor(primitives, [&](Color& c) {
        const uint8_t alpha = c.a;
        c = palette[Nearest(Internal::ColorToLab(c), centers)];
        c.a = alpha;
    });

    Platform::Log::Debug("palette: {} colours reduced to {}", distinct.size(), palette.size());
    return palette;
}

} // namespace Vx::Trace
