#pragma once

/**
 * @file Slic.h
 * @brief SLIC superpixels in (x, y, L, a, b)
 *
 * Seeds are placed on a square, hexagonal or Poisson-disk pattern, never
 * more than requested, and nudged to the lowest-gradient pixel of their 3x3
 * neighbourhood. Each iteration assigns pixels to the nearest centre within
 * 2S (S = sqrt(area / K)) under the SLIC distance, then moves centres to
 * the mean of their pixels. Connectivity enforcement makes every label a
 * single 4-connected region.
 */

#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Internal/ColorConvert.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Internal {

struct SlicParams {
    int32_t numSuperpixels = 150;
    double compactness = 10.0;
    int32_t iterations = 10;
    SeedPattern pattern = SeedPattern::Square;
    uint64_t seed = 42;
};

struct SlicResult {
    LabelMap labels;                    ///< Compact labels 0..numLabels-1
    std::vector<Lab> meanLab;           ///< Per label
    std::vector<Color> meanColor;       ///< Per label, from source pixels
    std::vector<int32_t> area;          ///< Pixels per label
    int32_t seedCount = 0;
    int32_t iterationsRun = 0;
};

/**
 * @brief Seed positions for count superpixels on a width x height raster
 *
 * Returns at most count points (at least one for a non-empty raster).
 */
std::vector<Point2d> GenerateSeeds(int32_t width, int32_t height, int32_t count,
                                   SeedPattern pattern, uint64_t seed);

/**
 * @brief Run SLIC on an image
 */
SlicResult ComputeSlic(const VImage& image, const SlicParams& params,
                       Platform::ThreadPool* pool = nullptr);

/**
 * @brief Make every label one 4-connected region, in place
 *
 * For each label the largest component is kept when it reaches minSize;
 * every other fragment, and every undersized region, is merged into the
 * neighbour it shares the longest border with. The result never has more
 * regions than the input had labels.
 *
 * @return Number of labels after relabelling (0..n-1 in raster order)
 */
int32_t EnforceConnectivity(LabelMap& labels, int32_t minSize);

} // namespace Vx::Trace::Internal
