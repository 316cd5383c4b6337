#pragma once

/**
 * @file Denoise.h
 * @brief Edge-preserving smoothing of the luminance plane
 */

#include <VxTrace/Platform/Thread.h>

#include <cstdint>
#include <vector>

namespace Vx::Trace::Preprocess {

struct DenoiseParams {
    double spatialSigma = 1.2;
    double rangeSigma = 50.0;
};

/**
 * @brief Bilateral-filtered copy of a luminance plane (values 0..255)
 */
std::vector<float> Denoise(const std::vector<float>& luminance, int32_t width, int32_t height,
                           const DenoiseParams& params = DenoiseParams(),
                           Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Preprocess
