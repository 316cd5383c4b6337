/**
 * @file Denoise.cpp
 * @brief Noise filtering ahead of edge detection
 */

#include <VxTrace/Preprocess/Denoise.h>
#include <VxTrace/Internal/Bilateral.h>

namespace Vx::Trace::Preprocess {

std::vector<float> Denoise(const std::vector<float>& luminance, int32_t width, int32_t height,
                           const DenoiseParams& params, Platform::ThreadPool* pool) {
    std::vector<float> out(luminance.size());
    if (luminance.empty()) return out;

    Internal::BilateralFilter(luminance.data(), out.data(), width, height,
                              params.spatialSigma, params.rangeSigma, pool);
    return out;
}

} // namespace Vx::Trace::Preprocess
