#pragma once

/**
 * @file Bilateral.h
 * @brief Edge-preserving bilateral filter on a float plane
 */

#include <VxTrace/Platform/Thread.h>

#include <cstdint>

namespace Vx::Trace::Internal {

/**
 * @brief Bilateral filter
 * @param spatialSigma Spatial Gaussian sigma in pixels (window radius 2 sigma)
 * @param rangeSigma Intensity Gaussian sigma in sample units
 *
 * src and dst must not alias. Rows run in parallel when a pool is given.
 */
void BilateralFilter(const float* src, float* dst, int32_t width, int32_t height,
                     double spatialSigma, double rangeSigma,
                     Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
