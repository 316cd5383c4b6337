#pragma once

/**
 * @file Vectorize.h
 * @brief Raster to vector entry point
 *
 * @code
 * TraceConfig cfg = TraceConfig::ForBackend(BackendKind::Edge);
 * cfg.detail = 0.6;
 * TraceResult result = Vectorize(image, cfg);
 * for (const auto& p : result.primitives) { ... }
 * @endcode
 *
 * Stages: validate config -> validate image -> downscale -> prepare
 * (background) -> dispatch -> merge -> colour annotation -> palette
 * reduction -> scale back to input coordinates.
 *
 * Dispatch:
 * - Edge with reversePass or diagonalPass: primary pass plus scheduled
 *   directional passes
 * - multipass.enabled with passCount >= 2 on Edge or Centerline: passes from
 *   conservative to aggressive detail
 * - otherwise one pass
 *
 * Failures: invalid configuration or input throws InvalidArgumentException
 * before any work. An exhausted time budget or memory keeps the completed
 * passes and sets truncated. Any other failure inside a pass skips that pass
 * and counts it in skippedFeatures.
 */

#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Platform/ExecutionContext.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace {

/**
 * @brief Vectorize with a private execution context (hardware thread count)
 */
VXTRACE_API TraceResult Vectorize(const VImage& image, const TraceConfig& config);

/**
 * @brief Vectorize on a caller-owned context (pool, profiler, progress callback)
 *
 * The context's budget is restarted from config.maxProcessingTimeMs.
 */
VXTRACE_API TraceResult Vectorize(const VImage& image, const TraceConfig& config,
                                  Platform::ExecutionContext& ctx);

/**
 * @brief Vectorize a tightly packed pixel buffer
 * @throws InvalidArgumentException when length does not match the dimensions
 */
VXTRACE_API TraceResult Vectorize(const uint8_t* data, size_t length, int32_t width,
                                  int32_t height, ChannelType channels,
                                  const TraceConfig& config);

/**
 * @brief Detail level of every multipass pass, conservative first
 *
 * Two passes use conservativeDetail and aggressiveDetail (defaults
 * detail * 0.7 and detail * 1.3, clamped to [0.1, 1]); more passes insert
 * evenly spaced levels between them.
 */
VXTRACE_API std::vector<double> MultipassDetails(const TraceConfig& config);

} // namespace Vx::Trace
