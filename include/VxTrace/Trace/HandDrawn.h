#pragma once

/**
 * @file HandDrawn.h
 * @brief Seeded hand-drawn stylisation of stroke primitives
 *
 * Runs on the final primitive list. Only strokes are touched; fills and
 * dots pass through unchanged. Per stroke, in order: variable weight,
 * tremor, tapering, pressure, then optional overlay strokes inserted right
 * after their source. The same config and input always give the same output.
 */

#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace Vx::Trace {

/// Tremor amplitude in pixels at full strength for an 800x600 image
constexpr double TREMOR_BASE_PX = 5.0;
constexpr double TREMOR_REFERENCE_AREA = 480000.0;

/// Width bounds after the weight and pressure steps
constexpr double HAND_DRAWN_MIN_WIDTH = 0.3;
constexpr double HAND_DRAWN_MAX_WIDTH = 4.0;

/// Strokes shorter than this are not tapered
constexpr double TAPER_MIN_LENGTH = 10.0;

struct HandDrawnStats {
    size_t strokes = 0;     ///< Source strokes modified
    size_t overlays = 0;    ///< Extra strokes inserted
};

/// Number of drawn passes per stroke, 1 + floor(2 * intensity)
int32_t HandDrawnPassCount(double multiPassIntensity);

/**
 * @brief Stylise strokes in place
 * @param width,height Output canvas size, scales the tremor when adaptive
 */
HandDrawnStats ApplyHandDrawn(std::vector<Primitive>& primitives, const HandDrawnConfig& config,
                              int32_t width, int32_t height);

} // namespace Vx::Trace
