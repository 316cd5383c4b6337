#pragma once

/**
 * @file Directional.h
 * @brief Decide which directional edge passes are worth running
 *
 * Benefit scores (Standard, Reverse, DiagonalNW, DiagonalNE):
 * - Standard is always 1
 * - Reverse is 0.8 when a lighting direction is detected, else 0.4
 * - Diagonals are 0.9 with diagonal gradient content, else 0.3, and x1.2
 *   when the first pass found architectural (long straight) strokes
 * - Highly directional texture scales every non-standard score by 0.7
 */

#include <VxTrace/Backend/EdgeBackend.h>
#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Vx::Trace {

struct DirectionalAnalysis {
    bool hasDiagonalContent = false;
    bool hasArchitecturalElements = false;
    std::optional<Backend::PassDirection> lighting;
    double textureDirectionality = 0.0;         ///< 0 isotropic .. 1 strongly directional
    std::array<double, 4> benefits{{1.0, 0.0, 0.0, 0.0}};
    std::array<uint32_t, 8> orientationHistogram{};
    size_t strongGradients = 0;

    double Benefit(Backend::PassDirection direction) const {
        return benefits[static_cast<size_t>(direction)];
    }
};

/**
 * @brief Orientation histogram of strong gradients sampled every 4 px
 *
 * Gradients with Sobel magnitude above 20 vote into eight 45 degree bins.
 */
DirectionalAnalysis AnalyzeDirections(const std::vector<uint8_t>& gray, int32_t width,
                                      int32_t height, const std::vector<Primitive>& existing);

/**
 * @brief Brightness bias between opposite quarters of the image
 *
 * Reverse when the right (or bottom) side is clearly brighter, Standard when
 * the left (or top) side is, nullopt without a clear bias.
 */
std::optional<Backend::PassDirection> DetectLightingDirection(const std::vector<uint8_t>& gray,
                                                              int32_t width, int32_t height);

/// At least three long, nearly straight strokes
bool HasArchitecturalElements(const std::vector<Primitive>& primitives);

/**
 * @brief Enabled passes whose benefit reaches the threshold, best first
 *
 * At most three; fewer when the remaining budget cannot fit them (each pass
 * is assumed to need a quarter of the remaining time and at least 50 ms).
 * @param remainingMs Infinity for an unlimited budget
 */
std::vector<Backend::PassDirection> ScheduleDirectionalPasses(const DirectionalAnalysis& analysis,
                                                              const TraceConfig& config,
                                                              double remainingMs);

} // namespace Vx::Trace
