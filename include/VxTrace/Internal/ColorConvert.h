#pragma once

/**
 * @file ColorConvert.h
 * @brief sRGB <-> CIE Lab (D65) conversion
 */

#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Platform/Thread.h>

#include <cstdint>

namespace Vx::Trace::Internal {

struct Lab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    Lab() = default;
    Lab(double l, double a_, double b_) : L(l), a(a_), b(b_) {}
};

/// 8-bit sRGB to Lab (D65 white point)
Lab RgbToLab(uint8_t r, uint8_t g, uint8_t b);

inline Lab ColorToLab(const Color& c) { return RgbToLab(c.r, c.g, c.b); }

/// Lab back to 8-bit sRGB, clamped to gamut
Color LabToColor(const Lab& lab);

/// CIE76 colour difference
double DeltaE(const Lab& x, const Lab& y);

/// Opaque colour seen when c is drawn over a white page
Color CompositeOverWhite(const Color& c);

/**
 * @brief Convert an image into three Lab planes (alpha composited over white)
 */
void ImageToLab(const VImage& image, float* L, float* a, float* b,
                Platform::ThreadPool* pool = nullptr);

} // namespace Vx::Trace::Internal
