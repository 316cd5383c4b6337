/**
 * @file ColorConvert.cpp
 * @brief sRGB, Lab and compositing conversions
 */

#include <VxTrace/Internal/ColorConvert.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace Vx::Trace::Internal {

namespace {

// D65 reference white
constexpr double XN = 0.95047;
constexpr double YN = 1.00000;
constexpr double ZN = 1.08883;

constexpr double LAB_EPS = 216.0 / 24389.0;
constexpr double LAB_KAPPA = 24389.0 / 27.0;

const std::array<double, 256>& SrgbToLinearTable() {
    static const std::array<double, 256> table = [] {
        std::array<double, 256> t{};
        for (int i = 0; i < 256; ++i) {
            double c = i / 255.0;
            t[i] = c <= 0.04045 ? c / 12.92 : std::pow((c + 0.055) / 1.055, 2.4);
        }
        return t;
    }();
    return table;
}

double LinearToSrgb(double c) {
    c = std::clamp(c, 0.0, 1.0);
    return c <= 0.0031308 ? 12.92 * c : 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
}

double LabF(double t) {
    return t > LAB_EPS ? std::cbrt(t) : (LAB_KAPPA * t + 16.0) / 116.0;
}

double LabFInv(double f) {
    double f3 = f * f * f;
    return f3 > LAB_EPS ? f3 : (116.0 * f - 16.0) / LAB_KAPPA;
}

} // namespace

Lab RgbToLab(uint8_t r, uint8_t g, uint8_t b) {
    const auto& lin = SrgbToLinearTable();
    double rl = lin[r], gl = lin[g], bl = lin[b];

    double x = 0.4124564 * rl + 0.3575761 * gl + 0.1804375 * bl;
    double y = 0.2126729 * rl + 0.7151522 * gl + 0.0721750 * bl;
    double z = 0.0193339 * rl + 0.1191920 * gl + 0.9503041 * bl;

    double fx = LabF(x / XN);
    double fy = LabF(y / YN);
    double fz = LabF(z / ZN);

    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Color LabToColor(const Lab& lab) {
    double fy = (lab.L + 16.0) / 116.0;
    double fx = fy + lab.a / 500.0;
    double fz = fy - lab.b / 200.0;

    double x = XN * LabFInv(fx);
    double y = YN * LabFInv(fy);
    double z = ZN * LabFInv(fz);

    double rl =  3.2404542 * x - 1.5371385 * y - 0.4985314 * z;
    double gl = -0.9692660 * x + 1.8760108 * y + 0.0415560 * z;
    double bl =  0.0556434 * x - 0.2040259 * y + 1.0572252 * z;

    auto to8 = [](double c) {
        return static_cast<uint8_t>(std::lround(LinearToSrgb(c) * 255.0));
    };
    return {to8(rl), to8(gl), to8(bl), 255};
}

double DeltaE(const Lab& x, const Lab& y) {
    double dL = x.L - y.L;
    double da = x.a - y.a;
    double db = x.b - y.b;
    return std::sqrt(dL * dL + da * da + db * db);
}

Color CompositeOverWhite(const Color& c) {
    if (c.a == 255) return c;
    const double alpha = c.a / 255.0;
    auto over = [alpha](uint8_t v) {
        return static_cast<uint8_t>(std::lround(v * alpha + 255.0 * (1.0 - alpha)));
    };
    return Color(over(c.r), over(c.g), over(c.b));
}

void ImageToLab(const VImage& image, float* L, float* a, float* b,
                Platform::ThreadPool* pool) {
    const int32_t w = image.Width();
    const int32_t h = image.Height();

    Platform::ParallelFor(pool, 0, static_cast<size_t>(h), [&](size_t row) {
        const int32_t y = static_cast<int32_t>(row);
        for (int32_t x = 0; x < w; ++x) {
            const Color c = CompositeOverWhite(image.PixelColor(x, y));
            Lab lab = RgbToLab(c.r, c.g, c.b);
            size_t idx = static_cast<size_t>(y) * w + x;
            L[idx] = static_cast<float>(lab.L);
            a[idx] = static_cast<float>(lab.a);
            b[idx] = static_cast<float>(lab.b);
        }
    });
}

} // namespace Vx::Trace::Internal
