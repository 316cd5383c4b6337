/**
 * @file Primitive.cpp
 * @brief Primitive kind, bounds, length and scaling
 */

#include <VxTrace/Core/Primitive.h>

#include <type_traits>

namespace Vx::Trace {

namespace {
template<class> inline constexpr bool ALWAYS_FALSE = false;
}

const char* PrimitiveKindName(PrimitiveKind kind) {
    switch (kind) {
        case PrimitiveKind::Stroke: return "stroke";
        case PrimitiveKind::Fill:   return "fill";
        case PrimitiveKind::Dot:    return "dot";
    }
    return "unknown";
}

PrimitiveKind KindOf(const Primitive& primitive) {
    return std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StrokePrimitive>) {
            return PrimitiveKind::Stroke;
        } else if constexpr (std::is_same_v<T, FillPrimitive>) {
            return PrimitiveKind::Fill;
        } else if constexpr (std::is_same_v<T, DotPrimitive>) {
            return PrimitiveKind::Dot;
        } else {
            static_assert(ALWAYS_FALSE<T>, "unhandled primitive");
        }
    }, primitive);
}

Rect2d BoundsOf(const Primitive& primitive) {
    return std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StrokePrimitive>) {
            return p.path.BoundingBox();
        } else if constexpr (std::is_same_v<T, FillPrimitive>) {
            Rect2d box;
            for (const auto& ring : p.rings) {
                for (const auto& pt : ring.Points()) box.Extend(pt);
            }
            return box;
        } else {
            return Rect2d(p.center.x - p.radius, p.center.y - p.radius,
                          p.center.x + p.radius, p.center.y + p.radius);
        }
    }, primitive);
}

double LengthOf(const Primitive& primitive) {
    return std::visit([](const auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StrokePrimitive>) {
            return p.path.Length();
        } else if constexpr (std::is_same_v<T, FillPrimitive>) {
            return p.rings.empty() ? 0.0 : p.rings.front().Length();
        } else {
            return 2.0 * p.radius;
        }
    }, primitive);
}

void ScalePrimitive(Primitive& primitive, double scale) {
    auto scaleCurves = [scale](std::vector<CubicBezier>& curves) {
        for (auto& c : curves) {
            c.p0 = c.p0 * scale;
            c.p1 = c.p1 * scale;
            c.p2 = c.p2 * scale;
            c.p3 = c.p3 * scale;
        }
    };

    std::visit([&](auto& p) {
        using T = std::decay_t<decltype(p)>;
        if constexpr (std::is_same_v<T, StrokePrimitive>) {
            p.path.Scale(scale, scale);
            p.width *= scale;
            scaleCurves(p.curves);
        } else if constexpr (std::is_same_v<T, FillPrimitive>) {
            for (auto& ring : p.rings) ring.Scale(scale, scale);
            for (auto& ringCurves : p.curves) scaleCurves(ringCurves);
        } else {
            p.center = p.center * scale;
            p.radius *= scale;
        }
    }, primitive);
}

size_t TraceResult::Count(PrimitiveKind kind) const {
    size_t n = 0;
    for (const auto& p : primitives) {
        if (KindOf(p) == kind) ++n;
    }
    return n;
}

} // namespace Vx::Trace
