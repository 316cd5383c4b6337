/**
 * @file Backend.cpp
 * @brief Backend dispatch over the four analysis strategies
 */

#include <VxTrace/Backend/Backend.h>
#include <VxTrace/Core/Exception.h>

#include <type_traits>

namespace Vx::Trace::Backend {

BackendGeometry Analyze(BackendKind kind, const Preprocess::PreparedImage& prepared,
                        const TraceConfig& config, double detail,
                        Platform::ExecutionContext& ctx) {
    switch (kind) {
        case BackendKind::Edge:
            return ExtractEdges(prepared, config, detail, ctx);
        case BackendKind::Centerline:
            return ExtractCenterlines(prepared, config, detail, ctx);
        case BackendKind::Superpixel:
            return ExtractRegions(prepared, config, detail, ctx);
        case BackendKind::Dots:
            return PlaceDots(prepared, config, detail, ctx);
    }
    throw InvalidArgumentException("Analyze: unknown backend");
}

BackendKind KindOf(const BackendGeometry& geometry) {
    return std::visit([](const auto& g) {
        using T = std::decay_t<decltype(g)>;
        if constexpr (std::is_same_v<T, EdgeGeometry>) {
            return BackendKind::Edge;
        } else if constexpr (std::is_same_v<T, CenterlineGeometry>) {
            return BackendKind::Centerline;
        } else if constexpr (std::is_same_v<T, SuperpixelGeometry>) {
            return BackendKind::Superpixel;
        } else {
            return BackendKind::Dots;
        }
    }, geometry);
}

} // namespace Vx::Trace::Backend
