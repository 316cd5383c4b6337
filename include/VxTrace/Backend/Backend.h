#pragma once

/**
 * @file Backend.h
 * @brief Closed set of feature extractors, dispatched once per pass
 *
 * @code
 * auto geometry = Backend::Analyze(BackendKind::Centerline, prepared, cfg, 0.6, ctx);
 * if (auto* cl = std::get_if<Backend::CenterlineGeometry>(&geometry)) {
 *     ...
 * }
 * @endcode
 */

#include <VxTrace/Backend/CenterlineBackend.h>
#include <VxTrace/Backend/DotsBackend.h>
#include <VxTrace/Backend/EdgeBackend.h>
#include <VxTrace/Backend/SuperpixelBackend.h>

#include <variant>

namespace Vx::Trace::Backend {

using BackendGeometry = std::variant<EdgeGeometry, CenterlineGeometry,
                                     SuperpixelGeometry, DotGeometry>;

/**
 * @brief Run the backend of the given kind on the prepared image
 * @param detail Pass detail level (may differ from config.detail in multipass)
 */
BackendGeometry Analyze(BackendKind kind, const Preprocess::PreparedImage& prepared,
                        const TraceConfig& config, double detail,
                        Platform::ExecutionContext& ctx);

/// Kind of the alternative held by a geometry
BackendKind KindOf(const BackendGeometry& geometry);

} // namespace Vx::Trace::Backend
