#pragma once

/**
 * @file VxTrace.h
 * @brief Main header file for the VxTrace library
 *
 * VxTrace converts raster images into vector primitives (strokes, even-odd
 * fills, dots) through four backends: edge, centerline, superpixel and dots.
 */

// Configuration and export macros
#include <VxTrace/VxTraceConfig.h>
#include <VxTrace/Core/Export.h>

// Core types
#include <VxTrace/Core/Types.h>
#include <VxTrace/Core/Constants.h>
#include <VxTrace/Core/Exception.h>
#include <VxTrace/Core/VImage.h>
#include <VxTrace/Core/VPath.h>
#include <VxTrace/Core/Primitive.h>
#include <VxTrace/Core/TraceConfig.h>

// Platform
#include <VxTrace/Platform/Log.h>
#include <VxTrace/Platform/ExecutionContext.h>

// Pipeline
#include <VxTrace/Trace/Vectorize.h>
#include <VxTrace/Trace/HandDrawn.h>

namespace Vx::Trace {

/**
 * @brief Get library version string
 * @return Version string in format "major.minor.patch"
 */
inline const char* GetVersion() {
    return VXTRACE_VERSION_STRING;
}

/**
 * @brief Get library version as integers
 */
inline void GetVersion(int& major, int& minor, int& patch) {
    major = VXTRACE_VERSION_MAJOR;
    minor = VXTRACE_VERSION_MINOR;
    patch = VXTRACE_VERSION_PATCH;
}

} // namespace Vx::Trace
