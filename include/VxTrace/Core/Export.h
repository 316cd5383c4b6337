#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - VXTRACE_BUILD_SHARED: when building VxTrace as shared library
 *   - VXTRACE_USE_SHARED: when using VxTrace as shared library
 *   - VXTRACE_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(VXTRACE_BUILD_SHARED)
        #define VXTRACE_API __declspec(dllexport)
    #elif defined(VXTRACE_USE_SHARED)
        #define VXTRACE_API __declspec(dllimport)
    #else
        #define VXTRACE_API
    #endif
#else
    #if defined(VXTRACE_BUILD_SHARED)
        #define VXTRACE_API __attribute__((visibility("default")))
    #else
        #define VXTRACE_API
    #endif
#endif
