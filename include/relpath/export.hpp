#ifndef RELPATH_EXPORT_HPP
#define RELPATH_EXPORT_HPP

/**
 * @file export.hpp
 * @brief Shared library export/import macros.
 *
 * When building relpath as a shared library:
 * - Define RELPATH_SHARED when using the library
 * - RELPATH_BUILDING_SHARED is defined automatically during library compilation
 */

#if defined(_WIN32) || defined(_WIN64)
    #ifdef RELPATH_BUILDING_SHARED
        #define RELPATH_API __declspec(dllexport)
    #elif defined(RELPATH_SHARED)
        #define RELPATH_API __declspec(dllimport)
    #else
        #define RELPATH_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef RELPATH_BUILDING_SHARED
        #define RELPATH_API __attribute__((visibility("default")))
    #else
        #define RELPATH_API
    #endif
#else
    #define RELPATH_API
#endif

#endif // RELPATH_EXPORT_HPP
