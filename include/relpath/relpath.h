/**
 * @file relpath.h
 * @brief relpath C API - Stable ABI for relative path normalization
 *
 * This header provides a C-compatible API for FFI and C-only toolchains.
 *
 * ## Design Principles
 *
 * 1. **Ownership**: Functions returning `char*` return newly allocated
 *    strings that the caller must free with `relpath_free_string()`.
 *
 * 2. **Error handling**: Fallible operations return NULL or a status code.
 *    Use `relpath_get_last_error()` for details. Errors are thread-local.
 *
 * 3. **No exceptions**: The C++ implementation catches all exceptions
 *    and converts them to error codes.
 *
 * ## Example
 *
 * ```c
 * #include <relpath/relpath.h>
 * #include <stdio.h>
 *
 * int main(void) {
 *     char* p = relpath_normalize("foo//bar/", "my_tool");
 *     if (!p) {
 *         fprintf(stderr, "Error: %s\n", relpath_get_last_error());
 *         return 1;
 *     }
 *     printf("%s\n", p);   // ./foo/bar
 *     relpath_free_string(p);
 *     return 0;
 * }
 * ```
 *
 * ## Thread Safety
 *
 * All functions are safe to call concurrently. The last error is
 * thread-local.
 */

#ifndef RELPATH_H
#define RELPATH_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#define RELPATH_ABI_VERSION 1

#if defined(_WIN32) || defined(_WIN64)
    #ifdef RELPATH_BUILDING_SHARED
        #define RELPATH_CAPI __declspec(dllexport)
    #else
        #define RELPATH_CAPI
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #ifdef RELPATH_BUILDING_SHARED
        #define RELPATH_CAPI __attribute__((visibility("default")))
    #else
        #define RELPATH_CAPI
    #endif
#else
    #define RELPATH_CAPI
#endif

/* ============================================================================
 * Status Codes
 * ============================================================================ */

typedef enum RelpathStatus {
    RELPATH_OK = 0,
    RELPATH_ERROR_INVALID_ARGUMENT = 1,
    RELPATH_ERROR_NOT_A_STRING = 2,
    RELPATH_ERROR_EMPTY_STRING = 3,
    RELPATH_ERROR_ABSOLUTE_PATH = 4,
    RELPATH_ERROR_PARENT_COMPONENT = 5,
    RELPATH_ERROR_INTERNAL = 99
} RelpathStatus;

/* ============================================================================
 * API Version
 * ============================================================================ */

/**
 * @brief Get the ABI version of the loaded library
 * @return ABI version number (compare with RELPATH_ABI_VERSION)
 */
RELPATH_CAPI int32_t relpath_abi_version(void);

/**
 * @brief Get the library version string
 * @return Version string. Pointer is valid for program lifetime.
 */
RELPATH_CAPI const char* relpath_version_string(void);

/* ============================================================================
 * Error Handling
 * ============================================================================ */

/**
 * @brief Get the last error message (thread-local)
 * @return Error message, or empty string if no error.
 *         Pointer valid until next relpath call on this thread.
 */
RELPATH_CAPI const char* relpath_get_last_error(void);

/** @brief Get the last error code (thread-local) */
RELPATH_CAPI RelpathStatus relpath_get_last_error_code(void);

/** @brief Clear the last error (thread-local) */
RELPATH_CAPI void relpath_clear_error(void);

/* ============================================================================
 * Memory Management
 * ============================================================================ */

/**
 * @brief Free a string returned by relpath functions
 * @param str String to free (NULL is safe)
 */
RELPATH_CAPI void relpath_free_string(char* str);

/* ============================================================================
 * Normalization
 * ============================================================================ */

/**
 * @brief Normalize a relative path string
 * @param path Relative path. NULL fails with RELPATH_ERROR_NOT_A_STRING.
 * @param context Label prefixed to error messages, or NULL for the default
 * @return Canonical path (caller must free), or NULL on error
 */
RELPATH_CAPI char* relpath_normalize(const char* path, const char* context);

/**
 * @brief Check whether a path normalizes
 * @return 1 if valid, 0 otherwise. Clears the last error; an invalid
 *         path does not set it, only an internal failure does.
 */
RELPATH_CAPI int32_t relpath_is_valid(const char* path);

/**
 * @brief Count the components of a relative path
 * @param path Relative path
 * @param out_count Receives the count (0 for the current directory)
 * @return RELPATH_OK or an error status
 */
RELPATH_CAPI RelpathStatus relpath_component_count(const char* path, size_t* out_count);

#ifdef __cplusplus
}
#endif

#endif /* RELPATH_H */
