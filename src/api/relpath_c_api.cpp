/**
 * @file relpath_c_api.cpp
 * @brief relpath C API Implementation
 *
 * All C++ exceptions are caught at the boundary and converted to status
 * codes.
 */

#include "relpath/relpath.h"
#include "relpath/relative_path.hpp"

#include <cstdlib>
#include <cstring>
#include <string>

#ifndef RELPATH_VERSION_STRING
#define RELPATH_VERSION_STRING "unknown"
#endif

// ============================================================================
// Thread-Local Error State
// ============================================================================

namespace {

thread_local std::string g_last_error;
thread_local RelpathStatus g_last_error_code = RELPATH_OK;

void set_error(RelpathStatus code, const std::string& message) {
    g_last_error_code = code;
    g_last_error = message;
}

void clear_error() {
    g_last_error_code = RELPATH_OK;
    g_last_error.clear();
}

RelpathStatus map_error_code(relpath::ErrorCode code) {
    switch (code) {
        case relpath::ErrorCode::NOT_A_STRING:
            return RELPATH_ERROR_NOT_A_STRING;
        case relpath::ErrorCode::EMPTY_STRING:
            return RELPATH_ERROR_EMPTY_STRING;
        case relpath::ErrorCode::ABSOLUTE_PATH:
            return RELPATH_ERROR_ABSOLUTE_PATH;
        case relpath::ErrorCode::PARENT_COMPONENT:
            return RELPATH_ERROR_PARENT_COMPONENT;
        default:
            return RELPATH_ERROR_INTERNAL;
    }
}

// Duplicate a string for returning to C caller (caller must free)
char* duplicate_string(const std::string& s) {
    char* result = static_cast<char*>(malloc(s.size() + 1));
    if (result) {
        memcpy(result, s.c_str(), s.size() + 1);
    }
    return result;
}

std::string default_label(const char* path) {
    std::string argument = path ? "\"" + std::string(path) + "\"" : "NULL";
    return "relpath_normalize: Argument " + argument + " is not a valid relative path string";
}

} // namespace

extern "C" {

// ============================================================================
// API Version
// ============================================================================

RELPATH_CAPI int32_t relpath_abi_version(void) {
    return RELPATH_ABI_VERSION;
}

RELPATH_CAPI const char* relpath_version_string(void) {
    return RELPATH_VERSION_STRING;
}

// ============================================================================
// Error Handling
// ============================================================================

RELPATH_CAPI const char* relpath_get_last_error(void) {
    return g_last_error.c_str();
}

RELPATH_CAPI RelpathStatus relpath_get_last_error_code(void) {
    return g_last_error_code;
}

RELPATH_CAPI void relpath_clear_error(void) {
    clear_error();
}

// ============================================================================
// Memory Management
// ============================================================================

RELPATH_CAPI void relpath_free_string(char* str) {
    free(str);
}

// ============================================================================
// Normalization
// ============================================================================

RELPATH_CAPI char* relpath_normalize(const char* path, const char* context) {
    clear_error();

    std::string label = context ? context : default_label(path);
    if (!path) {
        set_error(RELPATH_ERROR_NOT_A_STRING, label + ": Not a string");
        return nullptr;
    }

    try {
        auto result = relpath::normalize_relative(path, label);
        if (result.isErr()) {
            set_error(map_error_code(result.error().code()), result.error().message());
            return nullptr;
        }
        char* out = duplicate_string(result.value());
        if (!out) {
            set_error(RELPATH_ERROR_INTERNAL, "out of memory");
        }
        return out;
    } catch (const std::exception& e) {
        set_error(RELPATH_ERROR_INTERNAL, e.what());
        return nullptr;
    } catch (...) {
        set_error(RELPATH_ERROR_INTERNAL, "unknown error");
        return nullptr;
    }
}

RELPATH_CAPI int32_t relpath_is_valid(const char* path) {
    clear_error();

    if (!path) return 0;
    try {
        return relpath::is_valid_relative(path) ? 1 : 0;
    } catch (const std::exception& e) {
        set_error(RELPATH_ERROR_INTERNAL, e.what());
        return 0;
    } catch (...) {
        set_error(RELPATH_ERROR_INTERNAL, "unknown error");
        return 0;
    }
}

RELPATH_CAPI RelpathStatus relpath_component_count(const char* path, size_t* out_count) {
    clear_error();

    if (!out_count) {
        set_error(RELPATH_ERROR_INVALID_ARGUMENT, "out_count is NULL");
        return RELPATH_ERROR_INVALID_ARGUMENT;
    }
    if (!path) {
        set_error(RELPATH_ERROR_NOT_A_STRING, "relpath_component_count: Not a string");
        return RELPATH_ERROR_NOT_A_STRING;
    }

    try {
        auto components = relpath::split_relative(path, "relpath_component_count");
        if (components.isErr()) {
            RelpathStatus status = map_error_code(components.error().code());
            set_error(status, components.error().message());
            return status;
        }
        *out_count = components.value().size();
        return RELPATH_OK;
    } catch (const std::exception& e) {
        set_error(RELPATH_ERROR_INTERNAL, e.what());
        return RELPATH_ERROR_INTERNAL;
    } catch (...) {
        set_error(RELPATH_ERROR_INTERNAL, "unknown error");
        return RELPATH_ERROR_INTERNAL;
    }
}

} // extern "C"
