#pragma once

/**
 * @file json.hpp
 * @brief JSON binding for relative path normalization
 *
 * Requires nlohmann/json. A JSON value that is not a string is the one
 * place where NOT_A_STRING can occur in C++ code.
 */

#include "relpath/error.hpp"
#include "relpath/export.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace relpath {
namespace json {

using json = nlohmann::json;

/**
 * @brief Normalize a JSON value holding a relative path
 *
 * Non-string values fail with NOT_A_STRING; the error input is the value's
 * compact JSON dump.
 */
RELPATH_API Result<std::string> normalize_json(const json& value,
                                               const std::string& context = "");

/// {"code", "message", "input", "context"}
RELPATH_API json error_to_json(const Error& error);

// ============================================================================
// Batch Normalization
// ============================================================================

struct BatchEntry {
    json input;
    std::optional<std::string> path;   // set on success
    std::optional<Error> error;        // set on failure
};

struct BatchResult {
    std::vector<BatchEntry> entries;
    size_t normalized = 0;
    size_t failed = 0;

    bool ok() const { return failed == 0; }
};

/**
 * @brief Normalize every element of a JSON array independently
 * @param values JSON array; anything else fails with PARSE_ERROR
 * @param context Label for diagnostics; element i is labelled "<context>[i]"
 */
RELPATH_API Result<BatchResult> normalize_batch(const json& values,
                                                const std::string& context = "");

/// {"ok", "normalized", "failed", "results": [{"input", "ok", "path" | "error"}]}
RELPATH_API json to_json(const BatchResult& result);

/**
 * @brief Read a JSON array of paths from disk
 *
 * IO_ERROR when the file cannot be read, PARSE_ERROR when it is not valid
 * JSON or its top level is not an array.
 */
RELPATH_API Result<json> load_batch_file(const std::string& file_path);

} // namespace json
} // namespace relpath
