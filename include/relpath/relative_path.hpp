#pragma once

/**
 * @file relative_path.hpp
 * @brief Normalization of relative path strings
 *
 * All functions here work on path syntax only. They never touch the
 * filesystem, never resolve symlinks and never resolve `..`.
 *
 * Canonical form:
 * - starts with "./"
 * - no repeated "/", no trailing "/"
 * - no "." or ".." components
 * - "./." denotes the current directory
 *
 * @example
 * ```cpp
 * auto r = relpath::normalize_relative("foo//bar/./baz/");
 * if (r.isOk()) {
 *     // r.value() == "./foo/bar/baz"
 * }
 * ```
 */

#include "relpath/error.hpp"
#include "relpath/export.hpp"

#include <string>
#include <vector>

namespace relpath {

/// The canonical rendering of the current directory
inline constexpr const char* kCurrentDirectory = "./.";

/**
 * @brief Check that a string is eligible for relative path processing
 * @param value Candidate path
 * @param context Label prefixed to the error message
 *
 * Fails with EMPTY_STRING for "" and ABSOLUTE_PATH when the string starts
 * with '/'. Succeeds without transforming anything otherwise.
 */
RELPATH_API Result<void> validate_relative_string(const std::string& value,
                                                  const std::string& context);

/**
 * @brief Split a relative path into its components
 * @param path Relative path string
 * @param context Label prefixed to the error message
 * @return Components in left-to-right order, empty for the current directory
 *
 * Repeated separators and "." segments are dropped, as are a leading "./"
 * and a trailing "/" or "/.". A ".." component fails with PARENT_COMPONENT.
 * Input that fails validate_relative_string fails here with the same error.
 */
RELPATH_API Result<std::vector<std::string>> split_relative(const std::string& path,
                                                            const std::string& context);

/**
 * @brief Render components in canonical form
 *
 * Components are trusted to be nonempty, slash free and neither "." nor
 * "..", which is what split_relative produces.
 */
RELPATH_API std::string join_relative(const std::vector<std::string>& components);

/**
 * @brief Normalize a relative path string
 * @param path Relative path string (untrusted)
 * @param context Label for diagnostics; when empty a label naming this
 *        function and the argument is used
 *
 * Idempotent: normalizing a canonical path returns it unchanged.
 */
RELPATH_API Result<std::string> normalize_relative(const std::string& path,
                                                   const std::string& context = "");

/// True when normalize_relative would succeed.
RELPATH_API bool is_valid_relative(const std::string& path);

/**
 * @brief Normalize each path and join them into one
 * @return "./." for an empty list, otherwise the concatenated components
 *
 * Fails with the error of the first path that does not normalize.
 */
RELPATH_API Result<std::string> join_relative_paths(const std::vector<std::string>& paths,
                                                    const std::string& context = "");

} // namespace relpath
