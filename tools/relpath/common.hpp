/**
 * relpath CLI - Common utilities and types
 */

#pragma once

#include <relpath/error.hpp>
#include <relpath/json.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

namespace relpath::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string context;           // --context
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the context label used in diagnostics.
 * Priority: --context flag > RELPATH_CONTEXT env > "relpath <command>"
 */
inline std::string resolve_context(const std::string& override_context,
                                   const std::string& command) {
    if (!override_context.empty()) {
        return override_context;
    }

    std::string env_context = safe_getenv("RELPATH_CONTEXT");
    if (!env_context.empty()) {
        return env_context;
    }

    return "relpath " + command;
}

/**
 * Configure spdlog from the verbosity flags. Logging goes to stderr so it
 * never mixes with results on stdout.
 */
inline void init_logging(const GlobalOptions& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::off);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

// Thread-local warning collector for the current command
inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */

// Paths come from argv or files and need not be UTF-8; invalid bytes are
// written as U+FFFD instead of failing the dump.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << dump_json(output) << std::endl;
    } else {
        std::cout << dump_json(j) << std::endl;
    }
}

/**
 * One line of per-path output shared by normalize and check.
 */
inline nlohmann::json path_outcome_json(const std::string& input,
                                        const Result<std::string>& result) {
    nlohmann::json j;
    j["input"] = input;
    j["ok"] = result.isOk();
    if (result.isOk()) {
        j["path"] = result.value();
    } else {
        j["error"] = json::error_to_json(result.error());
    }
    return j;
}

} // namespace relpath::cli
