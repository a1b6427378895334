/**
 * relpath CLI - normalize command
 *
 * Print the canonical form of one or more relative paths.
 */

#include "../commands.hpp"
#include <relpath/relative_path.hpp>
#include <CLI/CLI.hpp>

namespace relpath::cli::commands {

int cmd_normalize(const GlobalOptions& opts, const NormalizeOptions& normalize_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    std::string context = resolve_context(opts.context, "normalize");
    nlohmann::json results = nlohmann::json::array();
    int failures = 0;

    for (const auto& path : normalize_opts.paths) {
        auto result = normalize_relative(path, context);
        if (result.isOk()) {
            spdlog::debug("{} -> {}", path, result.value());
            print_success(result.value(), opts.json);
        } else {
            ++failures;
            if (!opts.json) {
                print_error(result.error().message(), false);
            }
        }
        results.push_back(path_outcome_json(path, result));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = failures == 0;
        j["results"] = results;
        output_json(j);
    }

    return failures == 0 ? 0 : 1;
}

void setup_normalize(CLI::App* app, GlobalOptions& opts) {
    static NormalizeOptions normalize_opts;

    app->add_option("paths", normalize_opts.paths, "Relative paths to normalize")->required();

    app->callback([&opts]() {
        std::exit(cmd_normalize(opts, normalize_opts));
    });
}

} // namespace relpath::cli::commands
