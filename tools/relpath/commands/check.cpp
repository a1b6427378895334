/**
 * relpath CLI - check command
 *
 * Report whether paths are valid relative paths, without printing the
 * normalized form.
 */

#include "../commands.hpp"
#include <relpath/relative_path.hpp>
#include <CLI/CLI.hpp>

namespace relpath::cli::commands {

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    std::string context = resolve_context(opts.context, "check");
    nlohmann::json results = nlohmann::json::array();
    int invalid = 0;

    for (const auto& path : check_opts.paths) {
        auto result = normalize_relative(path, context);
        if (result.isErr()) {
            ++invalid;
            spdlog::debug("invalid: {} ({})", path, error_code_to_string(result.error().code()));
            if (!opts.json && !opts.quiet) {
                std::cout << path << ": invalid (" << result.error().message() << ")" << std::endl;
            }
        } else if (!opts.json && !opts.quiet) {
            std::cout << path << ": valid" << std::endl;
        }

        nlohmann::json entry = path_outcome_json(path, result);
        entry.erase("path");
        results.push_back(entry);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = invalid == 0;
        j["results"] = results;
        output_json(j);
    }

    return invalid == 0 ? 0 : 1;
}

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("paths", check_opts.paths, "Relative paths to check")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace relpath::cli::commands
