/**
 * relpath CLI - join command
 *
 * Normalize each argument and join them into a single relative path.
 */

#include "../commands.hpp"
#include <relpath/relative_path.hpp>
#include <CLI/CLI.hpp>

namespace relpath::cli::commands {

int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto result = join_relative_paths(join_opts.paths, resolve_context(opts.context, "join"));
    if (result.isErr()) {
        print_error(result.error().message(), opts.json);
        return 1;
    }

    spdlog::debug("joined {} path(s) into {}", join_opts.paths.size(), result.value());

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["inputs"] = join_opts.paths;
        j["path"] = result.value();
        output_json(j);
    } else {
        print_success(result.value(), false);
    }

    return 0;
}

void setup_join(CLI::App* app, GlobalOptions& opts) {
    static JoinOptions join_opts;

    app->add_option("paths", join_opts.paths, "Relative paths to join")->required();

    app->callback([&opts]() {
        std::exit(cmd_join(opts, join_opts));
    });
}

} // namespace relpath::cli::commands
