/**
 * relpath CLI - components command
 *
 * Print the components of a relative path, one per line.
 */

#include "../commands.hpp"
#include <relpath/relative_path.hpp>
#include <CLI/CLI.hpp>

namespace relpath::cli::commands {

int cmd_components(const GlobalOptions& opts, const ComponentsOptions& components_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto result = split_relative(components_opts.path, resolve_context(opts.context, "components"));
    if (result.isErr()) {
        print_error(result.error().message(), opts.json);
        return 1;
    }

    const auto& components = result.value();
    spdlog::debug("{} has {} component(s)", components_opts.path, components.size());

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["input"] = components_opts.path;
        j["components"] = components;
        j["path"] = join_relative(components);
        output_json(j);
    } else {
        if (components.empty()) {
            print_warning(components_opts.path + " denotes the current directory");
        }
        for (const auto& c : components) {
            std::cout << c << std::endl;
        }
    }

    return 0;
}

void setup_components(CLI::App* app, GlobalOptions& opts) {
    static ComponentsOptions components_opts;

    app->add_option("path", components_opts.path, "Relative path to split")->required();

    app->callback([&opts]() {
        std::exit(cmd_components(opts, components_opts));
    });
}

} // namespace relpath::cli::commands
