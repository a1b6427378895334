/**
 * relpath CLI - batch command
 *
 * Normalize every element of a JSON array file. Elements are handled
 * independently; a bad element does not stop the others.
 */

#include "../commands.hpp"
#include <CLI/CLI.hpp>

namespace relpath::cli::commands {

int cmd_batch(const GlobalOptions& opts, const BatchOptions& batch_opts) {
    init_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto loaded = json::load_batch_file(batch_opts.file);
    if (loaded.isErr()) {
        print_error(loaded.error().message(), opts.json);
        return 1;
    }

    spdlog::debug("loaded {} entries from {}", loaded.value().size(), batch_opts.file);

    auto batch = json::normalize_batch(loaded.value(), resolve_context(opts.context, "batch"));
    if (batch.isErr()) {
        print_error(batch.error().message(), opts.json);
        return 1;
    }

    const auto& result = batch.value();
    for (const auto& entry : result.entries) {
        if (entry.error) {
            spdlog::debug("skipped {}", entry.input.dump());
            print_warning(entry.error->message());
        }
    }

    if (opts.json) {
        output_json(json::to_json(result));
    } else {
        for (const auto& entry : result.entries) {
            if (entry.path) {
                std::cout << *entry.path << std::endl;
            }
        }
        if (!opts.quiet) {
            std::cerr << result.normalized << " normalized, " << result.failed << " failed"
                      << std::endl;
        }
    }

    return result.ok() ? 0 : 1;
}

void setup_batch(CLI::App* app, GlobalOptions& opts) {
    static BatchOptions batch_opts;

    app->add_option("file", batch_opts.file, "JSON file containing an array of paths")
        ->required()
        ->check(CLI::ExistingFile);

    app->callback([&opts]() {
        std::exit(cmd_batch(opts, batch_opts));
    });
}

} // namespace relpath::cli::commands
