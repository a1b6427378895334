/**
 * relpath CLI - Entry Point
 *
 * Relative path normalization from the command line.
 */

#include <CLI/CLI.hpp>
#include "commands.hpp"

#ifndef RELPATH_VERSION
#define RELPATH_VERSION "unknown"
#endif

int main(int argc, char** argv) {
    using namespace relpath::cli;

    CLI::App app{"relpath - Relative path normalization"};
    app.set_version_flag("-V,--version", RELPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--context", opts.context, "Label prefixed to error messages");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* normalize_cmd = app.add_subcommand("normalize", "Print the canonical form of paths");
    commands::setup_normalize(normalize_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Report whether paths normalize");
    commands::setup_check(check_cmd, opts);

    auto* components_cmd = app.add_subcommand("components", "List the components of a path");
    commands::setup_components(components_cmd, opts);

    auto* join_cmd = app.add_subcommand("join", "Join relative paths into one");
    commands::setup_join(join_cmd, opts);

    auto* batch_cmd = app.add_subcommand("batch", "Normalize a JSON array of paths");
    commands::setup_batch(batch_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
