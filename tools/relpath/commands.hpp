/**
 * relpath CLI - command entry points
 *
 * Each command has a cmd_* function returning the process exit code and a
 * setup_* function wiring it into CLI11.
 */

#pragma once

#include "common.hpp"

#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace relpath::cli::commands {

struct NormalizeOptions {
    std::vector<std::string> paths;
};

struct CheckOptions {
    std::vector<std::string> paths;
};

struct ComponentsOptions {
    std::string path;
};

struct JoinOptions {
    std::vector<std::string> paths;
};

struct BatchOptions {
    std::string file;
};

int cmd_normalize(const GlobalOptions& opts, const NormalizeOptions& normalize_opts);
int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts);
int cmd_components(const GlobalOptions& opts, const ComponentsOptions& components_opts);
int cmd_join(const GlobalOptions& opts, const JoinOptions& join_opts);
int cmd_batch(const GlobalOptions& opts, const BatchOptions& batch_opts);

void setup_normalize(CLI::App* app, GlobalOptions& opts);
void setup_check(CLI::App* app, GlobalOptions& opts);
void setup_components(CLI::App* app, GlobalOptions& opts);
void setup_join(CLI::App* app, GlobalOptions& opts);
void setup_batch(CLI::App* app, GlobalOptions& opts);

} // namespace relpath::cli::commands
