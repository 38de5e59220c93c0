#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>

#include "ctxopt/core/config.hpp"

namespace ctxopt::cli {

/// Options of the default action: run one script.
struct ExecuteOptions {
    std::string working_dir;
    std::string code;
    std::string file;
    std::optional<int64_t> timeout_ms;
    bool json_output = false;
};

/// Adds `-C`, `-e`, `-f`, `-t` and `--json` to `app`.
void register_execute_options(CLI::App& app, ExecuteOptions& options);

/// Runs the script named by `options` through the code_execute tool and
/// prints the tool result. Returns the process exit status.
auto run_execute(const ExecuteOptions& options, const Config& config) -> int;

/// Register the `schema` subcommand: prints the tool definitions.
auto register_schema_command(CLI::App& app) -> CLI::App*;

/// Register the `config` subcommand: prints the effective configuration.
auto register_config_command(CLI::App& app) -> CLI::App*;

/// Register the `version` subcommand.
auto register_version_command(CLI::App& app) -> CLI::App*;

auto print_schema(const Config& config) -> int;
auto print_config(const Config& config) -> int;
auto print_version() -> int;

} // namespace ctxopt::cli
