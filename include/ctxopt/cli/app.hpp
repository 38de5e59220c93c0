#pragma once

#include <string>

#include <CLI/CLI.hpp>

#include "ctxopt/cli/commands.hpp"
#include "ctxopt/core/config.hpp"

namespace ctxopt::cli {

/// Exit status when the tool result reports an error.
inline constexpr int kExitToolError = 1;
/// Exit status for invalid command lines.
inline constexpr int kExitUsage = 2;

/// Top-level CLI application.
///
/// Without a subcommand it runs one script through the code_execute tool
/// (`-e code` or `-f file`). Subcommands: `schema`, `config`, `version`.
class App {
public:
    App();
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// Parse arguments and run the selected action.
    /// @returns 0 on success, 1 when the tool reported an error, 2 on usage errors.
    auto run(int argc, char** argv) -> int;

private:
    void setup_commands();

    CLI::App cli_;
    Config config_;
    std::string config_path_;
    std::string log_level_;
    ExecuteOptions execute_;
    CLI::App* schema_cmd_ = nullptr;
    CLI::App* config_cmd_ = nullptr;
    CLI::App* version_cmd_ = nullptr;
};

} // namespace ctxopt::cli
