#include "ctxopt/cli/app.hpp"
#include "ctxopt/core/logger.hpp"

#include <filesystem>

#ifndef CTXOPT_VERSION_STRING
#define CTXOPT_VERSION_STRING "0.1.0-dev"
#endif

namespace ctxopt::cli {

App::App()
    : cli_("ctxopt-sandbox", "Run scripts against the read-only ctxopt capability SDK")
{
    cli_.set_version_flag("--version", CTXOPT_VERSION_STRING,
                          "Display version information");

    cli_.add_option("-c,--config", config_path_,
                    "Path to configuration file (JSON)")
        ->envname("CTXOPT_CONFIG")
        ->check(CLI::ExistingFile);

    cli_.add_option("--log-level", log_level_,
                    "Log level (trace, debug, info, warn, error, critical, off)");

    cli_.require_subcommand(0, 1);
    setup_commands();
}

App::~App() = default;

auto App::run(int argc, char** argv) -> int {
    try {
        cli_.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        auto code = cli_.exit(e);
        return code == 0 ? 0 : kExitUsage;
    }

    // File first, then CTXOPT_* variables, then the command line.
    config_ = config_path_.empty() ? default_config()
                                   : load_config(std::filesystem::path(config_path_));
    apply_env_overrides(config_);
    if (!log_level_.empty()) config_.log_level = log_level_;
    Logger::init("ctxopt", config_.log_level);

    int status = 0;
    if (schema_cmd_->parsed()) status = print_schema(config_);
    else if (config_cmd_->parsed()) status = print_config(config_);
    else if (version_cmd_->parsed()) status = print_version();
    else status = run_execute(execute_, config_);
    Logger::flush();
    return status;
}

void App::setup_commands() {
    register_execute_options(cli_, execute_);
    schema_cmd_ = register_schema_command(cli_);
    config_cmd_ = register_config_command(cli_);
    version_cmd_ = register_version_command(cli_);
}

} // namespace ctxopt::cli
