#include "ctxopt/cli/commands.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "ctxopt/cli/app.hpp"
#include "ctxopt/core/logger.hpp"
#include "ctxopt/sandbox/limits.hpp"
#include "ctxopt/tools/code_execute.hpp"
#include "ctxopt/tools/tool_registry.hpp"

// Set by the build.
#ifndef CTXOPT_VERSION_STRING
#define CTXOPT_VERSION_STRING "0.1.0-dev"
#endif

namespace ctxopt::cli {

using json = nlohmann::json;

namespace {

auto read_script(const std::string& path) -> std::optional<std::string> {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) return std::nullopt;
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

auto resolve_working_dir(const ExecuteOptions& options, const Config& config)
    -> std::optional<std::filesystem::path> {
    std::error_code ec;
    std::filesystem::path dir = !options.working_dir.empty() ? options.working_dir
                                : !config.working_dir.empty() ? config.working_dir
                                : std::filesystem::current_path(ec);
    if (ec) return std::nullopt;
    auto canonical = std::filesystem::weakly_canonical(dir, ec);
    if (ec || !std::filesystem::is_directory(canonical, ec)) return std::nullopt;
    return canonical;
}

auto make_registry(boost::asio::any_io_executor worker, const std::filesystem::path& working_dir,
                   const Config& config) -> tools::ToolRegistry {
    tools::ToolRegistry registry;
    registry.register_tool(std::make_unique<tools::CodeExecuteTool>(
        std::move(worker), working_dir, sandbox::limits_from_config(config.limits)));
    return registry;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// execute (default action)
// ---------------------------------------------------------------------------

void register_execute_options(CLI::App& app, ExecuteOptions& options) {
    app.add_option("-C,--dir", options.working_dir,
                   "Working directory the script may read (default: current directory)")
        ->check(CLI::ExistingDirectory);

    auto* code = app.add_option("-e,--eval", options.code, "Script source to run");
    auto* file = app.add_option("-f,--file", options.file, "Read the script from a file")
        ->check(CLI::ExistingFile);
    code->excludes(file);

    app.add_option("-t,--timeout", options.timeout_ms,
                   "Timeout in milliseconds (clamped to 1000..30000)");
    app.add_flag("--json", options.json_output, "Print the raw tool result as JSON");
}

auto run_execute(const ExecuteOptions& options, const Config& config) -> int {
    std::string code = options.code;
    if (!options.file.empty()) {
        auto script = read_script(options.file);
        if (!script) {
            std::cerr << "Cannot read script file: " << options.file << "\n";
            return kExitUsage;
        }
        code = std::move(*script);
    }
    if (code.empty()) {
        std::cerr << "Nothing to run: pass -e <code> or -f <file>\n";
        return kExitUsage;
    }

    auto working_dir = resolve_working_dir(options, config);
    if (!working_dir) {
        std::cerr << "Working directory is not accessible\n";
        return kExitUsage;
    }

    json params = {{"code", code}};
    if (options.timeout_ms) params["timeout"] = *options.timeout_ms;

    boost::asio::io_context ioc;
    boost::asio::thread_pool pool(std::max<std::size_t>(config.worker_threads, 1));
    auto registry = make_registry(pool.get_executor(), *working_dir, config);

    std::optional<Result<json>> outcome;
    std::exception_ptr failure;
    boost::asio::co_spawn(
        ioc,
        registry.execute(tools::kCodeExecuteName, std::move(params)),
        [&](std::exception_ptr ep, Result<json> result) {
            failure = ep;
            if (!ep) outcome = std::move(result);
        });
    ioc.run();
    pool.join();

    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            LOG_ERROR("code_execute failed: {}", e.what());
            return kExitToolError;
        }
    }
    if (!outcome || !*outcome) {
        std::cerr << (outcome ? outcome->error().what() : std::string("No result")) << "\n";
        return kExitUsage;
    }

    const auto& result = **outcome;
    bool is_error = result.value("isError", false);
    if (options.json_output) {
        std::cout << result.dump(2, ' ', false, json::error_handler_t::replace) << "\n";
    } else {
        for (const auto& item : result["content"]) {
            std::cout << item.value("text", "") << "\n";
        }
    }
    return is_error ? kExitToolError : 0;
}

// ---------------------------------------------------------------------------
// schema command
// ---------------------------------------------------------------------------

auto register_schema_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("schema", "Print the tool definitions as JSON");
}

auto print_schema(const Config& config) -> int {
    boost::asio::io_context ioc;
    auto registry = make_registry(ioc.get_executor(), std::filesystem::path("."), config);
    std::cout << registry.to_json().dump(2) << "\n";
    return 0;
}

// ---------------------------------------------------------------------------
// config command
// ---------------------------------------------------------------------------

auto register_config_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("config", "Print the effective configuration");
}

auto print_config(const Config& config) -> int {
    json j = config;
    std::cout << j.dump(2) << "\n";
    return 0;
}

// ---------------------------------------------------------------------------
// version command
// ---------------------------------------------------------------------------

auto register_version_command(CLI::App& app) -> CLI::App* {
    return app.add_subcommand("version", "Print version information");
}

auto print_version() -> int {
    std::cout << "ctxopt-sandbox " << CTXOPT_VERSION_STRING << "\n";
    std::cout << "C++ standard: " << __cplusplus << "\n";
#if defined(__clang__)
    std::cout << "Compiler: clang " << __clang_major__ << "."
              << __clang_minor__ << "." << __clang_patchlevel__ << "\n";
#elif defined(__GNUC__)
    std::cout << "Compiler: gcc " << __GNUC__ << "."
              << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#else
    std::cout << "Compiler: unknown\n";
#endif
    return 0;
}

} // namespace ctxopt::cli
