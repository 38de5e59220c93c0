#include "ctxopt/tools/code_execute.hpp"

#include <algorithm>
#include <cmath>
#include <format>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/use_awaitable.hpp>

#include "ctxopt/core/logger.hpp"

namespace ctxopt::tools {

namespace {

constexpr std::string_view kDescription =
    R"(Execute JavaScript with the ctxopt SDK. One call replaces many tool round-trips.

SDK (ctx):
  compress: auto(content,hint?) logs(logs) diff(diff) semantic(content,ratio?)
  code: parse(content,lang) extract(content,lang,{type,name}) skeleton(content,lang)
  files: read(path) exists(path) glob(pattern) readStructure(path)
  git: diff(ref?) log(limit?) blame(file,line?) status() branch()
  search: grep(pattern,glob?) symbols(query,glob?) files(pattern) references(symbol,glob?)
  analyze: dependencies(file) callGraph(fn,file,depth?) exports(file) structure(dir?,depth?)
  pipeline(steps) pipeline.codebaseOverview(dir?) pipeline.findUsages(symbol,glob?) pipeline.analyzeDeps(file,depth?)
  utils: countTokens(text) detectType(content) detectLanguage(path)

Example: return ctx.compress.auto(ctx.files.read("logs.txt")))";

} // anonymous namespace

CodeExecuteTool::CodeExecuteTool(boost::asio::any_io_executor worker,
                                 std::filesystem::path working_dir,
                                 sandbox::ExecutionLimits limits)
    : worker_(std::move(worker))
    , working_dir_(std::move(working_dir))
    , limits_(limits) {}

auto CodeExecuteTool::definition() const -> ToolDefinition {
    return ToolDefinition{
        .name = std::string(kCodeExecuteName),
        .description = std::string(kDescription),
        .parameters = {
            {.name = "code", .type = "string", .description = "", .required = true},
            {.name = "timeout", .type = "number", .description = "", .required = false},
        },
    };
}

auto CodeExecuteTool::format_result(const sandbox::ExecutionResult& result) -> json {
    if (!result.success) {
        return text_result(std::format("[ERR] {}\n\nExecution time: {}ms",
                                       result.error.value_or("Unknown error"),
                                       result.stats.execution_time_ms),
                           true);
    }
    return text_result(std::format("[OK] {}ms, {} tokens\n\n{}",
                                   result.stats.execution_time_ms,
                                   result.stats.tokens_used,
                                   result.output.value_or("(no output)")));
}

auto CodeExecuteTool::execute(json params) -> awaitable<Result<json>> {
    if (!params.is_object() || !params.contains("code") || !params["code"].is_string()) {
        co_return std::unexpected(make_error(
            ErrorCode::InvalidArgument,
            "Missing required parameter",
            "code"));
    }
    auto code = params["code"].get<std::string>();

    std::optional<std::chrono::milliseconds> timeout;
    if (params.contains("timeout") && params["timeout"].is_number()) {
        auto requested = params["timeout"].get<double>();
        if (std::isfinite(requested)) {
            timeout = std::chrono::milliseconds(
                static_cast<int64_t>(std::clamp(requested, 0.0, 1e9)));
        }
    }

    auto context = sandbox::make_context(working_dir_, limits_, timeout);
    auto result = co_await boost::asio::co_spawn(
        worker_,
        [code = std::move(code), context]() -> awaitable<sandbox::ExecutionResult> {
            co_return sandbox::execute_sandbox(code, context);
        },
        boost::asio::use_awaitable);

    LOG_DEBUG("code_execute finished: success={} kind={} {}ms {} tokens",
              result.success, sandbox::failure_kind_to_string(result.kind),
              result.stats.execution_time_ms, result.stats.tokens_used);
    co_return format_result(result);
}

} // namespace ctxopt::tools
