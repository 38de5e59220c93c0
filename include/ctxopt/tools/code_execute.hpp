#pragma once

#include <filesystem>
#include <utility>

#include <boost/asio.hpp>

#include "ctxopt/sandbox/executor.hpp"
#include "ctxopt/sandbox/limits.hpp"
#include "ctxopt/tools/tool.hpp"

namespace ctxopt::tools {

inline constexpr std::string_view kCodeExecuteName = "code_execute";

/// Runs a script against the capability SDK in the sandbox.
///
/// Parameters: `{ code: string, timeout?: number }`. Each call gets its own
/// executor run on `worker`, so concurrent calls never share state and the
/// caller's executor is never blocked by a running script.
///
/// Success text: `[OK] <ms>ms, <tokens> tokens`, a blank line, then the
/// output (`(no output)` for null/undefined). Failure text:
/// `[ERR] <reason>`, a blank line, then `Execution time: <ms>ms`.
class CodeExecuteTool : public Tool {
public:
    CodeExecuteTool(boost::asio::any_io_executor worker,
                    std::filesystem::path working_dir,
                    sandbox::ExecutionLimits limits = {});

    [[nodiscard]] auto definition() const -> ToolDefinition override;
    auto execute(json params) -> awaitable<Result<json>> override;

    /// Tool result text for a finished execution.
    [[nodiscard]] static auto format_result(const sandbox::ExecutionResult& result) -> json;

private:
    boost::asio::any_io_executor worker_;
    std::filesystem::path working_dir_;
    sandbox::ExecutionLimits limits_;
};

} // namespace ctxopt::tools
