#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ctxopt/sandbox/limits.hpp"

namespace ctxopt::sandbox {

/// Why an execution failed. OutputTooLarge is not a failure: it shows up as
/// `truncated` on a successful result.
enum class FailureKind {
    None,
    SecurityBlocked,
    PathRejected,
    Timeout,
    RuntimeError,
};

auto failure_kind_to_string(FailureKind kind) -> std::string_view;

struct ExecutionStats {
    int64_t execution_time_ms = 0;
    std::size_t tokens_used = 0;
};

struct ExecutionResult {
    bool success = false;
    /// Serialised return value; nullopt when the script returned null or
    /// undefined, or failed.
    std::optional<std::string> output;
    /// Sanitised failure reason.
    std::optional<std::string> error;
    FailureKind kind = FailureKind::None;
    std::vector<std::string> warnings;
    bool truncated = false;
    ExecutionStats stats;

    /// `{ success, output?, error?, kind?, warnings?, truncated?, stats }`
    [[nodiscard]] auto to_json() const -> nlohmann::json;
};

struct ExecutionContext {
    std::filesystem::path working_dir;
    /// Requested timeout; clamped into [kMinTimeout, max_timeout].
    std::optional<std::chrono::milliseconds> timeout;
    std::chrono::milliseconds max_timeout = kMaxTimeout;
    std::size_t memory_limit_bytes = kDefaultMemoryLimit;
    std::size_t max_output_tokens = kDefaultMaxOutputTokens;
};

/// Builds a context from configured limits plus a per-call timeout request.
auto make_context(std::filesystem::path working_dir, const ExecutionLimits& limits,
                  std::optional<std::chrono::milliseconds> timeout = std::nullopt)
    -> ExecutionContext;

/// Runs one untrusted script against the capability SDK.
///
/// The code is first screened by the static analyzer, then parsed and run
/// by a fresh interpreter whose only globals are the builtins and `ctx`.
/// Every error is sanitised before it leaves this function; nothing throws.
/// Blocking; callers that must not block run it on a worker thread.
auto execute_sandbox(std::string_view code, const ExecutionContext& context) -> ExecutionResult;

/// Cuts `text` so its estimated token count stays within `max_tokens` and
/// appends a `[truncated: N tokens exceeds limit of M]` marker. Text that
/// already fits comes back unchanged.
auto truncate_output(std::string text, std::size_t max_tokens) -> std::pair<std::string, bool>;

} // namespace ctxopt::sandbox
