#include "ctxopt/sandbox/executor.hpp"

#include <format>

#include "ctxopt/core/cancellation.hpp"
#include "ctxopt/core/logger.hpp"
#include "ctxopt/core/utils.hpp"
#include "ctxopt/script/builtins.hpp"
#include "ctxopt/script/interpreter.hpp"
#include "ctxopt/script/parser.hpp"
#include "ctxopt/sdk/bridge.hpp"
#include "ctxopt/security/code_analyzer.hpp"
#include "ctxopt/security/error_sanitizer.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::sandbox {

namespace {

auto kind_of(ErrorCode code) -> FailureKind {
    switch (code) {
        case ErrorCode::Timeout: return FailureKind::Timeout;
        case ErrorCode::PathRejected: return FailureKind::PathRejected;
        case ErrorCode::SecurityBlocked: return FailureKind::SecurityBlocked;
        default: return FailureKind::RuntimeError;
    }
}

/// Strings are returned verbatim; null and undefined mean "no output".
auto serialize(const script::Value& value, script::Heap& heap) -> std::optional<std::string> {
    if (value.is_nullish()) return std::nullopt;
    if (value.is_string()) return value.as_string();
    return script::to_json_value(value, heap).dump(2, ' ', false, script::json::error_handler_t::replace);
}

/// Drops a partial UTF-8 sequence left at the end of a byte cut.
auto utf8_boundary(std::string_view text, std::size_t pos) -> std::size_t {
    while (pos > 0 && pos < text.size() &&
           (static_cast<unsigned char>(text[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return pos;
}

} // anonymous namespace

auto failure_kind_to_string(FailureKind kind) -> std::string_view {
    switch (kind) {
        case FailureKind::None: return "None";
        case FailureKind::SecurityBlocked: return "SecurityBlocked";
        case FailureKind::PathRejected: return "PathRejected";
        case FailureKind::Timeout: return "Timeout";
        case FailureKind::RuntimeError: return "RuntimeError";
    }
    return "RuntimeError";
}

auto ExecutionResult::to_json() const -> nlohmann::json {
    nlohmann::json j = {
        {"success", success},
        {"stats", {
            {"executionTimeMs", stats.execution_time_ms},
            {"tokensUsed", stats.tokens_used},
        }},
    };
    j["output"] = output ? nlohmann::json(*output) : nlohmann::json(nullptr);
    if (error) j["error"] = *error;
    if (kind != FailureKind::None) j["kind"] = failure_kind_to_string(kind);
    if (!warnings.empty()) j["warnings"] = warnings;
    if (truncated) j["truncated"] = true;
    return j;
}

auto make_context(std::filesystem::path working_dir, const ExecutionLimits& limits,
                  std::optional<std::chrono::milliseconds> timeout) -> ExecutionContext {
    ExecutionContext ctx;
    ctx.working_dir = std::move(working_dir);
    ctx.timeout = timeout.value_or(limits.timeout);
    ctx.max_timeout = limits.max_timeout;
    ctx.memory_limit_bytes = limits.memory_limit_bytes;
    ctx.max_output_tokens = limits.max_output_tokens;
    return ctx;
}

auto truncate_output(std::string text, std::size_t max_tokens) -> std::pair<std::string, bool> {
    auto tokens = text::estimate_tokens(text);
    if (tokens <= max_tokens) return {std::move(text), false};

    // Estimates run close to four bytes per token; shrink until it fits.
    auto cut = utf8_boundary(text, std::min(text.size(), max_tokens * 4));
    while (cut > 0 && text::estimate_tokens(std::string_view(text).substr(0, cut)) > max_tokens) {
        cut = utf8_boundary(text, cut - std::max<std::size_t>(cut / 10, 1));
    }
    text.resize(cut);
    text += std::format("\n\n[truncated: {} tokens exceeds limit of {}]", tokens, max_tokens);
    return {std::move(text), true};
}

auto execute_sandbox(std::string_view code, const ExecutionContext& context) -> ExecutionResult {
    const auto start = utils::timestamp_ms();
    ExecutionResult result;
    auto finish = [&](ExecutionResult& r) -> ExecutionResult {
        r.stats.execution_time_ms = utils::timestamp_ms() - start;
        return std::move(r);
    };
    auto fail = [&](FailureKind kind, std::string_view message) -> ExecutionResult {
        result.success = false;
        result.kind = kind;
        result.output.reset();
        result.error = security::sanitize_error(message, context.working_dir);
        result.stats.tokens_used = 0;
        return finish(result);
    };

    const auto timeout = clamp_timeout(context.timeout, context.max_timeout);

    auto verdict = security::analyze_code(code);
    result.warnings = verdict.warnings;
    if (!verdict.safe) {
        LOG_WARN("Execution blocked: {}", utils::join(verdict.blocked_patterns, ", "));
        return fail(FailureKind::SecurityBlocked,
                    "Blocked patterns: " + utils::join(verdict.blocked_patterns, ", "));
    }

    auto program = script::parse_program(code);
    if (!program) {
        return fail(FailureKind::RuntimeError, program.error().what());
    }

    // The bridge and interpreter share this token; the run's deadline starts here.
    CancellationToken cancel(timeout);
    script::Heap heap(context.memory_limit_bytes);
    script::Interpreter interp(heap, cancel);
    sdk::Bridge bridge(context.working_dir, cancel);

    std::optional<std::string> output;
    try {
        script::install_builtins(interp);
        bridge.install(interp);

        auto value = interp.run(**program);
        if (!value) {
            const auto& error = value.error();
            if (error.code() == ErrorCode::Timeout) {
                LOG_WARN("Execution timed out after {}ms", timeout.count());
                return fail(FailureKind::Timeout, "Execution timeout");
            }
            if (error.code() == ErrorCode::PathRejected) {
                LOG_WARN("Execution stopped by a rejected path");
            }
            return fail(kind_of(error.code()), error.what());
        }
        output = serialize(*value, heap);
    } catch (const script::ScriptException& e) {
        return fail(FailureKind::RuntimeError, e.what());
    } catch (const script::AbortError& e) {
        return fail(kind_of(e.code()), e.what());
    } catch (const std::bad_alloc&) {
        return fail(FailureKind::RuntimeError, "Memory limit exceeded");
    }

    // Serialisation can outlive the deadline on huge values.
    if (cancel.is_cancelled()) {
        LOG_WARN("Execution timed out after {}ms", timeout.count());
        return fail(FailureKind::Timeout, "Execution timeout");
    }

    result.success = true;
    if (output) {
        auto [text, truncated] = truncate_output(std::move(*output), context.max_output_tokens);
        if (truncated) LOG_INFO("Execution output truncated to {} tokens", context.max_output_tokens);
        result.stats.tokens_used = text::estimate_tokens(text);
        result.truncated = truncated;
        result.output = std::move(text);
    }
    return finish(result);
}

} // namespace ctxopt::sandbox
