#pragma once

#include <chrono>
#include <cstddef>
#include <optional>

#include "ctxopt/core/config.hpp"

namespace ctxopt::sandbox {

using namespace std::chrono_literals;

inline constexpr std::chrono::milliseconds kDefaultTimeout = 5000ms;
inline constexpr std::chrono::milliseconds kMinTimeout = 1000ms;
inline constexpr std::chrono::milliseconds kMaxTimeout = 30000ms;
inline constexpr std::size_t kDefaultMemoryLimit = 128 * 1024 * 1024;
inline constexpr std::size_t kDefaultMaxOutputTokens = 4000;

/// Per-call limits. Immutable once an execution starts.
struct ExecutionLimits {
    std::chrono::milliseconds timeout = kDefaultTimeout;
    std::chrono::milliseconds max_timeout = kMaxTimeout;
    std::size_t memory_limit_bytes = kDefaultMemoryLimit;
    std::size_t max_output_tokens = kDefaultMaxOutputTokens;
};

/// Clamps a requested timeout into [kMinTimeout, max]. A missing request
/// uses kDefaultTimeout, clamped the same way. `max` never exceeds
/// kMaxTimeout.
[[nodiscard]] auto clamp_timeout(std::optional<std::chrono::milliseconds> requested,
                                 std::chrono::milliseconds max = kMaxTimeout)
    -> std::chrono::milliseconds;

/// Builds limits from configuration. The config can lower the timeout
/// ceiling and the memory budget, never raise them; zero values fall back
/// to the defaults.
[[nodiscard]] auto limits_from_config(const LimitsConfig& config) -> ExecutionLimits;

} // namespace ctxopt::sandbox
