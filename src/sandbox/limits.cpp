#include "ctxopt/sandbox/limits.hpp"

#include <algorithm>

namespace ctxopt::sandbox {

auto clamp_timeout(std::optional<std::chrono::milliseconds> requested,
                   std::chrono::milliseconds max) -> std::chrono::milliseconds {
    auto ceiling = std::clamp(max, kMinTimeout, kMaxTimeout);
    return std::clamp(requested.value_or(kDefaultTimeout), kMinTimeout, ceiling);
}

auto limits_from_config(const LimitsConfig& config) -> ExecutionLimits {
    ExecutionLimits limits;
    if (config.max_timeout_ms > 0) {
        limits.max_timeout = std::clamp(std::chrono::milliseconds(config.max_timeout_ms),
                                        kMinTimeout, kMaxTimeout);
    }
    limits.timeout = clamp_timeout(
        config.default_timeout_ms > 0
            ? std::optional(std::chrono::milliseconds(config.default_timeout_ms))
            : std::nullopt,
        limits.max_timeout);
    if (config.memory_limit_mb > 0) {
        limits.memory_limit_bytes =
            std::min(config.memory_limit_mb * 1024 * 1024, kDefaultMemoryLimit);
    }
    if (config.max_output_tokens > 0) {
        limits.max_output_tokens = config.max_output_tokens;
    }
    return limits;
}

} // namespace ctxopt::sandbox
