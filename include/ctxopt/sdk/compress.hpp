#pragma once

#include <optional>
#include <string_view>

#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

inline constexpr double kMinSemanticRatio = 0.1;
inline constexpr double kMaxSemanticRatio = 0.9;

/// Detects the content type (or uses `hint`, e.g. "logs") and compresses with
/// the matching compressor. `{ compressed, stats: { original, compressed,
/// reductionPercent } }`.
auto compress_auto(std::string_view content, std::optional<std::string_view> hint = std::nullopt)
    -> json;

/// `{ summary, stats: { totalLines, errorCount, warningCount } }`
auto compress_logs(std::string_view logs) -> json;

auto compress_diff(std::string_view diff) -> json;

/// Extractive compression keeping about `ratio` of the tokens. The ratio is
/// clamped into [0.1, 0.9].
auto compress_semantic(std::string_view content, double ratio = 0.5) -> json;

} // namespace ctxopt::sdk
