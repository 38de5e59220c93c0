#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace ctxopt::sdk {

auto count_tokens(std::string_view text) -> std::size_t;

/// "logs", "stacktrace", "config", "diff", "code" or "generic".
auto detect_type(std::string_view content) -> std::string;

/// Language name for a file path, "unknown" when the extension is not mapped.
auto detect_language(std::string_view path) -> std::string;

} // namespace ctxopt::sdk
