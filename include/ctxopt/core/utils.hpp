#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace ctxopt::utils {

auto timestamp_ms() -> int64_t;
auto trim(std::string_view s) -> std::string;
auto split(std::string_view s, char delim) -> std::vector<std::string>;

/// Splits on '\n' and keeps empty lines; a trailing "\r" is dropped per line.
auto split_lines(std::string_view s) -> std::vector<std::string>;

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto to_upper(std::string_view s) -> std::string;

/// Replaces every occurrence of `from` in `s` with `to`. An empty `from` is a no-op.
auto replace_all(std::string s, std::string_view from, std::string_view to) -> std::string;

/// Escapes ECMAScript regex metacharacters so `s` matches literally.
auto escape_regex(std::string_view s) -> std::string;

} // namespace ctxopt::utils
