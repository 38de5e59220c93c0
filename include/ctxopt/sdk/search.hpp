#pragma once

#include <optional>
#include <string_view>

#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

/// Lines longer than this are matched only up to this many bytes, which
/// bounds the cost of a single regex evaluation.
inline constexpr std::size_t kMaxScanLine = 4096;

/// Regex search over files matching `glob` (default: source files).
/// `{ matches: [{ file, line, column, content, match }], totalMatches, filesSearched }`
auto search_grep(const Host& host, std::string_view pattern,
                 std::optional<std::string_view> glob = std::nullopt) -> Result<json>;

/// Declarations whose name contains `query`, case-insensitively.
/// `{ symbols: [{ name, type, file, line, signature? }], totalMatches }`
auto search_symbols(const Host& host, std::string_view query,
                    std::optional<std::string_view> glob = std::nullopt) -> Result<json>;

/// `{ files: [{ path, name, extension, size }], totalMatches }`
auto search_files(const Host& host, std::string_view pattern) -> Result<json>;

/// Whole-word occurrences of `symbol`, each classified as definition,
/// import or usage. `[{ file, line, column, context, type }]`
auto search_references(const Host& host, std::string_view symbol,
                       std::optional<std::string_view> glob = std::nullopt) -> Result<json>;

} // namespace ctxopt::sdk
