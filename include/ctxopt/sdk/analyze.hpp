#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ctxopt/ast/language.hpp"
#include "ctxopt/core/error.hpp"
#include "ctxopt/sdk/host.hpp"
#include "ctxopt/sdk/types.hpp"

namespace ctxopt::sdk {

inline constexpr int kDefaultAnalyzeDepth = 3;
/// Files whose structure `analyze_structure` parses in one call.
inline constexpr std::size_t kMaxStructureFiles = 200;

struct ImportInfo {
    std::string source;
    std::vector<std::string> names;
    bool is_default = false;
    bool is_namespace = false;
    std::optional<std::string> resolved_path;
};

/// Import statements of one file. Understands ES modules and require() for
/// TypeScript/JavaScript, `import`/`from ... import` for Python and import
/// blocks for Go; other languages fall back to the structure parser.
auto parse_imports(std::string_view content, ast::Language lang) -> std::vector<ImportInfo>;

/// Working-directory relative path of a relative import, or nullopt for
/// package imports and targets that do not exist inside the sandbox.
auto resolve_import(const Host& host, std::string_view source, std::string_view from_file,
                    ast::Language lang) -> std::optional<std::string>;

/// Names called as `name(` in `body`, first occurrence order, without
/// control-flow keywords and without `self_name`.
auto extract_calls(std::string_view body, std::string_view self_name) -> std::vector<std::string>;

/// `{ file, imports, exports, externalDeps, internalDeps }`
auto analyze_dependencies(const Host& host, std::string_view file) -> Result<json>;

/// Same-file call graph rooted at `function_name`.
/// `{ root, nodes: [{ name, file, line, calls, calledBy }], depth }`
auto analyze_call_graph(const Host& host, std::string_view function_name, std::string_view file,
                        std::optional<int> depth = std::nullopt) -> Result<json>;

/// `[{ name, type, isDefault, line, signature? }]`
auto analyze_exports(const Host& host, std::string_view file) -> Result<json>;

/// Directory tree with per-file declaration counts. Visits at most kMaxFiles
/// entries and parses at most kMaxStructureFiles files.
auto analyze_structure(const Host& host, std::optional<std::string_view> dir = std::nullopt,
                       std::optional<int> depth = std::nullopt) -> Result<json>;

} // namespace ctxopt::sdk
