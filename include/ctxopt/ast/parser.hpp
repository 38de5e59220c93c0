#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "ctxopt/ast/structure.hpp"
#include "ctxopt/core/error.hpp"

namespace ctxopt::ast {

/// Abstract base class for per-language structure parsers.
///
/// Implementations extract top-level declarations, methods and imports
/// without building a full syntax tree. They never fail: malformed input
/// yields whatever declarations could be recognised.
class StructureParser {
public:
    virtual ~StructureParser() = default;

    [[nodiscard]] virtual auto language() const -> Language = 0;
    [[nodiscard]] virtual auto parse(std::string_view content) const -> FileStructure = 0;
};

/// Returns the parser for `lang`, or nullptr when the language has none.
auto make_parser(Language lang) -> std::unique_ptr<StructureParser>;

/// Parses `content` as `lang`. Fails with Unsupported for languages
/// without a parser (json, yaml, unknown).
auto parse_structure(std::string_view content, Language lang) -> Result<FileStructure>;

/// Source text of the first element of `type` named `name`, or nullopt.
/// Function and Method targets both search `functions`.
auto extract_element(std::string_view content, Language lang, ElementType type,
                     std::string_view name) -> Result<std::optional<std::string>>;

/// Signatures-only outline: the first imports, then classes with their
/// methods, interfaces, types and free functions.
auto render_skeleton(std::string_view content, Language lang) -> Result<std::string>;

/// Elements whose name contains `query` (case-insensitive), across all kinds
/// except imports and exports.
auto search_elements(const FileStructure& structure, std::string_view query)
    -> std::vector<CodeElement>;

} // namespace ctxopt::ast
