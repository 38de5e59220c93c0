#pragma once

#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

#include "ctxopt/ast/parser.hpp"

namespace ctxopt::ast {

/// How a declaration's extent is found.
enum class BlockStyle {
    Braces,       // matching '}' of the first '{' in the signature
    Indentation,  // last line indented deeper than the declaration
};

/// One line-anchored declaration pattern. Rules are tried in order and the
/// first match on a line wins.
struct DeclarationRule {
    std::regex pattern;
    ElementType type;
    int name_group = 1;
    int parent_group = 0;        // receiver type (Go methods); 0 = none
    bool record = true;          // false: container only (Rust impl, Swift extension)
    bool container = false;      // functions directly inside become methods
    bool member_only = false;    // only matches directly inside a container
    bool top_level_only = false;
};

/// Import or export-list pattern. With `split_list` the captured group is a
/// comma separated list ("a, b as c").
struct ListRule {
    std::regex pattern;
    int group = 1;
    bool split_list = false;
};

/// Everything a GrammarParser needs to know about one language.
struct Grammar {
    Language language = Language::Unknown;
    BlockStyle block_style = BlockStyle::Braces;
    std::vector<std::string> line_comments;     // longest first: "///", "//"
    std::vector<std::string> decorator_prefixes;  // skipped when looking for docs

    std::vector<ListRule> imports;
    std::optional<std::regex> import_block_open;   // Go: import (
    std::optional<std::regex> import_block_entry;  // Go: "fmt"

    std::vector<DeclarationRule> declarations;
    std::vector<ListRule> export_lists;

    /// Decides whether a declaration is visible outside its file.
    std::function<bool(std::string_view line, const CodeElement& element, bool top_level)>
        is_exported;
};

/// Line-oriented structure parser driven by a Grammar. Understands string
/// literals and comments well enough to match braces; does not build a tree.
class GrammarParser : public StructureParser {
public:
    explicit GrammarParser(const Grammar& grammar) : grammar_(grammar) {}

    [[nodiscard]] auto language() const -> Language override { return grammar_.language; }
    [[nodiscard]] auto parse(std::string_view content) const -> FileStructure override;

private:
    const Grammar& grammar_;
};

auto typescript_grammar() -> const Grammar&;
auto javascript_grammar() -> const Grammar&;
auto python_grammar() -> const Grammar&;
auto go_grammar() -> const Grammar&;
auto rust_grammar() -> const Grammar&;
auto php_grammar() -> const Grammar&;
auto swift_grammar() -> const Grammar&;

} // namespace ctxopt::ast
