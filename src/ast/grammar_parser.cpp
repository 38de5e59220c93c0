#include "ctxopt/ast/grammar.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::ast {

namespace {

constexpr std::size_t kMaxSignatureLength = 200;

auto excluded_names() -> const std::unordered_set<std::string>& {
    static const std::unordered_set<std::string> names = {
        "if", "for", "while", "switch", "catch", "return", "function", "new", "typeof",
        "await", "super", "this", "else", "do", "try", "func", "var", "let", "const",
        "throw", "delete", "void", "yield", "in", "of", "with",
    };
    return names;
}

// ---------------------------------------------------------------------------
// Brace scan
// ---------------------------------------------------------------------------

struct BraceMap {
    std::vector<int> depth_at_line;                     // depth at the start of each line
    std::unordered_map<std::size_t, std::size_t> close_of;  // '{' offset -> '}' offset
};

auto scan_braces(std::string_view content, Language lang, std::size_t line_count) -> BraceMap {
    BraceMap map;
    map.depth_at_line.reserve(line_count);
    map.depth_at_line.push_back(0);

    std::vector<std::size_t> stack;
    char quote = 0;
    bool line_comment = false;
    bool block_comment = false;

    for (std::size_t i = 0; i < content.size(); ++i) {
        char c = content[i];
        char next = i + 1 < content.size() ? content[i + 1] : '\0';

        if (c == '\n') {
            line_comment = false;
            map.depth_at_line.push_back(static_cast<int>(stack.size()));
            // Unterminated single-line strings end at the newline.
            if (quote == '"' || quote == '\'') quote = 0;
            continue;
        }
        if (line_comment) continue;
        if (block_comment) {
            if (c == '*' && next == '/') {
                block_comment = false;
                ++i;
            }
            continue;
        }
        if (quote) {
            if (c == '\\') {
                ++i;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }

        if (c == '/' && next == '/') {
            line_comment = true;
            continue;
        }
        if (c == '/' && next == '*') {
            block_comment = true;
            ++i;
            continue;
        }
        if (c == '\'' && lang == Language::Rust) {
            // Char literal ('a', '\n'); anything else is a lifetime.
            if (next == '\\') {
                auto end = content.find('\'', i + 2);
                if (end != std::string_view::npos) i = end;
            } else if (i + 2 < content.size() && content[i + 2] == '\'') {
                i += 2;
            }
            continue;
        }
        if (c == '"' || c == '\'' || c == '`') {
            quote = c;
            continue;
        }

        if (c == '{') {
            stack.push_back(i);
        } else if (c == '}' && !stack.empty()) {
            map.close_of[stack.back()] = i;
            stack.pop_back();
        }
    }
    return map;
}

// ---------------------------------------------------------------------------
// Line helpers
// ---------------------------------------------------------------------------

auto leading_indent(std::string_view line) -> std::size_t {
    auto pos = line.find_first_not_of(" \t");
    return pos == std::string_view::npos ? line.size() : pos;
}

auto is_blank(std::string_view line) -> bool {
    return line.find_first_not_of(" \t") == std::string_view::npos;
}

/// 1-based last line of a Python block starting at 0-based `start`.
auto indentation_block_end(const std::vector<std::string>& lines, std::size_t start) -> int {
    auto base = leading_indent(lines[start]);
    auto end = start;
    for (auto i = start + 1; i < lines.size(); ++i) {
        if (is_blank(lines[i])) continue;
        if (leading_indent(lines[i]) <= base) break;
        end = i;
    }
    return static_cast<int>(end) + 1;
}

auto line_of_offset(const std::vector<std::size_t>& offsets, std::size_t offset) -> int {
    auto it = std::upper_bound(offsets.begin(), offsets.end(), offset);
    return static_cast<int>(it - offsets.begin());
}

auto make_signature(std::string_view line, BlockStyle style) -> std::string {
    auto sig = utils::trim(line);
    if (style == BlockStyle::Braces) {
        if (sig.ends_with("{")) sig = utils::trim(sig.substr(0, sig.size() - 1));
    } else if (sig.ends_with(":")) {
        sig.pop_back();
    }
    if (sig.size() > kMaxSignatureLength) {
        sig = sig.substr(0, kMaxSignatureLength) + "...";
    }
    return sig;
}

auto strip_comment_marker(std::string line, const std::vector<std::string>& markers) -> std::string {
    line = utils::trim(line);
    for (const auto& m : markers) {
        if (line.starts_with(m)) return utils::trim(line.substr(m.size()));
    }
    return line;
}

auto python_docstring(const std::vector<std::string>& lines, std::size_t def_line)
    -> std::optional<std::string> {
    if (def_line + 1 >= lines.size()) return std::nullopt;
    auto first = utils::trim(lines[def_line + 1]);
    if (!first.starts_with("\"\"\"") && !first.starts_with("'''")) return std::nullopt;

    auto quote = first.substr(0, 3);
    auto body = first.substr(3);
    if (auto end = body.find(quote); end != std::string::npos) {
        return utils::trim(body.substr(0, end));
    }
    for (auto i = def_line + 2; i < lines.size(); ++i) {
        if (auto end = lines[i].find(quote); end != std::string::npos) {
            body += "\n" + lines[i].substr(0, end);
            return utils::trim(body);
        }
        body += "\n" + lines[i];
    }
    return std::nullopt;
}

/// Comment block directly above 0-based line `index`, skipping decorators.
auto documentation_above(const std::vector<std::string>& lines, std::size_t index,
                         const Grammar& grammar) -> std::optional<std::string> {
    if (index == 0) return std::nullopt;
    auto j = static_cast<std::ptrdiff_t>(index) - 1;

    auto is_decorator = [&](const std::string& trimmed) {
        return std::ranges::any_of(grammar.decorator_prefixes,
                                   [&](const auto& p) { return trimmed.starts_with(p); });
    };
    while (j >= 0 && is_decorator(utils::trim(lines[j]))) --j;
    if (j < 0) return std::nullopt;

    auto trimmed = utils::trim(lines[j]);
    std::vector<std::string> collected;

    if (trimmed.ends_with("*/")) {
        for (; j >= 0; --j) {
            auto t = utils::trim(lines[j]);
            bool opens = t.starts_with("/*");
            t = utils::replace_all(t, "*/", "");
            if (t.starts_with("/**")) t = t.substr(3);
            else if (t.starts_with("/*")) t = t.substr(2);
            else if (t.starts_with("*")) t = t.substr(1);
            t = utils::trim(t);
            if (!t.empty()) collected.push_back(t);
            if (opens) break;
        }
    } else {
        for (; j >= 0; --j) {
            auto t = utils::trim(lines[j]);
            bool is_comment = std::ranges::any_of(grammar.line_comments,
                                                  [&](const auto& m) { return t.starts_with(m); });
            if (!is_comment) break;
            collected.push_back(strip_comment_marker(t, grammar.line_comments));
        }
    }

    if (collected.empty()) return std::nullopt;
    std::ranges::reverse(collected);
    return utils::join(collected, "\n");
}

/// Splits "a, b as c, type d" into (local, exported) pairs.
auto split_names(const std::string& list) -> std::vector<std::pair<std::string, std::string>> {
    std::vector<std::pair<std::string, std::string>> out;
    for (auto part : utils::split(list, ',')) {
        part = utils::trim(part);
        if (part.starts_with("type ")) part = utils::trim(part.substr(5));
        if (part.empty()) continue;
        auto as = part.find(" as ");
        if (as == std::string::npos) {
            out.emplace_back(part, part);
        } else {
            out.emplace_back(utils::trim(part.substr(0, as)), utils::trim(part.substr(as + 4)));
        }
    }
    return out;
}

struct Container {
    std::string name;
    int end_line;
    int depth;
    std::size_t indent;
};

} // anonymous namespace

auto GrammarParser::parse(std::string_view content) const -> FileStructure {
    const auto& g = grammar_;
    auto lines = utils::split_lines(content);

    FileStructure out;
    out.language = g.language;
    out.total_lines = static_cast<int>(lines.size());

    std::vector<std::size_t> offsets;
    offsets.reserve(lines.size());
    offsets.push_back(0);
    for (std::size_t i = 0; i < content.size(); ++i) {
        if (content[i] == '\n') offsets.push_back(i + 1);
    }

    BraceMap braces;
    if (g.block_style == BlockStyle::Braces) {
        braces = scan_braces(content, g.language, lines.size());
    }
    auto depth_at = [&](std::size_t i) {
        return i < braces.depth_at_line.size() ? braces.depth_at_line[i] : 0;
    };
    auto is_top_level = [&](std::size_t i) {
        return g.block_style == BlockStyle::Braces ? depth_at(i) == 0
                                                   : leading_indent(lines[i]) == 0;
    };

    // 1-based end line of a brace block whose signature starts at `offset`.
    // The opening brace must come before the statement ends.
    auto brace_block_end = [&](std::size_t line_index, std::size_t offset) -> int {
        int parens = 0;
        char quote = 0;
        for (auto i = offset; i < content.size(); ++i) {
            char c = content[i];
            if (quote) {
                if (c == '\\') ++i;
                else if (c == quote) quote = 0;
                continue;
            }
            if (c == '"' || c == '`' || (c == '\'' && g.language != Language::Rust)) {
                quote = c;
                continue;
            }
            if (c == '(' || c == '[') ++parens;
            else if (c == ')' || c == ']') --parens;
            else if (parens <= 0 && (c == ';' || c == '\n')) break;
            else if (parens <= 0 && c == '=' && i + 1 < content.size() && content[i + 1] == '>') {
                // Arrow body: keep scanning for the brace on this line.
                ++i;
            } else if (parens <= 0 && c == '{') {
                auto it = braces.close_of.find(i);
                if (it == braces.close_of.end()) return out.total_lines;
                return line_of_offset(offsets, it->second);
            }
        }
        return static_cast<int>(line_index) + 1;
    };

    std::vector<Container> containers;
    std::vector<std::pair<std::string, std::string>> listed_exports;
    std::vector<std::pair<int, std::string>> listed_export_lines;
    bool in_import_block = false;

    auto add_import = [&](std::string name, std::size_t i) {
        name = utils::trim(name);
        if (name.empty()) return;
        CodeElement el;
        el.type = ElementType::Import;
        el.name = std::move(name);
        el.start_line = el.end_line = static_cast<int>(i) + 1;
        el.signature = make_signature(lines[i], g.block_style);
        out.imports.push_back(std::move(el));
    };

    // Declarations are bucketed after the loop, once export clauses are known.
    std::vector<std::pair<CodeElement, std::size_t>> found;

    for (std::size_t i = 0; i < lines.size(); ++i) {
        const auto& line = lines[i];
        const int lineno = static_cast<int>(i) + 1;
        while (!containers.empty() && containers.back().end_line < lineno) containers.pop_back();

        if (in_import_block) {
            if (utils::trim(line).starts_with(")")) {
                in_import_block = false;
            } else if (std::smatch m; g.import_block_entry &&
                                      std::regex_search(line, m, *g.import_block_entry)) {
                add_import(m[1].str(), i);
            }
            continue;
        }
        if (g.import_block_open && std::regex_search(line, *g.import_block_open)) {
            in_import_block = true;
            continue;
        }

        bool imported = false;
        for (const auto& rule : g.imports) {
            std::smatch m;
            if (!std::regex_search(line, m, rule.pattern)) continue;
            if (rule.split_list) {
                for (auto& [local, alias] : split_names(m[rule.group].str())) add_import(local, i);
            } else {
                add_import(m[rule.group].str(), i);
            }
            imported = true;
            break;
        }
        if (imported) continue;

        for (const auto& rule : g.export_lists) {
            std::smatch m;
            if (!std::regex_search(line, m, rule.pattern)) continue;
            auto captured = m[rule.group].matched ? m[rule.group].str() : std::string("*");
            if (rule.split_list) {
                for (auto& pair : split_names(captured)) {
                    listed_exports.push_back(pair);
                    listed_export_lines.emplace_back(lineno, line);
                }
            } else {
                listed_exports.emplace_back(captured, captured);
                listed_export_lines.emplace_back(lineno, line);
            }
            break;
        }

        for (const auto& rule : g.declarations) {
            bool top_level = is_top_level(i);
            if (rule.top_level_only && !top_level) continue;

            bool direct_member = false;
            if (!containers.empty()) {
                direct_member = g.block_style == BlockStyle::Braces
                                    ? depth_at(i) == containers.back().depth + 1
                                    : leading_indent(line) > containers.back().indent;
            }
            if (rule.member_only && !direct_member) continue;

            std::smatch m;
            if (!std::regex_search(line, m, rule.pattern)) continue;
            auto name = m[rule.name_group].str();
            if (name.empty() || excluded_names().contains(name)) continue;

            CodeElement el;
            el.type = rule.type;
            el.name = name;
            el.start_line = lineno;
            el.end_line = g.block_style == BlockStyle::Braces
                              ? brace_block_end(i, offsets[i] + static_cast<std::size_t>(m.position(0)))
                              : indentation_block_end(lines, i);
            el.signature = make_signature(line, g.block_style);
            el.is_async = line.find("async ") != std::string::npos;
            el.documentation = g.block_style == BlockStyle::Indentation
                                   ? python_docstring(lines, i)
                                   : std::nullopt;
            if (!el.documentation) el.documentation = documentation_above(lines, i, g);

            if (rule.parent_group > 0 && m[rule.parent_group].matched) {
                el.type = ElementType::Method;
                el.parent = m[rule.parent_group].str();
            } else if (rule.type == ElementType::Function && direct_member) {
                el.type = ElementType::Method;
                el.parent = containers.back().name;
            }

            if (g.is_exported) el.is_exported = g.is_exported(line, el, top_level);

            if (rule.container) {
                containers.push_back(Container{name, el.end_line, depth_at(i), leading_indent(line)});
            }
            if (rule.record) found.emplace_back(std::move(el), i);
            break;
        }
    }

    // Names listed in export clauses mark their declarations as exported.
    std::vector<CodeElement> extra_exports;
    for (std::size_t k = 0; k < listed_exports.size(); ++k) {
        const auto& [local, exported] = listed_exports[k];
        bool matched = false;
        for (auto& [el, line_index] : found) {
            if (el.name == local && el.type != ElementType::Method) {
                el.is_exported = true;
                matched = true;
            }
        }
        if (!matched || local != exported) {
            CodeElement el;
            el.type = ElementType::Export;
            el.name = exported;
            el.start_line = el.end_line = listed_export_lines[k].first;
            el.signature = make_signature(listed_export_lines[k].second, g.block_style);
            el.is_exported = true;
            extra_exports.push_back(std::move(el));
        }
    }

    for (auto& [el, line_index] : found) {
        if (el.is_exported && el.type != ElementType::Method) out.exports.push_back(el);
        switch (el.type) {
            case ElementType::Function:
            case ElementType::Method: out.functions.push_back(std::move(el)); break;
            case ElementType::Class: out.classes.push_back(std::move(el)); break;
            case ElementType::Interface: out.interfaces.push_back(std::move(el)); break;
            case ElementType::Type: out.types.push_back(std::move(el)); break;
            case ElementType::Variable: out.variables.push_back(std::move(el)); break;
            default: break;
        }
    }
    for (auto& el : extra_exports) out.exports.push_back(std::move(el));

    return out;
}

} // namespace ctxopt::ast
