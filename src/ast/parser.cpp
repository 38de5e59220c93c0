#include "ctxopt/ast/parser.hpp"

#include <algorithm>

#include "ctxopt/ast/grammar.hpp"
#include "ctxopt/core/utils.hpp"

namespace ctxopt::ast {

namespace {

constexpr std::size_t kSkeletonImports = 5;

auto unsupported(Language lang) -> Error {
    return make_error(ErrorCode::Unsupported, "Unsupported language",
                      std::string(language_to_string(lang)));
}

auto fallback_signature(const CodeElement& el) -> std::string {
    if (el.signature) return *el.signature;
    return std::string(element_type_to_string(el.type)) + " " + el.name;
}

} // anonymous namespace

auto make_parser(Language lang) -> std::unique_ptr<StructureParser> {
    switch (lang) {
        case Language::TypeScript: return std::make_unique<GrammarParser>(typescript_grammar());
        case Language::JavaScript: return std::make_unique<GrammarParser>(javascript_grammar());
        case Language::Python: return std::make_unique<GrammarParser>(python_grammar());
        case Language::Go: return std::make_unique<GrammarParser>(go_grammar());
        case Language::Rust: return std::make_unique<GrammarParser>(rust_grammar());
        case Language::Php: return std::make_unique<GrammarParser>(php_grammar());
        case Language::Swift: return std::make_unique<GrammarParser>(swift_grammar());
        default: return nullptr;
    }
}

auto parse_structure(std::string_view content, Language lang) -> Result<FileStructure> {
    auto parser = make_parser(lang);
    if (!parser) {
        return std::unexpected(unsupported(lang));
    }
    return parser->parse(content);
}

auto extract_element(std::string_view content, Language lang, ElementType type,
                     std::string_view name) -> Result<std::optional<std::string>> {
    auto structure = parse_structure(content, lang);
    if (!structure) {
        return std::unexpected(structure.error());
    }

    const std::vector<CodeElement>* bucket = nullptr;
    switch (type) {
        case ElementType::Function:
        case ElementType::Method: bucket = &structure->functions; break;
        case ElementType::Class: bucket = &structure->classes; break;
        case ElementType::Interface: bucket = &structure->interfaces; break;
        case ElementType::Type: bucket = &structure->types; break;
        case ElementType::Variable: bucket = &structure->variables; break;
        case ElementType::Import: bucket = &structure->imports; break;
        case ElementType::Export: bucket = &structure->exports; break;
    }

    auto it = std::ranges::find_if(*bucket, [&](const CodeElement& el) { return el.name == name; });
    if (it == bucket->end()) {
        return std::optional<std::string>{};
    }

    auto lines = utils::split_lines(content);
    auto first = static_cast<std::size_t>(std::max(it->start_line, 1)) - 1;
    auto last = std::min(static_cast<std::size_t>(std::max(it->end_line, it->start_line)),
                         lines.size());
    std::vector<std::string> slice(lines.begin() + static_cast<std::ptrdiff_t>(first),
                                   lines.begin() + static_cast<std::ptrdiff_t>(last));
    return std::optional<std::string>{utils::join(slice, "\n")};
}

auto render_skeleton(std::string_view content, Language lang) -> Result<std::string> {
    auto structure = parse_structure(content, lang);
    if (!structure) {
        return std::unexpected(structure.error());
    }

    const auto comment = lang == Language::Python ? std::string("#") : std::string("//");
    std::vector<std::string> out;

    if (!structure->imports.empty()) {
        out.push_back(comment + " Imports:");
        auto shown = std::min(structure->imports.size(), kSkeletonImports);
        for (std::size_t i = 0; i < shown; ++i) {
            out.push_back(comment + "   " + structure->imports[i].name);
        }
        if (structure->imports.size() > kSkeletonImports) {
            out.push_back(comment + "   ... +" +
                          std::to_string(structure->imports.size() - kSkeletonImports) + " more");
        }
        out.emplace_back();
    }

    std::vector<const CodeElement*> methods;
    for (const auto& fn : structure->functions) {
        if (fn.type == ElementType::Method) methods.push_back(&fn);
    }

    auto emit_members = [&](const std::string& owner) {
        for (const auto* m : methods) {
            if (m->parent && *m->parent == owner) out.push_back("  " + fallback_signature(*m));
        }
    };

    for (const auto& cls : structure->classes) {
        out.push_back(fallback_signature(cls));
        emit_members(cls.name);
        out.emplace_back();
    }
    for (const auto& iface : structure->interfaces) {
        out.push_back(fallback_signature(iface));
        emit_members(iface.name);
        out.emplace_back();
    }
    for (const auto& type : structure->types) {
        out.push_back(fallback_signature(type));
        out.emplace_back();
    }

    // Methods of types declared elsewhere (Rust impl, Swift extension).
    for (const auto* m : methods) {
        bool owned = std::ranges::any_of(structure->classes, [&](const auto& c) { return m->parent == c.name; }) ||
                     std::ranges::any_of(structure->interfaces, [&](const auto& c) { return m->parent == c.name; });
        if (!owned) out.push_back(*m->parent + "::" + fallback_signature(*m));
    }
    for (const auto& fn : structure->functions) {
        if (fn.type == ElementType::Function) out.push_back(fallback_signature(fn));
    }

    while (!out.empty() && out.back().empty()) out.pop_back();
    return utils::join(out, "\n");
}

auto search_elements(const FileStructure& structure, std::string_view query)
    -> std::vector<CodeElement> {
    auto needle = utils::to_lower(query);
    std::vector<CodeElement> matches;
    for (const auto* bucket : {&structure.functions, &structure.classes, &structure.interfaces,
                               &structure.types, &structure.variables}) {
        for (const auto& el : *bucket) {
            if (utils::to_lower(el.name).find(needle) != std::string::npos) {
                matches.push_back(el);
            }
        }
    }
    return matches;
}

} // namespace ctxopt::ast
