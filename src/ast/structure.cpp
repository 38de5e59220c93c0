#include "ctxopt/ast/structure.hpp"

namespace ctxopt::ast {

auto element_type_to_string(ElementType type) -> std::string_view {
    switch (type) {
        case ElementType::Function: return "function";
        case ElementType::Method: return "method";
        case ElementType::Class: return "class";
        case ElementType::Interface: return "interface";
        case ElementType::Type: return "type";
        case ElementType::Variable: return "variable";
        case ElementType::Import: return "import";
        case ElementType::Export: return "export";
    }
    return "function";
}

auto element_type_from_string(std::string_view name) -> std::optional<ElementType> {
    if (name == "function") return ElementType::Function;
    if (name == "method") return ElementType::Method;
    if (name == "class") return ElementType::Class;
    if (name == "interface") return ElementType::Interface;
    if (name == "type") return ElementType::Type;
    if (name == "variable") return ElementType::Variable;
    if (name == "import") return ElementType::Import;
    if (name == "export") return ElementType::Export;
    return std::nullopt;
}

void to_json(json& j, const CodeElement& e) {
    j = json{
        {"type", e.type},
        {"name", e.name},
        {"startLine", e.start_line},
        {"endLine", e.end_line},
    };
    if (e.signature) j["signature"] = *e.signature;
    if (e.documentation) j["documentation"] = *e.documentation;
    if (e.is_exported) j["isExported"] = true;
    if (e.is_async) j["isAsync"] = true;
    if (e.parent) j["parent"] = *e.parent;
}

void to_json(json& j, const FileStructure& s) {
    j = json{
        {"language", s.language},
        {"totalLines", s.total_lines},
        {"imports", s.imports},
        {"exports", s.exports},
        {"functions", s.functions},
        {"classes", s.classes},
        {"interfaces", s.interfaces},
        {"types", s.types},
        {"variables", s.variables},
    };
}

} // namespace ctxopt::ast
