#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "ctxopt/ast/language.hpp"

namespace ctxopt::ast {

using json = nlohmann::json;

enum class ElementType {
    Function,
    Method,
    Class,
    Interface,
    Type,
    Variable,
    Import,
    Export,
};

NLOHMANN_JSON_SERIALIZE_ENUM(ElementType, {
    {ElementType::Function, "function"},
    {ElementType::Method, "method"},
    {ElementType::Class, "class"},
    {ElementType::Interface, "interface"},
    {ElementType::Type, "type"},
    {ElementType::Variable, "variable"},
    {ElementType::Import, "import"},
    {ElementType::Export, "export"},
})

auto element_type_to_string(ElementType type) -> std::string_view;
auto element_type_from_string(std::string_view name) -> std::optional<ElementType>;

/// A named declaration with its 1-based, inclusive line range.
struct CodeElement {
    ElementType type = ElementType::Function;
    std::string name;
    int start_line = 0;
    int end_line = 0;
    std::optional<std::string> signature;
    std::optional<std::string> documentation;
    bool is_exported = false;
    bool is_async = false;
    std::optional<std::string> parent;  // enclosing class/impl for methods
};

void to_json(json& j, const CodeElement& e);

/// Declarations found in one source file, grouped by kind. Methods are
/// listed under `functions` with type Method and a parent.
struct FileStructure {
    Language language = Language::Unknown;
    int total_lines = 0;
    std::vector<CodeElement> imports;
    std::vector<CodeElement> exports;
    std::vector<CodeElement> functions;
    std::vector<CodeElement> classes;
    std::vector<CodeElement> interfaces;
    std::vector<CodeElement> types;
    std::vector<CodeElement> variables;
};

void to_json(json& j, const FileStructure& s);

} // namespace ctxopt::ast
