#include "ctxopt/ast/language.hpp"

#include <filesystem>
#include <string>
#include <unordered_map>

#include "ctxopt/core/utils.hpp"

namespace ctxopt::ast {

namespace {

auto extension_map() -> const std::unordered_map<std::string, Language>& {
    static const std::unordered_map<std::string, Language> map = {
        {".ts", Language::TypeScript},  {".tsx", Language::TypeScript},
        {".mts", Language::TypeScript}, {".cts", Language::TypeScript},
        {".js", Language::JavaScript},  {".jsx", Language::JavaScript},
        {".mjs", Language::JavaScript}, {".cjs", Language::JavaScript},
        {".py", Language::Python},      {".pyw", Language::Python},
        {".pyi", Language::Python},
        {".go", Language::Go},
        {".rs", Language::Rust},
        {".php", Language::Php},        {".phtml", Language::Php},
        {".php3", Language::Php},       {".php4", Language::Php},
        {".php5", Language::Php},       {".php7", Language::Php},
        {".phps", Language::Php},
        {".swift", Language::Swift},
        {".json", Language::Json},
        {".yaml", Language::Yaml},      {".yml", Language::Yaml},
    };
    return map;
}

} // anonymous namespace

auto language_to_string(Language lang) -> std::string_view {
    switch (lang) {
        case Language::TypeScript: return "typescript";
        case Language::JavaScript: return "javascript";
        case Language::Python: return "python";
        case Language::Go: return "go";
        case Language::Rust: return "rust";
        case Language::Php: return "php";
        case Language::Swift: return "swift";
        case Language::Json: return "json";
        case Language::Yaml: return "yaml";
        case Language::Unknown: return "unknown";
    }
    return "unknown";
}

auto language_from_string(std::string_view name) -> Language {
    auto lower = utils::to_lower(utils::trim(name));
    if (lower == "typescript" || lower == "ts" || lower == "tsx") return Language::TypeScript;
    if (lower == "javascript" || lower == "js" || lower == "jsx") return Language::JavaScript;
    if (lower == "python" || lower == "py") return Language::Python;
    if (lower == "go" || lower == "golang") return Language::Go;
    if (lower == "rust" || lower == "rs") return Language::Rust;
    if (lower == "php") return Language::Php;
    if (lower == "swift") return Language::Swift;
    if (lower == "json") return Language::Json;
    if (lower == "yaml" || lower == "yml") return Language::Yaml;
    return Language::Unknown;
}

auto detect_language_from_path(std::string_view path) -> Language {
    auto ext = utils::to_lower(std::filesystem::path(path).extension().string());
    auto it = extension_map().find(ext);
    return it != extension_map().end() ? it->second : Language::Unknown;
}

auto is_parseable(Language lang) -> bool {
    switch (lang) {
        case Language::TypeScript:
        case Language::JavaScript:
        case Language::Python:
        case Language::Go:
        case Language::Rust:
        case Language::Php:
        case Language::Swift:
            return true;
        default:
            return false;
    }
}

} // namespace ctxopt::ast
