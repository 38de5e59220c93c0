#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

namespace ctxopt::ast {

enum class Language {
    TypeScript,
    JavaScript,
    Python,
    Go,
    Rust,
    Php,
    Swift,
    Json,
    Yaml,
    Unknown,
};

NLOHMANN_JSON_SERIALIZE_ENUM(Language, {
    {Language::Unknown, "unknown"},
    {Language::TypeScript, "typescript"},
    {Language::JavaScript, "javascript"},
    {Language::Python, "python"},
    {Language::Go, "go"},
    {Language::Rust, "rust"},
    {Language::Php, "php"},
    {Language::Swift, "swift"},
    {Language::Json, "json"},
    {Language::Yaml, "yaml"},
})

auto language_to_string(Language lang) -> std::string_view;

/// Parses a lower-case language name. Also accepts "ts", "js" and "py".
auto language_from_string(std::string_view name) -> Language;

/// Maps a file extension (case-insensitive) to a language.
[[nodiscard]] auto detect_language_from_path(std::string_view path) -> Language;

/// True for the languages the structure parser understands.
[[nodiscard]] auto is_parseable(Language lang) -> bool;

} // namespace ctxopt::ast
