#include "ctxopt/sdk/code.hpp"

#include "ctxopt/ast/parser.hpp"

namespace ctxopt::sdk {

auto parseable_language(std::string_view name) -> Result<ast::Language> {
    auto lang = ast::language_from_string(name);
    if (!ast::is_parseable(lang)) {
        return std::unexpected(make_error(ErrorCode::Unsupported, "Unsupported language",
                                          std::string(name)));
    }
    return lang;
}

auto code_parse(std::string_view content, std::string_view language) -> Result<json> {
    auto lang = parseable_language(language);
    if (!lang) return std::unexpected(lang.error());
    auto structure = ast::parse_structure(content, *lang);
    if (!structure) return std::unexpected(structure.error());
    nlohmann::json j = *structure;
    return json(j);
}

auto code_extract(std::string_view content, std::string_view language,
                  std::string_view type, std::string_view name) -> Result<json> {
    auto lang = parseable_language(language);
    if (!lang) return std::unexpected(lang.error());
    auto element_type = ast::element_type_from_string(type);
    if (!element_type) {
        return std::unexpected(make_error(ErrorCode::InvalidArgument, "Unknown element type",
                                          std::string(type)));
    }
    auto source = ast::extract_element(content, *lang, *element_type, name);
    if (!source) return std::unexpected(source.error());
    if (!*source) return json(nullptr);
    return json(**source);
}

auto code_skeleton(std::string_view content, std::string_view language) -> Result<std::string> {
    auto lang = parseable_language(language);
    if (!lang) return std::unexpected(lang.error());
    return ast::render_skeleton(content, *lang);
}

} // namespace ctxopt::sdk
