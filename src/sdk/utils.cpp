#include "ctxopt/sdk/utils.hpp"

#include "ctxopt/ast/language.hpp"
#include "ctxopt/text/content_type.hpp"
#include "ctxopt/text/tokens.hpp"

namespace ctxopt::sdk {

auto count_tokens(std::string_view text) -> std::size_t {
    return text::estimate_tokens(text);
}

auto detect_type(std::string_view content) -> std::string {
    return std::string(text::content_type_to_string(text::detect_content_type(content)));
}

auto detect_language(std::string_view path) -> std::string {
    return std::string(ast::language_to_string(ast::detect_language_from_path(path)));
}

} // namespace ctxopt::sdk
