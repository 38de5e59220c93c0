#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "ctxopt/core/error.hpp"

namespace ctxopt::script {

enum class TokenType {
    Identifier,
    Keyword,
    Number,
    String,
    Template,
    Punctuator,
    End,
};

/// One `${...}` hole of a template literal, kept as source text and parsed
/// separately.
struct TemplatePart {
    std::string source;
    int line = 1;
};

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0.0;
    int line = 1;
    bool newline_before = false;

    // Template literals: cooked string pieces around the substitutions.
    std::vector<std::string> quasis;
    std::vector<TemplatePart> substitutions;

    [[nodiscard]] auto is(TokenType t, std::string_view s) const -> bool {
        return type == t && text == s;
    }
    [[nodiscard]] auto is_punct(std::string_view s) const -> bool {
        return is(TokenType::Punctuator, s);
    }
    [[nodiscard]] auto is_keyword(std::string_view s) const -> bool {
        return is(TokenType::Keyword, s);
    }
};

/// Splits script source into tokens. Errors are ParseError with a
/// "SyntaxError: ... (line N)" message. `first_line` offsets line numbers
/// for template substitutions.
auto tokenize(std::string_view source, int first_line = 1) -> Result<std::vector<Token>>;

} // namespace ctxopt::script
