#include "ctxopt/script/lexer.hpp"

#include <array>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <format>

#include "ctxopt/script/value.hpp"

namespace ctxopt::script {

namespace {

constexpr std::array kKeywords = {
    "var", "let", "const", "function", "return", "if", "else", "while", "do",
    "for", "in", "break", "continue", "throw", "try", "catch", "finally",
    "true", "false", "null", "typeof", "instanceof", "void", "delete", "await",
    "this", "new", "class", "switch", "case", "default", "yield", "with",
    "debugger", "import", "export", "super", "extends", "enum",
};

// Longest first so that a greedy scan picks the right operator.
constexpr std::array kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "??=",
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--", "+=", "-=",
    "*=", "/=", "%=", "&=", "|=", "^=", "**", "<<", ">>",
    "{", "}", "(", ")", "[", "]", ";", ",", "<", ">", "+", "-", "*", "/", "%",
    "&", "|", "^", "!", "~", "?", ":", "=", ".",
};

auto syntax_error(std::string message, int line) -> Error {
    return make_error(ErrorCode::ParseError,
                      std::format("SyntaxError: {} (line {})", message, line));
}

auto is_ident_start(char c) -> bool {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

auto is_ident_part(char c) -> bool {
    return is_ident_start(c) || std::isdigit(static_cast<unsigned char>(c));
}

auto is_keyword(std::string_view word) -> bool {
    for (const auto* k : kKeywords) {
        if (word == k) return true;
    }
    return false;
}

class Lexer {
public:
    Lexer(std::string_view src, int first_line) : src_(src), line_(first_line) {}

    auto run() -> Result<std::vector<Token>> {
        std::vector<Token> tokens;
        if (src_.starts_with("#!")) {
            while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
        }
        while (true) {
            bool newline = false;
            if (auto err = skip_trivia(newline); !err) {
                return std::unexpected(err.error());
            }
            if (pos_ >= src_.size()) {
                Token end;
                end.type = TokenType::End;
                end.line = line_;
                end.newline_before = true;
                tokens.push_back(std::move(end));
                return tokens;
            }
            auto tok = next(tokens);
            if (!tok) return std::unexpected(tok.error());
            tok->newline_before = newline || tokens.empty();
            tokens.push_back(std::move(*tok));
        }
    }

private:
    [[nodiscard]] auto peek(std::size_t ahead = 0) const -> char {
        return pos_ + ahead < src_.size() ? src_[pos_ + ahead] : '\0';
    }

    auto skip_trivia(bool& newline) -> Result<void> {
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\n') {
                newline = true;
                ++line_;
                ++pos_;
            } else if (c == ' ' || c == '\t' || c == '\r' || c == '\f' || c == '\v') {
                ++pos_;
            } else if (c == '/' && peek(1) == '/') {
                while (pos_ < src_.size() && src_[pos_] != '\n') ++pos_;
            } else if (c == '/' && peek(1) == '*') {
                int start = line_;
                pos_ += 2;
                while (pos_ < src_.size() && !(src_[pos_] == '*' && peek(1) == '/')) {
                    if (src_[pos_] == '\n') {
                        newline = true;
                        ++line_;
                    }
                    ++pos_;
                }
                if (pos_ >= src_.size()) return std::unexpected(syntax_error("Unterminated comment", start));
                pos_ += 2;
            } else {
                break;
            }
        }
        return ok_result();
    }

    /// True when a '/' at this point would start a regex literal.
    static auto regex_allowed(const std::vector<Token>& tokens) -> bool {
        if (tokens.empty()) return true;
        const auto& prev = tokens.back();
        switch (prev.type) {
            case TokenType::Identifier:
            case TokenType::Number:
            case TokenType::String:
            case TokenType::Template:
                return false;
            case TokenType::Keyword:
                return !(prev.text == "this" || prev.text == "true" ||
                         prev.text == "false" || prev.text == "null");
            case TokenType::Punctuator:
                return !(prev.text == ")" || prev.text == "]" || prev.text == "}" ||
                         prev.text == "++" || prev.text == "--");
            case TokenType::End:
                return true;
        }
        return true;
    }

    auto next(const std::vector<Token>& tokens) -> Result<Token> {
        char c = src_[pos_];
        if (is_ident_start(c)) return identifier();
        if (std::isdigit(static_cast<unsigned char>(c)) ||
            (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))))) {
            return number();
        }
        if (c == '"' || c == '\'') return string_literal(c);
        if (c == '`') return template_literal();
        if (c == '/' && regex_allowed(tokens)) {
            return std::unexpected(syntax_error("Regular expression literals are not supported", line_));
        }
        return punctuator();
    }

    auto identifier() -> Result<Token> {
        std::size_t start = pos_;
        while (pos_ < src_.size() && is_ident_part(src_[pos_])) ++pos_;
        Token tok;
        tok.text = std::string(src_.substr(start, pos_ - start));
        tok.type = is_keyword(tok.text) ? TokenType::Keyword : TokenType::Identifier;
        tok.line = line_;
        return tok;
    }

    auto number() -> Result<Token> {
        Token tok;
        tok.type = TokenType::Number;
        tok.line = line_;
        std::size_t start = pos_;

        int radix = 10;
        if (src_[pos_] == '0' && (peek(1) == 'x' || peek(1) == 'X')) radix = 16;
        if (src_[pos_] == '0' && (peek(1) == 'o' || peek(1) == 'O')) radix = 8;
        if (src_[pos_] == '0' && (peek(1) == 'b' || peek(1) == 'B')) radix = 2;

        std::string digits;
        if (radix != 10) {
            pos_ += 2;
            while (pos_ < src_.size() && (std::isxdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
                if (src_[pos_] != '_') digits += src_[pos_];
                ++pos_;
            }
            std::uint64_t value = 0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, radix);
            if (digits.empty() || ec != std::errc{} || ptr != digits.data() + digits.size()) {
                return std::unexpected(syntax_error("Invalid number literal", line_));
            }
            tok.number = static_cast<double>(value);
        } else {
            auto take_digits = [&] {
                while (pos_ < src_.size() &&
                       (std::isdigit(static_cast<unsigned char>(src_[pos_])) || src_[pos_] == '_')) {
                    if (src_[pos_] != '_') digits += src_[pos_];
                    ++pos_;
                }
            };
            take_digits();
            if (peek() == '.') {
                digits += '.';
                ++pos_;
                take_digits();
            }
            if (peek() == 'e' || peek() == 'E') {
                digits += 'e';
                ++pos_;
                if (peek() == '+' || peek() == '-') digits += src_[pos_++];
                take_digits();
            }
            double value = 0.0;
            auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
            if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
                return std::unexpected(syntax_error("Invalid number literal", line_));
            }
            tok.number = value;
        }

        if (pos_ < src_.size() && is_ident_part(src_[pos_])) {
            if (src_[pos_] == 'n') {
                return std::unexpected(syntax_error("BigInt literals are not supported", line_));
            }
            return std::unexpected(syntax_error("Invalid or unexpected token", line_));
        }
        tok.text = std::string(src_.substr(start, pos_ - start));
        return tok;
    }

    auto hex_value(std::size_t count) -> Result<std::uint32_t> {
        if (pos_ + count > src_.size()) {
            return std::unexpected(syntax_error("Invalid escape sequence", line_));
        }
        std::uint32_t value = 0;
        auto digits = src_.substr(pos_, count);
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
        if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
            return std::unexpected(syntax_error("Invalid escape sequence", line_));
        }
        pos_ += count;
        return value;
    }

    /// Decodes one escape sequence; `pos_` points just past the backslash.
    auto escape(std::string& out) -> Result<void> {
        if (pos_ >= src_.size()) return std::unexpected(syntax_error("Invalid escape sequence", line_));
        char c = src_[pos_++];
        switch (c) {
            case 'n': out += '\n'; break;
            case 't': out += '\t'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            case '0': out += '\0'; break;
            case '\r':
                if (peek() == '\n') ++pos_;
                ++line_;
                break;
            case '\n':
                ++line_;
                break;
            case 'x': {
                auto v = hex_value(2);
                if (!v) return std::unexpected(v.error());
                append_utf8(out, *v);
                break;
            }
            case 'u': {
                std::uint32_t cp = 0;
                if (peek() == '{') {
                    ++pos_;
                    auto close = src_.find('}', pos_);
                    if (close == std::string_view::npos) {
                        return std::unexpected(syntax_error("Invalid Unicode escape sequence", line_));
                    }
                    auto v = hex_value(close - pos_);
                    if (!v || *v > 0x10FFFF) {
                        return std::unexpected(syntax_error("Invalid Unicode escape sequence", line_));
                    }
                    cp = *v;
                    ++pos_;
                } else {
                    auto v = hex_value(4);
                    if (!v) return std::unexpected(v.error());
                    cp = *v;
                    // Combine a surrogate pair written as two escapes.
                    if (cp >= 0xD800 && cp <= 0xDBFF && peek() == '\\' && peek(1) == 'u') {
                        pos_ += 2;
                        auto low = hex_value(4);
                        if (!low) return std::unexpected(low.error());
                        if (*low >= 0xDC00 && *low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
                        } else {
                            append_utf8(out, 0xFFFD);
                            cp = *low;
                        }
                    }
                }
                append_utf8(out, cp);
                break;
            }
            default:
                out += c;
                break;
        }
        return ok_result();
    }

    auto string_literal(char quote) -> Result<Token> {
        Token tok;
        tok.type = TokenType::String;
        tok.line = line_;
        ++pos_;
        while (true) {
            if (pos_ >= src_.size() || src_[pos_] == '\n') {
                return std::unexpected(syntax_error("Unterminated string literal", tok.line));
            }
            char c = src_[pos_];
            if (c == quote) {
                ++pos_;
                break;
            }
            if (c == '\\') {
                ++pos_;
                if (auto r = escape(tok.text); !r) return std::unexpected(r.error());
                continue;
            }
            tok.text += c;
            ++pos_;
        }
        return tok;
    }

    /// Skips a quoted string or nested template inside a substitution.
    auto skip_nested(char quote) -> Result<void> {
        int start = line_;
        ++pos_;
        int depth = 0;
        while (pos_ < src_.size()) {
            char c = src_[pos_];
            if (c == '\n') ++line_;
            if (c == '\\') {
                pos_ += 2;
                continue;
            }
            if (quote == '`') {
                if (depth == 0 && c == '`') {
                    ++pos_;
                    return ok_result();
                }
                if (c == '$' && peek(1) == '{') {
                    ++depth;
                    pos_ += 2;
                    continue;
                }
                if (depth > 0 && c == '}') --depth;
                if (depth > 0 && (c == '"' || c == '\'' || c == '`')) {
                    if (auto r = skip_nested(c); !r) return r;
                    continue;
                }
            } else if (c == quote) {
                ++pos_;
                return ok_result();
            }
            ++pos_;
        }
        return std::unexpected(syntax_error("Unterminated string literal", start));
    }

    auto template_literal() -> Result<Token> {
        Token tok;
        tok.type = TokenType::Template;
        tok.line = line_;
        ++pos_;
        std::string cooked;
        while (true) {
            if (pos_ >= src_.size()) {
                return std::unexpected(syntax_error("Unterminated template literal", tok.line));
            }
            char c = src_[pos_];
            if (c == '`') {
                ++pos_;
                tok.quasis.push_back(std::move(cooked));
                return tok;
            }
            if (c == '\\') {
                ++pos_;
                if (auto r = escape(cooked); !r) return std::unexpected(r.error());
                continue;
            }
            if (c == '$' && peek(1) == '{') {
                tok.quasis.push_back(std::move(cooked));
                cooked.clear();
                pos_ += 2;
                TemplatePart part;
                part.line = line_;
                std::size_t start = pos_;
                int depth = 0;
                while (true) {
                    if (pos_ >= src_.size()) {
                        return std::unexpected(syntax_error("Unterminated template literal", tok.line));
                    }
                    char d = src_[pos_];
                    if (d == '}' && depth == 0) break;
                    if (d == '{') ++depth;
                    if (d == '}') --depth;
                    if (d == '\n') ++line_;
                    if (d == '"' || d == '\'' || d == '`') {
                        if (auto r = skip_nested(d); !r) return std::unexpected(r.error());
                        continue;
                    }
                    ++pos_;
                }
                part.source = std::string(src_.substr(start, pos_ - start));
                ++pos_;
                tok.substitutions.push_back(std::move(part));
                continue;
            }
            if (c == '\n') ++line_;
            cooked += c;
            ++pos_;
        }
    }

    auto punctuator() -> Result<Token> {
        for (const auto* p : kPunctuators) {
            std::string_view candidate(p);
            if (src_.substr(pos_).starts_with(candidate)) {
                // "?." followed by a digit is a conditional, not optional chaining.
                if (candidate == "?." && std::isdigit(static_cast<unsigned char>(peek(2)))) continue;
                Token tok;
                tok.type = TokenType::Punctuator;
                tok.text = std::string(candidate);
                tok.line = line_;
                pos_ += candidate.size();
                return tok;
            }
        }
        return std::unexpected(syntax_error(
            std::format("Invalid or unexpected token '{}'", src_[pos_]), line_));
    }

    std::string_view src_;
    std::size_t pos_ = 0;
    int line_;
};

} // anonymous namespace

auto tokenize(std::string_view source, int first_line) -> Result<std::vector<Token>> {
    Lexer lexer(source, first_line);
    return lexer.run();
}

} // namespace ctxopt::script
