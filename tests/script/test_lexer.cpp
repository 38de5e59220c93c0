#include <catch2/catch_test_macros.hpp>

#include "ctxopt/script/lexer.hpp"

using namespace ctxopt::script;

TEST_CASE("Lexer splits identifiers, keywords and punctuators", "[script][lexer]") {
    auto tokens = tokenize("const total = a + b;");
    REQUIRE(tokens.has_value());
    REQUIRE(tokens->size() == 8);
    CHECK((*tokens)[0].is_keyword("const"));
    CHECK((*tokens)[1].type == TokenType::Identifier);
    CHECK((*tokens)[1].text == "total");
    CHECK((*tokens)[2].is_punct("="));
    CHECK((*tokens)[4].is_punct("+"));
    CHECK((*tokens)[6].is_punct(";"));
    CHECK(tokens->back().type == TokenType::End);
}

TEST_CASE("Lexer prefers the longest punctuator", "[script][lexer]") {
    auto tokens = tokenize("a ?? b === c >>>= d ?.e");
    REQUIRE(tokens.has_value());
    CHECK((*tokens)[1].is_punct("??"));
    CHECK((*tokens)[3].is_punct("==="));
    CHECK((*tokens)[5].is_punct(">>>="));
    CHECK((*tokens)[7].is_punct("?."));
}

TEST_CASE("Lexer reads number literals", "[script][lexer]") {
    auto tokens = tokenize("42 3.5 0x1F 1e3 1_000");
    REQUIRE(tokens.has_value());
    CHECK((*tokens)[0].number == 42.0);
    CHECK((*tokens)[1].number == 3.5);
    CHECK((*tokens)[2].number == 31.0);
    CHECK((*tokens)[3].number == 1000.0);
    CHECK((*tokens)[4].number == 1000.0);
}

TEST_CASE("Lexer cooks string escapes", "[script][lexer]") {
    auto tokens = tokenize(R"('a\nb' "A\u{1F600}")");
    REQUIRE(tokens.has_value());
    CHECK((*tokens)[0].type == TokenType::String);
    CHECK((*tokens)[0].text == "a\nb");
    CHECK((*tokens)[1].text == "A\xF0\x9F\x98\x80");
}

TEST_CASE("Lexer keeps template substitutions as source", "[script][lexer]") {
    auto tokens = tokenize("`x=${ {a: 1}.a } and ${`inner ${y}`}!`");
    REQUIRE(tokens.has_value());
    const auto& t = (*tokens)[0];
    REQUIRE(t.type == TokenType::Template);
    REQUIRE(t.quasis.size() == 3);
    CHECK(t.quasis[0] == "x=");
    CHECK(t.quasis[1] == " and ");
    CHECK(t.quasis[2] == "!");
    REQUIRE(t.substitutions.size() == 2);
    CHECK(t.substitutions[1].source == "`inner ${y}`");
}

TEST_CASE("Lexer tracks lines and newlines", "[script][lexer]") {
    auto tokens = tokenize("a\n// comment\n/* block\n */ b");
    REQUIRE(tokens.has_value());
    CHECK((*tokens)[0].line == 1);
    CHECK((*tokens)[1].line == 4);
    CHECK((*tokens)[1].newline_before);
}

TEST_CASE("Lexer treats a slash after an operand as division", "[script][lexer]") {
    auto tokens = tokenize("a / b");
    REQUIRE(tokens.has_value());
    CHECK((*tokens)[1].is_punct("/"));
}

TEST_CASE("Lexer rejects regex literals", "[script][lexer]") {
    auto tokens = tokenize("const r = /ab+c/;");
    REQUIRE_FALSE(tokens.has_value());
    CHECK(tokens.error().code() == ctxopt::ErrorCode::ParseError);
    CHECK(tokens.error().message().find("Regular expression literals are not supported") !=
          std::string_view::npos);
}

TEST_CASE("Lexer reports unterminated strings with their line", "[script][lexer]") {
    auto tokens = tokenize("let a = 1;\nlet b = 'oops");
    REQUIRE_FALSE(tokens.has_value());
    CHECK(tokens.error().message().starts_with("SyntaxError:"));
    CHECK(tokens.error().message().find("(line 2)") != std::string_view::npos);
}
