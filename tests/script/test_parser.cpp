#include <catch2/catch_test_macros.hpp>

#include "ctxopt/script/parser.hpp"

#include <algorithm>
#include <string>

using namespace ctxopt::script;
using ctxopt::ErrorCode;

namespace {

auto parse_error(std::string_view source) -> std::string {
    auto program = parse_program(source);
    if (program) return {};
    return std::string(program.error().message());
}

} // anonymous namespace

TEST_CASE("Parser builds statements in order", "[script][parser]") {
    auto program = parse_program("const a = 1;\nfunction f() { return a; }\nreturn f();");
    REQUIRE(program.has_value());
    const auto& body = (*program)->body;
    REQUIRE(body.size() == 3);
    CHECK(body[0]->kind == StmtKind::VarDecl);
    CHECK(body[1]->kind == StmtKind::FunctionDecl);
    CHECK(body[2]->kind == StmtKind::Return);
    CHECK(body[2]->line == 3);
}

TEST_CASE("Parser honours operator precedence", "[script][parser]") {
    auto program = parse_program("return 1 + 2 * 3;");
    REQUIRE(program.has_value());
    const auto& ret = static_cast<const ArgumentStmt&>(*(*program)->body[0]);
    REQUIRE(ret.argument->kind == ExprKind::Binary);
    const auto& add = static_cast<const BinaryExpr&>(*ret.argument);
    CHECK(add.op == Op::Add);
    REQUIRE(add.right->kind == ExprKind::Binary);
    CHECK(static_cast<const BinaryExpr&>(*add.right).op == Op::Mul);
}

TEST_CASE("Parser inserts semicolons at line breaks", "[script][parser]") {
    auto program = parse_program("let a = 1\nlet b = 2\nreturn a + b");
    REQUIRE(program.has_value());
    CHECK((*program)->body.size() == 3);
}

TEST_CASE("Parser hoists var names to the program", "[script][parser]") {
    auto program = parse_program("if (true) { var x = 1; }\nfor (var i = 0; i < 2; i++) {}");
    REQUIRE(program.has_value());
    const auto& names = (*program)->var_names;
    CHECK(std::find(names.begin(), names.end(), "x") != names.end());
    CHECK(std::find(names.begin(), names.end(), "i") != names.end());
}

TEST_CASE("Parser accepts arrow functions and destructuring", "[script][parser]") {
    CHECK(parse_program("const f = (a, {b, c = 2}, [d, ...e]) => a + b;").has_value());
    CHECK(parse_program("const g = async x => await x;").has_value());
    CHECK(parse_program("const { a, b: [c] } = obj; [a, b] = [b, a];").has_value());
    CHECK(parse_program("const o = { a, [k]: 1, ...rest, m() { return 1; } };").has_value());
    CHECK(parse_program("return a?.b?.[c]?.(d) ?? `t${x}`;").has_value());
}

TEST_CASE("Parser accepts loops and exception handling", "[script][parser]") {
    CHECK(parse_program("for (const x of xs) { if (x) continue; else break; }").has_value());
    CHECK(parse_program("for (const k in obj) {}").has_value());
    CHECK(parse_program("do { i++; } while (i < 3);").has_value());
    CHECK(parse_program("try { f(); } catch { g(); } finally { h(); }").has_value());
    CHECK(parse_program("try { f(); } catch ({ message }) { g(message); }").has_value());
}

TEST_CASE("Parser rejects unsupported syntax with the line", "[script][parser]") {
    auto program = parse_program("let a = 1;\nclass Foo {}");
    REQUIRE_FALSE(program.has_value());
    CHECK(program.error().code() == ErrorCode::ParseError);
    CHECK(program.error().message() == "SyntaxError: Classes are not supported (line 2)");

    CHECK(parse_error("const m = new Map();").find("'new' is not supported") != std::string::npos);
    CHECK(parse_error("switch (x) { case 1: break; }").find("'switch' is not supported") != std::string::npos);
    CHECK(parse_error("function* gen() {}").find("Generators are not supported") != std::string::npos);
    CHECK(parse_error("outer: for (;;) {}").find("Labels are not supported") != std::string::npos);
    CHECK(parse_error("import fs from 'fs';").find("Module imports are not supported") != std::string::npos);
}

TEST_CASE("Parser rejects malformed programs", "[script][parser]") {
    CHECK(parse_error("let = ;").starts_with("SyntaxError:"));
    CHECK(parse_error("break;").find("break") != std::string::npos);
    CHECK(parse_error("try { f(); }").find("Missing catch or finally") != std::string::npos);
    CHECK(parse_error("const x;").starts_with("SyntaxError:"));
    CHECK(parse_error("f(").starts_with("SyntaxError:"));
}

TEST_CASE("Parser bounds nesting depth", "[script][parser]") {
    std::string deep(500, '(');
    deep += "1";
    deep += std::string(500, ')');
    auto program = parse_program("return " + deep + ";");
    REQUIRE_FALSE(program.has_value());
    CHECK(program.error().code() == ErrorCode::ParseError);
}
