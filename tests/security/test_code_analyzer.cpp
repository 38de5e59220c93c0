#include <catch2/catch_test_macros.hpp>

#include "ctxopt/security/code_analyzer.hpp"

#include <algorithm>

using namespace ctxopt::security;

namespace {

auto has_reason(const SecurityVerdict& v, std::string_view reason) -> bool {
    return std::ranges::find(v.blocked_patterns, reason) != v.blocked_patterns.end();
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Safe code
// ---------------------------------------------------------------------------

TEST_CASE("Plain arithmetic is safe", "[security][code_analyzer]") {
    auto v = analyze_code("return 1 + 1;");
    CHECK(v.safe);
    CHECK(v.blocked_patterns.empty());
    CHECK(v.warnings.empty());
}

TEST_CASE("SDK usage is safe", "[security][code_analyzer]") {
    auto v = analyze_code(R"(
        const files = await ctx.files.glob("src/**/*.ts");
        const out = [];
        for (const f of files) {
            const content = await ctx.files.read(f);
            out.push({ f, tokens: ctx.utils.countTokens(content) });
        }
        return out;
    )");
    CHECK(v.safe);
}

TEST_CASE("Identifiers containing denied words are not flagged", "[security][code_analyzer]") {
    auto v = analyze_code("const processed = 1; const globalCount = 2; const evaluate = 3; return processed;");
    CHECK(v.safe);
}

// ---------------------------------------------------------------------------
// Blocked constructs
// ---------------------------------------------------------------------------

TEST_CASE("Dynamic evaluation is blocked", "[security][code_analyzer]") {
    CHECK(has_reason(analyze_code("eval('1+1')"), "eval() is not allowed"));
    CHECK(has_reason(analyze_code("Function('return 1')()"), "Function constructor is not allowed"));
    CHECK(has_reason(analyze_code("new Function('x', 'return x')"), "new Function() is not allowed"));
}

TEST_CASE("Module loading is blocked", "[security][code_analyzer]") {
    CHECK(has_reason(analyze_code("const fs = require('fs')"), "require() is not allowed"));
    CHECK(has_reason(analyze_code("await import('fs')"), "dynamic import() is not allowed"));
    CHECK(has_reason(analyze_code("return import.meta.url"), "import.meta is not allowed"));
}

TEST_CASE("Host globals are blocked", "[security][code_analyzer]") {
    CHECK(has_reason(analyze_code("process.exit(1)"), "process is not allowed"));
    CHECK(has_reason(analyze_code("return globalThis"), "globalThis is not allowed"));
    CHECK(has_reason(analyze_code("return __dirname"), "__dirname is not allowed"));
    CHECK(has_reason(analyze_code("Buffer.from('x')"), "Buffer is not allowed"));
}

TEST_CASE("Prototype tampering is blocked", "[security][code_analyzer]") {
    CHECK_FALSE(analyze_code("({}).__proto__.x = 1").safe);
    CHECK_FALSE(analyze_code("[].constructor.constructor('x')").safe);
    CHECK_FALSE(analyze_code("x.constructor['prototype']").safe);
    CHECK_FALSE(analyze_code("Object.prototype.x = 1").safe);
}

TEST_CASE("Reflection is blocked", "[security][code_analyzer]") {
    CHECK(has_reason(analyze_code("Reflect.ownKeys(ctx)"), "Reflect is not allowed"));
    CHECK(has_reason(analyze_code("new Proxy({}, {})"), "Proxy is not allowed"));
}

TEST_CASE("Timers are blocked", "[security][code_analyzer]") {
    auto v = analyze_code("setTimeout(() => 1, 10)");
    CHECK_FALSE(v.safe);
    CHECK(has_reason(v, "setTimeout is not allowed (use await)"));
    CHECK_FALSE(analyze_code("setInterval(f, 1)").safe);
    CHECK_FALSE(analyze_code("setImmediate(f)").safe);
}

TEST_CASE("Escape literals are blocked", "[security][code_analyzer]") {
    CHECK_FALSE(analyze_code("ctx.files.read('file:///etc/passwd')").safe);
    CHECK_FALSE(analyze_code("ctx.files.read('../../etc/hosts')").safe);
}

TEST_CASE("Every matched construct is reported", "[security][code_analyzer]") {
    auto v = analyze_code("eval('x'); require('fs'); process.env");
    CHECK_FALSE(v.safe);
    REQUIRE(v.blocked_patterns.size() == 3);
    CHECK(v.blocked_patterns[0] == "eval() is not allowed");
    CHECK(v.blocked_patterns[1] == "require() is not allowed");
    CHECK(v.blocked_patterns[2] == "process is not allowed");
}

// ---------------------------------------------------------------------------
// Warnings
// ---------------------------------------------------------------------------

TEST_CASE("Unbounded loops produce a warning but stay safe", "[security][code_analyzer]") {
    auto v = analyze_code("while (true) { }");
    CHECK(v.safe);
    REQUIRE(v.warnings.size() == 1);
    CHECK(v.warnings[0] == "infinite loop detected");

    auto w = analyze_code("for (;;) {}");
    CHECK(w.safe);
    CHECK(w.warnings.size() == 1);
}

TEST_CASE("Large repeat produces a warning", "[security][code_analyzer]") {
    auto v = analyze_code("return 'x'.repeat(1000000)");
    CHECK(v.safe);
    REQUIRE(v.warnings.size() == 1);
    CHECK(v.warnings[0] == "large string repeat");

    CHECK(analyze_code("return 'x'.repeat(10)").warnings.empty());
}

TEST_CASE("Analysis is deterministic", "[security][code_analyzer]") {
    const char* code = "eval(1); while(true){}";
    auto a = analyze_code(code);
    auto b = analyze_code(code);
    CHECK(a.blocked_patterns == b.blocked_patterns);
    CHECK(a.warnings == b.warnings);
}
