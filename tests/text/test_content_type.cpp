#include <catch2/catch_test_macros.hpp>

#include "ctxopt/text/content_type.hpp"

using namespace ctxopt::text;

TEST_CASE("Unified diff is detected", "[text][content_type]") {
    const char* diff = "diff --git a/x.ts b/x.ts\n--- a/x.ts\n+++ b/x.ts\n@@ -1,2 +1,2 @@\n-old\n+new\n";
    CHECK(detect_content_type(diff) == ContentType::Diff);
}

TEST_CASE("Stack traces are detected", "[text][content_type]") {
    const char* js = "TypeError: x is undefined\n    at foo (/app/a.js:10:5)\n    at bar (/app/b.js:3:1)\n";
    CHECK(detect_content_type(js) == ContentType::Stacktrace);

    const char* py = "Traceback (most recent call last):\n  File \"a.py\", line 1\nValueError: bad\n";
    CHECK(detect_content_type(py) == ContentType::Stacktrace);
}

TEST_CASE("JSON and YAML are config", "[text][content_type]") {
    CHECK(detect_content_type(R"({"name": "x", "version": "1.0"})") == ContentType::Config);
    CHECK(detect_content_type("name: app\nversion: 2\nport: 8080\n") == ContentType::Config);
}

TEST_CASE("Log output is detected", "[text][content_type]") {
    const char* logs =
        "2024-01-01 10:00:00 INFO starting\n"
        "2024-01-01 10:00:01 WARN slow disk\n"
        "2024-01-01 10:00:02 ERROR failed to bind\n"
        "done\n";
    CHECK(detect_content_type(logs) == ContentType::Logs);
}

TEST_CASE("Source code is detected", "[text][content_type]") {
    const char* code =
        "import { x } from './x';\n"
        "export function f() {\n"
        "  return x + 1;\n"
        "}\n";
    CHECK(detect_content_type(code) == ContentType::Code);
}

TEST_CASE("Prose is generic", "[text][content_type]") {
    CHECK(detect_content_type("The quick brown fox jumps over the lazy dog.") == ContentType::Generic);
    CHECK(detect_content_type("") == ContentType::Generic);
}

TEST_CASE("Content type names", "[text][content_type]") {
    CHECK(content_type_to_string(ContentType::Logs) == "logs");
    CHECK(content_type_from_string("diff") == ContentType::Diff);
    CHECK(content_type_from_string("STACKTRACE") == ContentType::Stacktrace);
    CHECK(content_type_from_string("whatever") == ContentType::Generic);
}
