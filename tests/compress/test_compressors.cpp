#include <catch2/catch_test_macros.hpp>

#include "ctxopt/compress/compressors.hpp"

#include <string>

using namespace ctxopt::compress;

// ---------------------------------------------------------------------------
// Logs
// ---------------------------------------------------------------------------

TEST_CASE("Repeated log lines collapse with a count", "[compress][logs]") {
    LogCompressor c;
    auto r = c.compress(
        "2024-01-01 10:00:00 INFO request 1 ok\n"
        "2024-01-01 10:00:01 INFO request 2 ok\n"
        "2024-01-01 10:00:02 INFO request 3 ok\n"
        "2024-01-01 10:00:03 ERROR failed to bind port 8080\n",
        {});

    CHECK(r.compressed ==
          "2024-01-01 10:00:00 INFO request 1 ok [x3]\n"
          "2024-01-01 10:00:03 ERROR failed to bind port 8080");
    CHECK(r.stats.compressed_tokens < r.stats.original_tokens);
    CHECK(r.stats.technique == "dedupe");
}

TEST_CASE("Progress noise is dropped but errors are kept", "[compress][logs]") {
    LogCompressor c;
    auto r = c.compress("[=====>    ] 45%\n[==========] 100%\nerror: disk full\n", {});
    CHECK(r.compressed == "error: disk full");
}

TEST_CASE("summarize_logs counts errors and warnings", "[compress][logs]") {
    auto s = summarize_logs(
        "Compiling foo\n"
        "warning: unused variable x\n"
        "error: mismatched types\n"
        "error: mismatched types\n"
        "error: could not compile\n");

    CHECK(s.total_lines == 6);
    CHECK(s.error_count == 3);
    CHECK(s.warning_count == 1);
    CHECK(s.summary.starts_with("6 lines, 3 errors, 1 warnings"));
    CHECK(s.summary.find("  - error: mismatched types") != std::string::npos);
    CHECK(s.summary.find("Last: error: could not compile") != std::string::npos);

    json j = s;
    CHECK(j["stats"]["totalLines"] == 6);
    CHECK(j["stats"]["errorCount"] == 3);
    CHECK(j["stats"]["warningCount"] == 1);
}

TEST_CASE("Zero-error status lines are not errors", "[compress][logs]") {
    auto s = summarize_logs("Build finished with 0 errors\nno warnings\n");
    CHECK(s.error_count == 0);
    CHECK(s.warning_count == 0);
}

// ---------------------------------------------------------------------------
// Stack traces
// ---------------------------------------------------------------------------

TEST_CASE("Library frames are counted, application frames kept", "[compress][stacktrace]") {
    StacktraceCompressor c;
    auto r = c.compress(
        "TypeError: boom\n"
        "    at f (/app/src/a.js:1:1)\n"
        "    at g (/app/node_modules/lib/x.js:2:2)\n"
        "    at h (node:internal/process:3:3)\n"
        "    at k (/app/src/b.js:4:4)\n",
        {});

    CHECK(r.compressed ==
          "TypeError: boom\n"
          "    at f (/app/src/a.js:1:1)\n"
          "    ... 2 frames omitted (2 library)\n"
          "    at k (/app/src/b.js:4:4)");
}

TEST_CASE("Deep application traces are cut after five frames", "[compress][stacktrace]") {
    std::string trace = "Error: deep\n";
    for (int i = 0; i < 8; ++i) {
        trace += "    at fn" + std::to_string(i) + " (/app/src/a.js:" + std::to_string(i + 1) + ":1)\n";
    }
    StacktraceCompressor c;
    auto r = c.compress(trace, {});
    CHECK(r.compressed.find("at fn4 ") != std::string::npos);
    CHECK(r.compressed.find("at fn5 ") == std::string::npos);
    CHECK(r.compressed.ends_with("    ... 3 frames omitted"));
}

// ---------------------------------------------------------------------------
// Diff
// ---------------------------------------------------------------------------

TEST_CASE("Diff keeps files, hunks and changed lines", "[compress][diff]") {
    DiffCompressor c;
    auto r = c.compress(
        "diff --git a/src/a.ts b/src/a.ts\n"
        "index 1111111..2222222 100644\n"
        "--- a/src/a.ts\n"
        "+++ b/src/a.ts\n"
        "@@ -1,3 +1,3 @@\n"
        " context\n"
        "-const a = 1;\n"
        "+const a = 2;\n"
        "+\n",
        {});

    CHECK(r.compressed ==
          "[diff] +2/-1 lines\n"
          "\n## src/a.ts\n"
          "@@ -1,3 +1,3 @@\n"
          "-const a = 1;\n"
          "+const a = 2;");
}

// ---------------------------------------------------------------------------
// Config and generic
// ---------------------------------------------------------------------------

TEST_CASE("JSON config is minified", "[compress][config]") {
    ConfigCompressor c;
    auto r = c.compress("{\n  \"a\": 1,\n  \"b\": [1, 2]\n}\n", {});
    CHECK(r.compressed == R"({"a":1,"b":[1,2]})");
    CHECK(r.stats.technique == "minify");
}

TEST_CASE("Comments and blank lines are stripped from other config", "[compress][config]") {
    ConfigCompressor c;
    auto r = c.compress("# comment\nname: app\n\nport: 8080   \n", {});
    CHECK(r.compressed == "name: app\nport: 8080");
    CHECK(r.stats.technique == "strip-comments");
}

TEST_CASE("Generic compressor squeezes whitespace and repeats", "[compress][generic]") {
    GenericCompressor c;
    auto r = c.compress("a  \n\n\n\nb\nb\nc\n", {});
    CHECK(r.compressed == "a\n\nb\nc");
}

// ---------------------------------------------------------------------------
// Semantic
// ---------------------------------------------------------------------------

TEST_CASE("Small content is returned unchanged", "[compress][semantic]") {
    SemanticCompressor c;
    auto r = c.compress("short text", {});
    CHECK(r.compressed == "short text");
    CHECK(r.stats.reduction_percent() == 0);
}

TEST_CASE("Semantic compression keeps error segments and reduces size", "[compress][semantic]") {
    std::string content;
    for (int i = 0; i < 10; ++i) {
        content += "Paragraph " + std::to_string(i) +
                   " describes alpha beta gamma delta epsilon zeta eta theta iota kappa lambda\n\n";
        if (i == 5) content += "error: database connection failed\n\n";
    }

    SemanticCompressor c;
    CompressOptions opts;
    opts.target_ratio = 0.3;
    auto r = c.compress(content, opts);

    CHECK(r.stats.compressed_tokens < r.stats.original_tokens);
    CHECK(r.compressed.find("error: database connection failed") != std::string::npos);
    CHECK(r.stats.technique == "semantic");
}

TEST_CASE("Semantic compression preserves reading order", "[compress][semantic]") {
    std::string content;
    for (int i = 0; i < 12; ++i) {
        content += "Section" + std::to_string(i) + " unique" + std::to_string(i) +
                   " words about the component lifecycle and its rendering behaviour\n\n";
    }
    SemanticCompressor c;
    auto r = c.compress(content, {});

    std::size_t last = 0;
    for (int i = 0; i < 12; ++i) {
        auto pos = r.compressed.find("Section" + std::to_string(i) + " ");
        if (pos == std::string::npos) continue;
        CHECK(pos >= last);
        last = pos;
    }
}
