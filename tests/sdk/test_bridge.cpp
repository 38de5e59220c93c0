#include <catch2/catch_test_macros.hpp>

#include "ctxopt/script/builtins.hpp"
#include "ctxopt/script/interpreter.hpp"
#include "ctxopt/script/parser.hpp"
#include "ctxopt/sdk/bridge.hpp"
#include "support/temp_tree.hpp"

#include <chrono>

using namespace ctxopt::script;
using ctxopt::test::TempTree;
using ctxopt::CancellationToken;
using ctxopt::ErrorCode;

namespace {

auto run_with_ctx(const TempTree& tree, std::string_view code,
                  std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
    -> ctxopt::Result<json> {
    auto program = parse_program(code);
    if (!program) return std::unexpected(program.error());
    Heap heap(64 * 1024 * 1024);
    CancellationToken cancel(timeout);
    Interpreter interp(heap, cancel);
    install_builtins(interp);
    ctxopt::sdk::Bridge bridge(tree.root, cancel);
    bridge.install(interp);
    auto value = interp.run(**program);
    if (!value) return std::unexpected(value.error());
    return to_json_value(*value, heap);
}

} // anonymous namespace

TEST_CASE("Scripts reach the filesystem through ctx.files", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_files");
    tree.write("notes/a.txt", "hello");
    tree.write("notes/b.txt", "world");

    auto r = run_with_ctx(tree, "const files = ctx.files.glob('notes/*.txt');"
                                "return files.map(f => ctx.files.read(f)).join(' ');");
    REQUIRE(r.has_value());
    CHECK(*r == "hello world");

    auto exists = run_with_ctx(tree, "return [ctx.files.exists('notes/a.txt'), ctx.files.exists('nope')];");
    REQUIRE(exists.has_value());
    CHECK(*exists == json::array({true, false}));
}

TEST_CASE("Path rejections carry their code into script errors", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_reject");
    tree.write(".env", "SECRET=1\n");

    auto caught = run_with_ctx(tree, "try { ctx.files.read('.env'); } catch (e) { return e.code; }");
    REQUIRE(caught.has_value());
    CHECK(*caught == "PATH_REJECTED");

    auto uncaught = run_with_ctx(tree, "return ctx.files.read('../../etc/passwd');");
    REQUIRE_FALSE(uncaught.has_value());
    CHECK(uncaught.error().code() == ErrorCode::PathRejected);

    auto missing = run_with_ctx(tree, "try { ctx.files.read('gone.txt'); } catch (e) { return e.code; }");
    REQUIRE(missing.has_value());
    CHECK(*missing == "NOT_FOUND");
}

TEST_CASE("The ctx global and its namespaces are frozen", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_frozen");

    auto replace = run_with_ctx(tree, "ctx.files = {}; return 1;");
    REQUIRE_FALSE(replace.has_value());
    CHECK(replace.error().code() == ErrorCode::RuntimeError);

    auto patch = run_with_ctx(tree, "ctx.files.read = () => 'fake'; return 1;");
    REQUIRE_FALSE(patch.has_value());

    auto extend = run_with_ctx(tree, "ctx.pipeline.extra = 1; return 1;");
    REQUIRE_FALSE(extend.has_value());

    auto frozen = run_with_ctx(tree, "return [Object.isFrozen(ctx), Object.isFrozen(ctx.git)];");
    REQUIRE(frozen.has_value());
    CHECK(*frozen == json::array({true, true}));
}

TEST_CASE("Argument types are checked", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_args");

    auto r = run_with_ctx(tree, "try { ctx.files.read(42); } catch (e) { return e.name + ': ' + e.message; }");
    REQUIRE(r.has_value());
    CHECK(*r == "TypeError: path must be a string");
}

TEST_CASE("Pipelines run script callbacks", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_pipeline");
    tree.write("src/a.ts", "const a = 1;\nconst b = 2;\n");
    tree.write("src/b.ts", "const c = 3;\n");
    tree.write("src/b.test.ts", "test\n");

    auto r = run_with_ctx(tree, R"(
        const result = ctx.pipeline([
            { glob: 'src/**/*.ts' },
            { filter: f => !f.includes('.test.') },
            { read: true },
            { map: f => ({ file: f.file, lines: f.content.split('\n').length }) },
            { sort: 'desc', by: 'lines' },
            { limit: 1 },
        ]);
        return [result.data[0].file, result.data[0].lines, result.stats.stepsExecuted];
    )");
    REQUIRE(r.has_value());
    CHECK(*r == json::array({"src/a.ts", 3, 6}));

    auto unknown = run_with_ctx(tree, "try { ctx.pipeline([{ bogus: 1 }]); } catch (e) { return e.message; }");
    REQUIRE(unknown.has_value());
    CHECK(*unknown == "Unknown pipeline step");
}

TEST_CASE("Pipeline templates are exposed as members", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_templates");
    tree.write("src/a.ts", "export function used() {}\nused();\n");

    auto r = run_with_ctx(tree, R"(
        const first = ctx.pipeline.codebaseOverview();
        const again = ctx.pipeline.codebaseOverview('.');
        const usages = ctx.pipeline.findUsages('used');
        return [first.totalFiles, again.totalFiles, usages.totalReferences];
    )");
    REQUIRE(r.has_value());
    CHECK(*r == json::array({1, 1, 2}));
}

TEST_CASE("Template results are cached per bridge", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_cache");
    tree.write("src/a.ts", "const a = 1;\n");

    auto program = parse_program("ctx.pipeline.codebaseOverview('src');"
                                 "return ctx.pipeline.codebaseOverview('src').totalFiles;");
    REQUIRE(program.has_value());
    Heap heap(64 * 1024 * 1024);
    CancellationToken cancel(std::chrono::milliseconds(5000));
    Interpreter interp(heap, cancel);
    install_builtins(interp);
    ctxopt::sdk::Bridge bridge(tree.root, cancel);
    bridge.install(interp);

    auto value = interp.run(**program);
    REQUIRE(value.has_value());
    CHECK(to_json_value(*value, heap) == 1);
    CHECK(bridge.template_cache().size() == 1);
}

TEST_CASE("A cancelled run cannot be caught by the script", "[sdk][bridge]") {
    TempTree tree("ctxopt_bridge_timeout");
    tree.write("a.ts", "x\n");

    auto r = run_with_ctx(tree,
                          "let n = 0;"
                          "while (true) { try { ctx.files.glob('**/*.ts'); n++; } catch (e) { n--; } }",
                          std::chrono::milliseconds(100));
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().code() == ErrorCode::Timeout);
}
