#include <catch2/catch_test_macros.hpp>

#include "ctxopt/sdk/search.hpp"
#include "support/temp_tree.hpp"

#include <chrono>
#include <string>

using namespace ctxopt::sdk;
using ctxopt::test::TempTree;
using ctxopt::CancellationToken;
using ctxopt::ErrorCode;

namespace {

void write_project(const TempTree& tree) {
    tree.write("src/math.ts", "export function addNumbers(a: number, b: number) {\n"
                              "  return a + b;\n"
                              "}\n");
    tree.write("src/use.ts", "import { addNumbers } from './math';\n"
                             "const total = addNumbers(1, 2) + addNumbers(3, 4);\n");
    tree.write("notes.txt", "addNumbers is documented here\n");
}

} // anonymous namespace

TEST_CASE("grep reports every match with position", "[sdk][search]") {
    TempTree tree("ctxopt_search_grep");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto result = search_grep(host, "addNumbers");
    REQUIRE(result.has_value());
    CHECK((*result)["filesSearched"] == 2);
    CHECK((*result)["totalMatches"] == 4);

    const auto& first = (*result)["matches"][0];
    CHECK(first["file"] == "src/math.ts");
    CHECK(first["line"] == 1);
    CHECK(first["column"] == 17);
    CHECK(first["match"] == "addNumbers");

    const auto& last = (*result)["matches"][3];
    CHECK(last["file"] == "src/use.ts");
    CHECK(last["line"] == 2);
    CHECK(last["content"] == "const total = addNumbers(1, 2) + addNumbers(3, 4);");
}

TEST_CASE("grep honours an explicit glob", "[sdk][search]") {
    TempTree tree("ctxopt_search_glob");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto result = search_grep(host, "document\\w+", std::string_view("*.txt"));
    REQUIRE(result.has_value());
    REQUIRE((*result)["matches"].size() == 1);
    CHECK((*result)["matches"][0]["match"] == "documented");
}

TEST_CASE("grep rejects malformed patterns", "[sdk][search]") {
    TempTree tree("ctxopt_search_badre");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto result = search_grep(host, "(unclosed");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("grep runs nested quantifiers in linear time", "[sdk][search]") {
    TempTree tree("ctxopt_search_linear");
    std::string content;
    for (int i = 0; i < 200; ++i) content += std::string(34, 'a') + "\n";
    tree.write("b.ts", content);
    CancellationToken cancel(std::chrono::milliseconds(5000));
    Host host(tree.root, cancel);

    const auto start = std::chrono::steady_clock::now();
    auto result = search_grep(host, "(a+)+b");
    const auto elapsed = std::chrono::steady_clock::now() - start;
    REQUIRE(result.has_value());
    CHECK((*result)["totalMatches"] == 0);
    CHECK(elapsed < std::chrono::seconds(2));

    auto backref = search_grep(host, "(a)\\1");
    REQUIRE_FALSE(backref.has_value());
    CHECK(backref.error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("grep stops once the deadline has passed", "[sdk][search]") {
    TempTree tree("ctxopt_search_deadline");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);
    cancel.cancel();

    auto result = search_grep(host, "addNumbers");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code() == ErrorCode::Timeout);
}

TEST_CASE("symbols match declaration names case-insensitively", "[sdk][search]") {
    TempTree tree("ctxopt_search_symbols");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto result = search_symbols(host, "ADDNUM");
    REQUIRE(result.has_value());
    REQUIRE((*result)["totalMatches"] == 1);
    const auto& symbol = (*result)["symbols"][0];
    CHECK(symbol["name"] == "addNumbers");
    CHECK(symbol["type"] == "function");
    CHECK(symbol["file"] == "src/math.ts");
    CHECK(symbol["line"] == 1);
}

TEST_CASE("files lists glob matches with metadata", "[sdk][search]") {
    TempTree tree("ctxopt_search_files");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto result = search_files(host, "**/*.ts");
    REQUIRE(result.has_value());
    REQUIRE((*result)["totalMatches"] == 2);
    const auto& math = (*result)["files"][0];
    CHECK(math["path"] == "src/math.ts");
    CHECK(math["name"] == "math.ts");
    CHECK(math["extension"] == ".ts");
    CHECK(math["size"].get<std::size_t>() > 0);

    auto outside = search_files(host, "../**/*.ts");
    REQUIRE_FALSE(outside.has_value());
    CHECK(outside.error().code() == ErrorCode::PathRejected);
}

TEST_CASE("references classify definitions imports and usages", "[sdk][search]") {
    TempTree tree("ctxopt_search_refs");
    write_project(tree);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto refs = search_references(host, "addNumbers");
    REQUIRE(refs.has_value());
    REQUIRE(refs->size() == 4);
    CHECK((*refs)[0]["type"] == "definition");
    CHECK((*refs)[0]["file"] == "src/math.ts");
    CHECK((*refs)[1]["type"] == "import");
    CHECK((*refs)[2]["type"] == "usage");
    CHECK((*refs)[2]["column"] == 15);
    CHECK((*refs)[3]["type"] == "usage");

    auto empty = search_references(host, "  ");
    REQUIRE_FALSE(empty.has_value());
    CHECK(empty.error().code() == ErrorCode::InvalidArgument);
}
