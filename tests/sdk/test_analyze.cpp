#include <catch2/catch_test_macros.hpp>

#include "ctxopt/sdk/analyze.hpp"
#include "support/temp_tree.hpp"

#include <algorithm>

using namespace ctxopt::sdk;
using ctxopt::test::TempTree;
using ctxopt::CancellationToken;
using ctxopt::ErrorCode;
using ctxopt::ast::Language;

namespace {

constexpr const char* kGraphSource = "export function main() {\n"
                                     "  const x = load();\n"
                                     "  return render(x);\n"
                                     "}\n"
                                     "\n"
                                     "function load() {\n"
                                     "  return parse(\"a\");\n"
                                     "}\n"
                                     "\n"
                                     "function parse(s: string) {\n"
                                     "  return s;\n"
                                     "}\n"
                                     "\n"
                                     "function render(x: string) {\n"
                                     "  return x;\n"
                                     "}\n";

auto node_named(const json& nodes, std::string_view name) -> const json* {
    for (const auto& node : nodes) {
        if (node["name"] == name) return &node;
    }
    return nullptr;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Import parsing
// ---------------------------------------------------------------------------

TEST_CASE("ES module imports are parsed with their bindings", "[sdk][analyze]") {
    auto imports = parse_imports("import React, { useState, useEffect as effect } from 'react';\n"
                                 "import type { Config } from './config';\n"
                                 "import * as path from 'path';\n"
                                 "import './polyfill';\n"
                                 "export { helper } from './helper';\n"
                                 "const fs = require('fs');\n",
                                 Language::TypeScript);
    REQUIRE(imports.size() == 6);

    CHECK(imports[0].source == "react");
    CHECK(imports[0].is_default);
    CHECK(imports[0].names == std::vector<std::string>{"React", "useState", "useEffect"});

    CHECK(imports[1].source == "./config");
    CHECK_FALSE(imports[1].is_default);
    CHECK(imports[1].names == std::vector<std::string>{"Config"});

    CHECK(imports[2].source == "./polyfill");
    CHECK(imports[2].names.empty());

    CHECK(imports[3].source == "path");
    CHECK(imports[3].is_namespace);
    CHECK(imports[3].names == std::vector<std::string>{"path"});

    CHECK(imports[4].source == "./helper");
    CHECK(imports[4].names == std::vector<std::string>{"helper"});

    CHECK(imports[5].source == "fs");
}

TEST_CASE("Python and Go imports are parsed", "[sdk][analyze]") {
    auto py = parse_imports("import os, sys\n"
                            "from .utils import helper, other as o  # local\n",
                            Language::Python);
    REQUIRE(py.size() == 3);
    CHECK(py[0].source == "os");
    CHECK(py[1].source == "sys");
    CHECK(py[2].source == ".utils");
    CHECK(py[2].names == std::vector<std::string>{"helper", "other"});

    auto go = parse_imports("package main\n\n"
                            "import (\n"
                            "\t\"fmt\"\n"
                            "\tstr \"strings\"\n"
                            ")\n",
                            Language::Go);
    REQUIRE(go.size() == 2);
    CHECK(go[0].source == "fmt");
    CHECK(go[0].names == std::vector<std::string>{"fmt"});
    CHECK(go[1].source == "strings");
    CHECK(go[1].names == std::vector<std::string>{"str"});
}

TEST_CASE("Relative imports resolve to files in the working directory", "[sdk][analyze]") {
    TempTree tree("ctxopt_analyze_resolve");
    tree.write("src/app.ts", "");
    tree.write("src/util.ts", "");
    tree.write("src/lib/helpers.ts", "");
    tree.write("src/lib/index.ts", "");
    tree.write("pkg/mod.py", "");
    tree.write("pkg/sub/use.py", "");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    CHECK(resolve_import(host, "./lib/helpers", "src/app.ts", Language::TypeScript) ==
          std::optional<std::string>("src/lib/helpers.ts"));
    CHECK(resolve_import(host, "./lib", "src/app.ts", Language::TypeScript) ==
          std::optional<std::string>("src/lib/index.ts"));
    CHECK(resolve_import(host, "./util.js", "src/app.ts", Language::TypeScript) ==
          std::optional<std::string>("src/util.ts"));
    CHECK(resolve_import(host, "..mod", "pkg/sub/use.py", Language::Python) ==
          std::optional<std::string>("pkg/mod.py"));

    CHECK_FALSE(resolve_import(host, "react", "src/app.ts", Language::TypeScript));
    CHECK_FALSE(resolve_import(host, "./missing", "src/app.ts", Language::TypeScript));
    CHECK_FALSE(resolve_import(host, "../../../etc/passwd", "src/app.ts", Language::TypeScript));
}

TEST_CASE("Calls exclude keywords and the enclosing function", "[sdk][analyze]") {
    auto calls = extract_calls("function run() {\n"
                               "  if (ready()) { return run(); }\n"
                               "  for (const x of xs) emit(x);\n"
                               "  emit(1);\n"
                               "}\n",
                               "run");
    CHECK(calls == std::vector<std::string>{"ready", "emit"});
}

// ---------------------------------------------------------------------------
// File analysis
// ---------------------------------------------------------------------------

TEST_CASE("Dependencies split internal and external imports", "[sdk][analyze]") {
    TempTree tree("ctxopt_analyze_deps");
    tree.write("src/app.ts", "import React from 'react';\n"
                             "import { helper } from './lib/util';\n"
                             "import * as lib from './lib';\n"
                             "import { gone } from './gone';\n"
                             "\n"
                             "export function main() {\n"
                             "  return helper();\n"
                             "}\n");
    tree.write("src/lib/util.ts", "export function helper() {}\n");
    tree.write("src/lib/index.ts", "export * from './util';\n");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto deps = analyze_dependencies(host, "src/app.ts");
    REQUIRE(deps.has_value());
    CHECK((*deps)["file"] == "src/app.ts");
    REQUIRE((*deps)["imports"].size() == 4);
    CHECK((*deps)["imports"][1]["resolvedPath"] == "src/lib/util.ts");
    CHECK_FALSE((*deps)["imports"][2].contains("resolvedPath"));
    CHECK((*deps)["externalDeps"] == json::array({"react"}));
    CHECK((*deps)["internalDeps"] == json::array({"src/lib/util.ts", "src/lib/index.ts"}));
    REQUIRE_FALSE((*deps)["exports"].empty());
    CHECK((*deps)["exports"][0]["name"] == "main");

    auto missing = analyze_dependencies(host, "missing.ts");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);
}

TEST_CASE("Call graph follows same-file calls up to the depth", "[sdk][analyze]") {
    TempTree tree("ctxopt_analyze_graph");
    tree.write("src/graph.ts", kGraphSource);
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto graph = analyze_call_graph(host, "main", "src/graph.ts");
    REQUIRE(graph.has_value());
    CHECK((*graph)["root"] == "main");
    CHECK((*graph)["depth"] == 3);
    const auto& nodes = (*graph)["nodes"];
    REQUIRE(nodes.size() == 4);

    const auto* main = node_named(nodes, "main");
    REQUIRE(main != nullptr);
    CHECK((*main)["line"] == 1);
    CHECK((*main)["calls"] == json::array({"load", "render"}));

    const auto* parse = node_named(nodes, "parse");
    REQUIRE(parse != nullptr);
    CHECK((*parse)["calledBy"] == json::array({"load"}));

    auto shallow = analyze_call_graph(host, "main", "src/graph.ts", 1);
    REQUIRE(shallow.has_value());
    CHECK((*shallow)["nodes"].size() == 3);
    CHECK(node_named((*shallow)["nodes"], "parse") == nullptr);

    auto missing = analyze_call_graph(host, "nope", "src/graph.ts");
    REQUIRE_FALSE(missing.has_value());
    CHECK(missing.error().code() == ErrorCode::NotFound);
    CHECK(missing.error().message() == "Function 'nope' not found in src/graph.ts");
}

TEST_CASE("Exports list exported declarations", "[sdk][analyze]") {
    TempTree tree("ctxopt_analyze_exports");
    tree.write("src/graph.ts", kGraphSource);
    tree.write("notes.txt", "plain\n");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto exports = analyze_exports(host, "src/graph.ts");
    REQUIRE(exports.has_value());
    REQUIRE(exports->size() == 1);
    CHECK((*exports)[0]["name"] == "main");
    CHECK((*exports)[0]["line"] == 1);
    CHECK((*exports)[0]["isDefault"] == false);

    auto text = analyze_exports(host, "notes.txt");
    REQUIRE_FALSE(text.has_value());
    CHECK(text.error().code() == ErrorCode::Unsupported);
}

TEST_CASE("Structure walks the tree and skips hidden entries", "[sdk][analyze]") {
    TempTree tree("ctxopt_analyze_structure");
    tree.write("README.md", "# readme\n");
    tree.write("src/graph.ts", kGraphSource);
    tree.write("src/tool.py", "def run():\n    pass\n");
    tree.write(".env", "SECRET=1\n");
    tree.write(".git/config", "");
    tree.write("node_modules/pkg/index.js", "");
    CancellationToken cancel;
    Host host(tree.root, cancel);

    auto structure = analyze_structure(host);
    REQUIRE(structure.has_value());
    CHECK((*structure)["path"] == ".");
    CHECK((*structure)["type"] == "directory");
    const auto& children = (*structure)["children"];
    REQUIRE(children.size() == 2);
    CHECK(children[0]["name"] == "README.md");
    CHECK_FALSE(children[0].contains("language"));
    CHECK(children[1]["path"] == "src");

    const auto& src = children[1]["children"];
    REQUIRE(src.size() == 2);
    CHECK(src[0]["path"] == "src/graph.ts");
    CHECK(src[0]["language"] == "typescript");
    CHECK(src[0]["functions"] == 4);
    CHECK(src[1]["language"] == "python");

    auto shallow = analyze_structure(host, std::string_view("."), 1);
    REQUIRE(shallow.has_value());
    CHECK_FALSE((*shallow)["children"][1].contains("children"));

    auto outside = analyze_structure(host, std::string_view(".."));
    REQUIRE_FALSE(outside.has_value());
    CHECK(outside.error().code() == ErrorCode::PathRejected);
}
