#include <catch2/catch_test_macros.hpp>

#include "ctxopt/ast/parser.hpp"

#include <algorithm>

using namespace ctxopt::ast;

namespace {

auto find(const std::vector<CodeElement>& els, std::string_view name) -> const CodeElement* {
    auto it = std::ranges::find_if(els, [&](const auto& e) { return e.name == name; });
    return it == els.end() ? nullptr : &*it;
}

constexpr const char* kTypeScript = R"(import { readFile } from "fs/promises";
import path from 'path';
import './side-effect';

/** Adds two numbers. */
export function add(a: number, b: number): number {
  return a + b;
}

export interface Shape {
  area(): number;
}

export type Id = string;

const helper = (x: number) => {
  return x * 2;
};

export class Circle implements Shape {
  constructor(private r: number) {}

  area(): number {
    return Math.PI * this.r * this.r;
  }

  async load(file: string) {
    const data = await readFile(file);
    return data;
  }
}

export const VERSION = "1.0";
let counter = 0;
)";

} // anonymous namespace

// ---------------------------------------------------------------------------
// TypeScript
// ---------------------------------------------------------------------------

TEST_CASE("TypeScript imports are collected", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());
    REQUIRE(s->imports.size() == 3);
    CHECK(s->imports[0].name == "fs/promises");
    CHECK(s->imports[1].name == "path");
    CHECK(s->imports[2].name == "./side-effect");
    CHECK(s->total_lines > 30);
}

TEST_CASE("TypeScript functions and ranges", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());

    const auto* add = find(s->functions, "add");
    REQUIRE(add != nullptr);
    CHECK(add->type == ElementType::Function);
    CHECK(add->start_line == 6);
    CHECK(add->end_line == 8);
    CHECK(add->is_exported);
    REQUIRE(add->documentation.has_value());
    CHECK(*add->documentation == "Adds two numbers.");

    const auto* helper = find(s->functions, "helper");
    REQUIRE(helper != nullptr);
    CHECK(helper->end_line == helper->start_line + 2);
    CHECK_FALSE(helper->is_exported);
}

TEST_CASE("TypeScript class methods carry their parent", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());

    const auto* circle = find(s->classes, "Circle");
    REQUIRE(circle != nullptr);
    CHECK(circle->is_exported);

    const auto* area = find(s->functions, "area");
    REQUIRE(area != nullptr);
    CHECK(area->type == ElementType::Method);
    REQUIRE(area->parent.has_value());
    CHECK(*area->parent == "Circle");

    const auto* load = find(s->functions, "load");
    REQUIRE(load != nullptr);
    CHECK(load->is_async);

    CHECK(find(s->functions, "readFile") == nullptr);
}

TEST_CASE("TypeScript interfaces, types and variables", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());
    CHECK(find(s->interfaces, "Shape") != nullptr);
    CHECK(find(s->types, "Id") != nullptr);
    CHECK(find(s->variables, "VERSION") != nullptr);
    CHECK(find(s->variables, "counter") != nullptr);
    CHECK(find(s->variables, "data") == nullptr);
}

TEST_CASE("TypeScript exports list exported declarations", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());
    CHECK(find(s->exports, "add") != nullptr);
    CHECK(find(s->exports, "Circle") != nullptr);
    CHECK(find(s->exports, "VERSION") != nullptr);
    CHECK(find(s->exports, "helper") == nullptr);
    CHECK(find(s->exports, "area") == nullptr);
}

TEST_CASE("Export clauses mark declarations", "[ast][parser]") {
    auto s = parse_structure("function a() {}\nfunction b() {}\nexport { a, b as bee };\n",
                             Language::JavaScript);
    REQUIRE(s.has_value());
    CHECK(find(s->functions, "a")->is_exported);
    CHECK(find(s->exports, "a") != nullptr);
    CHECK(find(s->exports, "bee") != nullptr);
}

// ---------------------------------------------------------------------------
// Python
// ---------------------------------------------------------------------------

TEST_CASE("Python structure", "[ast][parser]") {
    const char* src = R"(import os, sys
from typing import List

MAX = 10

class Greeter:
    def greet(self, name):
        """Say hello."""
        return "hi " + name

async def fetch(url):
    return url

def _private():
    pass
)";
    auto s = parse_structure(src, Language::Python);
    REQUIRE(s.has_value());
    REQUIRE(s->imports.size() == 3);
    CHECK(s->imports[0].name == "os");
    CHECK(s->imports[1].name == "sys");
    CHECK(s->imports[2].name == "typing");

    const auto* greeter = find(s->classes, "Greeter");
    REQUIRE(greeter != nullptr);
    CHECK(greeter->start_line == 6);
    CHECK(greeter->end_line == 9);

    const auto* greet = find(s->functions, "greet");
    REQUIRE(greet != nullptr);
    CHECK(greet->type == ElementType::Method);
    CHECK(greet->parent == std::optional<std::string>("Greeter"));
    CHECK(greet->documentation == std::optional<std::string>("Say hello."));

    const auto* fetch = find(s->functions, "fetch");
    REQUIRE(fetch != nullptr);
    CHECK(fetch->is_async);
    CHECK(fetch->is_exported);
    CHECK_FALSE(find(s->functions, "_private")->is_exported);

    CHECK(find(s->variables, "MAX") != nullptr);
}

// ---------------------------------------------------------------------------
// Go and Rust
// ---------------------------------------------------------------------------

TEST_CASE("Go structure", "[ast][parser]") {
    const char* src = R"(package main

import (
	"fmt"
	str "strings"
)

// Server handles requests.
type Server struct {
	name string
}

type Handler interface {
	Serve()
}

func (s *Server) Start() error {
	fmt.Println(str.ToUpper(s.name))
	return nil
}

func helper() {}
)";
    auto s = parse_structure(src, Language::Go);
    REQUIRE(s.has_value());
    REQUIRE(s->imports.size() == 2);
    CHECK(s->imports[0].name == "fmt");
    CHECK(s->imports[1].name == "strings");

    const auto* server = find(s->classes, "Server");
    REQUIRE(server != nullptr);
    CHECK(server->is_exported);
    CHECK(server->documentation == std::optional<std::string>("Server handles requests."));
    CHECK(server->end_line == 11);

    CHECK(find(s->interfaces, "Handler") != nullptr);

    const auto* start = find(s->functions, "Start");
    REQUIRE(start != nullptr);
    CHECK(start->type == ElementType::Method);
    CHECK(start->parent == std::optional<std::string>("Server"));
    CHECK(start->end_line == 20);

    CHECK_FALSE(find(s->functions, "helper")->is_exported);
}

TEST_CASE("Rust structure", "[ast][parser]") {
    const char* src = R"(use std::collections::HashMap;

/// A cache.
pub struct Cache<'a> {
    items: HashMap<&'a str, u32>,
}

impl<'a> Cache<'a> {
    pub fn get(&self, key: &'a str) -> Option<&u32> {
        self.items.get(key)
    }
}

pub trait Store {
    fn put(&mut self, k: String);
}

enum Mode { Fast, Slow }

fn private_helper() {}
)";
    auto s = parse_structure(src, Language::Rust);
    REQUIRE(s.has_value());
    REQUIRE(s->imports.size() == 1);
    CHECK(s->imports[0].name == "std::collections::HashMap");

    const auto* cache = find(s->classes, "Cache");
    REQUIRE(cache != nullptr);
    CHECK(cache->is_exported);
    CHECK(cache->end_line == 6);
    CHECK(cache->documentation == std::optional<std::string>("A cache."));

    const auto* get = find(s->functions, "get");
    REQUIRE(get != nullptr);
    CHECK(get->type == ElementType::Method);
    CHECK(get->parent == std::optional<std::string>("Cache"));
    CHECK(get->end_line == 11);

    CHECK(find(s->interfaces, "Store") != nullptr);
    CHECK(find(s->types, "Mode") != nullptr);
    CHECK_FALSE(find(s->functions, "private_helper")->is_exported);
}

// ---------------------------------------------------------------------------
// Unsupported languages, extraction and skeleton
// ---------------------------------------------------------------------------

TEST_CASE("Unsupported language fails", "[ast][parser]") {
    auto s = parse_structure("{}", Language::Json);
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error().code() == ctxopt::ErrorCode::Unsupported);
    CHECK(s.error().message() == "Unsupported language");

    CHECK_FALSE(parse_structure("x", Language::Unknown).has_value());
    CHECK(make_parser(Language::Yaml) == nullptr);
}

TEST_CASE("extract_element returns the source of a function", "[ast][parser]") {
    auto code = extract_element(kTypeScript, Language::TypeScript, ElementType::Function, "add");
    REQUIRE(code.has_value());
    REQUIRE(code->has_value());
    CHECK(**code == "export function add(a: number, b: number): number {\n  return a + b;\n}");

    auto missing = extract_element(kTypeScript, Language::TypeScript, ElementType::Class, "Nope");
    REQUIRE(missing.has_value());
    CHECK_FALSE(missing->has_value());
}

TEST_CASE("render_skeleton lists signatures only", "[ast][parser]") {
    auto sk = render_skeleton(kTypeScript, Language::TypeScript);
    REQUIRE(sk.has_value());
    CHECK(sk->find("// Imports:") != std::string::npos);
    CHECK(sk->find("export class Circle implements Shape") != std::string::npos);
    CHECK(sk->find("  area(): number") != std::string::npos);
    CHECK(sk->find("export function add(a: number, b: number): number") != std::string::npos);
    CHECK(sk->find("return a + b") == std::string::npos);
}

TEST_CASE("search_elements matches case-insensitively", "[ast][parser]") {
    auto s = parse_structure(kTypeScript, Language::TypeScript);
    REQUIRE(s.has_value());
    auto hits = search_elements(*s, "CIRC");
    REQUIRE(hits.size() == 1);
    CHECK(hits[0].name == "Circle");
}
