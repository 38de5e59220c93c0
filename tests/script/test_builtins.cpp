#include <catch2/catch_test_macros.hpp>

#include "ctxopt/script/builtins.hpp"
#include "ctxopt/script/interpreter.hpp"
#include "ctxopt/script/parser.hpp"

#include <cmath>

using namespace ctxopt::script;
using ctxopt::CancellationToken;

namespace {

auto run(std::string_view code) -> ctxopt::Result<json> {
    auto program = parse_program(code);
    if (!program) return std::unexpected(program.error());
    Heap heap(64 * 1024 * 1024);
    CancellationToken cancel(std::chrono::milliseconds(5000));
    Interpreter interp(heap, cancel);
    install_builtins(interp);
    auto value = interp.run(**program);
    if (!value) return std::unexpected(value.error());
    return to_json_value(*value, heap);
}

auto eval(std::string_view expression) -> json {
    auto result = run("return " + std::string(expression) + ";");
    REQUIRE(result.has_value());
    return *result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Globals
// ---------------------------------------------------------------------------

TEST_CASE("Math functions", "[script][builtins]") {
    CHECK(eval("Math.max(1, 5, 3)") == 5);
    CHECK(eval("Math.min()") == nullptr);  // Infinity serialises as null
    CHECK(eval("Math.round(2.5)") == 3);
    CHECK(eval("Math.round(-2.5)") == -2);
    CHECK(eval("Math.floor(-1.5)") == -2);
    CHECK(eval("Math.abs(-4)") == 4);
    CHECK(eval("Math.sign(-3)") == -1);
    CHECK(eval("Math.pow(2, 8)") == 256);
    CHECK(eval("Math.random() < 1") == true);
}

TEST_CASE("JSON round trips through stringify and parse", "[script][builtins]") {
    CHECK(eval("JSON.stringify({ b: 1, a: [true, null, 'x'] })") == R"({"b":1,"a":[true,null,"x"]})");
    CHECK(eval("JSON.stringify({ a: 1 }, null, 2)") == "{\n  \"a\": 1\n}");
    CHECK(eval("JSON.stringify({ skip: undefined, f: () => 1, n: NaN })") == R"({"n":null})");
    CHECK(eval("JSON.parse('{\"x\": [1, 2]}').x[1]") == 2);
    CHECK(eval("JSON.stringify(undefined) === undefined") == true);
}

TEST_CASE("JSON reports bad input", "[script][builtins]") {
    auto bad = run("return JSON.parse('{oops');");
    REQUIRE_FALSE(bad.has_value());
    CHECK(bad.error().message() == "Unexpected token in JSON");

    auto circular = run("const o = {}; o.self = o; return JSON.stringify(o);");
    REQUIRE_FALSE(circular.has_value());
    CHECK(circular.error().message() == "Converting circular structure to JSON");
}

TEST_CASE("Object helpers", "[script][builtins]") {
    CHECK(eval("Object.keys({ a: 1, b: 2 })") == json::array({"a", "b"}));
    CHECK(eval("Object.values({ a: 1, b: 2 })") == json::array({1, 2}));
    CHECK(eval("Object.entries({ a: 1 })") == json::array({json::array({"a", 1})}));
    CHECK(eval("Object.fromEntries([['a', 1], ['b', 2]])") == json::object({{"a", 1}, {"b", 2}}));
    CHECK(eval("Object.assign({ a: 1 }, { b: 2 }, null, { a: 3 })") == json::object({{"a", 3}, {"b", 2}}));
    CHECK(eval("Object.isFrozen(Object.freeze({}))") == true);
    CHECK(eval("({ a: 1 }).hasOwnProperty('a')") == true);
}

TEST_CASE("Array statics", "[script][builtins]") {
    CHECK(eval("Array.isArray([])") == true);
    CHECK(eval("Array.isArray('x')") == false);
    CHECK(eval("Array.from('abc')") == json::array({"a", "b", "c"}));
    CHECK(eval("Array.from({ length: 3 }, (_, i) => i * 2)") == json::array({0, 2, 4}));
    CHECK(eval("Array.of(1, 2)") == json::array({1, 2}));
}

TEST_CASE("Conversion functions", "[script][builtins]") {
    CHECK(eval("String(12)") == "12");
    CHECK(eval("String(null)") == "null");
    CHECK(eval("Number('42')") == 42);
    CHECK(eval("Number('')") == 0);
    CHECK(eval("isNaN(Number('4x'))") == true);
    CHECK(eval("Boolean('')") == false);
    CHECK(eval("parseInt('42px')") == 42);
    CHECK(eval("parseInt('ff', 16)") == 255);
    CHECK(eval("parseInt('0x1A')") == 26);
    CHECK(eval("isNaN(parseInt('px'))") == true);
    CHECK(eval("parseFloat('3.25rem')") == 3.25);
    CHECK(eval("parseFloat('.5')") == 0.5);
    CHECK(eval("Number.isInteger(5)") == true);
    CHECK(eval("Number.isInteger(5.5)") == false);
    CHECK(eval("String.fromCharCode(72, 105)") == "Hi");
}

TEST_CASE("Error constructors build error objects", "[script][builtins]") {
    CHECK(eval("RangeError('too big').name") == "RangeError");
    CHECK(eval("String(TypeError('bad'))") == "TypeError: bad");
    CHECK(eval("Error('x') instanceof Error") == true);
    CHECK(eval("TypeError('x') instanceof RangeError") == false);
    CHECK(eval("[] instanceof Array") == true);
}

TEST_CASE("Promise helpers resolve synchronously", "[script][builtins]") {
    CHECK(eval("Promise.allSettled([1])") ==
          json::array({json::object({{"status", "fulfilled"}, {"value", 1}})}));
    CHECK(eval("Promise.race([7, 8])") == 7);

    auto rejected = run("await Promise.reject(Error('nope'));");
    REQUIRE_FALSE(rejected.has_value());
    CHECK(rejected.error().message() == "nope");
}

TEST_CASE("console is available and silent", "[script][builtins]") {
    CHECK(run("console.log('hello'); return 1;").value() == 1);
    CHECK(eval("typeof Date.now()") == "number");
}

// ---------------------------------------------------------------------------
// String methods
// ---------------------------------------------------------------------------

TEST_CASE("String search methods", "[script][builtins]") {
    CHECK(eval("'hello'.indexOf('l')") == 2);
    CHECK(eval("'hello'.lastIndexOf('l')") == 3);
    CHECK(eval("'hello'.indexOf('z')") == -1);
    CHECK(eval("'hello'.includes('ell')") == true);
    CHECK(eval("'hello'.startsWith('he')") == true);
    CHECK(eval("'hello'.endsWith('lo')") == true);
    CHECK(eval("'hello'.charAt(1)") == "e");
    CHECK(eval("'hello'[4]") == "o");
    CHECK(eval("'hello'.at(-1)") == "o");
    CHECK(eval("'A'.charCodeAt(0)") == 65);
}

TEST_CASE("String slicing and case", "[script][builtins]") {
    CHECK(eval("'hello'.slice(1, -1)") == "ell");
    CHECK(eval("'hello'.slice(-3)") == "llo");
    CHECK(eval("'hello'.substring(3, 1)") == "el");
    CHECK(eval("'hello'.substr(1, 3)") == "ell");
    CHECK(eval("'Hello'.toUpperCase()") == "HELLO");
    CHECK(eval("'Hello'.toLowerCase()") == "hello");
    CHECK(eval("'  pad  '.trim()") == "pad");
    CHECK(eval("'  pad  '.trimStart()") == "pad  ");
    CHECK(eval("'  pad  '.trimEnd()") == "  pad");
    CHECK(eval("'5'.padStart(3, '0')") == "005");
    CHECK(eval("'ab'.padEnd(5, 'xy')") == "abxyx");
    CHECK(eval("'ab'.repeat(3)") == "ababab");
}

TEST_CASE("String split and replace", "[script][builtins]") {
    CHECK(eval("'a,b,,c'.split(',')") == json::array({"a", "b", "", "c"}));
    CHECK(eval("'abc'.split('')") == json::array({"a", "b", "c"}));
    CHECK(eval("'a b c'.split(' ', 2)") == json::array({"a", "b"}));
    CHECK(eval("'x'.split()") == json::array({"x"}));
    CHECK(eval("'a-b-c'.replace('-', '+')") == "a+b-c");
    CHECK(eval("'a-b-c'.replaceAll('-', '+')") == "a+b+c");
    CHECK(eval("'cost'.replace('cost', '$$&')") == "$&");
    CHECK(eval("'a1b1'.replaceAll('1', (m, i) => `[${i}]`)") == "a[1]b[3]");
    CHECK(eval("'a'.concat('b', 1)") == "ab1");
    CHECK(eval("'b'.localeCompare('a')") == 1);
}

TEST_CASE("String repeat rejects bad counts", "[script][builtins]") {
    auto r = run("return 'x'.repeat(-1);");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().message().starts_with("Invalid count value"));
}

// ---------------------------------------------------------------------------
// Array methods
// ---------------------------------------------------------------------------

TEST_CASE("Array mutators", "[script][builtins]") {
    CHECK(eval("(() => { const a = [1]; a.push(2, 3); return a; })()") == json::array({1, 2, 3}));
    CHECK(eval("(() => { const a = [1, 2]; const x = a.pop(); return [x, a]; })()") ==
          json::array({2, json::array({1})}));
    CHECK(eval("(() => { const a = [1, 2]; a.shift(); a.unshift(0, 9); return a; })()") ==
          json::array({0, 9, 2}));
    CHECK(eval("(() => { const a = [1, 2, 3, 4]; const r = a.splice(1, 2, 'x'); return [r, a]; })()") ==
          json::array({json::array({2, 3}), json::array({1, "x", 4})}));
    CHECK(eval("[1, 2, 3].reverse()") == json::array({3, 2, 1}));
    CHECK(eval("[0, 0, 0].fill(7, 1)") == json::array({0, 7, 7}));
    CHECK(eval("(() => { const a = [1, 2, 3]; a.length = 1; return a; })()") == json::array({1}));
}

TEST_CASE("Array sort is stable and uses string order by default", "[script][builtins]") {
    CHECK(eval("[10, 9, 1, 100].sort()") == json::array({1, 10, 100, 9}));
    CHECK(eval("[10, 9, 1, 100].sort((a, b) => a - b)") == json::array({1, 9, 10, 100}));
    CHECK(eval("[{k: 1, v: 'a'}, {k: 0, v: 'b'}, {k: 1, v: 'c'}].sort((x, y) => x.k - y.k).map(o => o.v)") ==
          json::array({"b", "a", "c"}));
    CHECK(eval("[3, undefined, 1].sort()") == json::array({1, 3, nullptr}));
    CHECK(eval("[3, 1, 2].sort(() => Math.random() - 0.5).length") == 3);
}

TEST_CASE("Array iteration callbacks", "[script][builtins]") {
    CHECK(eval("[1, 2, 3].map((x, i) => x * i)") == json::array({0, 2, 6}));
    CHECK(eval("[1, 2, 3, 4].filter(x => x % 2 === 0)") == json::array({2, 4}));
    CHECK(eval("[1, 2, 3].reduce((a, b) => a + b)") == 6);
    CHECK(eval("[1, 2, 3].reduce((a, b) => a + b, 10)") == 16);
    CHECK(eval("['a', 'b'].reduceRight((acc, x) => acc + x, '')") == "ba");
    CHECK(eval("[5, 6, 7].find(x => x > 5)") == 6);
    CHECK(eval("[5, 6, 7].findIndex(x => x > 9)") == -1);
    CHECK(eval("[5, 6, 7].findLast(x => x > 5)") == 7);
    CHECK(eval("[1, 2].some(x => x > 1)") == true);
    CHECK(eval("[1, 2].every(x => x > 1)") == false);
    CHECK(eval("[[1, 2], [3]].flatMap(x => x)") == json::array({1, 2, 3}));
    CHECK(eval("(() => { let n = 0; [1, 2, 3].forEach(x => { n += x; }); return n; })()") == 6);
}

TEST_CASE("Array accessors", "[script][builtins]") {
    CHECK(eval("[1, 2, 3].slice(1)") == json::array({2, 3}));
    CHECK(eval("[1].concat([2, 3], 4)") == json::array({1, 2, 3, 4}));
    CHECK(eval("[1, [2, 3], null].join('-')") == "1-2,3-");
    CHECK(eval("[1, 2, 3].indexOf(2)") == 1);
    CHECK(eval("[NaN].includes(NaN)") == true);
    CHECK(eval("[NaN].indexOf(NaN)") == -1);
    CHECK(eval("[1, [2, [3, [4]]]].flat(2)") == json::array({1, 2, 3, json::array({4})}));
    CHECK(eval("[1, 2, 3].at(-1)") == 3);
    CHECK(eval("['a', 'b'].entries()") == json::array({json::array({0, "a"}), json::array({1, "b"})}));
    CHECK(eval("[1, 2, 3].length") == 3);
}

TEST_CASE("Self-containing arrays flatten and join without runaway recursion", "[script][builtins]") {
    CHECK(eval("(() => { const a = [1]; a.push(a); return a.flat(1).length; })()") == 3);
    CHECK(eval("(() => { const a = [1]; a.push(a); return a.join('-'); })()") == "1-");

    auto caught = run("const a = [1]; a.push(a); try { a.flat(Infinity); } catch (e) { return e.name; }");
    REQUIRE(caught.has_value());
    CHECK(*caught == "RangeError");

    auto uncaught = run("const a = [1]; a.push(a); return a.flat(Infinity).length;");
    REQUIRE_FALSE(uncaught.has_value());
    CHECK(uncaught.error().message().find("nested too deeply") != std::string_view::npos);

    auto deep = run("let a = []; for (let i = 0; i < 5000; i++) a = [a]; return [a.join(), a.flat(Infinity).length];");
    REQUIRE_FALSE(deep.has_value());
    CHECK(deep.error().message().find("nested too deeply") != std::string_view::npos);
}

TEST_CASE("Array callbacks reject non-functions", "[script][builtins]") {
    auto r = run("return [1].map(5);");
    REQUIRE_FALSE(r.has_value());
    CHECK(r.error().message() == "5 is not a function");
}

// ---------------------------------------------------------------------------
// Number methods
// ---------------------------------------------------------------------------

TEST_CASE("Number formatting methods", "[script][builtins]") {
    CHECK(eval("(3.14159).toFixed(2)") == "3.14");
    CHECK(eval("(2).toFixed(1)") == "2.0");
    CHECK(eval("(255).toString(16)") == "ff");
    CHECK(eval("(5).toString(2)") == "101");
    CHECK(eval("(1234567.891).toLocaleString()") == "1,234,567.891");
    CHECK(eval("(0.5).toString()") == "0.5");
    CHECK(eval("1e21 + ''") == "1e+21");
}
