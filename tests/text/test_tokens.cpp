#include <catch2/catch_test_macros.hpp>

#include "ctxopt/text/tokens.hpp"

#include <string>

using namespace ctxopt::text;

TEST_CASE("Empty and whitespace text cost nothing", "[text][tokens]") {
    CHECK(estimate_tokens("") == 0);
    CHECK(estimate_tokens("   \n\t ") == 0);
}

TEST_CASE("Short text is positive", "[text][tokens]") {
    CHECK(estimate_tokens("hello world") > 0);
    CHECK(estimate_tokens("x") == 1);
}

TEST_CASE("Punctuation is counted separately", "[text][tokens]") {
    // "foo" -> 1, "(" -> 1, ")" -> 1, ";" -> 1
    CHECK(estimate_tokens("foo();") == 4);
}

TEST_CASE("Estimate grows with length", "[text][tokens]") {
    std::string small(100, 'a');
    std::string large(1000, 'a');
    CHECK(estimate_tokens(large) > estimate_tokens(small));
    CHECK(estimate_tokens(large) == 250);
}
