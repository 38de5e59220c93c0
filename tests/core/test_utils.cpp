#include <catch2/catch_test_macros.hpp>

#include <regex>

#include "ctxopt/core/utils.hpp"

using namespace ctxopt;

TEST_CASE("trim removes whitespace", "[utils]") {
    SECTION("leading and trailing spaces") {
        REQUIRE(utils::trim("  hello  ") == "hello");
    }

    SECTION("leading and trailing tabs and newlines") {
        REQUIRE(utils::trim("\t\nhello\r\n") == "hello");
    }

    SECTION("empty and blank strings") {
        REQUIRE(utils::trim("") == "");
        REQUIRE(utils::trim("   \t\n  ") == "");
    }

    SECTION("internal whitespace preserved") {
        REQUIRE(utils::trim("  hello world  ") == "hello world");
    }
}

TEST_CASE("split divides string by delimiter", "[utils]") {
    SECTION("basic split on comma") {
        auto parts = utils::split("a,b,c", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[0] == "a");
        CHECK(parts[2] == "c");
    }

    SECTION("no delimiter present") {
        auto parts = utils::split("hello", ',');
        REQUIRE(parts.size() == 1);
        CHECK(parts[0] == "hello");
    }

    SECTION("trailing delimiter") {
        auto parts = utils::split("a,b,", ',');
        REQUIRE(parts.size() == 2);
        CHECK(parts[1] == "b");
    }

    SECTION("empty fields in the middle are kept") {
        auto parts = utils::split("a,,b", ',');
        REQUIRE(parts.size() == 3);
        CHECK(parts[1].empty());
    }
}

TEST_CASE("split_lines keeps empty lines and drops carriage returns", "[utils]") {
    auto lines = utils::split_lines("one\r\n\nthree\n");
    REQUIRE(lines.size() == 4);
    CHECK(lines[0] == "one");
    CHECK(lines[1].empty());
    CHECK(lines[2] == "three");
    CHECK(lines[3].empty());

    CHECK(utils::split_lines("").size() == 1);
}

TEST_CASE("join concatenates with a separator", "[utils]") {
    CHECK(utils::join({"a", "b", "c"}, ", ") == "a, b, c");
    CHECK(utils::join({"solo"}, ", ") == "solo");
    CHECK(utils::join({}, ", ").empty());
}

TEST_CASE("to_lower and to_upper", "[utils]") {
    CHECK(utils::to_lower("Hello World") == "hello world");
    CHECK(utils::to_upper("Hello World") == "HELLO WORLD");
    CHECK(utils::to_lower("").empty());
}

TEST_CASE("replace_all substitutes every occurrence", "[utils]") {
    CHECK(utils::replace_all("/work/a and /work/b", "/work", "<workdir>") == "<workdir>/a and <workdir>/b");
    CHECK(utils::replace_all("aaa", "a", "aa") == "aaaaaa");
    CHECK(utils::replace_all("unchanged", "", "x") == "unchanged");
}

TEST_CASE("escape_regex matches literally", "[utils]") {
    auto escaped = utils::escape_regex("a.b*(c)[d]$");
    std::regex re(escaped);
    CHECK(std::regex_match(std::string("a.b*(c)[d]$"), re));
    CHECK_FALSE(std::regex_match(std::string("aXb*(c)[d]$"), re));
}

TEST_CASE("timestamp_ms returns positive value", "[utils]") {
    auto ts = utils::timestamp_ms();
    CHECK(ts > 0);
    // Should be after 2020-01-01 in milliseconds
    CHECK(ts > 1577836800000LL);
}
