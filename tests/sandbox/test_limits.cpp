#include <catch2/catch_test_macros.hpp>

#include "ctxopt/sandbox/limits.hpp"

using namespace ctxopt::sandbox;
using std::chrono::milliseconds;

TEST_CASE("Timeouts are clamped into the allowed window", "[sandbox][limits]") {
    CHECK(clamp_timeout(std::nullopt) == kDefaultTimeout);
    CHECK(clamp_timeout(milliseconds(10)) == kMinTimeout);
    CHECK(clamp_timeout(milliseconds(0)) == kMinTimeout);
    CHECK(clamp_timeout(milliseconds(12000)) == milliseconds(12000));
    CHECK(clamp_timeout(milliseconds(600000)) == kMaxTimeout);
}

TEST_CASE("A lower ceiling caps the timeout", "[sandbox][limits]") {
    CHECK(clamp_timeout(milliseconds(20000), milliseconds(8000)) == milliseconds(8000));
    CHECK(clamp_timeout(std::nullopt, milliseconds(2000)) == milliseconds(2000));
    // The ceiling itself never drops below the minimum or rises above the maximum.
    CHECK(clamp_timeout(milliseconds(5000), milliseconds(10)) == kMinTimeout);
    CHECK(clamp_timeout(milliseconds(50000), milliseconds(90000)) == kMaxTimeout);
}

TEST_CASE("Limits from config can only tighten", "[sandbox][limits]") {
    SECTION("defaults") {
        auto limits = limits_from_config(ctxopt::LimitsConfig{});
        CHECK(limits.timeout == kDefaultTimeout);
        CHECK(limits.max_timeout == kMaxTimeout);
        CHECK(limits.memory_limit_bytes == kDefaultMemoryLimit);
        CHECK(limits.max_output_tokens == kDefaultMaxOutputTokens);
    }

    SECTION("tighter values apply") {
        ctxopt::LimitsConfig config;
        config.default_timeout_ms = 20000;
        config.max_timeout_ms = 10000;
        config.memory_limit_mb = 64;
        config.max_output_tokens = 500;
        auto limits = limits_from_config(config);
        CHECK(limits.max_timeout == milliseconds(10000));
        CHECK(limits.timeout == milliseconds(10000));
        CHECK(limits.memory_limit_bytes == 64u * 1024 * 1024);
        CHECK(limits.max_output_tokens == 500);
    }

    SECTION("looser values are capped") {
        ctxopt::LimitsConfig config;
        config.max_timeout_ms = 120000;
        config.memory_limit_mb = 4096;
        auto limits = limits_from_config(config);
        CHECK(limits.max_timeout == kMaxTimeout);
        CHECK(limits.memory_limit_bytes == kDefaultMemoryLimit);
    }

    SECTION("zero falls back to defaults") {
        ctxopt::LimitsConfig config;
        config.default_timeout_ms = 0;
        config.max_timeout_ms = 0;
        config.memory_limit_mb = 0;
        config.max_output_tokens = 0;
        auto limits = limits_from_config(config);
        CHECK(limits.timeout == kDefaultTimeout);
        CHECK(limits.max_timeout == kMaxTimeout);
        CHECK(limits.memory_limit_bytes == kDefaultMemoryLimit);
        CHECK(limits.max_output_tokens == kDefaultMaxOutputTokens);
    }
}
