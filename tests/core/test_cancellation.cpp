#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <thread>

#include "ctxopt/core/cancellation.hpp"

using namespace ctxopt;
using namespace std::chrono_literals;

TEST_CASE("Default token never expires", "[cancellation]") {
    CancellationToken token;
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE(token.remaining() == std::chrono::milliseconds::max());
}

TEST_CASE("Explicit cancel", "[cancellation]") {
    CancellationToken token(10s);
    REQUIRE_FALSE(token.is_cancelled());
    REQUIRE(token.remaining() > 0ms);

    token.cancel();
    REQUIRE(token.is_cancelled());
    REQUIRE(token.remaining() == 0ms);
}

TEST_CASE("Deadline latches the token", "[cancellation]") {
    CancellationToken token(1ms);
    std::this_thread::sleep_for(5ms);
    REQUIRE(token.is_cancelled());
    REQUIRE(token.remaining() == 0ms);
    REQUIRE(token.deadline() <= CancellationToken::clock::now());
}
