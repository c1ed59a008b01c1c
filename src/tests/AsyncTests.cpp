// SPDX-License-Identifier: Apache-2.0
#include <core/Async.hpp>

#include <catch2/catch_test_macros.hpp>

using namespace mcphub;
using namespace std::chrono_literals;

TEST_CASE("Join fires once every branch has settled", "[async]")
{
    auto fired = 0;
    auto join = Join::create(3, [&] { ++fired; });

    join->settle();
    join->settle();
    CHECK(fired == 0);

    join->settle();
    CHECK(fired == 1);

    // Extra settles are ignored.
    join->settle();
    CHECK(fired == 1);
}

TEST_CASE("Join without branches fires immediately", "[async]")
{
    auto fired = false;
    auto join = Join::create(0, [&] { fired = true; });
    CHECK(fired);
    CHECK(join.use_count() == 1);
}

TEST_CASE("awaitResult drives the loop until the operation completes", "[async]")
{
    auto loop = EventLoop {};

    auto value = awaitResult<int>(loop, [&](Callback<int> done) {
        loop.startTimer(10ms, [done] { done(42); });
    });
    REQUIRE(value.has_value());
    CHECK(*value == 42);

    auto starved = awaitResult<void>(loop, [](VoidCallback) {});
    REQUIRE(!starved.has_value());
    CHECK(starved.error().code == ErrorCode::Unknown);
}
