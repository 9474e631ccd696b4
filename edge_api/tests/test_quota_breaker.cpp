#include <catch2/catch_test_macros.hpp>
#include "../src/quota_breaker.hpp"
#include "test_support.hpp"

TEST_CASE("Quota breaker", "[breaker]") {
    FakeClock clock;
    QuotaBreaker breaker(120000, clock.fn());

    SECTION("Starts closed") {
        REQUIRE_FALSE(breaker.is_open());
        REQUIRE_FALSE(breaker.retry_after_sec().has_value());
    }

    SECTION("Trip opens for the cooldown") {
        REQUIRE(breaker.trip() == 120);
        REQUIRE(breaker.is_open());

        clock.advance(119500);
        REQUIRE(breaker.retry_after_sec() == std::optional<int>(1));

        clock.advance(500);
        REQUIRE_FALSE(breaker.is_open());
    }

    SECTION("Success closes immediately") {
        breaker.trip();
        breaker.record_success();
        REQUIRE_FALSE(breaker.is_open());
        REQUIRE(breaker.cooldown_until_ms() == 0);
    }
}
