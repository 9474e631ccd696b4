#include <catch2/catch_test_macros.hpp>
#include "../src/response_cache.hpp"
#include "test_support.hpp"

TEST_CASE("Response cache", "[cache]") {
    FakeClock clock;
    ResponseCache cache(1000, 3, clock.fn());

    SECTION("Value is served within the TTL and dropped after it") {
        cache.set("k", "v");
        clock.advance(1000);
        REQUIRE(cache.get("k") == std::optional<std::string>("v"));

        clock.advance(1);
        REQUIRE_FALSE(cache.get("k").has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Overwrite refreshes the entry") {
        cache.set("k", "old");
        clock.advance(800);
        cache.set("k", "new");
        clock.advance(800);
        REQUIRE(cache.get("k") == std::optional<std::string>("new"));
    }

    SECTION("Capacity evicts the oldest insertions") {
        cache.set("a", "1");
        clock.advance(1);
        cache.set("b", "2");
        clock.advance(1);
        cache.set("c", "3");
        clock.advance(1);
        cache.set("d", "4");

        REQUIRE(cache.size() == 3);
        REQUIRE_FALSE(cache.get("a").has_value());
        REQUIRE(cache.get("d").has_value());
    }
}

TEST_CASE("Cache key derivation", "[cache]") {
    SECTION("Key is a stable sha256 hex digest") {
        auto key = ResponseCache::make_key("m", "p", "s");
        REQUIRE(key.size() == 64);
        REQUIRE(key == ResponseCache::make_key("m", "p", "s"));
    }

    SECTION("Field boundaries matter") {
        REQUIRE(ResponseCache::make_key("m", "ab", "c") != ResponseCache::make_key("m", "a", "bc"));
        REQUIRE(ResponseCache::make_key("m1", "p", "s") != ResponseCache::make_key("m2", "p", "s"));
    }
}
