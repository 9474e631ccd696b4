#include <catch2/catch_test_macros.hpp>
#include "../src/rate_limiter.hpp"
#include "test_support.hpp"
#include <stdexcept>
#include <unordered_map>

namespace {

RateLimitOptions options(const std::string& key, int max_requests, int64_t window_ms) {
    RateLimitOptions opts;
    opts.ns = "analyze";
    opts.key = key;
    opts.max_requests = max_requests;
    opts.window_ms = window_ms;
    return opts;
}

} // namespace

TEST_CASE("Fixed window rate limiting", "[rate_limit]") {
    FakeClock clock;
    RateLimiter limiter(nullptr, clock.fn());

    SECTION("Limit applies after max requests and resets after the window") {
        auto opts = options("203.0.113.10", 2, 60000);

        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE_FALSE(limiter.check(opts).limited);

        auto third = limiter.check(opts);
        REQUIRE(third.limited);
        REQUIRE(third.retry_after_sec >= 1);
        REQUIRE(third.retry_after_sec <= 60);

        clock.advance(60001);
        REQUIRE_FALSE(limiter.check(opts).limited);
    }

    SECTION("Retry hint counts down with the window") {
        auto opts = options("a", 1, 10000);
        limiter.check(opts);
        clock.advance(7500);
        auto result = limiter.check(opts);
        REQUIRE(result.limited);
        REQUIRE(result.retry_after_sec == 3);
    }

    SECTION("Keys and namespaces are independent") {
        auto a = options("a", 1, 60000);
        auto b = options("b", 1, 60000);
        auto a_sync = a;
        a_sync.ns = "sync";

        REQUIRE_FALSE(limiter.check(a).limited);
        REQUIRE(limiter.check(a).limited);
        REQUIRE_FALSE(limiter.check(b).limited);
        REQUIRE_FALSE(limiter.check(a_sync).limited);
    }

    SECTION("Disabled limiter never limits") {
        auto opts = options("a", 1, 60000);
        opts.disabled = true;
        for (int i = 0; i < 10; ++i) {
            REQUIRE_FALSE(limiter.check(opts).limited);
        }
        REQUIRE(limiter.local_size("analyze") == 0);
    }

    SECTION("Local store is bounded per namespace") {
        for (int i = 0; i < 10; ++i) {
            auto opts = options("client-" + std::to_string(i), 1, 60000);
            opts.local_max_entries = 4;
            limiter.check(opts);
        }
        REQUIRE(limiter.local_size("analyze") == 4);

        // Oldest keys were evicted, so client-0 starts a fresh window.
        auto first = options("client-0", 1, 60000);
        first.local_max_entries = 4;
        REQUIRE_FALSE(limiter.check(first).limited);

        auto recent = options("client-9", 1, 60000);
        recent.local_max_entries = 4;
        REQUIRE(limiter.check(recent).limited);
    }
}

namespace {

// In-memory stand-in for the Redis counter. Keys never expire on their own;
// tests move time by editing ttl directly.
class ScriptedCounter : public RateCounter {
public:
    std::unordered_map<std::string, long long> counts;
    std::unordered_map<std::string, long long> ttls;
    bool fail_incr = false;
    int fail_pexpire = 0;
    int pexpire_calls = 0;

    long long incr(const std::string& key) override {
        if (fail_incr) throw std::runtime_error("Connection reset by peer");
        return ++counts[key];
    }

    void pexpire(const std::string& key, int64_t ttl_ms) override {
        pexpire_calls++;
        if (fail_pexpire > 0) {
            fail_pexpire--;
            throw std::runtime_error("Resource temporarily unavailable");
        }
        ttls[key] = ttl_ms;
    }

    long long pttl(const std::string& key) override {
        if (!counts.count(key)) return -2;
        auto it = ttls.find(key);
        return it == ttls.end() ? -1 : it->second;
    }
};

} // namespace

TEST_CASE("Shared counter rate limiting", "[rate_limit]") {
    FakeClock clock;
    auto counter = std::make_shared<ScriptedCounter>();
    RateLimiter limiter(counter, clock.fn());
    auto opts = options("203.0.113.10", 2, 60000);
    const std::string key = "rl:analyze:203.0.113.10";

    SECTION("Limit applies after max requests") {
        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE(limiter.check(opts).limited);
        REQUIRE(counter->counts[key] == 3);
        REQUIRE(counter->ttls[key] == 60000);
        REQUIRE(counter->pexpire_calls == 1);
        REQUIRE(limiter.local_size("analyze") == 0);
    }

    SECTION("Retry hint comes from the key ttl") {
        limiter.check(opts);
        limiter.check(opts);
        counter->ttls[key] = 4200;
        auto result = limiter.check(opts);
        REQUIRE(result.limited);
        REQUIRE(result.retry_after_sec == 5);
    }

    SECTION("Counter failure falls back to the local store") {
        counter->fail_incr = true;
        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE(limiter.check(opts).limited);
        REQUIRE(limiter.local_size("analyze") == 1);
    }

    SECTION("Key left without expiry gets one on the next hit") {
        counter->fail_pexpire = 1;
        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE(counter->counts[key] == 1);
        REQUIRE(counter->ttls.count(key) == 0);

        REQUIRE_FALSE(limiter.check(opts).limited);
        REQUIRE(counter->ttls[key] == 60000);

        auto limited = limiter.check(opts);
        REQUIRE(limited.limited);
        REQUIRE(limited.retry_after_sec == 60);
        REQUIRE(counter->pexpire_calls == 2);
    }
}
