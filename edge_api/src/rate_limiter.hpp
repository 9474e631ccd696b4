#pragma once

#include "util.hpp"
#include <string>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <sw/redis++/redis++.h>

struct RateLimitOptions {
    std::string ns;
    std::string key;
    int64_t window_ms = 60000;
    int max_requests = 20;
    bool disabled = false;
    size_t local_max_entries = 2000;
};

struct RateLimitResult {
    bool limited = false;
    int retry_after_sec = 0;
};

// Shared window counter. Implementations throw on transport failure.
class RateCounter {
public:
    virtual ~RateCounter() = default;

    virtual long long incr(const std::string& key) = 0;
    virtual void pexpire(const std::string& key, int64_t ttl_ms) = 0;
    // Remaining ttl in ms; -1 when the key has no expiry, -2 when it is gone.
    virtual long long pttl(const std::string& key) = 0;
};

class RedisRateCounter : public RateCounter {
public:
    explicit RedisRateCounter(std::shared_ptr<sw::redis::Redis> redis) : redis_(std::move(redis)) {}

    long long incr(const std::string& key) override;
    void pexpire(const std::string& key, int64_t ttl_ms) override;
    long long pttl(const std::string& key) override;

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Fixed-window counter per (namespace, key). Uses the shared Redis counter
// when one is configured and falls back to the in-process store otherwise
// or when Redis fails.
class RateLimiter {
public:
    explicit RateLimiter(std::shared_ptr<RateCounter> counter = nullptr,
                         util::ClockFn clock = util::steady_now_ms);

    RateLimitResult check(const RateLimitOptions& options);

    size_t local_size(const std::string& ns) const;

private:
    struct Window {
        int64_t count = 0;
        int64_t window_start_ms = 0;
    };

    struct LocalStore {
        std::unordered_map<std::string, Window> windows;
        std::list<std::string> insertion_order;
    };

    std::shared_ptr<RateCounter> counter_;
    util::ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, LocalStore> stores_;

    RateLimitResult check_local(const RateLimitOptions& options);
    RateLimitResult check_shared(const RateLimitOptions& options);
};
