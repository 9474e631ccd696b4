#include "rate_limiter.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>

namespace {

int retry_after_from_ms(int64_t remaining_ms) {
    int64_t secs = (std::max<int64_t>(0, remaining_ms) + 999) / 1000;
    return static_cast<int>(std::max<int64_t>(1, secs));
}

} // namespace

long long RedisRateCounter::incr(const std::string& key) {
    return redis_->incr(key);
}

void RedisRateCounter::pexpire(const std::string& key, int64_t ttl_ms) {
    redis_->pexpire(key, std::chrono::milliseconds(ttl_ms));
}

long long RedisRateCounter::pttl(const std::string& key) {
    return redis_->pttl(key);
}

RateLimiter::RateLimiter(std::shared_ptr<RateCounter> counter, util::ClockFn clock)
    : counter_(std::move(counter)), clock_(std::move(clock)) {}

RateLimitResult RateLimiter::check(const RateLimitOptions& options) {
    if (options.disabled) return {};

    if (counter_) {
        try {
            return check_shared(options);
        } catch (const std::exception& e) {
            spdlog::warn("Distributed rate limit unavailable for {}, using local store: {}",
                         options.ns, e.what());
        }
    }

    return check_local(options);
}

RateLimitResult RateLimiter::check_shared(const RateLimitOptions& options) {
    std::string key = "rl:" + options.ns + ":" + options.key;

    long long count = counter_->incr(key);

    // A key left without expiry by an earlier failed PEXPIRE would never reset.
    long long ttl_ms = count == 1 ? -1 : counter_->pttl(key);
    if (ttl_ms < 0) {
        counter_->pexpire(key, options.window_ms);
        ttl_ms = options.window_ms;
    }

    if (count > options.max_requests) {
        return {true, retry_after_from_ms(ttl_ms)};
    }

    return {};
}

RateLimitResult RateLimiter::check_local(const RateLimitOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    int64_t now = clock_();
    auto& store = stores_[options.ns];

    auto it = store.windows.find(options.key);
    if (it == store.windows.end()) {
        size_t max_entries = std::max<size_t>(1, options.local_max_entries);
        while (store.windows.size() >= max_entries && !store.insertion_order.empty()) {
            store.windows.erase(store.insertion_order.front());
            store.insertion_order.pop_front();
        }

        store.insertion_order.push_back(options.key);
        Window window;
        window.count = 1;
        window.window_start_ms = now;
        store.windows.emplace(options.key, window);
        return {};
    }

    Window& window = it->second;

    if (now - window.window_start_ms > options.window_ms) {
        window.count = 1;
        window.window_start_ms = now;
        return {};
    }

    window.count++;
    if (window.count > options.max_requests) {
        return {true, retry_after_from_ms(window.window_start_ms + options.window_ms - now)};
    }

    return {};
}

size_t RateLimiter::local_size(const std::string& ns) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stores_.find(ns);
    return it == stores_.end() ? 0 : it->second.windows.size();
}
