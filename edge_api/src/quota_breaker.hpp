#pragma once

#include "util.hpp"
#include <mutex>
#include <optional>

// Process-wide cooldown for the provider quota. Open while
// cooldown_until_ms > now; closes lazily once the deadline passes.
class QuotaBreaker {
public:
    explicit QuotaBreaker(int64_t cooldown_ms, util::ClockFn clock = util::steady_now_ms);

    // Seconds to wait while open, nullopt when calls may proceed.
    std::optional<int> retry_after_sec() const;

    // Opens the breaker and returns the Retry-After hint.
    int trip();
    void record_success();

    bool is_open() const;
    int64_t cooldown_until_ms() const;

private:
    int64_t cooldown_ms_;
    util::ClockFn clock_;
    mutable std::mutex mutex_;
    int64_t cooldown_until_ms_ = 0;
};
