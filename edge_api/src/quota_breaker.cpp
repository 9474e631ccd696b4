#include "quota_breaker.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

namespace {

int seconds_until(int64_t until_ms, int64_t now_ms) {
    int64_t secs = (until_ms - now_ms + 999) / 1000;
    return static_cast<int>(std::max<int64_t>(1, secs));
}

} // namespace

QuotaBreaker::QuotaBreaker(int64_t cooldown_ms, util::ClockFn clock)
    : cooldown_ms_(cooldown_ms), clock_(std::move(clock)) {}

std::optional<int> QuotaBreaker::retry_after_sec() const {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    if (cooldown_until_ms_ <= now) return std::nullopt;
    return seconds_until(cooldown_until_ms_, now);
}

int QuotaBreaker::trip() {
    std::lock_guard<std::mutex> lock(mutex_);
    int64_t now = clock_();
    cooldown_until_ms_ = now + cooldown_ms_;
    spdlog::warn("Provider quota exhausted, cooling down for {}ms", cooldown_ms_);
    return seconds_until(cooldown_until_ms_, now);
}

void QuotaBreaker::record_success() {
    std::lock_guard<std::mutex> lock(mutex_);
    cooldown_until_ms_ = 0;
}

bool QuotaBreaker::is_open() const {
    return retry_after_sec().has_value();
}

int64_t QuotaBreaker::cooldown_until_ms() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cooldown_until_ms_;
}
