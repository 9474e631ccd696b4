#include "health.hpp"

nlohmann::json HealthCheck::get_status() const {
    bool store_ok = ctx_.store->ping();
    auto retry_after = ctx_.breaker->retry_after_sec();

    nlohmann::json status = {
        {"ok", store_ok},
        {"store", store_ok},
        {"breaker", retry_after ? "open" : "closed"},
        {"cooldown_remaining_sec", retry_after.value_or(0)},
        {"cache_entries", ctx_.cache->size()},
        {"service", ctx_.config.service_name}
    };

    return status;
}

bool HealthCheck::is_healthy() const {
    return ctx_.store->ping();
}
