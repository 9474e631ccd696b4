#include "response_cache.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <vector>

ResponseCache::ResponseCache(int64_t ttl_ms, size_t max_entries, util::ClockFn clock)
    : ttl_ms_(ttl_ms), max_entries_(std::max<size_t>(1, max_entries)), clock_(std::move(clock)) {}

bool ResponseCache::is_expired(const CacheEntry& entry, int64_t now) const {
    return now - entry.inserted_at_ms > ttl_ms_;
}

std::optional<std::string> ResponseCache::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(key);
    if (it == cache_.end()) return std::nullopt;

    if (is_expired(it->second, clock_())) {
        cache_.erase(it);
        return std::nullopt;
    }

    return it->second.value;
}

void ResponseCache::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);

    cache_[key] = CacheEntry{value, clock_()};
    if (cache_.size() > max_entries_) {
        evict_oldest();
    }
}

void ResponseCache::evict_oldest() {
    std::vector<std::pair<int64_t, std::string>> by_age;
    by_age.reserve(cache_.size());
    for (const auto& [key, entry] : cache_) {
        by_age.emplace_back(entry.inserted_at_ms, key);
    }
    std::sort(by_age.begin(), by_age.end());

    size_t evicted = 0;
    for (const auto& [_, key] : by_age) {
        if (cache_.size() <= max_entries_) break;
        cache_.erase(key);
        evicted++;
    }

    spdlog::debug("Response cache evicted {} entries", evicted);
}

size_t ResponseCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

std::string ResponseCache::make_key(const std::string& model,
                                    const std::string& prompt,
                                    const std::string& system_instruction) {
    // Array encoding keeps field boundaries unambiguous before hashing.
    nlohmann::json parts = nlohmann::json::array({model, prompt, system_instruction});
    return util::sha256_hex(parts.dump());
}
