#pragma once

#include "util.hpp"
#include <string>
#include <optional>
#include <unordered_map>
#include <mutex>

struct CacheEntry {
    std::string value;
    int64_t inserted_at_ms;
};

// TTL-bounded memo of provider answers. Stale entries are dropped when
// looked up; capacity overflow evicts oldest insertions first.
class ResponseCache {
public:
    ResponseCache(int64_t ttl_ms, size_t max_entries,
                  util::ClockFn clock = util::steady_now_ms);

    std::optional<std::string> get(const std::string& key);
    void set(const std::string& key, const std::string& value);
    size_t size() const;

    static std::string make_key(const std::string& model,
                                const std::string& prompt,
                                const std::string& system_instruction);

private:
    int64_t ttl_ms_;
    size_t max_entries_;
    util::ClockFn clock_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, CacheEntry> cache_;

    bool is_expired(const CacheEntry& entry, int64_t now) const;
    void evict_oldest();
};
