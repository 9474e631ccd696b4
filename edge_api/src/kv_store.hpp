#pragma once

#include <string>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <sw/redis++/redis++.h>

// Key-value collaborator. Implementations throw on storage failure.
class KvStore {
public:
    virtual ~KvStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual bool del(const std::string& key) = 0;
    virtual bool ping() = 0;
};

class RedisKvStore : public KvStore {
public:
    RedisKvStore(const std::string& redis_url, int timeout_ms);

    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool del(const std::string& key) override;
    bool ping() override;

    std::shared_ptr<sw::redis::Redis> get_redis() { return redis_; }

private:
    std::shared_ptr<sw::redis::Redis> redis_;
};

// Process-local store used when no Redis is configured.
class MemoryKvStore : public KvStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    bool del(const std::string& key) override;
    bool ping() override { return true; }

    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string> data_;
};

std::string sync_data_key(const std::string& key_hash);
std::string push_subscription_key(const std::string& key_hash);
std::string schedule_key(const std::string& key_hash);

// Key hashes become part of store keys: 1-128 characters of [A-Za-z0-9_-].
bool is_valid_key_hash(const std::string& key_hash);
