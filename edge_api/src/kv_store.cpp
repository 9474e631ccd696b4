#include "kv_store.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

RedisKvStore::RedisKvStore(const std::string& redis_url, int timeout_ms) {
    try {
        sw::redis::ConnectionOptions opts(redis_url);
        opts.connect_timeout = std::chrono::milliseconds(timeout_ms);
        opts.socket_timeout = std::chrono::milliseconds(timeout_ms);

        redis_ = std::make_shared<sw::redis::Redis>(opts);
        spdlog::info("Connected to Redis {}:{}", opts.host, opts.port);
    } catch (const std::exception& e) {
        spdlog::error("Failed to connect to Redis: {}", e.what());
        throw;
    }
}

std::optional<std::string> RedisKvStore::get(const std::string& key) {
    try {
        auto val = redis_->get(key);
        if (val) return *val;
        return std::nullopt;
    } catch (const std::exception& e) {
        spdlog::error("Redis GET failed: {}", e.what());
        throw;
    }
}

void RedisKvStore::set(const std::string& key, const std::string& value) {
    try {
        redis_->set(key, value);
    } catch (const std::exception& e) {
        spdlog::error("Redis SET failed: {}", e.what());
        throw;
    }
}

bool RedisKvStore::del(const std::string& key) {
    try {
        return redis_->del(key) > 0;
    } catch (const std::exception& e) {
        spdlog::error("Redis DEL failed: {}", e.what());
        throw;
    }
}

bool RedisKvStore::ping() {
    try {
        redis_->ping();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Redis ping failed: {}", e.what());
        return false;
    }
}

std::optional<std::string> MemoryKvStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key);
    if (it == data_.end()) return std::nullopt;
    return it->second;
}

void MemoryKvStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    data_[key] = value;
}

bool MemoryKvStore::del(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.erase(key) > 0;
}

size_t MemoryKvStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

std::string sync_data_key(const std::string& key_hash) {
    return "sync_data:" + key_hash;
}

std::string push_subscription_key(const std::string& key_hash) {
    return "push_sub:" + key_hash;
}

std::string schedule_key(const std::string& key_hash) {
    return "schedule:" + key_hash;
}

bool is_valid_key_hash(const std::string& key_hash) {
    if (key_hash.empty() || key_hash.size() > 128) return false;
    for (char c : key_hash) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                  (c >= '0' && c <= '9') || c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}
