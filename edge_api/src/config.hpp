#pragma once

#include <string>
#include <cstdlib>
#include <cstddef>

struct Config {
    // HTTP
    std::string listen_addr = "0.0.0.0";
    int listen_port = 8080;

    // CORS
    std::string cors_allowed_origins;
    bool cors_strict = false;

    // Rate limiting
    bool disable_rate_limit = false;
    int analyze_rate_window_ms = 60000;
    int analyze_rate_max_requests = 20;
    int sync_rate_window_ms = 60000;
    int sync_rate_max_requests = 60;
    int rate_limit_local_max_entries = 2000;

    // Response cache / quota breaker
    int ai_cache_ttl_ms = 600000;
    int ai_cache_max_entries = 200;
    int ai_quota_cooldown_ms = 120000;

    // LLM provider
    std::string api_key;
    std::string ai_model = "gemini-2.5-flash";
    std::string ai_api_base = "https://generativelanguage.googleapis.com/v1beta";
    int ai_timeout_ms = 25000;

    // Request bodies
    int body_read_timeout_ms = 5000;
    size_t analyze_max_body_bytes = 64 * 1024;
    size_t sync_max_payload_bytes = 1024 * 1024;

    // Key-value store (empty url = in-memory)
    std::string redis_url;
    int redis_timeout_ms = 2000;

    // Service
    std::string service_name = "edge_api";
    std::string log_level = "info";

    static Config from_env();
    void validate() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
