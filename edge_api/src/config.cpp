#include "config.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    int parsed = 0;
    try {
        parsed = std::stoi(val);
    } catch (const std::exception& e) {
        spdlog::warn("Failed to parse {}='{}': {}", name, val, e.what());
    }
    if (parsed > 0) return parsed;
    spdlog::warn("Invalid positive integer for {}, using default {}", name, default_val);
    return default_val;
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string v = util::to_lower(util::trim(val));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

Config Config::from_env() {
    Config cfg;

    cfg.listen_addr = get_env("LISTEN_ADDR", cfg.listen_addr);
    cfg.listen_port = get_env_int("LISTEN_PORT", cfg.listen_port);

    cfg.cors_allowed_origins = get_env("CORS_ALLOWED_ORIGINS");
    cfg.cors_strict = get_env_bool("CORS_STRICT", false);

    cfg.disable_rate_limit = get_env_bool("DISABLE_RATE_LIMIT", false);
    cfg.analyze_rate_window_ms = get_env_int("ANALYZE_RATE_LIMIT_WINDOW_MS", cfg.analyze_rate_window_ms);
    cfg.analyze_rate_max_requests = get_env_int("ANALYZE_RATE_LIMIT_MAX_REQUESTS", cfg.analyze_rate_max_requests);
    cfg.sync_rate_window_ms = get_env_int("SYNC_RATE_LIMIT_WINDOW_MS", cfg.sync_rate_window_ms);
    cfg.sync_rate_max_requests = get_env_int("SYNC_RATE_LIMIT_MAX_REQUESTS", cfg.sync_rate_max_requests);
    cfg.rate_limit_local_max_entries = get_env_int("RATE_LIMIT_LOCAL_MAX_ENTRIES", cfg.rate_limit_local_max_entries);

    cfg.ai_cache_ttl_ms = get_env_int("AI_CACHE_TTL_MS", cfg.ai_cache_ttl_ms);
    cfg.ai_cache_max_entries = get_env_int("AI_CACHE_MAX_ENTRIES", cfg.ai_cache_max_entries);
    cfg.ai_quota_cooldown_ms = get_env_int("AI_QUOTA_COOLDOWN_MS", cfg.ai_quota_cooldown_ms);

    cfg.api_key = get_env("API_KEY");
    cfg.ai_model = get_env("AI_MODEL", cfg.ai_model);
    cfg.ai_api_base = get_env("AI_API_BASE", cfg.ai_api_base);
    cfg.ai_timeout_ms = get_env_int("AI_TIMEOUT_MS", cfg.ai_timeout_ms);

    cfg.body_read_timeout_ms = get_env_int("BODY_READ_TIMEOUT_MS", cfg.body_read_timeout_ms);
    cfg.analyze_max_body_bytes = static_cast<size_t>(
        get_env_int("ANALYZE_MAX_BODY_BYTES", static_cast<int>(cfg.analyze_max_body_bytes)));
    cfg.sync_max_payload_bytes = static_cast<size_t>(
        get_env_int("SYNC_MAX_PAYLOAD_BYTES", static_cast<int>(cfg.sync_max_payload_bytes)));

    cfg.redis_url = get_env("REDIS_URL");
    cfg.redis_timeout_ms = get_env_int("REDIS_TIMEOUT_MS", cfg.redis_timeout_ms);

    cfg.service_name = get_env("SERVICE_NAME", cfg.service_name);
    cfg.log_level = get_env("LOG_LEVEL", cfg.log_level);

    return cfg;
}

void Config::validate() const {
    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("LISTEN_PORT must be between 1 and 65535");
    }

    if (api_key.empty()) {
        spdlog::warn("API_KEY not set; /api/analyze will answer 500 until configured");
    }

    spdlog::info("Configuration validated successfully");
    spdlog::info("  CORS: origins='{}', strict={}", cors_allowed_origins, cors_strict);
    spdlog::info("  Rate limits: analyze={}/{}ms, sync={}/{}ms, disabled={}",
                 analyze_rate_max_requests, analyze_rate_window_ms,
                 sync_rate_max_requests, sync_rate_window_ms, disable_rate_limit);
    spdlog::info("  AI cache: ttl={}ms, max={}, quota cooldown={}ms",
                 ai_cache_ttl_ms, ai_cache_max_entries, ai_quota_cooldown_ms);
    spdlog::info("  Store: {}", redis_url.empty() ? "in-memory" : "redis");
}
