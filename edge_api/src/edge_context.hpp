#pragma once

#include "config.hpp"
#include "origin_policy.hpp"
#include "rate_limiter.hpp"
#include "response_cache.hpp"
#include "quota_breaker.hpp"
#include "kv_store.hpp"
#include "llm_client.hpp"
#include <memory>
#include <vector>

// Shared state for every request handler. Each member synchronizes itself.
struct EdgeContext {
    Config config;
    std::vector<OriginRule> origin_rules;

    std::shared_ptr<RateLimiter> rate_limiter;
    std::shared_ptr<ResponseCache> cache;
    std::shared_ptr<QuotaBreaker> breaker;
    std::shared_ptr<KvStore> store;
    std::shared_ptr<LlmProvider> llm;

    static EdgeContext create(const Config& config,
                              std::shared_ptr<KvStore> store,
                              std::shared_ptr<LlmProvider> llm,
                              std::shared_ptr<sw::redis::Redis> redis = nullptr,
                              util::ClockFn clock = util::steady_now_ms);

    RateLimitOptions rate_limit_options(const std::string& ns, const std::string& key) const;
};
