#include "edge_context.hpp"

EdgeContext EdgeContext::create(const Config& config,
                                std::shared_ptr<KvStore> store,
                                std::shared_ptr<LlmProvider> llm,
                                std::shared_ptr<sw::redis::Redis> redis,
                                util::ClockFn clock) {
    EdgeContext ctx;
    ctx.config = config;
    ctx.origin_rules = parse_allowed_origins(config.cors_allowed_origins);
    std::shared_ptr<RateCounter> counter;
    if (redis) counter = std::make_shared<RedisRateCounter>(std::move(redis));
    ctx.rate_limiter = std::make_shared<RateLimiter>(std::move(counter), clock);
    ctx.cache = std::make_shared<ResponseCache>(config.ai_cache_ttl_ms,
                                                static_cast<size_t>(config.ai_cache_max_entries),
                                                clock);
    ctx.breaker = std::make_shared<QuotaBreaker>(config.ai_quota_cooldown_ms, clock);
    ctx.store = std::move(store);
    ctx.llm = std::move(llm);
    return ctx;
}

RateLimitOptions EdgeContext::rate_limit_options(const std::string& ns, const std::string& key) const {
    RateLimitOptions opts;
    opts.ns = ns;
    opts.key = key;
    opts.disabled = config.disable_rate_limit;
    opts.local_max_entries = static_cast<size_t>(config.rate_limit_local_max_entries);

    if (ns == "analyze") {
        opts.window_ms = config.analyze_rate_window_ms;
        opts.max_requests = config.analyze_rate_max_requests;
    } else {
        opts.window_ms = config.sync_rate_window_ms;
        opts.max_requests = config.sync_rate_max_requests;
    }
    return opts;
}
