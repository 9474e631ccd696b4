#include "config.hpp"
#include "edge_context.hpp"
#include "edge_server.hpp"
#include "kv_store.hpp"
#include "llm_client.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("edge_api", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

int main(int argc, char* argv[]) {
    curl_global_init(CURL_GLOBAL_DEFAULT);

    try {
        auto config = Config::from_env();

        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("Edge API v1.0");
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        std::shared_ptr<KvStore> store;
        std::shared_ptr<sw::redis::Redis> redis;
        if (!config.redis_url.empty()) {
            auto redis_store = std::make_shared<RedisKvStore>(config.redis_url, config.redis_timeout_ms);
            redis = redis_store->get_redis();
            store = redis_store;
        } else {
            spdlog::warn("REDIS_URL not set, using in-memory store and local rate limits");
            store = std::make_shared<MemoryKvStore>();
        }

        auto llm = std::make_shared<GeminiClient>(config.ai_api_base, config.api_key, config.ai_timeout_ms);

        EdgeContext ctx = EdgeContext::create(config, store, llm, redis);
        spdlog::info("CORS rules: {} ({})", ctx.origin_rules.size(),
                     config.cors_strict ? "strict" : "reflect");

        EdgeServer server(ctx);
        server.start();

        while (!shutdown_requested && server.is_running()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        server.stop();

        spdlog::info("Shutdown complete");
        curl_global_cleanup();
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        curl_global_cleanup();
        return 1;
    }
}
