#include "analyze_handler.hpp"
#include "client_ip.hpp"
#include "http_util.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

const CorsRoute kAnalyzeCors{"POST, OPTIONS", "Content-Type"};

} // namespace

void AnalyzeHandler::handle(const httplib::Request& req, httplib::Response& res,
                            const BodyFn& read_body) {
    std::string request_id = util::generate_request_id();

    try {
        if (handle_cors_gate(ctx_, req, res, kAnalyzeCors)) return;

        if (req.method != "POST") {
            send_json_error(res, 405, "Method Not Allowed");
            return;
        }

        std::string client_ip = get_client_ip(req);
        auto limit = ctx_.rate_limiter->check(ctx_.rate_limit_options("analyze", client_ip));
        if (limit.limited) {
            spdlog::info("[{}] analyze rate limited for {}", request_id, client_ip);
            send_throttled(res, limit.retry_after_sec, "Too Many Requests",
                           "Rate limit exceeded. Try again later.");
            return;
        }

        auto body = read_body(ctx_.config.analyze_max_body_bytes);
        if (body.status == BodyReadStatus::TooLarge) {
            send_json_error(res, 413, "Payload Too Large",
                            fmt::format("Request body exceeds {} bytes.", ctx_.config.analyze_max_body_bytes));
            return;
        }
        if (body.status == BodyReadStatus::TimedOut) {
            send_json_error(res, 408, "Request Timeout", "Request body was not received in time.");
            return;
        }

        nlohmann::json payload = nlohmann::json::parse(body.body, nullptr, false);
        if (payload.is_discarded() || !payload.is_object()) {
            send_json_error(res, 400, "Bad Request: Invalid JSON format");
            return;
        }

        auto prompt = payload.find("prompt");
        auto system = payload.find("systemInstruction");
        if (prompt == payload.end() || !prompt->is_string() || prompt->get<std::string>().empty()
            || system == payload.end() || !system->is_string() || system->get<std::string>().empty()) {
            send_json_error(res, 400, "Bad Request: Missing prompt or systemInstruction");
            return;
        }

        LlmRequest llm_request;
        llm_request.model = ctx_.config.ai_model;
        llm_request.prompt = prompt->get<std::string>();
        llm_request.system_instruction = system->get<std::string>();

        std::string cache_key = ResponseCache::make_key(
            llm_request.model, llm_request.prompt, llm_request.system_instruction);

        if (auto cached = ctx_.cache->get(cache_key)) {
            spdlog::debug("[{}] analyze cache hit {}", request_id, cache_key.substr(0, 12));
            res.set_header("X-Cache", "HIT");
            send_text(res, 200, *cached);
            return;
        }

        if (auto retry_after = ctx_.breaker->retry_after_sec()) {
            spdlog::info("[{}] analyze short-circuited, provider cooling down for {}s",
                         request_id, *retry_after);
            send_throttled(res, *retry_after, "Too Many Requests",
                           "AI quota temporarily exhausted. Try again later.");
            return;
        }

        if (ctx_.config.api_key.empty() || !ctx_.llm) {
            spdlog::error("[{}] API_KEY environment variable not set", request_id);
            send_json_error(res, 500, "Internal Server Error", "Server configuration error.");
            return;
        }

        call_provider(request_id, cache_key, llm_request, res);

    } catch (const std::exception& e) {
        spdlog::error("[{}] Critical error in /api/analyze handler: {}", request_id, e.what());
        send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(e.what()));
    }
}

void AnalyzeHandler::call_provider(const std::string& request_id, const std::string& cache_key,
                                   const LlmRequest& llm_request, httplib::Response& res) {
    LlmResult result = ctx_.llm->generate(llm_request);

    if (result.ok) {
        ctx_.breaker->record_success();
        ctx_.cache->set(cache_key, result.text);
        res.set_header("X-Cache", "MISS");
        send_text(res, 200, result.text);
        return;
    }

    UpstreamErrorKind kind = classify_upstream_error(result);
    spdlog::error("[{}] Provider call failed ({}, status {}): {}", request_id,
                  upstream_error_kind_name(kind), result.status, result.error);

    switch (kind) {
        case UpstreamErrorKind::Quota: {
            int retry_after = ctx_.breaker->trip();
            send_throttled(res, retry_after, "Too Many Requests",
                           "AI quota temporarily exhausted. Try again later.");
            break;
        }
        case UpstreamErrorKind::Timeout:
            send_json_error(res, 504, "Gateway Timeout", "AI provider did not respond in time.");
            break;
        case UpstreamErrorKind::Other:
            send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(result.error));
            break;
    }
}
