#include "push_handler.hpp"
#include "client_ip.hpp"
#include "http_util.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

const CorsRoute kPushCors{"POST, OPTIONS", "Content-Type, X-Sync-Key-Hash"};

} // namespace

bool PushHandler::is_supported_lang(const std::string& lang) {
    return lang == "pt" || lang == "en" || lang == "es";
}

bool PushHandler::admit(const std::string& request_id, const httplib::Request& req,
                        httplib::Response& res, const BodyFn& read_body,
                        std::string& key_hash, nlohmann::json& payload) {
    if (handle_cors_gate(ctx_, req, res, kPushCors)) return false;

    if (req.method != "POST") {
        send_json_error(res, 405, "Method Not Allowed");
        return false;
    }

    if (!require_key_hash(req, res, key_hash)) return false;

    std::string client_ip = get_client_ip(req);
    auto limit = ctx_.rate_limiter->check(ctx_.rate_limit_options("push", client_ip));
    if (limit.limited) {
        spdlog::info("[{}] push rate limited for {}", request_id, client_ip);
        send_throttled(res, limit.retry_after_sec, "Too Many Requests",
                       "Rate limit exceeded. Try again later.");
        return false;
    }

    auto body = read_body(ctx_.config.analyze_max_body_bytes);
    if (body.status == BodyReadStatus::TooLarge) {
        send_json_error(res, 413, "Payload Too Large");
        return false;
    }
    if (body.status == BodyReadStatus::TimedOut) {
        send_json_error(res, 408, "Request Timeout", "Request body was not received in time.");
        return false;
    }

    payload = nlohmann::json::parse(body.body, nullptr, false);
    if (payload.is_discarded() || !payload.is_object()) {
        send_json_error(res, 400, "Bad Request: Invalid JSON format");
        return false;
    }
    return true;
}

void PushHandler::handle_subscribe(const httplib::Request& req, httplib::Response& res,
                                   const BodyFn& read_body) {
    std::string request_id = util::generate_request_id();

    try {
        std::string key_hash;
        nlohmann::json payload;
        if (!admit(request_id, req, res, read_body, key_hash, payload)) return;

        auto sub = payload.find("subscription");
        auto lang = payload.find("lang");
        bool valid = sub != payload.end() && sub->is_object()
                     && sub->contains("endpoint") && (*sub)["endpoint"].is_string()
                     && !(*sub)["endpoint"].get_ref<const std::string&>().empty()
                     && lang != payload.end() && lang->is_string()
                     && is_supported_lang(lang->get<std::string>());
        if (!valid) {
            send_json_error(res, 400, "Bad Request: Invalid subscription payload");
            return;
        }

        ctx_.store->set(push_subscription_key(key_hash), payload.dump());
        spdlog::info("[{}] Push subscription stored (lang={})", request_id, lang->get<std::string>());
        send_json(res, 201, {{"success", true}});

    } catch (const std::exception& e) {
        spdlog::error("[{}] Error in /api/subscribe: {}", request_id, e.what());
        send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(e.what()));
    }
}

void PushHandler::handle_unsubscribe(const httplib::Request& req, httplib::Response& res,
                                     const BodyFn& read_body) {
    std::string request_id = util::generate_request_id();

    try {
        std::string key_hash;
        nlohmann::json payload;
        if (!admit(request_id, req, res, read_body, key_hash, payload)) return;

        auto endpoint = payload.find("endpoint");
        if (endpoint == payload.end() || !endpoint->is_string()
            || endpoint->get_ref<const std::string&>().empty()) {
            send_json_error(res, 400, "Bad Request: Missing endpoint in request body");
            return;
        }

        bool removed = ctx_.store->del(push_subscription_key(key_hash));
        spdlog::info("[{}] Push subscription {}", request_id, removed ? "removed" : "already absent");
        send_json(res, 200, {{"success", true}});

    } catch (const std::exception& e) {
        spdlog::error("[{}] Error in /api/unsubscribe: {}", request_id, e.what());
        send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(e.what()));
    }
}

void PushHandler::handle_schedules(const httplib::Request& req, httplib::Response& res,
                                   const BodyFn& read_body) {
    std::string request_id = util::generate_request_id();

    try {
        std::string key_hash;
        nlohmann::json payload;
        if (!admit(request_id, req, res, read_body, key_hash, payload)) return;

        auto schedules = payload.find("schedules");
        auto tz = payload.find("timezone");
        bool valid = schedules != payload.end() && schedules->is_array()
                     && tz != payload.end() && tz->is_string()
                     && !tz->get_ref<const std::string&>().empty();
        if (valid) {
            for (const auto& entry : *schedules) {
                if (!entry.is_string()) valid = false;
            }
        }
        if (!valid) {
            send_json_error(res, 400, "Bad Request: Invalid schedule payload");
            return;
        }

        if (schedules->empty()) {
            ctx_.store->del(schedule_key(key_hash));
            spdlog::info("[{}] Reminder schedule cleared", request_id);
        } else {
            nlohmann::json record = {{"schedules", *schedules}, {"timezone", *tz}};
            ctx_.store->set(schedule_key(key_hash), record.dump());
            spdlog::info("[{}] Reminder schedule stored ({} slots, {})", request_id,
                         schedules->size(), tz->get<std::string>());
        }
        send_json(res, 200, {{"success", true}});

    } catch (const std::exception& e) {
        spdlog::error("[{}] Error in /api/schedules: {}", request_id, e.what());
        send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(e.what()));
    }
}
