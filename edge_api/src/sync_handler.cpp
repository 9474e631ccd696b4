#include "sync_handler.hpp"
#include "client_ip.hpp"
#include "http_util.hpp"
#include "upstream_error.hpp"
#include "util.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace {

const CorsRoute kSyncCors{"GET, POST, OPTIONS", "Content-Type, X-Sync-Key-Hash"};

} // namespace

void SyncHandler::handle(const httplib::Request& req, httplib::Response& res,
                         const BodyFn& read_body) {
    std::string request_id = util::generate_request_id();

    try {
        if (handle_cors_gate(ctx_, req, res, kSyncCors)) return;

        if (req.method != "GET" && req.method != "POST") {
            send_json_error(res, 405, "Method Not Allowed");
            return;
        }

        std::string key_hash;
        if (!require_key_hash(req, res, key_hash)) return;

        std::string client_ip = get_client_ip(req);
        auto limit = ctx_.rate_limiter->check(ctx_.rate_limit_options("sync", client_ip));
        if (limit.limited) {
            spdlog::info("[{}] sync rate limited for {}", request_id, client_ip);
            send_throttled(res, limit.retry_after_sec, "Too Many Requests",
                           "Rate limit exceeded. Try again later.");
            return;
        }

        if (req.method == "GET") {
            handle_get(key_hash, res);
        } else {
            handle_post(key_hash, res, read_body);
        }

    } catch (const std::exception& e) {
        spdlog::error("[{}] Critical error in /api/sync: {}", request_id, e.what());
        send_json_error(res, 500, "Internal Server Error", sanitize_error_detail(e.what()));
    }
}

void SyncHandler::handle_get(const std::string& key_hash, httplib::Response& res) {
    auto stored = ctx_.store->get(sync_data_key(key_hash));
    res.status = 200;
    res.set_content(stored ? *stored : "null", "application/json");
}

void SyncHandler::handle_post(const std::string& key_hash, httplib::Response& res,
                              const BodyFn& read_body) {
    const size_t max_bytes = ctx_.config.sync_max_payload_bytes;
    const std::string too_large = fmt::format("Payload size exceeds the limit of {} bytes.", max_bytes);

    auto body = read_body(max_bytes);
    if (body.status == BodyReadStatus::TooLarge) {
        send_json_error(res, 413, "Payload Too Large", too_large);
        return;
    }
    if (body.status == BodyReadStatus::TimedOut) {
        send_json_error(res, 408, "Request Timeout", "Request body was not received in time.");
        return;
    }

    nlohmann::json payload = nlohmann::json::parse(body.body, nullptr, false);
    if (payload.is_discarded()) {
        send_json_error(res, 400, "Bad Request: Invalid JSON format");
        return;
    }

    if (!payload.is_object()
        || !payload.contains("lastModified") || !payload["lastModified"].is_number()
        || !payload.contains("state") || !payload["state"].is_string()) {
        send_json_error(res, 400, "Bad Request: Invalid or missing payload data");
        return;
    }

    if (payload["state"].get_ref<const std::string&>().size() > max_bytes) {
        send_json_error(res, 413, "Payload Too Large", too_large);
        return;
    }

    nlohmann::json record = {
        {"lastModified", payload["lastModified"]},
        {"state", payload["state"]}
    };

    std::string conflict_value;
    SyncOutcome outcome = compare_and_store(sync_data_key(key_hash),
                                            payload["lastModified"].get<double>(),
                                            record.dump(), conflict_value);

    switch (outcome) {
        case SyncOutcome::Written:
            send_json(res, 200, {{"success", true}});
            break;
        case SyncOutcome::NotModified:
            res.status = 304;
            break;
        case SyncOutcome::Conflict:
            res.status = 409;
            res.set_content(conflict_value, "application/json");
            break;
    }
}

SyncOutcome SyncHandler::compare_and_store(const std::string& key, double last_modified,
                                           const std::string& payload, std::string& conflict_value) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    auto current = ctx_.store->get(key);
    if (current) {
        nlohmann::json stored = nlohmann::json::parse(*current, nullptr, false);
        if (stored.is_discarded()) {
            spdlog::warn("Overwriting corrupt sync record {}", key.substr(0, 24));
        } else if (stored.is_object() && stored.contains("lastModified")
                   && stored["lastModified"].is_number()) {
            double current_ts = stored["lastModified"].get<double>();
            if (last_modified == current_ts) return SyncOutcome::NotModified;
            if (last_modified < current_ts) {
                conflict_value = *current;
                return SyncOutcome::Conflict;
            }
        }
    }

    ctx_.store->set(key, payload);
    return SyncOutcome::Written;
}
