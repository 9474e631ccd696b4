#include "http_util.hpp"
#include "edge_context.hpp"
#include "origin_policy.hpp"
#include "upstream_error.hpp"
#include "kv_store.hpp"
#include <spdlog/spdlog.h>

void apply_cors(httplib::Response& res, const std::string& allow_origin, const CorsRoute& route) {
    res.set_header("Access-Control-Allow-Origin", allow_origin);
    res.set_header("Access-Control-Allow-Methods", route.methods);
    res.set_header("Access-Control-Allow-Headers", route.allowed_headers);
    res.set_header("Vary", "Origin");
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void send_json_error(httplib::Response& res, int status, const std::string& error,
                     const std::string& details) {
    send_json(res, status, {{"error", error}, {"details", details}});
}

void send_text(httplib::Response& res, int status, const std::string& text) {
    res.status = status;
    res.set_content(text, "text/plain; charset=utf-8");
}

void send_throttled(httplib::Response& res, int retry_after_sec, const std::string& error,
                    const std::string& details) {
    res.set_header("Retry-After", std::to_string(retry_after_sec));
    send_json_error(res, 429, error, details);
}

bool handle_cors_gate(const EdgeContext& ctx, const httplib::Request& req,
                      httplib::Response& res, const CorsRoute& route) {
    apply_cors(res, get_cors_origin(req, ctx.origin_rules), route);

    if (ctx.config.cors_strict && !ctx.origin_rules.empty()) {
        std::string origin = req.get_header_value("Origin");
        if (!is_origin_allowed(req, origin, ctx.origin_rules)) {
            spdlog::warn("Rejected origin '{}' on {} {}",
                         sanitize_error_detail(origin, 100), req.method, req.path);
            send_json_error(res, 403, "Forbidden", "Origin not allowed");
            return true;
        }
    }

    if (req.method == "OPTIONS") {
        res.status = 204;
        return true;
    }

    return false;
}

bool require_key_hash(const httplib::Request& req, httplib::Response& res, std::string& key_hash) {
    if (!req.has_header("X-Sync-Key-Hash")) {
        send_json_error(res, 401, "Unauthorized: Missing sync key hash");
        return false;
    }
    key_hash = req.get_header_value("X-Sync-Key-Hash");
    if (!is_valid_key_hash(key_hash)) {
        send_json_error(res, 401, "Unauthorized: Invalid sync key hash");
        return false;
    }
    return true;
}
