#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <httplib.h>

struct EdgeContext;

struct CorsRoute {
    const char* methods;
    const char* allowed_headers;
};

void apply_cors(httplib::Response& res, const std::string& allow_origin, const CorsRoute& route);

void send_json(httplib::Response& res, int status, const nlohmann::json& body);
void send_json_error(httplib::Response& res, int status, const std::string& error,
                     const std::string& details = "");
void send_text(httplib::Response& res, int status, const std::string& text);
void send_throttled(httplib::Response& res, int retry_after_sec, const std::string& error,
                    const std::string& details = "");

// CORS headers, strict-origin rejection and preflight. Returns true when the
// response is already final.
bool handle_cors_gate(const EdgeContext& ctx, const httplib::Request& req,
                      httplib::Response& res, const CorsRoute& route);

// Reads X-Sync-Key-Hash into key_hash; answers 401 and returns false when it
// is missing or malformed.
bool require_key_hash(const httplib::Request& req, httplib::Response& res, std::string& key_hash);
