#pragma once

#include "edge_context.hpp"
#include "body_reader.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

// Web-push subscription and reminder schedule records stored under the
// client's key hash.
class PushHandler {
public:
    explicit PushHandler(EdgeContext& ctx) : ctx_(ctx) {}

    void handle_subscribe(const httplib::Request& req, httplib::Response& res, const BodyFn& read_body);
    void handle_unsubscribe(const httplib::Request& req, httplib::Response& res, const BodyFn& read_body);
    // Reminder times of day; an empty list clears them.
    void handle_schedules(const httplib::Request& req, httplib::Response& res, const BodyFn& read_body);

    static bool is_supported_lang(const std::string& lang);

private:
    EdgeContext& ctx_;

    // Shared gates for both endpoints. On success key_hash and payload are
    // filled and the response is untouched.
    bool admit(const std::string& request_id, const httplib::Request& req, httplib::Response& res,
               const BodyFn& read_body, std::string& key_hash, nlohmann::json& payload);
};
