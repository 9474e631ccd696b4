#pragma once

#include "edge_context.hpp"
#include "body_reader.hpp"
#include <httplib.h>
#include <mutex>
#include <string>

enum class SyncOutcome {
    Written,
    NotModified,
    Conflict
};

// Last-write-wins store for the encrypted client state, keyed by the
// client's key hash.
class SyncHandler {
public:
    explicit SyncHandler(EdgeContext& ctx) : ctx_(ctx) {}

    void handle(const httplib::Request& req, httplib::Response& res, const BodyFn& read_body);

private:
    EdgeContext& ctx_;
    std::mutex write_mutex_;

    void handle_get(const std::string& key_hash, httplib::Response& res);
    void handle_post(const std::string& key_hash, httplib::Response& res, const BodyFn& read_body);

    // Read-compare-write on one key. conflict_value receives the stored
    // record on Conflict.
    SyncOutcome compare_and_store(const std::string& key, double last_modified,
                                  const std::string& payload, std::string& conflict_value);
};
