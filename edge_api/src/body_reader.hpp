#pragma once

#include "util.hpp"
#include <string>
#include <functional>
#include <httplib.h>

enum class BodyReadStatus {
    Ok,
    TooLarge,
    TimedOut
};

struct BodyReadResult {
    BodyReadStatus status = BodyReadStatus::Ok;
    std::string body;
};

// Pulls the body through a receiver; wraps httplib::ContentReader on the server.
using BodySource = std::function<bool(const httplib::ContentReceiver&)>;

// Deferred body read with a per-endpoint byte cap. Handlers call it only after
// the request has passed the cheap gates.
using BodyFn = std::function<BodyReadResult(size_t max_bytes)>;

// Reads at most max_bytes within timeout_ms of wall-clock time. A declared
// Content-Length above the cap is rejected before any byte is read.
BodyReadResult read_body_bounded(const httplib::Request& req,
                                 const BodySource& source,
                                 size_t max_bytes,
                                 int timeout_ms,
                                 const util::ClockFn& clock = util::steady_now_ms);

// Per-recv socket timeout for a body budget. The deadline is checked as chunks
// arrive, so a trickling client holds a read for at most the budget plus this.
int socket_read_timeout_ms(int body_timeout_ms);
