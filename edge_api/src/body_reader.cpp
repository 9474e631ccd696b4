#include "body_reader.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

BodyReadResult read_body_bounded(const httplib::Request& req,
                                 const BodySource& source,
                                 size_t max_bytes,
                                 int timeout_ms,
                                 const util::ClockFn& clock) {
    BodyReadResult result;

    std::string content_length = util::trim(req.get_header_value("Content-Length"));
    if (!content_length.empty()) {
        try {
            if (std::stoull(content_length) > max_bytes) {
                result.status = BodyReadStatus::TooLarge;
                return result;
            }
        } catch (const std::exception&) {
            result.status = BodyReadStatus::TooLarge;
            return result;
        }
    }

    const int64_t deadline = clock() + timeout_ms;
    bool too_large = false;
    bool timed_out = false;

    bool ok = source([&](const char* data, size_t len) {
        if (clock() > deadline) {
            timed_out = true;
            return false;
        }
        if (result.body.size() + len > max_bytes) {
            too_large = true;
            return false;
        }
        result.body.append(data, len);
        return true;
    });

    if (too_large) {
        result.status = BodyReadStatus::TooLarge;
        result.body.clear();
    } else if (timed_out || !ok || clock() > deadline) {
        // A failed read is the socket read timeout or a client that went away.
        spdlog::debug("Body read aborted after {} bytes", result.body.size());
        result.status = BodyReadStatus::TimedOut;
        result.body.clear();
    }

    return result;
}

int socket_read_timeout_ms(int body_timeout_ms) {
    return std::max(1, std::min(body_timeout_ms, std::max(250, body_timeout_ms / 4)));
}
