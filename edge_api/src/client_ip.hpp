#pragma once

#include <string>
#include <httplib.h>

// Shared bucket for requests that carry no usable address header.
inline constexpr const char* kUnknownClientIp = "unknown";

// Most trustworthy client address: the platform-injected header, then
// X-Real-IP, then the last X-Forwarded-For hop (the first hop is whatever
// the client chose to send).
std::string get_client_ip(const httplib::Request& req);
