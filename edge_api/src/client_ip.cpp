#include "client_ip.hpp"
#include "util.hpp"

namespace {

constexpr size_t kMaxIpLength = 64;

std::string normalize_ip_candidate(const std::string& value) {
    std::string candidate = util::trim(value);
    if (candidate.size() > kMaxIpLength) {
        candidate.resize(kMaxIpLength);
    }
    return candidate;
}

} // namespace

std::string get_client_ip(const httplib::Request& req) {
    std::string platform = normalize_ip_candidate(req.get_header_value("X-Vercel-Forwarded-For"));
    if (!platform.empty()) return platform;

    std::string real_ip = normalize_ip_candidate(req.get_header_value("X-Real-IP"));
    if (!real_ip.empty()) return real_ip;

    std::string forwarded_for = req.get_header_value("X-Forwarded-For");
    if (!forwarded_for.empty()) {
        std::string last_hop;
        for (const auto& hop : util::split(forwarded_for, ',')) {
            std::string trimmed = util::trim(hop);
            if (!trimmed.empty()) last_hop = trimmed;
        }
        last_hop = normalize_ip_candidate(last_hop);
        if (!last_hop.empty()) return last_hop;
    }

    return kUnknownClientIp;
}
