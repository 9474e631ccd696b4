#include "upstream_error.hpp"
#include "util.hpp"
#include <algorithm>

UpstreamErrorKind classify_upstream_error(const LlmResult& result) {
    if (result.status == 429) return UpstreamErrorKind::Quota;

    static const char* quota_markers[] = {
        "resource_exhausted", "quota", "rate limit", "ratelimit", "too many requests"
    };
    for (const char* marker : quota_markers) {
        if (util::contains_ci(result.error, marker)) return UpstreamErrorKind::Quota;
    }

    if (result.timed_out || result.status == 504 || result.status == 408) {
        return UpstreamErrorKind::Timeout;
    }

    return UpstreamErrorKind::Other;
}

const char* upstream_error_kind_name(UpstreamErrorKind kind) {
    switch (kind) {
        case UpstreamErrorKind::Quota: return "quota";
        case UpstreamErrorKind::Timeout: return "timeout";
        case UpstreamErrorKind::Other: return "other";
    }
    return "other";
}

std::string sanitize_error_detail(const std::string& detail, size_t max_length) {
    std::string clean;
    clean.reserve(std::min(detail.size(), max_length));

    for (char c : detail) {
        if (clean.size() >= max_length) break;
        unsigned char uc = static_cast<unsigned char>(c);
        if (uc < 0x20 || uc >= 0x7f) {
            if (!clean.empty() && clean.back() != ' ') clean += ' ';
            continue;
        }
        switch (c) {
            case '<': case '>': case '"': case '\'': case '`': case '\\':
                continue;
            default:
                clean += c;
        }
    }

    return util::trim(clean);
}
