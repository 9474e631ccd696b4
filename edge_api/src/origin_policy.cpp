#include "origin_policy.hpp"
#include "util.hpp"
#include <cctype>

namespace {

const std::string kSchemeSep = "://";

bool is_label_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-';
}

// Splits "scheme://host[:port]" into its parts. Rejects paths, user-info,
// queries and fragments so nothing can hide behind the host.
bool split_origin(const std::string& origin, std::string& scheme, std::string& host) {
    auto sep = origin.find(kSchemeSep);
    if (sep == std::string::npos || sep == 0) return false;

    scheme = util::to_lower(origin.substr(0, sep));
    std::string authority = origin.substr(sep + kSchemeSep.size());
    if (authority.empty()) return false;
    if (authority.find_first_of("/@?#\\ ") != std::string::npos) return false;

    auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        std::string port = authority.substr(colon + 1);
        if (port.empty()) return false;
        for (char c : port) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        }
        authority = authority.substr(0, colon);
    }

    host = util::to_lower(authority);
    return !host.empty();
}

} // namespace

OriginRule OriginRule::parse(const std::string& raw) {
    OriginRule rule;
    rule.raw = raw;

    if (raw == "*") {
        rule.kind = OriginRuleKind::Any;
        return rule;
    }

    auto sep = raw.find(kSchemeSep + "*.");
    if (sep != std::string::npos && sep > 0) {
        std::string scheme = util::to_lower(raw.substr(0, sep));
        std::string suffix = util::to_lower(raw.substr(sep + kSchemeSep.size() + 2));
        if ((scheme == "http" || scheme == "https")
            && !suffix.empty()
            && suffix.find_first_of("*/@:?#") == std::string::npos
            && suffix.front() != '.' && suffix.find("..") == std::string::npos) {
            rule.kind = OriginRuleKind::Wildcard;
            rule.scheme = scheme;
            rule.suffix = suffix;
        }
    }

    return rule;
}

bool OriginRule::matches(const std::string& origin) const {
    if (origin.empty()) return false;

    switch (kind) {
        case OriginRuleKind::Any:
            return true;
        case OriginRuleKind::Exact:
            return !raw.empty() && origin == raw;
        case OriginRuleKind::Wildcard: {
            std::string origin_scheme;
            std::string host;
            if (!split_origin(origin, origin_scheme, host)) return false;
            if (origin_scheme != scheme) return false;

            const std::string dotted = "." + suffix;
            if (host.size() <= dotted.size()) return false;
            if (host.compare(host.size() - dotted.size(), dotted.size(), dotted) != 0) return false;

            // Exactly one DNS label in front of the suffix.
            std::string label = host.substr(0, host.size() - dotted.size());
            for (char c : label) {
                if (!is_label_char(c)) return false;
            }
            return !label.empty();
        }
    }
    return false;
}

std::vector<OriginRule> parse_allowed_origins(const std::string& raw) {
    std::vector<OriginRule> rules;
    for (const auto& item : util::split(raw, ',')) {
        std::string trimmed = util::trim(item);
        if (!trimmed.empty()) {
            rules.push_back(OriginRule::parse(trimmed));
        }
    }
    return rules;
}

bool matches_origin_rule(const std::string& origin, const std::string& rule) {
    if (rule.empty()) return false;
    return OriginRule::parse(rule).matches(origin);
}

bool is_same_deployment_origin(const httplib::Request& req, const std::string& origin) {
    if (origin.empty()) return false;

    auto sep = origin.find(kSchemeSep);
    if (sep == std::string::npos) return false;
    std::string origin_host = origin.substr(sep + kSchemeSep.size());
    if (origin_host.empty() || origin_host.find_first_of("/@?#") != std::string::npos) return false;

    std::string request_host = req.get_header_value("X-Forwarded-Host");
    if (request_host.empty()) request_host = req.get_header_value("Host");
    request_host = util::trim(request_host);

    return !request_host.empty() && util::to_lower(origin_host) == util::to_lower(request_host);
}

bool is_origin_allowed(const httplib::Request& req, const std::string& origin,
                       const std::vector<OriginRule>& rules) {
    if (rules.empty()) return true;
    if (origin.empty()) return false;
    if (is_same_deployment_origin(req, origin)) return true;

    for (const auto& rule : rules) {
        if (rule.matches(origin)) return true;
    }
    return false;
}

std::string get_cors_origin(const httplib::Request& req, const std::vector<OriginRule>& rules) {
    std::string origin = req.get_header_value("Origin");

    if (rules.empty()) {
        return origin.empty() ? "*" : origin;
    }

    return is_origin_allowed(req, origin, rules) ? origin : "null";
}
