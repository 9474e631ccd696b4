#pragma once

#include <string>
#include <vector>
#include <httplib.h>

enum class OriginRuleKind {
    Exact,
    Wildcard,   // scheme://*.suffix
    Any         // *
};

struct OriginRule {
    OriginRuleKind kind = OriginRuleKind::Exact;
    std::string raw;
    std::string scheme;   // lowercased, wildcard rules only
    std::string suffix;   // lowercased host suffix, wildcard rules only

    static OriginRule parse(const std::string& raw);
    bool matches(const std::string& origin) const;
};

std::vector<OriginRule> parse_allowed_origins(const std::string& raw);

bool matches_origin_rule(const std::string& origin, const std::string& rule);

bool is_same_deployment_origin(const httplib::Request& req, const std::string& origin);

bool is_origin_allowed(const httplib::Request& req, const std::string& origin,
                       const std::vector<OriginRule>& rules);

// Value for Access-Control-Allow-Origin: the request origin when allowed,
// "null" when a rule list exists and the origin fails it.
std::string get_cors_origin(const httplib::Request& req, const std::vector<OriginRule>& rules);
