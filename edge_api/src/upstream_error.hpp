#pragma once

#include "llm_client.hpp"
#include <string>

enum class UpstreamErrorKind {
    Quota,
    Timeout,
    Other
};

// Single place that decides how a failed provider call is treated.
UpstreamErrorKind classify_upstream_error(const LlmResult& result);

const char* upstream_error_kind_name(UpstreamErrorKind kind);

// Bounded, printable-ASCII, markup-free version of an error text that may be echoed to clients.
std::string sanitize_error_detail(const std::string& detail, size_t max_length = 200);
