#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <curl/curl.h>

struct LlmRequest {
    std::string model;
    std::string prompt;
    std::string system_instruction;
};

struct LlmResult {
    bool ok = false;
    std::string text;
    int status = 0;          // provider HTTP status, 0 when no response arrived
    bool timed_out = false;
    std::string error;
};

class LlmProvider {
public:
    virtual ~LlmProvider() = default;
    virtual LlmResult generate(const LlmRequest& request) = 0;
};

// Gemini generateContent over libcurl. Every call gets its own easy handle
// so concurrent requests never share transfer state.
class GeminiClient : public LlmProvider {
public:
    GeminiClient(const std::string& base_url, const std::string& api_key, int timeout_ms = 25000);

    GeminiClient(const GeminiClient&) = delete;
    GeminiClient& operator=(const GeminiClient&) = delete;

    LlmResult generate(const LlmRequest& request) override;

    static nlohmann::json build_request_body(const LlmRequest& request);
    static LlmResult parse_response(long http_status, const std::string& body);

private:
    std::string base_url_;
    std::string api_key_;
    int timeout_ms_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp);
};
