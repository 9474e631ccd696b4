#include "llm_client.hpp"
#include <spdlog/spdlog.h>
#include <memory>
#include <stdexcept>

GeminiClient::GeminiClient(const std::string& base_url, const std::string& api_key, int timeout_ms)
    : base_url_(base_url)
    , api_key_(api_key)
    , timeout_ms_(timeout_ms)
{}

size_t GeminiClient::write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), size * nmemb);
    return size * nmemb;
}

nlohmann::json GeminiClient::build_request_body(const LlmRequest& request) {
    return {
        {"contents", nlohmann::json::array({
            {{"role", "user"}, {"parts", nlohmann::json::array({{{"text", request.prompt}}})}}
        })},
        {"systemInstruction", {
            {"parts", nlohmann::json::array({{{"text", request.system_instruction}}})}
        }}
    };
}

LlmResult GeminiClient::parse_response(long http_status, const std::string& body) {
    LlmResult result;
    result.status = static_cast<int>(http_status);

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(body);
    } catch (const std::exception& e) {
        result.error = http_status >= 400
            ? "Provider returned HTTP " + std::to_string(http_status)
            : std::string("Failed to parse provider response: ") + e.what();
        return result;
    }

    if (http_status >= 400 || json.contains("error")) {
        const auto& err = json.value("error", nlohmann::json::object());
        if (err.is_object()) {
            if (err.contains("code") && err["code"].is_number_integer()) {
                result.status = err["code"].get<int>();
            }
            result.error = err.value("status", "") + " " + err.value("message", "");
        }
        if (result.error.empty() || result.error == " ") {
            result.error = "Provider returned HTTP " + std::to_string(http_status);
        }
        return result;
    }

    if (json.contains("candidates") && json["candidates"].is_array() && !json["candidates"].empty()) {
        const auto& content = json["candidates"][0].value("content", nlohmann::json::object());
        if (content.contains("parts") && content["parts"].is_array()) {
            for (const auto& part : content["parts"]) {
                if (part.contains("text") && part["text"].is_string()) {
                    result.text += part["text"].get<std::string>();
                }
            }
        }
    }

    if (result.text.empty()) {
        std::string reason = "no candidates";
        if (json.contains("promptFeedback")) {
            reason = json["promptFeedback"].value("blockReason", reason);
        }
        result.error = "Provider returned no text: " + reason;
        return result;
    }

    result.ok = true;
    return result;
}

LlmResult GeminiClient::generate(const LlmRequest& request) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
    if (!curl) {
        throw std::runtime_error("Failed to initialize CURL for Gemini");
    }

    std::string url = base_url_ + "/models/" + request.model + ":generateContent";
    std::string payload = build_request_body(request).dump();
    std::string response_string;

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(nullptr, curl_slist_free_all);
    curl_slist* list = curl_slist_append(nullptr, "Content-Type: application/json");
    list = curl_slist_append(list, ("x-goog-api-key: " + api_key_).c_str());
    headers.reset(list);

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_string);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms_));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    CURLcode res = curl_easy_perform(curl.get());

    if (res != CURLE_OK) {
        LlmResult result;
        result.timed_out = res == CURLE_OPERATION_TIMEDOUT;
        result.error = curl_easy_strerror(res);
        spdlog::error("Gemini request failed: {}", result.error);
        return result;
    }

    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

    return parse_response(http_status, response_string);
}
