#include <catch2/catch_test_macros.hpp>
#include "../src/upstream_error.hpp"
#include "../src/llm_client.hpp"

namespace {

LlmResult failure(int status, const std::string& error, bool timed_out = false) {
    LlmResult r;
    r.status = status;
    r.error = error;
    r.timed_out = timed_out;
    return r;
}

} // namespace

TEST_CASE("Upstream error classification", "[upstream]") {
    SECTION("Quota by status or message") {
        REQUIRE(classify_upstream_error(failure(429, "")) == UpstreamErrorKind::Quota);
        REQUIRE(classify_upstream_error(failure(400, "RESOURCE_EXHAUSTED please retry")) == UpstreamErrorKind::Quota);
        REQUIRE(classify_upstream_error(failure(500, "Daily Quota exceeded")) == UpstreamErrorKind::Quota);
        REQUIRE(classify_upstream_error(failure(0, "Too Many Requests")) == UpstreamErrorKind::Quota);
        REQUIRE(classify_upstream_error(failure(503, "ratelimit hit")) == UpstreamErrorKind::Quota);
    }

    SECTION("Timeouts") {
        REQUIRE(classify_upstream_error(failure(0, "Timeout was reached", true)) == UpstreamErrorKind::Timeout);
        REQUIRE(classify_upstream_error(failure(504, "DEADLINE_EXCEEDED")) == UpstreamErrorKind::Timeout);
    }

    SECTION("Everything else") {
        REQUIRE(classify_upstream_error(failure(500, "INTERNAL boom")) == UpstreamErrorKind::Other);
        REQUIRE(classify_upstream_error(failure(0, "Couldn't resolve host name")) == UpstreamErrorKind::Other);
        REQUIRE(std::string(upstream_error_kind_name(UpstreamErrorKind::Quota)) == "quota");
        REQUIRE(std::string(upstream_error_kind_name(UpstreamErrorKind::Timeout)) == "timeout");
        REQUIRE(std::string(upstream_error_kind_name(UpstreamErrorKind::Other)) == "other");
    }
}

TEST_CASE("Error detail sanitizing", "[upstream]") {
    SECTION("Markup and quotes are removed") {
        REQUIRE(sanitize_error_detail("<script>alert(\"x\")</script>") == "scriptalert(x)/script");
    }

    SECTION("Control and non-ASCII bytes become spaces") {
        REQUIRE(sanitize_error_detail("line1\nline2\t\x01") == "line1 line2");
        REQUIRE(sanitize_error_detail("caf\xc3\xa9" "x") == "caf x");
    }

    SECTION("Length is bounded") {
        REQUIRE(sanitize_error_detail(std::string(500, 'x')).size() == 200);
        REQUIRE(sanitize_error_detail(std::string(50, 'x'), 10).size() == 10);

        std::string detail = std::string(199, 'x') + "\n" + "yyyy";
        REQUIRE(sanitize_error_detail(detail).size() <= 200);
        REQUIRE(sanitize_error_detail(detail) == std::string(199, 'x'));
        REQUIRE(sanitize_error_detail(std::string(200, 'x') + "\x01yy").size() == 200);
    }
}

TEST_CASE("Gemini wire format", "[llm]") {
    SECTION("Request body") {
        LlmRequest request{"gemini-2.5-flash", "hello", "be brief"};
        auto body = GeminiClient::build_request_body(request);
        REQUIRE(body["contents"][0]["role"] == "user");
        REQUIRE(body["contents"][0]["parts"][0]["text"] == "hello");
        REQUIRE(body["systemInstruction"]["parts"][0]["text"] == "be brief");
    }

    SECTION("Text parts are concatenated") {
        auto result = GeminiClient::parse_response(200,
            R"({"candidates":[{"content":{"parts":[{"text":"Hello, "},{"text":"world"}]}}]})");
        REQUIRE(result.ok);
        REQUIRE(result.text == "Hello, world");
    }

    SECTION("Error envelope carries code and status") {
        auto result = GeminiClient::parse_response(429,
            R"({"error":{"code":429,"status":"RESOURCE_EXHAUSTED","message":"Quota exceeded"}})");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.status == 429);
        REQUIRE(result.error == "RESOURCE_EXHAUSTED Quota exceeded");
        REQUIRE(classify_upstream_error(result) == UpstreamErrorKind::Quota);
    }

    SECTION("Blocked prompt is an error") {
        auto result = GeminiClient::parse_response(200,
            R"({"promptFeedback":{"blockReason":"SAFETY"}})");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.error == "Provider returned no text: SAFETY");
    }

    SECTION("Non-JSON error body") {
        auto result = GeminiClient::parse_response(502, "<html>Bad Gateway</html>");
        REQUIRE_FALSE(result.ok);
        REQUIRE(result.status == 502);
        REQUIRE(result.error == "Provider returned HTTP 502");
    }
}
