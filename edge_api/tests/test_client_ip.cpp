#include <catch2/catch_test_macros.hpp>
#include "../src/client_ip.hpp"

TEST_CASE("Client IP resolution", "[client_ip]") {
    SECTION("Last forwarded hop is used") {
        httplib::Request req;
        req.set_header("X-Forwarded-For", "1.2.3.4, 203.0.113.10");
        REQUIRE(get_client_ip(req) == "203.0.113.10");
    }

    SECTION("Empty trailing hops are skipped") {
        httplib::Request req;
        req.set_header("X-Forwarded-For", "1.2.3.4, 203.0.113.10, ");
        REQUIRE(get_client_ip(req) == "203.0.113.10");
    }

    SECTION("Platform header wins") {
        httplib::Request req;
        req.set_header("X-Vercel-Forwarded-For", "192.0.2.1");
        req.set_header("X-Real-IP", "192.0.2.2");
        req.set_header("X-Forwarded-For", "192.0.2.3");
        REQUIRE(get_client_ip(req) == "192.0.2.1");
    }

    SECTION("Real IP beats forwarded-for") {
        httplib::Request req;
        req.set_header("X-Real-IP", " 192.0.2.2 ");
        req.set_header("X-Forwarded-For", "192.0.2.3");
        REQUIRE(get_client_ip(req) == "192.0.2.2");
    }

    SECTION("No headers share one bucket") {
        httplib::Request req;
        REQUIRE(get_client_ip(req) == kUnknownClientIp);
    }

    SECTION("Oversized values are truncated") {
        httplib::Request req;
        req.set_header("X-Real-IP", std::string(200, 'a'));
        REQUIRE(get_client_ip(req).size() == 64);
    }
}
