// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangefile/core/http_session.hpp>

using namespace rangefile::core;

// No network here: only the pieces of HttpSession that do not perform requests

TEST_CASE("HttpSession::status_error", "[http]") {
    CHECK_FALSE(HttpSession::status_error(200));
    CHECK_FALSE(HttpSession::status_error(206));
    CHECK_FALSE(HttpSession::status_error(304));
    CHECK(HttpSession::status_error(404) == ReadErrc::not_found);
    CHECK(HttpSession::status_error(410) == ReadErrc::not_found);
    CHECK(HttpSession::status_error(401) == ReadErrc::permission_denied);
    CHECK(HttpSession::status_error(403) == ReadErrc::permission_denied);
    CHECK(HttpSession::status_error(416) == ReadErrc::invalid_range);
    CHECK(HttpSession::status_error(503) == ReadErrc::server_error);
    CHECK(HttpSession::status_error(418) == ReadErrc::network_error);
}

TEST_CASE("HttpSession::classify_range_response", "[http]") {
    SECTION("206 with the exact byte count") {
        CHECK_FALSE(HttpSession::classify_range_response(206, 100, 50, 50, false));
        CHECK_FALSE(HttpSession::classify_range_response(206, 0, 1, 1, false));
    }

    SECTION("206 with a short or long body") {
        CHECK(HttpSession::classify_range_response(206, 100, 49, 50, false) == ReadErrc::short_read);
        CHECK(HttpSession::classify_range_response(206, 100, 0, 50, false) == ReadErrc::short_read);
        CHECK(HttpSession::classify_range_response(206, 100, 50, 50, true) == ReadErrc::short_read);
    }

    SECTION("200 only for the whole resource from offset 0") {
        CHECK_FALSE(HttpSession::classify_range_response(200, 0, 50, 50, false));
        CHECK(HttpSession::classify_range_response(200, 10, 50, 50, false) == ReadErrc::short_read);
        CHECK(HttpSession::classify_range_response(200, 0, 40, 50, false) == ReadErrc::short_read);
    }

    SECTION("Server that ignores the range overflows the body") {
        CHECK(HttpSession::classify_range_response(200, 0, 50, 50, true) == ReadErrc::short_read);
        CHECK(HttpSession::classify_range_response(200, 4096, 10, 10, true) == ReadErrc::short_read);
    }

    SECTION("HTTP errors win over body checks") {
        CHECK(HttpSession::classify_range_response(416, 100, 0, 50, false) == ReadErrc::invalid_range);
        CHECK(HttpSession::classify_range_response(416, 0, 1, 1, true) == ReadErrc::invalid_range);
        CHECK(HttpSession::classify_range_response(404, 0, 50, 50, false) == ReadErrc::not_found);
        CHECK(HttpSession::classify_range_response(503, 0, 50, 50, false) == ReadErrc::server_error);
    }

    SECTION("Other success codes are not a range reply") {
        CHECK(HttpSession::classify_range_response(204, 0, 0, 1, false) == ReadErrc::short_read);
        CHECK(HttpSession::classify_range_response(302, 0, 50, 50, false) == ReadErrc::short_read);
    }
}

TEST_CASE("HttpSession::parse_length", "[http]") {
    std::uint64_t n = 0;
    CHECK(HttpSession::parse_length("10000000", n));
    CHECK(n == 10'000'000);
    CHECK(HttpSession::parse_length("0", n));
    CHECK(n == 0);

    CHECK_FALSE(HttpSession::parse_length("", n));
    CHECK_FALSE(HttpSession::parse_length("12abc", n));
    CHECK_FALSE(HttpSession::parse_length("-1", n));
    CHECK_FALSE(HttpSession::parse_length("99999999999999999999999", n));
}

TEST_CASE("HttpSession options", "[http]") {
    SECTION("Default user agent carries the version") {
        HttpSession session;
        CHECK(session.options().user_agent.starts_with("rangefile/"));
        CHECK(session.options().max_redirects == MAX_REDIRECTS);
    }

    SECTION("Explicit options are kept") {
        TransportOptions opts;
        opts.user_agent = "custom/1.0";
        opts.verify_tls = false;
        HttpSession session(opts);
        CHECK(session.options().user_agent == "custom/1.0");
        CHECK_FALSE(session.options().verify_tls);
    }

    SECTION("Inverted range is rejected before any request") {
        HttpSession session;
        auto bytes = session.fetch_range("http://127.0.0.1:1/x", 10, 5);
        REQUIRE_FALSE(bytes.has_value());
        CHECK(bytes.error() == ReadErrc::invalid_range);
    }
}
