// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangefile/core/url.hpp>

using namespace rangefile::core;

TEST_CASE("Url::parse - valid URLs", "[url]") {
    SECTION("HTTPS URL") {
        auto result = Url::parse("https://example.com/data/archive.bin");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
        CHECK(result->host() == "example.com");
        CHECK(result->path() == "/data/archive.bin");
        CHECK(result->port().empty());
    }

    SECTION("HTTP URL with port") {
        auto result = Url::parse("http://example.com:8080/path");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "http");
        CHECK(result->port() == "8080");
    }

    SECTION("Scheme is case-insensitive") {
        auto result = Url::parse("HTTPS://example.com/x");
        REQUIRE(result.has_value());
        CHECK(result->scheme() == "https");
    }

    SECTION("Query and fragment") {
        auto result = Url::parse("https://example.com/file.zip?v=1#section");
        REQUIRE(result.has_value());
        CHECK(result->path() == "/file.zip");
        CHECK(result->query() == "v=1");
    }

    SECTION("No path") {
        auto result = Url::parse("https://example.com?x=/y");
        REQUIRE(result.has_value());
        CHECK(result->host() == "example.com");
        CHECK(result->path() == "/");
        CHECK(result->query() == "x=/y");
    }

    SECTION("IPv6 host with port and userinfo") {
        auto result = Url::parse("http://user:pw@[::1]:9000/blob");
        REQUIRE(result.has_value());
        CHECK(result->host() == "[::1]");
        CHECK(result->port() == "9000");
        CHECK(result->path() == "/blob");
    }

    SECTION("full() keeps the input text verbatim") {
        const std::string text = "https://cdn.example.com/a%20b/file.bin?sig=abc";
        auto result = Url::parse(text);
        REQUIRE(result.has_value());
        CHECK(result->full() == text);
    }
}

TEST_CASE("Url::parse - invalid URLs", "[url]") {
    CHECK_FALSE(Url::parse("").has_value());
    CHECK_FALSE(Url::parse("example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("ftp://example.com/file.zip").has_value());
    CHECK_FALSE(Url::parse("https:///nohost").has_value());
    CHECK_FALSE(Url::parse("http://example.com:http/").has_value());
    CHECK_FALSE(Url::parse("http://example.com:70000/").has_value());
    CHECK_FALSE(Url::parse("http://[::1/").has_value());

    auto result = Url::parse("file:///etc/passwd");
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error() == ReadErrc::invalid_url);
}
