// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <rangefile/io/range_source.hpp>
#include "fake_transport.hpp"

using namespace rangefile;
using namespace rangefile::io;
using rangefile::core::ReadErrc;
using rangefile::test::FakeTransport;
using rangefile::test::pattern_bytes;

TEST_CASE("RangeSource::open", "[source]") {
    SECTION("Metadata establishes the resource") {
        FakeTransport transport(5000);
        auto source = RangeSource::open(transport, "https://example.com/blob.bin");
        REQUIRE(source.has_value());

        const auto& src = **source;
        CHECK(src.length() == 5000);
        CHECK(src.url() == "https://example.com/blob.bin");
        CHECK(src.name() == src.url());
        CHECK(src.resource().supports_ranges);
        CHECK(transport.probe_count() == 1);
        CHECK(transport.fetch_count() == 0);
    }

    SECTION("No range support is fatal") {
        FakeTransport transport(5000, false);
        auto source = RangeSource::open(transport, "https://example.com/blob.bin");
        REQUIRE_FALSE(source.has_value());
        CHECK(source.error() == ReadErrc::range_unsupported);
    }

    SECTION("Metadata failure propagates unchanged") {
        FakeTransport transport(5000);
        transport.fail_probe(core::make_error_code(ReadErrc::not_found));
        auto source = RangeSource::open(transport, "https://example.com/missing");
        REQUIRE_FALSE(source.has_value());
        CHECK(source.error() == ReadErrc::not_found);
    }

    SECTION("Invalid URL never reaches the transport") {
        FakeTransport transport(5000);
        auto source = RangeSource::open(transport, "not a url");
        REQUIRE_FALSE(source.has_value());
        CHECK(source.error() == ReadErrc::invalid_url);
        CHECK(transport.probe_count() == 0);
    }
}

TEST_CASE("RangeSource::fetch", "[source]") {
    FakeTransport transport(1000);
    auto source = *RangeSource::open(transport, "http://example.com/r");

    SECTION("Exact inclusive range") {
        auto bytes = source->fetch(100, 199);
        REQUIRE(bytes.has_value());
        CHECK(bytes->size() == 100);
        CHECK(*bytes == pattern_bytes(100, 100));
    }

    SECTION("End past the resource is clamped") {
        auto bytes = source->fetch(990, 5000);
        REQUIRE(bytes.has_value());
        CHECK(bytes->size() == 10);
        REQUIRE(transport.calls().size() == 1);
        CHECK(transport.calls()[0] == std::pair<std::uint64_t, std::uint64_t>{990, 999});
    }

    SECTION("Start at or past the end is rejected without a request") {
        CHECK(source->fetch(1000, 1010).error() == ReadErrc::invalid_range);
        CHECK(source->fetch(10, 5).error() == ReadErrc::invalid_range);
        CHECK(transport.fetch_count() == 0);
    }

    SECTION("Transport failure propagates and is counted") {
        transport.fail_next(1, core::make_error_code(ReadErrc::server_error));
        auto bytes = source->fetch(0, 9);
        REQUIRE_FALSE(bytes.has_value());
        CHECK(bytes.error() == ReadErrc::server_error);

        auto m = source->metrics();
        CHECK(m.num_requests == 0);
        CHECK(m.total_bytes_fetched == 0);
        CHECK(m.failed_requests == 1);
    }

    SECTION("Wrong byte count is a short read") {
        transport.truncate_by(3);
        auto bytes = source->fetch(0, 99);
        REQUIRE_FALSE(bytes.has_value());
        CHECK(bytes.error() == ReadErrc::short_read);
    }
}

TEST_CASE("RangeSource metrics", "[source]") {
    FakeTransport transport(1000);
    auto source = *RangeSource::open(transport, "http://example.com/r");

    REQUIRE(source->fetch(0, 99).has_value());
    REQUIRE(source->fetch(900, 2000).has_value());
    REQUIRE(source->get(500, 0).has_value());

    auto m = source->metrics();
    CHECK(m.num_requests == 2);
    CHECK(m.total_bytes_fetched == 200);
    CHECK(m.failed_requests == 0);
}

TEST_CASE("RangeSource::get", "[source]") {
    FakeTransport transport(1000);
    auto source = *RangeSource::open(transport, "http://example.com/r");

    SECTION("Zero size is empty and free") {
        auto bytes = source->get(10, 0);
        REQUIRE(bytes.has_value());
        CHECK(bytes->empty());
        CHECK(transport.fetch_count() == 0);
    }

    SECTION("Maps to an inclusive fetch") {
        auto bytes = source->get(10, 20);
        REQUIRE(bytes.has_value());
        CHECK(*bytes == pattern_bytes(10, 20));
        CHECK(transport.calls()[0] == std::pair<std::uint64_t, std::uint64_t>{10, 29});
    }

    SECTION("Window past the end is invalid") {
        CHECK(source->get(995, 10).error() == ReadErrc::invalid_range);
    }
}
