// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/error.hpp>
#include <rangefile/core/transport.hpp>
#include <rangefile/io/byte_source.hpp>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace rangefile::io {

// A remote resource as established by the metadata probe
struct Resource {
    std::string url;
    std::uint64_t length{0};
    bool supports_ranges{false};
    std::string content_type;
};

// Request accounting; all fields only ever grow
struct FetchMetrics {
    std::uint64_t total_bytes_fetched{0};
    std::uint64_t num_requests{0};
    std::uint64_t failed_requests{0};
};

// Uncached byte-range access to one remote resource.
//
// The transport is borrowed and must outlive the source. Safe to share
// between threads: the only mutable state is the metrics block.
class RangeSource final : public ByteSource {
public:
    // Probe `url` and return a ready source. Fails with range_unsupported if
    // the server does not advertise "Accept-Ranges: bytes"; transport errors
    // are passed through.
    [[nodiscard]] static std::expected<std::shared_ptr<RangeSource>, std::error_code>
    open(core::Transport& transport, std::string_view url) noexcept;

    RangeSource(const RangeSource&) = delete;
    RangeSource& operator=(const RangeSource&) = delete;

    // Fetch the inclusive range [start, end]. `end` past the last byte is
    // clamped to length() - 1.
    [[nodiscard]] std::expected<Bytes, std::error_code>
    fetch(std::uint64_t start, std::uint64_t end) noexcept;

    [[nodiscard]] std::expected<Bytes, std::error_code>
    get(std::uint64_t start, std::uint64_t size) noexcept override;

    [[nodiscard]] std::uint64_t length() const noexcept override { return resource_.length; }
    [[nodiscard]] const std::string& name() const noexcept override { return resource_.url; }

    [[nodiscard]] const std::string& url() const noexcept { return resource_.url; }
    [[nodiscard]] const Resource& resource() const noexcept { return resource_; }

    // Consistent snapshot of both counters
    [[nodiscard]] FetchMetrics metrics() const noexcept;

private:
    RangeSource(core::Transport& transport, Resource resource) noexcept;

    void record_success(std::uint64_t bytes) noexcept;
    void record_failure() noexcept;

    core::Transport* transport_;  // not owned
    const Resource resource_;

    FetchMetrics metrics_;
    mutable std::mutex metrics_mutex_;
};

} // namespace rangefile::io
