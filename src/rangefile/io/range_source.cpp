// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/io/range_source.hpp>
#include <rangefile/core/url.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

namespace rangefile::io {

//=============================================================================
// RangeSource
//=============================================================================

RangeSource::RangeSource(core::Transport& transport, Resource resource) noexcept
    : transport_(&transport)
    , resource_(std::move(resource)) {}

std::expected<std::shared_ptr<RangeSource>, std::error_code>
RangeSource::open(core::Transport& transport, std::string_view url) noexcept {
    auto parsed = core::Url::parse(url);
    if (!parsed) {
        spdlog::error("Rejected URL '{}': {}", url, parsed.error().message());
        return std::unexpected(parsed.error());
    }

    auto info = transport.probe_metadata(parsed->full());
    if (!info) {
        spdlog::error("Probe of {} failed: {}", parsed->full(), info.error().message());
        return std::unexpected(info.error());
    }

    if (!info->accepts_ranges) {
        spdlog::error("{} does not support range requests", parsed->full());
        return std::unexpected(core::make_error_code(core::ReadErrc::range_unsupported));
    }

    try {
        Resource resource{parsed->full(), info->length, info->accepts_ranges, std::move(info->content_type)};
        spdlog::debug("Opened {} ({} bytes)", resource.url, resource.length);
        return std::shared_ptr<RangeSource>(new RangeSource(transport, std::move(resource)));
    } catch (const std::bad_alloc&) {
        return std::unexpected(core::make_error_code(core::ReadErrc::out_of_memory));
    }
}

std::expected<Bytes, std::error_code>
RangeSource::fetch(std::uint64_t start, std::uint64_t end) noexcept {
    if (start >= resource_.length || start > end) {
        return std::unexpected(core::make_error_code(core::ReadErrc::invalid_range));
    }

    end = std::min(end, resource_.length - 1);
    const std::uint64_t expected_size = end - start + 1;

    auto bytes = transport_->fetch_range(resource_.url, start, end);
    if (!bytes) {
        record_failure();
        spdlog::debug("fetch {}-{} of {} failed: {}", start, end, resource_.url, bytes.error().message());
        return std::unexpected(bytes.error());
    }

    if (bytes->size() != expected_size) {
        record_failure();
        spdlog::warn("fetch {}-{} of {} returned {} bytes, expected {}",
                     start, end, resource_.url, bytes->size(), expected_size);
        return std::unexpected(core::make_error_code(core::ReadErrc::short_read));
    }

    record_success(expected_size);
    spdlog::trace("fetch {}-{} of {} ({} bytes)", start, end, resource_.url, expected_size);
    return bytes;
}

std::expected<Bytes, std::error_code>
RangeSource::get(std::uint64_t start, std::uint64_t size) noexcept {
    if (size == 0) {
        return Bytes{};
    }
    if (start > resource_.length || size > resource_.length - start) {
        return std::unexpected(core::make_error_code(core::ReadErrc::invalid_range));
    }
    return fetch(start, start + size - 1);
}

FetchMetrics RangeSource::metrics() const noexcept {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    return metrics_;
}

void RangeSource::record_success(std::uint64_t bytes) noexcept {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.num_requests += 1;
    metrics_.total_bytes_fetched += bytes;
}

void RangeSource::record_failure() noexcept {
    std::lock_guard<std::mutex> lock(metrics_mutex_);
    metrics_.failed_requests += 1;
}

} // namespace rangefile::io
