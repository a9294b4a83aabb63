// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/config.hpp>
#include <rangefile/core/error.hpp>
#include <rangefile/core/transport.hpp>
#include <cstdint>
#include <string>
#include <expected>
#include <map>

namespace rangefile::core {

// Status line and headers of one response
struct HttpResponse {
    std::int32_t status_code{0};
    std::map<std::string, std::string> headers;  // lowercase names
    std::uint64_t content_length{0};
    bool accepts_ranges{false};
    std::string content_type;
};

// libcurl-backed Transport. Every request uses its own easy handle, so one
// session can serve several readers concurrently.
class HttpSession final : public Transport {
public:
    HttpSession();
    explicit HttpSession(TransportOptions options);
    ~HttpSession() override = default;

    // Non-copyable, movable
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
    HttpSession(HttpSession&&) noexcept = default;
    HttpSession& operator=(HttpSession&&) noexcept = default;

    // Perform HEAD request
    [[nodiscard]] std::expected<HttpResponse, std::error_code>
    head(const std::string& url) noexcept;

    [[nodiscard]] std::expected<ResourceInfo, std::error_code>
    probe_metadata(const std::string& url) noexcept override;

    // GET with "Range: bytes=start-end"
    [[nodiscard]] std::expected<Bytes, std::error_code>
    fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end) noexcept override;

    [[nodiscard]] const TransportOptions& options() const noexcept { return options_; }

    // Global initialization (call once at startup, before any thread uses a session)
    [[nodiscard]] static std::error_code global_init() noexcept;
    static void global_cleanup() noexcept;

    // Map an HTTP status >= 400 to an error code
    [[nodiscard]] static std::error_code status_error(long http_code) noexcept;

    // Verdict on a finished ranged GET of [start, start + expected_size).
    // Accepts 206 with exactly expected_size bytes, or 200 with exactly
    // expected_size bytes from offset 0. HTTP errors map as status_error;
    // an overflowing or mis-sized body is short_read.
    [[nodiscard]] static std::error_code
    classify_range_response(long http_code, std::uint64_t start, std::uint64_t body_size,
                            std::uint64_t expected_size, bool overflow) noexcept;

    // Parse a Content-Length value; false unless it is plain decimal digits
    [[nodiscard]] static bool parse_length(const std::string& value, std::uint64_t& out) noexcept;

private:
    TransportOptions options_;
};

} // namespace rangefile::core
