// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace rangefile::core {

constexpr std::uint64_t DEFAULT_CHUNK_SIZE = 1024 * 1024;          // 1 MiB
constexpr std::uint64_t DEFAULT_CACHE_BUDGET = 10 * 1024 * 1024;   // 10 MiB

constexpr std::uint32_t CONNECTION_TIMEOUT_SEC = 30;
constexpr std::uint32_t STALL_TIMEOUT_SEC = 15;
constexpr std::uint32_t MAX_REDIRECTS = 10;

constexpr std::size_t RECEIVE_BUFFER_SIZE = 256 * 1024;            // 256 KB

// libcurl transport settings
struct TransportOptions {
    std::uint32_t connect_timeout_sec{CONNECTION_TIMEOUT_SEC};
    std::uint32_t low_speed_timeout_sec{STALL_TIMEOUT_SEC};  // abort if < 1 B/s this long
    std::uint32_t max_redirects{MAX_REDIRECTS};
    bool verify_tls{true};
    std::string user_agent;  // empty: rangefile/<version>
};

// Chunking and cache sizing for buffered readers
struct ReaderConfig {
    std::uint64_t chunk_size_bytes{DEFAULT_CHUNK_SIZE};
    std::uint64_t cache_budget_bytes{DEFAULT_CACHE_BUDGET};
    std::string log_level{"info"};  // applied to spdlog by open_buffered_reader
    TransportOptions transport;

    // Number of whole chunks the budget can hold
    [[nodiscard]] std::uint64_t budget_chunks() const noexcept {
        return chunk_size_bytes == 0 ? 0 : cache_budget_bytes / chunk_size_bytes;
    }

    [[nodiscard]] std::error_code validate() const noexcept;
};

// Parse a JSON document; keys that are absent keep their defaults
[[nodiscard]] std::expected<ReaderConfig, std::error_code>
parse_config(std::string_view json) noexcept;

// Load and parse a JSON config file
[[nodiscard]] std::expected<ReaderConfig, std::error_code>
load_config(std::string_view path) noexcept;

} // namespace rangefile::core
