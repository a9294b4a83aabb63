// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string_view>

namespace rangefile::core {

enum class ReadErrc {
    success = 0,
    network_error,
    timeout,
    not_found,
    server_error,
    permission_denied,
    dns_error,
    ssl_error,
    too_many_redirects,
    short_read,
    range_unsupported,
    invalid_url,
    invalid_range,
    out_of_range,
    out_of_memory,
    invalid_config,
    config_io_error,
};

namespace detail {

struct ReadErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "rangefile::read";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ReadErrc>(ev)) {
            case ReadErrc::success:             return "Success";
            case ReadErrc::network_error:       return "Network error";
            case ReadErrc::timeout:             return "Operation timed out";
            case ReadErrc::not_found:           return "Resource not found (404)";
            case ReadErrc::server_error:        return "Server error (5xx)";
            case ReadErrc::permission_denied:   return "Permission denied";
            case ReadErrc::dns_error:           return "DNS resolution failed";
            case ReadErrc::ssl_error:           return "SSL/TLS error";
            case ReadErrc::too_many_redirects:  return "Too many redirects";
            case ReadErrc::short_read:          return "Server returned the wrong number of bytes";
            case ReadErrc::range_unsupported:   return "HTTP range requests not supported";
            case ReadErrc::invalid_url:         return "Invalid URL";
            case ReadErrc::invalid_range:       return "Invalid byte range";
            case ReadErrc::out_of_range:        return "Position out of range";
            case ReadErrc::out_of_memory:       return "Out of memory";
            case ReadErrc::invalid_config:      return "Invalid configuration";
            case ReadErrc::config_io_error:     return "Cannot read configuration file";
            default:                            return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ReadErrcCategory& read_errc_category() noexcept {
    static detail::ReadErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ReadErrc e) noexcept {
    return {static_cast<int>(e), read_errc_category()};
}

} // namespace rangefile::core

namespace std {

template<>
struct is_error_code_enum<rangefile::core::ReadErrc> : true_type {};

} // namespace std
