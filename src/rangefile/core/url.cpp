// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/core/url.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>

namespace rangefile::core {

std::expected<Url, std::error_code> Url::parse(std::string_view url_str) noexcept {
    try {
        Url url;

        auto scheme_end = url_str.find("://");
        if (scheme_end == std::string_view::npos || scheme_end == 0) {
            return std::unexpected(make_error_code(ReadErrc::invalid_url));
        }

        url.scheme_.reserve(scheme_end);
        for (std::size_t i = 0; i < scheme_end; ++i) {
            url.scheme_ += static_cast<char>(std::tolower(static_cast<unsigned char>(url_str[i])));
        }

        // Range requests only make sense over HTTP
        if (url.scheme_ != "http" && url.scheme_ != "https") {
            return std::unexpected(make_error_code(ReadErrc::invalid_url));
        }

        auto rest_start = scheme_end + 3;

        auto path_start = std::min(url_str.find('/', rest_start), url_str.length());
        auto query_start = std::min(url_str.find('?', rest_start), url_str.length());
        auto fragment_start = std::min(url_str.find('#', rest_start), url_str.length());
        auto host_end = std::min({path_start, query_start, fragment_start});

        auto authority = url_str.substr(rest_start, host_end - rest_start);

        // Drop user:pass@
        auto at_pos = authority.rfind('@');
        if (at_pos != std::string_view::npos) {
            authority.remove_prefix(at_pos + 1);
        }

        if (!authority.empty() && authority.front() == '[') {
            // IPv6 literal, [::1]:8080
            auto bracket_end = authority.find(']');
            if (bracket_end == std::string_view::npos) {
                return std::unexpected(make_error_code(ReadErrc::invalid_url));
            }
            url.host_ = std::string(authority.substr(0, bracket_end + 1));
            auto after = authority.substr(bracket_end + 1);
            if (!after.empty()) {
                if (after.front() != ':') {
                    return std::unexpected(make_error_code(ReadErrc::invalid_url));
                }
                url.port_ = std::string(after.substr(1));
            }
        } else {
            auto colon_pos = authority.find(':');
            if (colon_pos != std::string_view::npos) {
                url.host_ = std::string(authority.substr(0, colon_pos));
                url.port_ = std::string(authority.substr(colon_pos + 1));
            } else {
                url.host_ = std::string(authority);
            }
        }

        if (url.host_.empty()) {
            return std::unexpected(make_error_code(ReadErrc::invalid_url));
        }

        if (!url.port_.empty()) {
            std::uint16_t port = 0;
            auto [ptr, ec] = std::from_chars(url.port_.data(), url.port_.data() + url.port_.size(), port);
            if (ec != std::errc{} || ptr != url.port_.data() + url.port_.size() || port == 0) {
                return std::unexpected(make_error_code(ReadErrc::invalid_url));
            }
        }

        if (path_start < url_str.length() && path_start == host_end) {
            auto path_end = std::min(query_start, fragment_start);
            url.path_ = std::string(url_str.substr(path_start, path_end - path_start));
        } else {
            url.path_ = "/";
        }

        if (query_start < fragment_start) {
            url.query_ = std::string(url_str.substr(query_start + 1, fragment_start - query_start - 1));
        }

        url.str_ = std::string(url_str);
        return url;
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ReadErrc::out_of_memory));
    }
}

} // namespace rangefile::core
