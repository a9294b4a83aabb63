// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace rangefile::core {

// An http(s) URL split into its components. The input text is kept
// verbatim and is what gets handed to the transport.
class Url {
public:
    static std::expected<Url, std::error_code> parse(std::string_view url_str) noexcept;

    [[nodiscard]] const std::string& scheme() const noexcept { return scheme_; }
    [[nodiscard]] const std::string& host() const noexcept { return host_; }
    [[nodiscard]] const std::string& port() const noexcept { return port_; }
    [[nodiscard]] const std::string& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    [[nodiscard]] const std::string& full() const noexcept { return str_; }

    Url() = default;

private:
    std::string str_;
    std::string scheme_;
    std::string host_;
    std::string port_;
    std::string path_;
    std::string query_;
};

} // namespace rangefile::core
