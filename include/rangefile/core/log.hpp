// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <string_view>
#include <system_error>

namespace rangefile::core {

// True for trace, debug, info, warn, error, critical and off
[[nodiscard]] bool is_log_level(std::string_view name) noexcept;

// Set the level of spdlog's default logger. Unknown names leave the
// level untouched and return invalid_config.
[[nodiscard]] std::error_code set_log_level(std::string_view name) noexcept;

} // namespace rangefile::core
