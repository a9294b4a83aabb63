// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/core/log.hpp>
#include <rangefile/core/error.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <utility>

namespace rangefile::core {

namespace {

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 7> LEVELS{{
    {"trace",    spdlog::level::trace},
    {"debug",    spdlog::level::debug},
    {"info",     spdlog::level::info},
    {"warn",     spdlog::level::warn},
    {"error",    spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off",      spdlog::level::off},
}};

} // namespace

bool is_log_level(std::string_view name) noexcept {
    for (const auto& [key, level] : LEVELS) {
        if (key == name) return true;
    }
    return false;
}

std::error_code set_log_level(std::string_view name) noexcept {
    for (const auto& [key, level] : LEVELS) {
        if (key == name) {
            spdlog::set_level(level);
            return {};
        }
    }
    spdlog::warn("Unknown log level '{}'", name);
    return make_error_code(ReadErrc::invalid_config);
}

} // namespace rangefile::core
