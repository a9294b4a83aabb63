// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/core/config.hpp>
#include <rangefile/core/error.hpp>
#include <rangefile/core/log.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <sstream>

namespace rangefile::core {

namespace {

void read_transport(const nlohmann::json& j, TransportOptions& opts) {
    if (j.contains("connect_timeout_sec")) {
        opts.connect_timeout_sec = j["connect_timeout_sec"].get<std::uint32_t>();
    }

    if (j.contains("low_speed_timeout_sec")) {
        opts.low_speed_timeout_sec = j["low_speed_timeout_sec"].get<std::uint32_t>();
    }

    if (j.contains("max_redirects")) {
        opts.max_redirects = j["max_redirects"].get<std::uint32_t>();
    }

    if (j.contains("verify_tls")) {
        opts.verify_tls = j["verify_tls"].get<bool>();
    }

    if (j.contains("user_agent")) {
        opts.user_agent = j["user_agent"].get<std::string>();
    }
}

} // namespace

std::error_code ReaderConfig::validate() const noexcept {
    if (chunk_size_bytes == 0) {
        return make_error_code(ReadErrc::invalid_config);
    }
    if (!is_log_level(log_level)) {
        return make_error_code(ReadErrc::invalid_config);
    }
    return {};
}

std::expected<ReaderConfig, std::error_code>
parse_config(std::string_view json) noexcept {
    try {
        auto j = nlohmann::json::parse(json);
        if (!j.is_object()) {
            spdlog::error("Config root must be a JSON object");
            return std::unexpected(make_error_code(ReadErrc::invalid_config));
        }

        ReaderConfig cfg;

        if (j.contains("chunk_size_bytes")) {
            cfg.chunk_size_bytes = j["chunk_size_bytes"].get<std::uint64_t>();
        }

        if (j.contains("cache_budget_bytes")) {
            cfg.cache_budget_bytes = j["cache_budget_bytes"].get<std::uint64_t>();
        }

        if (j.contains("log_level")) {
            cfg.log_level = j["log_level"].get<std::string>();
        }

        if (j.contains("transport") && j["transport"].is_object()) {
            read_transport(j["transport"], cfg.transport);
        }

        if (auto ec = cfg.validate()) {
            spdlog::error("Rejected config: chunk_size_bytes={} log_level='{}'",
                          cfg.chunk_size_bytes, cfg.log_level);
            return std::unexpected(ec);
        }

        return cfg;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Malformed config: {}", e.what());
        return std::unexpected(make_error_code(ReadErrc::invalid_config));
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ReadErrc::out_of_memory));
    }
}

std::expected<ReaderConfig, std::error_code>
load_config(std::string_view path) noexcept {
    try {
        std::ifstream file{std::string(path)};
        if (!file) {
            spdlog::error("Cannot open config file {}", path);
            return std::unexpected(make_error_code(ReadErrc::config_io_error));
        }

        std::ostringstream contents;
        contents << file.rdbuf();
        if (file.bad()) {
            return std::unexpected(make_error_code(ReadErrc::config_io_error));
        }

        return parse_config(contents.str());
    } catch (const std::bad_alloc&) {
        return std::unexpected(make_error_code(ReadErrc::out_of_memory));
    }
}

} // namespace rangefile::core
