// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/error.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <vector>

namespace rangefile::core {

using Bytes = std::vector<std::byte>;

// What a metadata-only request reveals about a remote resource
struct ResourceInfo {
    std::uint64_t length{0};
    bool accepts_ranges{false};
    std::string content_type;
};

// The network capability the readers need. Implementations must be safe to
// call from several threads at once.
class Transport {
public:
    virtual ~Transport() = default;

    // Metadata-only request (HEAD)
    [[nodiscard]] virtual std::expected<ResourceInfo, std::error_code>
    probe_metadata(const std::string& url) noexcept = 0;

    // Inclusive byte range [start, end]; a successful result holds exactly
    // end - start + 1 bytes
    [[nodiscard]] virtual std::expected<Bytes, std::error_code>
    fetch_range(const std::string& url, std::uint64_t start, std::uint64_t end) noexcept = 0;
};

} // namespace rangefile::core
