// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/error.hpp>
#include <rangefile/core/transport.hpp>
#include <cstdint>
#include <expected>
#include <string>

namespace rangefile::io {

using core::Bytes;

// Anything that can hand out [start, start + size) of a fixed-length resource
class ByteSource {
public:
    virtual ~ByteSource() = default;

    // Exactly `size` bytes or an error; size == 0 never touches the network
    [[nodiscard]] virtual std::expected<Bytes, std::error_code>
    get(std::uint64_t start, std::uint64_t size) noexcept = 0;

    [[nodiscard]] virtual std::uint64_t length() const noexcept = 0;

    // URL of the underlying resource
    [[nodiscard]] virtual const std::string& name() const noexcept = 0;
};

} // namespace rangefile::io
