// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/config.hpp>
#include <rangefile/core/error.hpp>
#include <rangefile/core/transport.hpp>
#include <rangefile/io/byte_source.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>

namespace rangefile::io {

enum class Whence : std::uint8_t {
    start,    // offset from the beginning
    current,  // offset from the cursor
    end       // offset from length()
};

// Read-only, seekable file over a ByteSource.
//
// Seeks never fail; the cursor may be placed anywhere, and a position that
// would leave the int64 range stops at its limit. Reads truncate at
// length(): a read at or past the end returns no bytes, and a read that
// would cross the end returns only what is left. Reading with a negative
// cursor is out_of_range. One reader is not thread-safe; give each thread
// its own reader over a shared source instead.
class RandomAccessReader {
public:
    explicit RandomAccessReader(std::shared_ptr<ByteSource> source) noexcept;

    // Returns the new position
    std::int64_t seek(std::int64_t offset, Whence whence = Whence::start) noexcept;

    [[nodiscard]] std::int64_t tell() const noexcept { return pos_; }

    // Negative size reads to the end of the resource
    [[nodiscard]] std::expected<Bytes, std::error_code> read(std::int64_t size = -1) noexcept;

    // Fill as much of `buffer` as the resource allows; returns the count
    [[nodiscard]] std::expected<std::size_t, std::error_code> read_into(std::span<std::byte> buffer) noexcept;

    // Nothing to release; only remembers that close() was called
    void close() noexcept { closed_ = true; }
    [[nodiscard]] bool closed() const noexcept { return closed_; }

    [[nodiscard]] std::uint64_t length() const noexcept { return source_->length(); }
    [[nodiscard]] const std::string& name() const noexcept { return source_->name(); }
    [[nodiscard]] std::string_view mode() const noexcept { return "rb"; }
    [[nodiscard]] bool readable() const noexcept { return true; }
    [[nodiscard]] bool seekable() const noexcept { return true; }
    [[nodiscard]] bool writable() const noexcept { return false; }

    [[nodiscard]] const std::shared_ptr<ByteSource>& source() const noexcept { return source_; }

private:
    // Bytes a read of `size` may return from the current position
    [[nodiscard]] std::uint64_t clamp(std::int64_t size) const noexcept;

    std::shared_ptr<ByteSource> source_;
    std::int64_t pos_{0};
    bool closed_{false};
};

// Reader straight over a RangeSource; every read is one range request
[[nodiscard]] std::expected<RandomAccessReader, std::error_code>
open_reader(core::Transport& transport, std::string_view url) noexcept;

// Reader over a ChunkCache built from `config`. Also sets the global log
// level to config.log_level.
[[nodiscard]] std::expected<RandomAccessReader, std::error_code>
open_buffered_reader(core::Transport& transport, std::string_view url,
                     const core::ReaderConfig& config = {}) noexcept;

} // namespace rangefile::io
