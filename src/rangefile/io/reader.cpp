// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/io/reader.hpp>
#include <rangefile/core/log.hpp>
#include <rangefile/io/chunk_cache.hpp>
#include <rangefile/io/range_source.hpp>
#include <algorithm>
#include <cstring>
#include <limits>
#include <utility>

namespace rangefile::io {

namespace {

// a + b, pinned to the int64 range instead of overflowing
std::int64_t saturating_add(std::int64_t a, std::int64_t b) noexcept {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if (b > 0 && a > max - b) return max;
    if (b < 0 && a < min - b) return min;
    return a + b;
}

} // namespace

//=============================================================================
// RandomAccessReader
//=============================================================================

RandomAccessReader::RandomAccessReader(std::shared_ptr<ByteSource> source) noexcept
    : source_(std::move(source)) {}

std::int64_t RandomAccessReader::seek(std::int64_t offset, Whence whence) noexcept {
    switch (whence) {
        case Whence::start:
            pos_ = offset;
            break;
        case Whence::current:
            pos_ = saturating_add(pos_, offset);
            break;
        case Whence::end: {
            const auto length = std::min<std::uint64_t>(
                source_->length(), std::numeric_limits<std::int64_t>::max());
            pos_ = saturating_add(static_cast<std::int64_t>(length), offset);
            break;
        }
    }
    return pos_;
}

std::uint64_t RandomAccessReader::clamp(std::int64_t size) const noexcept {
    const std::uint64_t length = source_->length();
    const auto pos = static_cast<std::uint64_t>(pos_);
    const std::uint64_t remaining = pos >= length ? 0 : length - pos;
    if (size < 0) return remaining;
    return std::min(static_cast<std::uint64_t>(size), remaining);
}

std::expected<Bytes, std::error_code> RandomAccessReader::read(std::int64_t size) noexcept {
    if (pos_ < 0) {
        return std::unexpected(core::make_error_code(core::ReadErrc::out_of_range));
    }

    const std::uint64_t n = clamp(size);
    if (n == 0) {
        return Bytes{};
    }

    auto data = source_->get(static_cast<std::uint64_t>(pos_), n);
    if (!data) {
        return std::unexpected(data.error());
    }

    pos_ += static_cast<std::int64_t>(n);
    return data;
}

std::expected<std::size_t, std::error_code>
RandomAccessReader::read_into(std::span<std::byte> buffer) noexcept {
    auto data = read(static_cast<std::int64_t>(buffer.size()));
    if (!data) {
        return std::unexpected(data.error());
    }
    if (!data->empty()) {
        std::memcpy(buffer.data(), data->data(), data->size());
    }
    return data->size();
}

//=============================================================================
// Factories
//=============================================================================

std::expected<RandomAccessReader, std::error_code>
open_reader(core::Transport& transport, std::string_view url) noexcept {
    auto source = RangeSource::open(transport, url);
    if (!source) {
        return std::unexpected(source.error());
    }
    return RandomAccessReader(std::move(*source));
}

std::expected<RandomAccessReader, std::error_code>
open_buffered_reader(core::Transport& transport, std::string_view url,
                     const core::ReaderConfig& config) noexcept {
    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    if (auto ec = core::set_log_level(config.log_level)) {
        return std::unexpected(ec);
    }

    auto source = RangeSource::open(transport, url);
    if (!source) {
        return std::unexpected(source.error());
    }

    auto cache = ChunkCache::create(std::move(*source), config);
    if (!cache) {
        return std::unexpected(cache.error());
    }
    return RandomAccessReader(std::move(*cache));
}

} // namespace rangefile::io
