// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <rangefile/core/config.hpp>
#include <rangefile/core/error.hpp>
#include <rangefile/io/byte_source.hpp>
#include <rangefile/io/range_source.hpp>
#include <cstdint>
#include <expected>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace rangefile::io {

struct CacheStats {
    std::uint64_t hits{0};            // chunks served from memory
    std::uint64_t misses{0};          // chunks that had to be fetched
    std::uint64_t fetches{0};         // coalesced range requests issued
    std::uint64_t evictions{0};
    std::uint64_t resident_chunks{0};
    std::uint64_t accounted_bytes{0}; // resident_chunks * chunk_size
};

// Chunk-aligned LRU cache in front of a RangeSource.
//
// The resource is cut into chunk_size windows starting at multiples of
// chunk_size. get() serves cached chunks from memory and fetches every
// maximal run of missing chunks with a single range request. Every resident
// chunk is accounted at chunk_size bytes, including a shorter final chunk,
// and resident_chunks * chunk_size never exceeds the budget.
//
// One mutex covers lookup, fetch, insert and eviction for a whole get(), so
// the cache can be shared by several readers.
class ChunkCache final : public ByteSource {
public:
    // chunk_size must be positive. A budget smaller than one chunk is valid
    // and caches nothing.
    [[nodiscard]] static std::expected<std::shared_ptr<ChunkCache>, std::error_code>
    create(std::shared_ptr<RangeSource> source,
           std::uint64_t chunk_size = core::DEFAULT_CHUNK_SIZE,
           std::uint64_t budget_bytes = core::DEFAULT_CACHE_BUDGET) noexcept;

    [[nodiscard]] static std::expected<std::shared_ptr<ChunkCache>, std::error_code>
    create(std::shared_ptr<RangeSource> source, const core::ReaderConfig& config) noexcept;

    ChunkCache(const ChunkCache&) = delete;
    ChunkCache& operator=(const ChunkCache&) = delete;

    // Requires start + size <= length(); anything else is invalid_range.
    // Either all `size` bytes come back or nothing is inserted for the
    // failing run and the source's error is returned unchanged.
    [[nodiscard]] std::expected<Bytes, std::error_code>
    get(std::uint64_t start, std::uint64_t size) noexcept override;

    [[nodiscard]] std::uint64_t length() const noexcept override { return source_->length(); }
    [[nodiscard]] const std::string& name() const noexcept override { return source_->name(); }

    // Is the chunk starting at `chunk_start` resident? Does not touch recency.
    [[nodiscard]] bool contains(std::uint64_t chunk_start) const noexcept;

    // Drop every resident chunk
    void clear() noexcept;

    [[nodiscard]] CacheStats stats() const noexcept;

    [[nodiscard]] std::uint64_t chunk_size() const noexcept { return chunk_size_; }
    [[nodiscard]] std::uint64_t budget_bytes() const noexcept { return budget_bytes_; }
    [[nodiscard]] std::uint64_t max_chunks() const noexcept { return max_chunks_; }
    [[nodiscard]] const std::shared_ptr<RangeSource>& source() const noexcept { return source_; }

    // Start of the chunk holding `offset`
    [[nodiscard]] std::uint64_t align(std::uint64_t offset) const noexcept {
        return offset - offset % chunk_size_;
    }

private:
    ChunkCache(std::shared_ptr<RangeSource> source,
               std::uint64_t chunk_size, std::uint64_t budget_bytes) noexcept;

    struct Entry {
        Bytes data;
        std::list<std::uint64_t>::iterator lru_pos;
    };

    // True byte count of the chunk at `chunk_start`
    [[nodiscard]] std::uint64_t chunk_length(std::uint64_t chunk_start) const noexcept;

    // Fetch chunks [run_start, run_end) in one request and insert them
    [[nodiscard]] std::error_code fetch_run(std::uint64_t run_start, std::uint64_t run_end,
                                            std::uint64_t start, std::uint64_t end, Bytes& out);

    void insert(std::uint64_t chunk_start, Bytes data);
    void evict_lru() noexcept;

    // Move an entry to the most-recently-used end
    void touch(Entry& entry) noexcept { lru_.splice(lru_.begin(), lru_, entry.lru_pos); }

    std::shared_ptr<RangeSource> source_;
    const std::uint64_t chunk_size_;
    const std::uint64_t budget_bytes_;
    const std::uint64_t max_chunks_;

    std::unordered_map<std::uint64_t, Entry> entries_;
    std::list<std::uint64_t> lru_;  // front = most recently used
    CacheStats stats_;

    mutable std::mutex mutex_;
};

} // namespace rangefile::io
