// Copyright (c) 2026 changcheng967. All rights reserved.

#include <rangefile/io/chunk_cache.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstddef>
#include <utility>
#include <vector>

namespace rangefile::io {

namespace {

// Copy the part of [chunk_start, chunk_start + chunk_len) that lies inside
// the requested window [start, end) to its place in `out`, which holds the
// whole window
void copy_window(Bytes& out, const std::byte* chunk, std::uint64_t chunk_start,
                 std::uint64_t chunk_len, std::uint64_t start, std::uint64_t end) {
    const std::uint64_t from = std::max(chunk_start, start);
    const std::uint64_t to = std::min(chunk_start + chunk_len, end);
    if (from >= to) return;
    std::copy(chunk + (from - chunk_start), chunk + (to - chunk_start),
              out.begin() + static_cast<std::ptrdiff_t>(from - start));
}

} // namespace

//=============================================================================
// ChunkCache
//=============================================================================

ChunkCache::ChunkCache(std::shared_ptr<RangeSource> source,
                       std::uint64_t chunk_size, std::uint64_t budget_bytes) noexcept
    : source_(std::move(source))
    , chunk_size_(chunk_size)
    , budget_bytes_(budget_bytes)
    , max_chunks_(budget_bytes / chunk_size) {}

std::expected<std::shared_ptr<ChunkCache>, std::error_code>
ChunkCache::create(std::shared_ptr<RangeSource> source,
                   std::uint64_t chunk_size, std::uint64_t budget_bytes) noexcept {
    if (!source || chunk_size == 0) {
        return std::unexpected(core::make_error_code(core::ReadErrc::invalid_config));
    }

    if (budget_bytes < chunk_size) {
        spdlog::warn("Cache budget {} is below chunk size {}; {} will not be cached",
                     budget_bytes, chunk_size, source->url());
    }

    try {
        return std::shared_ptr<ChunkCache>(new ChunkCache(std::move(source), chunk_size, budget_bytes));
    } catch (const std::bad_alloc&) {
        return std::unexpected(core::make_error_code(core::ReadErrc::out_of_memory));
    }
}

std::expected<std::shared_ptr<ChunkCache>, std::error_code>
ChunkCache::create(std::shared_ptr<RangeSource> source, const core::ReaderConfig& config) noexcept {
    if (auto ec = config.validate()) {
        return std::unexpected(ec);
    }
    return create(std::move(source), config.chunk_size_bytes, config.cache_budget_bytes);
}

std::uint64_t ChunkCache::chunk_length(std::uint64_t chunk_start) const noexcept {
    const std::uint64_t length = source_->length();
    if (chunk_start >= length) return 0;
    return std::min(chunk_size_, length - chunk_start);
}

std::expected<Bytes, std::error_code>
ChunkCache::get(std::uint64_t start, std::uint64_t size) noexcept {
    if (size == 0) {
        return Bytes{};
    }

    const std::uint64_t length = source_->length();
    if (start > length || size > length - start) {
        return std::unexpected(core::make_error_code(core::ReadErrc::invalid_range));
    }

    const std::uint64_t end = start + size;

    std::lock_guard<std::mutex> lock(mutex_);

    try {
        Bytes out(static_cast<std::size_t>(size));

        // Serve every resident chunk of the window before anything is
        // inserted, so evictions caused by the runs below never hit a chunk
        // this call still needs
        const std::uint64_t first = align(start);
        const std::uint64_t count = (align(end - 1) - first) / chunk_size_ + 1;
        std::vector<bool> missing(static_cast<std::size_t>(count), false);

        for (std::uint64_t i = 0; i < count; ++i) {
            const std::uint64_t pos = first + i * chunk_size_;
            auto it = entries_.find(pos);
            if (it == entries_.end()) {
                missing[i] = true;
                continue;
            }
            touch(it->second);
            ++stats_.hits;
            const Bytes& chunk = it->second.data;
            copy_window(out, chunk.data(), pos, chunk.size(), start, end);
        }

        // One request per maximal run of missing chunks
        std::uint64_t i = 0;
        while (i < count) {
            if (!missing[i]) {
                ++i;
                continue;
            }
            std::uint64_t j = i + 1;
            while (j < count && missing[j]) ++j;

            if (auto ec = fetch_run(first + i * chunk_size_, first + j * chunk_size_,
                                    start, end, out)) {
                return std::unexpected(ec);
            }
            i = j;
        }

        return out;
    } catch (const std::bad_alloc&) {
        spdlog::error("Out of memory serving {}+{} of {}", start, size, source_->url());
        return std::unexpected(core::make_error_code(core::ReadErrc::out_of_memory));
    }
}

std::error_code ChunkCache::fetch_run(std::uint64_t run_start, std::uint64_t run_end,
                                      std::uint64_t start, std::uint64_t end, Bytes& out) {
    // The source clamps run_end - 1 to the last byte of the resource
    auto fetched = source_->fetch(run_start, run_end - 1);
    if (!fetched) {
        return fetched.error();
    }

    const std::uint64_t chunks = (run_end - run_start) / chunk_size_;
    ++stats_.fetches;
    stats_.misses += chunks;
    spdlog::debug("cache miss: {} chunk(s) at {} of {} in one request",
                  chunks, run_start, source_->url());

    const Bytes& run = *fetched;
    std::uint64_t offset = 0;
    for (std::uint64_t chunk_start = run_start; chunk_start < run_end; chunk_start += chunk_size_) {
        const std::uint64_t n = chunk_length(chunk_start);
        const std::byte* piece = run.data() + offset;

        copy_window(out, piece, chunk_start, n, start, end);
        insert(chunk_start, Bytes(piece, piece + n));
        offset += n;
    }

    return {};
}

void ChunkCache::insert(std::uint64_t chunk_start, Bytes data) {
    if (max_chunks_ == 0) {
        // Budget below one chunk: behave as a pass-through
        ++stats_.evictions;
        return;
    }

    if (auto it = entries_.find(chunk_start); it != entries_.end()) {
        it->second.data = std::move(data);
        touch(it->second);
        return;
    }

    while (entries_.size() >= max_chunks_) {
        evict_lru();
    }

    lru_.push_front(chunk_start);
    try {
        entries_.emplace(chunk_start, Entry{std::move(data), lru_.begin()});
    } catch (...) {
        lru_.pop_front();
        throw;
    }
}

void ChunkCache::evict_lru() noexcept {
    if (lru_.empty()) return;

    const std::uint64_t victim = lru_.back();
    lru_.pop_back();
    entries_.erase(victim);
    ++stats_.evictions;
    spdlog::trace("evicted chunk {} of {}", victim, source_->url());
}

bool ChunkCache::contains(std::uint64_t chunk_start) const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.contains(chunk_start);
}

void ChunkCache::clear() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
}

CacheStats ChunkCache::stats() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheStats copy = stats_;
    copy.resident_chunks = entries_.size();
    copy.accounted_bytes = copy.resident_chunks * chunk_size_;
    return copy;
}

} // namespace rangefile::io
