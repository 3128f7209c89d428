// File: src/storage/arena_allocator.hpp
#pragma once

#include "memory/shared_region.hpp"
#include <atomic>
#include <cstdint>
#include <optional>

namespace patex {

/// Lock-free bump allocator over a fixed arena in the shared region.
///
/// The bump pointer lives in the region (allocator word) so every process
/// mapping the region shares it. On overflow the reservation is undone with a
/// compensating subtract. That rollback is not linearizable: a concurrent
/// allocator may observe the transiently inflated pointer and fail spuriously.
class ArenaAllocator {
public:
    /// Allocations are rounded up to this many bytes
    static constexpr size_t kAlignment = 8;

    /// @throws std::invalid_argument if the arena does not fit in the region
    ArenaAllocator(ISharedRegion& region, const RegionLayout& layout);

    /// Reserve size bytes
    /// @return Absolute region offset, or std::nullopt when the arena is full
    ///         (size 0 also yields std::nullopt; empty payloads need no space)
    std::optional<uint32_t> Allocate(size_t size);

    /// Bytes handed out so far (relative to arena start)
    size_t Used() const;

    size_t Capacity() const { return arena_size_; }

    uint64_t Failures() const { return failures_.load(std::memory_order_relaxed); }

private:
    ISharedRegion& region_;
    size_t allocator_offset_;
    size_t arena_offset_;
    size_t arena_size_;
    std::atomic<uint64_t> failures_{0};
};

} // namespace patex
