// File: src/storage/arena_allocator.cpp
#include "storage/arena_allocator.hpp"
#include <limits>
#include <stdexcept>

namespace patex {

ArenaAllocator::ArenaAllocator(ISharedRegion& region, const RegionLayout& layout)
    : region_(region),
      allocator_offset_(layout.allocator_offset),
      arena_offset_(layout.arena_offset),
      arena_size_(layout.arena_size) {
    if (layout.RequiredSize() > region_.Size()) {
        throw std::invalid_argument("Arena does not fit in shared region");
    }
    if (arena_offset_ + arena_size_ > std::numeric_limits<uint32_t>::max()) {
        throw std::invalid_argument("Arena must be addressable with 32-bit offsets");
    }
}

std::optional<uint32_t> ArenaAllocator::Allocate(size_t size) {
    if (size == 0) {
        return std::nullopt;
    }

    size_t rounded = (size + kAlignment - 1) & ~(kAlignment - 1);
    if (rounded > arena_size_) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    int32_t delta = static_cast<int32_t>(rounded);
    uint32_t end = region_.AtomicAdd(allocator_offset_, delta);
    if (end > arena_size_) {
        // Roll back our reservation
        region_.AtomicAdd(allocator_offset_, -delta);
        failures_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }

    uint32_t start = end - static_cast<uint32_t>(rounded);
    return static_cast<uint32_t>(arena_offset_ + start);
}

size_t ArenaAllocator::Used() const {
    size_t used = region_.AtomicLoad(allocator_offset_);
    return used > arena_size_ ? arena_size_ : used;
}

} // namespace patex
