// File: src/storage/hot_tier.hpp
#pragma once

#include "core/pattern.hpp"
#include "memory/shared_region.hpp"
#include "storage/arena_allocator.hpp"
#include "storage/lru_cache.hpp"
#include <atomic>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace patex {

/// Tier 1: fixed 64-byte header slots in the shared region plus arena payloads.
///
/// Headers and payloads live in the region so external producers can read
/// and write them. Encoding, metadata and links are process-local.
/// Never holds more entries than it has slots. A new entry on a full tier
/// evicts exactly one least-recently-used entry; its slot magic is cleared
/// and the entry is dropped.
class HotTier {
public:
    struct WriteResult {
        bool admitted{false};
        std::optional<PatternID> evicted;
    };

    /// @throws std::invalid_argument if the layout is invalid or exceeds the region
    HotTier(ISharedRegion& region, const RegionLayout& layout);

    /// Store or overwrite. Payload space is reserved before any eviction,
    /// so a full arena rejects the write without disturbing the tier.
    WriteResult Write(const Pattern& pattern);

    /// Decode from the region and mark most recently used
    /// @return std::nullopt if unmapped or the slot no longer holds this ID
    std::optional<Pattern> Read(PatternID id);

    bool Contains(PatternID id) const;

    /// Rescan every slot and adopt headers written by external producers.
    /// Mappings whose slot was cleared or overwritten are dropped. Headers
    /// that fail ValidateStructure are logged and left unimported.
    /// @return Newly imported patterns
    std::vector<Pattern> Sync();

    size_t Size() const;
    size_t Capacity() const { return layout_.slot_count; }

    /// IDs ordered most recently used first
    std::vector<PatternID> RecencyOrder() const { return lru_.Keys(); }

    uint64_t Evictions() const { return evictions_.load(); }
    uint64_t Hits() const { return lru_.Hits(); }
    uint64_t Misses() const { return lru_.Misses(); }

    const ArenaAllocator& arena() const { return arena_; }
    const RegionLayout& layout() const { return layout_; }

private:
    struct Body {
        DataEncoding encoding{DataEncoding::BINARY};
        PatternMetadata metadata;
        PatternLinks links;
    };

    std::optional<std::vector<uint8_t>> ReadPayload(uint32_t data_pointer, uint16_t size) const;
    void ClearSlot(size_t slot);
    void DropMappingLocked(size_t slot);
    void ClaimFreeSlotLocked(size_t slot);

    ISharedRegion& region_;
    RegionLayout layout_;
    ArenaAllocator arena_;

    LRUCache<PatternID, size_t> lru_;          // ID -> slot
    std::vector<PatternID> slot_owner_;        // slot -> ID (unassigned = free)
    std::vector<size_t> free_slots_;
    std::unordered_map<PatternID, Body> bodies_;
    std::atomic<uint64_t> evictions_{0};

    mutable std::shared_mutex mutex_;
};

} // namespace patex
