// File: src/storage/hot_tier.cpp
#include "storage/hot_tier.hpp"
#include "codec/binary_codec.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace patex {

HotTier::HotTier(ISharedRegion& region, const RegionLayout& layout)
    : region_(region),
      layout_(layout),
      arena_(region, layout),
      lru_(layout.slot_count),
      slot_owner_(layout.slot_count) {
    if (!layout_.IsValid()) {
        throw std::invalid_argument("Invalid hot tier region layout");
    }
    if (layout_.slot_size < kHeaderSize) {
        throw std::invalid_argument("Hot tier slots must hold a 64-byte header");
    }
    if (layout_.SlotOffset(layout_.slot_count) > region_.Size()) {
        throw std::invalid_argument("Hot tier slots do not fit in shared region");
    }

    // Hand out low slots first
    free_slots_.reserve(layout_.slot_count);
    for (size_t slot = layout_.slot_count; slot > 0; --slot) {
        free_slots_.push_back(slot - 1);
    }
}

// ============================================================================
// Write / Read
// ============================================================================

HotTier::WriteResult HotTier::Write(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (pattern.payload.size() > kMaxPayloadSize || !pattern.header.id.IsValid()) {
        return WriteResult{};
    }

    const PatternID id = pattern.header.id;
    const uint16_t payload_size = static_cast<uint16_t>(pattern.payload.size());
    const auto existing_slot = lru_.Peek(id);

    // Reserve payload space first; an overwrite reuses its old block if it fits
    uint32_t data_pointer = 0;
    if (payload_size > 0) {
        bool reused = false;
        if (existing_slot) {
            auto bytes = region_.Read(layout_.SlotOffset(*existing_slot), kHeaderSize);
            auto current = DecodeHeader(bytes.data(), bytes.size());
            if (current && current->header.id == id &&
                current->payload_size >= payload_size && current->data_pointer != 0) {
                data_pointer = current->data_pointer;
                reused = true;
            }
        }
        if (!reused) {
            auto allocated = arena_.Allocate(payload_size);
            if (!allocated) {
                return WriteResult{};
            }
            data_pointer = *allocated;
        }
    }

    WriteResult result;
    size_t slot = 0;

    if (existing_slot) {
        slot = *existing_slot;
    } else if (!free_slots_.empty()) {
        slot = free_slots_.back();
        free_slots_.pop_back();
    } else {
        auto victim = lru_.EvictLeastRecent();
        if (!victim) {
            return WriteResult{};
        }
        slot = victim->second;
        ClearSlot(slot);
        bodies_.erase(victim->first);
        slot_owner_[slot] = PatternID();
        result.evicted = victim->first;
        evictions_.fetch_add(1);
    }

    uint8_t header[kHeaderSize];
    EncodeHeader(pattern.header, payload_size, data_pointer, header);

    if (payload_size > 0) {
        region_.Write(data_pointer, pattern.payload.data(), payload_size);
    }
    region_.Write(layout_.SlotOffset(slot), header, kHeaderSize);

    lru_.Put(id, slot);
    slot_owner_[slot] = id;
    bodies_[id] = Body{pattern.encoding, pattern.metadata, pattern.links};

    result.admitted = true;
    return result;
}

std::optional<Pattern> HotTier::Read(PatternID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto slot = lru_.Get(id);
    if (!slot) {
        return std::nullopt;
    }

    auto bytes = region_.Read(layout_.SlotOffset(*slot), kHeaderSize);
    auto decoded = DecodeHeader(bytes.data(), bytes.size());
    if (!decoded || decoded->header.id != id) {
        return std::nullopt;  // Overwritten externally; Sync() drops the mapping
    }

    Pattern pattern;
    pattern.header = decoded->header;

    if (decoded->payload_size > 0) {
        auto payload = ReadPayload(decoded->data_pointer, decoded->payload_size);
        if (!payload) {
            return std::nullopt;
        }
        pattern.payload = std::move(*payload);
    }

    auto body = bodies_.find(id);
    if (body != bodies_.end()) {
        pattern.encoding = body->second.encoding;
        pattern.metadata = body->second.metadata;
        pattern.links = body->second.links;
    }

    return pattern;
}

bool HotTier::Contains(PatternID id) const {
    return lru_.Contains(id);
}

size_t HotTier::Size() const {
    return lru_.Size();
}

// ============================================================================
// Reconciliation
// ============================================================================

std::vector<Pattern> HotTier::Sync() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<Pattern> imported;

    for (size_t slot = 0; slot < layout_.slot_count; ++slot) {
        auto bytes = region_.Read(layout_.SlotOffset(slot), kHeaderSize);
        auto decoded = DecodeHeader(bytes.data(), bytes.size());
        const PatternID owner = slot_owner_[slot];

        if (!decoded || !decoded->header.id.IsValid()) {
            if (owner.IsValid()) {
                DropMappingLocked(slot);
            }
            continue;
        }

        const PatternID id = decoded->header.id;
        if (owner == id) {
            continue;
        }

        if (owner.IsValid()) {
            DropMappingLocked(slot);
        }

        if (lru_.Contains(id)) {
            continue;  // Same ID already mapped to another slot
        }

        Pattern pattern;
        pattern.header = decoded->header;

        if (decoded->payload_size > 0) {
            if (decoded->payload_size > kMaxPayloadSize) {
                continue;
            }
            auto payload = ReadPayload(decoded->data_pointer, decoded->payload_size);
            if (!payload) {
                continue;
            }
            pattern.payload = std::move(*payload);
        }

        try {
            pattern.ValidateStructure();
        } catch (const std::invalid_argument& e) {
            std::cerr << "HotTier: skipping slot " << slot << " (" << id.ToString()
                      << "): " << e.what() << std::endl;
            continue;
        }

        ClaimFreeSlotLocked(slot);
        lru_.Put(id, slot);
        slot_owner_[slot] = id;
        imported.push_back(std::move(pattern));
    }

    return imported;
}

// ============================================================================
// Helpers
// ============================================================================

std::optional<std::vector<uint8_t>> HotTier::ReadPayload(uint32_t data_pointer, uint16_t size) const {
    const size_t begin = data_pointer;
    const size_t arena_end = layout_.arena_offset + layout_.arena_size;
    if (begin < layout_.arena_offset || begin + size > arena_end) {
        return std::nullopt;
    }
    return region_.Read(begin, size);
}

void HotTier::ClearSlot(size_t slot) {
    const uint8_t zeros[8] = {0, 0, 0, 0, 0, 0, 0, 0};
    region_.Write(layout_.SlotOffset(slot), zeros, sizeof(zeros));
}

void HotTier::DropMappingLocked(size_t slot) {
    const PatternID id = slot_owner_[slot];
    lru_.Remove(id);
    bodies_.erase(id);
    slot_owner_[slot] = PatternID();
    free_slots_.push_back(slot);
}

void HotTier::ClaimFreeSlotLocked(size_t slot) {
    auto it = std::find(free_slots_.begin(), free_slots_.end(), slot);
    if (it != free_slots_.end()) {
        free_slots_.erase(it);
    }
}

} // namespace patex
