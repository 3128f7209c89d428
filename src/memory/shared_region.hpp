// File: src/memory/shared_region.hpp
//
// Shared Region - flat address space shared with external producers
//
// The engine never owns this memory exclusively: other processes may write
// header slots directly, so the hot tier reconciles by rescanning.

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace patex {

/// Opaque shared address space consumed by the hot tier
class ISharedRegion {
public:
    virtual ~ISharedRegion() = default;

    /// Total addressable bytes
    virtual size_t Size() const = 0;

    /// Copy length bytes starting at offset
    /// @throws std::out_of_range if the range exceeds Size()
    virtual std::vector<uint8_t> Read(size_t offset, size_t length) const = 0;

    /// @throws std::out_of_range if the range exceeds Size()
    virtual void Write(size_t offset, const uint8_t* data, size_t length) = 0;

    void Write(size_t offset, const std::vector<uint8_t>& bytes) {
        Write(offset, bytes.data(), bytes.size());
    }

    /// Atomically add delta to the 32-bit word at offset
    /// @return The value after the addition
    virtual uint32_t AtomicAdd(size_t offset, int32_t delta) = 0;

    /// Atomically load the 32-bit word at offset
    virtual uint32_t AtomicLoad(size_t offset) const = 0;
};

/// mmap-backed region: anonymous (process-local) or file-backed (MAP_SHARED)
class MappedRegion : public ISharedRegion {
public:
    /// Anonymous zero-filled mapping
    /// @throws std::runtime_error if the mapping fails
    explicit MappedRegion(size_t size);

    /// File-backed mapping, file created and sized as needed
    /// @throws std::runtime_error if the file cannot be opened or mapped
    MappedRegion(const std::string& path, size_t size);

    ~MappedRegion() override;

    MappedRegion(const MappedRegion&) = delete;
    MappedRegion& operator=(const MappedRegion&) = delete;

    size_t Size() const override { return size_; }
    std::vector<uint8_t> Read(size_t offset, size_t length) const override;
    void Write(size_t offset, const uint8_t* data, size_t length) override;
    using ISharedRegion::Write;
    uint32_t AtomicAdd(size_t offset, int32_t delta) override;
    uint32_t AtomicLoad(size_t offset) const override;

    const std::string& path() const { return path_; }

private:
    void CheckRange(size_t offset, size_t length) const;
    uint32_t* WordAt(size_t offset) const;
    void Unmap();

    std::string path_;
    size_t size_{0};
    int fd_{-1};
    uint8_t* base_{nullptr};
};

/// Where the hot tier keeps its slots, allocator word and arena
struct RegionLayout {
    size_t slot_base{0};
    size_t slot_count{1024};
    size_t slot_size{64};
    size_t allocator_offset{0};   // u32 bump pointer
    size_t arena_offset{0};
    size_t arena_size{1u << 20};

    /// Slots at 0, allocator word right after them, arena 64-byte aligned after that
    static RegionLayout Standard(size_t slot_count, size_t arena_size);

    size_t SlotOffset(size_t index) const { return slot_base + index * slot_size; }

    /// Smallest region that holds this layout
    size_t RequiredSize() const { return arena_offset + arena_size; }

    bool IsValid() const;
};

} // namespace patex
