// File: src/memory/shared_region.cpp
#include "memory/shared_region.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace patex {

// ============================================================================
// MappedRegion
// ============================================================================

MappedRegion::MappedRegion(size_t size) : size_(size) {
    if (size_ == 0) {
        throw std::invalid_argument("MappedRegion size must be positive");
    }

    void* ptr = mmap(nullptr, size_, PROT_READ | PROT_WRITE,
                     MAP_SHARED | MAP_ANONYMOUS, -1, 0);
    if (ptr == MAP_FAILED) {
        throw std::runtime_error(std::string("Anonymous mmap failed: ") + std::strerror(errno));
    }
    base_ = static_cast<uint8_t*>(ptr);
}

MappedRegion::MappedRegion(const std::string& path, size_t size)
    : path_(path), size_(size) {
    if (size_ == 0) {
        throw std::invalid_argument("MappedRegion size must be positive");
    }

    fd_ = open(path_.c_str(), O_RDWR | O_CREAT, 0644);
    if (fd_ == -1) {
        throw std::runtime_error("Failed to open region file " + path_ + ": " + std::strerror(errno));
    }

    struct stat sb;
    if (fstat(fd_, &sb) == -1) {
        close(fd_);
        fd_ = -1;
        throw std::runtime_error("Failed to stat region file " + path_);
    }

    if (static_cast<size_t>(sb.st_size) < size_) {
        if (ftruncate(fd_, static_cast<off_t>(size_)) == -1) {
            close(fd_);
            fd_ = -1;
            throw std::runtime_error("Failed to size region file " + path_);
        }
    }

    void* ptr = mmap(nullptr, size_, PROT_READ | PROT_WRITE, MAP_SHARED, fd_, 0);
    if (ptr == MAP_FAILED) {
        close(fd_);
        fd_ = -1;
        throw std::runtime_error("Failed to map region file " + path_);
    }
    base_ = static_cast<uint8_t*>(ptr);
}

MappedRegion::~MappedRegion() {
    Unmap();
}

void MappedRegion::Unmap() {
    if (base_ != nullptr) {
        munmap(base_, size_);
        base_ = nullptr;
    }

    if (fd_ != -1) {
        close(fd_);
        fd_ = -1;
    }
}

void MappedRegion::CheckRange(size_t offset, size_t length) const {
    if (offset > size_ || length > size_ - offset) {
        throw std::out_of_range("Region access [" + std::to_string(offset) + ", +" +
                                std::to_string(length) + ") exceeds size " +
                                std::to_string(size_));
    }
}

uint32_t* MappedRegion::WordAt(size_t offset) const {
    CheckRange(offset, sizeof(uint32_t));
    if (offset % alignof(uint32_t) != 0) {
        throw std::invalid_argument("Atomic word offset must be 4-byte aligned");
    }
    return reinterpret_cast<uint32_t*>(base_ + offset);
}

std::vector<uint8_t> MappedRegion::Read(size_t offset, size_t length) const {
    CheckRange(offset, length);
    return std::vector<uint8_t>(base_ + offset, base_ + offset + length);
}

void MappedRegion::Write(size_t offset, const uint8_t* data, size_t length) {
    CheckRange(offset, length);
    if (length > 0) {
        std::memcpy(base_ + offset, data, length);
    }
}

uint32_t MappedRegion::AtomicAdd(size_t offset, int32_t delta) {
    return __atomic_add_fetch(WordAt(offset), static_cast<uint32_t>(delta), __ATOMIC_SEQ_CST);
}

uint32_t MappedRegion::AtomicLoad(size_t offset) const {
    return __atomic_load_n(WordAt(offset), __ATOMIC_SEQ_CST);
}

// ============================================================================
// RegionLayout
// ============================================================================

RegionLayout RegionLayout::Standard(size_t slot_count, size_t arena_size) {
    RegionLayout layout;
    layout.slot_base = 0;
    layout.slot_count = slot_count;
    layout.allocator_offset = layout.SlotOffset(slot_count);
    // Arena starts on the next 64-byte boundary after the allocator word
    layout.arena_offset = (layout.allocator_offset + sizeof(uint32_t) + 63) & ~static_cast<size_t>(63);
    layout.arena_size = arena_size;
    return layout;
}

bool RegionLayout::IsValid() const {
    if (slot_count == 0 || slot_size == 0 || arena_size == 0) return false;
    if (allocator_offset % alignof(uint32_t) != 0) return false;

    size_t slots_end = SlotOffset(slot_count);
    bool allocator_clear = allocator_offset >= slots_end || allocator_offset + sizeof(uint32_t) <= slot_base;
    bool arena_clear = arena_offset >= slots_end || arena_offset + arena_size <= slot_base;
    bool arena_past_word = arena_offset >= allocator_offset + sizeof(uint32_t) ||
                           arena_offset + arena_size <= allocator_offset;
    return allocator_clear && arena_clear && arena_past_word;
}

} // namespace patex
