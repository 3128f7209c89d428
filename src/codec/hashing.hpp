// File: src/codec/hashing.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace patex {

/// 64-bit avalanche mixer (MurmurHash3 fmix64)
inline uint64_t Mix64(uint64_t h) {
    h ^= h >> 33;
    h *= 0xff51afd7ed558ccdULL;
    h ^= h >> 33;
    h *= 0xc4ceb9fe1a85ec53ULL;
    h ^= h >> 33;
    return h;
}

/// FNV-1a over a byte span
uint32_t Fnv1a32(const uint8_t* data, size_t size);

/// Derive the 32-bit source hash stored in headers from a producer name
uint32_t HashSource(const std::string& name);

} // namespace patex
