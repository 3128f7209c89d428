// File: src/codec/hashing.cpp
#include "codec/hashing.hpp"

namespace patex {

uint32_t Fnv1a32(const uint8_t* data, size_t size) {
    uint32_t hash = 2166136261u;
    for (size_t i = 0; i < size; ++i) {
        hash ^= data[i];
        hash *= 16777619u;
    }
    return hash;
}

uint32_t HashSource(const std::string& name) {
    return Fnv1a32(reinterpret_cast<const uint8_t*>(name.data()), name.size());
}

} // namespace patex
