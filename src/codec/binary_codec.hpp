// File: src/codec/binary_codec.hpp
//
// Binary Codec - fixed 64-byte pattern header
//
// Wire layout (little-endian):
//   0  magic        u64     34 expiration   u64
//   8  id           u64     42 weight       f32
//   16 version      u16     46 accessCount  u32
//   18 type         u16     50 successRate  f32
//   20 complexity   u8      54 flags        u16
//   21 confidence   u8      56 payloadSize  u16
//   22 sourceHash   u32     58 reserved     u16 (zero)
//   26 timestamp    u64     60 dataPointer  u32
//
// This layout is the contract for external producers writing straight into
// the hot tier. No other component touches raw header bytes.

#pragma once

#include "core/pattern.hpp"
#include <array>
#include <cstdint>
#include <optional>

namespace patex {

constexpr size_t kHeaderSize = 64;

namespace header_offset {
    constexpr size_t MAGIC = 0;
    constexpr size_t ID = 8;
    constexpr size_t VERSION = 16;
    constexpr size_t TYPE = 18;
    constexpr size_t COMPLEXITY = 20;
    constexpr size_t CONFIDENCE = 21;
    constexpr size_t SOURCE_HASH = 22;
    constexpr size_t TIMESTAMP = 26;
    constexpr size_t EXPIRATION = 34;
    constexpr size_t WEIGHT = 42;
    constexpr size_t ACCESS_COUNT = 46;
    constexpr size_t SUCCESS_RATE = 50;
    constexpr size_t FLAGS = 54;
    constexpr size_t PAYLOAD_SIZE = 56;
    constexpr size_t RESERVED = 58;
    constexpr size_t DATA_POINTER = 60;
}

/// Decoded header plus the slot-level fields that locate the payload
struct HeaderSlot {
    PatternHeader header;
    uint16_t payload_size{0};
    uint32_t data_pointer{0};
};

/// Encode a header into exactly kHeaderSize bytes at out
void EncodeHeader(const PatternHeader& header,
                  uint16_t payload_size,
                  uint32_t data_pointer,
                  uint8_t* out);

/// Convenience overload returning a buffer
std::array<uint8_t, kHeaderSize> EncodeHeader(const PatternHeader& header,
                                              uint16_t payload_size,
                                              uint32_t data_pointer);

/// Decode a header
/// @return std::nullopt if size < kHeaderSize or the magic does not match
std::optional<HeaderSlot> DecodeHeader(const uint8_t* data, size_t size);

/// Read only the magic word (no validation)
uint64_t PeekMagic(const uint8_t* data);

} // namespace patex
