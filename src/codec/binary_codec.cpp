// File: src/codec/binary_codec.cpp
#include "codec/binary_codec.hpp"
#include <cstring>

namespace patex {

namespace {

template<typename T>
void PutLE(uint8_t* out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out[i] = static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i));
    }
}

template<typename T>
T GetLE(const uint8_t* in) {
    uint64_t value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<uint64_t>(in[i]) << (8 * i);
    }
    return static_cast<T>(value);
}

void PutFloat(uint8_t* out, float value) {
    uint32_t bits;
    std::memcpy(&bits, &value, sizeof(bits));
    PutLE<uint32_t>(out, bits);
}

float GetFloat(const uint8_t* in) {
    uint32_t bits = GetLE<uint32_t>(in);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

} // anonymous namespace

void EncodeHeader(const PatternHeader& header,
                  uint16_t payload_size,
                  uint32_t data_pointer,
                  uint8_t* out) {
    using namespace header_offset;

    PutLE<uint64_t>(out + MAGIC, header.magic);
    PutLE<uint64_t>(out + ID, header.id.value());
    PutLE<uint16_t>(out + VERSION, header.version);
    PutLE<uint16_t>(out + TYPE, static_cast<uint16_t>(header.type));
    out[COMPLEXITY] = header.complexity;
    out[CONFIDENCE] = header.confidence;
    PutLE<uint32_t>(out + SOURCE_HASH, header.source_hash);
    PutLE<uint64_t>(out + TIMESTAMP, header.timestamp.ToNanos());
    PutLE<uint64_t>(out + EXPIRATION, header.expiration.ToNanos());
    PutFloat(out + WEIGHT, header.weight);
    PutLE<uint32_t>(out + ACCESS_COUNT, header.access_count);
    PutFloat(out + SUCCESS_RATE, header.success_rate);
    PutLE<uint16_t>(out + FLAGS, header.flags);
    PutLE<uint16_t>(out + PAYLOAD_SIZE, payload_size);
    PutLE<uint16_t>(out + RESERVED, 0);
    PutLE<uint32_t>(out + DATA_POINTER, data_pointer);
}

std::array<uint8_t, kHeaderSize> EncodeHeader(const PatternHeader& header,
                                              uint16_t payload_size,
                                              uint32_t data_pointer) {
    std::array<uint8_t, kHeaderSize> buffer{};
    EncodeHeader(header, payload_size, data_pointer, buffer.data());
    return buffer;
}

uint64_t PeekMagic(const uint8_t* data) {
    return GetLE<uint64_t>(data + header_offset::MAGIC);
}

std::optional<HeaderSlot> DecodeHeader(const uint8_t* data, size_t size) {
    using namespace header_offset;

    if (data == nullptr || size < kHeaderSize) {
        return std::nullopt;
    }

    uint64_t magic = GetLE<uint64_t>(data + MAGIC);
    if (magic != kPatternMagic) {
        return std::nullopt;
    }

    HeaderSlot slot;
    PatternHeader& h = slot.header;
    h.magic = magic;
    h.id = PatternID(GetLE<uint64_t>(data + ID));
    h.version = GetLE<uint16_t>(data + VERSION);
    h.type = static_cast<PatternType>(GetLE<uint16_t>(data + TYPE));
    h.complexity = data[COMPLEXITY];
    h.confidence = data[CONFIDENCE];
    h.source_hash = GetLE<uint32_t>(data + SOURCE_HASH);
    h.timestamp = Timestamp::FromNanos(GetLE<uint64_t>(data + TIMESTAMP));
    h.expiration = Timestamp::FromNanos(GetLE<uint64_t>(data + EXPIRATION));
    h.weight = GetFloat(data + WEIGHT);
    h.access_count = GetLE<uint32_t>(data + ACCESS_COUNT);
    h.success_rate = GetFloat(data + SUCCESS_RATE);
    h.flags = GetLE<uint16_t>(data + FLAGS);

    slot.payload_size = GetLE<uint16_t>(data + PAYLOAD_SIZE);
    slot.data_pointer = GetLE<uint32_t>(data + DATA_POINTER);
    return slot;
}

} // namespace patex
