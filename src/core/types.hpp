// File: src/core/types.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <chrono>
#include <vector>
#include <map>
#include <iosfwd>

namespace patex {

// PatternID: Unique identifier for patterns
// 0 is reserved for "unassigned"; storage hands out monotonic IDs
class PatternID {
public:
    using ValueType = uint64_t;

    // Default constructor creates unassigned ID
    PatternID() : value_(kUnassigned) {}

    // Explicit constructor from value
    explicit PatternID(ValueType value) : value_(value) {}

    // Check if ID has been assigned
    bool IsValid() const { return value_ != kUnassigned; }

    // Get underlying value
    ValueType value() const { return value_; }

    // Comparison operators
    bool operator==(const PatternID& other) const { return value_ == other.value_; }
    bool operator!=(const PatternID& other) const { return value_ != other.value_; }
    bool operator<(const PatternID& other) const { return value_ < other.value_; }
    bool operator>(const PatternID& other) const { return value_ > other.value_; }

    // String conversion for debugging
    std::string ToString() const;

    // Hash support for std::unordered_map
    struct Hash {
        size_t operator()(const PatternID& id) const {
            return std::hash<ValueType>()(id.value_);
        }
    };

private:
    static constexpr ValueType kUnassigned = 0;

    ValueType value_;
};

// PatternType: Behavioural class of a pattern (u16 on the wire)
enum class PatternType : uint16_t {
    ATOMIC = 0,         // Simple rule
    COMPOSITE = 1,      // Multiple patterns combined
    CONDITIONAL = 2,    // IF-THEN-ELSE rule
    TEMPORAL = 3,       // Time-based rule
    SEQUENTIAL = 4,     // A -> B -> C sequence
    PROBABILISTIC = 5,  // Probabilistic decision
    ADAPTIVE = 6,       // Self-modifying rule
    SECURITY = 7,       // Security policy
};

constexpr size_t kPatternTypeCount = 8;

// Convert PatternType to string
const char* ToString(PatternType type);

// Parse PatternType from string
PatternType ParsePatternType(const std::string& str);

// PatternFlags: bit set stored in the header (u16 on the wire)
namespace PatternFlags {
    constexpr uint16_t ACTIVE     = 1u << 0;
    constexpr uint16_t TRUSTED    = 1u << 1;
    constexpr uint16_t VALIDATED  = 1u << 2;
    constexpr uint16_t EVOLVED    = 1u << 3;
    constexpr uint16_t COMPOSITE  = 1u << 4;
    constexpr uint16_t TEMPORAL   = 1u << 5;
    constexpr uint16_t ENCRYPTED  = 1u << 6;
    constexpr uint16_t COMPRESSED = 1u << 7;
}

// DataEncoding: how the payload bytes are to be interpreted
enum class DataEncoding : uint8_t {
    BINARY = 0,
    JSON = 1,
    PROTO = 2,
    EXPRESSION = 3,  // Pattern DSL
    GRAPH = 4,
};

const char* ToString(DataEncoding encoding);
DataEncoding ParseDataEncoding(const std::string& str);

// Timestamp: Nanosecond-precision wall-clock time point
// Wall clock (not steady) because headers carry Unix-epoch nanoseconds
// that external producers also write.
class Timestamp {
public:
    using ClockType = std::chrono::system_clock;
    using Duration = std::chrono::nanoseconds;

    // Create timestamp for current time
    static Timestamp Now();

    // Create timestamp from nanoseconds since the Unix epoch
    static Timestamp FromNanos(uint64_t nanos) { return Timestamp(nanos); }

    // Default constructor creates zero timestamp
    Timestamp() : nanos_(0) {}

    // Get nanoseconds since epoch
    uint64_t ToNanos() const { return nanos_; }

    // Hour of day in UTC [0, 23]
    int HourOfDay() const;

    bool IsZero() const { return nanos_ == 0; }

    // Signed duration between two timestamps
    Duration operator-(const Timestamp& other) const {
        return Duration(static_cast<int64_t>(nanos_) - static_cast<int64_t>(other.nanos_));
    }

    Timestamp operator+(Duration d) const {
        return Timestamp(static_cast<uint64_t>(static_cast<int64_t>(nanos_) + d.count()));
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(static_cast<uint64_t>(static_cast<int64_t>(nanos_) - d.count()));
    }

    // Comparison operators
    bool operator<(const Timestamp& other) const { return nanos_ < other.nanos_; }
    bool operator>(const Timestamp& other) const { return nanos_ > other.nanos_; }
    bool operator<=(const Timestamp& other) const { return nanos_ <= other.nanos_; }
    bool operator>=(const Timestamp& other) const { return nanos_ >= other.nanos_; }
    bool operator==(const Timestamp& other) const { return nanos_ == other.nanos_; }
    bool operator!=(const Timestamp& other) const { return nanos_ != other.nanos_; }

    // String conversion
    std::string ToString() const;

private:
    explicit Timestamp(uint64_t nanos) : nanos_(nanos) {}
    uint64_t nanos_;
};

// Context passed to pattern application (field -> value)
using ApplicationContext = std::map<std::string, std::string>;

} // namespace patex

// Hash specialization for std::unordered_map
namespace std {
    template<>
    struct hash<patex::PatternID> {
        size_t operator()(const patex::PatternID& id) const {
            return patex::PatternID::Hash()(id);
        }
    };
}
