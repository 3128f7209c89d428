// File: src/core/pattern.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace patex {

/// "PAT_EX-P" read as a little-endian u64
constexpr uint64_t kPatternMagic = 0x5041545F45582D50ULL;

constexpr size_t kMaxPayloadSize = 1024;
constexpr size_t kMaxTags = 16;
constexpr size_t kMaxConditions = 32;

constexpr uint8_t kMinComplexity = 1;
constexpr uint8_t kMaxComplexity = 10;
constexpr uint8_t kMaxConfidence = 100;

/// Fixed-size part of a pattern; mirrors the 64-byte wire header
struct PatternHeader {
    uint64_t magic{kPatternMagic};
    PatternID id;
    uint16_t version{1};
    PatternType type{PatternType::ATOMIC};
    uint8_t complexity{kMinComplexity};
    uint8_t confidence{0};
    uint32_t source_hash{0};
    Timestamp timestamp;
    Timestamp expiration;     // zero = never
    float weight{1.0f};
    uint32_t access_count{0};
    float success_rate{0.0f};
    uint16_t flags{0};

    bool operator==(const PatternHeader& other) const;
    bool operator!=(const PatternHeader& other) const { return !(*this == other); }
};

/// Single condition a context must satisfy (e.g. "region" "=" "eu")
struct Condition {
    std::string field;
    std::string op;
    std::string value;

    bool operator==(const Condition& other) const {
        return field == other.field && op == other.op && value == other.value;
    }
};

struct Constraint {
    std::string type;
    std::string limit;

    bool operator==(const Constraint& other) const {
        return type == other.type && limit == other.limit;
    }
};

/// Outcome counters accumulated while a pattern is applied
struct PatternMetrics {
    uint64_t applications{0};
    uint64_t successes{0};
    uint64_t failures{0};
    double avg_improvement{0.0};
    double avg_latency_ms{0.0};
    double cost_savings{0.0};
    Timestamp last_applied;

    bool operator==(const PatternMetrics& other) const;
};

struct PatternMetadata {
    std::vector<std::string> tags;
    std::vector<Condition> conditions;
    std::vector<Constraint> constraints;
    PatternMetrics metrics;
};

struct PatternLinks {
    std::vector<PatternID> dependencies;
    std::vector<PatternID> alternatives;
    std::vector<PatternID> contradicts;
    std::vector<PatternID> evolved_from;
};

/// A learned behavioural rule: fixed header plus variable body
struct Pattern {
    PatternHeader header;
    DataEncoding encoding{DataEncoding::BINARY};
    std::vector<uint8_t> payload;
    PatternMetadata metadata;
    PatternLinks links;

    /// Fresh pattern: version 1, complexity 1, weight 1.0, Active, stamped now
    static Pattern Create(PatternType type, uint32_t source_hash);

    /// Magic matches, ID assigned and payload within bounds
    bool IsValid() const;

    bool IsActive() const { return HasFlag(PatternFlags::ACTIVE); }
    bool IsExpired(Timestamp now) const;

    bool HasFlag(uint16_t flag) const { return (header.flags & flag) != 0; }
    void SetFlag(uint16_t flag) { header.flags |= flag; }
    void ClearFlag(uint16_t flag) { header.flags &= static_cast<uint16_t>(~flag); }

    bool HasTag(const std::string& tag) const;

    /// Record one application outcome and refresh the header success rate
    void UpdateSuccessRate(bool success);

    /// Check field ranges and body limits
    /// @throws std::invalid_argument describing the first violation
    void ValidateStructure() const;

    std::string ToString() const;
};

} // namespace patex
