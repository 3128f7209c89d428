// File: src/core/pattern.cpp
#include "core/pattern.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace patex {

bool PatternHeader::operator==(const PatternHeader& other) const {
    return magic == other.magic &&
           id == other.id &&
           version == other.version &&
           type == other.type &&
           complexity == other.complexity &&
           confidence == other.confidence &&
           source_hash == other.source_hash &&
           timestamp == other.timestamp &&
           expiration == other.expiration &&
           weight == other.weight &&
           access_count == other.access_count &&
           success_rate == other.success_rate &&
           flags == other.flags;
}

bool PatternMetrics::operator==(const PatternMetrics& other) const {
    return applications == other.applications &&
           successes == other.successes &&
           failures == other.failures &&
           avg_improvement == other.avg_improvement &&
           avg_latency_ms == other.avg_latency_ms &&
           cost_savings == other.cost_savings &&
           last_applied == other.last_applied;
}

Pattern Pattern::Create(PatternType type, uint32_t source_hash) {
    Pattern pattern;
    pattern.header.type = type;
    pattern.header.source_hash = source_hash;
    pattern.header.timestamp = Timestamp::Now();
    pattern.header.flags = PatternFlags::ACTIVE;
    return pattern;
}

bool Pattern::IsValid() const {
    return header.magic == kPatternMagic &&
           header.id.IsValid() &&
           payload.size() <= kMaxPayloadSize;
}

bool Pattern::IsExpired(Timestamp now) const {
    if (header.expiration.IsZero()) {
        return false;
    }
    return now > header.expiration;
}

bool Pattern::HasTag(const std::string& tag) const {
    return std::find(metadata.tags.begin(), metadata.tags.end(), tag) != metadata.tags.end();
}

void Pattern::UpdateSuccessRate(bool success) {
    auto& m = metadata.metrics;
    m.applications++;
    if (success) {
        m.successes++;
    } else {
        m.failures++;
    }
    m.last_applied = Timestamp::Now();
    header.success_rate = static_cast<float>(m.successes) / static_cast<float>(m.applications);
}

void Pattern::ValidateStructure() const {
    if (header.magic != kPatternMagic) {
        throw std::invalid_argument("pattern magic mismatch");
    }
    if (static_cast<size_t>(header.type) >= kPatternTypeCount) {
        throw std::invalid_argument("unknown pattern type " +
                                    std::to_string(static_cast<uint16_t>(header.type)));
    }
    if (payload.size() > kMaxPayloadSize) {
        throw std::invalid_argument("payload exceeds " + std::to_string(kMaxPayloadSize) + " bytes");
    }
    if (header.complexity < kMinComplexity || header.complexity > kMaxComplexity) {
        throw std::invalid_argument("complexity out of range [1,10]");
    }
    if (header.confidence > kMaxConfidence) {
        throw std::invalid_argument("confidence out of range [0,100]");
    }
    if (!(header.weight >= 0.0f && header.weight <= 1.0f)) {
        throw std::invalid_argument("weight out of range [0,1]");
    }
    if (!(header.success_rate >= 0.0f && header.success_rate <= 1.0f)) {
        throw std::invalid_argument("success rate out of range [0,1]");
    }
    if (metadata.tags.size() > kMaxTags) {
        throw std::invalid_argument("too many tags");
    }
    if (metadata.conditions.size() > kMaxConditions) {
        throw std::invalid_argument("too many conditions");
    }
}

std::string Pattern::ToString() const {
    std::ostringstream oss;
    oss << "Pattern{" << header.id.ToString()
        << ", type=" << patex::ToString(header.type)
        << ", v" << header.version
        << ", confidence=" << static_cast<int>(header.confidence)
        << ", complexity=" << static_cast<int>(header.complexity)
        << ", weight=" << header.weight
        << ", success=" << header.success_rate
        << ", payload=" << payload.size() << "B";
    if (!metadata.tags.empty()) {
        oss << ", tags=[";
        for (size_t i = 0; i < metadata.tags.size(); ++i) {
            if (i > 0) oss << ",";
            oss << metadata.tags[i];
        }
        oss << "]";
    }
    oss << "}";
    return oss.str();
}

} // namespace patex
