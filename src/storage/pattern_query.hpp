// File: src/storage/pattern_query.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patex {

struct TimeRange {
    Timestamp start;
    Timestamp end;

    bool Contains(Timestamp t) const { return t >= start && t <= end; }
};

/// Builder-style pattern filter.
///
/// Candidates come from the first supplied category in the order
/// tags, types, min confidence (> 0), sources. The other categories do not
/// narrow the result; the time range and limit always apply.
class PatternQuery {
public:
    static constexpr uint8_t kDefaultMinConfidence = 70;
    static constexpr size_t kDefaultLimit = 100;

    PatternQuery& WithType(PatternType type) {
        types_.push_back(type);
        return *this;
    }

    PatternQuery& WithMinConfidence(uint8_t confidence) {
        min_confidence_ = confidence;
        return *this;
    }

    PatternQuery& WithTag(const std::string& tag) {
        tags_.push_back(tag);
        return *this;
    }

    PatternQuery& WithSource(uint32_t source_hash) {
        sources_.push_back(source_hash);
        return *this;
    }

    PatternQuery& WithTimeRange(Timestamp start, Timestamp end) {
        time_range_ = TimeRange{start, end};
        return *this;
    }

    /// 0 = unlimited
    PatternQuery& WithLimit(size_t limit) {
        limit_ = limit;
        return *this;
    }

    const std::vector<PatternType>& types() const { return types_; }
    uint8_t min_confidence() const { return min_confidence_; }
    const std::vector<std::string>& tags() const { return tags_; }
    const std::vector<uint32_t>& sources() const { return sources_; }
    const std::optional<TimeRange>& time_range() const { return time_range_; }
    size_t limit() const { return limit_; }

private:
    std::vector<PatternType> types_;
    uint8_t min_confidence_{kDefaultMinConfidence};
    std::vector<std::string> tags_;
    std::vector<uint32_t> sources_;
    std::optional<TimeRange> time_range_;
    size_t limit_{kDefaultLimit};
};

} // namespace patex
