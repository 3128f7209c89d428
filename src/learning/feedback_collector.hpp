// File: src/learning/feedback_collector.hpp
#pragma once

#include "core/types.hpp"
#include <map>
#include <shared_mutex>
#include <vector>

namespace patex {

/// Outcome of one pattern application, reported by its consumer
struct Feedback {
    PatternID pattern_id;
    Timestamp timestamp;
    bool success{false};

    /// Relative improvement the pattern produced (0 = none)
    double improvement{0.0};

    double latency_ms{0.0};
    double cost{0.0};
};

/// Feedback grouped by pattern
class FeedbackCollector {
public:
    void Add(const Feedback& feedback);

    /// Copy of every group, ordered by pattern ID
    std::map<PatternID, std::vector<Feedback>> Snapshot() const;

    /// Total feedback records
    size_t Count() const;

    /// Number of distinct patterns with feedback
    size_t PatternCount() const;

    void Clear();

private:
    std::map<PatternID, std::vector<Feedback>> feedback_;
    size_t count_{0};
    mutable std::shared_mutex mutex_;
};

} // namespace patex
