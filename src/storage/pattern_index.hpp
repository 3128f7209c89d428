// File: src/storage/pattern_index.hpp
#pragma once

#include "core/pattern.hpp"
#include <array>
#include <map>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace patex {

/// Secondary indices over every pattern ever written.
///
/// Derived and non-authoritative: IDs are never removed when a pattern is
/// evicted, so callers must expect Read() misses on returned IDs. Nothing is
/// rehydrated from the durable tier on restart.
class PatternIndex {
public:
    static constexpr size_t kBucketCount = 11;

    /// Record the pattern under every dimension
    void Add(const Pattern& pattern);

    std::vector<PatternID> FindByType(PatternType type) const;

    /// IDs from confidence buckets min/10 through 10
    std::vector<PatternID> FindByConfidence(uint8_t min_confidence) const;

    /// IDs from success buckets (min*10) through 10
    std::vector<PatternID> FindBySuccessRate(float min_rate) const;

    std::vector<PatternID> FindByComplexity(uint8_t complexity) const;
    std::vector<PatternID> FindBySource(uint32_t source_hash) const;
    std::vector<PatternID> FindByTag(const std::string& tag) const;

    /// Number of distinct IDs indexed
    size_t Size() const;

    void Clear();

    static size_t ConfidenceBucket(uint8_t confidence);
    static size_t SuccessBucket(float success_rate);
    static size_t ComplexityBucket(uint8_t complexity);

private:
    /// Insertion-ordered ID list without duplicates
    struct IdList {
        std::vector<PatternID> ids;
        std::unordered_set<PatternID> members;

        void Add(PatternID id) {
            if (members.insert(id).second) {
                ids.push_back(id);
            }
        }
    };

    static std::vector<PatternID> CollectBuckets(const std::array<IdList, kBucketCount>& buckets,
                                                 size_t first);

    std::map<PatternType, IdList> by_type_;
    std::array<IdList, kBucketCount> by_confidence_;
    std::array<IdList, kBucketCount> by_success_;
    std::array<IdList, kBucketCount> by_complexity_;
    std::unordered_map<uint32_t, IdList> by_source_;
    std::unordered_map<std::string, IdList> by_tag_;
    std::unordered_set<PatternID> all_ids_;

    mutable std::shared_mutex mutex_;
};

} // namespace patex
