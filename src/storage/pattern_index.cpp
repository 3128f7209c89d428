// File: src/storage/pattern_index.cpp
#include "storage/pattern_index.hpp"
#include <algorithm>
#include <mutex>

namespace patex {

size_t PatternIndex::ConfidenceBucket(uint8_t confidence) {
    return std::min<size_t>(confidence / 10, kBucketCount - 1);
}

size_t PatternIndex::SuccessBucket(float success_rate) {
    if (!(success_rate > 0.0f)) {
        return 0;
    }
    return std::min<size_t>(static_cast<size_t>(success_rate * 10.0f), kBucketCount - 1);
}

size_t PatternIndex::ComplexityBucket(uint8_t complexity) {
    return std::min<size_t>(complexity, kBucketCount - 1);
}

void PatternIndex::Add(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    const PatternID id = pattern.header.id;
    by_type_[pattern.header.type].Add(id);
    by_confidence_[ConfidenceBucket(pattern.header.confidence)].Add(id);
    by_success_[SuccessBucket(pattern.header.success_rate)].Add(id);
    by_complexity_[ComplexityBucket(pattern.header.complexity)].Add(id);
    by_source_[pattern.header.source_hash].Add(id);
    for (const auto& tag : pattern.metadata.tags) {
        by_tag_[tag].Add(id);
    }
    all_ids_.insert(id);
}

std::vector<PatternID> PatternIndex::CollectBuckets(
    const std::array<IdList, kBucketCount>& buckets, size_t first) {
    std::vector<PatternID> result;
    for (size_t b = first; b < kBucketCount; ++b) {
        result.insert(result.end(), buckets[b].ids.begin(), buckets[b].ids.end());
    }
    return result;
}

std::vector<PatternID> PatternIndex::FindByType(PatternType type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_type_.find(type);
    return it == by_type_.end() ? std::vector<PatternID>{} : it->second.ids;
}

std::vector<PatternID> PatternIndex::FindByConfidence(uint8_t min_confidence) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return CollectBuckets(by_confidence_, ConfidenceBucket(min_confidence));
}

std::vector<PatternID> PatternIndex::FindBySuccessRate(float min_rate) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return CollectBuckets(by_success_, SuccessBucket(min_rate));
}

std::vector<PatternID> PatternIndex::FindByComplexity(uint8_t complexity) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return by_complexity_[ComplexityBucket(complexity)].ids;
}

std::vector<PatternID> PatternIndex::FindBySource(uint32_t source_hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_source_.find(source_hash);
    return it == by_source_.end() ? std::vector<PatternID>{} : it->second.ids;
}

std::vector<PatternID> PatternIndex::FindByTag(const std::string& tag) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = by_tag_.find(tag);
    return it == by_tag_.end() ? std::vector<PatternID>{} : it->second.ids;
}

size_t PatternIndex::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return all_ids_.size();
}

void PatternIndex::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    by_type_.clear();
    for (auto& bucket : by_confidence_) bucket = IdList{};
    for (auto& bucket : by_success_) bucket = IdList{};
    for (auto& bucket : by_complexity_) bucket = IdList{};
    by_source_.clear();
    by_tag_.clear();
    all_ids_.clear();
}

} // namespace patex
