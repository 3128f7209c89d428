// File: src/storage/warm_tier.hpp
#pragma once

#include "core/pattern.hpp"
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace patex {

/// Tier 2: bounded in-process map. No eviction; new IDs past capacity are rejected.
class WarmTier {
public:
    /// @throws std::invalid_argument if capacity is zero
    explicit WarmTier(size_t capacity);

    /// Store or overwrite
    /// @return false if the ID is new and the tier is full
    bool Put(const Pattern& pattern);

    std::optional<Pattern> Get(PatternID id) const;
    bool Contains(PatternID id) const;
    bool Remove(PatternID id);

    size_t Size() const;
    size_t Capacity() const { return capacity_; }

private:
    size_t capacity_;
    std::unordered_map<PatternID, Pattern> patterns_;
    mutable std::shared_mutex mutex_;
};

} // namespace patex
