// File: src/storage/warm_tier.cpp
#include "storage/warm_tier.hpp"
#include <mutex>
#include <stdexcept>

namespace patex {

WarmTier::WarmTier(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("WarmTier capacity must be positive");
    }
}

bool WarmTier::Put(const Pattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = patterns_.find(pattern.header.id);
    if (it != patterns_.end()) {
        it->second = pattern;
        return true;
    }

    if (patterns_.size() >= capacity_) {
        return false;
    }

    patterns_.emplace(pattern.header.id, pattern);
    return true;
}

std::optional<Pattern> WarmTier::Get(PatternID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = patterns_.find(id);
    if (it == patterns_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool WarmTier::Contains(PatternID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.count(id) > 0;
}

bool WarmTier::Remove(PatternID id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return patterns_.erase(id) > 0;
}

size_t WarmTier::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

} // namespace patex
