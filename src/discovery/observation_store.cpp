// File: src/discovery/observation_store.cpp
#include "discovery/observation_store.hpp"
#include <mutex>
#include <stdexcept>

namespace patex {

ObservationStore::ObservationStore(size_t window_size) : window_size_(window_size) {
    if (window_size_ == 0) {
        throw std::invalid_argument("ObservationStore window size must be positive");
    }
}

void ObservationStore::Add(const std::string& key, const Observation& observation) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto& window = windows_[key];
    window.push_back(observation);
    while (window.size() > window_size_) {
        window.pop_front();
    }
}

std::vector<Observation> ObservationStore::Get(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = windows_.find(key);
    if (it == windows_.end()) {
        return {};
    }
    return std::vector<Observation>(it->second.begin(), it->second.end());
}

std::vector<std::string> ObservationStore::Keys() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> keys;
    keys.reserve(windows_.size());
    for (const auto& entry : windows_) {
        keys.push_back(entry.first);
    }
    return keys;
}

size_t ObservationStore::Count(const std::string& key) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = windows_.find(key);
    return it == windows_.end() ? 0 : it->second.size();
}

size_t ObservationStore::KeyCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return windows_.size();
}

void ObservationStore::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    windows_.clear();
}

} // namespace patex
