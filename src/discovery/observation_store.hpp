// File: src/discovery/observation_store.hpp
#pragma once

#include "core/types.hpp"
#include <deque>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace patex {

/// One outcome reported by a runtime component
struct Observation {
    Timestamp timestamp;
    bool success{false};
    double latency_ms{0.0};
    double cost{0.0};

    /// Free-form attributes; "action" feeds sequence detection
    std::map<std::string, std::string> attributes;

    std::optional<std::string> Action() const {
        auto it = attributes.find("action");
        if (it == attributes.end()) {
            return std::nullopt;
        }
        return it->second;
    }
};

/// Capped sliding window of observations per key
class ObservationStore {
public:
    /// @param window_size Samples kept per key; the oldest is dropped first
    /// @throws std::invalid_argument if window_size is zero
    explicit ObservationStore(size_t window_size);

    void Add(const std::string& key, const Observation& observation);

    /// Snapshot of one window in arrival order
    std::vector<Observation> Get(const std::string& key) const;

    /// Keys in sorted order
    std::vector<std::string> Keys() const;

    size_t Count(const std::string& key) const;
    size_t KeyCount() const;
    void Clear();

    size_t window_size() const { return window_size_; }

private:
    size_t window_size_;
    std::map<std::string, std::deque<Observation>> windows_;
    mutable std::shared_mutex mutex_;
};

} // namespace patex
