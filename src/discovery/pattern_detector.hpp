// File: src/discovery/pattern_detector.hpp
//
// Detection pipeline:
//
//   observations -> ObservationStore -> detection algorithms -> candidates
//                -> PatternCorrelator -> DetectionValidator -> PatternPublisher
//                -> TieredStorage
//
// Rejections from the optional security gate are returned to the caller.
// A candidate whose (key, type, payload) this detector already published is
// counted as a duplicate and not written again.

#pragma once

#include "core/pattern.hpp"
#include "discovery/detection_algorithms.hpp"
#include "discovery/observation_store.hpp"
#include "security/pattern_security.hpp"
#include "storage/tiered_storage.hpp"
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <tuple>
#include <vector>
#include <vector>

namespace patex {

/// Tag every detected pattern carries
constexpr const char* kDetectedTag = "detected";

/// Promotes raw candidates to complete patterns
class PatternCorrelator {
public:
    explicit PatternCorrelator(uint32_t source_hash) : source_hash_(source_hash) {}

    /// Build a pattern tagged with "detected", the detector name and key
    Pattern Correlate(const PatternCandidate& candidate, const std::string& key) const;

    uint32_t source_hash() const { return source_hash_; }

private:
    uint32_t source_hash_;
};

/// Structural admission check for freshly correlated patterns
class DetectionValidator {
public:
    struct Config {
        uint8_t min_confidence{70};
        std::chrono::hours max_age{24};

        bool IsValid() const {
            return min_confidence <= kMaxConfidence && max_age.count() > 0;
        }
    };

    DetectionValidator();

    /// @throws std::invalid_argument if config is invalid
    explicit DetectionValidator(const Config& config);

    /// Magic matches, confidence high enough and not older than max_age
    bool Validate(const Pattern& pattern, Timestamp now) const;

    const Config& config() const { return config_; }

private:
    Config config_;
};

struct RejectedPattern {
    Pattern pattern;
    std::vector<ThreatIndicator> threats;
};

/// Writes validated patterns into storage, optionally behind the security gate
class PatternPublisher {
public:
    struct Outcome {
        bool published{false};
        PatternID id;
        std::vector<ThreatIndicator> threats;
    };

    /// @param security May be null to publish without the security gate
    PatternPublisher(TieredStorage& storage, const SecurityValidator* security);

    /// Gate, flag and write pattern. On success the assigned ID is written back.
    /// @throws PatternError(SERIALIZATION_FAILED) if storage cannot take it
    Outcome Publish(Pattern& pattern);

private:
    TieredStorage& storage_;
    const SecurityValidator* security_;
};

/// Sliding-window pattern detector
class PatternDetector {
public:
    struct Config {
        /// Observations kept per key
        size_t window_size{1000};

        /// Keys with fewer observations are skipped
        size_t min_samples{10};

        uint8_t min_confidence{70};
        std::chrono::hours max_age{24};

        /// Producer name hashed into the source field of detected patterns
        std::string source_name{"patex.local"};

        DetectionParams params;

        bool IsValid() const;
    };

    struct DetectionResult {
        std::vector<Pattern> published;
        std::vector<RejectedPattern> rejected;

        /// Candidates produced by the algorithms
        size_t candidates{0};

        /// Candidates dropped by the structural validator
        size_t discarded{0};

        /// Candidates already published by an earlier pass
        size_t duplicates{0};
    };

    /// @param security May be null to publish without the security gate
    /// @throws std::invalid_argument if config is invalid
    PatternDetector(TieredStorage& storage, const SecurityValidator* security,
                    const Config& config);

    void AddObservation(const std::string& key, const Observation& observation);

    /// Run every algorithm over every key with enough samples, in key order
    /// @throws PatternError(SERIALIZATION_FAILED) if publishing fails in storage
    DetectionResult Detect();

    size_t ObservationCount(const std::string& key) const;
    size_t KeyCount() const;
    void ClearObservations();

    uint32_t source_hash() const { return correlator_.source_hash(); }
    const Config& config() const { return config_; }

private:
    Config config_;
    ObservationStore observations_;
    PatternCorrelator correlator_;
    DetectionValidator validator_;
    PatternPublisher publisher_;

    using Signature = std::tuple<std::string, PatternType, std::vector<uint8_t>>;
    std::set<Signature> published_;

    // Serialises detection passes and guards published_
    std::mutex detect_mutex_;
};

/// Summarise a batch of observations as a pattern
///
/// Confidence = success rate x 100; metrics carry the counts, average latency
/// and average cost (as cost savings).
/// @throws std::invalid_argument if observations is empty
Pattern CreatePatternFromObservations(PatternType type,
                                      const std::vector<Observation>& observations);

} // namespace patex
