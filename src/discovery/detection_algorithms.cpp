// File: src/discovery/detection_algorithms.cpp
#include "discovery/detection_algorithms.hpp"
#include "core/pattern.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>

namespace patex {

const char* ToString(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::STATISTICAL: return "statistical";
        case DetectorKind::TEMPORAL: return "temporal";
        case DetectorKind::SEQUENTIAL: return "sequential";
        default: return "unknown";
    }
}

namespace {

// Integer percentage so that 7 of 10 is exactly 70
uint8_t PercentOf(size_t part, size_t whole) {
    if (whole == 0) {
        return 0;
    }
    return static_cast<uint8_t>(std::min<size_t>(part * 100 / whole, kMaxConfidence));
}

size_t CountSuccesses(const std::vector<Observation>& window) {
    return static_cast<size_t>(std::count_if(window.begin(), window.end(),
        [](const Observation& obs) { return obs.success; }));
}

// ============================================================================
// Statistical: overall success rate
// ============================================================================

std::vector<PatternCandidate> DetectStatistical(const std::vector<Observation>& window,
                                                const DetectionParams& params) {
    if (window.empty()) {
        return {};
    }

    const size_t successes = CountSuccesses(window);
    const double rate = static_cast<double>(successes) / static_cast<double>(window.size());
    if (rate < params.statistical_threshold) {
        return {};
    }

    PatternCandidate candidate;
    candidate.detector = DetectorKind::STATISTICAL;
    candidate.type = PatternType::ATOMIC;
    candidate.complexity = 1;
    candidate.confidence = PercentOf(successes, window.size());
    candidate.evidence_count = window.size();
    return {candidate};
}

// ============================================================================
// Temporal: success rate per UTC hour of day
// ============================================================================

std::vector<PatternCandidate> DetectTemporal(const std::vector<Observation>& window,
                                             const DetectionParams& params) {
    struct Bucket {
        size_t total{0};
        size_t successes{0};
    };

    std::map<int, Bucket> buckets;
    for (const auto& obs : window) {
        Bucket& bucket = buckets[obs.timestamp.HourOfDay()];
        ++bucket.total;
        if (obs.success) {
            ++bucket.successes;
        }
    }

    std::vector<PatternCandidate> candidates;
    for (const auto& [hour, bucket] : buckets) {
        if (bucket.total < params.temporal_min_bucket) {
            continue;
        }

        const double rate = static_cast<double>(bucket.successes) / static_cast<double>(bucket.total);
        if (!(rate > params.temporal_high) && !(rate < params.temporal_low)) {
            continue;
        }

        // Confidence is the success rate, so a failing hour is left for the
        // validator's confidence gate to drop
        PatternCandidate candidate;
        candidate.detector = DetectorKind::TEMPORAL;
        candidate.type = PatternType::TEMPORAL;
        candidate.complexity = 3;
        candidate.confidence = PercentOf(bucket.successes, bucket.total);
        candidate.data = {static_cast<uint8_t>(hour), 0, 0, 0};
        candidate.evidence_count = bucket.total;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

// ============================================================================
// Sequential: repeated runs of consecutive actions
// ============================================================================

std::vector<PatternCandidate> DetectSequential(const std::vector<Observation>& window,
                                               const DetectionParams& params) {
    const size_t length = params.sequence_length;
    if (length == 0 || window.size() < length) {
        return {};
    }

    std::map<std::vector<std::string>, size_t> frequencies;
    for (size_t start = 0; start + length <= window.size(); ++start) {
        std::vector<std::string> steps;
        steps.reserve(length);
        for (size_t i = start; i < start + length; ++i) {
            auto action = window[i].Action();
            if (!action) {
                break;
            }
            steps.push_back(std::move(*action));
        }
        if (steps.size() == length) {
            ++frequencies[steps];
        }
    }

    std::vector<PatternCandidate> candidates;
    for (const auto& [steps, frequency] : frequencies) {
        if (frequency < params.sequence_min_frequency) {
            continue;
        }

        PatternCandidate candidate;
        candidate.detector = DetectorKind::SEQUENTIAL;
        candidate.type = PatternType::SEQUENTIAL;
        candidate.complexity = 5;
        candidate.confidence = static_cast<uint8_t>(
            std::min<size_t>(frequency * 10, kMaxConfidence));
        for (const auto& step : steps) {
            candidate.data.insert(candidate.data.end(), step.begin(), step.end());
            candidate.data.push_back(0);
        }
        candidate.evidence_count = frequency;
        candidates.push_back(std::move(candidate));
    }
    return candidates;
}

const DetectorStrategy kStrategies[] = {
    {DetectorKind::STATISTICAL, PatternType::ATOMIC, 1, &DetectStatistical},
    {DetectorKind::TEMPORAL, PatternType::TEMPORAL, 3, &DetectTemporal},
    {DetectorKind::SEQUENTIAL, PatternType::SEQUENTIAL, 5, &DetectSequential},
};

} // anonymous namespace

const DetectorStrategy& StrategyFor(DetectorKind kind) {
    for (const auto& strategy : kStrategies) {
        if (strategy.kind == kind) {
            return strategy;
        }
    }
    throw std::invalid_argument("Unknown detector kind");
}

std::vector<PatternCandidate> RunDetector(DetectorKind kind,
                                          const std::vector<Observation>& window,
                                          const DetectionParams& params) {
    return StrategyFor(kind).detect(window, params);
}

} // namespace patex
