// File: src/discovery/detection_algorithms.hpp
//
// Detection algorithms over one observation window.
//
// The set is closed: each DetectorKind maps to one entry in a strategy
// table, and every strategy yields the same PatternCandidate shape.

#pragma once

#include "core/types.hpp"
#include "discovery/observation_store.hpp"
#include <array>
#include <cstdint>
#include <vector>

namespace patex {

enum class DetectorKind : uint8_t {
    STATISTICAL = 0,
    TEMPORAL = 1,
    SEQUENTIAL = 2,
};

constexpr std::array<DetectorKind, 3> kAllDetectors = {
    DetectorKind::STATISTICAL,
    DetectorKind::TEMPORAL,
    DetectorKind::SEQUENTIAL,
};

/// Lower-case name, used as a pattern tag
const char* ToString(DetectorKind kind);

/// Raw detector output, before correlation into a full pattern
struct PatternCandidate {
    DetectorKind detector{DetectorKind::STATISTICAL};
    PatternType type{PatternType::ATOMIC};
    uint8_t confidence{0};
    uint8_t complexity{1};
    std::vector<uint8_t> data;
    size_t evidence_count{0};
};

/// Thresholds shared by the algorithms
struct DetectionParams {
    /// Statistical: minimum success rate
    double statistical_threshold{0.7};

    /// Temporal: samples per hour bucket and the rate band outside which it fires
    size_t temporal_min_bucket{5};
    double temporal_high{0.8};
    double temporal_low{0.2};

    /// Sequential: window length and repetitions required
    size_t sequence_length{3};
    size_t sequence_min_frequency{3};
};

using DetectFn = std::vector<PatternCandidate> (*)(const std::vector<Observation>&,
                                                   const DetectionParams&);

struct DetectorStrategy {
    DetectorKind kind;
    PatternType type;
    uint8_t complexity;
    DetectFn detect;
};

/// Strategy table entry for kind
const DetectorStrategy& StrategyFor(DetectorKind kind);

/// Run one algorithm over a window snapshot
std::vector<PatternCandidate> RunDetector(DetectorKind kind,
                                          const std::vector<Observation>& window,
                                          const DetectionParams& params);

} // namespace patex
