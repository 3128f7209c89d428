// File: src/security/security_engine.hpp
//
// Request-level security: rate limiting, input validation and
// isolation-forest anomaly scoring. Independent of patterns.

#pragma once

#include "core/types.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace patex {

/// Named numeric features describing one request
using FeatureVector = std::map<std::string, double>;

enum class RequestThreatType {
    ANOMALY,
    RATE_LIMIT,
    INVALID_INPUT,
    SUSPICIOUS_PATTERN,
};

const char* ToString(RequestThreatType type);

struct ThreatEvent {
    RequestThreatType type{RequestThreatType::ANOMALY};
    double severity{0.0};
    std::string source;
    Timestamp timestamp;
    bool blocked{false};
    std::string description;
};

struct SecurityRequest {
    std::string source;
    std::optional<std::string> data;
    FeatureVector features;
};

struct SecurityDecision {
    bool allow{true};
    double threat_score{0.0};
    std::vector<ThreatEvent> threats;
};

// ============================================================================
// RateLimiter
// ============================================================================

/// Token bucket per source
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        double capacity{100.0};
        double refill_per_second{10.0};

        /// Buckets kept at once; past this, refilled buckets are dropped and
        /// then the least recently refilled one
        size_t max_sources{10000};

        bool IsValid() const {
            return capacity >= 1.0 && refill_per_second >= 0.0 && max_sources > 0;
        }
    };

    RateLimiter();

    /// @throws std::invalid_argument if config is invalid
    explicit RateLimiter(const Config& config);

    bool Allow(const std::string& source);

    /// Same as Allow(source) with an explicit clock reading
    bool Allow(const std::string& source, Clock::time_point now);

    /// Tokens left for source (full capacity if never seen)
    double Tokens(const std::string& source) const;

    /// Sources currently holding a bucket
    size_t SourceCount() const;

private:
    struct TokenBucket {
        double tokens;
        Clock::time_point last_refill;
    };

    void MakeRoomLocked(Clock::time_point now);

    Config config_;
    std::unordered_map<std::string, TokenBucket> buckets_;
    mutable std::mutex mutex_;
};

/// Rejects requests that carry no data
class InputValidator {
public:
    bool Validate(const std::optional<std::string>& data) const {
        return data.has_value();
    }
};

// ============================================================================
// AnomalyDetector
// ============================================================================

/// Isolation forest. Anomaly score = 2^(-E[h(x)] / c(n)); untrained => 0.
class AnomalyDetector {
public:
    struct Config {
        size_t num_trees{10};
        size_t sample_size{256};

        /// 0 = seed from std::random_device
        uint64_t seed{0};

        bool IsValid() const { return num_trees > 0 && sample_size > 1; }
    };

    AnomalyDetector();

    /// @throws std::invalid_argument if config is invalid
    explicit AnomalyDetector(const Config& config);
    ~AnomalyDetector();

    /// Build the forest from reference samples, replacing any previous one
    /// @throws std::invalid_argument if fewer than two samples are given
    void Train(const std::vector<FeatureVector>& samples);

    /// @return Anomaly score in (0, 1]; higher is more anomalous
    double Detect(const FeatureVector& features) const;

    bool IsTrained() const;

    /// c(n) = 2 H(n-1) - 2 (n-1) / n, the expected unsuccessful BST search length
    static double AveragePathLength(size_t n);

private:
    struct TreeNode;

    std::unique_ptr<TreeNode> BuildTree(std::vector<const FeatureVector*>& points,
                                        size_t depth, size_t height_limit,
                                        std::mt19937_64& rng) const;
    static double PathLength(const TreeNode* node, const FeatureVector& features, size_t depth);

    Config config_;
    std::vector<std::unique_ptr<TreeNode>> trees_;
    size_t effective_sample_size_{0};
    mutable std::shared_mutex mutex_;
};

/// Aggregate severity: 0.7 * max + 0.3 * mean
class ThreatScorer {
public:
    static double Score(const std::vector<ThreatEvent>& threats);
};

// ============================================================================
// SecurityEngine
// ============================================================================

class SecurityEngine {
public:
    struct Config {
        RateLimiter::Config rate_limit;
        AnomalyDetector::Config anomaly;

        /// Scores above this raise an anomaly threat
        double anomaly_threshold{0.7};

        /// Anomaly scores above this are blocked
        double block_threshold{0.9};

        double rate_limit_severity{0.7};
        double invalid_input_severity{0.8};

        bool IsValid() const;
    };

    struct Stats {
        uint64_t threats_detected{0};
        uint64_t threats_blocked{0};
        double block_rate{0.0};
    };

    SecurityEngine();

    /// @throws std::invalid_argument if config is invalid
    explicit SecurityEngine(const Config& config);

    /// Rate limit, then input validation (each blocks and returns), then anomaly scoring
    SecurityDecision Analyze(const SecurityRequest& request);

    void TrainAnomalyModel(const std::vector<FeatureVector>& samples);

    Stats GetStats() const;

private:
    void RecordThreat(const ThreatEvent& threat);

    Config config_;
    RateLimiter rate_limiter_;
    InputValidator validator_;
    AnomalyDetector anomaly_detector_;

    std::atomic<uint64_t> threats_detected_{0};
    std::atomic<uint64_t> threats_blocked_{0};
};

} // namespace patex
