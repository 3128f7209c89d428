// File: src/analytics/pattern_analytics.hpp
#pragma once

#include "storage/tiered_storage.hpp"
#include <atomic>
#include <chrono>
#include <deque>
#include <shared_mutex>
#include <string>
#include <vector>

namespace patex {

struct StorageUsage {
    size_t hot{0};
    size_t warm{0};
    size_t cold{0};
    size_t ephemeral{0};
    uint64_t total_patterns{0};
};

/// Point-in-time view of every analytics counter
struct AnalyticsMetrics {
    // Detection
    uint64_t patterns_detected{0};
    uint64_t false_positives{0};
    double detection_latency_ms{0.0};

    // Application
    uint64_t patterns_applied{0};
    double success_rate{0.0};
    double avg_improvement{0.0};
    double application_latency_ms{0.0};

    // Evolution
    uint64_t patterns_evolved{0};
    double evolution_success{0.0};
    uint32_t generations{0};

    // Storage
    StorageUsage storage;
    double cache_hit_rate{0.0};

    double FalsePositiveRate() const {
        return patterns_detected > 0
            ? static_cast<double>(false_positives) / static_cast<double>(patterns_detected)
            : 0.0;
    }
};

/// Deltas between the last two snapshots
struct PerformanceTrends {
    double detection_rate{0.0};
    double application_rate{0.0};
    double success_rate_trend{0.0};
    double cache_hit_trend{0.0};
};

struct AnalyticsAnomaly {
    std::string type;
    std::string severity;
    std::string message;
    double value{0.0};
};

struct PerformanceAnalysis {
    AnalyticsMetrics current;
    PerformanceTrends trends;
    std::vector<AnalyticsAnomaly> anomalies;
};

/// Counters, moving averages and a bounded snapshot history.
/// Anomalies are advisory; nothing acts on them automatically.
class PatternAnalytics {
public:
    struct Config {
        /// Snapshots kept; the oldest is dropped first
        size_t history_size{100};

        /// Snapshots needed before anomalies are reported
        size_t min_history_for_anomalies{10};

        double min_cache_hit_rate{0.8};
        double min_success_rate{0.7};
        double max_false_positive_rate{0.1};

        bool IsValid() const {
            return history_size >= 2 && min_history_for_anomalies > 0;
        }
    };

    /// @throws std::invalid_argument if config is invalid
    PatternAnalytics(const TieredStorage& storage, const Config& config);

    /// @param success false counts a false positive
    void RecordDetection(std::chrono::nanoseconds latency, bool success);

    void RecordApplication(bool success, double improvement, std::chrono::nanoseconds latency);

    void RecordEvolution(uint32_t generation, bool success);

    /// Current counters plus storage statistics
    AnalyticsMetrics CollectMetrics() const;

    /// Snapshot into the history, then compute trends and anomalies
    PerformanceAnalysis AnalyzePerformance();

    size_t HistorySize() const;

    /// Zero every counter and drop the history
    void Reset();

private:
    PerformanceTrends CalculateTrends() const;
    std::vector<AnalyticsAnomaly> DetectAnomalies() const;

    const TieredStorage& storage_;
    Config config_;

    std::atomic<uint64_t> patterns_detected_{0};
    std::atomic<uint64_t> false_positives_{0};
    std::atomic<uint64_t> patterns_applied_{0};
    std::atomic<uint64_t> patterns_evolved_{0};

    // Guarded by mutex_
    double detection_latency_ms_{0.0};
    double success_rate_{0.0};
    double avg_improvement_{0.0};
    double application_latency_ms_{0.0};
    double evolution_success_{0.0};
    uint32_t generations_{0};
    std::deque<AnalyticsMetrics> history_;

    mutable std::shared_mutex mutex_;
};

} // namespace patex
