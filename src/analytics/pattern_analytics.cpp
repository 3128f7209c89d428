// File: src/analytics/pattern_analytics.cpp
#include "analytics/pattern_analytics.hpp"
#include <mutex>
#include <stdexcept>

namespace patex {

namespace {

double ToMillis(std::chrono::nanoseconds latency) {
    return std::chrono::duration<double, std::milli>(latency).count();
}

// Running mean after the n-th sample
double UpdateMean(double mean, double sample, uint64_t n) {
    const double count = static_cast<double>(n);
    return (mean * (count - 1.0) + sample) / count;
}

} // anonymous namespace

PatternAnalytics::PatternAnalytics(const TieredStorage& storage, const Config& config)
    : storage_(storage), config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid PatternAnalytics configuration");
    }
}

void PatternAnalytics::RecordDetection(std::chrono::nanoseconds latency, bool success) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_detected_.fetch_add(1);
    if (!success) {
        false_positives_.fetch_add(1);
    }
    detection_latency_ms_ = ToMillis(latency);
}

void PatternAnalytics::RecordApplication(bool success, double improvement,
                                         std::chrono::nanoseconds latency) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const uint64_t applied = patterns_applied_.fetch_add(1) + 1;

    success_rate_ = UpdateMean(success_rate_, success ? 1.0 : 0.0, applied);
    avg_improvement_ = UpdateMean(avg_improvement_, improvement, applied);
    application_latency_ms_ = ToMillis(latency);
}

void PatternAnalytics::RecordEvolution(uint32_t generation, bool success) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const uint64_t evolved = patterns_evolved_.fetch_add(1) + 1;

    generations_ = generation;
    evolution_success_ = UpdateMean(evolution_success_, success ? 1.0 : 0.0, evolved);
}

AnalyticsMetrics PatternAnalytics::CollectMetrics() const {
    const TieredStorage::Stats stats = storage_.GetStats();

    AnalyticsMetrics metrics;
    metrics.storage.hot = stats.hot_count;
    metrics.storage.warm = stats.warm_count;
    metrics.storage.cold = stats.cold_count;
    metrics.storage.ephemeral = stats.ephemeral_count;
    metrics.storage.total_patterns = stats.total_patterns;
    metrics.cache_hit_rate = stats.GetHitRate();

    std::shared_lock<std::shared_mutex> lock(mutex_);
    metrics.patterns_detected = patterns_detected_.load();
    metrics.false_positives = false_positives_.load();
    metrics.detection_latency_ms = detection_latency_ms_;
    metrics.patterns_applied = patterns_applied_.load();
    metrics.success_rate = success_rate_;
    metrics.avg_improvement = avg_improvement_;
    metrics.application_latency_ms = application_latency_ms_;
    metrics.patterns_evolved = patterns_evolved_.load();
    metrics.evolution_success = evolution_success_;
    metrics.generations = generations_;
    return metrics;
}

PerformanceAnalysis PatternAnalytics::AnalyzePerformance() {
    PerformanceAnalysis analysis;
    analysis.current = CollectMetrics();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    history_.push_back(analysis.current);
    while (history_.size() > config_.history_size) {
        history_.pop_front();
    }

    analysis.trends = CalculateTrends();
    analysis.anomalies = DetectAnomalies();
    return analysis;
}

PerformanceTrends PatternAnalytics::CalculateTrends() const {
    PerformanceTrends trends;
    if (history_.size() < 2) {
        return trends;
    }

    const AnalyticsMetrics& current = history_[history_.size() - 1];
    const AnalyticsMetrics& previous = history_[history_.size() - 2];

    trends.detection_rate = static_cast<double>(current.patterns_detected) -
                            static_cast<double>(previous.patterns_detected);
    trends.application_rate = static_cast<double>(current.patterns_applied) -
                              static_cast<double>(previous.patterns_applied);
    trends.success_rate_trend = current.success_rate - previous.success_rate;
    trends.cache_hit_trend = current.cache_hit_rate - previous.cache_hit_rate;
    return trends;
}

std::vector<AnalyticsAnomaly> PatternAnalytics::DetectAnomalies() const {
    std::vector<AnalyticsAnomaly> anomalies;
    if (history_.size() < config_.min_history_for_anomalies) {
        return anomalies;
    }

    const AnalyticsMetrics& current = history_.back();

    if (current.cache_hit_rate < config_.min_cache_hit_rate) {
        anomalies.push_back({"CACHE_PERFORMANCE", "WARNING",
                             "Cache hit rate below threshold", current.cache_hit_rate});
    }

    if (current.success_rate < config_.min_success_rate) {
        anomalies.push_back({"APPLICATION_PERFORMANCE", "WARNING",
                             "Pattern success rate below threshold", current.success_rate});
    }

    const double fp_rate = current.FalsePositiveRate();
    if (fp_rate > config_.max_false_positive_rate) {
        anomalies.push_back({"DETECTION_ACCURACY", "WARNING",
                             "False positive rate above threshold", fp_rate});
    }

    return anomalies;
}

size_t PatternAnalytics::HistorySize() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return history_.size();
}

void PatternAnalytics::Reset() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_detected_.store(0);
    false_positives_.store(0);
    patterns_applied_.store(0);
    patterns_evolved_.store(0);
    detection_latency_ms_ = 0.0;
    success_rate_ = 0.0;
    avg_improvement_ = 0.0;
    application_latency_ms_ = 0.0;
    evolution_success_ = 0.0;
    generations_ = 0;
    history_.clear();
}

} // namespace patex
