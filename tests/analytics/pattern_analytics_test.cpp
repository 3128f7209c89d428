// File: tests/analytics/pattern_analytics_test.cpp
#include "analytics/pattern_analytics.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <memory>
#include <stdexcept>

namespace patex {
namespace {

using namespace std::chrono_literals;

class PatternAnalyticsTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.hot_capacity = 8;
        config_.arena_size = 1u << 13;
        config_.warm_capacity = 16;
        config_.ephemeral_capacity = 4;
        region_ = std::make_unique<MappedRegion>(TieredStorage::LayoutFor(config_).RequiredSize());
        storage_ = std::make_unique<TieredStorage>(
            *region_, std::make_unique<FileColdStore>(FileColdStore::Config{""}), config_);
    }

    static bool HasAnomaly(const PerformanceAnalysis& analysis, const std::string& type) {
        return std::any_of(analysis.anomalies.begin(), analysis.anomalies.end(),
                           [&type](const AnalyticsAnomaly& a) { return a.type == type; });
    }

    TieredStorage::Config config_;
    std::unique_ptr<MappedRegion> region_;
    std::unique_ptr<TieredStorage> storage_;
};

TEST_F(PatternAnalyticsTest, InvalidConfigThrows) {
    PatternAnalytics::Config config;
    config.history_size = 1;
    EXPECT_THROW(PatternAnalytics analytics(*storage_, config), std::invalid_argument);
}

TEST_F(PatternAnalyticsTest, DetectionCountersAndFalsePositives) {
    PatternAnalytics analytics(*storage_, {});
    analytics.RecordDetection(2ms, true);
    analytics.RecordDetection(2ms, true);
    analytics.RecordDetection(2ms, true);
    analytics.RecordDetection(4ms, false);

    AnalyticsMetrics metrics = analytics.CollectMetrics();
    EXPECT_EQ(4u, metrics.patterns_detected);
    EXPECT_EQ(1u, metrics.false_positives);
    EXPECT_DOUBLE_EQ(0.25, metrics.FalsePositiveRate());
    EXPECT_DOUBLE_EQ(4.0, metrics.detection_latency_ms);
}

TEST_F(PatternAnalyticsTest, ApplicationAveragesAreRunningMeans) {
    PatternAnalytics analytics(*storage_, {});
    analytics.RecordApplication(true, 0.2, 1ms);
    analytics.RecordApplication(false, 0.4, 3ms);

    AnalyticsMetrics metrics = analytics.CollectMetrics();
    EXPECT_EQ(2u, metrics.patterns_applied);
    EXPECT_DOUBLE_EQ(0.5, metrics.success_rate);
    EXPECT_NEAR(0.3, metrics.avg_improvement, 1e-12);
    EXPECT_DOUBLE_EQ(3.0, metrics.application_latency_ms);
}

TEST_F(PatternAnalyticsTest, EvolutionTracksLatestGeneration) {
    PatternAnalytics analytics(*storage_, {});
    analytics.RecordEvolution(1, true);
    analytics.RecordEvolution(2, true);
    analytics.RecordEvolution(3, false);

    AnalyticsMetrics metrics = analytics.CollectMetrics();
    EXPECT_EQ(3u, metrics.patterns_evolved);
    EXPECT_EQ(3u, metrics.generations);
    EXPECT_NEAR(2.0 / 3.0, metrics.evolution_success, 1e-12);
}

TEST_F(PatternAnalyticsTest, MetricsIncludeStorageUsage) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    PatternID id = storage_->Write(p);
    ASSERT_TRUE(storage_->Read(id).has_value());

    PatternAnalytics analytics(*storage_, {});
    AnalyticsMetrics metrics = analytics.CollectMetrics();
    EXPECT_EQ(1u, metrics.storage.hot);
    EXPECT_EQ(1u, metrics.storage.total_patterns);
    EXPECT_GT(metrics.cache_hit_rate, 0.0);
}

TEST_F(PatternAnalyticsTest, TrendsCompareLastTwoSnapshots) {
    PatternAnalytics analytics(*storage_, {});

    PerformanceAnalysis first = analytics.AnalyzePerformance();
    EXPECT_DOUBLE_EQ(0.0, first.trends.detection_rate);

    analytics.RecordDetection(1ms, true);
    analytics.RecordDetection(1ms, true);
    analytics.RecordApplication(true, 0.0, 1ms);

    PerformanceAnalysis second = analytics.AnalyzePerformance();
    EXPECT_DOUBLE_EQ(2.0, second.trends.detection_rate);
    EXPECT_DOUBLE_EQ(1.0, second.trends.application_rate);
    EXPECT_DOUBLE_EQ(1.0, second.trends.success_rate_trend);
}

TEST_F(PatternAnalyticsTest, AnomaliesNeedEnoughHistory) {
    PatternAnalytics analytics(*storage_, {});
    analytics.RecordApplication(false, 0.0, 1ms);
    analytics.RecordDetection(1ms, false);

    for (int i = 0; i < 9; ++i) {
        EXPECT_TRUE(analytics.AnalyzePerformance().anomalies.empty());
    }

    PerformanceAnalysis analysis = analytics.AnalyzePerformance();
    EXPECT_TRUE(HasAnomaly(analysis, "CACHE_PERFORMANCE"));
    EXPECT_TRUE(HasAnomaly(analysis, "APPLICATION_PERFORMANCE"));
    EXPECT_TRUE(HasAnomaly(analysis, "DETECTION_ACCURACY"));
}

TEST_F(PatternAnalyticsTest, HealthyMetricsRaiseNoAnomalies) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    PatternID id = storage_->Write(p);
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(storage_->Read(id).has_value());
    }

    PatternAnalytics::Config config;
    config.min_history_for_anomalies = 1;
    PatternAnalytics analytics(*storage_, config);
    analytics.RecordApplication(true, 0.1, 1ms);
    analytics.RecordDetection(1ms, true);

    EXPECT_TRUE(analytics.AnalyzePerformance().anomalies.empty());
}

TEST_F(PatternAnalyticsTest, HistoryIsBoundedAndResettable) {
    PatternAnalytics::Config config;
    config.history_size = 3;
    PatternAnalytics analytics(*storage_, config);

    for (int i = 0; i < 5; ++i) {
        analytics.AnalyzePerformance();
    }
    EXPECT_EQ(3u, analytics.HistorySize());

    analytics.RecordDetection(1ms, true);
    analytics.Reset();
    EXPECT_EQ(0u, analytics.HistorySize());
    EXPECT_EQ(0u, analytics.CollectMetrics().patterns_detected);
}

} // namespace
} // namespace patex
