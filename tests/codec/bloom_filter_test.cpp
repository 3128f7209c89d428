// File: tests/codec/bloom_filter_test.cpp
#include "codec/bloom_filter.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace patex {
namespace {

TEST(BloomFilterTest, DefaultGeometry) {
    BloomFilter filter;
    EXPECT_EQ(8192u * 8, filter.BitCount());
    EXPECT_EQ(3u, filter.HashCount());
    EXPECT_EQ(0u, filter.PopCount());
}

TEST(BloomFilterTest, InvalidConfigThrows) {
    BloomFilter::Config config;
    config.size_bytes = 0;
    EXPECT_THROW(BloomFilter{config}, std::invalid_argument);

    config.size_bytes = 16;
    config.hash_count = 0;
    EXPECT_THROW(BloomFilter{config}, std::invalid_argument);
}

TEST(BloomFilterTest, NoFalseNegatives) {
    BloomFilter filter;
    for (uint64_t i = 1; i <= 5000; ++i) {
        filter.Add(PatternID(1000000 + i));
    }
    for (uint64_t i = 1; i <= 5000; ++i) {
        EXPECT_TRUE(filter.Contains(PatternID(1000000 + i))) << "missing " << i;
    }
}

TEST(BloomFilterTest, FalsePositiveRateNearEstimate) {
    BloomFilter filter;
    const uint64_t inserted = 2000;
    for (uint64_t i = 1; i <= inserted; ++i) {
        filter.Add(PatternID(i));
    }

    const uint64_t lookups = 20000;
    uint64_t false_positives = 0;
    for (uint64_t i = 0; i < lookups; ++i) {
        if (filter.Contains(PatternID(10000000 + i))) {
            ++false_positives;
        }
    }

    double observed = static_cast<double>(false_positives) / lookups;
    double estimate = filter.EstimateFalsePositiveRate(inserted);
    EXPECT_LT(estimate, 0.01);
    EXPECT_LT(observed, estimate * 3 + 0.005);
}

TEST(BloomFilterTest, EstimateGrowsWithInsertions) {
    BloomFilter filter;
    EXPECT_DOUBLE_EQ(0.0, filter.EstimateFalsePositiveRate(0));
    EXPECT_LT(filter.EstimateFalsePositiveRate(100), filter.EstimateFalsePositiveRate(10000));
}

TEST(BloomFilterTest, ClearResetsBits) {
    BloomFilter::Config config;
    config.size_bytes = 64;
    BloomFilter filter(config);

    filter.Add(PatternID(42));
    EXPECT_TRUE(filter.Contains(PatternID(42)));
    EXPECT_GT(filter.PopCount(), 0u);
    EXPECT_LE(filter.PopCount(), 3u);

    filter.Clear();
    EXPECT_EQ(0u, filter.PopCount());
    EXPECT_FALSE(filter.Contains(PatternID(42)));
}

} // namespace
} // namespace patex
