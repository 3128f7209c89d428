// File: tests/core/pattern_test.cpp
#include "core/pattern.hpp"
#include <gtest/gtest.h>
#include <stdexcept>

namespace patex {
namespace {

TEST(PatternTest, CreateSetsDefaults) {
    Pattern p = Pattern::Create(PatternType::CONDITIONAL, 42);

    EXPECT_EQ(kPatternMagic, p.header.magic);
    EXPECT_FALSE(p.header.id.IsValid());
    EXPECT_EQ(1u, p.header.version);
    EXPECT_EQ(PatternType::CONDITIONAL, p.header.type);
    EXPECT_EQ(1u, p.header.complexity);
    EXPECT_EQ(42u, p.header.source_hash);
    EXPECT_FLOAT_EQ(1.0f, p.header.weight);
    EXPECT_TRUE(p.IsActive());
    EXPECT_FALSE(p.header.timestamp.IsZero());
}

TEST(PatternTest, IsValidNeedsAssignedId) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    EXPECT_FALSE(p.IsValid());

    p.header.id = PatternID(7);
    EXPECT_TRUE(p.IsValid());

    p.header.magic = 0;
    EXPECT_FALSE(p.IsValid());
}

TEST(PatternTest, FlagHelpers) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    EXPECT_FALSE(p.HasFlag(PatternFlags::TRUSTED));

    p.SetFlag(PatternFlags::TRUSTED);
    EXPECT_TRUE(p.HasFlag(PatternFlags::TRUSTED));
    EXPECT_TRUE(p.HasFlag(PatternFlags::ACTIVE));

    p.ClearFlag(PatternFlags::ACTIVE);
    EXPECT_FALSE(p.IsActive());
    EXPECT_TRUE(p.HasFlag(PatternFlags::TRUSTED));
}

TEST(PatternTest, ExpirationZeroNeverExpires) {
    Pattern p = Pattern::Create(PatternType::TEMPORAL, 1);
    EXPECT_FALSE(p.IsExpired(Timestamp::Now()));

    Timestamp now = Timestamp::Now();
    p.header.expiration = now - std::chrono::seconds(1);
    EXPECT_TRUE(p.IsExpired(now));

    p.header.expiration = now + std::chrono::hours(1);
    EXPECT_FALSE(p.IsExpired(now));
}

TEST(PatternTest, UpdateSuccessRateTracksCounters) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);

    p.UpdateSuccessRate(true);
    p.UpdateSuccessRate(true);
    p.UpdateSuccessRate(false);
    p.UpdateSuccessRate(true);

    EXPECT_EQ(4u, p.metadata.metrics.applications);
    EXPECT_EQ(3u, p.metadata.metrics.successes);
    EXPECT_EQ(1u, p.metadata.metrics.failures);
    EXPECT_FLOAT_EQ(0.75f, p.header.success_rate);
    EXPECT_FALSE(p.metadata.metrics.last_applied.IsZero());
}

TEST(PatternTest, ValidateStructureAcceptsFreshPattern) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    EXPECT_NO_THROW(p.ValidateStructure());
}

TEST(PatternTest, ValidateStructureRejectsOutOfRangeFields) {
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.header.magic = 0xdeadbeef;
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.payload.assign(kMaxPayloadSize + 1, 0);
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.header.complexity = 0;
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
        p.header.complexity = 11;
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.header.confidence = 101;
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.header.weight = 1.5f;
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
        p.metadata.tags.assign(kMaxTags + 1, "t");
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
    {
        Pattern p = Pattern::Create(PatternType::SECURITY, 1);
        EXPECT_NO_THROW(p.ValidateStructure());
        p.header.type = static_cast<PatternType>(kPatternTypeCount);
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
        p.header.type = static_cast<PatternType>(0xFFFF);
        EXPECT_THROW(p.ValidateStructure(), std::invalid_argument);
    }
}

TEST(PatternTest, PayloadAtLimitIsAccepted) {
    Pattern p = Pattern::Create(PatternType::ATOMIC, 1);
    p.payload.assign(kMaxPayloadSize, 0xAB);
    EXPECT_NO_THROW(p.ValidateStructure());
}

TEST(PatternTest, HasTagAndToString) {
    Pattern p = Pattern::Create(PatternType::SEQUENTIAL, 1);
    p.header.id = PatternID(1000001);
    p.metadata.tags = {"detected", "sequential"};

    EXPECT_TRUE(p.HasTag("detected"));
    EXPECT_FALSE(p.HasTag("temporal"));

    std::string text = p.ToString();
    EXPECT_NE(std::string::npos, text.find("PatternID(1000001)"));
    EXPECT_NE(std::string::npos, text.find("SEQUENTIAL"));
    EXPECT_NE(std::string::npos, text.find("tags=[detected,sequential]"));
}

} // namespace
} // namespace patex
