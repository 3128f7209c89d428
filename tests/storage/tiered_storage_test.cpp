// File: tests/storage/tiered_storage_test.cpp
#include "storage/tiered_storage.hpp"
#include "codec/binary_codec.hpp"
#include "core/errors.hpp"
#include <gtest/gtest.h>
#include <memory>
#include <stdexcept>

namespace patex {
namespace {

class TieredStorageTest : public ::testing::Test {
protected:
    void Init(const TieredStorage::Config& config) {
        storage_.reset();
        config_ = config;
        region_ = std::make_unique<MappedRegion>(TieredStorage::LayoutFor(config).RequiredSize());
        auto cold = std::make_unique<FileColdStore>(FileColdStore::Config{""});
        cold_ = cold.get();
        storage_ = std::make_unique<TieredStorage>(*region_, std::move(cold), config);
    }

    void InitDefault() {
        TieredStorage::Config config;
        config.hot_capacity = 16;
        config.arena_size = 1u << 14;
        config.warm_capacity = 64;
        config.ephemeral_capacity = 8;
        Init(config);
    }

    static Pattern Make(PatternType type = PatternType::ATOMIC, uint8_t confidence = 80,
                        size_t payload_size = 0) {
        Pattern p = Pattern::Create(type, 1234);
        p.header.confidence = confidence;
        p.payload.assign(payload_size, 0x5A);
        return p;
    }

    TieredStorage::Config config_;
    std::unique_ptr<MappedRegion> region_;
    IColdStore* cold_{nullptr};
    std::unique_ptr<TieredStorage> storage_;
};

TEST_F(TieredStorageTest, InvalidConstructionThrows) {
    TieredStorage::Config config;
    config.hot_capacity = 4;
    config.arena_size = 1024;
    MappedRegion small(128);

    EXPECT_THROW(TieredStorage(small, std::make_unique<FileColdStore>(FileColdStore::Config{""}), config),
                 std::invalid_argument);

    MappedRegion region(TieredStorage::LayoutFor(config).RequiredSize());
    EXPECT_THROW(TieredStorage(region, nullptr, config), std::invalid_argument);

    config.warm_capacity = 0;
    EXPECT_THROW(TieredStorage(region, std::make_unique<FileColdStore>(FileColdStore::Config{""}), config),
                 std::invalid_argument);
}

TEST_F(TieredStorageTest, AssignsMonotonicIdsAboveBase) {
    InitDefault();
    Pattern a = Make();
    Pattern b = Make();

    PatternID first = storage_->Write(a);
    PatternID second = storage_->Write(b);

    EXPECT_EQ(PatternID(TieredStorage::kIdBase + 1), first);
    EXPECT_EQ(PatternID(TieredStorage::kIdBase + 2), second);
    EXPECT_EQ(first, a.header.id);
}

TEST_F(TieredStorageTest, WriteThenReadReturnsEqualPattern) {
    InitDefault();
    Pattern p = Make(PatternType::CONDITIONAL, 90, 24);
    p.metadata.tags = {"alpha"};
    p.metadata.conditions.push_back(Condition{"region", "=", "eu"});

    PatternID id = storage_->Write(p);
    auto read = storage_->Read(id);

    ASSERT_TRUE(read.has_value());
    EXPECT_TRUE(p.header == read->header);
    EXPECT_EQ(p.payload, read->payload);
    EXPECT_EQ(p.metadata.tags, read->metadata.tags);
    EXPECT_EQ(p.metadata.conditions, read->metadata.conditions);
    EXPECT_EQ(1u, storage_->GetStats().cache_hits);
}

TEST_F(TieredStorageTest, MalformedPatternRejected) {
    InitDefault();
    Pattern p = Make();
    p.header.complexity = 0;
    EXPECT_THROW(storage_->Write(p), std::invalid_argument);
    EXPECT_EQ(0u, storage_->GetStats().total_patterns);
}

TEST_F(TieredStorageTest, BloomNegativeReadIsMiss) {
    InitDefault();
    EXPECT_FALSE(storage_->MightContain(PatternID(42)));
    EXPECT_FALSE(storage_->Read(PatternID(42)).has_value());
    EXPECT_EQ(1u, storage_->GetStats().cache_misses);
}

TEST_F(TieredStorageTest, HotTierEvictsLeastRecentAndDropsIt) {
    TieredStorage::Config config;
    config.hot_capacity = 3;
    config.arena_size = 4096;
    Init(config);

    Pattern p1 = Make(), p2 = Make(), p3 = Make(), p4 = Make();
    storage_->Write(p1);
    storage_->Write(p2);
    storage_->Write(p3);
    ASSERT_TRUE(storage_->Read(p1.header.id).has_value());

    storage_->Write(p4);

    auto stats = storage_->GetStats();
    EXPECT_EQ(3u, stats.hot_count);
    EXPECT_EQ(1u, stats.evictions);
    EXPECT_EQ(0u, stats.warm_count);
    EXPECT_EQ(0u, stats.cold_count);
    EXPECT_EQ(4u, stats.total_patterns);

    EXPECT_TRUE(storage_->MightContain(p2.header.id));
    EXPECT_FALSE(storage_->Read(p2.header.id).has_value());
    EXPECT_TRUE(storage_->Read(p1.header.id).has_value());
    EXPECT_TRUE(storage_->Read(p3.header.id).has_value());
    EXPECT_TRUE(storage_->Read(p4.header.id).has_value());
}

TEST_F(TieredStorageTest, ArenaExhaustionCascadesToWarm) {
    TieredStorage::Config config;
    config.hot_capacity = 8;
    config.arena_size = 64;
    Init(config);

    Pattern big1 = Make(PatternType::ATOMIC, 80, 48);
    Pattern big2 = Make(PatternType::ATOMIC, 80, 48);
    storage_->Write(big1);
    storage_->Write(big2);

    auto stats = storage_->GetStats();
    EXPECT_EQ(1u, stats.hot_count);
    EXPECT_EQ(1u, stats.warm_count);
    EXPECT_EQ(0u, stats.evictions);
    EXPECT_GE(stats.arena_failures, 1u);

    auto read = storage_->Read(big2.header.id);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(big2.payload, read->payload);
}

TEST_F(TieredStorageTest, FullWarmTierCascadesToCold) {
    TieredStorage::Config config;
    config.hot_capacity = 4;
    config.arena_size = 64;
    config.warm_capacity = 1;
    Init(config);

    Pattern a = Make(PatternType::ATOMIC, 80, 64);
    Pattern b = Make(PatternType::ATOMIC, 80, 64);
    Pattern c = Make(PatternType::ATOMIC, 80, 64);
    storage_->Write(a);
    storage_->Write(b);
    storage_->Write(c);

    auto stats = storage_->GetStats();
    EXPECT_EQ(1u, stats.hot_count);
    EXPECT_EQ(1u, stats.warm_count);
    EXPECT_EQ(1u, stats.cold_count);
    EXPECT_TRUE(cold_->Contains(c.header.id));

    auto read = storage_->Read(c.header.id);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(c.payload, read->payload);
}

TEST_F(TieredStorageTest, ColdRecordIsBloomGated) {
    TieredStorage::Config config;
    config.hot_capacity = 4;
    config.arena_size = 64;
    Init(config);

    // Record present only in the durable store, never written through this instance
    Pattern c = Make(PatternType::ATOMIC, 80, 8);
    c.header.id = PatternID(TieredStorage::kIdBase + 500);
    cold_->Write(c);

    EXPECT_FALSE(storage_->MightContain(c.header.id));
    EXPECT_FALSE(storage_->Read(c.header.id).has_value());
}

TEST_F(TieredStorageTest, WarmHitWithoutArenaRoomStaysWarm) {
    TieredStorage::Config config;
    config.hot_capacity = 2;
    config.arena_size = 64;
    Init(config);

    Pattern big = Make(PatternType::ATOMIC, 80, 64);
    storage_->Write(big);
    Pattern spill = Make(PatternType::ATOMIC, 80, 8);
    storage_->Write(spill);

    ASSERT_EQ(1u, storage_->GetStats().warm_count);

    auto read = storage_->Read(spill.header.id);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(spill.payload, read->payload);
    EXPECT_EQ(0u, storage_->GetStats().promotions);
    EXPECT_EQ(1u, storage_->GetStats().hot_count);
}

TEST_F(TieredStorageTest, WarmHitPromotesToHotByDuplication) {
    TieredStorage::Config config;
    config.hot_capacity = 4;
    config.arena_size = 64;
    Init(config);

    Pattern big = Make(PatternType::ATOMIC, 80, 64);
    storage_->Write(big);
    Pattern spill = Make(PatternType::ATOMIC, 80, 8);
    storage_->Write(spill);
    ASSERT_EQ(1u, storage_->GetStats().warm_count);

    // An external producer rewinds the shared bump pointer
    RegionLayout layout = TieredStorage::LayoutFor(config);
    region_->AtomicAdd(layout.allocator_offset, -64);

    auto read = storage_->Read(spill.header.id);
    ASSERT_TRUE(read.has_value());

    auto stats = storage_->GetStats();
    EXPECT_EQ(1u, stats.promotions);
    EXPECT_EQ(2u, stats.hot_count);
    EXPECT_EQ(1u, stats.warm_count);

    auto again = storage_->Read(spill.header.id);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(spill.payload, again->payload);
    EXPECT_EQ(1u, storage_->GetStats().promotions);
}

TEST_F(TieredStorageTest, EphemeralTierIsSeparateAndUnindexed) {
    InitDefault();
    Pattern p = Make(PatternType::SECURITY, 95);
    PatternID id = storage_->WriteEphemeral(p);

    EXPECT_TRUE(id.IsValid());
    auto stats = storage_->GetStats();
    EXPECT_EQ(1u, stats.ephemeral_count);
    EXPECT_EQ(0u, stats.hot_count);
    EXPECT_EQ(0u, stats.total_patterns);

    auto read = storage_->Read(id);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(PatternType::SECURITY, read->header.type);

    EXPECT_TRUE(storage_->Query(PatternQuery().WithType(PatternType::SECURITY)).empty());
}

TEST_F(TieredStorageTest, QueryUsesFirstCategory) {
    InitDefault();
    Pattern atomic = Make(PatternType::ATOMIC, 90);
    atomic.metadata.tags = {"fast"};
    Pattern temporal = Make(PatternType::TEMPORAL, 50);
    temporal.metadata.tags = {"slow"};
    storage_->Write(atomic);
    storage_->Write(temporal);

    // Tags win over type
    auto by_tag = storage_->Query(PatternQuery().WithTag("slow").WithType(PatternType::ATOMIC));
    ASSERT_EQ(1u, by_tag.size());
    EXPECT_EQ(temporal.header.id, by_tag[0].header.id);

    // Default min confidence applies when nothing else is supplied
    auto by_conf = storage_->Query(PatternQuery());
    ASSERT_EQ(1u, by_conf.size());
    EXPECT_EQ(atomic.header.id, by_conf[0].header.id);

    // Types take precedence over min confidence
    auto by_type = storage_->Query(PatternQuery().WithType(PatternType::TEMPORAL).WithMinConfidence(95));
    ASSERT_EQ(1u, by_type.size());

    auto by_source = storage_->Query(PatternQuery().WithMinConfidence(0).WithSource(1234));
    EXPECT_EQ(2u, by_source.size());
}

TEST_F(TieredStorageTest, QueryDeduplicatesAndLimits) {
    InitDefault();
    for (int i = 0; i < 5; ++i) {
        Pattern p = Make();
        p.metadata.tags = {"a", "b"};
        storage_->Write(p);
    }

    auto both = storage_->Query(PatternQuery().WithTag("a").WithTag("b").WithLimit(0));
    EXPECT_EQ(5u, both.size());

    auto limited = storage_->Query(PatternQuery().WithTag("a").WithLimit(2));
    EXPECT_EQ(2u, limited.size());
}

TEST_F(TieredStorageTest, QueryTimeRangeFilters) {
    InitDefault();
    Pattern old_pattern = Make();
    old_pattern.header.timestamp = Timestamp::Now() - std::chrono::hours(48);
    Pattern fresh = Make();
    storage_->Write(old_pattern);
    storage_->Write(fresh);

    Timestamp now = Timestamp::Now();
    auto recent = storage_->Query(PatternQuery()
                                      .WithType(PatternType::ATOMIC)
                                      .WithTimeRange(now - std::chrono::hours(1), now + std::chrono::hours(1)));
    ASSERT_EQ(1u, recent.size());
    EXPECT_EQ(fresh.header.id, recent[0].header.id);
}

TEST_F(TieredStorageTest, QueryIsIdempotent) {
    InitDefault();
    for (int i = 0; i < 4; ++i) {
        Pattern p = Make(PatternType::PROBABILISTIC, 75);
        storage_->Write(p);
    }

    PatternQuery query = PatternQuery().WithType(PatternType::PROBABILISTIC);
    auto first = storage_->Query(query);
    auto second = storage_->Query(query);

    ASSERT_EQ(first.size(), second.size());
    for (size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].header.id, second[i].header.id);
    }
}

TEST_F(TieredStorageTest, QuerySkipsEvictedPatterns) {
    TieredStorage::Config config;
    config.hot_capacity = 2;
    config.arena_size = 4096;
    Init(config);

    for (int i = 0; i < 5; ++i) {
        Pattern p = Make(PatternType::ADAPTIVE, 80);
        storage_->Write(p);
    }

    EXPECT_EQ(5u, storage_->index().FindByType(PatternType::ADAPTIVE).size());
    EXPECT_EQ(2u, storage_->Query(PatternQuery().WithType(PatternType::ADAPTIVE)).size());
}

TEST_F(TieredStorageTest, SyncImportsExternalProducerWrite) {
    InitDefault();
    RegionLayout layout = TieredStorage::LayoutFor(config_);

    PatternHeader header;
    header.id = PatternID(9000001);
    header.type = PatternType::SECURITY;
    header.confidence = 90;
    header.flags = PatternFlags::ACTIVE;
    auto bytes = EncodeHeader(header, 0, 0);
    region_->Write(layout.SlotOffset(config_.hot_capacity - 1), bytes.data(), bytes.size());

    EXPECT_FALSE(storage_->Read(PatternID(9000001)).has_value());

    auto imported = storage_->SyncFromSharedRegion();
    ASSERT_EQ(1u, imported.size());
    EXPECT_EQ(PatternID(9000001), imported[0]);

    auto read = storage_->Read(PatternID(9000001));
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(PatternType::SECURITY, read->header.type);
    EXPECT_EQ(1u, storage_->Query(PatternQuery().WithType(PatternType::SECURITY)).size());
    EXPECT_EQ(1u, storage_->GetStats().total_patterns);
}

TEST_F(TieredStorageTest, SyncSkipsMalformedExternalHeaders) {
    InitDefault();
    RegionLayout layout = TieredStorage::LayoutFor(config_);

    PatternHeader unknown_type;
    unknown_type.id = PatternID(9000002);
    unknown_type.type = static_cast<PatternType>(42);
    unknown_type.confidence = 90;
    auto bytes = EncodeHeader(unknown_type, 0, 0);
    region_->Write(layout.SlotOffset(config_.hot_capacity - 1), bytes.data(), bytes.size());

    PatternHeader bad_complexity;
    bad_complexity.id = PatternID(9000003);
    bad_complexity.type = PatternType::ATOMIC;
    bad_complexity.complexity = 0;
    bytes = EncodeHeader(bad_complexity, 0, 0);
    region_->Write(layout.SlotOffset(config_.hot_capacity - 2), bytes.data(), bytes.size());

    PatternHeader good;
    good.id = PatternID(9000004);
    good.type = PatternType::ATOMIC;
    good.confidence = 75;
    bytes = EncodeHeader(good, 0, 0);
    region_->Write(layout.SlotOffset(config_.hot_capacity - 3), bytes.data(), bytes.size());

    auto imported = storage_->SyncFromSharedRegion();
    ASSERT_EQ(1u, imported.size());
    EXPECT_EQ(PatternID(9000004), imported[0]);

    EXPECT_FALSE(storage_->MightContain(PatternID(9000002)));
    EXPECT_FALSE(storage_->MightContain(PatternID(9000003)));
    EXPECT_FALSE(storage_->Read(PatternID(9000002)).has_value());
    EXPECT_EQ(1u, storage_->GetStats().total_patterns);
    EXPECT_EQ(1u, storage_->GetStats().hot_count);

    // A later pass still refuses them
    EXPECT_TRUE(storage_->SyncFromSharedRegion().empty());
}

TEST_F(TieredStorageTest, UpdateModifiesUnderLockAndKeepsId) {
    InitDefault();
    Pattern p = Make();
    PatternID id = storage_->Write(p);

    auto updated = storage_->Update(id, [](Pattern& current) {
        current.header.confidence = 55;
        current.header.id = PatternID(1);
    });
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(id, updated->header.id);

    auto read = storage_->Read(id);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(55, read->header.confidence);

    EXPECT_FALSE(storage_->Update(PatternID(42), [](Pattern&) {}).has_value());
    EXPECT_THROW(storage_->Update(id, [](Pattern& current) { current.header.complexity = 0; }),
                 std::invalid_argument);
    EXPECT_EQ(55, storage_->Read(id)->header.confidence);
}

TEST_F(TieredStorageTest, FullSizeHotTierEvictsFirstWritten) {
    TieredStorage::Config config;
    config.hot_capacity = 1024;
    config.arena_size = 1u << 16;
    Init(config);

    PatternID first;
    PatternID last;
    for (int i = 0; i < 1025; ++i) {
        Pattern p = Make();
        PatternID id = storage_->Write(p);
        if (i == 0) first = id;
        last = id;
    }

    EXPECT_EQ(1024u, storage_->GetStats().hot_count);
    EXPECT_FALSE(storage_->Read(first).has_value());
    EXPECT_TRUE(storage_->Read(last).has_value());
}

TEST_F(TieredStorageTest, QueryReturnsSingleMatchingPattern) {
    InitDefault();
    Pattern other = Make(PatternType::ATOMIC, 90);
    storage_->Write(other);

    Pattern match = Make(PatternType::ATOMIC, 60);
    match.metadata.tags = {"query"};
    storage_->Write(match);

    auto results = storage_->Query(
        PatternQuery().WithType(PatternType::ATOMIC).WithMinConfidence(50).WithTag("query"));
    ASSERT_EQ(1u, results.size());
    EXPECT_EQ(match.header.id, results[0].header.id);
}

TEST_F(TieredStorageTest, StatsTrackTotalsAndHitRate) {
    InitDefault();
    Pattern p = Make();
    storage_->Write(p);
    storage_->Write(p);  // Overwrite is not a new pattern

    storage_->Read(p.header.id);
    storage_->Read(PatternID(1));

    auto stats = storage_->GetStats();
    EXPECT_EQ(1u, stats.total_patterns);
    EXPECT_EQ(1u, stats.cache_hits);
    EXPECT_EQ(1u, stats.cache_misses);
    EXPECT_FLOAT_EQ(0.5f, stats.GetHitRate());
}

} // namespace
} // namespace patex
