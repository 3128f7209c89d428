// File: tests/storage/cold_store_test.cpp
#include "storage/cold_store.hpp"
#include "storage/record_format.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

namespace patex {
namespace {

std::string TempPath(const std::string& name) {
    return "/tmp/patex_cold_" + name + "_" + std::to_string(::getpid());
}

Pattern MakeRecord(uint64_t id) {
    Pattern p = Pattern::Create(PatternType::CONDITIONAL, 0xABCD);
    p.header.id = PatternID(id);
    p.header.confidence = 85;
    p.header.complexity = 3;
    p.header.weight = 0.5f;
    p.header.success_rate = 0.75f;
    p.header.flags |= PatternFlags::VALIDATED;
    p.encoding = DataEncoding::EXPRESSION;
    p.payload = {0x00, 0x7F, 0xFF, 0x10};
    p.metadata.tags = {"detected", "needs \"quotes\""};
    p.metadata.conditions.push_back(Condition{"region", "==", "eu-west"});
    p.metadata.constraints.push_back(Constraint{"max_latency", "250ms"});
    p.metadata.metrics.applications = 12;
    p.metadata.metrics.successes = 9;
    p.metadata.metrics.failures = 3;
    p.metadata.metrics.avg_latency_ms = 12.5;
    p.links.evolved_from = {PatternID(7), PatternID(8)};
    p.links.alternatives = {PatternID(9)};
    return p;
}

void ExpectSameRecord(const Pattern& expected, const Pattern& actual) {
    EXPECT_TRUE(expected.header == actual.header);
    EXPECT_EQ(expected.encoding, actual.encoding);
    EXPECT_EQ(expected.payload, actual.payload);
    EXPECT_EQ(expected.metadata.tags, actual.metadata.tags);
    EXPECT_EQ(expected.metadata.conditions, actual.metadata.conditions);
    EXPECT_EQ(expected.metadata.constraints, actual.metadata.constraints);
    EXPECT_TRUE(expected.metadata.metrics == actual.metadata.metrics);
    EXPECT_EQ(expected.links.evolved_from, actual.links.evolved_from);
    EXPECT_EQ(expected.links.alternatives, actual.links.alternatives);
}

// ============================================================================
// Record format
// ============================================================================

TEST(RecordFormatTest, HexHelpers) {
    EXPECT_EQ("007fff", ToHex({0x00, 0x7F, 0xFF}));
    EXPECT_EQ((std::vector<uint8_t>{0xAB, 0x01}), FromHex("ab01"));
    EXPECT_TRUE(FromHex("").empty());
    EXPECT_THROW(FromHex("abc"), std::invalid_argument);
    EXPECT_THROW(FromHex("zz"), std::invalid_argument);
}

TEST(RecordFormatTest, RecordSurvivesYamlText) {
    Pattern p = MakeRecord(1000001);
    auto parsed = RecordFromYaml(RecordToYaml(p));
    ASSERT_TRUE(parsed.has_value());
    ExpectSameRecord(p, *parsed);
}

TEST(RecordFormatTest, ControlAndNonUtf8StringsSurvive) {
    Pattern p = MakeRecord(1000003);
    p.metadata.tags = {"a\x01" "b", "\xff", std::string("nul\0byte", 8), "line\r\nbreak",
                       "del\x7f", "caf\xc3\xa9", "c1\xc2\x85"};
    p.metadata.conditions = {Condition{"field\x1b", "==", "\xfe\xfd"}};
    p.metadata.constraints = {Constraint{"\xe2\x80\xa8sep", "\x80"}};

    auto parsed = RecordFromYaml(RecordToYaml(p));
    ASSERT_TRUE(parsed.has_value());
    ExpectSameRecord(p, *parsed);
}

TEST(RecordFormatTest, RecordWithoutIdRejected) {
    EXPECT_FALSE(RecordFromYaml("version: 1\ntype: ATOMIC\n").has_value());
    EXPECT_FALSE(RecordFromYaml("id: 5\ntype: NOT_A_TYPE\n").has_value());
    EXPECT_FALSE(RecordFromYaml("[1, 2, 3]").has_value());
}

// ============================================================================
// FileColdStore
// ============================================================================

TEST(FileColdStoreTest, MemoryOnlyWithEmptyPath) {
    FileColdStore store(FileColdStore::Config{""});
    EXPECT_EQ(0u, store.Count());

    store.Write(MakeRecord(1));
    EXPECT_TRUE(store.Contains(PatternID(1)));
    EXPECT_FALSE(store.Contains(PatternID(2)));
    EXPECT_EQ(1u, store.Count());

    store.Clear();
    EXPECT_EQ(0u, store.Count());
}

TEST(FileColdStoreTest, PersistsAcrossInstances) {
    const std::string path = TempPath("file");
    std::remove(path.c_str());

    Pattern p = MakeRecord(1000002);
    {
        FileColdStore store(FileColdStore::Config{path});
        store.Write(MakeRecord(1000001));
        store.Write(p);
    }
    {
        FileColdStore store(FileColdStore::Config{path});
        EXPECT_EQ(2u, store.Count());
        auto read = store.Read(PatternID(1000002));
        ASSERT_TRUE(read.has_value());
        ExpectSameRecord(p, *read);
    }

    std::remove(path.c_str());
}

TEST(FileColdStoreTest, ControlBytesDoNotCorruptFile) {
    const std::string path = TempPath("control");
    std::remove(path.c_str());

    Pattern plain = MakeRecord(1000001);
    Pattern odd = MakeRecord(1000002);
    odd.metadata.tags = {"a\x01" "b", "\xff"};
    {
        FileColdStore store(FileColdStore::Config{path});
        store.Write(plain);
        store.Write(odd);
        EXPECT_EQ(2u, store.Count());
    }
    {
        FileColdStore store(FileColdStore::Config{path});
        EXPECT_EQ(2u, store.Count());
        auto read = store.Read(PatternID(1000002));
        ASSERT_TRUE(read.has_value());
        ExpectSameRecord(odd, *read);
    }

    std::remove(path.c_str());
}

TEST(FileColdStoreTest, OverwriteReplacesRecord) {
    FileColdStore store(FileColdStore::Config{""});
    Pattern p = MakeRecord(5);
    store.Write(p);
    p.header.version = 9;
    store.Write(p);

    EXPECT_EQ(1u, store.Count());
    EXPECT_EQ(9u, store.Read(PatternID(5))->header.version);
}

TEST(FileColdStoreTest, GarbageFileStartsEmpty) {
    const std::string path = TempPath("garbage");
    {
        std::ofstream out(path);
        out << "patterns: [unterminated\n";
    }

    FileColdStore store(FileColdStore::Config{path});
    EXPECT_EQ(0u, store.Count());

    std::remove(path.c_str());
}

// ============================================================================
// SqliteColdStore
// ============================================================================

TEST(SqliteColdStoreTest, InMemoryDatabase) {
    SqliteColdStore::Config config;
    config.db_path = ":memory:";
    SqliteColdStore store(config);

    Pattern p = MakeRecord(1000003);
    store.Write(p);

    EXPECT_EQ(1u, store.Count());
    EXPECT_TRUE(store.Contains(p.header.id));
    EXPECT_FALSE(store.Read(PatternID(42)).has_value());

    auto read = store.Read(p.header.id);
    ASSERT_TRUE(read.has_value());
    ExpectSameRecord(p, *read);
}

TEST(SqliteColdStoreTest, UpsertAndClear) {
    SqliteColdStore::Config config;
    config.db_path = ":memory:";
    SqliteColdStore store(config);

    Pattern p = MakeRecord(10);
    store.Write(p);
    p.header.confidence = 99;
    store.Write(p);

    EXPECT_EQ(1u, store.Count());
    EXPECT_EQ(99u, store.Read(PatternID(10))->header.confidence);

    store.Clear();
    EXPECT_EQ(0u, store.Count());
}

TEST(SqliteColdStoreTest, PersistsToFile) {
    const std::string path = TempPath("db");
    std::remove(path.c_str());

    SqliteColdStore::Config config;
    config.db_path = path;
    config.synchronous = "NORMAL";
    {
        SqliteColdStore store(config);
        store.Write(MakeRecord(77));
    }
    {
        SqliteColdStore store(config);
        EXPECT_TRUE(store.Contains(PatternID(77)));
    }

    std::remove(path.c_str());
    std::remove((path + "-wal").c_str());
    std::remove((path + "-shm").c_str());
}

TEST(SqliteColdStoreTest, UnopenablePathThrows) {
    SqliteColdStore::Config config;
    config.db_path = "/nonexistent-dir/patex/cold.db";
    EXPECT_THROW(SqliteColdStore store(config), std::runtime_error);
}

} // namespace
} // namespace patex
