// File: tests/config/engine_config_test.cpp
//
// Tests for the YAML engine configuration

#include "config/engine_config.hpp"
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <limits>
#include <unistd.h>

namespace patex {
namespace {

class EngineConfigTest : public ::testing::Test {
protected:
    std::string temp_config_path =
        "/tmp/patex_config_test_" + std::to_string(::getpid()) + ".yaml";

    void TearDown() override {
        std::filesystem::remove(temp_config_path);
    }
};

TEST_F(EngineConfigTest, DefaultConfig) {
    auto config = EngineConfig::Default();

    EXPECT_EQ(1024u, config.storage.hot_capacity);
    EXPECT_EQ(10000u, config.storage.warm_capacity);
    EXPECT_EQ("file", config.storage.cold_backend);
    EXPECT_TRUE(config.storage.region_path.empty());

    EXPECT_EQ(70u, config.detection.min_confidence);
    EXPECT_EQ("patex.local", config.detection.source_name);

    EXPECT_DOUBLE_EQ(0.1, config.evolution.mutation_rate);
    EXPECT_EQ(15u, config.security.logic_bomb_horizon_minutes);
    EXPECT_TRUE(config.security.trusted_sources.empty());
    EXPECT_EQ(100u, config.subscription.tick_ms);

    EXPECT_TRUE(config.Validate());
}

TEST_F(EngineConfigTest, LoadFromString) {
    std::string yaml = R"(
storage:
  hot_capacity: 64
  cold_backend: "sqlite"
  cold_path: "/var/lib/patex/cold.db"

detection:
  min_samples: 5
  source_name: "ingest-a"

evolution:
  mutation_rate: 0.25
  seed: 42

security:
  complexity_ceiling: 8
  trusted_sources:
    - "ingest-a"
    - "ingest-b"

subscription:
  tick_ms: 20
)";

    auto config_opt = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config_opt.has_value());

    auto config = config_opt.value();
    EXPECT_EQ(64u, config.storage.hot_capacity);
    EXPECT_EQ("sqlite", config.storage.cold_backend);
    EXPECT_EQ("/var/lib/patex/cold.db", config.storage.cold_path);
    EXPECT_EQ(5u, config.detection.min_samples);
    EXPECT_EQ("ingest-a", config.detection.source_name);
    EXPECT_DOUBLE_EQ(0.25, config.evolution.mutation_rate);
    EXPECT_EQ(42u, config.evolution.seed);
    EXPECT_EQ(8u, config.security.complexity_ceiling);
    ASSERT_EQ(2u, config.security.trusted_sources.size());
    EXPECT_EQ("ingest-b", config.security.trusted_sources[1]);
    EXPECT_EQ(20u, config.subscription.tick_ms);

    // Untouched sections keep their defaults
    EXPECT_EQ(100u, config.analytics.history_size);
    EXPECT_EQ(10000u, config.storage.warm_capacity);
}

TEST_F(EngineConfigTest, UnknownSettingsAreIgnored) {
    std::string yaml = R"(
storage:
  hot_capacity: 32
  compression: "zstd"
telemetry:
  endpoint: "http://localhost"
)";

    auto config = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(32u, config->storage.hot_capacity);
}

TEST_F(EngineConfigTest, MalformedNumberFails) {
    std::string yaml = R"(
storage:
  hot_capacity: lots
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, NegativeUnsignedFails) {
    std::string yaml = R"(
storage:
  hot_capacity: -1
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());

    yaml = R"(
evolution:
  seed: -5
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, OutOfRangeOrTrailingNumberFails) {
    std::string yaml = R"(
detection:
  min_confidence: 4294967296
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());

    yaml = R"(
storage:
  hot_capacity: 64kb
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, NonFiniteDoubleFails) {
    std::string yaml = R"(
evolution:
  mutation_rate: nan
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());

    yaml = R"(
security:
  rate_limit_capacity: inf
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());

    auto config = EngineConfig::Default();
    config.evolution.mutation_rate = std::numeric_limits<double>::quiet_NaN();
    config.security.rate_limit_refill_per_second = std::numeric_limits<double>::infinity();
    EXPECT_EQ(2u, config.GetValidationErrors().size());
}

TEST_F(EngineConfigTest, RateLimitSourcesSetting) {
    std::string yaml = R"(
security:
  rate_limit_max_sources: 250
)";
    auto config = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(config.has_value());
    EXPECT_EQ(250u, config->security.rate_limit_max_sources);

    config->security.rate_limit_max_sources = 0;
    EXPECT_FALSE(config->Validate());
}

TEST_F(EngineConfigTest, MalformedYamlFails) {
    EXPECT_FALSE(EngineConfig::LoadFromString("storage: [unclosed").has_value());
}

TEST_F(EngineConfigTest, InvalidValuesFailValidation) {
    std::string yaml = R"(
evolution:
  mutation_rate: 1.5
)";
    EXPECT_FALSE(EngineConfig::LoadFromString(yaml).has_value());
}

TEST_F(EngineConfigTest, ValidationErrors) {
    auto config = EngineConfig::Default();
    EXPECT_TRUE(config.GetValidationErrors().empty());

    config.storage.hot_capacity = 0;
    config.storage.cold_backend = "redis";
    config.detection.min_samples = config.detection.window_size + 1;
    config.detection.min_confidence = 101;
    config.analytics.history_size = 1;

    auto errors = config.GetValidationErrors();
    EXPECT_EQ(5u, errors.size());
    EXPECT_FALSE(config.Validate());
}

TEST_F(EngineConfigTest, SqliteBackendNeedsPath) {
    auto config = EngineConfig::Default();
    config.storage.cold_backend = "sqlite";
    config.storage.cold_path.clear();
    ASSERT_EQ(1u, config.GetValidationErrors().size());
    EXPECT_EQ("cold_path is required for the sqlite backend", config.GetValidationErrors()[0]);
}

TEST_F(EngineConfigTest, SaveAndLoad) {
    auto config = EngineConfig::Default();
    config.storage.hot_capacity = 256;
    config.storage.region_path = "/dev/shm/patex";
    config.evolution.selection_count = 4;
    config.security.trusted_sources = {"alpha", "beta"};

    ASSERT_TRUE(config.SaveToFile(temp_config_path));

    auto loaded = EngineConfig::LoadFromFile(temp_config_path);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(256u, loaded->storage.hot_capacity);
    EXPECT_EQ("/dev/shm/patex", loaded->storage.region_path);
    EXPECT_EQ(4u, loaded->evolution.selection_count);
    EXPECT_EQ(config.security.trusted_sources, loaded->security.trusted_sources);
}

TEST_F(EngineConfigTest, EmptyTrustedSourcesRoundTrip) {
    auto config = EngineConfig::Default();
    std::string yaml = config.ToYamlString();
    EXPECT_NE(std::string::npos, yaml.find("trusted_sources: []"));

    auto loaded = EngineConfig::LoadFromString(yaml);
    ASSERT_TRUE(loaded.has_value());
    EXPECT_TRUE(loaded->security.trusted_sources.empty());
}

TEST_F(EngineConfigTest, LoadFromMissingFile) {
    EXPECT_FALSE(EngineConfig::LoadFromFile("/nonexistent/patex.yaml").has_value());
}

} // namespace
} // namespace patex
