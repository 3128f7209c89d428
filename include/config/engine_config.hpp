// File: include/config/engine_config.hpp
//
// YAML configuration for the PatEx engine.
// Every section maps onto the nested Config of the component it tunes.

#ifndef PATEX_ENGINE_CONFIG_HPP
#define PATEX_ENGINE_CONFIG_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace patex {

/// Configuration structure for the pattern engine
struct EngineConfig {
    // === Tiered Storage ===
    struct Storage {
        size_t hot_capacity = 1024;          // Tier 1 slots
        size_t warm_capacity = 10000;        // Tier 2 entries
        size_t ephemeral_capacity = 256;     // Tier 4 entries
        size_t arena_size = 1u << 20;        // Tier 1 payload arena (bytes)
        size_t bloom_size_bytes = 8192;
        std::string cold_backend = "file";   // "file" or "sqlite"
        std::string cold_path = "patex_cold.yaml";  // Empty = memory only (file backend)
        std::string region_path;             // Empty = anonymous shared mapping
    } storage;

    // === Pattern Detection ===
    struct Detection {
        size_t window_size = 1000;
        size_t min_samples = 10;
        uint32_t min_confidence = 70;
        uint32_t max_age_hours = 24;
        std::string source_name = "patex.local";
    } detection;

    // === Evolution ===
    struct Evolution {
        double mutation_rate = 0.1;
        size_t selection_count = 10;
        uint64_t interval_ms = 60000;
        uint64_t seed = 0;                   // 0 = random device
    } evolution;

    // === Security ===
    struct Security {
        uint64_t logic_bomb_horizon_minutes = 15;
        uint32_t complexity_ceiling = 10;
        double rate_limit_capacity = 100.0;
        double rate_limit_refill_per_second = 10.0;
        size_t rate_limit_max_sources = 10000;
        std::vector<std::string> trusted_sources;  // Producer names
    } security;

    // === Subscriptions ===
    struct Subscription {
        uint64_t tick_ms = 100;
    } subscription;

    // === Analytics ===
    struct Analytics {
        size_t history_size = 100;
    } analytics;

    /// Load configuration from YAML file
    /// @param filepath Path to YAML configuration file
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromFile(const std::string& filepath);

    /// Load configuration from YAML string
    /// @param yaml_content YAML content as string
    /// @return EngineConfig if successful, std::nullopt on error
    static std::optional<EngineConfig> LoadFromString(const std::string& yaml_content);

    /// Save configuration to YAML file
    /// @return true if successful, false on error
    bool SaveToFile(const std::string& filepath) const;

    std::string ToYamlString() const;

    bool Validate() const;

    /// @return One message per invalid setting
    std::vector<std::string> GetValidationErrors() const;

    static EngineConfig Default();
};

} // namespace patex

#endif // PATEX_ENGINE_CONFIG_HPP
