// File: src/storage/tiered_storage.hpp
//
// Tiered Storage - four-tier pattern cache
//
//   Tier 1 (hot)       shared-region header slots + arena payloads, LRU
//   Tier 2 (warm)      bounded in-process map, rejects past capacity
//   Tier 3 (cold)      unbounded durable store, written synchronously
//   Tier 4 (ephemeral) small LRU for transient entries outside the pipeline
//
// Writes land in the highest tier that accepts them. Reads are gated by the
// Bloom filter and promote one tier up by duplication; the lower tier keeps
// its copy.

#pragma once

#include "codec/bloom_filter.hpp"
#include "core/pattern.hpp"
#include "memory/shared_region.hpp"
#include "storage/cold_store.hpp"
#include "storage/hot_tier.hpp"
#include "storage/lru_cache.hpp"
#include "storage/pattern_index.hpp"
#include "storage/pattern_query.hpp"
#include "storage/warm_tier.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace patex {

class TieredStorage {
public:
    /// First ID handed out is kIdBase + 1
    static constexpr uint64_t kIdBase = 1000000;

    struct Config {
        /// Tier 1 slot count
        size_t hot_capacity{1024};

        /// Tier 1 payload arena in bytes
        size_t arena_size{1u << 20};

        size_t warm_capacity{10000};
        size_t ephemeral_capacity{256};

        size_t bloom_size_bytes{8192};

        bool IsValid() const;
    };

    struct Stats {
        size_t hot_count{0};
        size_t warm_count{0};
        size_t cold_count{0};
        size_t ephemeral_count{0};
        uint64_t total_patterns{0};
        uint64_t cache_hits{0};
        uint64_t cache_misses{0};
        uint64_t promotions{0};
        uint64_t evictions{0};
        size_t arena_used{0};
        uint64_t arena_failures{0};

        /// Calculate hit rate [0,1]
        float GetHitRate() const {
            uint64_t total = cache_hits + cache_misses;
            return total > 0 ? static_cast<float>(cache_hits) / static_cast<float>(total) : 0.0f;
        }
    };

    /// Region layout this configuration needs (slots at offset 0)
    static RegionLayout LayoutFor(const Config& config);

    /// @throws std::invalid_argument if config is invalid, cold_store is null
    ///         or the region is too small for LayoutFor(config)
    TieredStorage(ISharedRegion& region,
                  std::unique_ptr<IColdStore> cold_store,
                  const Config& config);

    TieredStorage(const TieredStorage&) = delete;
    TieredStorage& operator=(const TieredStorage&) = delete;

    /// Store a pattern, assigning an ID if it has none (written back into pattern)
    /// @return The pattern's ID
    /// @throws std::invalid_argument if the pattern is structurally malformed
    /// @throws PatternError(SERIALIZATION_FAILED) if it cascades to Tier 3 and that fails
    PatternID Write(Pattern& pattern);

    /// Look a pattern up through every tier
    /// @return std::nullopt when Bloom-negative or absent from every tier
    std::optional<Pattern> Read(PatternID id);

    /// Read, modify and write back one pattern under the exclusive lock, so
    /// concurrent read-modify-write cycles on the same ID cannot interleave.
    /// The ID is preserved whatever modify does.
    /// @return The stored pattern, or std::nullopt if id does not read
    /// @throws std::invalid_argument if modify leaves the pattern malformed
    std::optional<Pattern> Update(PatternID id, const std::function<void(Pattern&)>& modify);

    /// Tier 4 entry path; assigns an ID if needed, not indexed
    /// @throws std::invalid_argument if the pattern is structurally malformed
    PatternID WriteEphemeral(Pattern& pattern);

    /// Import headers external producers wrote into Tier 1 slots
    /// @return IDs imported by this pass
    std::vector<PatternID> SyncFromSharedRegion();

    /// Candidates from the first supplied query category, deduplicated,
    /// time-filtered and limited. Indexed IDs that no longer read are skipped.
    std::vector<Pattern> Query(const PatternQuery& query);

    /// Bloom-filter membership (may be a false positive)
    bool MightContain(PatternID id) const;

    Stats GetStats() const;

    const PatternIndex& index() const { return index_; }
    const BloomFilter& bloom_filter() const { return bloom_; }
    const Config& config() const { return config_; }

private:
    PatternID AssignId(Pattern& pattern);
    PatternID WriteLocked(Pattern& pattern);
    std::optional<Pattern> ReadLocked(PatternID id);
    std::vector<PatternID> CollectCandidates(const PatternQuery& query) const;

    Config config_;

    std::unique_ptr<HotTier> hot_;
    WarmTier warm_;
    std::unique_ptr<IColdStore> cold_;
    LRUCache<PatternID, Pattern> ephemeral_;

    BloomFilter bloom_;
    PatternIndex index_;

    std::atomic<uint64_t> id_counter_{0};
    std::atomic<uint64_t> total_patterns_{0};
    std::atomic<uint64_t> cache_hits_{0};
    std::atomic<uint64_t> cache_misses_{0};
    std::atomic<uint64_t> promotions_{0};

    mutable std::shared_mutex mutex_;
};

} // namespace patex
