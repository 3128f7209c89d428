// File: src/storage/tiered_storage.cpp
#include "storage/tiered_storage.hpp"
#include <mutex>
#include <stdexcept>
#include <unordered_set>

namespace patex {

// ============================================================================
// Config
// ============================================================================

bool TieredStorage::Config::IsValid() const {
    return hot_capacity > 0 &&
           arena_size > 0 &&
           warm_capacity > 0 &&
           ephemeral_capacity > 0 &&
           bloom_size_bytes > 0;
}

RegionLayout TieredStorage::LayoutFor(const Config& config) {
    return RegionLayout::Standard(config.hot_capacity, config.arena_size);
}

// ============================================================================
// Construction
// ============================================================================

namespace {

BloomFilter::Config BloomConfigFor(const TieredStorage::Config& config) {
    BloomFilter::Config bloom;
    bloom.size_bytes = config.bloom_size_bytes;
    return bloom;
}

} // anonymous namespace

TieredStorage::TieredStorage(ISharedRegion& region,
                             std::unique_ptr<IColdStore> cold_store,
                             const Config& config)
    : config_(config),
      warm_(config.warm_capacity == 0 ? 1 : config.warm_capacity),
      cold_(std::move(cold_store)),
      ephemeral_(config.ephemeral_capacity),
      bloom_(BloomConfigFor(config)) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid TieredStorage configuration");
    }
    if (!cold_) {
        throw std::invalid_argument("TieredStorage requires a cold store");
    }

    RegionLayout layout = LayoutFor(config_);
    if (layout.RequiredSize() > region.Size()) {
        throw std::invalid_argument("Shared region too small: need " +
                                    std::to_string(layout.RequiredSize()) + " bytes");
    }
    hot_ = std::make_unique<HotTier>(region, layout);
}

// ============================================================================
// Write path
// ============================================================================

PatternID TieredStorage::AssignId(Pattern& pattern) {
    if (!pattern.header.id.IsValid()) {
        pattern.header.id = PatternID(kIdBase + id_counter_.fetch_add(1) + 1);
    }
    return pattern.header.id;
}

PatternID TieredStorage::Write(Pattern& pattern) {
    pattern.ValidateStructure();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return WriteLocked(pattern);
}

PatternID TieredStorage::WriteLocked(Pattern& pattern) {
    const PatternID id = AssignId(pattern);

    const bool seen = bloom_.Contains(id);
    bloom_.Add(id);

    // Tier 1, then cascade
    bool stored = hot_->Write(pattern).admitted;
    if (!stored) {
        stored = warm_.Put(pattern);
    }
    if (!stored) {
        cold_->Write(pattern);
    }

    index_.Add(pattern);

    if (!seen) {
        total_patterns_.fetch_add(1);
    }

    return id;
}

PatternID TieredStorage::WriteEphemeral(Pattern& pattern) {
    pattern.ValidateStructure();

    std::unique_lock<std::shared_mutex> lock(mutex_);

    const PatternID id = AssignId(pattern);
    bloom_.Add(id);
    ephemeral_.Put(id, pattern);
    return id;
}

// ============================================================================
// Read path
// ============================================================================

std::optional<Pattern> TieredStorage::Read(PatternID id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return ReadLocked(id);
}

std::optional<Pattern> TieredStorage::ReadLocked(PatternID id) {
    if (!bloom_.Contains(id)) {
        cache_misses_.fetch_add(1);
        return std::nullopt;
    }

    if (auto pattern = hot_->Read(id)) {
        cache_hits_.fetch_add(1);
        return pattern;
    }

    if (auto pattern = warm_.Get(id)) {
        cache_hits_.fetch_add(1);
        if (hot_->Write(*pattern).admitted) {
            promotions_.fetch_add(1);
        }
        return pattern;
    }

    if (auto pattern = cold_->Read(id)) {
        cache_hits_.fetch_add(1);
        if (warm_.Put(*pattern)) {
            promotions_.fetch_add(1);
        }
        return pattern;
    }

    if (auto pattern = ephemeral_.Get(id)) {
        cache_hits_.fetch_add(1);
        return pattern;
    }

    cache_misses_.fetch_add(1);
    return std::nullopt;
}

std::optional<Pattern> TieredStorage::Update(PatternID id,
                                             const std::function<void(Pattern&)>& modify) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto pattern = ReadLocked(id);
    if (!pattern) {
        return std::nullopt;
    }

    modify(*pattern);
    pattern->header.id = id;
    pattern->ValidateStructure();

    WriteLocked(*pattern);
    return pattern;
}

bool TieredStorage::MightContain(PatternID id) const {
    return bloom_.Contains(id);
}

// ============================================================================
// Reconciliation
// ============================================================================

std::vector<PatternID> TieredStorage::SyncFromSharedRegion() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::vector<PatternID> imported_ids;
    for (const auto& pattern : hot_->Sync()) {
        const PatternID id = pattern.header.id;
        if (!bloom_.Contains(id)) {
            total_patterns_.fetch_add(1);
        }
        bloom_.Add(id);
        index_.Add(pattern);
        imported_ids.push_back(id);
    }
    return imported_ids;
}

// ============================================================================
// Query
// ============================================================================

std::vector<PatternID> TieredStorage::CollectCandidates(const PatternQuery& query) const {
    std::vector<PatternID> candidates;
    auto append = [&candidates](const std::vector<PatternID>& ids) {
        candidates.insert(candidates.end(), ids.begin(), ids.end());
    };

    if (!query.tags().empty()) {
        for (const auto& tag : query.tags()) append(index_.FindByTag(tag));
    } else if (!query.types().empty()) {
        for (PatternType type : query.types()) append(index_.FindByType(type));
    } else if (query.min_confidence() > 0) {
        append(index_.FindByConfidence(query.min_confidence()));
    } else if (!query.sources().empty()) {
        for (uint32_t source : query.sources()) append(index_.FindBySource(source));
    }

    return candidates;
}

std::vector<Pattern> TieredStorage::Query(const PatternQuery& query) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<Pattern> results;
    std::unordered_set<PatternID> seen;

    for (PatternID id : CollectCandidates(query)) {
        if (query.limit() > 0 && results.size() >= query.limit()) {
            break;
        }
        if (!seen.insert(id).second) {
            continue;
        }

        auto pattern = ReadLocked(id);
        if (!pattern) {
            continue;  // Indexed but evicted from every tier
        }

        if (query.time_range() && !query.time_range()->Contains(pattern->header.timestamp)) {
            continue;
        }

        results.push_back(std::move(*pattern));
    }

    return results;
}

// ============================================================================
// Statistics
// ============================================================================

TieredStorage::Stats TieredStorage::GetStats() const {
    Stats stats;
    stats.hot_count = hot_->Size();
    stats.warm_count = warm_.Size();
    stats.cold_count = cold_->Count();
    stats.ephemeral_count = ephemeral_.Size();
    stats.total_patterns = total_patterns_.load();
    stats.cache_hits = cache_hits_.load();
    stats.cache_misses = cache_misses_.load();
    stats.promotions = promotions_.load();
    stats.evictions = hot_->Evictions();
    stats.arena_used = hot_->arena().Used();
    stats.arena_failures = hot_->arena().Failures();
    return stats;
}

} // namespace patex
