// File: src/codec/bloom_filter.hpp
#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace patex {

/// Probabilistic membership gate over pattern IDs.
///
/// Append-only until Clear(). No false negatives; the false-positive rate
/// follows (1 - e^(-k n / m))^k for m bits, k hashes and n insertions.
class BloomFilter {
public:
    struct Config {
        /// Bit array size in bytes
        size_t size_bytes{8192};

        /// Number of hash functions
        uint8_t hash_count{3};

        bool IsValid() const { return size_bytes > 0 && hash_count > 0; }
    };

    /// @throws std::invalid_argument if config is invalid
    explicit BloomFilter(const Config& config);
    BloomFilter();

    void Add(PatternID id);

    /// @return true only if every hashed bit is set
    bool Contains(PatternID id) const;

    /// Analytic false-positive estimate after n insertions
    double EstimateFalsePositiveRate(uint64_t n) const;

    void Clear();

    size_t BitCount() const { return bit_count_; }
    uint8_t HashCount() const { return config_.hash_count; }

    /// Number of bits currently set
    size_t PopCount() const;

private:
    size_t BitIndex(PatternID id, uint8_t seed) const;

    Config config_;
    size_t bit_count_;
    std::vector<uint8_t> bits_;
    mutable std::shared_mutex mutex_;
};

} // namespace patex
