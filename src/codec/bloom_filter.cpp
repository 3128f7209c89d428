// File: src/codec/bloom_filter.cpp
#include "codec/bloom_filter.hpp"
#include "codec/hashing.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <stdexcept>

namespace patex {

namespace {
constexpr uint64_t kGoldenRatio64 = 0x9e3779b97f4a7c15ULL;
}

BloomFilter::BloomFilter() : BloomFilter(Config{}) {}

BloomFilter::BloomFilter(const Config& config)
    : config_(config), bit_count_(config.size_bytes * 8) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid BloomFilter configuration");
    }
    bits_.assign(config_.size_bytes, 0);
}

size_t BloomFilter::BitIndex(PatternID id, uint8_t seed) const {
    uint64_t h = id.value() ^ (static_cast<uint64_t>(seed) * kGoldenRatio64);
    return static_cast<size_t>(Mix64(h) % bit_count_);
}

void BloomFilter::Add(PatternID id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (uint8_t seed = 0; seed < config_.hash_count; ++seed) {
        size_t bit = BitIndex(id, seed);
        bits_[bit / 8] |= static_cast<uint8_t>(1u << (bit % 8));
    }
}

bool BloomFilter::Contains(PatternID id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (uint8_t seed = 0; seed < config_.hash_count; ++seed) {
        size_t bit = BitIndex(id, seed);
        if ((bits_[bit / 8] & (1u << (bit % 8))) == 0) {
            return false;
        }
    }
    return true;
}

double BloomFilter::EstimateFalsePositiveRate(uint64_t n) const {
    double k = static_cast<double>(config_.hash_count);
    double m = static_cast<double>(bit_count_);
    return std::pow(1.0 - std::exp(-k * static_cast<double>(n) / m), k);
}

void BloomFilter::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    std::fill(bits_.begin(), bits_.end(), 0);
}

size_t BloomFilter::PopCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t count = 0;
    for (uint8_t byte : bits_) {
        for (int i = 0; i < 8; ++i) {
            count += (byte >> i) & 1u;
        }
    }
    return count;
}

} // namespace patex
