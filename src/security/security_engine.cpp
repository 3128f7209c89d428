// File: src/security/security_engine.cpp
#include "security/security_engine.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <set>
#include <stdexcept>

namespace patex {

const char* ToString(RequestThreatType type) {
    switch (type) {
        case RequestThreatType::ANOMALY: return "ANOMALY";
        case RequestThreatType::RATE_LIMIT: return "RATE_LIMIT";
        case RequestThreatType::INVALID_INPUT: return "INVALID_INPUT";
        case RequestThreatType::SUSPICIOUS_PATTERN: return "SUSPICIOUS_PATTERN";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// RateLimiter
// ============================================================================

RateLimiter::RateLimiter() : RateLimiter(Config{}) {}

RateLimiter::RateLimiter(const Config& config) : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid RateLimiter configuration");
    }
}

bool RateLimiter::Allow(const std::string& source) {
    return Allow(source, Clock::now());
}

bool RateLimiter::Allow(const std::string& source, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = buckets_.find(source);
    if (it == buckets_.end()) {
        if (buckets_.size() >= config_.max_sources) {
            MakeRoomLocked(now);
        }
        it = buckets_.emplace(source, TokenBucket{config_.capacity, now}).first;
    }

    TokenBucket& bucket = it->second;
    if (now > bucket.last_refill) {
        double elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
        bucket.tokens = std::min(config_.capacity,
                                 bucket.tokens + elapsed * config_.refill_per_second);
        bucket.last_refill = now;
    }

    if (bucket.tokens >= 1.0) {
        bucket.tokens -= 1.0;
        return true;
    }
    return false;
}

void RateLimiter::MakeRoomLocked(Clock::time_point now) {
    // A bucket that has refilled to capacity is indistinguishable from a new one
    auto oldest = buckets_.end();
    for (auto it = buckets_.begin(); it != buckets_.end();) {
        const TokenBucket& bucket = it->second;
        double elapsed = 0.0;
        if (now > bucket.last_refill) {
            elapsed = std::chrono::duration<double>(now - bucket.last_refill).count();
        }
        if (bucket.tokens + elapsed * config_.refill_per_second >= config_.capacity) {
            it = buckets_.erase(it);
            continue;
        }
        if (oldest == buckets_.end() || bucket.last_refill < oldest->second.last_refill) {
            oldest = it;
        }
        ++it;
    }

    if (buckets_.size() >= config_.max_sources && oldest != buckets_.end()) {
        buckets_.erase(oldest);
    }
}

size_t RateLimiter::SourceCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

double RateLimiter::Tokens(const std::string& source) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(source);
    return it == buckets_.end() ? config_.capacity : it->second.tokens;
}

// ============================================================================
// AnomalyDetector
// ============================================================================

struct AnomalyDetector::TreeNode {
    std::string feature;
    double threshold{0.0};
    std::unique_ptr<TreeNode> left;
    std::unique_ptr<TreeNode> right;
    size_t size{0};

    bool IsLeaf() const { return !left && !right; }
};

namespace {

double FeatureValue(const FeatureVector& features, const std::string& name) {
    auto it = features.find(name);
    return it == features.end() ? 0.0 : it->second;
}

} // anonymous namespace

AnomalyDetector::AnomalyDetector() : AnomalyDetector(Config{}) {}

AnomalyDetector::AnomalyDetector(const Config& config) : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid AnomalyDetector configuration");
    }
}

AnomalyDetector::~AnomalyDetector() = default;

double AnomalyDetector::AveragePathLength(size_t n) {
    if (n <= 1) {
        return 0.0;
    }
    const double nd = static_cast<double>(n);
    const double harmonic = std::log(nd - 1.0) + 0.5772156649;  // Euler's constant
    return 2.0 * harmonic - 2.0 * (nd - 1.0) / nd;
}

void AnomalyDetector::Train(const std::vector<FeatureVector>& samples) {
    if (samples.size() < 2) {
        throw std::invalid_argument("AnomalyDetector needs at least two samples");
    }

    uint64_t seed = config_.seed;
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) | rd();
    }
    std::mt19937_64 rng(seed);

    const size_t subsample = std::min(config_.sample_size, samples.size());
    const size_t height_limit = static_cast<size_t>(std::ceil(std::log2(static_cast<double>(subsample))));

    std::vector<size_t> order(samples.size());
    std::iota(order.begin(), order.end(), 0);

    std::vector<std::unique_ptr<TreeNode>> forest;
    forest.reserve(config_.num_trees);

    for (size_t t = 0; t < config_.num_trees; ++t) {
        std::shuffle(order.begin(), order.end(), rng);

        std::vector<const FeatureVector*> points;
        points.reserve(subsample);
        for (size_t i = 0; i < subsample; ++i) {
            points.push_back(&samples[order[i]]);
        }

        forest.push_back(BuildTree(points, 0, height_limit, rng));
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    trees_ = std::move(forest);
    effective_sample_size_ = subsample;
}

std::unique_ptr<AnomalyDetector::TreeNode> AnomalyDetector::BuildTree(
    std::vector<const FeatureVector*>& points,
    size_t depth, size_t height_limit,
    std::mt19937_64& rng) const {

    auto node = std::make_unique<TreeNode>();
    node->size = points.size();

    if (depth >= height_limit || points.size() <= 1) {
        return node;
    }

    // Only features that still vary can split this node
    std::set<std::string> names;
    for (const auto* p : points) {
        for (const auto& kv : *p) {
            names.insert(kv.first);
        }
    }

    struct Range { std::string name; double lo; double hi; };
    std::vector<Range> splittable;
    for (const auto& name : names) {
        double lo = FeatureValue(*points.front(), name);
        double hi = lo;
        for (const auto* p : points) {
            double v = FeatureValue(*p, name);
            lo = std::min(lo, v);
            hi = std::max(hi, v);
        }
        if (hi > lo) {
            splittable.push_back({name, lo, hi});
        }
    }

    if (splittable.empty()) {
        return node;
    }

    std::uniform_int_distribution<size_t> pick(0, splittable.size() - 1);
    const Range& range = splittable[pick(rng)];
    std::uniform_real_distribution<double> split(range.lo, range.hi);
    const double threshold = split(rng);

    std::vector<const FeatureVector*> left;
    std::vector<const FeatureVector*> right;
    for (const auto* p : points) {
        (FeatureValue(*p, range.name) < threshold ? left : right).push_back(p);
    }

    if (left.empty() || right.empty()) {
        return node;
    }

    node->feature = range.name;
    node->threshold = threshold;
    node->left = BuildTree(left, depth + 1, height_limit, rng);
    node->right = BuildTree(right, depth + 1, height_limit, rng);
    return node;
}

double AnomalyDetector::PathLength(const TreeNode* node, const FeatureVector& features, size_t depth) {
    if (node->IsLeaf()) {
        return static_cast<double>(depth) + AveragePathLength(node->size);
    }

    if (FeatureValue(features, node->feature) < node->threshold) {
        return PathLength(node->left.get(), features, depth + 1);
    }
    return PathLength(node->right.get(), features, depth + 1);
}

double AnomalyDetector::Detect(const FeatureVector& features) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (trees_.empty()) {
        return 0.0;  // Not trained
    }

    double avg_path = 0.0;
    for (const auto& tree : trees_) {
        avg_path += PathLength(tree.get(), features, 0);
    }
    avg_path /= static_cast<double>(trees_.size());

    const double c = AveragePathLength(effective_sample_size_);
    return std::pow(2.0, -avg_path / c);
}

bool AnomalyDetector::IsTrained() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !trees_.empty();
}

// ============================================================================
// ThreatScorer
// ============================================================================

double ThreatScorer::Score(const std::vector<ThreatEvent>& threats) {
    if (threats.empty()) {
        return 0.0;
    }

    double max_severity = 0.0;
    double total = 0.0;
    for (const auto& threat : threats) {
        total += threat.severity;
        max_severity = std::max(max_severity, threat.severity);
    }

    double mean = total / static_cast<double>(threats.size());
    return 0.7 * max_severity + 0.3 * mean;
}

// ============================================================================
// SecurityEngine
// ============================================================================

bool SecurityEngine::Config::IsValid() const {
    return rate_limit.IsValid() &&
           anomaly.IsValid() &&
           anomaly_threshold >= 0.0 && anomaly_threshold <= 1.0 &&
           block_threshold >= anomaly_threshold && block_threshold <= 1.0;
}

SecurityEngine::SecurityEngine() : SecurityEngine(Config{}) {}

SecurityEngine::SecurityEngine(const Config& config)
    : config_(config),
      rate_limiter_(config.rate_limit),
      anomaly_detector_(config.anomaly) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid SecurityEngine configuration");
    }
}

SecurityDecision SecurityEngine::Analyze(const SecurityRequest& request) {
    SecurityDecision decision;

    if (!rate_limiter_.Allow(request.source)) {
        ThreatEvent threat;
        threat.type = RequestThreatType::RATE_LIMIT;
        threat.severity = config_.rate_limit_severity;
        threat.source = request.source;
        threat.timestamp = Timestamp::Now();
        threat.blocked = true;
        threat.description = "Rate limit exceeded";

        RecordThreat(threat);
        decision.allow = false;
        decision.threats.push_back(std::move(threat));
        decision.threat_score = ThreatScorer::Score(decision.threats);
        return decision;
    }

    if (!validator_.Validate(request.data)) {
        ThreatEvent threat;
        threat.type = RequestThreatType::INVALID_INPUT;
        threat.severity = config_.invalid_input_severity;
        threat.source = request.source;
        threat.timestamp = Timestamp::Now();
        threat.blocked = true;
        threat.description = "Invalid input detected";

        RecordThreat(threat);
        decision.allow = false;
        decision.threats.push_back(std::move(threat));
        decision.threat_score = ThreatScorer::Score(decision.threats);
        return decision;
    }

    const double score = anomaly_detector_.Detect(request.features);
    if (score > config_.anomaly_threshold) {
        ThreatEvent threat;
        threat.type = RequestThreatType::ANOMALY;
        threat.severity = score;
        threat.source = request.source;
        threat.timestamp = Timestamp::Now();
        threat.blocked = score > config_.block_threshold;
        threat.description = "Anomalous behavior detected";

        RecordThreat(threat);
        if (threat.blocked) {
            decision.allow = false;
        }
        decision.threats.push_back(std::move(threat));
    }

    decision.threat_score = ThreatScorer::Score(decision.threats);
    return decision;
}

void SecurityEngine::TrainAnomalyModel(const std::vector<FeatureVector>& samples) {
    anomaly_detector_.Train(samples);
}

void SecurityEngine::RecordThreat(const ThreatEvent& threat) {
    threats_detected_.fetch_add(1);
    if (threat.blocked) {
        threats_blocked_.fetch_add(1);
    }
}

SecurityEngine::Stats SecurityEngine::GetStats() const {
    Stats stats;
    stats.threats_detected = threats_detected_.load();
    stats.threats_blocked = threats_blocked_.load();
    if (stats.threats_detected > 0) {
        stats.block_rate = static_cast<double>(stats.threats_blocked) /
                           static_cast<double>(stats.threats_detected);
    }
    return stats;
}

} // namespace patex
