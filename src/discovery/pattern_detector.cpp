// File: src/discovery/pattern_detector.cpp
#include "discovery/pattern_detector.hpp"
#include "codec/hashing.hpp"
#include <iostream>
#include <stdexcept>

namespace patex {

// ============================================================================
// PatternCorrelator
// ============================================================================

Pattern PatternCorrelator::Correlate(const PatternCandidate& candidate,
                                     const std::string& key) const {
    Pattern pattern = Pattern::Create(candidate.type, source_hash_);
    pattern.header.confidence = candidate.confidence;
    pattern.header.complexity = candidate.complexity;
    pattern.header.weight = 1.0f;

    if (candidate.type == PatternType::TEMPORAL) {
        pattern.SetFlag(PatternFlags::TEMPORAL);
    }

    pattern.encoding = DataEncoding::BINARY;
    pattern.payload = candidate.data;

    pattern.metadata.tags = {kDetectedTag, ToString(candidate.detector), key};
    return pattern;
}

// ============================================================================
// DetectionValidator
// ============================================================================

DetectionValidator::DetectionValidator() : DetectionValidator(Config{}) {}

DetectionValidator::DetectionValidator(const Config& config) : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid DetectionValidator configuration");
    }
}

bool DetectionValidator::Validate(const Pattern& pattern, Timestamp now) const {
    if (pattern.header.magic != kPatternMagic) {
        return false;
    }

    if (pattern.header.confidence < config_.min_confidence) {
        return false;
    }

    auto age = now - pattern.header.timestamp;
    if (age > std::chrono::duration_cast<Timestamp::Duration>(config_.max_age)) {
        return false;
    }

    return true;
}

// ============================================================================
// PatternPublisher
// ============================================================================

PatternPublisher::PatternPublisher(TieredStorage& storage, const SecurityValidator* security)
    : storage_(storage), security_(security) {}

PatternPublisher::Outcome PatternPublisher::Publish(Pattern& pattern) {
    Outcome outcome;

    if (security_) {
        ValidationReport report = security_->ValidatePattern(pattern);
        if (!report.valid) {
            std::cerr << "PatternPublisher: rejected " << pattern.ToString() << ":";
            for (const auto& threat : report.threats) {
                std::cerr << " " << ToString(threat.type) << "/" << ToString(threat.severity);
            }
            std::cerr << std::endl;

            outcome.threats = std::move(report.threats);
            return outcome;
        }
        pattern.SetFlag(PatternFlags::TRUSTED);
    }

    pattern.SetFlag(PatternFlags::VALIDATED);
    outcome.id = storage_.Write(pattern);
    outcome.published = true;
    return outcome;
}

// ============================================================================
// PatternDetector
// ============================================================================

bool PatternDetector::Config::IsValid() const {
    return window_size > 0 &&
           min_samples > 0 &&
           min_samples <= window_size &&
           min_confidence <= kMaxConfidence &&
           max_age.count() > 0 &&
           !source_name.empty();
}

namespace {

const PatternDetector::Config& CheckConfig(const PatternDetector::Config& config) {
    if (!config.IsValid()) {
        throw std::invalid_argument("Invalid PatternDetector configuration");
    }
    return config;
}

} // anonymous namespace

PatternDetector::PatternDetector(TieredStorage& storage,
                                 const SecurityValidator* security,
                                 const Config& config)
    : config_(CheckConfig(config)),
      observations_(config.window_size),
      correlator_(HashSource(config.source_name)),
      validator_(DetectionValidator::Config{config.min_confidence, config.max_age}),
      publisher_(storage, security) {}

void PatternDetector::AddObservation(const std::string& key, const Observation& observation) {
    observations_.Add(key, observation);
}

PatternDetector::DetectionResult PatternDetector::Detect() {
    std::lock_guard<std::mutex> lock(detect_mutex_);

    DetectionResult result;
    const Timestamp now = Timestamp::Now();

    for (const auto& key : observations_.Keys()) {
        std::vector<Observation> window = observations_.Get(key);
        if (window.size() < config_.min_samples) {
            continue;
        }

        for (DetectorKind kind : kAllDetectors) {
            for (const auto& candidate : RunDetector(kind, window, config_.params)) {
                ++result.candidates;

                Pattern pattern = correlator_.Correlate(candidate, key);
                if (!validator_.Validate(pattern, now)) {
                    ++result.discarded;
                    continue;
                }

                Signature signature{key, pattern.header.type, pattern.payload};
                if (published_.count(signature) > 0) {
                    ++result.duplicates;
                    continue;
                }

                PatternPublisher::Outcome outcome = publisher_.Publish(pattern);
                if (outcome.published) {
                    published_.insert(std::move(signature));
                    result.published.push_back(std::move(pattern));
                } else {
                    result.rejected.push_back({std::move(pattern), std::move(outcome.threats)});
                }
            }
        }
    }

    return result;
}

size_t PatternDetector::ObservationCount(const std::string& key) const {
    return observations_.Count(key);
}

size_t PatternDetector::KeyCount() const {
    return observations_.KeyCount();
}

void PatternDetector::ClearObservations() {
    observations_.Clear();
}

// ============================================================================
// CreatePatternFromObservations
// ============================================================================

Pattern CreatePatternFromObservations(PatternType type,
                                      const std::vector<Observation>& observations) {
    if (observations.empty()) {
        throw std::invalid_argument("CreatePatternFromObservations: no observations provided");
    }

    uint64_t successes = 0;
    double total_latency = 0.0;
    double total_cost = 0.0;
    for (const auto& obs : observations) {
        if (obs.success) {
            ++successes;
        }
        total_latency += obs.latency_ms;
        total_cost += obs.cost;
    }

    const uint64_t count = observations.size();
    const double n = static_cast<double>(count);

    Pattern pattern = Pattern::Create(type, 0);
    pattern.header.confidence = static_cast<uint8_t>(successes * 100 / count);
    pattern.header.success_rate = static_cast<float>(static_cast<double>(successes) / n);

    PatternMetrics& metrics = pattern.metadata.metrics;
    metrics.applications = count;
    metrics.successes = successes;
    metrics.failures = count - successes;
    metrics.avg_latency_ms = total_latency / n;
    metrics.cost_savings = total_cost / n;

    return pattern;
}

} // namespace patex
