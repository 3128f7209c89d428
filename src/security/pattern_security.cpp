// File: src/security/pattern_security.cpp
#include "security/pattern_security.hpp"
#include <iomanip>
#include <limits>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace patex {

const char* ToString(ThreatType type) {
    switch (type) {
        case ThreatType::LOGIC_BOMB: return "LOGIC_BOMB";
        case ThreatType::RESOURCE_EXHAUSTION: return "RESOURCE_EXHAUSTION";
        case ThreatType::PRIVILEGE_ESCALATION: return "PRIVILEGE_ESCALATION";
        case ThreatType::DATA_LEAKAGE: return "DATA_LEAKAGE";
        default: return "UNKNOWN";
    }
}

const char* ToString(Severity severity) {
    switch (severity) {
        case Severity::LOW: return "LOW";
        case Severity::MEDIUM: return "MEDIUM";
        case Severity::HIGH: return "HIGH";
        case Severity::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

// ============================================================================
// ValidationError
// ============================================================================

ValidationError::ValidationError(std::vector<ThreatIndicator> threats)
    : PatternError(ErrorCode::VALIDATION_FAILED, Describe(threats)),
      threats_(std::move(threats)) {}

std::string ValidationError::Describe(const std::vector<ThreatIndicator>& threats) {
    std::ostringstream oss;
    oss << threats.size() << " threat(s)";
    for (const auto& threat : threats) {
        oss << "; " << ToString(threat.type) << "/" << ToString(threat.severity)
            << ": " << threat.message;
    }
    return oss.str();
}

// ============================================================================
// TrustStore
// ============================================================================

void TrustStore::AddTrusted(uint32_t source_hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    trusted_.insert(source_hash);
}

void TrustStore::RemoveTrusted(uint32_t source_hash) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    trusted_.erase(source_hash);
}

bool TrustStore::IsTrusted(uint32_t source_hash) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trusted_.count(source_hash) > 0;
}

size_t TrustStore::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trusted_.size();
}

// ============================================================================
// SecurityValidator
// ============================================================================

SecurityValidator::SecurityValidator() : SecurityValidator(Config{}) {}

SecurityValidator::SecurityValidator(const Config& config) : config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid SecurityValidator configuration");
    }
}

namespace {

// now + horizon in nanoseconds, saturating at the largest timestamp
uint64_t HorizonDeadline(Timestamp now, std::chrono::minutes horizon) {
    constexpr uint64_t kNanosPerMinute = 60ull * 1000 * 1000 * 1000;
    constexpr uint64_t kMax = std::numeric_limits<uint64_t>::max();
    const uint64_t minutes = static_cast<uint64_t>(horizon.count());
    if (minutes > (kMax - now.ToNanos()) / kNanosPerMinute) {
        return kMax;
    }
    return now.ToNanos() + minutes * kNanosPerMinute;
}

} // anonymous namespace

ValidationReport SecurityValidator::ValidatePattern(const Pattern& pattern) const {
    return ValidatePattern(pattern, Timestamp::Now());
}

ValidationReport SecurityValidator::ValidatePattern(const Pattern& pattern, Timestamp now) const {
    ValidationReport report;
    const auto& header = pattern.header;

    if (!trust_store_.IsTrusted(header.source_hash)) {
        std::ostringstream msg;
        msg << "Untrusted source: " << std::hex << header.source_hash;
        report.threats.push_back({ThreatType::PRIVILEGE_ESCALATION, Severity::MEDIUM, msg.str()});
    }

    if (header.magic != kPatternMagic || pattern.payload.size() > kMaxPayloadSize) {
        report.threats.push_back({ThreatType::DATA_LEAKAGE, Severity::HIGH,
                                  "Pattern integrity check failed"});
        report.valid = false;
        return report;
    }

    // Unsigned comparison: expirations past INT64_MAX nanoseconds are far
    // future, not negative
    if (!header.expiration.IsZero() &&
        header.expiration.ToNanos() < HorizonDeadline(now, config_.logic_bomb_horizon)) {
        report.threats.push_back({ThreatType::LOGIC_BOMB, Severity::MEDIUM,
                                  "Pattern expires soon - possible logic bomb"});
    }

    if (header.complexity >= config_.complexity_ceiling) {
        report.threats.push_back({ThreatType::RESOURCE_EXHAUSTION, Severity::MEDIUM,
                                  "Pattern complexity too high - possible resource exhaustion"});
    }

    report.valid = report.threats.empty();
    return report;
}

void SecurityValidator::RequireValid(const Pattern& pattern) const {
    auto report = ValidatePattern(pattern);
    if (!report.valid) {
        throw ValidationError(std::move(report.threats));
    }
}

} // namespace patex
