// File: src/security/pattern_security.hpp
#pragma once

#include "core/errors.hpp"
#include "core/pattern.hpp"
#include <chrono>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace patex {

enum class ThreatType {
    LOGIC_BOMB,
    RESOURCE_EXHAUSTION,
    PRIVILEGE_ESCALATION,
    DATA_LEAKAGE,
};

enum class Severity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL,
};

const char* ToString(ThreatType type);
const char* ToString(Severity severity);

struct ThreatIndicator {
    ThreatType type;
    Severity severity;
    std::string message;
};

struct ValidationReport {
    bool valid{false};
    std::vector<ThreatIndicator> threats;
};

/// Rejection carrying the threats that caused it
class ValidationError : public PatternError {
public:
    explicit ValidationError(std::vector<ThreatIndicator> threats);

    const std::vector<ThreatIndicator>& threats() const { return threats_; }

private:
    static std::string Describe(const std::vector<ThreatIndicator>& threats);

    std::vector<ThreatIndicator> threats_;
};

/// Allow-list of source hashes whose patterns may be accepted
class TrustStore {
public:
    void AddTrusted(uint32_t source_hash);
    void RemoveTrusted(uint32_t source_hash);
    bool IsTrusted(uint32_t source_hash) const;
    size_t Size() const;

private:
    std::unordered_set<uint32_t> trusted_;
    mutable std::shared_mutex mutex_;
};

/// Heuristic threat checks gating pattern acceptance.
///
/// Checks run in order: trust, integrity (stops on failure), logic bomb,
/// resource exhaustion. A pattern is valid only when no threat is raised.
class SecurityValidator {
public:
    struct Config {
        /// Expirations closer than this are treated as logic bombs
        std::chrono::minutes logic_bomb_horizon{15};

        /// Complexity at or above this is resource exhaustion
        uint8_t complexity_ceiling{kMaxComplexity};

        bool IsValid() const {
            return logic_bomb_horizon.count() >= 0 && complexity_ceiling > 0;
        }
    };

    SecurityValidator();

    /// @throws std::invalid_argument if config is invalid
    explicit SecurityValidator(const Config& config);

    ValidationReport ValidatePattern(const Pattern& pattern) const;
    ValidationReport ValidatePattern(const Pattern& pattern, Timestamp now) const;

    /// @throws ValidationError listing every threat if the pattern is not valid
    void RequireValid(const Pattern& pattern) const;

    TrustStore& trust_store() { return trust_store_; }
    const TrustStore& trust_store() const { return trust_store_; }

    const Config& config() const { return config_; }

private:
    Config config_;
    TrustStore trust_store_;
};

} // namespace patex
