// File: src/core/pattern_engine.hpp
#pragma once

#include "analytics/pattern_analytics.hpp"
#include "config/engine_config.hpp"
#include "core/periodic_task.hpp"
#include "discovery/pattern_detector.hpp"
#include "learning/evolution_engine.hpp"
#include "memory/shared_region.hpp"
#include "security/pattern_security.hpp"
#include "security/security_engine.hpp"
#include "storage/tiered_storage.hpp"
#include "subscription/pattern_interpreter.hpp"
#include "subscription/pattern_subscriber.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace patex {

/// PatternEngine - Unified interface for all pattern operations
///
/// Owns tiered storage, detection, evolution, security, subscriptions and
/// analytics, and wires them together. The shared region is owned by the
/// caller and must outlive the engine.
class PatternEngine {
public:
    /// Region layout the storage settings need
    static RegionLayout RequiredLayout(const EngineConfig& config);

    /// Cold store selected by storage.cold_backend
    /// @throws std::invalid_argument for an unknown backend
    /// @throws std::runtime_error if the SQLite database cannot be opened
    static std::unique_ptr<IColdStore> MakeColdStore(const EngineConfig& config);

    /// @throws std::invalid_argument if config is invalid or region is too small
    PatternEngine(ISharedRegion& region, const EngineConfig& config);

    /// Stops both background loops
    ~PatternEngine();

    // Disable copy and move
    PatternEngine(const PatternEngine&) = delete;
    PatternEngine& operator=(const PatternEngine&) = delete;
    PatternEngine(PatternEngine&&) = delete;
    PatternEngine& operator=(PatternEngine&&) = delete;

    // ========================================================================
    // Detection
    // ========================================================================

    void Observe(const std::string& key, const Observation& observation);

    /// Run the detector and publish survivors through the security gate
    PatternDetector::DetectionResult DetectPatterns();

    // ========================================================================
    // Patterns
    // ========================================================================

    /// Security-gate a pattern and store it (sets TRUSTED and VALIDATED)
    /// @return Assigned ID, also written back into pattern
    /// @throws ValidationError carrying the threats on rejection
    /// @throws std::invalid_argument if the pattern is structurally malformed
    PatternID SubmitPattern(Pattern& pattern);

    std::optional<Pattern> GetPattern(PatternID id);

    std::vector<Pattern> Query(const PatternQuery& query);

    /// Interpret a stored pattern against context and write the updated copy back
    /// @return Whether the pattern applies
    /// @throws PatternError(NOT_FOUND) if the pattern cannot be read
    bool ApplyPattern(PatternID id, const ApplicationContext& context);

    // ========================================================================
    // Evolution
    // ========================================================================

    void RecordFeedback(const Feedback& feedback);

    /// @throws PatternError(NO_FEEDBACK) when no feedback has been recorded
    EvolutionEngine::Generation Evolve();

    // ========================================================================
    // Security
    // ========================================================================

    /// Allow patterns from the named producer
    void TrustSource(const std::string& source_name);
    void TrustSource(uint32_t source_hash);

    SecurityDecision AnalyzeRequest(const SecurityRequest& request);

    /// @throws std::invalid_argument if fewer than two samples are given
    void TrainAnomalyModel(const std::vector<FeatureVector>& samples);

    // ========================================================================
    // Shared region, subscriptions, analytics
    // ========================================================================

    std::vector<PatternID> SyncFromSharedRegion();

    void Subscribe(const std::string& id, const PatternQuery& query,
                   PatternSubscriber::Callback callback,
                   SubscriptionPriority priority = SubscriptionPriority::NORMAL);
    bool Unsubscribe(const std::string& id);

    PerformanceAnalysis Analyze();
    AnalyticsMetrics GetMetrics() const;

    // ========================================================================
    // Background loops
    // ========================================================================

    void StartEvolutionLoop();
    void StopEvolutionLoop();
    bool IsEvolutionLoopRunning() const { return evolution_task_->IsRunning(); }

    void StartSubscriptions();
    void StopSubscriptions();

    /// Stop every background loop
    void Stop();

    // ========================================================================
    // Component access
    // ========================================================================

    TieredStorage& storage() { return *storage_; }
    SecurityValidator& security_validator() { return security_validator_; }
    PatternDetector& detector() { return *detector_; }
    EvolutionEngine& evolution() { return *evolution_; }
    SecurityEngine& security_engine() { return *security_engine_; }
    const EngineConfig& config() const { return config_; }

    /// Source hash stamped on locally detected patterns
    uint32_t local_source_hash() const { return detector_->source_hash(); }

private:
    void RunEvolutionCycle(const std::atomic<bool>& running);
    void RecordGeneration(const EvolutionEngine::Generation& generation);

    EngineConfig config_;

    std::unique_ptr<TieredStorage> storage_;
    SecurityValidator security_validator_;
    std::unique_ptr<PatternDetector> detector_;
    std::unique_ptr<EvolutionEngine> evolution_;
    std::unique_ptr<PatternSubscriber> subscriber_;
    PatternInterpreter interpreter_;
    std::unique_ptr<PatternAnalytics> analytics_;
    std::unique_ptr<SecurityEngine> security_engine_;

    std::unique_ptr<PeriodicTask> evolution_task_;
};

} // namespace patex
