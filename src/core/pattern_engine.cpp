// File: src/core/pattern_engine.cpp
#include "core/pattern_engine.hpp"
#include "codec/hashing.hpp"
#include <chrono>
#include <stdexcept>

namespace patex {

// ============================================================================
// Configuration mapping
// ============================================================================

namespace {

TieredStorage::Config ToStorageConfig(const EngineConfig& config) {
    TieredStorage::Config storage;
    storage.hot_capacity = config.storage.hot_capacity;
    storage.arena_size = config.storage.arena_size;
    storage.warm_capacity = config.storage.warm_capacity;
    storage.ephemeral_capacity = config.storage.ephemeral_capacity;
    storage.bloom_size_bytes = config.storage.bloom_size_bytes;
    return storage;
}

SecurityValidator::Config ToValidatorConfig(const EngineConfig& config) {
    SecurityValidator::Config validator;
    validator.logic_bomb_horizon = std::chrono::minutes(config.security.logic_bomb_horizon_minutes);
    validator.complexity_ceiling = static_cast<uint8_t>(config.security.complexity_ceiling);
    return validator;
}

PatternDetector::Config ToDetectorConfig(const EngineConfig& config) {
    PatternDetector::Config detector;
    detector.window_size = config.detection.window_size;
    detector.min_samples = config.detection.min_samples;
    detector.min_confidence = static_cast<uint8_t>(config.detection.min_confidence);
    detector.max_age = std::chrono::hours(config.detection.max_age_hours);
    detector.source_name = config.detection.source_name;
    return detector;
}

EvolutionEngine::Config ToEvolutionConfig(const EngineConfig& config) {
    EvolutionEngine::Config evolution;
    evolution.mutation_rate = config.evolution.mutation_rate;
    evolution.selection_count = config.evolution.selection_count;
    evolution.interval = std::chrono::milliseconds(config.evolution.interval_ms);
    evolution.seed = config.evolution.seed;
    return evolution;
}

SecurityEngine::Config ToSecurityEngineConfig(const EngineConfig& config) {
    SecurityEngine::Config engine;
    engine.rate_limit.capacity = config.security.rate_limit_capacity;
    engine.rate_limit.refill_per_second = config.security.rate_limit_refill_per_second;
    engine.rate_limit.max_sources = config.security.rate_limit_max_sources;
    engine.anomaly.seed = config.evolution.seed;
    return engine;
}

const EngineConfig& CheckConfig(const EngineConfig& config) {
    if (!config.Validate()) {
        std::string message = "Invalid engine configuration";
        for (const auto& error : config.GetValidationErrors()) {
            message += "; " + error;
        }
        throw std::invalid_argument(message);
    }
    return config;
}

} // anonymous namespace

RegionLayout PatternEngine::RequiredLayout(const EngineConfig& config) {
    return TieredStorage::LayoutFor(ToStorageConfig(config));
}

std::unique_ptr<IColdStore> PatternEngine::MakeColdStore(const EngineConfig& config) {
    if (config.storage.cold_backend == "file") {
        return std::make_unique<FileColdStore>(FileColdStore::Config{config.storage.cold_path});
    }
    if (config.storage.cold_backend == "sqlite") {
        SqliteColdStore::Config sqlite;
        sqlite.db_path = config.storage.cold_path;
        return std::make_unique<SqliteColdStore>(sqlite);
    }
    throw std::invalid_argument("Unknown cold backend: " + config.storage.cold_backend);
}

// ============================================================================
// Constructor & Initialization
// ============================================================================

PatternEngine::PatternEngine(ISharedRegion& region, const EngineConfig& config)
    : config_(CheckConfig(config)),
      security_validator_(ToValidatorConfig(config)) {

    storage_ = std::make_unique<TieredStorage>(region, MakeColdStore(config_),
                                               ToStorageConfig(config_));

    detector_ = std::make_unique<PatternDetector>(*storage_, &security_validator_,
                                                  ToDetectorConfig(config_));
    evolution_ = std::make_unique<EvolutionEngine>(*storage_, ToEvolutionConfig(config_));

    PatternSubscriber::Config subscriber_config;
    subscriber_config.tick = std::chrono::milliseconds(config_.subscription.tick_ms);
    subscriber_ = std::make_unique<PatternSubscriber>(*storage_, subscriber_config);

    PatternAnalytics::Config analytics_config;
    analytics_config.history_size = config_.analytics.history_size;
    analytics_ = std::make_unique<PatternAnalytics>(*storage_, analytics_config);

    security_engine_ = std::make_unique<SecurityEngine>(ToSecurityEngineConfig(config_));

    // The local producer is always trusted
    security_validator_.trust_store().AddTrusted(detector_->source_hash());
    for (const auto& source : config_.security.trusted_sources) {
        security_validator_.trust_store().AddTrusted(HashSource(source));
    }

    evolution_task_ = std::make_unique<PeriodicTask>(
        "evolution", std::chrono::milliseconds(config_.evolution.interval_ms),
        [this](const std::atomic<bool>& running) { RunEvolutionCycle(running); });
}

PatternEngine::~PatternEngine() {
    Stop();
}

// ============================================================================
// Detection
// ============================================================================

void PatternEngine::Observe(const std::string& key, const Observation& observation) {
    detector_->AddObservation(key, observation);
}

PatternDetector::DetectionResult PatternEngine::DetectPatterns() {
    auto start_time = std::chrono::steady_clock::now();
    PatternDetector::DetectionResult result = detector_->Detect();
    auto latency = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);

    for (size_t i = 0; i < result.published.size(); ++i) {
        analytics_->RecordDetection(latency, true);
    }
    for (size_t i = 0; i < result.rejected.size(); ++i) {
        analytics_->RecordDetection(latency, false);
    }
    return result;
}

// ============================================================================
// Patterns
// ============================================================================

PatternID PatternEngine::SubmitPattern(Pattern& pattern) {
    security_validator_.RequireValid(pattern);

    pattern.SetFlag(PatternFlags::TRUSTED);
    pattern.SetFlag(PatternFlags::VALIDATED);
    return storage_->Write(pattern);
}

std::optional<Pattern> PatternEngine::GetPattern(PatternID id) {
    return storage_->Read(id);
}

std::vector<Pattern> PatternEngine::Query(const PatternQuery& query) {
    return storage_->Query(query);
}

bool PatternEngine::ApplyPattern(PatternID id, const ApplicationContext& context) {
    auto start_time = std::chrono::steady_clock::now();

    bool applies = false;
    auto updated = storage_->Update(id, [&](Pattern& pattern) {
        applies = interpreter_.Apply(pattern, context);
    });
    if (!updated) {
        throw PatternError(ErrorCode::NOT_FOUND, "pattern " + id.ToString());
    }

    auto latency = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
    analytics_->RecordApplication(applies, 0.0, latency);
    return applies;
}

// ============================================================================
// Evolution
// ============================================================================

void PatternEngine::RecordFeedback(const Feedback& feedback) {
    evolution_->RecordFeedback(feedback);
}

EvolutionEngine::Generation PatternEngine::Evolve() {
    EvolutionEngine::Generation generation = evolution_->Evolve();
    RecordGeneration(generation);
    return generation;
}

void PatternEngine::RunEvolutionCycle(const std::atomic<bool>& running) {
    if (evolution_->FeedbackCount() == 0) {
        return;  // Nothing to learn from yet
    }

    auto generation = evolution_->Evolve(running);
    if (generation) {
        RecordGeneration(*generation);
    }
}

void PatternEngine::RecordGeneration(const EvolutionEngine::Generation& generation) {
    analytics_->RecordEvolution(generation.number, !generation.evolved.empty());
}

// ============================================================================
// Security
// ============================================================================

void PatternEngine::TrustSource(const std::string& source_name) {
    TrustSource(HashSource(source_name));
}

void PatternEngine::TrustSource(uint32_t source_hash) {
    security_validator_.trust_store().AddTrusted(source_hash);
}

SecurityDecision PatternEngine::AnalyzeRequest(const SecurityRequest& request) {
    return security_engine_->Analyze(request);
}

void PatternEngine::TrainAnomalyModel(const std::vector<FeatureVector>& samples) {
    security_engine_->TrainAnomalyModel(samples);
}

// ============================================================================
// Shared region, subscriptions, analytics
// ============================================================================

std::vector<PatternID> PatternEngine::SyncFromSharedRegion() {
    return storage_->SyncFromSharedRegion();
}

void PatternEngine::Subscribe(const std::string& id, const PatternQuery& query,
                              PatternSubscriber::Callback callback,
                              SubscriptionPriority priority) {
    subscriber_->Subscribe(id, query, std::move(callback), priority);
}

bool PatternEngine::Unsubscribe(const std::string& id) {
    return subscriber_->Unsubscribe(id);
}

PerformanceAnalysis PatternEngine::Analyze() {
    return analytics_->AnalyzePerformance();
}

AnalyticsMetrics PatternEngine::GetMetrics() const {
    return analytics_->CollectMetrics();
}

// ============================================================================
// Background loops
// ============================================================================

void PatternEngine::StartEvolutionLoop() {
    evolution_task_->Start();
}

void PatternEngine::StopEvolutionLoop() {
    evolution_task_->Stop();
}

void PatternEngine::StartSubscriptions() {
    subscriber_->Start();
}

void PatternEngine::StopSubscriptions() {
    subscriber_->Stop();
}

void PatternEngine::Stop() {
    if (evolution_task_) {
        evolution_task_->Stop();
    }
    if (subscriber_) {
        subscriber_->Stop();
    }
}

} // namespace patex
