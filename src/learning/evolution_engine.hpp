// File: src/learning/evolution_engine.hpp
//
// Genetic evolution over stored patterns.
//
// One generation:
//   1. group feedback by pattern (none => NO_FEEDBACK, nothing changes)
//   2. fitness = 0.4 success + 0.3 improvement + 0.2 frequency/100 + 0.1 recency
//   3. keep the top selection_count patterns that still read from storage
//   4. mutate each with probability mutation_rate using one random operator
//   5. bump version, set EVOLVED, link the parent and write back
//   6. record the generation

#pragma once

#include "core/pattern.hpp"
#include "learning/feedback_collector.hpp"
#include "storage/tiered_storage.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <shared_mutex>
#include <vector>

namespace patex {

enum class MutationKind : uint8_t {
    CONFIDENCE = 0,   // +/- up to 5, clamped to [0, 100]
    WEIGHT = 1,       // +/- up to 0.1, clamped to [0, 1]
    COMPLEXITY = 2,   // +/- 1, clamped to [1, 10]
};

constexpr std::array<MutationKind, 3> kAllMutations = {
    MutationKind::CONFIDENCE,
    MutationKind::WEIGHT,
    MutationKind::COMPLEXITY,
};

const char* ToString(MutationKind kind);

/// Relative weights of the fitness components
struct FitnessWeights {
    double success_rate{0.4};
    double improvement{0.3};
    double frequency{0.2};
    double recency{0.1};
};

class EvolutionEngine {
public:
    struct Config {
        /// Probability that a selected pattern is mutated
        double mutation_rate{0.1};

        /// Patterns kept per generation
        size_t selection_count{10};

        /// Period of the background loop driven by the engine facade
        std::chrono::milliseconds interval{60000};

        /// 0 = seed from std::random_device
        uint64_t seed{0};

        FitnessWeights weights;

        bool IsValid() const {
            return mutation_rate >= 0.0 && mutation_rate <= 1.0 &&
                   selection_count > 0 &&
                   interval.count() > 0;
        }
    };

    struct ScoredPattern {
        PatternID id;
        double fitness{0.0};
    };

    /// Record of one completed generation
    struct Generation {
        uint32_t number{0};
        Timestamp timestamp;

        /// Patterns that had feedback, best first
        std::vector<ScoredPattern> ranking;

        /// Patterns that were selected and still readable
        size_t selected{0};

        /// Mutated patterns as written back
        std::vector<Pattern> evolved;
    };

    /// @throws std::invalid_argument if config is invalid
    EvolutionEngine(TieredStorage& storage, const Config& config);

    void RecordFeedback(const Feedback& feedback);
    size_t FeedbackCount() const;
    void ClearFeedback();

    /// Run one generation
    /// @throws PatternError(NO_FEEDBACK) when no feedback has been recorded
    /// @throws PatternError(SERIALIZATION_FAILED) if a write-back reaches a failing cold tier
    Generation Evolve();

    /// Same as Evolve() but abandons the batch once keep_running turns false
    /// @return std::nullopt if cancelled; the generation counter is unchanged then
    std::optional<Generation> Evolve(const std::atomic<bool>& keep_running);

    std::optional<Generation> GetGeneration(uint32_t number) const;
    uint32_t CurrentGeneration() const;

    /// Weighted fitness of one pattern's feedback group
    static double Fitness(const std::vector<Feedback>& feedback,
                          Timestamp now,
                          const FitnessWeights& weights = FitnessWeights{});

    /// Apply one mutation operator in place (no version or flag changes)
    static void Mutate(MutationKind kind, Pattern& pattern, std::mt19937_64& rng);

    const Config& config() const { return config_; }

private:
    std::optional<Generation> RunGeneration(const std::atomic<bool>* keep_running);
    std::vector<ScoredPattern> Rank(const std::map<PatternID, std::vector<Feedback>>& groups,
                                    Timestamp now) const;

    TieredStorage& storage_;
    Config config_;
    FeedbackCollector feedback_;

    std::mt19937_64 rng_;
    uint32_t generation_{0};
    std::vector<Generation> history_;

    // Serialises generations
    std::mutex evolve_mutex_;

    // Guards generation_ and history_
    mutable std::shared_mutex history_mutex_;
};

} // namespace patex
