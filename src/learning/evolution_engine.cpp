// File: src/learning/evolution_engine.cpp
#include "learning/evolution_engine.hpp"
#include "core/errors.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace patex {

const char* ToString(MutationKind kind) {
    switch (kind) {
        case MutationKind::CONFIDENCE: return "confidence";
        case MutationKind::WEIGHT: return "weight";
        case MutationKind::COMPLEXITY: return "complexity";
        default: return "unknown";
    }
}

namespace {

uint64_t ResolveSeed(uint64_t seed) {
    if (seed != 0) {
        return seed;
    }
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | rd();
}

// 1.0 for feedback received now, falling linearly to 0.0 at 24 hours
double Recency(const std::vector<Feedback>& feedback, Timestamp now) {
    Timestamp most_recent = feedback.front().timestamp;
    for (const auto& fb : feedback) {
        most_recent = std::max(most_recent, fb.timestamp);
    }

    const double age_hours =
        std::chrono::duration<double, std::ratio<3600>>(now - most_recent).count();
    if (age_hours > 24.0) {
        return 0.0;
    }
    if (age_hours < 0.0) {
        return 1.0;
    }
    return 1.0 - age_hours / 24.0;
}

// ============================================================================
// Mutation operators
// ============================================================================

void MutateConfidence(Pattern& pattern, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> delta(-5, 5);
    int confidence = static_cast<int>(pattern.header.confidence) + delta(rng);
    confidence = std::clamp(confidence, 0, static_cast<int>(kMaxConfidence));
    pattern.header.confidence = static_cast<uint8_t>(confidence);
}

void MutateWeight(Pattern& pattern, std::mt19937_64& rng) {
    std::uniform_real_distribution<float> unit(0.0f, 1.0f);
    float weight = pattern.header.weight + (unit(rng) - 0.5f) * 0.2f;
    pattern.header.weight = std::clamp(weight, 0.0f, 1.0f);
}

void MutateComplexity(Pattern& pattern, std::mt19937_64& rng) {
    std::uniform_real_distribution<double> unit(0.0, 1.0);
    uint8_t& complexity = pattern.header.complexity;
    if (unit(rng) < 0.5 && complexity > kMinComplexity) {
        --complexity;
    } else if (complexity < kMaxComplexity) {
        ++complexity;
    }
}

using MutateFn = void (*)(Pattern&, std::mt19937_64&);

struct MutationOperator {
    MutationKind kind;
    MutateFn apply;
};

const MutationOperator kOperators[] = {
    {MutationKind::CONFIDENCE, &MutateConfidence},
    {MutationKind::WEIGHT, &MutateWeight},
    {MutationKind::COMPLEXITY, &MutateComplexity},
};

} // anonymous namespace

// ============================================================================
// EvolutionEngine
// ============================================================================

EvolutionEngine::EvolutionEngine(TieredStorage& storage, const Config& config)
    : storage_(storage), config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid EvolutionEngine configuration");
    }
    rng_.seed(ResolveSeed(config_.seed));
}

void EvolutionEngine::RecordFeedback(const Feedback& feedback) {
    feedback_.Add(feedback);
}

size_t EvolutionEngine::FeedbackCount() const {
    return feedback_.Count();
}

void EvolutionEngine::ClearFeedback() {
    feedback_.Clear();
}

double EvolutionEngine::Fitness(const std::vector<Feedback>& feedback,
                                Timestamp now,
                                const FitnessWeights& weights) {
    if (feedback.empty()) {
        return 0.0;
    }

    size_t successes = 0;
    double total_improvement = 0.0;
    for (const auto& fb : feedback) {
        if (fb.success) {
            ++successes;
        }
        total_improvement += fb.improvement;
    }

    const double n = static_cast<double>(feedback.size());
    const double success_rate = static_cast<double>(successes) / n;
    const double avg_improvement = total_improvement / n;
    const double frequency = n / 100.0;

    return weights.success_rate * success_rate +
           weights.improvement * avg_improvement +
           weights.frequency * frequency +
           weights.recency * Recency(feedback, now);
}

void EvolutionEngine::Mutate(MutationKind kind, Pattern& pattern, std::mt19937_64& rng) {
    for (const auto& op : kOperators) {
        if (op.kind == kind) {
            op.apply(pattern, rng);
            return;
        }
    }
    throw std::invalid_argument("Unknown mutation kind");
}

std::vector<EvolutionEngine::ScoredPattern> EvolutionEngine::Rank(
    const std::map<PatternID, std::vector<Feedback>>& groups, Timestamp now) const {

    std::vector<ScoredPattern> ranking;
    ranking.reserve(groups.size());
    for (const auto& [id, feedback] : groups) {
        ranking.push_back({id, Fitness(feedback, now, config_.weights)});
    }

    // Ties keep ascending ID order
    std::stable_sort(ranking.begin(), ranking.end(),
                     [](const ScoredPattern& a, const ScoredPattern& b) {
                         return a.fitness > b.fitness;
                     });
    return ranking;
}

EvolutionEngine::Generation EvolutionEngine::Evolve() {
    // Without a cancellation flag a generation always completes
    return *RunGeneration(nullptr);
}

std::optional<EvolutionEngine::Generation> EvolutionEngine::Evolve(
    const std::atomic<bool>& keep_running) {
    return RunGeneration(&keep_running);
}

std::optional<EvolutionEngine::Generation> EvolutionEngine::RunGeneration(
    const std::atomic<bool>* keep_running) {

    std::lock_guard<std::mutex> lock(evolve_mutex_);

    auto groups = feedback_.Snapshot();
    if (groups.empty()) {
        throw PatternError(ErrorCode::NO_FEEDBACK, "no feedback recorded since start");
    }

    auto cancelled = [keep_running]() {
        return keep_running != nullptr && !keep_running->load();
    };

    Generation generation;
    generation.timestamp = Timestamp::Now();
    generation.ranking = Rank(groups, generation.timestamp);

    std::vector<Pattern> selected;
    for (const auto& scored : generation.ranking) {
        if (selected.size() >= config_.selection_count) {
            break;
        }
        auto pattern = storage_.Read(scored.id);
        if (pattern) {
            selected.push_back(std::move(*pattern));
        }
    }
    generation.selected = selected.size();

    std::uniform_real_distribution<double> unit(0.0, 1.0);
    std::uniform_int_distribution<size_t> pick(0, kAllMutations.size() - 1);

    for (auto& pattern : selected) {
        if (cancelled()) {
            return std::nullopt;
        }
        if (unit(rng_) >= config_.mutation_rate) {
            continue;
        }

        const PatternID parent = pattern.header.id;
        const MutationKind kind = kAllMutations[pick(rng_)];

        // Mutate the stored copy under the storage lock so a concurrent
        // application cannot write back a stale version over this one
        auto evolved = storage_.Update(parent, [&](Pattern& current) {
            Mutate(kind, current, rng_);
            if (current.header.version < std::numeric_limits<uint16_t>::max()) {
                ++current.header.version;
            }
            current.SetFlag(PatternFlags::EVOLVED);
            current.links.evolved_from.push_back(parent);
        });
        if (evolved) {
            generation.evolved.push_back(std::move(*evolved));
        }
    }

    std::unique_lock<std::shared_mutex> history_lock(history_mutex_);
    generation.number = ++generation_;
    history_.push_back(generation);
    return generation;
}

std::optional<EvolutionEngine::Generation> EvolutionEngine::GetGeneration(uint32_t number) const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    if (number == 0 || number > history_.size()) {
        return std::nullopt;
    }
    return history_[number - 1];
}

uint32_t EvolutionEngine::CurrentGeneration() const {
    std::shared_lock<std::shared_mutex> lock(history_mutex_);
    return generation_;
}

} // namespace patex
