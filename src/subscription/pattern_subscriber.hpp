// File: src/subscription/pattern_subscriber.hpp
#pragma once

#include "core/periodic_task.hpp"
#include "storage/pattern_query.hpp"
#include "storage/tiered_storage.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace patex {

enum class SubscriptionPriority {
    LOW = 0,
    NORMAL = 1,
    HIGH = 2,
    CRITICAL = 3,
};

const char* ToString(SubscriptionPriority priority);

struct SubscriptionStats {
    uint64_t patterns_received{0};
    uint64_t checks{0};
    Timestamp last_update;
};

/// Standing queries re-run on a tick; callbacks fire once per match per tick.
///
/// Subscriptions are snapshotted under the lock and their queries and
/// callbacks run without it, so a callback may subscribe or unsubscribe.
class PatternSubscriber {
public:
    using Callback = std::function<void(const Pattern&)>;

    struct Config {
        std::chrono::milliseconds tick{100};

        bool IsValid() const { return tick.count() > 0; }
    };

    /// @throws std::invalid_argument if config is invalid
    PatternSubscriber(TieredStorage& storage, const Config& config);
    ~PatternSubscriber();

    PatternSubscriber(const PatternSubscriber&) = delete;
    PatternSubscriber& operator=(const PatternSubscriber&) = delete;

    /// Add or replace the subscription with this ID
    /// @throws std::invalid_argument if id is empty or callback is unset
    void Subscribe(const std::string& id,
                   const PatternQuery& query,
                   Callback callback,
                   SubscriptionPriority priority = SubscriptionPriority::NORMAL);

    /// @return true if a subscription was removed
    bool Unsubscribe(const std::string& id);

    /// Run every subscription once, highest priority first
    /// @return Callback invocations made
    size_t CheckUpdates();

    std::optional<SubscriptionStats> GetStats(const std::string& id) const;
    size_t SubscriptionCount() const;

    void Start();
    void Stop();
    bool IsRunning() const { return task_->IsRunning(); }

private:
    struct Subscription {
        std::string id;
        PatternQuery query;
        Callback callback;
        SubscriptionPriority priority{SubscriptionPriority::NORMAL};
        SubscriptionStats stats;
    };

    size_t RunChecks(const std::atomic<bool>* keep_running);

    TieredStorage& storage_;
    Config config_;
    std::map<std::string, Subscription> subscriptions_;
    mutable std::shared_mutex mutex_;

    std::unique_ptr<PeriodicTask> task_;
};

} // namespace patex
