// File: src/subscription/pattern_subscriber.cpp
#include "subscription/pattern_subscriber.hpp"
#include <algorithm>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace patex {

const char* ToString(SubscriptionPriority priority) {
    switch (priority) {
        case SubscriptionPriority::LOW: return "LOW";
        case SubscriptionPriority::NORMAL: return "NORMAL";
        case SubscriptionPriority::HIGH: return "HIGH";
        case SubscriptionPriority::CRITICAL: return "CRITICAL";
        default: return "UNKNOWN";
    }
}

PatternSubscriber::PatternSubscriber(TieredStorage& storage, const Config& config)
    : storage_(storage), config_(config) {
    if (!config_.IsValid()) {
        throw std::invalid_argument("Invalid PatternSubscriber configuration");
    }

    task_ = std::make_unique<PeriodicTask>(
        "subscriber", config_.tick,
        [this](const std::atomic<bool>& running) { RunChecks(&running); });
}

PatternSubscriber::~PatternSubscriber() {
    Stop();
}

void PatternSubscriber::Subscribe(const std::string& id,
                                  const PatternQuery& query,
                                  Callback callback,
                                  SubscriptionPriority priority) {
    if (id.empty()) {
        throw std::invalid_argument("Subscription id must not be empty");
    }
    if (!callback) {
        throw std::invalid_argument("Subscription callback must be set");
    }

    Subscription subscription;
    subscription.id = id;
    subscription.query = query;
    subscription.callback = std::move(callback);
    subscription.priority = priority;
    subscription.stats.last_update = Timestamp::Now();

    std::unique_lock<std::shared_mutex> lock(mutex_);
    subscriptions_[id] = std::move(subscription);
}

bool PatternSubscriber::Unsubscribe(const std::string& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return subscriptions_.erase(id) > 0;
}

size_t PatternSubscriber::CheckUpdates() {
    return RunChecks(nullptr);
}

size_t PatternSubscriber::RunChecks(const std::atomic<bool>* keep_running) {
    std::vector<Subscription> snapshot;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        snapshot.reserve(subscriptions_.size());
        for (const auto& entry : subscriptions_) {
            snapshot.push_back(entry.second);
        }
    }

    std::stable_sort(snapshot.begin(), snapshot.end(),
                     [](const Subscription& a, const Subscription& b) {
                         return a.priority > b.priority;
                     });

    size_t delivered = 0;
    for (const auto& subscription : snapshot) {
        if (keep_running && !keep_running->load()) {
            break;
        }

        std::vector<Pattern> matches = storage_.Query(subscription.query);

        uint64_t received = 0;
        for (const auto& pattern : matches) {
            try {
                subscription.callback(pattern);
                ++received;
            } catch (const std::exception& e) {
                std::cerr << "PatternSubscriber: callback for '" << subscription.id
                          << "' failed: " << e.what() << std::endl;
                break;
            }
        }
        delivered += received;

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = subscriptions_.find(subscription.id);
        if (it != subscriptions_.end()) {
            it->second.stats.patterns_received += received;
            it->second.stats.checks += 1;
            if (received > 0) {
                it->second.stats.last_update = Timestamp::Now();
            }
        }
    }

    return delivered;
}

std::optional<SubscriptionStats> PatternSubscriber::GetStats(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = subscriptions_.find(id);
    if (it == subscriptions_.end()) {
        return std::nullopt;
    }
    return it->second.stats;
}

size_t PatternSubscriber::SubscriptionCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return subscriptions_.size();
}

void PatternSubscriber::Start() {
    task_->Start();
}

void PatternSubscriber::Stop() {
    task_->Stop();
}

} // namespace patex
