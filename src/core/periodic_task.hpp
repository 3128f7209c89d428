// File: src/core/periodic_task.hpp
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace patex {

/// Runs a body on a background thread at a fixed interval until stopped.
///
/// The body receives the running flag so long batches can bail out between
/// items; Stop() wakes the sleeping thread immediately and joins it.
class PeriodicTask {
public:
    using Body = std::function<void(const std::atomic<bool>& running)>;

    /// @throws std::invalid_argument if interval is zero or body is empty
    PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body);

    /// Stops the thread if still running
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    /// Start the loop; no-op if already running
    void Start();

    /// Signal cancellation and join; no-op if not running
    void Stop();

    bool IsRunning() const { return running_.load(); }

    /// Number of completed body invocations
    uint64_t RunCount() const { return run_count_.load(); }

    const std::string& name() const { return name_; }

private:
    void Loop();

    std::string name_;
    std::chrono::milliseconds interval_;
    Body body_;

    std::unique_ptr<std::thread> thread_;
    std::atomic<bool> running_{false};
    std::atomic<uint64_t> run_count_{0};

    std::mutex wake_mutex_;
    std::condition_variable wake_cv_;
};

} // namespace patex
