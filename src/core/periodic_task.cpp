// File: src/core/periodic_task.cpp
#include "core/periodic_task.hpp"
#include <iostream>
#include <stdexcept>

namespace patex {

PeriodicTask::PeriodicTask(std::string name, std::chrono::milliseconds interval, Body body)
    : name_(std::move(name)), interval_(interval), body_(std::move(body)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("PeriodicTask interval must be positive");
    }
    if (!body_) {
        throw std::invalid_argument("PeriodicTask body must be set");
    }
}

PeriodicTask::~PeriodicTask() {
    Stop();
}

void PeriodicTask::Start() {
    if (running_.load()) {
        return;  // Already running
    }

    running_.store(true);
    thread_ = std::make_unique<std::thread>(&PeriodicTask::Loop, this);
}

void PeriodicTask::Stop() {
    if (!running_.load()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        running_.store(false);
    }
    wake_cv_.notify_all();

    if (thread_ && thread_->joinable()) {
        thread_->join();
    }

    thread_.reset();
}

void PeriodicTask::Loop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_cv_.wait_for(lock, interval_, [this] { return !running_.load(); });
        }

        if (!running_.load()) {
            break;
        }

        try {
            body_(running_);
        } catch (const std::exception& e) {
            std::cerr << "[" << name_ << "] iteration failed: " << e.what() << std::endl;
        }

        run_count_.fetch_add(1);
    }
}

} // namespace patex
