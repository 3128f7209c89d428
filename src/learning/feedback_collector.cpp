// File: src/learning/feedback_collector.cpp
#include "learning/feedback_collector.hpp"
#include <mutex>

namespace patex {

void FeedbackCollector::Add(const Feedback& feedback) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    feedback_[feedback.pattern_id].push_back(feedback);
    ++count_;
}

std::map<PatternID, std::vector<Feedback>> FeedbackCollector::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return feedback_;
}

size_t FeedbackCollector::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return count_;
}

size_t FeedbackCollector::PatternCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return feedback_.size();
}

void FeedbackCollector::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    feedback_.clear();
    count_ = 0;
}

} // namespace patex
