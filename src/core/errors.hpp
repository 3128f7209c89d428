// File: src/core/errors.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace patex {

/// Failure categories surfaced by the engine
enum class ErrorCode {
    NOT_FOUND,             // Bloom-negative or absent from every tier
    CAPACITY_EXCEEDED,     // Tier or arena full
    VALIDATION_FAILED,     // Security validator rejection
    SERIALIZATION_FAILED,  // Durable store I/O
    NO_FEEDBACK,           // Evolution cycle with nothing to learn from
};

inline const char* ToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_FOUND: return "NOT_FOUND";
        case ErrorCode::CAPACITY_EXCEEDED: return "CAPACITY_EXCEEDED";
        case ErrorCode::VALIDATION_FAILED: return "VALIDATION_FAILED";
        case ErrorCode::SERIALIZATION_FAILED: return "SERIALIZATION_FAILED";
        case ErrorCode::NO_FEEDBACK: return "NO_FEEDBACK";
        default: return "UNKNOWN";
    }
}

class PatternError : public std::runtime_error {
public:
    PatternError(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(ToString(code)) + ": " + message),
          code_(code) {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

} // namespace patex
