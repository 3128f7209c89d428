// File: src/subscription/pattern_interpreter.hpp
#pragma once

#include "core/pattern.hpp"
#include "core/types.hpp"
#include <atomic>
#include <cstdint>

namespace patex {

/// Decides whether a pattern applies in a given context.
///
/// By type:
///   ATOMIC       valid and active
///   CONDITIONAL  every "=" / "==" condition whose field is in the context matches
///   SECURITY     carries the TRUSTED flag
///   TEMPORAL     not expired
///   others       active
///
/// Every application, successful or not, increments the access count and
/// refreshes the timestamp.
class PatternInterpreter {
public:
    bool Apply(Pattern& pattern, const ApplicationContext& context);
    bool Apply(Pattern& pattern, const ApplicationContext& context, Timestamp now);

    /// Equality-only condition check; non-equality operators are not evaluated
    static bool ConditionsHold(const Pattern& pattern, const ApplicationContext& context);

    uint64_t Applications() const { return applications_.load(); }
    uint64_t Matches() const { return matches_.load(); }

private:
    std::atomic<uint64_t> applications_{0};
    std::atomic<uint64_t> matches_{0};
};

} // namespace patex
