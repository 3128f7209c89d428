// File: src/subscription/pattern_interpreter.cpp
#include "subscription/pattern_interpreter.hpp"

namespace patex {

bool PatternInterpreter::Apply(Pattern& pattern, const ApplicationContext& context) {
    return Apply(pattern, context, Timestamp::Now());
}

bool PatternInterpreter::Apply(Pattern& pattern, const ApplicationContext& context, Timestamp now) {
    ++pattern.header.access_count;
    pattern.header.timestamp = now;

    bool applies = false;
    switch (pattern.header.type) {
        case PatternType::ATOMIC:
            applies = pattern.IsValid() && pattern.IsActive();
            break;
        case PatternType::CONDITIONAL:
            applies = ConditionsHold(pattern, context);
            break;
        case PatternType::SECURITY:
            applies = pattern.HasFlag(PatternFlags::TRUSTED);
            break;
        case PatternType::TEMPORAL:
            applies = !pattern.IsExpired(now);
            break;
        default:
            applies = pattern.IsActive();
            break;
    }

    applications_.fetch_add(1);
    if (applies) {
        matches_.fetch_add(1);
    }
    return applies;
}

bool PatternInterpreter::ConditionsHold(const Pattern& pattern, const ApplicationContext& context) {
    for (const auto& condition : pattern.metadata.conditions) {
        if (condition.op != "=" && condition.op != "==") {
            continue;
        }

        auto it = context.find(condition.field);
        if (it == context.end()) {
            continue;  // Field not supplied
        }
        if (it->second != condition.value) {
            return false;
        }
    }
    return true;
}

} // namespace patex
