// File: src/core/types.cpp
#include "core/types.hpp"
#include <sstream>
#include <iomanip>
#include <stdexcept>
#include <ctime>

namespace patex {

std::string PatternID::ToString() const {
    if (!IsValid()) {
        return "PatternID(UNASSIGNED)";
    }
    std::ostringstream oss;
    oss << "PatternID(" << value_ << ")";
    return oss.str();
}

// Enum implementations

const char* ToString(PatternType type) {
    switch (type) {
        case PatternType::ATOMIC: return "ATOMIC";
        case PatternType::COMPOSITE: return "COMPOSITE";
        case PatternType::CONDITIONAL: return "CONDITIONAL";
        case PatternType::TEMPORAL: return "TEMPORAL";
        case PatternType::SEQUENTIAL: return "SEQUENTIAL";
        case PatternType::PROBABILISTIC: return "PROBABILISTIC";
        case PatternType::ADAPTIVE: return "ADAPTIVE";
        case PatternType::SECURITY: return "SECURITY";
        default: return "UNKNOWN";
    }
}

PatternType ParsePatternType(const std::string& str) {
    if (str == "ATOMIC") return PatternType::ATOMIC;
    if (str == "COMPOSITE") return PatternType::COMPOSITE;
    if (str == "CONDITIONAL") return PatternType::CONDITIONAL;
    if (str == "TEMPORAL") return PatternType::TEMPORAL;
    if (str == "SEQUENTIAL") return PatternType::SEQUENTIAL;
    if (str == "PROBABILISTIC") return PatternType::PROBABILISTIC;
    if (str == "ADAPTIVE") return PatternType::ADAPTIVE;
    if (str == "SECURITY") return PatternType::SECURITY;
    throw std::invalid_argument("Unknown PatternType: " + str);
}

const char* ToString(DataEncoding encoding) {
    switch (encoding) {
        case DataEncoding::BINARY: return "BINARY";
        case DataEncoding::JSON: return "JSON";
        case DataEncoding::PROTO: return "PROTO";
        case DataEncoding::EXPRESSION: return "EXPRESSION";
        case DataEncoding::GRAPH: return "GRAPH";
        default: return "UNKNOWN";
    }
}

DataEncoding ParseDataEncoding(const std::string& str) {
    if (str == "BINARY") return DataEncoding::BINARY;
    if (str == "JSON") return DataEncoding::JSON;
    if (str == "PROTO") return DataEncoding::PROTO;
    if (str == "EXPRESSION") return DataEncoding::EXPRESSION;
    if (str == "GRAPH") return DataEncoding::GRAPH;
    throw std::invalid_argument("Unknown DataEncoding: " + str);
}

// Timestamp implementations

Timestamp Timestamp::Now() {
    auto since_epoch = ClockType::now().time_since_epoch();
    return Timestamp(static_cast<uint64_t>(
        std::chrono::duration_cast<Duration>(since_epoch).count()));
}

int Timestamp::HourOfDay() const {
    std::time_t seconds = static_cast<std::time_t>(nanos_ / 1000000000ULL);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    return utc.tm_hour;
}

std::string Timestamp::ToString() const {
    auto seconds = nanos_ / 1000000000ULL;
    auto remaining = nanos_ % 1000000000ULL;

    std::ostringstream oss;
    oss << "Timestamp(" << seconds << "."
        << std::setw(9) << std::setfill('0') << remaining << "s)";
    return oss.str();
}

} // namespace patex
