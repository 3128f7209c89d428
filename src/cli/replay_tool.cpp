// File: src/cli/replay_tool.cpp
#include "cli/replay_tool.hpp"
#include "core/pattern_engine.hpp"
#include "memory/shared_region.hpp"
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace patex {

namespace {

std::vector<std::string> SplitFields(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        // Trim surrounding whitespace
        size_t start = field.find_first_not_of(" \t\r");
        size_t end = field.find_last_not_of(" \t\r");
        fields.push_back(start == std::string::npos ? "" : field.substr(start, end - start + 1));
    }
    return fields;
}

std::optional<bool> ParseSuccess(const std::string& value) {
    if (value == "1" || value == "true" || value == "yes" || value == "ok") {
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "fail") {
        return false;
    }
    return std::nullopt;
}

std::unique_ptr<ISharedRegion> MakeRegion(const EngineConfig& config) {
    const size_t size = PatternEngine::RequiredLayout(config).RequiredSize();
    if (config.storage.region_path.empty()) {
        return std::make_unique<MappedRegion>(size);
    }
    return std::make_unique<MappedRegion>(config.storage.region_path, size);
}

void PrintPattern(std::ostream& out, const Pattern& pattern) {
    out << "  " << pattern.ToString() << "\n";
}

} // anonymous namespace

std::optional<ReplayRecord> ParseReplayLine(const std::string& line) {
    std::vector<std::string> fields = SplitFields(line);
    if (fields.size() < 4 || fields.size() > 6 || fields[0].empty()) {
        return std::nullopt;
    }

    auto success = ParseSuccess(fields[1]);
    if (!success) {
        return std::nullopt;
    }

    ReplayRecord record;
    record.key = fields[0];
    record.observation.success = *success;

    try {
        record.observation.latency_ms = std::stod(fields[2]);
        record.observation.cost = std::stod(fields[3]);

        if (fields.size() >= 6 && !fields[5].empty()) {
            const uint64_t seconds = std::stoull(fields[5]);
            record.observation.timestamp = Timestamp::FromNanos(seconds * 1000000000ULL);
        } else {
            record.observation.timestamp = Timestamp::Now();
        }
    } catch (const std::logic_error&) {
        return std::nullopt;
    }

    if (fields.size() >= 5 && !fields[4].empty()) {
        record.observation.attributes["action"] = fields[4];
    }
    return record;
}

ReplaySummary RunReplay(const EngineConfig& config, std::istream& input, std::ostream& out) {
    auto region = MakeRegion(config);
    PatternEngine engine(*region, config);

    ReplaySummary summary;
    std::string line;
    while (std::getline(input, line)) {
        ++summary.lines_read;
        if (line.empty() || line[0] == '#' || line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }

        auto record = ParseReplayLine(line);
        if (!record) {
            std::cerr << "line " << summary.lines_read << ": malformed observation, skipped" << std::endl;
            ++summary.malformed;
            continue;
        }

        engine.Observe(record->key, record->observation);
        ++summary.observations;
    }

    PatternDetector::DetectionResult result = engine.DetectPatterns();
    summary.published = result.published.size();
    summary.rejected = result.rejected.size();

    out << "Observations: " << summary.observations
        << " (" << engine.detector().KeyCount() << " keys, "
        << summary.malformed << " malformed)\n";
    out << "Candidates: " << result.candidates
        << ", discarded: " << result.discarded << "\n\n";

    out << "Published " << result.published.size() << " pattern(s):\n";
    for (const auto& pattern : result.published) {
        PrintPattern(out, pattern);
    }

    out << "Rejected " << result.rejected.size() << " pattern(s):\n";
    for (const auto& rejected : result.rejected) {
        PrintPattern(out, rejected.pattern);
        for (const auto& threat : rejected.threats) {
            out << "    " << ToString(threat.type) << "/" << ToString(threat.severity)
                << ": " << threat.message << "\n";
        }
    }

    TieredStorage::Stats stats = engine.storage().GetStats();
    out << "\nStorage: hot=" << stats.hot_count
        << " warm=" << stats.warm_count
        << " cold=" << stats.cold_count
        << " ephemeral=" << stats.ephemeral_count
        << " total=" << stats.total_patterns
        << " evictions=" << stats.evictions
        << " arena_used=" << stats.arena_used << "\n";

    AnalyticsMetrics metrics = engine.GetMetrics();
    out << "Analytics: detected=" << metrics.patterns_detected
        << " false_positives=" << metrics.false_positives
        << std::fixed << std::setprecision(3)
        << " detection_latency_ms=" << metrics.detection_latency_ms << "\n";

    return summary;
}

} // namespace patex
