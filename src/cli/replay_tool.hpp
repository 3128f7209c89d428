// File: src/cli/replay_tool.hpp
//
// Offline replay of recorded observations through a full engine.
//
// Input is CSV, one observation per line:
//   key,success,latency_ms,cost[,action[,unix_seconds]]
// Blank lines and lines starting with '#' are skipped.

#pragma once

#include "config/engine_config.hpp"
#include "discovery/observation_store.hpp"
#include <iosfwd>
#include <optional>
#include <string>

namespace patex {

struct ReplayRecord {
    std::string key;
    Observation observation;
};

/// Parse one CSV line
/// @return std::nullopt for a malformed line
std::optional<ReplayRecord> ParseReplayLine(const std::string& line);

struct ReplaySummary {
    size_t lines_read{0};
    size_t observations{0};
    size_t malformed{0};
    size_t published{0};
    size_t rejected{0};
};

/// Feed every observation into a fresh engine, run detection once and print
/// the published and rejected patterns followed by storage and analytics
/// statistics.
/// @throws std::invalid_argument if config is invalid
ReplaySummary RunReplay(const EngineConfig& config, std::istream& input, std::ostream& out);

} // namespace patex
