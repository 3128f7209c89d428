// File: src/config/engine_config.cpp
//
// YAML Configuration Implementation for the PatEx engine

#include "config/engine_config.hpp"
#include <yaml.h>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>
#include <iostream>
#include <stdexcept>

namespace patex {

// Helper function to read string from YAML scalar
static std::string GetScalarValue(yaml_event_t* event) {
    return std::string(reinterpret_cast<char*>(event->data.scalar.value),
                      event->data.scalar.length);
}

// Parse a non-negative integer that fits T. std::stoul alone accepts a
// leading '-' and wraps it to a huge value.
// @throws std::invalid_argument or std::out_of_range (both std::logic_error)
template <typename T>
static T ParseUnsigned(const std::string& value) {
    const size_t first = value.find_first_not_of(" \t");
    if (first != std::string::npos && value[first] == '-') {
        throw std::invalid_argument("negative value");
    }
    size_t consumed = 0;
    const unsigned long long parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    if (parsed > std::numeric_limits<T>::max()) {
        throw std::out_of_range("value too large");
    }
    return static_cast<T>(parsed);
}

// Parse a finite double; nan and inf are rejected
static double ParseDouble(const std::string& value) {
    size_t consumed = 0;
    const double parsed = std::stod(value, &consumed);
    if (consumed != value.size()) {
        throw std::invalid_argument("trailing characters");
    }
    if (!std::isfinite(parsed)) {
        throw std::invalid_argument("value is not finite");
    }
    return parsed;
}

// Apply one "section.key: value" setting
// @return false if the setting is unknown
// @throws std::logic_error on malformed numbers
static bool ApplySetting(EngineConfig& config, const std::string& section,
                         const std::string& key, const std::string& value) {
    if (section == "storage") {
        auto& s = config.storage;
        if (key == "hot_capacity") s.hot_capacity = ParseUnsigned<size_t>(value);
        else if (key == "warm_capacity") s.warm_capacity = ParseUnsigned<size_t>(value);
        else if (key == "ephemeral_capacity") s.ephemeral_capacity = ParseUnsigned<size_t>(value);
        else if (key == "arena_size") s.arena_size = ParseUnsigned<size_t>(value);
        else if (key == "bloom_size_bytes") s.bloom_size_bytes = ParseUnsigned<size_t>(value);
        else if (key == "cold_backend") s.cold_backend = value;
        else if (key == "cold_path") s.cold_path = value;
        else if (key == "region_path") s.region_path = value;
        else return false;
    }
    else if (section == "detection") {
        auto& d = config.detection;
        if (key == "window_size") d.window_size = ParseUnsigned<size_t>(value);
        else if (key == "min_samples") d.min_samples = ParseUnsigned<size_t>(value);
        else if (key == "min_confidence") d.min_confidence = ParseUnsigned<uint32_t>(value);
        else if (key == "max_age_hours") d.max_age_hours = ParseUnsigned<uint32_t>(value);
        else if (key == "source_name") d.source_name = value;
        else return false;
    }
    else if (section == "evolution") {
        auto& e = config.evolution;
        if (key == "mutation_rate") e.mutation_rate = ParseDouble(value);
        else if (key == "selection_count") e.selection_count = ParseUnsigned<size_t>(value);
        else if (key == "interval_ms") e.interval_ms = ParseUnsigned<uint64_t>(value);
        else if (key == "seed") e.seed = ParseUnsigned<uint64_t>(value);
        else return false;
    }
    else if (section == "security") {
        auto& s = config.security;
        if (key == "logic_bomb_horizon_minutes") s.logic_bomb_horizon_minutes = ParseUnsigned<uint64_t>(value);
        else if (key == "complexity_ceiling") s.complexity_ceiling = ParseUnsigned<uint32_t>(value);
        else if (key == "rate_limit_capacity") s.rate_limit_capacity = ParseDouble(value);
        else if (key == "rate_limit_refill_per_second") s.rate_limit_refill_per_second = ParseDouble(value);
        else if (key == "rate_limit_max_sources") s.rate_limit_max_sources = ParseUnsigned<size_t>(value);
        else return false;
    }
    else if (section == "subscription") {
        if (key == "tick_ms") config.subscription.tick_ms = ParseUnsigned<uint64_t>(value);
        else return false;
    }
    else if (section == "analytics") {
        if (key == "history_size") config.analytics.history_size = ParseUnsigned<size_t>(value);
        else return false;
    }
    else {
        return false;
    }
    return true;
}

std::optional<EngineConfig> EngineConfig::LoadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open config file: " << filepath << std::endl;
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return LoadFromString(buffer.str());
}

std::optional<EngineConfig> EngineConfig::LoadFromString(const std::string& yaml_content) {
    yaml_parser_t parser;
    yaml_event_t event;

    if (!yaml_parser_initialize(&parser)) {
        std::cerr << "Failed to initialize YAML parser" << std::endl;
        return std::nullopt;
    }

    yaml_parser_set_input_string(&parser,
        reinterpret_cast<const unsigned char*>(yaml_content.c_str()),
        yaml_content.size());

    EngineConfig config = Default();
    std::string current_section;
    std::string current_key;
    bool in_sequence = false;
    int depth = 0;

    bool done = false;
    bool failed = false;
    while (!done) {
        if (!yaml_parser_parse(&parser, &event)) {
            std::cerr << "YAML parse error: "
                      << (parser.problem ? parser.problem : "unknown") << std::endl;
            yaml_parser_delete(&parser);
            return std::nullopt;
        }

        switch (event.type) {
            case YAML_MAPPING_START_EVENT:
                depth++;
                break;

            case YAML_MAPPING_END_EVENT:
                depth--;
                if (depth == 1) {
                    current_section.clear();
                }
                break;

            case YAML_SEQUENCE_START_EVENT:
                if (depth == 2 && current_section == "security" &&
                    current_key == "trusted_sources") {
                    config.security.trusted_sources.clear();
                    in_sequence = true;
                }
                break;

            case YAML_SEQUENCE_END_EVENT:
                in_sequence = false;
                current_key.clear();
                break;

            case YAML_SCALAR_EVENT: {
                std::string value = GetScalarValue(&event);

                if (in_sequence) {
                    config.security.trusted_sources.push_back(value);
                } else if (depth == 1) {
                    current_section = value;
                } else if (depth == 2) {
                    if (current_key.empty()) {
                        current_key = value;
                    } else {
                        try {
                            if (!ApplySetting(config, current_section, current_key, value)) {
                                std::cerr << "Ignoring unknown setting " << current_section
                                          << "." << current_key << std::endl;
                            }
                        } catch (const std::logic_error& e) {
                            std::cerr << "Invalid value '" << value << "' for "
                                      << current_section << "." << current_key
                                      << ": " << e.what() << std::endl;
                            failed = true;
                            done = true;
                        }
                        current_key.clear();
                    }
                }
                break;
            }

            case YAML_STREAM_END_EVENT:
            case YAML_DOCUMENT_END_EVENT:
                done = true;
                break;

            default:
                break;
        }

        yaml_event_delete(&event);
    }

    yaml_parser_delete(&parser);

    if (failed) {
        return std::nullopt;
    }

    if (!config.Validate()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.GetValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return std::nullopt;
    }

    return config;
}

bool EngineConfig::SaveToFile(const std::string& filepath) const {
    std::ofstream file(filepath);
    if (!file.is_open()) {
        std::cerr << "Failed to open file for writing: " << filepath << std::endl;
        return false;
    }

    file << ToYamlString();
    return file.good();
}

std::string EngineConfig::ToYamlString() const {
    std::ostringstream ss;

    ss << "# PatEx engine configuration\n\n";

    ss << "storage:\n";
    ss << "  hot_capacity: " << storage.hot_capacity << "\n";
    ss << "  warm_capacity: " << storage.warm_capacity << "\n";
    ss << "  ephemeral_capacity: " << storage.ephemeral_capacity << "\n";
    ss << "  arena_size: " << storage.arena_size << "\n";
    ss << "  bloom_size_bytes: " << storage.bloom_size_bytes << "\n";
    ss << "  cold_backend: \"" << storage.cold_backend << "\"\n";
    ss << "  cold_path: \"" << storage.cold_path << "\"\n";
    ss << "  region_path: \"" << storage.region_path << "\"\n\n";

    ss << "detection:\n";
    ss << "  window_size: " << detection.window_size << "\n";
    ss << "  min_samples: " << detection.min_samples << "\n";
    ss << "  min_confidence: " << detection.min_confidence << "\n";
    ss << "  max_age_hours: " << detection.max_age_hours << "\n";
    ss << "  source_name: \"" << detection.source_name << "\"\n\n";

    ss << "evolution:\n";
    ss << "  mutation_rate: " << evolution.mutation_rate << "\n";
    ss << "  selection_count: " << evolution.selection_count << "\n";
    ss << "  interval_ms: " << evolution.interval_ms << "\n";
    ss << "  seed: " << evolution.seed << "\n\n";

    ss << "security:\n";
    ss << "  logic_bomb_horizon_minutes: " << security.logic_bomb_horizon_minutes << "\n";
    ss << "  complexity_ceiling: " << security.complexity_ceiling << "\n";
    ss << "  rate_limit_capacity: " << security.rate_limit_capacity << "\n";
    ss << "  rate_limit_refill_per_second: " << security.rate_limit_refill_per_second << "\n";
    ss << "  rate_limit_max_sources: " << security.rate_limit_max_sources << "\n";
    if (security.trusted_sources.empty()) {
        ss << "  trusted_sources: []\n\n";
    } else {
        ss << "  trusted_sources:\n";
        for (const auto& source : security.trusted_sources) {
            ss << "    - \"" << source << "\"\n";
        }
        ss << "\n";
    }

    ss << "subscription:\n";
    ss << "  tick_ms: " << subscription.tick_ms << "\n\n";

    ss << "analytics:\n";
    ss << "  history_size: " << analytics.history_size << "\n";

    return ss.str();
}

bool EngineConfig::Validate() const {
    return GetValidationErrors().empty();
}

std::vector<std::string> EngineConfig::GetValidationErrors() const {
    std::vector<std::string> errors;

    // Storage
    if (storage.hot_capacity == 0) {
        errors.push_back("hot_capacity must be greater than 0");
    }
    if (storage.warm_capacity == 0) {
        errors.push_back("warm_capacity must be greater than 0");
    }
    if (storage.ephemeral_capacity == 0) {
        errors.push_back("ephemeral_capacity must be greater than 0");
    }
    if (storage.arena_size == 0) {
        errors.push_back("arena_size must be greater than 0");
    }
    if (storage.bloom_size_bytes == 0) {
        errors.push_back("bloom_size_bytes must be greater than 0");
    }
    if (storage.cold_backend != "file" && storage.cold_backend != "sqlite") {
        errors.push_back("cold_backend must be one of: file, sqlite");
    }
    if (storage.cold_backend == "sqlite" && storage.cold_path.empty()) {
        errors.push_back("cold_path is required for the sqlite backend");
    }

    // Detection
    if (detection.window_size == 0) {
        errors.push_back("window_size must be greater than 0");
    }
    if (detection.min_samples == 0 || detection.min_samples > detection.window_size) {
        errors.push_back("min_samples must be between 1 and window_size");
    }
    if (detection.min_confidence > 100) {
        errors.push_back("min_confidence must be between 0 and 100");
    }
    if (detection.max_age_hours == 0) {
        errors.push_back("max_age_hours must be greater than 0");
    }
    if (detection.source_name.empty()) {
        errors.push_back("source_name must not be empty");
    }

    // Evolution
    if (!(evolution.mutation_rate >= 0.0 && evolution.mutation_rate <= 1.0)) {
        errors.push_back("mutation_rate must be between 0.0 and 1.0");
    }
    if (evolution.selection_count == 0) {
        errors.push_back("selection_count must be greater than 0");
    }
    if (evolution.interval_ms == 0) {
        errors.push_back("evolution interval_ms must be greater than 0");
    }

    // Security
    if (security.complexity_ceiling == 0 || security.complexity_ceiling > 255) {
        errors.push_back("complexity_ceiling must be between 1 and 255");
    }
    if (!(security.rate_limit_capacity >= 1.0) || std::isinf(security.rate_limit_capacity)) {
        errors.push_back("rate_limit_capacity must be at least 1");
    }
    if (!(security.rate_limit_refill_per_second >= 0.0) ||
        std::isinf(security.rate_limit_refill_per_second)) {
        errors.push_back("rate_limit_refill_per_second must be non-negative");
    }
    if (security.rate_limit_max_sources == 0) {
        errors.push_back("rate_limit_max_sources must be greater than 0");
    }

    // Subscription / analytics
    if (subscription.tick_ms == 0) {
        errors.push_back("tick_ms must be greater than 0");
    }
    if (analytics.history_size < 2) {
        errors.push_back("history_size must be at least 2");
    }

    return errors;
}

EngineConfig EngineConfig::Default() {
    return EngineConfig{};  // Uses default member initializers
}

} // namespace patex
