// File: src/cli/main.cpp
//
// patex_replay - replay recorded observations through the pattern engine
//
// Usage: patex_replay [--config file.yaml] observations.csv

#include "cli/replay_tool.hpp"
#include "config/engine_config.hpp"
#include <fstream>
#include <iostream>
#include <string>

using namespace patex;

static void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config file.yaml] observations.csv\n"
              << "\n"
              << "CSV columns: key,success,latency_ms,cost[,action[,unix_seconds]]\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    std::string input_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return 2;
            }
            config_path = argv[++i];
        } else if (input_path.empty()) {
            input_path = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            PrintUsage(argv[0]);
            return 2;
        }
    }

    if (input_path.empty()) {
        PrintUsage(argv[0]);
        return 2;
    }

    EngineConfig config = EngineConfig::Default();
    if (!config_path.empty()) {
        auto loaded = EngineConfig::LoadFromFile(config_path);
        if (!loaded) {
            return 1;
        }
        config = *loaded;
    }

    std::ifstream input(input_path);
    if (!input.is_open()) {
        std::cerr << "Failed to open observations file: " << input_path << std::endl;
        return 1;
    }

    try {
        ReplaySummary summary = RunReplay(config, input, std::cout);
        return summary.malformed > 0 ? 3 : 0;
    } catch (const std::exception& e) {
        std::cerr << "Replay failed: " << e.what() << std::endl;
        return 1;
    }
}
