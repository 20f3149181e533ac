// File: src/cli/main.cpp
//
// Entry point for the TrendSketch shell
//
// Usage: trendsketch [--config <file.yaml>] [--db <transactions.db>]

#include "cli/trendsketch_cli.hpp"
#include <iostream>
#include <string>

using namespace trendsketch;

int main(int argc, char** argv) {
    std::string config_path;
    std::string db_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--db" && i + 1 < argc) {
            db_path = argv[++i];
        } else {
            std::cerr << "Usage: " << argv[0]
                      << " [--config <file.yaml>] [--db <transactions.db>]\n";
            return 2;
        }
    }

    try {
        EngineConfig config = EngineConfig::Default();
        if (!config_path.empty()) {
            auto loaded = EngineConfig::LoadFromFile(config_path);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        }

        TrendSketchCli cli(config);
        if (!db_path.empty() && !cli.LoadDatabase(db_path)) {
            return 1;
        }
        cli.Run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
