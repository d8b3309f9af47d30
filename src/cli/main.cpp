// File: src/cli/main.cpp
//
// dedupe_cli entry point
//
// Usage: dedupe_cli [--config <file.yaml>] [--db <file.db>] [--debug]

#include "cli/dedupe_cli.hpp"
#include <cstring>
#include <iostream>

using namespace dedupe;

namespace {

void PrintUsage(const char* program) {
    std::cerr << "Usage: " << program << " [--config <file.yaml>] [--db <file.db>] [--debug]\n";
}

} // namespace

int main(int argc, char** argv) {
    DetectorConfig config = DetectorConfig::Default();
    std::string db_override;
    bool debug = false;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            auto loaded = DetectorConfig::LoadFromFile(argv[++i]);
            if (!loaded) {
                return 1;
            }
            config = *loaded;
        } else if (std::strcmp(argv[i], "--db") == 0 && i + 1 < argc) {
            db_override = argv[++i];
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            debug = true;
        } else {
            PrintUsage(argv[0]);
            return 1;
        }
    }

    if (!db_override.empty()) {
        config.storage.db_path = db_override;
    }
    if (debug) {
        config.logging.debug_logging = true;
    }

    try {
        DedupeCli cli(config);
        cli.Run();
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
