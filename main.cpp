#include "bootstrap_config.hpp"
#include "logger.hpp"
#include "resources.hpp"
#include "nlp/classifier_engine.hpp"
#include "nlp/result_json.hpp"
#include "nlp/text_utils.hpp"

#include <iostream>
#include <string>

using namespace streetwise;

static void printUsage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " [--resources DIR] [--config FILE] [--analyze] [--verbose]\n"
              << "Reads one utterance per line from stdin and prints JSON.\n"
              << "Commands: :stats  :clear  :suggest <text>  :spell <word>  :quit\n";
}

// ============================================================
// Main entry point
// ============================================================
int main(int argc, char* argv[]) {
    std::string resourceDir;
    std::string configPath;
    bool analyzeMode = false;
    bool verbose = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--resources" && i + 1 < argc) {
            resourceDir = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--analyze") {
            analyzeMode = true;
        } else if (arg == "--verbose") {
            verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "[Console] Unknown argument: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    if (resourceDir.empty()) {
        resourceDir = getResourcePath();
    }

    // Config first so the log file name is known
    EngineConfig config = bootstrap_config::initAll(resourceDir, configPath);
    if (verbose) setVerboseLogging(true);

    initLogger(config.logFile);
    LOG_PHASE("Startup begin", true);

    auto engine = ClassifierEngine::create(resourceDir, config);
    LOG_PHASE("Startup complete, reading stdin", true);

    std::string line;
    while (std::getline(std::cin, line)) {
        std::string cmd = text::trim(line);

        if (cmd == ":quit" || cmd == ":q") {
            break;
        }
        if (cmd == ":stats") {
            std::cout << toJsonLine(engine->stats()) << std::endl;
            continue;
        }
        if (cmd == ":clear") {
            engine->clearCache();
            std::cout << R"({"cleared":true})" << std::endl;
            continue;
        }
        if (cmd.rfind(":spell", 0) == 0) {
            std::string rest = text::trim(cmd.substr(6));
            std::cout << toJsonLine(engine->getSpellingSuggestions(rest)) << std::endl;
            continue;
        }
        if (cmd.rfind(":suggest", 0) == 0) {
            std::string rest = text::trim(cmd.substr(8));
            std::cout << toJsonLine(engine->getSuggestions(rest)) << std::endl;
            continue;
        }

        nlohmann::json out;
        if (analyzeMode) {
            out = engine->analyze(line);
        } else {
            out = engine->classify(line);
        }
        std::cout << toJsonLine(out) << std::endl;
    }

    LOG_PHASE("Shutdown", true);
    shutdownLogger();
    return 0;
}
