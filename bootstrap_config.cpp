#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace streetwise {

// ----------------- typed view -----------------
EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
    EngineConfig c;
    nlohmann::json cfg = j.is_object() ? j : nlohmann::json::object();
    bootstrap_config::mergeDefaults(cfg, bootstrap_config::defaultEngineConfig());

    const auto& th = cfg["thresholds"];
    c.highConfidence     = th["high_confidence"].get<double>();
    c.patternThreshold   = th["pattern"].get<double>();
    c.semanticThreshold  = th["semantic"].get<double>();
    c.fallbackSimilarity = th["fallback_similarity"].get<double>();

    const auto& sem = cfg["semantic"];
    c.centroidWeight  = sem["centroid_weight"].get<double>();
    c.exemplarWeight  = sem["exemplar_weight"].get<double>();
    c.topMatches      = sem["top_matches"].get<std::size_t>();
    c.phraseCacheSize = sem["phrase_cache_size"].get<std::size_t>();

    const auto& pat = cfg["pattern"];
    c.ruleScore    = pat["rule_score"].get<double>();
    c.scoreDivisor = pat["score_divisor"].get<double>();
    c.maxPatternInput = pat["max_input_chars"].get<std::size_t>();

    const auto& typo = cfg["typo"];
    c.maxDistance         = typo["max_distance"].get<int>();
    c.typoCacheSize       = typo["cache_size"].get<std::size_t>();
    c.suggestionThreshold = typo["suggestion_threshold"].get<double>();
    c.maxSuggestions      = typo["max_suggestions"].get<std::size_t>();

    c.classificationCacheSize = cfg["cache"]["classification_cache_size"].get<std::size_t>();

    c.logFile = cfg["logging"]["file"].get<std::string>();
    c.verbose = cfg["logging"]["verbose"].get<bool>();
    return c;
}

namespace bootstrap_config {

// ----------------- helpers -----------------
// Integer and float literals are one JSON number type for patching purposes
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        if (!cfg.contains(key) || cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultEngineConfig() {
    return {
        {"thresholds", {
            {"high_confidence", 0.7},
            {"pattern", 0.4},
            {"semantic", 0.25},
            {"fallback_similarity", 0.15}
        }},
        {"semantic", {
            {"centroid_weight", 0.6},
            {"exemplar_weight", 0.4},
            {"top_matches", 3},
            {"phrase_cache_size", 500}
        }},
        {"pattern", {
            {"rule_score", 3.0},
            {"score_divisor", 6.0},
            {"max_input_chars", 1000}
        }},
        {"typo", {
            {"max_distance", 2},
            {"cache_size", 1000},
            {"suggestion_threshold", 2.5},
            {"max_suggestions", 5}
        }},
        {"cache", {
            {"classification_cache_size", 200}
        }},
        {"logging", {
            {"file", "streetwise.log"},
            {"verbose", false}
        }}
    };
}

nlohmann::json defaultErrors() {
    return {
        {"ERR_RESOURCE_MISSING", {
            {"user", "[Data] A knowledge file is missing; some intents may not be recognized."},
            {"debug", "Resource file could not be opened."}
        }},
        {"ERR_RESOURCE_PARSE", {
            {"user", "[Data] A knowledge file is damaged; some intents may not be recognized."},
            {"debug", "Resource file is not valid JSON or has an unexpected shape."}
        }},
        {"ERR_RULE_INVALID_REGEX", {
            {"user", "[Rules] A trigger rule was skipped."},
            {"debug", "Trigger rule pattern failed to compile."}
        }},
        {"ERR_PATTERN_CLASSIFIER", {
            {"user", "[Classifier] Pattern matching failed; using semantic matching only."},
            {"debug", "Pattern classifier threw during classification."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "[Config] Config file invalid → reset to defaults."},
            {"debug", "engine_config.json failed parsing or validation."}
        }},
        {"ERR_UNKNOWN_INTENT", {
            {"user", "[Catalog] No such intent."},
            {"debug", "Mutation referenced an intent id that is not in the catalog."}
        }},
        {"ERR_UNKNOWN_CLUSTER", {
            {"user", "[Semantic] No such word cluster."},
            {"debug", "Mutation referenced a cluster name that does not exist."}
        }}
    };
}

// ----------------- loader -----------------
bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) {
            throw std::runtime_error(name + " is not a JSON object");
        }

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, &patchedCount)) {
            std::ofstream(path) << outConfig.dump(2);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid → reset to defaults (" + e.what() + ")");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode, path.string());

        outConfig = defaults;
        std::ofstream(path) << outConfig.dump(2);
        return false;
    }
}

// ----------------- entry -----------------
EngineConfig initAll(const fs::path& resourceDir, const fs::path& configPath) {
    beginPhaseGroup();

    // errors.json
    fs::path errPath = resourceDir / "errors.json";
    nlohmann::json errorsCfg;
    loadConfig(errPath, defaultErrors(), errorsCfg, "Errors config", "");
    ErrorManager::loadFromJson(errorsCfg);

    // engine_config.json
    fs::path cfgPath = configPath.empty() ? resourceDir / "engine_config.json" : configPath;
    nlohmann::json engineCfg;
    loadConfig(cfgPath, defaultEngineConfig(), engineCfg, "Engine config", "ERR_CONFIG_INVALID");

    endPhaseGroup();

    EngineConfig config = EngineConfig::fromJson(engineCfg);
    setVerboseLogging(config.verbose);
    return config;
}

} // namespace bootstrap_config
} // namespace streetwise
