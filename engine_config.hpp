#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json_fwd.hpp>

namespace streetwise {

// Tunables for the whole pipeline. Defaults mirror bootstrap_config::defaultEngineConfig().
struct EngineConfig {
    // Combiner
    double highConfidence      = 0.7;
    double patternThreshold    = 0.4;
    double semanticThreshold   = 0.25;
    double fallbackSimilarity  = 0.15;

    // Semantic engine
    double centroidWeight      = 0.6;
    double exemplarWeight      = 0.4;
    std::size_t topMatches     = 3;
    std::size_t phraseCacheSize = 500;

    // Pattern matcher
    double ruleScore           = 3.0;
    double scoreDivisor        = 6.0;
    std::size_t maxPatternInput = 1000;   // chars the regexes see

    // Typo corrector
    int maxDistance            = 2;
    std::size_t typoCacheSize  = 1000;
    double suggestionThreshold = 2.5;
    std::size_t maxSuggestions = 5;

    // Classification cache
    std::size_t classificationCacheSize = 200;

    // Logging
    std::string logFile = "streetwise.log";
    bool verbose        = false;

    static EngineConfig fromJson(const nlohmann::json& j);
};

} // namespace streetwise
