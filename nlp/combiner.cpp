#include "nlp/combiner.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>

namespace streetwise {

Combiner::Thresholds Combiner::Thresholds::fromConfig(const EngineConfig& config) {
    return { config.highConfidence, config.patternThreshold,
             config.semanticThreshold, config.fallbackSimilarity };
}

Combiner::Combiner(IntentClassifier& pattern, IntentClassifier& semantic, Thresholds t)
    : patternClassifier(pattern), semanticClassifier(semantic), thresholds(t) {}

// A throwing pattern classifier (bad rule, regex blowup) must not take the semantic path down
IntentGuess Combiner::runPattern(const std::string& text) {
    try {
        return patternClassifier.classifyIntent(text);
    } catch (const std::exception& e) {
        ErrorManager::report("ERR_PATTERN_CLASSIFIER", e.what());
        return IntentGuess{};
    }
}

Combiner::Decision Combiner::decide(const std::string& text) {
    IntentGuess pattern = runPattern(text);

    if (pattern.confidence >= thresholds.highConfidence) {
        Decision d;
        d.intent = pattern.intent;
        d.confidence = pattern.confidence;
        d.source = source::PatternHigh;
        d.pattern = std::move(pattern);
        LOG_TRACE("Combiner", std::string(d.source) + " -> " + d.intent);
        return d;
    }

    IntentGuess semantic = semanticClassifier.classifyIntent(text);
    Decision d = merge(pattern, semantic, thresholds);
    LOG_TRACE("Combiner", d.source + " -> " + d.intent + " (" + std::to_string(d.confidence) + ")");
    return d;
}

Combiner::Decision Combiner::merge(const IntentGuess& pattern,
                                   const IntentGuess& semantic,
                                   const Thresholds& t) {
    Decision d;
    d.pattern = pattern;
    d.semantic = semantic;
    d.semanticRan = true;

    const bool patternOk  = pattern.confidence >= t.pattern;
    const bool semanticOk = semantic.confidence >= t.semantic;

    if (patternOk && semanticOk) {
        if (pattern.intent == semantic.intent) {
            d.intent = pattern.intent;
            d.confidence = std::min(1.0, (pattern.confidence + semantic.confidence) / 1.5);
            d.source = source::CombinedAgreement;
        } else if (pattern.confidence >= semantic.confidence) {
            d.intent = pattern.intent;
            d.confidence = pattern.confidence * 0.9;
            d.source = source::PatternPreferred;
        } else {
            d.intent = semantic.intent;
            d.confidence = semantic.confidence * 0.9;
            d.source = source::SemanticPreferred;
        }
    } else if (patternOk) {
        d.intent = pattern.intent;
        d.confidence = pattern.confidence;
        d.source = source::PatternOnly;
    } else if (semanticOk) {
        d.intent = semantic.intent;
        d.confidence = semantic.confidence;
        d.source = source::SemanticOnly;
    } else if (semantic.similarity > t.fallbackSimilarity) {
        d.intent = semantic.intent;
        d.confidence = semantic.confidence;
        d.source = source::SemanticFallback;
    } else {
        d.intent = "unknown";
        d.confidence = 0.0;
        d.source = source::NoMatch;
    }
    return d;
}

} // namespace streetwise
