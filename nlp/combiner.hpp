#pragma once
#include <string>
#include "engine_config.hpp"
#include "intent.hpp"
#include "nlp/intent_classifier.hpp"

namespace streetwise {

// Branch tags reported in ClassificationResult::source
namespace source {
    inline constexpr const char* PatternHigh       = "pattern_high";
    inline constexpr const char* CombinedAgreement = "combined_agreement";
    inline constexpr const char* PatternPreferred  = "pattern_preferred";
    inline constexpr const char* SemanticPreferred = "semantic_preferred";
    inline constexpr const char* PatternOnly       = "pattern_only";
    inline constexpr const char* SemanticOnly      = "semantic_only";
    inline constexpr const char* SemanticFallback  = "semantic_fallback";
    inline constexpr const char* NoMatch           = "no_match";
    inline constexpr const char* EmptyInput        = "empty_input";
}

// Confidence thresholds used by Combiner (exposed as Combiner::Thresholds)
struct CombinerThresholds {
    double highConfidence     = 0.7;
    double pattern            = 0.4;
    double semantic           = 0.25;
    double fallbackSimilarity = 0.15;

    static CombinerThresholds fromConfig(const EngineConfig& config);
};

// Merges the pattern and semantic opinions by confidence policy
class Combiner {
public:
    using Thresholds = CombinerThresholds;

    struct Decision {
        std::string intent = "unknown";
        double confidence = 0.0;
        std::string source;
        IntentGuess pattern;
        IntentGuess semantic;
        bool semanticRan = false;
    };

    Combiner(IntentClassifier& pattern, IntentClassifier& semantic, Thresholds thresholds = {});

    // Pattern first; semantic only when pattern is not decisive
    Decision decide(const std::string& preprocessedText);

    // Pure merge policy for when both classifiers have run
    static Decision merge(const IntentGuess& pattern, const IntentGuess& semantic, const Thresholds& t);

private:
    IntentGuess runPattern(const std::string& text);

    IntentClassifier& patternClassifier;
    IntentClassifier& semanticClassifier;
    Thresholds thresholds;
};

} // namespace streetwise
