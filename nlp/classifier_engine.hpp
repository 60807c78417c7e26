#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "engine_config.hpp"
#include "intent.hpp"
#include "nlp/combiner.hpp"
#include "nlp/fifo_cache.hpp"
#include "nlp/intent_catalog.hpp"
#include "nlp/lexicon.hpp"
#include "nlp/pattern_matcher.hpp"
#include "nlp/preprocessor.hpp"
#include "nlp/semantic_engine.hpp"

namespace streetwise {

// Everything read from the resource directory
struct EngineData {
    IntentCatalog catalog;
    Lexicon lexicon;
    SemanticModel semantic;
    RuleSet rules;
    std::vector<std::string> vocabulary;   // base typo vocabulary (vocabulary.json)

    // Loads intents, lexicon, semantic, vocabulary and nlp_rules JSON from dir.
    // A missing or broken file is reported and left empty; this never throws.
    static EngineData load(const std::filesystem::path& dir);
};

struct Suggestion {
    std::string intent;
    std::string friendlyName;
    double confidence = 0.0;
    std::string suggestion;
};

// Full diagnostic breakdown of one input
struct Analysis {
    Preprocessed input;
    IntentGuess pattern;
    IntentGuess semantic;
    std::vector<std::string> concepts;
    ClassificationResult final;
};

// The hybrid classifier: normalize -> correct -> pattern/semantic -> combine -> cache.
// Not thread-safe; confine an instance to one thread or lock around it.
class ClassifierEngine {
public:
    struct Stats {
        size_t totalClassifications = 0;
        size_t cacheHits = 0;
        size_t patternHits = 0;
        size_t semanticHits = 0;
        size_t combinedHits = 0;
        size_t cacheSize = 0;
        double hitRate = 0.0;
        double patternRate = 0.0;
        double semanticRate = 0.0;
        double combinedRate = 0.0;
    };

    explicit ClassifierEngine(EngineData data, const EngineConfig& config = {});
    static std::unique_ptr<ClassifierEngine> create(const std::filesystem::path& resourceDir,
                                                    const EngineConfig& config = {});

    ClassifierEngine(const ClassifierEngine&) = delete;
    ClassifierEngine& operator=(const ClassifierEngine&) = delete;

    // --- Classification ---
    ClassificationResult classify(const std::string& rawText);
    std::vector<IntentScore> getTopMatches(const std::string& text, size_t n = 3);
    std::vector<std::string> getConcepts(const std::string& text);
    bool isSimilarTo(const std::string& text, const std::string& reference, double threshold = 0.5);
    std::vector<Suggestion> getSuggestions(const std::string& text);
    // Vocabulary words close to a misspelled word (typo.max_suggestions / suggestion_threshold)
    std::vector<std::string> getSpellingSuggestions(const std::string& word) const {
        return prep.corrector().getSuggestions(word);
    }
    Analysis analyze(const std::string& text);
    Preprocessed preprocess(const std::string& text) { return prep.run(text); }

    // --- Vocabulary mutation (in memory, immediate) ---
    void addWord(const std::string& word);
    void addPhrase(const std::string& phrase, const std::string& canonical);
    void addSlangTerm(const std::string& slang, const std::string& canonical);
    bool addWordToCluster(const std::string& word, const std::string& cluster);
    void setWordImportance(const std::string& word, double weight);
    bool addExemplar(const std::string& intent, const std::string& phrase);

    // --- Housekeeping ---
    void clearCache();
    Stats stats() const;
    void resetStats();

    const IntentCatalog& catalog() const { return intents; }
    const EngineConfig& config() const { return settings; }
    Preprocessor& preprocessor() { return prep; }
    SemanticEngine& semantic() { return semanticEngine; }
    PatternMatcher& patterns() { return patternMatcher; }

private:
    struct CacheSummary {
        std::string intent;
        double confidence = 0.0;
        std::string friendlyName;
        std::string source;
    };

    struct Counters {
        size_t total = 0;
        size_t cacheHits = 0;
        size_t patternHits = 0;
        size_t semanticHits = 0;
        size_t combinedHits = 0;
    };

    static Preprocessor makePreprocessor(const EngineData& data, const EngineConfig& config);
    void tally(const std::string& source);
    void afterTableChange();

    EngineConfig settings;
    Preprocessor prep;
    IntentCatalog intents;
    SemanticEngine semanticEngine;
    PatternMatcher patternMatcher;
    Combiner combiner;
    FifoCache<std::string, CacheSummary> cache;   // lowercased trimmed input -> summary
    Counters counters;
};

} // namespace streetwise
