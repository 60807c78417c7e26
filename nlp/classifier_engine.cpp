#include "nlp/classifier_engine.hpp"
#include "nlp/text_utils.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

namespace streetwise {

// ------------------------------------------------------------
// Loading
// ------------------------------------------------------------
EngineData EngineData::load(const fs::path& dir) {
    EngineData data;
    std::string err;

    beginPhaseGroup();

    bool ok = data.catalog.loadFromFile((dir / "intents.json").string(), &err);
    LOG_PHASE("Intent catalog load", ok);

    ok = data.lexicon.load((dir / "lexicon.json").string(), &err);
    LOG_PHASE("Lexicon load", ok);

    ok = data.semantic.load((dir / "semantic.json").string(), &err);
    LOG_PHASE("Semantic model load", ok);

    ok = data.rules.load_rules((dir / "nlp_rules.json").string(), &err);
    LOG_PHASE("NLP rules load", ok);

    nlohmann::json vocab;
    ok = loadJsonResource(dir / "vocabulary.json", vocab, &err);
    if (ok) {
        try {
            data.vocabulary = vocab.at("words").get<std::vector<std::string>>();
        } catch (const std::exception& e) {
            ErrorManager::report("ERR_RESOURCE_PARSE", "vocabulary.json: " + std::string(e.what()));
            ok = false;
        }
    }
    LOG_PHASE("Vocabulary load", ok);

    endPhaseGroup();
    return data;
}

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------
Preprocessor ClassifierEngine::makePreprocessor(const EngineData& data, const EngineConfig& config) {
    // order decides typo tie-breaks: base list, cluster words, keywords,
    // exemplar words, canonical lexicon words, importance keys
    TypoCorrector typo(config.typoCacheSize, config.maxSuggestions, config.suggestionThreshold);
    typo.addWords(data.vocabulary);
    for (const auto& cluster : data.semantic.clusters) {
        typo.addWords(cluster.words);
    }
    for (const auto& def : data.catalog.all()) {
        typo.addWords(def.keywords);
    }
    for (const auto& def : data.catalog.all()) {
        for (const auto& phrase : def.exemplars) {
            typo.addWords(text::wordTokens(text::toLower(phrase)));
        }
    }
    typo.addWords(data.lexicon.canonicalWords());
    for (const auto& [word, weight] : data.semantic.importance) {
        typo.addWord(word);
    }

    LOG_DEBUG("Engine", "Typo vocabulary: " + std::to_string(typo.stats().vocabularySize) + " words");
    return Preprocessor(TextNormalizer(data.lexicon), std::move(typo), config.maxDistance);
}

ClassifierEngine::ClassifierEngine(EngineData data, const EngineConfig& config)
    : settings(config),
      prep(makePreprocessor(data, config)),
      intents(std::move(data.catalog)),
      semanticEngine(std::move(data.semantic), intents, prep, config),
      patternMatcher(std::move(data.rules), intents, config),
      combiner(patternMatcher, semanticEngine, Combiner::Thresholds::fromConfig(config)),
      cache(config.classificationCacheSize) {
    LOG_PHASE("Classifier engine ready", true);
}

std::unique_ptr<ClassifierEngine> ClassifierEngine::create(const fs::path& resourceDir,
                                                           const EngineConfig& config) {
    return std::make_unique<ClassifierEngine>(EngineData::load(resourceDir), config);
}

// ------------------------------------------------------------
// Classification
// ------------------------------------------------------------
ClassificationResult ClassifierEngine::classify(const std::string& rawText) {
    counters.total++;

    ClassificationResult result;
    result.preprocessed.original = rawText;

    std::string trimmed = text::trim(rawText);
    if (trimmed.empty()) {
        result.friendlyName = intents.friendlyName(result.intent);
        result.source = source::EmptyInput;
        return result;
    }

    std::string key = text::toLower(trimmed);
    if (const CacheSummary* hit = cache.find(key)) {
        counters.cacheHits++;
        result.intent = hit->intent;
        result.confidence = hit->confidence;
        result.friendlyName = hit->friendlyName;
        result.source = hit->source;
        result.fromCache = true;
        LOG_TRACE("Engine", "cache hit: \"" + key + "\" -> " + result.intent);
        return result;
    }

    result.preprocessed = prep.run(trimmed);
    Combiner::Decision d = combiner.decide(result.preprocessed.corrected);

    result.intent = d.intent;
    result.confidence = d.confidence;
    result.friendlyName = intents.friendlyName(d.intent);
    result.source = d.source;
    result.topMatches = d.semanticRan ? d.semantic.topMatches : d.pattern.topMatches;

    tally(result.source);
    cache.put(key, { result.intent, result.confidence, result.friendlyName, result.source });

    LOG_TRACE("Engine", "\"" + trimmed + "\" -> " + result.intent + " [" + result.source + "] " +
                        std::to_string(result.confidence));
    return result;
}

std::vector<IntentScore> ClassifierEngine::getTopMatches(const std::string& text, size_t n) {
    std::vector<IntentScore> ranked = semanticEngine.rankIntents(prep.prepare(text));
    if (ranked.size() > n) ranked.resize(n);
    return ranked;
}

std::vector<std::string> ClassifierEngine::getConcepts(const std::string& text) {
    return semanticEngine.extractConcepts(prep.prepare(text));
}

bool ClassifierEngine::isSimilarTo(const std::string& text, const std::string& reference, double threshold) {
    return semanticEngine.areSimilar(prep.prepare(text), prep.prepare(reference), threshold);
}

std::vector<Suggestion> ClassifierEngine::getSuggestions(const std::string& text) {
    std::vector<Suggestion> out;
    for (const auto& match : getTopMatches(text, 4)) {
        out.push_back({ match.intent, match.friendlyName, match.score, intents.hint(match.intent) });
    }
    return out;
}

Analysis ClassifierEngine::analyze(const std::string& text) {
    Analysis a;
    a.input = prep.run(text);

    try {
        a.pattern = patternMatcher.classifyIntent(a.input.corrected);
    } catch (const std::exception& e) {
        ErrorManager::report("ERR_PATTERN_CLASSIFIER", e.what());
    }
    a.semantic = semanticEngine.classifyIntent(a.input.corrected);
    a.concepts = semanticEngine.extractConcepts(a.input.corrected);
    a.final = classify(text);
    return a;
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------
void ClassifierEngine::afterTableChange() {
    semanticEngine.clearCache();
    cache.clear();
}

void ClassifierEngine::addWord(const std::string& word) {
    prep.corrector().addWord(word);
    afterTableChange();
}

void ClassifierEngine::addPhrase(const std::string& phrase, const std::string& canonical) {
    prep.normalizer().addPhrase(phrase, canonical);
    prep.corrector().addWords(text::wordTokens(text::toLower(canonical)));
    afterTableChange();
}

void ClassifierEngine::addSlangTerm(const std::string& slang, const std::string& canonical) {
    prep.normalizer().addSlangTerm(slang, canonical);
    prep.corrector().addWords(text::wordTokens(text::toLower(canonical)));
    afterTableChange();
}

bool ClassifierEngine::addWordToCluster(const std::string& word, const std::string& cluster) {
    if (!semanticEngine.addWordToCluster(word, cluster)) {
        return false;
    }
    prep.corrector().addWord(word);
    afterTableChange();
    return true;
}

void ClassifierEngine::setWordImportance(const std::string& word, double weight) {
    semanticEngine.setWordImportance(word, weight);
    cache.clear();
}

bool ClassifierEngine::addExemplar(const std::string& intent, const std::string& phrase) {
    if (intent == IntentCatalog::kUnknown || !intents.addExemplar(intent, phrase)) {
        ErrorManager::report("ERR_UNKNOWN_INTENT", intent);
        return false;
    }
    prep.corrector().addWords(text::wordTokens(text::toLower(phrase)));
    afterTableChange();
    semanticEngine.initialize();
    return true;
}

// ------------------------------------------------------------
// Housekeeping
// ------------------------------------------------------------
void ClassifierEngine::clearCache() {
    cache.clear();
    semanticEngine.clearCache();
}

void ClassifierEngine::tally(const std::string& src) {
    if (src == source::PatternHigh || src == source::PatternPreferred || src == source::PatternOnly) {
        counters.patternHits++;
    } else if (src == source::SemanticPreferred || src == source::SemanticOnly ||
               src == source::SemanticFallback) {
        counters.semanticHits++;
    } else if (src == source::CombinedAgreement) {
        counters.combinedHits++;
    }
}

ClassifierEngine::Stats ClassifierEngine::stats() const {
    Stats s;
    s.totalClassifications = counters.total;
    s.cacheHits = counters.cacheHits;
    s.patternHits = counters.patternHits;
    s.semanticHits = counters.semanticHits;
    s.combinedHits = counters.combinedHits;
    s.cacheSize = cache.size();

    double denom = static_cast<double>(counters.total > 0 ? counters.total : 1);
    s.hitRate      = counters.cacheHits / denom;
    s.patternRate  = counters.patternHits / denom;
    s.semanticRate = counters.semanticHits / denom;
    s.combinedRate = counters.combinedHits / denom;
    return s;
}

void ClassifierEngine::resetStats() {
    counters = Counters{};
}

} // namespace streetwise
