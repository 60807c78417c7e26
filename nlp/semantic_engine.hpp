#pragma once
#include <map>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "engine_config.hpp"
#include "intent.hpp"
#include "nlp/fifo_cache.hpp"
#include "nlp/intent_catalog.hpp"
#include "nlp/intent_classifier.hpp"
#include "nlp/preprocessor.hpp"

namespace streetwise {

struct WordCluster {
    std::string name;
    std::vector<std::string> words;
};

// Concept space definition: one dimension per cluster, plus per-word weights
struct SemanticModel {
    std::vector<WordCluster> clusters;
    std::map<std::string, double> importance;   // default weight 1.0

    bool load(const std::string& path, std::string* err = nullptr);
    bool loadFromJson(const nlohmann::json& j, std::string* err = nullptr);
};

struct PhraseScore {
    std::string phrase;
    double similarity = 0.0;
};

// Bag-of-concepts classifier: phrases become unit vectors over the word
// clusters and are compared against per-intent centroids and exemplars.
class SemanticEngine : public IntentClassifier {
public:
    using Vector = std::vector<double>;

    struct Stats {
        size_t intentCount = 0;
        size_t dimensions = 0;
        size_t cacheSize = 0;
        size_t clusterCount = 0;
        size_t wordMappings = 0;
    };

    SemanticEngine(SemanticModel model,
                   const IntentCatalog& catalog,
                   Preprocessor& preprocessor,
                   const EngineConfig& config = {});

    // Vectorize every exemplar and rebuild the centroids
    void initialize();

    Vector phraseToVector(const std::string& phrase);
    static double cosineSimilarity(const Vector& a, const Vector& b);

    IntentGuess classifyIntent(const std::string& phrase) override;
    const char* name() const override { return "semantic"; }

    // Every intent with exemplars, best blended score first (empty for a zero vector)
    std::vector<IntentScore> rankIntents(const std::string& phrase);

    double phraseSimilarity(const std::string& a, const std::string& b);
    bool areSimilar(const std::string& a, const std::string& b, double threshold = 0.5);
    std::vector<PhraseScore> findSimilar(const std::string& input,
                                         const std::vector<std::string>& candidates,
                                         size_t topK = 5);
    std::vector<std::string> extractConcepts(const std::string& phrase);

    // Mutations; cached phrase vectors are dropped, centroids stay until initialize()
    bool addWordToCluster(const std::string& word, const std::string& cluster);
    void setWordImportance(const std::string& word, double weight);

    const std::vector<std::string>& clusterNames() const { return dimensionNames; }
    void clearCache() { phraseCache.clear(); }
    Stats stats() const;

private:
    struct IntentModel {
        std::string id;
        Vector centroid;
        std::vector<Vector> exemplars;
    };

    void indexClusters();
    double importanceOf(const std::string& word) const;

    SemanticModel model;
    const IntentCatalog& catalog;
    Preprocessor& preprocessor;
    double centroidWeight;
    double exemplarWeight;
    size_t topMatches;

    std::vector<std::string> dimensionNames;
    std::unordered_map<std::string, std::vector<size_t>> wordToClusters;
    std::vector<IntentModel> intentModels;   // catalog order
    FifoCache<std::string, Vector> phraseCache;
};

} // namespace streetwise
