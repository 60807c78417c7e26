#include "nlp/semantic_engine.hpp"
#include "nlp/text_utils.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cmath>
#include <nlohmann/json.hpp>

namespace streetwise {

// ------------------------------------------------------------
// Model loading
// ------------------------------------------------------------
bool SemanticModel::load(const std::string& path, std::string* err) {
    nlohmann::json j;
    if (!loadJsonResource(path, j, err)) {
        return false;
    }
    return loadFromJson(j, err);
}

bool SemanticModel::loadFromJson(const nlohmann::json& j, std::string* err) {
    if (!j.is_object() || !j.contains("clusters") || !j["clusters"].is_array()) {
        if (err) *err = "semantic.json: expected {\"clusters\": [...], \"importance\": {...}}";
        LOG_ERROR("Semantic", "semantic.json has no clusters array");
        return false;
    }

    try {
        std::vector<WordCluster> loadedClusters;
        for (auto& c : j["clusters"]) {
            WordCluster cluster;
            cluster.name = c.value("name", "");
            for (auto& w : c.value("words", std::vector<std::string>{})) {
                cluster.words.push_back(text::toLower(w));
            }
            if (cluster.name.empty()) {
                LOG_ERROR("Semantic", "Skipping cluster without name");
                continue;
            }
            loadedClusters.push_back(std::move(cluster));
        }

        std::map<std::string, double> loadedImportance;
        if (j.contains("importance")) {
            for (auto& [word, weight] : j["importance"].items()) {
                double w = weight.get<double>();
                if (w <= 0.0) {
                    LOG_ERROR("Semantic", "Ignoring non-positive importance for: " + word);
                    continue;
                }
                loadedImportance[text::toLower(word)] = w;
            }
        }

        clusters = std::move(loadedClusters);
        importance = std::move(loadedImportance);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("Semantic", std::string("Bad semantic model entry: ") + e.what());
        return false;
    }

    LOG_DEBUG("Semantic", "Loaded " + std::to_string(clusters.size()) + " clusters, " +
                          std::to_string(importance.size()) + " importance weights");
    return true;
}

// ------------------------------------------------------------
// Engine
// ------------------------------------------------------------
SemanticEngine::SemanticEngine(SemanticModel m,
                               const IntentCatalog& intents,
                               Preprocessor& prep,
                               const EngineConfig& config)
    : model(std::move(m)),
      catalog(intents),
      preprocessor(prep),
      centroidWeight(config.centroidWeight),
      exemplarWeight(config.exemplarWeight),
      topMatches(config.topMatches),
      phraseCache(config.phraseCacheSize) {
    indexClusters();
    initialize();
}

void SemanticEngine::indexClusters() {
    dimensionNames.clear();
    wordToClusters.clear();

    for (size_t i = 0; i < model.clusters.size(); i++) {
        dimensionNames.push_back(model.clusters[i].name);
        for (const auto& w : model.clusters[i].words) {
            auto& dims = wordToClusters[w];
            if (std::find(dims.begin(), dims.end(), i) == dims.end()) {
                dims.push_back(i);
            }
        }
    }
}

double SemanticEngine::importanceOf(const std::string& word) const {
    auto it = model.importance.find(word);
    return it == model.importance.end() ? 1.0 : it->second;
}

void SemanticEngine::initialize() {
    phraseCache.clear();
    intentModels.clear();

    for (const auto& def : catalog.all()) {
        if (def.exemplars.empty()) continue;   // "unknown" never wins on similarity

        IntentModel im;
        im.id = def.id;
        im.centroid.assign(dimensionNames.size(), 0.0);

        for (const auto& phrase : def.exemplars) {
            Vector v = phraseToVector(phrase);
            for (size_t d = 0; d < v.size(); d++) im.centroid[d] += v[d];
            im.exemplars.push_back(std::move(v));
        }

        double mag = 0.0;
        for (double x : im.centroid) mag += x * x;
        mag = std::sqrt(mag);
        if (mag > 0.0) {
            // unit-length mean (the 1/n factor cancels)
            for (double& x : im.centroid) x /= mag;
        }

        intentModels.push_back(std::move(im));
    }

    LOG_DEBUG("Semantic", "Computed " + std::to_string(intentModels.size()) +
                          " centroids over " + std::to_string(dimensionNames.size()) + " dimensions");
}

// ------------------------------------------------------------
// Vectors
// ------------------------------------------------------------
SemanticEngine::Vector SemanticEngine::phraseToVector(const std::string& phrase) {
    if (const Vector* hit = phraseCache.find(phrase)) {
        return *hit;
    }

    Vector v(dimensionNames.size(), 0.0);
    std::string prepared = preprocessor.prepare(phrase);

    for (const auto& word : text::wordTokens(prepared)) {
        if (word.size() <= 1) continue;
        auto it = wordToClusters.find(word);
        if (it == wordToClusters.end()) continue;

        double weight = importanceOf(word);
        for (size_t dim : it->second) v[dim] += weight;
    }

    double mag = 0.0;
    for (double x : v) mag += x * x;
    mag = std::sqrt(mag);
    if (mag > 0.0) {
        for (double& x : v) x /= mag;
    }

    phraseCache.put(phrase, v);
    return v;
}

double SemanticEngine::cosineSimilarity(const Vector& a, const Vector& b) {
    if (a.size() != b.size()) return 0.0;

    double dot = 0.0, ma = 0.0, mb = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += a[i] * b[i];
        ma  += a[i] * a[i];
        mb  += b[i] * b[i];
    }
    if (ma == 0.0 || mb == 0.0) return 0.0;
    return dot / (std::sqrt(ma) * std::sqrt(mb));
}

// ------------------------------------------------------------
// Classification
// ------------------------------------------------------------
std::vector<IntentScore> SemanticEngine::rankIntents(const std::string& phrase) {
    std::vector<IntentScore> ranked;

    Vector v = phraseToVector(phrase);
    bool zero = std::all_of(v.begin(), v.end(), [](double x) { return x == 0.0; });
    if (zero) return ranked;

    for (const auto& im : intentModels) {
        double centroidSim = cosineSimilarity(v, im.centroid);
        double bestExemplar = 0.0;
        for (const auto& ex : im.exemplars) {
            bestExemplar = std::max(bestExemplar, cosineSimilarity(v, ex));
        }
        double blended = centroidWeight * centroidSim + exemplarWeight * bestExemplar;
        ranked.push_back({ im.id, catalog.friendlyName(im.id), blended });
    }

    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const IntentScore& a, const IntentScore& b) { return a.score > b.score; });
    return ranked;
}

IntentGuess SemanticEngine::classifyIntent(const std::string& phrase) {
    IntentGuess guess;

    std::vector<IntentScore> ranked = rankIntents(phrase);
    if (ranked.empty()) {
        // no recognizable words
        return guess;
    }

    double top = ranked[0].score;
    double second = ranked.size() > 1 ? ranked[1].score : 0.0;
    double separation = top > 0.0 ? (top - second) / top : 0.0;

    guess.intent = ranked[0].intent;
    guess.similarity = top;
    guess.confidence = 0.7 * top + 0.3 * separation;
    if (ranked.size() > topMatches) ranked.resize(topMatches);
    guess.topMatches = std::move(ranked);
    return guess;
}

double SemanticEngine::phraseSimilarity(const std::string& a, const std::string& b) {
    return cosineSimilarity(phraseToVector(a), phraseToVector(b));
}

bool SemanticEngine::areSimilar(const std::string& a, const std::string& b, double threshold) {
    return phraseSimilarity(a, b) >= threshold;
}

std::vector<PhraseScore> SemanticEngine::findSimilar(const std::string& input,
                                                     const std::vector<std::string>& candidates,
                                                     size_t topK) {
    Vector v = phraseToVector(input);
    std::vector<PhraseScore> scored;
    for (const auto& c : candidates) {
        scored.push_back({ c, cosineSimilarity(v, phraseToVector(c)) });
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const PhraseScore& a, const PhraseScore& b) { return a.similarity > b.similarity; });
    if (scored.size() > topK) scored.resize(topK);
    return scored;
}

std::vector<std::string> SemanticEngine::extractConcepts(const std::string& phrase) {
    std::vector<std::string> concepts;
    std::string prepared = preprocessor.prepare(phrase);

    for (const auto& word : text::wordTokens(prepared)) {
        if (word.size() <= 1) continue;
        auto it = wordToClusters.find(word);
        if (it == wordToClusters.end()) continue;

        for (size_t dim : it->second) {
            const auto& name = dimensionNames[dim];
            if (std::find(concepts.begin(), concepts.end(), name) == concepts.end()) {
                concepts.push_back(name);
            }
        }
    }
    return concepts;
}

// ------------------------------------------------------------
// Mutations
// ------------------------------------------------------------
bool SemanticEngine::addWordToCluster(const std::string& word, const std::string& cluster) {
    auto it = std::find_if(model.clusters.begin(), model.clusters.end(),
                           [&](const WordCluster& c) { return c.name == cluster; });
    if (it == model.clusters.end()) {
        ErrorManager::report("ERR_UNKNOWN_CLUSTER", cluster);
        return false;
    }

    std::string lw = text::toLower(word);
    if (std::find(it->words.begin(), it->words.end(), lw) == it->words.end()) {
        it->words.push_back(lw);
    }

    indexClusters();
    phraseCache.clear();
    return true;
}

void SemanticEngine::setWordImportance(const std::string& word, double weight) {
    if (weight <= 0.0) {
        LOG_ERROR("Semantic", "Ignoring non-positive importance for: " + word);
        return;
    }
    model.importance[text::toLower(word)] = weight;
    phraseCache.clear();
}

SemanticEngine::Stats SemanticEngine::stats() const {
    return { intentModels.size(), dimensionNames.size(), phraseCache.size(),
             model.clusters.size(), wordToClusters.size() };
}

} // namespace streetwise
