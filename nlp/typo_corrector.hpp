#pragma once
#include <optional>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>
#include "intent.hpp"
#include "nlp/fifo_cache.hpp"

namespace streetwise {

// Snaps misspelled words onto the domain vocabulary.
// correct() uses strict Damerau-Levenshtein; getSuggestions() uses the
// keyboard/phonetic weighted distance. Neither is used in place of the other.
class TypoCorrector {
public:
    struct Stats {
        size_t vocabularySize = 0;
        size_t cacheSize = 0;
        size_t maxCacheSize = 0;
    };

    explicit TypoCorrector(size_t cacheSize = 1000,
                           size_t maxSuggestions = 5,
                           double suggestionThreshold = 2.5);

    // Vocabulary order matters: on equal distance the earlier word wins
    void addWord(const std::string& word);
    void addWords(const std::vector<std::string>& words);
    bool isKnownWord(const std::string& word) const;
    const std::vector<std::string>& vocabulary() const { return vocabularyList; }

    CorrectionResult correct(const std::string& text, int maxDistance = 2);

    // Up to maxResults vocabulary words within threshold weighted distance, closest first.
    // The one-argument form uses the limits given at construction.
    std::vector<std::string> getSuggestions(const std::string& word) const;
    std::vector<std::string> getSuggestions(const std::string& word,
                                            size_t maxResults,
                                            double threshold) const;

    // Not a known word, but something known is within distance 2
    bool mightBeTypo(const std::string& word);

    void clearCache() { cache.clear(); }
    Stats stats() const;

private:
    using Candidate = std::optional<std::pair<std::string, int>>;

    Candidate findBestCorrection(const std::string& word, int maxDistance);

    size_t suggestionLimit;
    double suggestionThreshold;
    std::vector<std::string> vocabularyList;
    std::unordered_set<std::string> vocabularySet;
    FifoCache<std::string, Candidate> cache;   // "word|maxDistance" -> best candidate
};

} // namespace streetwise
