#include "nlp/typo_corrector.hpp"
#include "nlp/edit_distance.hpp"
#include "nlp/text_utils.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cstdlib>

namespace streetwise {

TypoCorrector::TypoCorrector(size_t cacheSize, size_t maxSuggestions, double threshold)
    : suggestionLimit(maxSuggestions),
      suggestionThreshold(threshold),
      cache(cacheSize) {}

// ------------------------------------------------------------
// Vocabulary
// ------------------------------------------------------------
void TypoCorrector::addWord(const std::string& word) {
    std::string lw = text::toLower(word);
    if (lw.empty()) return;
    if (!std::all_of(lw.begin(), lw.end(), text::isTokenChar)) return;
    if (!vocabularySet.insert(lw).second) return;

    vocabularyList.push_back(lw);
    // cached "no match" answers may now be wrong
    cache.clear();
}

void TypoCorrector::addWords(const std::vector<std::string>& words) {
    for (const auto& w : words) addWord(w);
}

bool TypoCorrector::isKnownWord(const std::string& word) const {
    return vocabularySet.count(text::toLower(word)) != 0;
}

// ------------------------------------------------------------
// Strict correction
// ------------------------------------------------------------
static bool isCorrectable(const std::string& token) {
    bool hasLetter = false;
    for (char c : token) {
        if (!text::isTokenChar(c)) return false;
        if ((c >= '0' && c <= '9') || c == '_') return false;
        if (c >= 'a' && c <= 'z') hasLetter = true;
    }
    return hasLetter;
}

TypoCorrector::Candidate TypoCorrector::findBestCorrection(const std::string& word, int maxDistance) {
    std::string key = word + "|" + std::to_string(maxDistance);
    if (const Candidate* hit = cache.find(key)) {
        return *hit;
    }

    Candidate best;
    int bestDistance = maxDistance + 1;
    const int len = static_cast<int>(word.size());

    for (const auto& candidate : vocabularyList) {
        if (std::abs(static_cast<int>(candidate.size()) - len) > maxDistance) continue;

        int d = damerauLevenshtein(word, candidate);
        if (d <= maxDistance && d < bestDistance) {
            bestDistance = d;
            best = std::make_pair(candidate, d);
            if (d <= 1) break;   // nothing closer exists for an unknown word
        }
    }

    cache.put(key, best);
    return best;
}

CorrectionResult TypoCorrector::correct(const std::string& input, int maxDistance) {
    CorrectionResult result;

    for (auto& token : text::splitTokens(text::toLower(input))) {
        if (!isCorrectable(token) || vocabularySet.count(token)) {
            result.corrected += token;
            continue;
        }

        Candidate best = findBestCorrection(token, maxDistance);
        if (best) {
            result.corrections.push_back({ token, best->first, best->second });
            result.corrected += best->first;
        } else {
            result.corrected += token;
        }
    }

    result.wasModified = !result.corrections.empty();
    if (result.wasModified) {
        LOG_TRACE("Typo", "\"" + input + "\" -> \"" + result.corrected + "\"");
    }
    return result;
}

// ------------------------------------------------------------
// Fuzzy helpers
// ------------------------------------------------------------
std::vector<std::string> TypoCorrector::getSuggestions(const std::string& word) const {
    return getSuggestions(word, suggestionLimit, suggestionThreshold);
}

std::vector<std::string> TypoCorrector::getSuggestions(const std::string& word,
                                                       size_t maxResults,
                                                       double threshold) const {
    std::string lw = text::toLower(word);
    std::vector<std::pair<std::string, double>> scored;

    for (const auto& candidate : vocabularyList) {
        if (std::abs(static_cast<int>(candidate.size()) - static_cast<int>(lw.size())) > 2) continue;
        double d = weightedDistance(lw, candidate);
        if (d <= threshold) {
            scored.emplace_back(candidate, d);
        }
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.second < b.second; });

    std::vector<std::string> out;
    for (size_t i = 0; i < scored.size() && i < maxResults; i++) {
        out.push_back(scored[i].first);
    }
    return out;
}

bool TypoCorrector::mightBeTypo(const std::string& word) {
    std::string lw = text::toLower(word);
    if (lw.empty() || vocabularySet.count(lw)) return false;
    return findBestCorrection(lw, 2).has_value();
}

TypoCorrector::Stats TypoCorrector::stats() const {
    return { vocabularyList.size(), cache.size(), cache.capacity() };
}

} // namespace streetwise
