#pragma once
#include <string>
#include <utility>
#include <vector>
#include "intent.hpp"
#include "nlp/lexicon.hpp"

namespace streetwise {

// Rewrites slang, abbreviations, contractions and idioms to canonical words.
// Total over any input; normalizing its own output yields no further changes.
class TextNormalizer {
public:
    explicit TextNormalizer(Lexicon lexicon = {});

    NormalizationResult normalize(const std::string& text) const;

    // Runtime additions, effective immediately
    void addSlangTerm(const std::string& slang, const std::string& canonical);
    void addPhrase(const std::string& phrase, const std::string& canonical);

    // True if any whitespace token is a known slang term or abbreviation
    bool hasSlang(const std::string& text) const;

    const Lexicon& lexicon() const { return tables; }
    Lexicon::Stats stats() const { return tables.stats(); }

private:
    std::string clean(const std::string& text) const;
    std::string expandPhrases(const std::string& text, std::vector<Substitution>& changes) const;
    std::string rewriteTokens(const std::string& text, std::vector<Substitution>& changes) const;
    void rebuildPhraseOrder();

    Lexicon tables;
    std::vector<std::pair<std::string, std::string>> phraseOrder;   // longest idiom first
};

} // namespace streetwise
