#include "nlp/text_normalizer.hpp"
#include "nlp/text_utils.hpp"

#include <algorithm>

namespace streetwise {

// Whole pipeline is repeated until a pass makes no change
static constexpr int kMaxPasses = 4;

TextNormalizer::TextNormalizer(Lexicon lexicon)
    : tables(std::move(lexicon)) {
    rebuildPhraseOrder();
}

void TextNormalizer::rebuildPhraseOrder() {
    phraseOrder.assign(tables.phrases.begin(), tables.phrases.end());
    std::stable_sort(phraseOrder.begin(), phraseOrder.end(),
                     [](const auto& a, const auto& b) { return a.first.size() > b.first.size(); });
}

// ------------------------------------------------------------
// Normalize
// ------------------------------------------------------------
NormalizationResult TextNormalizer::normalize(const std::string& text) const {
    NormalizationResult result;
    result.original = text;

    std::string current = clean(text);
    for (int pass = 0; pass < kMaxPasses && !current.empty(); pass++) {
        size_t before = result.changes.size();
        current = expandPhrases(current, result.changes);
        current = rewriteTokens(current, result.changes);
        current = text::collapseWhitespace(current);
        if (result.changes.size() == before) break;
    }

    result.normalized = current;
    result.wasModified = result.normalized != text;
    return result;
}

// ------------------------------------------------------------
// Step 1: whitespace, quote glyphs, repeated punctuation, case
// ------------------------------------------------------------
std::string TextNormalizer::clean(const std::string& text) const {
    std::string s = text::collapseWhitespace(text);

    // ‘ ’ ´ (UTF-8) and ` all become '
    static const char* const quotes[] = { "\xE2\x80\x98", "\xE2\x80\x99", "\xC2\xB4", "`" };
    for (const char* q : quotes) {
        std::string glyph(q);
        size_t pos = 0;
        while ((pos = s.find(glyph, pos)) != std::string::npos) {
            s.replace(pos, glyph.size(), "'");
            pos += 1;
        }
    }

    // "!!!" -> "!", "?!" -> "!" (last mark of the run wins)
    auto isMark = [](char c) { return c == '!' || c == '?' || c == '.'; };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (isMark(s[i]) && i + 1 < s.size() && isMark(s[i + 1])) continue;
        out += s[i];
    }

    return text::toLower(out);
}

// ------------------------------------------------------------
// Step 2: idioms, longest first, whole words only
// ------------------------------------------------------------
std::string TextNormalizer::expandPhrases(const std::string& input,
                                          std::vector<Substitution>& changes) const {
    std::string s = input;
    for (const auto& [phrase, canonical] : phraseOrder) {
        std::string out;
        size_t from = 0;
        size_t pos;
        while ((pos = s.find(phrase, from)) != std::string::npos) {
            size_t end = pos + phrase.size();
            bool okLeft  = pos == 0 || !text::isWordChar(s[pos - 1]);
            bool okRight = end == s.size() || !text::isWordChar(s[end]);
            if (okLeft && okRight) {
                out.append(s, from, pos - from);
                out += canonical;
                changes.push_back({ phrase, canonical, "phrase" });
                from = end;
            } else {
                out.append(s, from, pos + 1 - from);
                from = pos + 1;
            }
        }
        out.append(s, from, std::string::npos);
        s = std::move(out);
    }
    return s;
}

// ------------------------------------------------------------
// Step 3: per token contraction > abbreviation > slang
// ------------------------------------------------------------
std::string TextNormalizer::rewriteTokens(const std::string& input,
                                          std::vector<Substitution>& changes) const {
    static const std::string trailing = "!?.,;:";

    const std::pair<const Lexicon::Table*, const char*> lookups[] = {
        { &tables.contractions,  "contraction" },
        { &tables.abbreviations, "abbreviation" },
        { &tables.slang,         "slang" },
    };

    std::string out;
    size_t start = 0;
    while (start <= input.size()) {
        size_t end = input.find(' ', start);
        if (end == std::string::npos) end = input.size();
        std::string token = input.substr(start, end - start);
        start = end + 1;
        if (token.empty()) continue;

        // keep trailing punctuation out of the lookup
        std::string core = token;
        std::string suffix;
        size_t cut = token.find_last_not_of(trailing);
        if (cut != std::string::npos && cut + 1 < token.size()) {
            core = token.substr(0, cut + 1);
            suffix = token.substr(cut + 1);
        }

        std::string replaced = token;
        for (const auto& [table, type] : lookups) {
            auto it = table->find(core);
            if (it != table->end()) {
                changes.push_back({ core, it->second, type });
                replaced = it->second + suffix;
                break;
            }
        }

        if (!out.empty()) out += ' ';
        out += replaced;
    }
    return out;
}

// ------------------------------------------------------------
// Runtime additions
// ------------------------------------------------------------
void TextNormalizer::addSlangTerm(const std::string& slang, const std::string& canonical) {
    std::string key = text::trim(text::toLower(slang));
    if (key.empty()) return;
    tables.slang[key] = text::collapseWhitespace(text::toLower(canonical));
}

void TextNormalizer::addPhrase(const std::string& phrase, const std::string& canonical) {
    std::string key = text::collapseWhitespace(text::toLower(phrase));
    if (key.empty()) return;
    tables.phrases[key] = text::collapseWhitespace(text::toLower(canonical));
    rebuildPhraseOrder();
}

bool TextNormalizer::hasSlang(const std::string& input) const {
    std::string lowered = text::toLower(input);
    size_t start = 0;
    while (start < lowered.size()) {
        size_t end = lowered.find_first_of(" \t\r\n", start);
        if (end == std::string::npos) end = lowered.size();
        std::string token = lowered.substr(start, end - start);
        start = end + 1;
        if (token.empty()) continue;
        if (tables.slang.count(token) || tables.abbreviations.count(token)) return true;
    }
    return false;
}

} // namespace streetwise
