#include "nlp/lexicon.hpp"
#include "nlp/text_utils.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <nlohmann/json.hpp>
#include <initializer_list>

namespace streetwise {

// ---------------- Helpers ----------------
static void readTable(const nlohmann::json& j, const char* key, Lexicon::Table& out) {
    out.clear();
    if (!j.contains(key)) return;

    for (auto& [surface, canonical] : j[key].items()) {
        std::string from = text::collapseWhitespace(text::toLower(surface));
        std::string to   = text::collapseWhitespace(text::toLower(canonical.get<std::string>()));
        if (from.empty()) continue;
        out[from] = to;
    }
}

// ---------------- API ----------------
bool Lexicon::load(const std::string& path, std::string* err) {
    nlohmann::json j;
    if (!loadJsonResource(path, j, err)) {
        return false;
    }
    return loadFromJson(j, err);
}

bool Lexicon::loadFromString(const std::string& jsonStr, std::string* err) {
    try {
        return loadFromJson(nlohmann::json::parse(jsonStr), err);
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
        LOG_ERROR("Lexicon", std::string("Failed to parse lexicon string: ") + ex.what());
        return false;
    }
}

bool Lexicon::loadFromJson(const nlohmann::json& j, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "lexicon: expected a JSON object";
        LOG_ERROR("Lexicon", "lexicon is not a JSON object");
        return false;
    }

    try {
        readTable(j, "slang", slang);
        readTable(j, "abbreviations", abbreviations);
        readTable(j, "contractions", contractions);
        readTable(j, "phrases", phrases);
    } catch (const std::exception& ex) {
        if (err) *err = ex.what();
        LOG_ERROR("Lexicon", std::string("Bad lexicon entry: ") + ex.what());
        return false;
    }

    auto s = stats();
    LOG_DEBUG("Lexicon", "Loaded " + std::to_string(s.slangTerms) + " slang, " +
                         std::to_string(s.abbreviations) + " abbreviations, " +
                         std::to_string(s.contractions) + " contractions, " +
                         std::to_string(s.phrases) + " phrases");
    return true;
}

std::vector<std::string> Lexicon::canonicalWords() const {
    std::vector<std::string> out;
    for (const Table* table : { &contractions, &abbreviations, &slang, &phrases }) {
        for (const auto& [surface, canonical] : *table) {
            for (auto& w : text::wordTokens(canonical)) {
                out.push_back(w);
            }
        }
    }
    return out;
}

Lexicon::Stats Lexicon::stats() const {
    return { slang.size(), abbreviations.size(), contractions.size(), phrases.size() };
}

} // namespace streetwise
