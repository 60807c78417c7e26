#pragma once
#include <map>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace streetwise {

// Surface form -> canonical form tables used by the text normalizer.
// Keys are lowercase; std::map keeps iteration deterministic.
struct Lexicon {
    using Table = std::map<std::string, std::string>;

    Table slang;
    Table abbreviations;
    Table contractions;
    Table phrases;          // multi-word idioms

    struct Stats {
        size_t slangTerms = 0;
        size_t abbreviations = 0;
        size_t contractions = 0;
        size_t phrases = 0;
    };

    // ---------------- Loaders ----------------
    bool load(const std::string& path, std::string* err = nullptr);
    bool loadFromString(const std::string& jsonStr, std::string* err = nullptr);
    bool loadFromJson(const nlohmann::json& j, std::string* err = nullptr);

    // Every word of every canonical form, tables in contraction/abbreviation/slang/phrase order
    std::vector<std::string> canonicalWords() const;

    Stats stats() const;
};

} // namespace streetwise
