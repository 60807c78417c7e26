#pragma once
#include <map>
#include <regex>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "engine_config.hpp"
#include "intent.hpp"
#include "nlp/intent_catalog.hpp"
#include "nlp/intent_classifier.hpp"

namespace streetwise {

// Hand-written trigger rules, keyword weights and entity term lists (nlp_rules.json)
struct RuleSet {
    struct Rule {
        std::string intent;           // e.g. "money_advice"
        std::string description;      // human-readable ("How to make money")
        std::string pattern_str;      // raw regex string
        std::regex pattern;           // compiled regex
        bool case_insensitive = true; // regex flag
    };

    std::vector<Rule> rules;
    std::map<std::string, std::map<std::string, double>> keyword_weights;   // word -> intent -> weight
    std::map<std::string, std::vector<std::string>> entity_terms;           // list name -> terms

    // --- Loaders (invalid regexes are reported and skipped) ---
    bool load_rules(const std::string& path, std::string* err = nullptr);
    bool load_rules_from_string(const std::string& rulesText, std::string* err = nullptr);
    bool load_rules_from_json(const nlohmann::json& j, std::string* err = nullptr);

    size_t rule_count() const { return rules.size(); }
};

// Precision-first matcher: +rule_score per matching rule plus keyword weights,
// confidence = min(1, best / score_divisor).
class PatternMatcher : public IntentClassifier {
public:
    PatternMatcher(RuleSet rules, const IntentCatalog& catalog, const EngineConfig& config = {});

    IntentGuess classifyIntent(const std::string& text) override;
    const char* name() const override { return "pattern"; }

    // Raw score of every catalog intent, catalog order
    std::vector<IntentScore> scores(const std::string& text) const;

    Entities extract_entities(const std::string& text) const;

    size_t rule_count() const { return ruleSet.rule_count(); }

private:
    std::string regexSubject(const std::string& s) const;

    RuleSet ruleSet;
    const IntentCatalog& catalog;
    double ruleScore;
    double scoreDivisor;
    size_t topMatches;
    size_t maxRegexInput;
};

} // namespace streetwise
