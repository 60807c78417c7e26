#include "nlp/pattern_matcher.hpp"
#include "nlp/text_utils.hpp"
#include "error_manager.hpp"
#include "resources.hpp"
#include "logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace streetwise {

// ------------------------------------------------------------
// Load rules
// ------------------------------------------------------------
bool RuleSet::load_rules(const std::string& path, std::string* err) {
    nlohmann::json j;
    if (!loadJsonResource(path, j, err)) {
        return false;
    }
    return load_rules_from_json(j, err);
}

bool RuleSet::load_rules_from_string(const std::string& rulesText, std::string* err) {
    try {
        return load_rules_from_json(nlohmann::json::parse(rulesText), err);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("NLP", std::string("Failed to parse rules: ") + e.what());
        return false;
    }
}

bool RuleSet::load_rules_from_json(const nlohmann::json& j, std::string* err) {
    if (!j.is_object()) {
        if (err) *err = "nlp_rules.json: expected a JSON object";
        LOG_ERROR("NLP", "nlp_rules.json is not a JSON object");
        return false;
    }

    try {
        const nlohmann::json ruleList = j.value("rules", nlohmann::json::array());
        const nlohmann::json weights  = j.value("keyword_weights", nlohmann::json::object());
        const nlohmann::json entities = j.value("entities", nlohmann::json::object());

        std::vector<Rule> loadedRules;
        for (auto& r : ruleList) {
            Rule rule;
            rule.intent = r.value("intent", "");
            rule.description = r.value("description", "");
            rule.pattern_str = r.value("pattern", "");
            rule.case_insensitive = r.value("case_insensitive", true);

            try {
                std::regex::flag_type flags = std::regex::ECMAScript;
                if (rule.case_insensitive) {
                    flags |= std::regex::icase;
                }
                rule.pattern = std::regex(rule.pattern_str, flags);
            } catch (const std::regex_error& e) {
                ErrorManager::report("ERR_RULE_INVALID_REGEX",
                                     rule.intent + ": " + rule.pattern_str + " (" + e.what() + ")");
                continue;
            }

            loadedRules.push_back(std::move(rule));
        }

        std::map<std::string, std::map<std::string, double>> loadedWeights;
        for (auto& [word, perIntent] : weights.items()) {
            for (auto& [intent, weight] : perIntent.items()) {
                loadedWeights[text::toLower(word)][intent] = weight.get<double>();
            }
        }

        std::map<std::string, std::vector<std::string>> loadedTerms;
        for (auto& [listName, terms] : entities.items()) {
            for (auto& t : terms.get<std::vector<std::string>>()) {
                loadedTerms[listName].push_back(text::toLower(t));
            }
        }

        rules = std::move(loadedRules);
        keyword_weights = std::move(loadedWeights);
        entity_terms = std::move(loadedTerms);
    } catch (const std::exception& e) {
        if (err) *err = e.what();
        LOG_ERROR("NLP", std::string("Bad rule entry: ") + e.what());
        return false;
    }

    LOG_DEBUG("NLP", "Loaded " + std::to_string(rules.size()) + " rules, " +
                     std::to_string(keyword_weights.size()) + " weighted keywords");
    return true;
}

// ------------------------------------------------------------
// Matcher
// ------------------------------------------------------------
PatternMatcher::PatternMatcher(RuleSet rules, const IntentCatalog& intents, const EngineConfig& config)
    : ruleSet(std::move(rules)),
      catalog(intents),
      ruleScore(config.ruleScore),
      scoreDivisor(config.scoreDivisor > 0.0 ? config.scoreDivisor : 6.0),
      topMatches(config.topMatches),
      maxRegexInput(config.maxPatternInput) {
    for (const auto& rule : ruleSet.rules) {
        if (!catalog.contains(rule.intent)) {
            LOG_ERROR("NLP", "Rule targets unknown intent: " + rule.intent);
        }
    }
}

// std::regex recurses per character, so an unbounded subject can blow the stack
std::string PatternMatcher::regexSubject(const std::string& s) const {
    if (s.size() <= maxRegexInput) return s;
    LOG_DEBUG("NLP", "Input of " + std::to_string(s.size()) + " chars cut to " +
                     std::to_string(maxRegexInput) + " for rule matching");
    return s.substr(0, maxRegexInput);
}

std::vector<IntentScore> PatternMatcher::scores(const std::string& input) const {
    std::string lowered = text::trim(text::toLower(input));
    std::string subject = regexSubject(lowered);

    std::map<std::string, double> raw;
    for (const auto& rule : ruleSet.rules) {
        if (std::regex_search(subject, rule.pattern)) {
            raw[rule.intent] += ruleScore;
        }
    }

    for (const auto& word : text::wordTokens(lowered)) {
        auto it = ruleSet.keyword_weights.find(word);
        if (it == ruleSet.keyword_weights.end()) continue;
        for (const auto& [intent, weight] : it->second) {
            raw[intent] += weight;
        }
    }

    std::vector<IntentScore> out;
    for (const auto& def : catalog.all()) {
        auto it = raw.find(def.id);
        out.push_back({ def.id, def.friendlyName, it == raw.end() ? 0.0 : it->second });
    }
    return out;
}

IntentGuess PatternMatcher::classifyIntent(const std::string& input) {
    IntentGuess guess;
    guess.entities = extract_entities(input);

    std::vector<IntentScore> all = scores(input);

    // strictly greater: the earliest intent in catalog order keeps a tie
    double best = 0.0;
    for (const auto& s : all) {
        if (s.score > best) {
            best = s.score;
            guess.intent = s.intent;
        }
    }
    guess.confidence = std::min(1.0, best / scoreDivisor);

    std::vector<IntentScore> ranked;
    for (const auto& s : all) {
        if (s.score > 0.0) ranked.push_back({ s.intent, s.friendlyName, std::min(1.0, s.score / scoreDivisor) });
    }
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const IntentScore& a, const IntentScore& b) { return a.score > b.score; });
    if (ranked.size() > topMatches) ranked.resize(topMatches);
    guess.topMatches = std::move(ranked);

    LOG_TRACE("NLP", "pattern -> " + guess.intent + " (" + std::to_string(guess.confidence) + ")");
    return guess;
}

// ------------------------------------------------------------
// Entities
// ------------------------------------------------------------
Entities PatternMatcher::extract_entities(const std::string& input) const {
    // tried in order; the first non-common capture is the name
    static const std::regex namePatterns[] = {
        std::regex(R"((?:about|who is|info on|trust)\s+(\w+))", std::regex::ECMAScript | std::regex::icase),
        std::regex(R"((\w+)(?:'s| is| has))", std::regex::ECMAScript | std::regex::icase),
    };
    static const std::regex numberPattern(R"(\d+)");
    static const std::vector<std::string> commonWords = {
        "the", "a", "an", "my", "your", "this", "that", "what", "how", "who", "is", "are"
    };

    Entities entities;
    std::string subject = regexSubject(input);
    std::string lowered = text::toLower(subject);

    for (const auto& pattern : namePatterns) {
        std::smatch m;
        if (!std::regex_search(subject, m, pattern)) continue;
        std::string candidate = m[1].str();
        if (std::find(commonWords.begin(), commonWords.end(), text::toLower(candidate)) == commonWords.end()) {
            entities.playerName = candidate;
            break;
        }
    }

    for (auto it = std::sregex_iterator(lowered.begin(), lowered.end(), numberPattern);
         it != std::sregex_iterator(); ++it) {
        const std::string digits = it->str();
        // absurdly long digit runs are not quantities
        if (digits.size() > 18) continue;
        entities.numbers.push_back(std::stoll(digits));
    }

    for (const auto& [listName, terms] : ruleSet.entity_terms) {
        for (const auto& term : terms) {
            if (text::containsWholeWord(lowered, term)) {
                entities.terms[listName] = term;
                break;
            }
        }
    }

    return entities;
}

} // namespace streetwise
