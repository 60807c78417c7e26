/**
 * test_pattern_matcher.cpp - Trigger rules, keyword weights and entity extraction
 */

#include "nlp/pattern_matcher.hpp"

#include <cassert>
#include <cmath>
#include <filesystem>
#include <iostream>

using namespace streetwise;

static IntentCatalog testCatalog() {
    IntentCatalog catalog;
    bool ok = catalog.loadFromString(R"({
        "intents": [
            {"id": "money_advice", "friendly_name": "Money Tips"},
            {"id": "crime_advice", "friendly_name": "Crime Advice"},
            {"id": "greeting",     "friendly_name": "Greeting"}
        ]
    })");
    assert(ok);
    return catalog;
}

static RuleSet testRules() {
    RuleSet rules;
    std::string err;
    bool ok = rules.load_rules_from_string(R"({
        "rules": [
            {"intent": "money_advice", "pattern": "\\bmake money\\b", "description": "Make money"},
            {"intent": "money_advice", "pattern": "\\bneed money\\b", "description": "Need money"},
            {"intent": "crime_advice", "pattern": "\\bcrime\\b", "description": "Crime"},
            {"intent": "greeting",     "pattern": "([unclosed", "description": "Broken"},
            {"intent": "greeting",     "pattern": "^hello$", "description": "Bare hello"}
        ],
        "keyword_weights": {
            "cash":  {"money_advice": 1.5},
            "steal": {"crime_advice": 2.0, "money_advice": 0.5}
        },
        "entities": {
            "district":   ["downtown", "uptown"],
            "crime_type": ["car theft", "robbery"]
        }
    })", &err);
    assert(ok);
    return rules;
}

static bool near(double a, double b) {
    return std::fabs(a - b) < 1e-9;
}

void test_invalid_regex_is_skipped() {
    RuleSet rules = testRules();
    assert(rules.rule_count() == 4);
    assert(rules.keyword_weights.at("steal").at("crime_advice") == 2.0);
    assert(rules.entity_terms.at("district").size() == 2);

    RuleSet broken;
    assert(!broken.load_rules_from_string("{ nope"));
    assert(!broken.load_rules_from_string("[1, 2]"));

    std::cout << "[PASS] test_invalid_regex_is_skipped\n";
}

void test_rule_and_keyword_scoring() {
    IntentCatalog catalog = testCatalog();
    PatternMatcher matcher(testRules(), catalog);

    auto both = matcher.classifyIntent("I need money to make money");
    assert(both.intent == "money_advice");
    assert(both.confidence == 1.0);

    auto crime = matcher.classifyIntent("crime");
    assert(crime.intent == "crime_advice");
    assert(near(crime.confidence, 0.5));

    auto hello = matcher.classifyIntent("  HELLO  ");
    assert(hello.intent == "greeting");
    assert(near(hello.confidence, 0.5));

    auto none = matcher.classifyIntent("xyz");
    assert(none.intent == "unknown");
    assert(none.confidence == 0.0);
    assert(none.topMatches.empty());

    auto raw = matcher.scores("crime steal");
    assert(raw.size() == catalog.size());
    assert(raw[0].intent == "money_advice" && near(raw[0].score, 0.5));
    assert(raw[1].intent == "crime_advice" && near(raw[1].score, 5.0));

    std::cout << "[PASS] test_rule_and_keyword_scoring\n";
}

void test_tie_goes_to_catalog_order() {
    IntentCatalog catalog = testCatalog();
    PatternMatcher matcher(testRules(), catalog);

    // money 1.5 + 0.5, crime 2.0
    auto tie = matcher.classifyIntent("steal cash");
    assert(tie.intent == "money_advice");
    assert(near(tie.confidence, 2.0 / 6.0));

    std::cout << "[PASS] test_tie_goes_to_catalog_order\n";
}

void test_top_matches_scaled_and_sorted() {
    IntentCatalog catalog = testCatalog();
    PatternMatcher matcher(testRules(), catalog);

    auto guess = matcher.classifyIntent("crime steal");
    assert(guess.topMatches.size() == 2);
    assert(guess.topMatches[0].intent == "crime_advice");
    assert(guess.topMatches[0].friendlyName == "Crime Advice");
    assert(near(guess.topMatches[0].score, 5.0 / 6.0));
    assert(near(guess.topMatches[1].score, 0.5 / 6.0));

    std::cout << "[PASS] test_top_matches_scaled_and_sorted\n";
}

void test_score_settings_from_config() {
    IntentCatalog catalog = testCatalog();
    EngineConfig config;
    config.ruleScore = 2.0;
    config.scoreDivisor = 4.0;
    PatternMatcher matcher(testRules(), catalog, config);

    assert(near(matcher.classifyIntent("crime").confidence, 0.5));
    assert(near(matcher.classifyIntent("cash").confidence, 1.5 / 4.0));

    std::cout << "[PASS] test_score_settings_from_config\n";
}

void test_entities() {
    IntentCatalog catalog = testCatalog();
    PatternMatcher matcher(testRules(), catalog);

    assert(matcher.extract_entities("tell me about Marcus").playerName == "Marcus");
    assert(matcher.extract_entities("can I trust vinnie").playerName == "vinnie");
    assert(matcher.extract_entities("who is the boss").playerName.empty());
    assert(matcher.extract_entities("Vinnie's crew runs uptown").playerName == "Vinnie");
    assert(matcher.extract_entities("rosa has the goods").playerName == "rosa");
    assert(matcher.extract_entities("what is my heat").playerName.empty());

    auto nums = matcher.extract_entities("I have 250 bucks and 3 cars");
    assert((nums.numbers == std::vector<long long>{ 250, 3 }));
    assert(matcher.extract_entities("1234567890123456789012").numbers.empty());

    auto terms = matcher.extract_entities("any robbery or car theft downtown?");
    assert(terms.terms.at("crime_type") == "car theft");
    assert(terms.terms.at("district") == "downtown");
    assert(matcher.extract_entities("uptowns").terms.empty());

    assert(matcher.extract_entities("hello there").empty());

    auto guess = matcher.classifyIntent("crime downtown");
    assert(guess.entities.terms.at("district") == "downtown");

    std::cout << "[PASS] test_entities\n";
}

void test_long_input_is_bounded() {
    IntentCatalog catalog = testCatalog();
    EngineConfig config;
    config.maxPatternInput = 12;
    PatternMatcher matcher(testRules(), catalog, config);

    // "crime" sits past the cut; keyword weights still see the whole text
    auto s = matcher.scores("need money and cash then crime");
    assert(near(s[0].score, 4.5));
    assert(near(s[1].score, 0.0));

    PatternMatcher defaults(testRules(), catalog);
    assert(near(defaults.scores("need money and cash then crime")[1].score, 3.0));

    std::string word(50000, 'a');
    assert(defaults.extract_entities(word).empty());
    std::string digits(50000, '7');
    assert(defaults.extract_entities(digits).numbers.empty());

    std::cout << "[PASS] test_long_input_is_bounded\n";
}

void test_shipped_rules() {
    IntentCatalog catalog;
    assert(catalog.loadFromFile((std::filesystem::path(STREETWISE_RESOURCE_DIR) / "intents.json").string()));
    RuleSet rules;
    assert(rules.load_rules((std::filesystem::path(STREETWISE_RESOURCE_DIR) / "nlp_rules.json").string()));
    assert(rules.rule_count() >= 100);

    PatternMatcher matcher(std::move(rules), catalog);

    auto money = matcher.classifyIntent("how do i make money");
    assert(money.intent == "money_advice");
    assert(money.confidence == 1.0);

    assert(matcher.classifyIntent("thanks").intent == "thanks");
    assert(matcher.classifyIntent("hello").intent == "greeting");

    auto marcus = matcher.classifyIntent("tell me about marcus");
    assert(marcus.entities.playerName == "marcus");

    std::string longInput = "suggest";
    for (int i = 0; i < 20000; i++) longInput += " ok";
    assert(matcher.scores(longInput).size() == catalog.size());

    assert(matcher.classifyIntent("recommend a good crime").intent == "crime_advice");

    std::cout << "[PASS] test_shipped_rules\n";
}

int main() {
    std::cout << "Running PatternMatcher tests...\n\n";

    test_invalid_regex_is_skipped();
    test_rule_and_keyword_scoring();
    test_tie_goes_to_catalog_order();
    test_top_matches_scaled_and_sorted();
    test_score_settings_from_config();
    test_entities();
    test_long_input_is_bounded();
    test_shipped_rules();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
