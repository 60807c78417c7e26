/**
 * test_classifier_engine.cpp - End-to-end classification over the shipped resources
 */

#include "nlp/classifier_engine.hpp"
#include "nlp/result_json.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>

using namespace streetwise;

static std::unique_ptr<ClassifierEngine> makeEngine() {
    auto engine = ClassifierEngine::create(STREETWISE_RESOURCE_DIR);
    assert(engine);
    assert(engine->catalog().size() == 20);
    return engine;
}

static bool near(double a, double b, double eps = 1e-6) {
    return std::fabs(a - b) < eps;
}

void test_direct_pattern_hit() {
    auto engine = makeEngine();

    auto r = engine->classify("how do i make money");
    assert(r.intent == "money_advice");
    assert(r.friendlyName == "Money Tips");
    assert(r.confidence == 1.0);
    assert(r.source == "pattern_high");
    assert(!r.fromCache);
    assert(!r.topMatches.empty());
    assert(r.topMatches[0].intent == "money_advice");

    std::cout << "[PASS] test_direct_pattern_hit\n";
}

void test_slang_is_normalized_first() {
    auto engine = makeEngine();

    auto r = engine->classify("need that paper rn");
    assert(r.intent == "money_advice");
    assert(r.source == "pattern_high");
    assert(near(r.confidence, 5.0 / 6.0));

    const auto& p = r.preprocessed;
    assert(p.original == "need that paper rn");
    assert(p.normalized == "need money right now");
    assert(p.corrected == "need money right now");
    assert(p.wasModified);
    assert(p.changes.size() == 2);
    assert(p.changes[0].type == "phrase");
    assert(p.changes[0].from == "need that paper");
    assert(p.changes[1].type == "abbreviation");
    assert(p.changes[1].to == "right now");

    std::cout << "[PASS] test_slang_is_normalized_first\n";
}

void test_typos_are_corrected() {
    auto engine = makeEngine();

    auto r = engine->classify("wat crme shud i do");
    assert(r.intent == "crime_advice");
    assert(r.source == "pattern_high");
    assert(near(r.confidence, 5.0 / 6.0));

    const auto& p = r.preprocessed;
    assert(p.normalized == "what crme shud i do");
    assert(p.corrected == "what crime should i do");
    assert(p.corrections.size() == 2);
    assert(p.corrections[0].from == "crme" && p.corrections[0].to == "crime");
    assert(p.corrections[0].distance == 1);
    assert(p.corrections[1].from == "shud" && p.corrections[1].to == "should");
    assert(p.corrections[1].distance == 2);

    std::cout << "[PASS] test_typos_are_corrected\n";
}

void test_empty_input() {
    auto engine = makeEngine();

    for (const char* input : { "", "   ", "\t\n" }) {
        auto r = engine->classify(input);
        assert(r.intent == "unknown");
        assert(r.friendlyName == "Unknown");
        assert(r.confidence == 0.0);
        assert(r.source == "empty_input");
        assert(r.topMatches.empty());
    }
    assert(engine->stats().cacheSize == 0);

    std::cout << "[PASS] test_empty_input\n";
}

void test_gibberish_is_unknown() {
    auto engine = makeEngine();

    auto r = engine->classify("xyzzy plugh");
    assert(r.intent == "unknown");
    assert(r.confidence == 0.0);
    assert(r.source == "no_match");
    assert(r.topMatches.empty());

    std::cout << "[PASS] test_gibberish_is_unknown\n";
}

void test_ambiguous_input_has_lower_confidence() {
    auto engine = makeEngine();

    auto r = engine->classify("market prices for crimes");
    assert(r.intent == "market_analysis");
    assert(r.source == "combined_agreement");
    assert(r.confidence > 0.6 && r.confidence < 0.75);
    assert(r.confidence < engine->classify("how do i make money").confidence);

    assert(r.topMatches.size() == 3);
    assert(r.topMatches[0].intent == "market_analysis");
    assert(r.topMatches[1].intent == "crime_advice");
    assert(r.topMatches[0].score - r.topMatches[1].score < 0.2);
    assert(r.topMatches[0].score >= r.topMatches[1].score);
    assert(r.topMatches[1].score >= r.topMatches[2].score);

    std::cout << "[PASS] test_ambiguous_input_has_lower_confidence\n";
}

void test_other_branches() {
    auto engine = makeEngine();

    auto heat = engine->classify("how is my heat");
    assert(heat.intent == "heat_advice");
    assert(heat.source == "combined_agreement");
    assert(heat.confidence > 0.9);

    auto greet = engine->classify("what's up");
    assert(greet.intent == "greeting");
    assert(greet.source == "pattern_preferred");
    assert(near(greet.confidence, 0.45));

    auto marcus = engine->classify("tell me about marcus");
    assert(marcus.intent == "stat_analysis");
    assert(marcus.source == "semantic_only");

    assert(engine->classify("how do i lay low").intent == "heat_advice");
    assert(engine->classify("thanks").source == "pattern_high");

    std::cout << "[PASS] test_other_branches\n";
}

void test_cache_returns_same_answer() {
    auto engine = makeEngine();

    auto first = engine->classify("how is my heat");
    auto second = engine->classify("  HOW is my HEAT  ");
    assert(!first.fromCache);
    assert(second.fromCache);
    assert(second.intent == first.intent);
    assert(second.confidence == first.confidence);
    assert(second.friendlyName == first.friendlyName);
    assert(second.source == first.source);

    engine->clearCache();
    auto third = engine->classify("how is my heat");
    assert(!third.fromCache);
    assert(third.intent == first.intent);
    assert(third.confidence == first.confidence);

    std::cout << "[PASS] test_cache_returns_same_answer\n";
}

void test_exemplars_classify_to_their_intent() {
    auto engine = makeEngine();

    size_t checked = 0;
    for (const auto& def : engine->catalog().all()) {
        for (const auto& phrase : def.exemplars) {
            auto r = engine->classify(phrase);
            if (r.intent != def.id || r.confidence < 0.7) {
                std::cerr << "  \"" << phrase << "\" -> " << r.intent << " " << r.confidence
                          << " [" << r.source << "]\n";
            }
            assert(r.intent == def.id);
            assert(r.confidence >= 0.7);
            checked++;
        }
    }
    assert(checked > 200);

    std::cout << "[PASS] test_exemplars_classify_to_their_intent\n";
}

void test_very_long_input() {
    auto engine = makeEngine();

    std::string input = "recommend a good crime";
    while (input.size() < 50000) input += " ok";

    auto r = engine->classify(input);
    assert(r.intent == "crime_advice");
    assert(r.source == "pattern_high");

    std::string flat(50000, 'z');
    assert(engine->classify(flat).intent == "unknown");

    std::cout << "[PASS] test_very_long_input\n";
}

void test_stats() {
    auto engine = makeEngine();

    engine->classify("how do i make money");        // pattern
    engine->classify("market prices for crimes");   // combined
    engine->classify("tell me about marcus");       // semantic
    engine->classify("How do I make money");        // cached
    engine->classify("");

    auto s = engine->stats();
    assert(s.totalClassifications == 5);
    assert(s.cacheHits == 1);
    assert(s.patternHits == 1);
    assert(s.combinedHits == 1);
    assert(s.semanticHits == 1);
    assert(s.cacheSize == 3);
    assert(near(s.hitRate, 0.2));
    assert(near(s.patternRate, 0.2));

    nlohmann::json j = s;
    assert(j["totalClassifications"] == 5);

    engine->resetStats();
    assert(engine->stats().totalClassifications == 0);
    assert(engine->stats().hitRate == 0.0);
    assert(engine->stats().cacheSize == 3);

    std::cout << "[PASS] test_stats\n";
}

void test_suggestions_and_similarity() {
    auto engine = makeEngine();

    auto suggestions = engine->getSuggestions("market prices for crimes");
    assert(suggestions.size() == 4);
    assert(suggestions[0].intent == "market_analysis");
    assert(suggestions[0].friendlyName == "Market Info");
    assert(suggestions[0].suggestion == engine->catalog().hint("market_analysis"));
    assert(suggestions[1].intent == "crime_advice");
    assert(suggestions[3].intent == "job_advice");

    assert(engine->getSuggestions("xyzzy plugh").empty());
    assert(engine->getTopMatches("market prices for crimes", 2).size() == 2);

    assert(engine->isSimilarTo("how do i make money", "how can i earn cash"));
    assert(!engine->isSimilarTo("how do i make money", "where are the cops"));

    std::cout << "[PASS] test_suggestions_and_similarity\n";
}

void test_analyze() {
    auto engine = makeEngine();

    Analysis a = engine->analyze("need that paper rn");
    assert(a.input.normalized == "need money right now");
    assert(a.pattern.intent == "money_advice");
    assert(a.semantic.intent == "money_advice");
    assert((a.concepts == std::vector<std::string>{ "action", "money", "time" }));
    assert(a.final.intent == "money_advice");
    assert(a.final.source == "pattern_high");

    nlohmann::json j = a;
    assert(j["input"]["changes"].size() == 2);
    assert(j["input"]["changes"][0]["stage"] == "normalize");
    assert(j["final"]["intent"] == "money_advice");

    Analysis typo = engine->analyze("wat crme shud i do");
    nlohmann::json tj = typo;
    assert(tj["input"]["changes"].back()["stage"] == "typo");

    Analysis marcus = engine->analyze("tell me about marcus");
    assert(marcus.pattern.entities.playerName == "marcus");

    std::cout << "[PASS] test_analyze\n";
}

void test_runtime_vocabulary_changes() {
    auto engine = makeEngine();

    auto before = engine->classify("need zorp");
    assert(before.preprocessed.corrected != "need money");
    engine->addSlangTerm("zorp", "money");
    auto after = engine->classify("need zorp");
    assert(!after.fromCache);
    assert(after.preprocessed.normalized == "need money");
    assert(after.intent == "money_advice");

    engine->addPhrase("stack some paper", "make money");
    auto phrase = engine->classify("how do i stack some paper");
    assert(phrase.preprocessed.normalized == "how do i make money");
    assert(phrase.intent == "money_advice");
    assert(phrase.confidence == 1.0);

    assert(engine->preprocess("zorpwod").corrected == "zorpwod");
    engine->addWord("zorpwood");
    assert(engine->preprocess("zorpwod").corrected == "zorpwood");

    std::cout << "[PASS] test_runtime_vocabulary_changes\n";
}

void test_runtime_semantic_changes() {
    auto engine = makeEngine();

    assert(!engine->addWordToCluster("blorp", "vibes"));
    assert(engine->addWordToCluster("blorp", "police"));
    auto concepts = engine->getConcepts("blorp");
    assert((concepts == std::vector<std::string>{ "police" }));

    engine->classify("market prices for crimes");
    engine->setWordImportance("prices", 1.5);
    assert(!engine->classify("market prices for crimes").fromCache);

    assert(!engine->addExemplar("unknown", "whatever"));
    assert(!engine->addExemplar("no_such_intent", "whatever"));
    assert(engine->addExemplar("heat_advice", "is the blorp after me"));
    assert(engine->catalog().find("heat_advice")->exemplars.back() == "is the blorp after me");
    assert(engine->semantic().rankIntents("blorp")[0].intent == "heat_advice");

    std::cout << "[PASS] test_runtime_semantic_changes\n";
}

void test_result_json() {
    auto engine = makeEngine();

    nlohmann::json j = engine->classify("need that paper rn");
    assert(j["intent"] == "money_advice");
    assert(j["friendlyName"] == "Money Tips");
    assert(j["source"] == "pattern_high");
    assert(j["fromCache"] == false);
    assert(j["preprocessed"]["normalized"] == "need money right now");
    assert(j["preprocessed"]["changes"][1]["type"] == "abbreviation");

    std::cout << "[PASS] test_result_json\n";
}

void test_invalid_utf8_serializes() {
    auto engine = makeEngine();

    auto r = engine->classify("\xff\xfe cash");
    assert(r.preprocessed.original == "\xff\xfe cash");

    std::string line = toJsonLine(r);
    nlohmann::json back = nlohmann::json::parse(line);
    assert(back["preprocessed"]["original"] == "\xEF\xBF\xBD\xEF\xBF\xBD cash");
    assert(back["intent"] == r.intent);
    assert(line.find('\n') == std::string::npos);

    std::cout << "[PASS] test_invalid_utf8_serializes\n";
}

int main() {
    std::cout << "Running ClassifierEngine tests...\n\n";

    test_direct_pattern_hit();
    test_slang_is_normalized_first();
    test_typos_are_corrected();
    test_empty_input();
    test_gibberish_is_unknown();
    test_ambiguous_input_has_lower_confidence();
    test_other_branches();
    test_cache_returns_same_answer();
    test_exemplars_classify_to_their_intent();
    test_very_long_input();
    test_stats();
    test_suggestions_and_similarity();
    test_analyze();
    test_runtime_vocabulary_changes();
    test_runtime_semantic_changes();
    test_result_json();
    test_invalid_utf8_serializes();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
