/**
 * test_text_normalizer.cpp - Slang, abbreviation, contraction and idiom rewriting
 */

#include "nlp/text_normalizer.hpp"

#include <cassert>
#include <filesystem>
#include <iostream>

using namespace streetwise;

static Lexicon smallLexicon() {
    Lexicon lex;
    lex.slang = { {"paper", "money"}, {"feds", "police"} };
    lex.abbreviations = { {"rn", "right now"}, {"hml", "hit my line"} };
    lex.contractions = { {"can't", "cannot"} };
    lex.phrases = {
        {"get money", "earn"},
        {"get money fast", "earn quickly"},
        {"hit my line", "call me"},
        {"lay low", "hide"},
    };
    return lex;
}

static TextNormalizer realNormalizer() {
    Lexicon lex;
    std::string err;
    bool ok = lex.load((std::filesystem::path(STREETWISE_RESOURCE_DIR) / "lexicon.json").string(), &err);
    assert(ok);
    return TextNormalizer(std::move(lex));
}

void test_clean_whitespace_case_and_punctuation() {
    TextNormalizer n(smallLexicon());

    auto r = n.normalize("  Where   ARE the Feds!!!  ");
    assert(r.normalized == "where are the police!");
    assert(r.wasModified);
    assert(r.changes.size() == 1);
    assert(r.changes[0].from == "feds");
    assert(r.changes[0].type == "slang");

    assert(n.normalize("why?!").normalized == "why!");
    assert(n.normalize("").normalized.empty());
    assert(n.normalize("   ").normalized.empty());

    std::cout << "[PASS] test_clean_whitespace_case_and_punctuation\n";
}

void test_longest_idiom_wins() {
    TextNormalizer n(smallLexicon());

    auto r = n.normalize("get money fast");
    assert(r.normalized == "earn quickly");
    assert(r.changes.size() == 1);
    assert(r.changes[0].type == "phrase");

    assert(n.normalize("get money").normalized == "earn");

    std::cout << "[PASS] test_longest_idiom_wins\n";
}

void test_idioms_match_whole_words_only() {
    TextNormalizer n(smallLexicon());

    auto r = n.normalize("play low");
    assert(r.normalized == "play low");
    assert(r.changes.empty());
    assert(!r.wasModified);

    assert(n.normalize("lay low, now").normalized == "hide, now");

    std::cout << "[PASS] test_idioms_match_whole_words_only\n";
}

void test_trailing_punctuation_kept() {
    TextNormalizer n(smallLexicon());

    assert(n.normalize("rn?").normalized == "right now?");
    assert(n.normalize("I can't, sorry").normalized == "i cannot, sorry");
    assert(n.normalize("paper.").normalized == "money.");

    std::cout << "[PASS] test_trailing_punctuation_kept\n";
}

void test_expansions_reach_fixed_point() {
    TextNormalizer n(smallLexicon());

    // abbreviation expands into an idiom, which is rewritten on the next pass
    auto r = n.normalize("hml");
    assert(r.normalized == "call me");
    assert(r.changes.size() == 2);
    assert(r.changes[0].type == "abbreviation");
    assert(r.changes[1].type == "phrase");

    auto again = n.normalize(r.normalized);
    assert(again.normalized == r.normalized);
    assert(again.changes.empty());

    std::cout << "[PASS] test_expansions_reach_fixed_point\n";
}

void test_runtime_additions() {
    TextNormalizer n(smallLexicon());

    assert(!n.hasSlang("zoinks here"));
    n.addSlangTerm("Zoinks", "Police");
    assert(n.hasSlang("ZOINKS here"));
    assert(n.normalize("zoinks here").normalized == "police here");

    n.addPhrase("Hit The Block", "go outside");
    assert(n.normalize("time to hit the block").normalized == "time to go outside");

    auto s = n.stats();
    assert(s.slangTerms == 3);
    assert(s.phrases == 5);

    assert(n.hasSlang("rn please"));
    assert(!n.hasSlang("hello there"));

    std::cout << "[PASS] test_runtime_additions\n";
}

void test_lexicon_from_json_text() {
    Lexicon lex;
    std::string err;
    assert(lex.loadFromString(R"({
        "slang": {"Bread": "money"},
        "abbreviations": {"rn": "right now"},
        "phrases": {"lay low": "hide"}
    })", &err));
    assert(lex.slang.at("bread") == "money");
    assert(lex.contractions.empty());

    auto words = lex.canonicalWords();
    assert((words == std::vector<std::string>{ "right", "now", "money", "hide" }));

    Lexicon bad;
    assert(!bad.loadFromString("[\"not\", \"an object\"]", &err));
    assert(!err.empty());

    std::cout << "[PASS] test_lexicon_from_json_text\n";
}

void test_shipped_lexicon() {
    TextNormalizer n = realNormalizer();

    assert(n.normalize("  What's   UP!!!  ").normalized == "what is up!");
    assert(n.normalize("lay low").normalized == "hide from police");
    assert(n.normalize("idk wat 2 do").normalized == "i do not know what 2 do");
    assert(n.normalize("how r u").normalized == "how are you");
    assert(n.normalize("U GOOD???").normalized == "you good?");
    assert(n.normalize("five-o").normalized == "police");
    assert(n.normalize("i need cash").normalized == "i need money");
    assert(n.normalize("ngl im broke af").normalized == "not going to lie i am poor af");
    assert(n.normalize("I\xE2\x80\x99m tryna hit a lick tonight").normalized ==
           "i am trying to do a crime tonight");

    auto r = n.normalize("need that paper rn");
    assert(r.normalized == "need money right now");
    assert(r.changes.size() == 2);
    assert(r.changes[0].from == "need that paper" && r.changes[0].to == "need money");
    assert(r.changes[0].type == "phrase");
    assert(r.changes[1].from == "rn" && r.changes[1].to == "right now");
    assert(r.changes[1].type == "abbreviation");

    auto lick = n.normalize("i'm tryna hit a lick tonight");
    assert(lick.changes.size() == 3);
    assert(lick.changes[0].type == "phrase");
    assert(lick.changes[1].from == "i'm");
    assert(lick.changes[2].from == "tryna");

    auto plain = n.normalize("someone time");
    assert(plain.normalized == "someone time");
    assert(plain.changes.empty());

    std::cout << "[PASS] test_shipped_lexicon\n";
}

void test_shipped_lexicon_is_idempotent() {
    TextNormalizer n = realNormalizer();

    const char* inputs[] = {
        "need that paper rn", "i'm tryna hit a lick tonight", "ngl im broke af",
        "how r u", "yo whats good", "lay low", "wat crme shud i do",
    };
    for (const char* input : inputs) {
        std::string once = n.normalize(input).normalized;
        auto twice = n.normalize(once);
        assert(twice.normalized == once);
        assert(twice.changes.empty());
    }

    std::cout << "[PASS] test_shipped_lexicon_is_idempotent\n";
}

int main() {
    std::cout << "Running TextNormalizer tests...\n\n";

    test_clean_whitespace_case_and_punctuation();
    test_longest_idiom_wins();
    test_idioms_match_whole_words_only();
    test_trailing_punctuation_kept();
    test_expansions_reach_fixed_point();
    test_runtime_additions();
    test_lexicon_from_json_text();
    test_shipped_lexicon();
    test_shipped_lexicon_is_idempotent();

    std::cout << "\nAll tests passed!\n";
    return 0;
}
