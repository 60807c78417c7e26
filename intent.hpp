#pragma once
#include <string>
#include <map>
#include <vector>

namespace streetwise {

// 🔹 One ranked candidate intent
struct IntentScore {
    std::string intent;
    std::string friendlyName;
    double score = 0.0;   // blended similarity (semantic) or scaled rule score (pattern)
};

// 🔹 One normalizer rewrite; type is phrase, contraction, abbreviation or slang
struct Substitution {
    std::string from;
    std::string to;
    std::string type;
};

// 🔹 One typo fix
struct Correction {
    std::string from;
    std::string to;
    int distance = 0;
};

struct NormalizationResult {
    std::string normalized;
    std::string original;
    std::vector<Substitution> changes;
    bool wasModified = false;
};

struct CorrectionResult {
    std::string corrected;
    std::vector<Correction> corrections;
    bool wasModified = false;
};

// 🔹 Normalizer + typo corrector trace for one input
struct Preprocessed {
    std::string original;
    std::string normalized;
    std::string corrected;                 // text both classifiers see
    std::vector<Substitution> changes;
    std::vector<Correction> corrections;
    bool wasModified = false;
};

// 🔹 Shallow entities picked out by the pattern matcher
struct Entities {
    std::string playerName;
    std::vector<long long> numbers;
    std::map<std::string, std::string> terms;   // list name -> first term found

    bool empty() const { return playerName.empty() && numbers.empty() && terms.empty(); }
};

// 🔹 Output of a single sub-classifier
struct IntentGuess {
    std::string intent = "unknown";
    double confidence = 0.0;
    double similarity = 0.0;               // semantic only: best blended score
    std::vector<IntentScore> topMatches;
    Entities entities;                     // pattern only
};

// 🔹 Final answer handed to callers
struct ClassificationResult {
    std::string intent = "unknown";
    double confidence = 0.0;
    std::string friendlyName;
    std::string source;                    // branch tag, e.g. pattern_high, no_match
    Preprocessed preprocessed;
    std::vector<IntentScore> topMatches;
    bool fromCache = false;
};

} // namespace streetwise
