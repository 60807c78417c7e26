#pragma once
#include <string>
#include <vector>

// Small ASCII string helpers shared by the NLP stages
namespace streetwise::text {

    std::string toLower(std::string s);
    std::string trim(const std::string& s);

    // Collapse whitespace runs to one space and trim
    std::string collapseWhitespace(const std::string& s);

    // [a-z0-9_]
    bool isWordChar(char c);

    // [a-z0-9_'] : characters that make up a word token
    bool isTokenChar(char c);

    // All maximal runs of token chars, in order ("what's up?" -> what's, up)
    std::vector<std::string> wordTokens(const std::string& lowered);

    // Split into word runs, whitespace runs and other-symbol runs; concatenating gives s back
    std::vector<std::string> splitTokens(const std::string& s);

    // Whole-word (on isWordChar boundaries) occurrence of needle in haystack
    bool containsWholeWord(const std::string& haystack, const std::string& needle);
}
