#include "nlp/text_utils.hpp"

#include <algorithm>
#include <cctype>

namespace streetwise::text {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && isSpace(s[start])) start++;
    size_t end = s.size();
    while (end > start && isSpace(s[end - 1])) end--;
    return s.substr(start, end - start);
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool pendingSpace = false;
    for (char c : s) {
        if (isSpace(c)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace && !out.empty()) out += ' ';
        pendingSpace = false;
        out += c;
    }
    return out;
}

bool isWordChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '_';
}

bool isTokenChar(char c) {
    return isWordChar(c) || c == '\'';
}

std::vector<std::string> wordTokens(const std::string& lowered) {
    std::vector<std::string> out;
    std::string current;
    for (char c : lowered) {
        if (isTokenChar(c)) {
            current += c;
        } else if (!current.empty()) {
            out.push_back(current);
            current.clear();
        }
    }
    if (!current.empty()) out.push_back(current);
    return out;
}

std::vector<std::string> splitTokens(const std::string& s) {
    // 0 = word, 1 = whitespace, 2 = anything else
    auto kind = [](char c) { return isTokenChar(c) ? 0 : (isSpace(c) ? 1 : 2); };

    std::vector<std::string> out;
    size_t i = 0;
    while (i < s.size()) {
        int k = kind(s[i]);
        size_t j = i + 1;
        while (j < s.size() && kind(s[j]) == k) j++;
        out.push_back(s.substr(i, j - i));
        i = j;
    }
    return out;
}

bool containsWholeWord(const std::string& haystack, const std::string& needle) {
    if (needle.empty()) return false;
    size_t pos = haystack.find(needle);
    while (pos != std::string::npos) {
        size_t end = pos + needle.size();
        bool okLeft  = pos == 0 || !isWordChar(haystack[pos - 1]);
        bool okRight = end == haystack.size() || !isWordChar(haystack[end]);
        if (okLeft && okRight) return true;
        pos = haystack.find(needle, pos + 1);
    }
    return false;
}

} // namespace streetwise::text
