#include "nlp/edit_distance.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <vector>

namespace streetwise {

// ------------------------------------------------------------
// Lookup tables
// ------------------------------------------------------------
static const char* adjacentKeys(char c) {
    switch (c) {
        case 'q': return "wa";
        case 'w': return "qesa";
        case 'e': return "wrds";
        case 'r': return "etfd";
        case 't': return "rygf";
        case 'y': return "tuhg";
        case 'u': return "yijh";
        case 'i': return "uokj";
        case 'o': return "iplk";
        case 'p': return "ol";
        case 'a': return "qwsz";
        case 's': return "weadzx";
        case 'd': return "ersfxc";
        case 'f': return "rtdgcv";
        case 'g': return "tyfhvb";
        case 'h': return "yugjbn";
        case 'j': return "uihknm";
        case 'k': return "iojlm";
        case 'l': return "opk";
        case 'z': return "asx";
        case 'x': return "zsdc";
        case 'c': return "xdfv";
        case 'v': return "cfgb";
        case 'b': return "vghn";
        case 'n': return "bhjm";
        case 'm': return "njk";
        default:  return "";
    }
}

static const char* const kPhoneticGroups[] = {
    "ck", "scz", "gj", "iy", "ae", "ou", "nm", "bp", "dt", "vw"
};

static char lower(char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

bool isAdjacentKey(char a, char b) {
    a = lower(a);
    b = lower(b);
    if (b == '\0') return false;
    return std::strchr(adjacentKeys(a), b) != nullptr;
}

bool isPhoneticallySimilar(char a, char b) {
    a = lower(a);
    b = lower(b);
    if (a == '\0' || b == '\0') return false;
    for (const char* group : kPhoneticGroups) {
        if (std::strchr(group, a) && std::strchr(group, b)) return true;
    }
    return false;
}

// ------------------------------------------------------------
// Distances (three rolling rows: i-2, i-1, i)
// ------------------------------------------------------------
int damerauLevenshtein(const std::string& a, const std::string& b) {
    const size_t m = a.size(), n = b.size();
    if (m == 0) return static_cast<int>(n);
    if (n == 0) return static_cast<int>(m);

    std::vector<int> prev2(n + 1), prev(n + 1), curr(n + 1);
    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<int>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<int>(i);
        for (size_t j = 1; j <= n; j++) {
            int cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            curr[j] = std::min({ prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost });
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                curr[j] = std::min(curr[j], prev2[j - 2] + cost);
            }
        }
        prev2.swap(prev);
        prev.swap(curr);
    }
    return prev[n];
}

double weightedDistance(const std::string& a, const std::string& b) {
    const size_t m = a.size(), n = b.size();
    if (m == 0) return static_cast<double>(n);
    if (n == 0) return static_cast<double>(m);

    std::vector<double> prev2(n + 1), prev(n + 1), curr(n + 1);
    for (size_t j = 0; j <= n; j++) prev[j] = static_cast<double>(j);

    for (size_t i = 1; i <= m; i++) {
        curr[0] = static_cast<double>(i);
        for (size_t j = 1; j <= n; j++) {
            double cost = 0.0;
            if (a[i - 1] != b[j - 1]) {
                if (isAdjacentKey(a[i - 1], b[j - 1]))              cost = 0.5;
                else if (isPhoneticallySimilar(a[i - 1], b[j - 1])) cost = 0.7;
                else                                                cost = 1.0;
            }
            curr[j] = std::min({ prev[j] + 1.0, curr[j - 1] + 1.0, prev[j - 1] + cost });
            if (i > 1 && j > 1 && a[i - 1] == b[j - 2] && a[i - 2] == b[j - 1]) {
                curr[j] = std::min(curr[j], prev2[j - 2] + 0.5);
            }
        }
        prev2.swap(prev);
        prev.swap(curr);
    }
    return prev[n];
}

} // namespace streetwise
