#pragma once
#include <string>

namespace streetwise {

// Damerau-Levenshtein (optimal string alignment): insert, delete, substitute
// and adjacent transposition each cost 1.
int damerauLevenshtein(const std::string& a, const std::string& b);

// Same recurrence with typing-aware costs: keyboard-adjacent substitution 0.5,
// phonetically similar substitution 0.7, adjacent transposition 0.5.
double weightedDistance(const std::string& a, const std::string& b);

// QWERTY neighbours (lowercase letters only)
bool isAdjacentKey(char a, char b);

// Letters that commonly stand in for each other (c/k, s/c/z, g/j, i/y, ...)
bool isPhoneticallySimilar(char a, char b);

} // namespace streetwise
