#ifndef FUZZY_MATCHER_HPP
#define FUZZY_MATCHER_HPP

#include <string>

// Levenshtein similarity of the normalized strings, as a percentage of the
// longer one: (1 - distance / max_len) * 100. Two empty strings are 100.
double similarity(const std::string& a, const std::string& b);

#endif
