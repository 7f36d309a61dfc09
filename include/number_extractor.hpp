#ifndef NUMBER_EXTRACTOR_HPP
#define NUMBER_EXTRACTOR_HPP

#include <string>
#include <vector>

struct NumberMatch {
    int position; // token index where the number starts
    int value;
};

// Every nonzero number in the token stream, in position order. Number words joined
// by "e" ("vinte e cinco") collapse into one match at the first word.
std::vector<NumberMatch> extract_numbers(const std::vector<std::string>& tokens);

#endif
