#ifndef SEGMENTER_HPP
#define SEGMENTER_HPP

#include <string>
#include <vector>

// "2mangas" -> "2 mangas", "dezesseisqueijos" -> "dezesseis queijos".
// Expects text that already went through normalize().
std::string separate_numbers_and_words(const std::string& text);

// Full pipeline from raw message to tokens:
// normalize, separate, punctuation to spaces, split.
std::vector<std::string> tokenize_order(const std::string& raw_text);

#endif
