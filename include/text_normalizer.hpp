#ifndef TEXT_NORMALIZER_HPP
#define TEXT_NORMALIZER_HPP

#include <string>

// Lowercase, fold Latin diacritics (ã -> a, ç -> c, ...), trim.
std::string normalize(const std::string& text);

std::string collapse_spaces(const std::string& text);

// UTF-8 <-> code points. Invalid bytes become U+FFFD.
std::u32string decode_utf8(const std::string& text);
std::string encode_utf8(const std::u32string& text);

#endif
