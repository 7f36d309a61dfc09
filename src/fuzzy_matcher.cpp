#include "fuzzy_matcher.hpp"
#include "text_normalizer.hpp"
#include <rapidfuzz/distance/Levenshtein.hpp>
#include <algorithm>

double similarity(const std::string& a, const std::string& b) {
    const std::u32string lhs = decode_utf8(normalize(a));
    const std::u32string rhs = decode_utf8(normalize(b));

    const size_t max_len = std::max(lhs.size(), rhs.size());
    if (max_len == 0) return 100.0;

    const double distance = static_cast<double>(rapidfuzz::levenshtein_distance(lhs, rhs));
    return std::clamp((1.0 - distance / static_cast<double>(max_len)) * 100.0, 0.0, 100.0);
}
