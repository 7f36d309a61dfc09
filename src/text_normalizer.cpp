#include "text_normalizer.hpp"

namespace {

const char32_t REPLACEMENT_CHAR = 0xFFFD;

bool is_combining_mark(char32_t cp) {
    return cp >= 0x0300 && cp <= 0x036F;
}

bool is_space(char32_t cp) {
    return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
           cp == U'\v' || cp == U'\f' || cp == 0x00A0;
}

char32_t to_lower(char32_t cp) {
    if (cp >= U'A' && cp <= U'Z') return cp + 0x20;
    // Latin-1 uppercase block, skipping the multiplication sign
    if (cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) return cp + 0x20;
    return cp;
}

// Base letter of a precomposed lowercase Latin-1 letter, or the letter itself.
char32_t strip_accent(char32_t cp) {
    if (cp < 0x00E0 || cp > 0x00FF) return cp;
    if (cp <= 0x00E5) return U'a';
    if (cp == 0x00E7) return U'c';
    if (cp >= 0x00E8 && cp <= 0x00EB) return U'e';
    if (cp >= 0x00EC && cp <= 0x00EF) return U'i';
    if (cp == 0x00F1) return U'n';
    if (cp >= 0x00F2 && cp <= 0x00F6) return U'o';
    if (cp >= 0x00F9 && cp <= 0x00FC) return U'u';
    if (cp == 0x00FD || cp == 0x00FF) return U'y';
    return cp;
}

}

std::u32string decode_utf8(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    const unsigned char* data = reinterpret_cast<const unsigned char*>(text.data());
    const size_t length = text.size();
    size_t i = 0;
    while (i < length) {
        unsigned char byte = data[i];
        size_t extra = 0;
        char32_t cp = 0;
        if (byte < 0x80) {
            out.push_back(byte);
            ++i;
            continue;
        } else if ((byte >> 5) == 0x6) {
            extra = 1;
            cp = byte & 0x1F;
        } else if ((byte >> 4) == 0xE) {
            extra = 2;
            cp = byte & 0x0F;
        } else if ((byte >> 3) == 0x1E) {
            extra = 3;
            cp = byte & 0x07;
        } else {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }

        if (i + extra >= length) {
            out.push_back(REPLACEMENT_CHAR);
            break;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; ++k) {
            unsigned char next = data[i + k];
            if ((next & 0xC0) != 0x80) { valid = false; break; }
            cp = (cp << 6) | (next & 0x3F);
        }
        if (!valid) {
            out.push_back(REPLACEMENT_CHAR);
            ++i;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

std::string encode_utf8(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }
    return out;
}

std::string normalize(const std::string& text) {
    std::u32string folded;
    for (char32_t cp : decode_utf8(text)) {
        if (is_combining_mark(cp)) continue;
        folded.push_back(strip_accent(to_lower(cp)));
    }

    size_t begin = 0;
    size_t end = folded.size();
    while (begin < end && is_space(folded[begin])) ++begin;
    while (end > begin && is_space(folded[end - 1])) --end;
    return encode_utf8(folded.substr(begin, end - begin));
}

std::string collapse_spaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool in_space = false;
    for (char c : text) {
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            if (!in_space) { out.push_back(' '); in_space = true; }
        } else {
            out.push_back(c);
            in_space = false;
        }
    }
    if (!out.empty() && out.front() == ' ') out.erase(out.begin());
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}
