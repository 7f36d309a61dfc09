#include "segmenter.hpp"
#include "number_lexicon.hpp"
#include "text_normalizer.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace {

struct WordPattern {
    std::string word;
    std::regex pattern;
};

const std::vector<WordPattern>& number_word_patterns() {
    static const std::vector<WordPattern> patterns = [] {
        const auto& teens = NumberLexicon::protected_teens();
        std::vector<WordPattern> out;
        for (const auto& w : NumberLexicon::words_longest_first()) {
            if (std::find(teens.begin(), teens.end(), w) != teens.end()) continue;
            out.push_back({w, std::regex("\\b" + w + "\\b")});
        }
        return out;
    }();
    return patterns;
}

void replace_all(std::string& text, const std::string& from, const std::string& to) {
    size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos) {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}

bool is_order_punct(char c) {
    switch (c) {
        case ',': case '.': case ';': case '+': case '-': case '/':
        case '(': case ')': case '[': case ']': case ':':
            return true;
        default:
            return false;
    }
}

}

std::string separate_numbers_and_words(const std::string& input) {
    static const std::regex digit_then_letter("([0-9]+)([a-zA-Z])");
    static const std::regex letter_then_digit("([a-zA-Z])([0-9]+)");

    std::string text = std::regex_replace(input, digit_then_letter, "$1 $2");
    text = std::regex_replace(text, letter_then_digit, "$1 $2");

    for (const auto& teen : NumberLexicon::protected_teens()) {
        replace_all(text, teen, " " + teen + " ");
    }

    for (const auto& [word, pattern] : number_word_patterns()) {
        text = std::regex_replace(text, pattern, " " + word + " ");
    }

    return collapse_spaces(text);
}

std::vector<std::string> tokenize_order(const std::string& raw_text) {
    std::string text = separate_numbers_and_words(normalize(raw_text));
    std::replace_if(text.begin(), text.end(), is_order_punct, ' ');

    std::vector<std::string> tokens;
    std::istringstream iss(collapse_spaces(text));
    std::string token;
    while (iss >> token) tokens.push_back(token);
    return tokens;
}
