#include "number_extractor.hpp"
#include "number_lexicon.hpp"

std::vector<NumberMatch> extract_numbers(const std::vector<std::string>& tokens) {
    std::vector<NumberMatch> numbers;
    const size_t n = tokens.size();

    size_t i = 0;
    while (i < n) {
        if (auto digits = NumberLexicon::parse_digits(tokens[i])) {
            if (*digits > 0) numbers.push_back({static_cast<int>(i), *digits});
            ++i;
            continue;
        }
        if (!NumberLexicon::is_number_word(tokens[i])) {
            ++i;
            continue;
        }

        std::vector<std::string> run = {tokens[i]};
        size_t j = i + 1;
        while (j + 1 < n && tokens[j] == "e" && NumberLexicon::is_number_word(tokens[j + 1])) {
            run.push_back(tokens[j + 1]);
            j += 2;
        }

        if (auto value = NumberLexicon::parse_run(run)) {
            numbers.push_back({static_cast<int>(i), *value});
            i = j;
        } else {
            ++i;
        }
    }
    return numbers;
}
