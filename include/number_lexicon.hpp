#ifndef NUMBER_LEXICON_HPP
#define NUMBER_LEXICON_HPP

#include <map>
#include <optional>
#include <string>
#include <vector>

// Portuguese number words from 0 to 999, including the misspellings
// that show up in typed orders ("treis", "cnico", "quarto", ...).
class NumberLexicon {
public:
    // Largest quantity a single number or a running total can reach.
    static constexpr int MAX_QUANTITY = 9999;

    static bool is_number_word(const std::string& token);

    // Digit literal or number word.
    static bool is_number_token(const std::string& token);

    // Digit-only token, saturated at MAX_QUANTITY.
    static std::optional<int> parse_digits(const std::string& token);

    // Parses a run of number words with the "e" joiners already removed:
    // hundreds are added, a ten absorbs an adjacent unit, teens and units
    // are added. Returns nullopt when the run is worth 0.
    static std::optional<int> parse_run(const std::vector<std::string>& tokens);

    static const std::vector<std::string>& words_longest_first();

    // Compound teens that generic word wrapping must not split.
    static const std::vector<std::string>& protected_teens();

private:
    static const std::map<std::string, int>& units();
    static const std::map<std::string, int>& teens();
    static const std::map<std::string, int>& tens();
    static const std::map<std::string, int>& hundreds();
};

#endif
