#include "number_lexicon.hpp"
#include <algorithm>
#include <cctype>

const std::map<std::string, int>& NumberLexicon::units() {
    static const std::map<std::string, int> table = {
        {"0", 0}, {"1", 1}, {"2", 2}, {"3", 3}, {"4", 4},
        {"5", 5}, {"6", 6}, {"7", 7}, {"8", 8}, {"9", 9},
        {"zero", 0}, {"um", 1}, {"uma", 1}, {"dois", 2}, {"duas", 2}, {"dos", 2},
        {"tres", 3}, {"treis", 3}, {"quatro", 4}, {"quarto", 4},
        {"cinco", 5}, {"cnico", 5}, {"seis", 6}, {"ses", 6}, {"sete", 7},
        {"oito", 8}, {"nove", 9}, {"nov", 9}
    };
    return table;
}

const std::map<std::string, int>& NumberLexicon::teens() {
    static const std::map<std::string, int> table = {
        {"dez", 10}, {"onze", 11}, {"doze", 12}, {"treze", 13},
        {"quatorze", 14}, {"catorze", 14}, {"quinze", 15},
        {"dezesseis", 16}, {"dezessete", 17}, {"dezoito", 18}, {"dezenove", 19}
    };
    return table;
}

const std::map<std::string, int>& NumberLexicon::tens() {
    static const std::map<std::string, int> table = {
        {"vinte", 20}, {"trinta", 30}, {"quarenta", 40}, {"cinquenta", 50},
        {"sessenta", 60}, {"setenta", 70}, {"oitenta", 80}, {"noventa", 90}
    };
    return table;
}

const std::map<std::string, int>& NumberLexicon::hundreds() {
    static const std::map<std::string, int> table = {
        {"cem", 100}, {"cento", 100}, {"duzentos", 200}, {"trezentos", 300},
        {"quatrocentos", 400}, {"quinhentos", 500}, {"seiscentos", 600},
        {"setecentos", 700}, {"oitocentos", 800}, {"novecentos", 900}
    };
    return table;
}

bool NumberLexicon::is_number_word(const std::string& token) {
    return units().count(token) || teens().count(token) ||
           tens().count(token) || hundreds().count(token);
}

std::optional<int> NumberLexicon::parse_digits(const std::string& token) {
    if (token.empty()) return std::nullopt;
    int value = 0;
    for (unsigned char c : token) {
        if (!std::isdigit(c)) return std::nullopt;
        value = std::min(MAX_QUANTITY, value * 10 + (c - '0'));
    }
    return value;
}

bool NumberLexicon::is_number_token(const std::string& token) {
    return parse_digits(token).has_value() || is_number_word(token);
}

std::optional<int> NumberLexicon::parse_run(const std::vector<std::string>& tokens) {
    int total = 0;
    size_t i = 0;
    while (i < tokens.size()) {
        const std::string& t = tokens[i];
        if (auto h = hundreds().find(t); h != hundreds().end()) {
            total += h->second;
            ++i;
        } else if (auto ten = tens().find(t); ten != tens().end()) {
            int value = ten->second;
            if (i + 1 < tokens.size() && units().count(tokens[i + 1])) {
                value += units().at(tokens[i + 1]);
                i += 2;
            } else {
                ++i;
            }
            total += value;
        } else if (auto teen = teens().find(t); teen != teens().end()) {
            total += teen->second;
            ++i;
        } else if (auto unit = units().find(t); unit != units().end()) {
            total += unit->second;
            ++i;
        } else {
            ++i;
        }
    }
    if (total <= 0) return std::nullopt;
    return total;
}

const std::vector<std::string>& NumberLexicon::words_longest_first() {
    static const std::vector<std::string> words = [] {
        std::vector<std::string> all;
        for (const auto* table : {&units(), &teens(), &tens(), &hundreds()}) {
            for (const auto& [word, value] : *table) all.push_back(word);
        }
        std::stable_sort(all.begin(), all.end(), [](const std::string& a, const std::string& b) {
            return a.size() > b.size();
        });
        return all;
    }();
    return words;
}

const std::vector<std::string>& NumberLexicon::protected_teens() {
    static const std::vector<std::string> words = {"dezesseis", "dezessete", "dezoito", "dezenove"};
    return words;
}
