#include "quantity_associator.hpp"
#include "number_lexicon.hpp"

namespace {

std::optional<NumberMatch> number_at(const std::vector<NumberMatch>& numbers, int position) {
    for (const auto& n : numbers) {
        if (n.position == position) return n;
    }
    return std::nullopt;
}

std::optional<NumberMatch> pick_by_position(int start,
                                            int size,
                                            const std::vector<std::string>& tokens,
                                            const std::vector<NumberMatch>& numbers) {
    const int end = start + size - 1;

    if (start > 0 && NumberLexicon::is_number_token(tokens[start - 1])) {
        if (auto n = number_at(numbers, start - 1)) return n;
    }

    std::optional<NumberMatch> closest_before;
    for (const auto& n : numbers) {
        if (n.position < start && (!closest_before || n.position > closest_before->position)) {
            closest_before = n;
        }
    }
    if (closest_before) return closest_before;

    if (end + 1 < static_cast<int>(tokens.size()) && NumberLexicon::is_number_token(tokens[end + 1])) {
        if (auto n = number_at(numbers, end + 1)) return n;
    }

    std::optional<NumberMatch> closest_after;
    for (const auto& n : numbers) {
        if (n.position > end && (!closest_after || n.position < closest_after->position)) {
            closest_after = n;
        }
    }
    return closest_after;
}

}

QuantityChoice associate_quantity(int start,
                                  int size,
                                  const std::vector<std::string>& tokens,
                                  const std::vector<NumberMatch>& numbers,
                                  const std::set<int>& used_numbers) {
    QuantityChoice choice;
    if (numbers.empty()) return choice;

    auto picked = pick_by_position(start, size, tokens, numbers);
    if (!picked) return choice;

    if (used_numbers.count(picked->position)) {
        picked.reset();
        for (const auto& n : numbers) {
            if (!used_numbers.count(n.position)) {
                picked = n;
                break;
            }
        }
        if (!picked) return choice;
    }

    choice.quantity = picked->value;
    choice.number_position = picked->position;
    return choice;
}
