#ifndef QUANTITY_ASSOCIATOR_HPP
#define QUANTITY_ASSOCIATOR_HPP

#include "number_extractor.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

struct QuantityChoice {
    int quantity = 1;
    std::optional<int> number_position;
};

// Picks the quantity for the product window [start, start + size).
// Rules, first match wins:
//   1. number right before the window
//   2. closest number anywhere before it
//   3. number right after the window
//   4. closest number anywhere after it
//   5. quantity 1, no number
// A pick already in used_numbers is swapped for the first unused number in
// position order; with none left the default applies.
QuantityChoice associate_quantity(int start,
                                  int size,
                                  const std::vector<std::string>& tokens,
                                  const std::vector<NumberMatch>& numbers,
                                  const std::set<int>& used_numbers);

#endif
