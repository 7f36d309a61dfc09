#include "catalog.hpp"
#include <algorithm>

WorkingCatalog make_working_catalog(const std::vector<std::string>& product_names) {
    WorkingCatalog catalog;
    catalog.reserve(product_names.size());
    for (const auto& name : product_names) catalog.push_back({name, 0});
    return catalog;
}

OrderLines to_order_lines(const WorkingCatalog& catalog) {
    OrderLines lines;
    for (const auto& entry : catalog) {
        if (entry.running_quantity > 0) lines[entry.name] = entry.running_quantity;
    }
    return lines;
}

bool has_items(const WorkingCatalog& catalog) {
    return std::any_of(catalog.begin(), catalog.end(),
                       [](const CatalogEntry& e) { return e.running_quantity > 0; });
}

const std::vector<std::string>& default_product_names() {
    static const std::vector<std::string> names = {
        "limão", "abacaxi", "abacaxi com hortelã", "açaí", "acerola",
        "ameixa", "cajá", "cajú", "goiaba", "graviola",
        "manga", "maracujá", "morango", "seriguela", "tamarindo",
        "caixa de ovos", "ovo", "queijo"
    };
    return names;
}
