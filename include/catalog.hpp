#ifndef CATALOG_HPP
#define CATALOG_HPP

#include <map>
#include <string>
#include <vector>

struct CatalogEntry {
    std::string name;
    int running_quantity = 0;
};

using WorkingCatalog = std::vector<CatalogEntry>;

// product -> quantity, only quantities above zero
using OrderLines = std::map<std::string, int>;

WorkingCatalog make_working_catalog(const std::vector<std::string>& product_names);
OrderLines to_order_lines(const WorkingCatalog& catalog);
bool has_items(const WorkingCatalog& catalog);

// Fruit pulps, eggs and cheese sold by the store.
const std::vector<std::string>& default_product_names();

#endif
