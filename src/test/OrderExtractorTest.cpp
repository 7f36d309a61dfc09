#include <cassert>
#include <cmath>
#include <iostream>
#include "number_lexicon.hpp"
#include "order_extractor.hpp"

static bool near(double a, double b) {
    return std::fabs(a - b) < 0.01;
}

int main() {
    std::cout << "[Test] Starting OrderExtractor Test..." << std::endl;

    const OrderExtractor extractor;
    const WorkingCatalog small = make_working_catalog({"manga", "queijo"});
    const WorkingCatalog full = make_working_catalog(default_product_names());

    // Number words before each product
    {
        auto result = extractor.extract("dois mangas e tres queijos", small);
        assert(result.lines.size() == 2);
        assert(result.lines[0].product == "manga" && result.lines[0].quantity == 2);
        assert(near(result.lines[0].score, 83.33));
        assert(result.lines[1].product == "queijo" && result.lines[1].quantity == 3);
        assert(near(result.lines[1].score, 85.71));

        OrderLines lines = to_order_lines(result.catalog);
        assert(lines.size() == 2 && lines["manga"] == 2 && lines["queijo"] == 3);
        assert(!has_items(small) && "Input catalog must not change.");
    }

    // Compound number and nasal plural
    {
        auto result = extractor.extract("vinte e cinco limões", full);
        assert(result.lines.size() == 1);
        assert(result.lines[0].product == "limão");
        assert(result.lines[0].quantity == 25);
        assert(near(result.lines[0].score, 100.0));
    }

    // Repeated product accumulates
    {
        auto result = extractor.extract("2 mangas 3 mangas", small);
        assert(result.lines.size() == 2);
        assert(result.lines[0].quantity == 2 && result.lines[1].quantity == 3);
        assert(to_order_lines(result.catalog).at("manga") == 5);
    }

    // Trailing numbers, the second one taken by substitution
    {
        auto result = extractor.extract("mangas 2 mangas 3", small);
        assert(result.lines.size() == 2);
        assert(result.lines[0].quantity == 2);
        assert(result.lines[1].quantity == 3);
    }

    // A number alone is not an order
    {
        auto result = extractor.extract("5", full);
        assert(result.lines.empty());
        assert(!has_items(result.catalog));
    }

    // Single-token fallback below the phrase threshold
    {
        auto result = extractor.extract("ovos", full);
        assert(result.lines.size() == 1);
        assert(result.lines[0].product == "ovo" && result.lines[0].quantity == 1);
        assert(near(result.lines[0].score, 75.0));
    }

    // Multi-word product wins over its prefix
    {
        auto result = extractor.extract("abacaxi com hortelã", full);
        assert(result.lines.size() == 1);
        assert(result.lines[0].product == "abacaxi com hortelã");
        assert(result.lines[0].quantity == 1);
    }

    // Filler words are skipped
    {
        auto result = extractor.extract("quero 2 acerolas", full);
        assert(result.lines.size() == 1);
        assert(result.lines[0].product == "acerola" && result.lines[0].quantity == 2);
    }

    // Glued digits and punctuation
    {
        auto result = extractor.extract("3mangas, 1 queijo.", small);
        OrderLines lines = to_order_lines(result.catalog);
        assert(lines["manga"] == 3 && lines["queijo"] == 1);
    }

    // Nothing recognizable
    {
        assert(extractor.extract("xyz qwk", full).lines.empty());
        assert(extractor.extract("", full).lines.empty());
        assert(extractor.extract("2 mangas", WorkingCatalog{}).lines.empty());
    }

    // Existing quantities are carried forward
    {
        auto first = extractor.extract("2 queijos", small);
        auto second = extractor.extract("1 queijo", first.catalog);
        assert(to_order_lines(second.catalog).at("queijo") == 3);
    }

    // Stricter threshold rejects the plural phrase and leaves the fallback
    {
        ExtractorOptions strict;
        strict.match_threshold = 90.0;
        strict.fallback_threshold = 85.0;
        OrderExtractor picky(strict);
        assert(picky.options().match_threshold == 90.0);
        assert(picky.extract("mangas", small).lines.empty());
        assert(picky.extract("manga", small).lines.size() == 1);
    }

    // Huge quantities saturate instead of wrapping around
    {
        auto result = extractor.extract("999999999 mangas 999999999 mangas 999999999 mangas", small);
        assert(result.lines.size() == 3);
        assert(result.lines[0].quantity == NumberLexicon::MAX_QUANTITY);
        assert(to_order_lines(result.catalog).at("manga") == NumberLexicon::MAX_QUANTITY);
        assert(has_items(result.catalog));

        auto again = extractor.extract("5000 mangas", result.catalog);
        assert(to_order_lines(again.catalog).at("manga") == NumberLexicon::MAX_QUANTITY);
    }

    // A zero literal is not a quantity
    {
        auto result = extractor.extract("0 mangas", small);
        assert(result.lines.size() == 1 && result.lines[0].quantity == 1);
        assert(extractor.extract("0", small).lines.empty());
    }

    assert(near(phrase_score("limões", "limao"), 100.0));
    assert(near(phrase_score("paes", "pao"), 100.0));
    assert(near(phrase_score("mangas", "manga"), 83.33));

    std::cout << "[PASS] OrderExtractor Test." << std::endl;
    return 0;
}
