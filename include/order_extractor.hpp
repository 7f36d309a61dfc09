#ifndef ORDER_EXTRACTOR_HPP
#define ORDER_EXTRACTOR_HPP

#include "catalog.hpp"
#include <string>
#include <vector>

struct ParsedOrderLine {
    std::string product;
    int quantity;
    double score; // 0-100, two decimals
};

struct ExtractorOptions {
    double match_threshold = 80.0;    // phrase windows
    double fallback_threshold = 50.0; // single-token guesses, strictly above
    int max_window = 4;               // longest phrase tried, in tokens
};

struct ExtractionResult {
    std::vector<ParsedOrderLine> lines;
    WorkingCatalog catalog; // input catalog with the lines merged in
};

class OrderExtractor {
public:
    explicit OrderExtractor(ExtractorOptions options = {});

    // Matches product phrases in a free-text order and attaches quantities.
    // The input catalog is left untouched; unmatched tokens are ignored.
    ExtractionResult extract(const std::string& text, const WorkingCatalog& catalog) const;

    const ExtractorOptions& options() const { return opts; }

private:
    ExtractorOptions opts;
};

// Similarity of a normalized phrase against a product name, also trying the
// phrase with Portuguese nasal plurals folded ("limoes" -> "limao").
double phrase_score(const std::string& phrase, const std::string& product);

#endif
