#include "order_extractor.hpp"
#include "fuzzy_matcher.hpp"
#include "number_extractor.hpp"
#include "number_lexicon.hpp"
#include "quantity_associator.hpp"
#include "segmenter.hpp"
#include "text_normalizer.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <set>
#include <sstream>

namespace {

const std::set<std::string> FILLER_WORDS = {"quero", "e"};

struct ProductKey {
    size_t index;      // position in the working catalog
    std::string name;  // normalized
    int word_count;
};

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() > suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string fold_plurals(const std::string& phrase) {
    std::istringstream iss(phrase);
    std::string word, out;
    while (iss >> word) {
        if (ends_with(word, "oes") || ends_with(word, "aes")) {
            word = word.substr(0, word.size() - 3) + "ao";
        } else if (ends_with(word, "ns")) {
            word = word.substr(0, word.size() - 2) + "m";
        }
        if (!out.empty()) out += ' ';
        out += word;
    }
    return out;
}

std::string join(const std::vector<std::string>& tokens, size_t from, size_t count) {
    std::string out;
    for (size_t k = from; k < from + count; ++k) {
        if (k > from) out += ' ';
        out += tokens[k];
    }
    return out;
}

double round2(double score) {
    return std::round(score * 100.0) / 100.0;
}

}

double phrase_score(const std::string& phrase, const std::string& product) {
    const std::string norm = normalize(phrase);
    const double raw = similarity(norm, product);
    const std::string folded = fold_plurals(norm);
    if (folded == norm) return raw;
    return std::max(raw, similarity(folded, product));
}

OrderExtractor::OrderExtractor(ExtractorOptions options) : opts(options) {}

ExtractionResult OrderExtractor::extract(const std::string& text, const WorkingCatalog& catalog) const {
    ExtractionResult result{{}, catalog};

    const std::vector<std::string> tokens = tokenize_order(text);
    if (tokens.empty() || catalog.empty()) return result;

    const std::vector<NumberMatch> numbers = extract_numbers(tokens);

    std::vector<ProductKey> products;
    std::set<std::string> product_words;
    int longest = 0;
    for (size_t idx = 0; idx < catalog.size(); ++idx) {
        ProductKey key{idx, normalize(catalog[idx].name), 0};
        std::istringstream iss(key.name);
        std::string w;
        while (iss >> w) {
            product_words.insert(w);
            ++key.word_count;
        }
        longest = std::max(longest, key.word_count);
        products.push_back(key);
    }

    // Longest names first so "abacaxi com hortela" wins ties over "abacaxi".
    std::vector<ProductKey> by_length = products;
    std::stable_sort(by_length.begin(), by_length.end(), [](const ProductKey& a, const ProductKey& b) {
        return a.word_count > b.word_count;
    });

    const int max_window = std::min(longest, opts.max_window);

    auto blocks_phrase = [&](const std::string& t) {
        if (product_words.count(t)) return false;
        return FILLER_WORDS.count(t) > 0 || NumberLexicon::is_number_token(t);
    };

    std::set<int> used_positions;
    std::set<int> used_numbers;

    auto commit = [&](const ProductKey& product, double score, int start, int size) {
        QuantityChoice choice = associate_quantity(start, size, tokens, numbers, used_numbers);

        int& running = result.catalog[product.index].running_quantity;
        running = std::min(NumberLexicon::MAX_QUANTITY, running + choice.quantity);
        result.lines.push_back({catalog[product.index].name, choice.quantity, round2(score)});

        for (int k = start; k < start + size; ++k) used_positions.insert(k);
        if (choice.number_position) used_numbers.insert(*choice.number_position);

        std::cout << "[DEBUG] Phrase: '" << join(tokens, start, size) << "' | Best Match: "
                  << catalog[product.index].name << " (" << round2(score) << "%) x"
                  << choice.quantity << std::endl;
    };

    const int n = static_cast<int>(tokens.size());
    int i = 0;
    while (i < n) {
        if (used_positions.count(i) || blocks_phrase(tokens[i])) {
            ++i;
            continue;
        }

        bool matched = false;
        for (int size = max_window; size >= 1 && !matched; --size) {
            if (i + size > n) continue;

            bool skip = false;
            for (int k = i; k < i + size; ++k) {
                if (used_positions.count(k) || blocks_phrase(tokens[k])) { skip = true; break; }
            }
            if (skip) continue;

            const std::string phrase = join(tokens, i, size);
            const ProductKey* best = nullptr;
            double best_score = 0.0;
            for (const auto& p : by_length) {
                double s = phrase_score(phrase, p.name);
                if (s > best_score) { best_score = s; best = &p; }
            }

            if (best && best_score >= opts.match_threshold) {
                commit(*best, best_score, i, size);
                i += size;
                matched = true;
            }
        }
        if (matched) continue;

        // Single-token best guess, in catalog order.
        const ProductKey* best = nullptr;
        double best_score = 0.0;
        for (const auto& p : products) {
            double s = phrase_score(tokens[i], p.name);
            if (s > best_score) { best_score = s; best = &p; }
        }
        if (best && best_score > opts.fallback_threshold) {
            commit(*best, best_score, i, 1);
        }
        ++i;
    }

    return result;
}
