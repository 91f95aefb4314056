/**
 * @file string_similarity.hpp
 * @brief Stateless string similarity primitives used by blocking and scoring
 *
 * Every similarity is in [0, 1]. Inputs are compared after normalize_text()
 * (trim, collapse internal whitespace, ASCII lower-case) except for the raw
 * distance helpers.
 */

#pragma once

#include <set>
#include <string>
#include <string_view>

namespace Coalesce {

enum class SimilarityAlgorithm {
    Exact,
    NGramJaccard,
    NGramDice,
    Levenshtein,
    JaroWinkler,
    Phonetic
};

const char* to_string(SimilarityAlgorithm algorithm);

/**
 * @brief Parse "exact", "ngram" / "ngram_jaccard", "ngram_dice", "levenshtein",
 * "jaro_winkler", "phonetic". Throws ConfigurationError otherwise.
 */
SimilarityAlgorithm parse_similarity_algorithm(const std::string& name);

std::string normalize_text(std::string_view s);

/**
 * @brief Character n-grams of the normalized string.
 *
 * A non-empty string shorter than n yields itself as the only gram.
 */
std::set<std::string> char_ngrams(std::string_view s, size_t n = 3);

double exact_similarity(std::string_view a, std::string_view b);
double ngram_jaccard(std::string_view a, std::string_view b, size_t n = 3);
double ngram_dice(std::string_view a, std::string_view b, size_t n = 3);

size_t levenshtein_distance(std::string_view a, std::string_view b);

/**
 * @brief 1 - distance / max(len); two empty strings are identical.
 */
double normalized_levenshtein(std::string_view a, std::string_view b);

double jaro(std::string_view a, std::string_view b);

/**
 * @brief Jaro similarity boosted by the common prefix (at most 4 chars).
 */
double jaro_winkler(std::string_view a, std::string_view b, double prefix_scale = 0.1);

/**
 * @brief American Soundex: first letter + three digits, "0000" for input
 * without letters.
 */
std::string soundex(std::string_view s);

double phonetic_similarity(std::string_view a, std::string_view b);

double compute_string_similarity(SimilarityAlgorithm algorithm, std::string_view a, std::string_view b,
                                 size_t ngram_size = 3);

} // namespace Coalesce
