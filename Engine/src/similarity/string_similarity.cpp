/**
 * @file string_similarity.cpp
 * @brief String similarity primitives
 */

#include <similarity/string_similarity.hpp>
#include <utils/errors.hpp>
#include <algorithm>
#include <cctype>
#include <vector>

namespace Coalesce {

const char* to_string(SimilarityAlgorithm algorithm) {
    switch (algorithm) {
        case SimilarityAlgorithm::Exact:        return "exact";
        case SimilarityAlgorithm::NGramJaccard: return "ngram_jaccard";
        case SimilarityAlgorithm::NGramDice:    return "ngram_dice";
        case SimilarityAlgorithm::Levenshtein:  return "levenshtein";
        case SimilarityAlgorithm::JaroWinkler:  return "jaro_winkler";
        case SimilarityAlgorithm::Phonetic:     return "phonetic";
    }
    return "unknown";
}

SimilarityAlgorithm parse_similarity_algorithm(const std::string& name) {
    if (name == "exact") return SimilarityAlgorithm::Exact;
    if (name == "ngram" || name == "ngram_jaccard") return SimilarityAlgorithm::NGramJaccard;
    if (name == "ngram_dice") return SimilarityAlgorithm::NGramDice;
    if (name == "levenshtein") return SimilarityAlgorithm::Levenshtein;
    if (name == "jaro_winkler") return SimilarityAlgorithm::JaroWinkler;
    if (name == "phonetic" || name == "soundex") return SimilarityAlgorithm::Phonetic;
    throw ConfigurationError("unknown similarity algorithm '" + name + "'");
}

std::string normalize_text(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    bool pending_space = false;

    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::set<std::string> char_ngrams(std::string_view s, size_t n) {
    std::set<std::string> grams;
    const std::string norm = normalize_text(s);
    if (norm.empty() || n == 0) return grams;

    if (norm.size() < n) {
        grams.insert(norm);
        return grams;
    }
    for (size_t i = 0; i + n <= norm.size(); ++i) {
        grams.insert(norm.substr(i, n));
    }
    return grams;
}

double exact_similarity(std::string_view a, std::string_view b) {
    return normalize_text(a) == normalize_text(b) ? 1.0 : 0.0;
}

static size_t intersection_size(const std::set<std::string>& a, const std::set<std::string>& b) {
    size_t common = 0;
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) ++ia;
        else if (*ib < *ia) ++ib;
        else { ++common; ++ia; ++ib; }
    }
    return common;
}

double ngram_jaccard(std::string_view a, std::string_view b, size_t n) {
    const std::string na = normalize_text(a);
    const std::string nb = normalize_text(b);
    if (na == nb) return 1.0;

    auto ga = char_ngrams(na, n);
    auto gb = char_ngrams(nb, n);
    if (ga.empty() || gb.empty()) return 0.0;

    size_t common = intersection_size(ga, gb);
    size_t uni = ga.size() + gb.size() - common;
    return static_cast<double>(common) / static_cast<double>(uni);
}

double ngram_dice(std::string_view a, std::string_view b, size_t n) {
    const std::string na = normalize_text(a);
    const std::string nb = normalize_text(b);
    if (na == nb) return 1.0;

    auto ga = char_ngrams(na, n);
    auto gb = char_ngrams(nb, n);
    if (ga.empty() || gb.empty()) return 0.0;

    size_t common = intersection_size(ga, gb);
    return 2.0 * static_cast<double>(common) / static_cast<double>(ga.size() + gb.size());
}

size_t levenshtein_distance(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    if (b.empty()) return a.size();

    // Two-row DP over the shorter string
    std::vector<size_t> prev(b.size() + 1), cur(b.size() + 1);
    for (size_t j = 0; j <= b.size(); ++j) prev[j] = j;

    for (size_t i = 1; i <= a.size(); ++i) {
        cur[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t cost = (a[i - 1] == b[j - 1]) ? 0 : 1;
            cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
        }
        std::swap(prev, cur);
    }
    return prev[b.size()];
}

double normalized_levenshtein(std::string_view a, std::string_view b) {
    const std::string na = normalize_text(a);
    const std::string nb = normalize_text(b);
    const size_t max_len = std::max(na.size(), nb.size());
    if (max_len == 0) return 1.0;
    return 1.0 - static_cast<double>(levenshtein_distance(na, nb)) / static_cast<double>(max_len);
}

double jaro(std::string_view a_in, std::string_view b_in) {
    const std::string a = normalize_text(a_in);
    const std::string b = normalize_text(b_in);
    if (a.empty() && b.empty()) return 1.0;
    if (a.empty() || b.empty()) return 0.0;
    if (a == b) return 1.0;

    const size_t window = std::max(a.size(), b.size()) / 2;
    const size_t match_distance = window > 0 ? window - 1 : 0;

    std::vector<bool> a_matched(a.size(), false), b_matched(b.size(), false);
    size_t matches = 0;

    for (size_t i = 0; i < a.size(); ++i) {
        size_t lo = (i > match_distance) ? i - match_distance : 0;
        size_t hi = std::min(i + match_distance + 1, b.size());
        for (size_t j = lo; j < hi; ++j) {
            if (b_matched[j] || a[i] != b[j]) continue;
            a_matched[i] = b_matched[j] = true;
            ++matches;
            break;
        }
    }
    if (matches == 0) return 0.0;

    size_t transpositions = 0;
    size_t k = 0;
    for (size_t i = 0; i < a.size(); ++i) {
        if (!a_matched[i]) continue;
        while (!b_matched[k]) ++k;
        if (a[i] != b[k]) ++transpositions;
        ++k;
    }

    const double m = static_cast<double>(matches);
    const double t = static_cast<double>(transpositions) / 2.0;
    return (m / a.size() + m / b.size() + (m - t) / m) / 3.0;
}

double jaro_winkler(std::string_view a_in, std::string_view b_in, double prefix_scale) {
    const std::string a = normalize_text(a_in);
    const std::string b = normalize_text(b_in);
    const double j = jaro(a, b);

    size_t prefix = 0;
    const size_t max_prefix = std::min<size_t>({4, a.size(), b.size()});
    while (prefix < max_prefix && a[prefix] == b[prefix]) ++prefix;

    return std::min(1.0, j + static_cast<double>(prefix) * prefix_scale * (1.0 - j));
}

static char soundex_code(char c) {
    switch (c) {
        case 'B': case 'F': case 'P': case 'V':
            return '1';
        case 'C': case 'G': case 'J': case 'K': case 'Q': case 'S': case 'X': case 'Z':
            return '2';
        case 'D': case 'T':
            return '3';
        case 'L':
            return '4';
        case 'M': case 'N':
            return '5';
        case 'R':
            return '6';
        default:
            return '0';     // vowels, H, W, Y
    }
}

std::string soundex(std::string_view s) {
    std::string letters;
    letters.reserve(s.size());
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        if (std::isalpha(c)) letters.push_back(static_cast<char>(std::toupper(c)));
    }
    if (letters.empty()) return "0000";

    std::string code(1, letters[0]);
    char last = soundex_code(letters[0]);

    for (size_t i = 1; i < letters.size() && code.size() < 4; ++i) {
        const char c = letters[i];
        const char digit = soundex_code(c);
        if (digit != '0' && digit != last) {
            code.push_back(digit);
        }
        // H and W do not separate letters with the same code; vowels do
        if (c != 'H' && c != 'W') last = digit;
    }

    code.resize(4, '0');
    return code;
}

double phonetic_similarity(std::string_view a, std::string_view b) {
    const std::string sa = soundex(a);
    const std::string sb = soundex(b);
    if (sa == "0000" || sb == "0000") return normalize_text(a) == normalize_text(b) ? 1.0 : 0.0;
    return sa == sb ? 1.0 : 0.0;
}

double compute_string_similarity(SimilarityAlgorithm algorithm, std::string_view a, std::string_view b,
                                 size_t ngram_size) {
    switch (algorithm) {
        case SimilarityAlgorithm::Exact:        return exact_similarity(a, b);
        case SimilarityAlgorithm::NGramJaccard: return ngram_jaccard(a, b, ngram_size);
        case SimilarityAlgorithm::NGramDice:    return ngram_dice(a, b, ngram_size);
        case SimilarityAlgorithm::Levenshtein:  return normalized_levenshtein(a, b);
        case SimilarityAlgorithm::JaroWinkler:  return jaro_winkler(a, b);
        case SimilarityAlgorithm::Phonetic:     return phonetic_similarity(a, b);
    }
    return 0.0;
}

} // namespace Coalesce
