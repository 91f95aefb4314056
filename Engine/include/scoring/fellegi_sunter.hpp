/**
 * @file fellegi_sunter.hpp
 * @brief Probabilistic record comparison (Fellegi-Sunter log2 likelihood ratios)
 *
 * Each configured field comparison contributes
 *   importance * log2(m / u)             when the raw similarity >= threshold
 *   importance * log2((1 - m) / (1 - u)) otherwise
 * and is skipped when either record lacks the value. The summed score is
 * classified against the upper / lower thresholds. m and u are supplied by
 * the caller; nothing here estimates them.
 */

#pragma once

#include <export.hpp>
#include <model/entities.hpp>
#include <model/record.hpp>
#include <similarity/string_similarity.hpp>
#include <storage/store.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

enum class MatchDecision {
    Match,
    NonMatch,
    PossibleMatch
};

const char* to_string(MatchDecision decision);

/**
 * @brief One comparison dimension. Several source fields are joined with a
 * space (e.g. first_name + last_name) and compared as one value.
 */
struct FieldComparison {
    std::string name;
    std::vector<std::string> source_fields;
    SimilarityAlgorithm algorithm = SimilarityAlgorithm::NGramJaccard;
    double m_probability = 0.9;
    double u_probability = 0.01;
    double threshold = 0.7;
    double importance = 1.0;
    size_t ngram_size = 3;
};

struct ScoringConfig {
    std::vector<FieldComparison> fields;
    double upper_threshold = 2.0;
    double lower_threshold = -1.0;

    /// Person/company defaults (name, address, contact fields).
    static ScoringConfig defaults();
};

ScoringConfig scoring_config_from_json(const nlohmann::json& j);
nlohmann::json scoring_config_to_json(const ScoringConfig& config);

struct FieldSimilarity {
    std::string field;
    double similarity = 0.0;
    SimilarityAlgorithm algorithm = SimilarityAlgorithm::Exact;
    double m_probability = 0.0;
    double u_probability = 0.0;
    double threshold = 0.0;
    double importance = 0.0;
    bool agrees = false;
    double weight = 0.0;        ///< contribution to the aggregate score
};

struct SimilarityResult {
    double score = 0.0;
    MatchDecision decision = MatchDecision::NonMatch;
    double confidence = 0.0;    ///< (score - lower) / (upper - lower), clamped to [0, 1]
    size_t fields_compared = 0;
    std::vector<FieldSimilarity> field_similarities;   ///< empty unless details were requested
};

struct ScoreOutcome {
    bool success = false;
    std::string error;
    std::string first_id;
    std::string second_id;
    std::optional<SimilarityResult> result;
};

/**
 * @brief Non-owning pair for batch scoring. A null side is a malformed pair.
 */
struct RecordPair {
    const Record* first = nullptr;
    const Record* second = nullptr;
};

struct BatchSimilarityResult {
    std::vector<ScoreOutcome> outcomes;     ///< input order
    size_t total_pairs = 0;
    size_t successful_pairs = 0;
    size_t failed_pairs = 0;
    size_t matches = 0;
    size_t possible_matches = 0;
    size_t non_matches = 0;
    double average_score = 0.0;             ///< over successful pairs
    double execution_time_ms = 0.0;
};

/// Scores are stored rounded to 4 decimals.
inline double round_score(double score) { return round_to(score, 4); }

class COALESCE_API FellegiSunterScorer {
public:
    /**
     * @throws ConfigurationError if no fields are configured, all importances
     * are zero, a probability lies outside (0, 1), a threshold outside [0, 1],
     * an importance is negative or upper_threshold <= lower_threshold
     */
    explicit FellegiSunterScorer(ScoringConfig config);

    const ScoringConfig& config() const { return config_; }

    /**
     * @brief Compare two records. Never throws for bad input; a null record
     * produces an unsuccessful outcome.
     */
    ScoreOutcome compute_similarity(const Record* first, const Record* second, bool include_details = false) const;

    ScoreOutcome compute_similarity(const Record& first, const Record& second, bool include_details = false) const {
        return compute_similarity(&first, &second, include_details);
    }

    /**
     * @brief Score every pair, recording malformed pairs as failures and
     * continuing.
     */
    BatchSimilarityResult compute_batch_similarity(const std::vector<RecordPair>& pairs,
                                                   bool include_details = false) const;

    /**
     * @brief Fetch both records of each candidate and score them. A candidate
     * whose record is missing from the store counts as a failed pair.
     */
    BatchSimilarityResult score_candidates(Store& store, const std::string& collection,
                                           const std::vector<CandidatePair>& candidates,
                                           bool include_details = false) const;

    MatchDecision classify(double score) const;
    double confidence(double score) const;

private:
    static std::optional<std::string> field_value(const Record& record, const FieldComparison& field);

    ScoringConfig config_;
};

/**
 * @brief Pairs classified as match, ready for edge creation.
 *
 * Similarity is the confidence rounded to 4 decimals; the raw score and the
 * number of compared fields go into the attributes.
 */
std::vector<ScoredMatch> collect_matches(const BatchSimilarityResult& batch);

} // namespace Coalesce
