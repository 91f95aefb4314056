/**
 * @file fellegi_sunter.cpp
 * @brief Fellegi-Sunter scoring of record pairs
 */

#include <scoring/fellegi_sunter.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <unordered_map>

namespace Coalesce {

const char* to_string(MatchDecision decision) {
    switch (decision) {
        case MatchDecision::Match:         return "match";
        case MatchDecision::NonMatch:      return "non_match";
        case MatchDecision::PossibleMatch: return "possible_match";
    }
    return "unknown";
}

FellegiSunterScorer::FellegiSunterScorer(ScoringConfig config) : config_(std::move(config)) {
    if (config_.fields.empty()) {
        throw ConfigurationError("scoring requires at least one field comparison");
    }
    if (!(config_.upper_threshold > config_.lower_threshold)) {
        throw ConfigurationError("upper_threshold must be greater than lower_threshold");
    }

    double total_importance = 0.0;
    for (const auto& f : config_.fields) {
        if (f.name.empty()) throw ConfigurationError("field comparison without a name");
        if (f.source_fields.empty()) {
            throw ConfigurationError("field comparison '" + f.name + "' has no source fields");
        }
        validate_identifiers(f.source_fields, "scoring field");

        if (!(f.m_probability > 0.0 && f.m_probability < 1.0)) {
            throw ConfigurationError(f.name + ": m_probability must be in (0, 1)");
        }
        if (!(f.u_probability > 0.0 && f.u_probability < 1.0)) {
            throw ConfigurationError(f.name + ": u_probability must be in (0, 1)");
        }
        if (f.threshold < 0.0 || f.threshold > 1.0) {
            throw ConfigurationError(f.name + ": threshold must be in [0, 1]");
        }
        if (f.importance < 0.0) {
            throw ConfigurationError(f.name + ": importance must not be negative");
        }
        if (f.ngram_size == 0) {
            throw ConfigurationError(f.name + ": ngram_size must be positive");
        }
        total_importance += f.importance;
    }
    if (total_importance <= 0.0) {
        throw ConfigurationError("all field importances are zero");
    }
}

MatchDecision FellegiSunterScorer::classify(double score) const {
    if (score >= config_.upper_threshold) return MatchDecision::Match;
    if (score <= config_.lower_threshold) return MatchDecision::NonMatch;
    return MatchDecision::PossibleMatch;
}

double FellegiSunterScorer::confidence(double score) const {
    const double c = (score - config_.lower_threshold) / (config_.upper_threshold - config_.lower_threshold);
    return std::clamp(c, 0.0, 1.0);
}

std::optional<std::string> FellegiSunterScorer::field_value(const Record& record, const FieldComparison& field) {
    if (field.source_fields.size() == 1) return record.text(field.source_fields.front());

    std::string joined;
    for (const auto& source : field.source_fields) {
        auto v = record.text(source);
        if (!v) continue;
        if (!joined.empty()) joined.push_back(' ');
        joined += *v;
    }
    if (joined.empty()) return std::nullopt;
    return joined;
}

ScoreOutcome FellegiSunterScorer::compute_similarity(const Record* first, const Record* second,
                                                     bool include_details) const {
    ScoreOutcome outcome;
    if (first) outcome.first_id = first->id;
    if (second) outcome.second_id = second->id;

    if (!first || !second) {
        outcome.error = "missing record";
        return outcome;
    }
    if (!first->fields.is_object() || !second->fields.is_object()) {
        outcome.error = "record fields are not an object";
        return outcome;
    }

    SimilarityResult result;
    double score = 0.0;

    for (const auto& field : config_.fields) {
        auto a = field_value(*first, field);
        auto b = field_value(*second, field);
        if (!a || !b) continue;

        const double sim = compute_string_similarity(field.algorithm, *a, *b, field.ngram_size);
        const bool agrees = sim >= field.threshold;
        const double ratio = agrees
            ? field.m_probability / field.u_probability
            : (1.0 - field.m_probability) / (1.0 - field.u_probability);
        const double weight = field.importance * std::log2(ratio);

        score += weight;
        ++result.fields_compared;

        if (include_details) {
            FieldSimilarity fs;
            fs.field = field.name;
            fs.similarity = sim;
            fs.algorithm = field.algorithm;
            fs.m_probability = field.m_probability;
            fs.u_probability = field.u_probability;
            fs.threshold = field.threshold;
            fs.importance = field.importance;
            fs.agrees = agrees;
            fs.weight = weight;
            result.field_similarities.push_back(std::move(fs));
        }
    }

    result.score = round_score(score);
    result.decision = classify(score);
    result.confidence = round_score(confidence(score));

    outcome.success = true;
    outcome.result = std::move(result);
    return outcome;
}

static void tally(BatchSimilarityResult& batch, double& score_sum) {
    const ScoreOutcome& o = batch.outcomes.back();
    if (!o.success) {
        ++batch.failed_pairs;
        return;
    }
    ++batch.successful_pairs;
    score_sum += o.result->score;
    switch (o.result->decision) {
        case MatchDecision::Match:         ++batch.matches; break;
        case MatchDecision::PossibleMatch: ++batch.possible_matches; break;
        case MatchDecision::NonMatch:      ++batch.non_matches; break;
    }
}

static void finish(BatchSimilarityResult& batch, double score_sum, const Timer& timer) {
    batch.total_pairs = batch.outcomes.size();
    batch.average_score = batch.successful_pairs > 0 ? round_score(score_sum / batch.successful_pairs) : 0.0;
    batch.execution_time_ms = timer.elapsed_ms();

    if (batch.failed_pairs > 0) {
        Logger::warn("Batch scoring: " + std::to_string(batch.failed_pairs) + " of " +
                     std::to_string(batch.total_pairs) + " pairs failed");
    }
    Logger::info("Scored " + std::to_string(batch.successful_pairs) + " pairs: " +
                 std::to_string(batch.matches) + " match, " +
                 std::to_string(batch.possible_matches) + " possible, " +
                 std::to_string(batch.non_matches) + " non-match");
}

BatchSimilarityResult FellegiSunterScorer::compute_batch_similarity(const std::vector<RecordPair>& pairs,
                                                                    bool include_details) const {
    Timer timer;
    BatchSimilarityResult batch;
    batch.outcomes.reserve(pairs.size());
    double score_sum = 0.0;

    for (const auto& pair : pairs) {
        batch.outcomes.push_back(compute_similarity(pair.first, pair.second, include_details));
        tally(batch, score_sum);
    }

    finish(batch, score_sum, timer);
    return batch;
}

BatchSimilarityResult FellegiSunterScorer::score_candidates(Store& store, const std::string& collection,
                                                            const std::vector<CandidatePair>& candidates,
                                                            bool include_details) const {
    validate_identifier(collection, "collection");

    Timer timer;
    BatchSimilarityResult batch;
    batch.outcomes.reserve(candidates.size());
    double score_sum = 0.0;

    // Records appear in many pairs; fetch each id once
    std::unordered_map<std::string, std::optional<Record>> cache;
    auto lookup = [&](const std::string& id) -> const Record* {
        auto it = cache.find(id);
        if (it == cache.end()) it = cache.emplace(id, store.fetch_record(collection, id)).first;
        return it->second ? &*it->second : nullptr;
    };

    for (const auto& c : candidates) {
        const Record* a = lookup(c.first_id);
        const Record* b = lookup(c.second_id);
        ScoreOutcome o = compute_similarity(a, b, include_details);
        o.first_id = c.first_id;
        o.second_id = c.second_id;
        batch.outcomes.push_back(std::move(o));
        tally(batch, score_sum);
    }

    finish(batch, score_sum, timer);
    return batch;
}

std::vector<ScoredMatch> collect_matches(const BatchSimilarityResult& batch) {
    std::vector<ScoredMatch> matches;
    for (const auto& o : batch.outcomes) {
        if (!o.success || o.result->decision != MatchDecision::Match) continue;
        ScoredMatch m;
        m.first_id = o.first_id;
        m.second_id = o.second_id;
        m.similarity = round_score(o.result->confidence);
        m.attributes = {
            {"score", o.result->score},
            {"fields_compared", o.result->fields_compared}
        };
        matches.push_back(std::move(m));
    }
    return matches;
}

// ============================================================================
// Configuration
// ============================================================================

static FieldComparison comparison(std::string name, std::vector<std::string> sources, SimilarityAlgorithm algorithm,
                                  double m, double u, double threshold, double importance) {
    FieldComparison f;
    f.name = std::move(name);
    f.source_fields = std::move(sources);
    f.algorithm = algorithm;
    f.m_probability = m;
    f.u_probability = u;
    f.threshold = threshold;
    f.importance = importance;
    return f;
}

ScoringConfig ScoringConfig::defaults() {
    using A = SimilarityAlgorithm;
    ScoringConfig c;
    c.fields = {
        comparison("name_ngram",             {"name"},       A::NGramJaccard, 0.90, 0.010, 0.7, 1.0),
        comparison("first_name_ngram",       {"first_name"}, A::NGramJaccard, 0.85, 0.020, 0.7, 0.8),
        comparison("last_name_ngram",        {"last_name"},  A::NGramJaccard, 0.90, 0.015, 0.7, 1.0),
        comparison("first_name_levenshtein", {"first_name"}, A::Levenshtein,  0.80, 0.050, 0.6, 0.7),
        comparison("last_name_levenshtein",  {"last_name"},  A::Levenshtein,  0.85, 0.030, 0.6, 0.9),
        comparison("address_ngram",          {"address"},    A::NGramJaccard, 0.80, 0.030, 0.6, 0.8),
        comparison("city_ngram",             {"city"},       A::NGramJaccard, 0.90, 0.050, 0.8, 0.6),
        comparison("email_exact",            {"email"},      A::Exact,        0.95, 0.001, 1.0, 1.2),
        comparison("phone_exact",            {"phone"},      A::Exact,        0.90, 0.005, 1.0, 1.1),
        comparison("company_ngram",          {"company"},    A::NGramJaccard, 0.80, 0.020, 0.7, 0.7),
    };
    c.upper_threshold = 2.0;
    c.lower_threshold = -1.0;
    return c;
}

ScoringConfig scoring_config_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw ConfigurationError("scoring configuration must be an object");

    ScoringConfig c;
    try {
        c.upper_threshold = j.value("upper_threshold", c.upper_threshold);
        c.lower_threshold = j.value("lower_threshold", c.lower_threshold);

        for (const auto& fj : j.at("fields")) {
            FieldComparison f;
            f.name = fj.at("name").get<std::string>();
            if (fj.contains("fields")) {
                f.source_fields = fj["fields"].get<std::vector<std::string>>();
            } else {
                f.source_fields = {fj.value("field", f.name)};
            }
            f.algorithm = parse_similarity_algorithm(fj.value("algorithm", std::string("ngram")));
            f.m_probability = fj.value("m_probability", f.m_probability);
            f.u_probability = fj.value("u_probability", f.u_probability);
            f.threshold = fj.value("threshold", f.threshold);
            f.importance = fj.value("importance", f.importance);
            f.ngram_size = fj.value("ngram_size", f.ngram_size);
            c.fields.push_back(std::move(f));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("scoring: ") + e.what());
    }
    return c;
}

nlohmann::json scoring_config_to_json(const ScoringConfig& config) {
    nlohmann::json fields = nlohmann::json::array();
    for (const auto& f : config.fields) {
        fields.push_back({
            {"name", f.name},
            {"fields", f.source_fields},
            {"algorithm", to_string(f.algorithm)},
            {"m_probability", f.m_probability},
            {"u_probability", f.u_probability},
            {"threshold", f.threshold},
            {"importance", f.importance},
            {"ngram_size", f.ngram_size}
        });
    }
    return {
        {"upper_threshold", config.upper_threshold},
        {"lower_threshold", config.lower_threshold},
        {"fields", fields}
    };
}

} // namespace Coalesce
