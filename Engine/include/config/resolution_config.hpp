/**
 * @file resolution_config.hpp
 * @brief Versioned configuration for a full resolution run
 *
 * Defaults live in the struct. JSON layers are applied on top in order
 * (later layers win, unknown keys are rejected) and the result is validated
 * once before any component is built.
 */

#pragma once

#include <blocking/blocking_spec.hpp>
#include <clustering/wcc_clustering.hpp>
#include <embedding/node2vec.hpp>
#include <persistence/golden_record_service.hpp>
#include <persistence/similarity_edge_service.hpp>
#include <scoring/fellegi_sunter.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Coalesce {

struct EmbeddingOptions {
    bool enabled = false;
    std::string field = "node_embedding";
    Node2VecParams params;
    Node2VecLimits limits;
    size_t edge_limit = 0;          ///< 0 = up to limits.max_edges_fetched
};

struct ResolutionConfig {
    static constexpr int CURRENT_VERSION = 1;

    int version = CURRENT_VERSION;
    std::string record_collection = "records";
    std::vector<BlockingSpec> blocking;
    ScoringConfig scoring = ScoringConfig::defaults();
    EdgeServiceOptions edges;
    bool bidirectional_edges = false;
    ClusteringOptions clustering;
    GoldenRecordOptions golden;
    EmbeddingOptions embeddings;

    /**
     * @brief Defaults for a collection: exact blocking on email and phonetic
     * blocking on last_name, default scoring weights.
     */
    static ResolutionConfig defaults(const std::string& record_collection);
};

/**
 * @brief Apply one JSON override layer.
 * @throws ConfigurationError on unknown keys, wrong types or a version mismatch
 */
void apply_overrides(ResolutionConfig& config, const nlohmann::json& layer);

/**
 * @brief defaults(collection) with every layer applied in order, then validated.
 */
ResolutionConfig layered_config(const std::string& record_collection, const std::vector<nlohmann::json>& layers);

/**
 * @brief Check names, ranges and component options that do not need a store.
 * @throws ConfigurationError / ValidationError / SafetyLimitExceeded
 */
void validate(const ResolutionConfig& config);

nlohmann::json to_json(const ResolutionConfig& config);

} // namespace Coalesce
