/**
 * @file similarity_edge_service.hpp
 * @brief Batched, idempotent creation of match edges
 */

#pragma once

#include <model/entities.hpp>
#include <storage/store.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

struct EdgeServiceOptions {
    std::string edge_collection = "similar_to";
    size_t batch_size = 1000;
    std::string method = "fellegi_sunter";
};

struct EdgeCreationStats {
    size_t edges_requested = 0;
    size_t edges_created = 0;           ///< new identities written
    size_t batches_processed = 0;
    size_t batches_failed = 0;
    size_t edges_failed = 0;
    double avg_batch_size = 0.0;
    double execution_time_ms = 0.0;
    double edges_per_second = 0.0;

    nlohmann::json to_json() const;
};

class SimilarityEdgeService {
public:
    SimilarityEdgeService(Store& store, EdgeServiceOptions options = {});

    /**
     * @brief Build deterministic-key edges for each match and insert them with
     * ignore-on-conflict, batch by batch.
     *
     * With bidirectional, each match yields a forward and a reverse edge that
     * share one key. A batch the store rejects is logged and counted as
     * failed; later batches still run.
     * @param method Overrides options.method when set
     */
    EdgeCreationStats create_edges(const std::vector<ScoredMatch>& matches,
                                   const nlohmann::json& attributes = nlohmann::json::object(),
                                   bool bidirectional = false,
                                   const std::optional<std::string>& method = std::nullopt);

    /**
     * @brief The edges create_edges would write, without touching the store.
     */
    std::vector<MatchEdge> build_edges(const std::vector<ScoredMatch>& matches,
                                       const nlohmann::json& attributes, bool bidirectional,
                                       const std::string& method) const;

    /**
     * @brief Remove edges by method tag and/or timestamp cutoff (strictly older).
     * @throws ValidationError if neither criterion is given
     */
    size_t clear_edges(const std::optional<std::string>& method,
                       const std::optional<std::string>& older_than = std::nullopt);

    const EdgeCreationStats& statistics() const { return stats_; }
    const EdgeServiceOptions& options() const { return options_; }

private:
    Store& store_;
    EdgeServiceOptions options_;
    EdgeCreationStats stats_;
};

} // namespace Coalesce
