/**
 * @file node2vec.hpp
 * @brief node2vec-style graph embeddings from the match graph
 *
 * Biased second-order random walks -> windowed co-occurrence counts ->
 * truncated SVD. Embeddings are written back onto records so vector and
 * LSH blocking can use them on the next run.
 */

#pragma once

#include <export.hpp>
#include <storage/store.hpp>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace Coalesce {

struct Node2VecParams {
    int dimensions = 64;
    int walk_length = 10;
    int num_walks = 10;         ///< walks started from every node
    int window_size = 5;
    double p = 1.0;             ///< return parameter
    double q = 1.0;             ///< in-out parameter
    uint64_t seed = 42;
    bool directed = false;
};

/**
 * @brief Hard caps raise SafetyLimitExceeded; warn thresholds only log.
 */
struct Node2VecLimits {
    size_t max_nodes = 5000;
    size_t warn_nodes_threshold = 2000;
    size_t max_dimensions = 512;
    size_t max_edges_fetched = 200000;
    size_t warn_edges_threshold = 50000;
};

struct WeightedEdge {
    std::string from;
    std::string to;
    std::optional<double> weight;   ///< 1.0 when absent
};

struct EmbeddingMetadata {
    std::string method = "node2vec_svd";
    int dimensions = 0;             ///< after clamping to the node count
    int requested_dimensions = 0;
    int walk_length = 0;
    int num_walks = 0;
    int window_size = 0;
    double p = 1.0;
    double q = 1.0;
    uint64_t seed = 0;
    bool directed = false;

    nlohmann::json to_json() const;
};

struct EmbeddingResult {
    std::map<std::string, std::vector<double>> vectors;
    EmbeddingMetadata metadata;
    size_t node_count = 0;
    size_t walk_count = 0;
};

class COALESCE_API Node2VecTrainer {
public:
    /**
     * @throws ConfigurationError for non-positive sizes or p / q
     * @throws SafetyLimitExceeded if dimensions exceed max_dimensions
     */
    explicit Node2VecTrainer(Node2VecParams params, Node2VecLimits limits = {});

    /**
     * @brief Embed every node touched by @p edges.
     *
     * Empty input yields an empty map. Vectors have min(dimensions, nodes)
     * components and unit length unless they are all zero.
     * @throws SafetyLimitExceeded if the graph has more than max_nodes nodes
     */
    EmbeddingResult train(const std::vector<WeightedEdge>& edges) const;

    const Node2VecParams& params() const { return params_; }
    const Node2VecLimits& limits() const { return limits_; }

private:
    Node2VecParams params_;
    Node2VecLimits limits_;
};

/**
 * @brief Store-facing half: read the match graph, write embeddings back.
 */
class GraphEmbeddingService {
public:
    explicit GraphEmbeddingService(Store& store, Node2VecLimits limits = {});

    /**
     * @brief Read edges as weighted graph edges.
     *
     * limit 0 means "up to max_edges_fetched" (logged). Reverse halves of
     * bidirectional edges are skipped. Weight comes from attributes["weight"],
     * else the edge similarity when positive, else 1.0.
     * @throws SafetyLimitExceeded if limit > max_edges_fetched
     */
    std::vector<WeightedEdge> fetch_edges(const std::string& edge_collection, size_t limit = 0,
                                          std::optional<double> min_similarity = std::nullopt,
                                          std::optional<std::string> method = std::nullopt);

    /**
     * @brief Store each vector in @p field and the metadata in field + "_meta".
     * @return Number of records updated
     */
    size_t write_embeddings(const std::string& collection, const EmbeddingResult& result,
                            const std::string& field = "node_embedding", size_t batch_size = 1000);

private:
    Store& store_;
    Node2VecLimits limits_;
};

} // namespace Coalesce
