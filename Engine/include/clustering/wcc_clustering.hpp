/**
 * @file wcc_clustering.hpp
 * @brief Weakly connected components over match edges
 *
 * Union-find with path compression and union by size, one union per edge.
 * Output is canonical: members sorted within each cluster, clusters sorted
 * by smallest member, ids assigned by position. The same edge set always
 * yields the same clusters regardless of edge order.
 */

#pragma once

#include <export.hpp>
#include <model/entities.hpp>
#include <storage/store.hpp>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Coalesce {

struct ClusterStatistics {
    size_t total_clusters = 0;
    size_t total_entities_clustered = 0;
    size_t min_cluster_size = 0;
    size_t max_cluster_size = 0;
    double avg_cluster_size = 0.0;                  ///< rounded to 2 decimals
    std::map<std::string, size_t> size_distribution;   ///< "2", "3", "4-10", "11-50", "51+"
    size_t edges_processed = 0;
    size_t nodes_seen = 0;
    double execution_time_ms = 0.0;

    nlohmann::json to_json() const;
};

/// Histogram bucket for a cluster size.
std::string size_bucket(size_t size);

class COALESCE_API WccClustering {
public:
    /**
     * @throws ConfigurationError if min_cluster_size < 2
     */
    explicit WccClustering(size_t min_cluster_size = 2);

    std::vector<Cluster> cluster(const std::vector<std::pair<std::string, std::string>>& edges);
    std::vector<Cluster> cluster(const std::vector<MatchEdge>& edges);

    /// Statistics of the last cluster() call.
    const ClusterStatistics& statistics() const { return stats_; }

    static ClusterStatistics compute_statistics(const std::vector<Cluster>& clusters);

    size_t min_cluster_size() const { return min_cluster_size_; }

private:
    size_t min_cluster_size_;
    ClusterStatistics stats_;
};

struct ClusterValidation {
    bool valid = true;
    std::vector<std::string> issues;
};

/**
 * @brief Check that clusters do not overlap, respect the minimum size, and
 * that every edge has both endpoints in the same cluster (or neither
 * endpoint clustered).
 */
ClusterValidation validate_clusters(const std::vector<Cluster>& clusters, const std::vector<MatchEdge>& edges,
                                    size_t min_cluster_size);

struct ClusteringOptions {
    std::string edge_collection = "similar_to";
    std::string cluster_collection = "entity_clusters";
    size_t min_cluster_size = 2;
    std::optional<double> min_similarity;
    std::optional<std::string> edge_method;     ///< only edges with this method tag
    std::string method = "wcc_union_find";
};

/**
 * @brief Clusters the edges currently in the store and persists the result.
 */
class WccClusteringService {
public:
    WccClusteringService(Store& store, ClusteringOptions options);

    /**
     * @brief Read edges, cluster, and (optionally) replace stored clusters.
     */
    std::vector<Cluster> run(bool store_results = true);

    const ClusterStatistics& statistics() const { return engine_.statistics(); }

    /// Stored cluster containing @p member.
    std::optional<Cluster> cluster_of(const std::string& member);

    /// Validate stored clusters against stored edges.
    ClusterValidation validate();

private:
    EdgeFilter edge_filter() const;

    Store& store_;
    ClusteringOptions options_;
    WccClustering engine_;
};

} // namespace Coalesce
