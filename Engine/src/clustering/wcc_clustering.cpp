/**
 * @file wcc_clustering.cpp
 * @brief Union-find clustering of match edges
 */

#include <clustering/wcc_clustering.hpp>
#include <hashing/deterministic_keys.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cstdio>
#include <numeric>
#include <unordered_map>

namespace Coalesce {

namespace {

class UnionFind {
public:
    size_t add(const std::string& id) {
        auto [it, inserted] = index_.emplace(id, parent_.size());
        if (inserted) {
            parent_.push_back(parent_.size());
            size_.push_back(1);
            ids_.push_back(id);
        }
        return it->second;
    }

    size_t find(size_t x) {
        size_t root = x;
        while (parent_[root] != root) root = parent_[root];
        while (parent_[x] != root) {
            size_t next = parent_[x];
            parent_[x] = root;
            x = next;
        }
        return root;
    }

    void unite(size_t a, size_t b) {
        a = find(a);
        b = find(b);
        if (a == b) return;
        if (size_[a] < size_[b]) std::swap(a, b);
        parent_[b] = a;
        size_[a] += size_[b];
    }

    size_t size() const { return parent_.size(); }
    const std::string& id(size_t i) const { return ids_[i]; }

private:
    std::unordered_map<std::string, size_t> index_;
    std::vector<size_t> parent_;
    std::vector<size_t> size_;
    std::vector<std::string> ids_;
};

std::string cluster_id(size_t position) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "cluster_%06zu", position);
    return buf;
}

} // namespace

std::string size_bucket(size_t size) {
    if (size <= 3) return std::to_string(size);
    if (size <= 10) return "4-10";
    if (size <= 50) return "11-50";
    return "51+";
}

nlohmann::json ClusterStatistics::to_json() const {
    return {
        {"total_clusters", total_clusters},
        {"total_entities_clustered", total_entities_clustered},
        {"min_cluster_size", min_cluster_size},
        {"max_cluster_size", max_cluster_size},
        {"avg_cluster_size", avg_cluster_size},
        {"size_distribution", size_distribution},
        {"edges_processed", edges_processed},
        {"nodes_seen", nodes_seen},
        {"execution_time_ms", execution_time_ms}
    };
}

// ============================================================================
// WccClustering
// ============================================================================

WccClustering::WccClustering(size_t min_cluster_size) : min_cluster_size_(min_cluster_size) {
    if (min_cluster_size_ < 2) {
        throw ConfigurationError("min_cluster_size must be at least 2");
    }
}

std::vector<Cluster> WccClustering::cluster(const std::vector<std::pair<std::string, std::string>>& edges) {
    Timer timer;
    UnionFind uf;

    for (const auto& [a, b] : edges) {
        size_t ia = uf.add(a);
        size_t ib = uf.add(b);
        uf.unite(ia, ib);
    }

    std::unordered_map<size_t, std::vector<std::string>> components;
    for (size_t i = 0; i < uf.size(); ++i) {
        components[uf.find(i)].push_back(uf.id(i));
    }

    std::vector<Cluster> clusters;
    for (auto& [root, members] : components) {
        if (members.size() < min_cluster_size_) continue;
        std::sort(members.begin(), members.end());
        Cluster c;
        c.members = std::move(members);
        clusters.push_back(std::move(c));
    }

    std::sort(clusters.begin(), clusters.end(), [](const Cluster& a, const Cluster& b) {
        return a.members.front() < b.members.front();
    });

    for (size_t i = 0; i < clusters.size(); ++i) {
        clusters[i].id = cluster_id(i);
        clusters[i].content_key = member_set_key(clusters[i].members);
    }

    stats_ = compute_statistics(clusters);
    stats_.edges_processed = edges.size();
    stats_.nodes_seen = uf.size();
    stats_.execution_time_ms = timer.elapsed_ms();

    Logger::info("WCC: " + std::to_string(stats_.total_clusters) + " clusters covering " +
                 std::to_string(stats_.total_entities_clustered) + " entities from " +
                 std::to_string(edges.size()) + " edges");
    return clusters;
}

std::vector<Cluster> WccClustering::cluster(const std::vector<MatchEdge>& edges) {
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve(edges.size());
    for (const auto& e : edges) pairs.emplace_back(e.from_id, e.to_id);
    return cluster(pairs);
}

ClusterStatistics WccClustering::compute_statistics(const std::vector<Cluster>& clusters) {
    ClusterStatistics s;
    s.total_clusters = clusters.size();
    if (clusters.empty()) return s;

    s.min_cluster_size = clusters.front().size();
    for (const auto& c : clusters) {
        s.total_entities_clustered += c.size();
        s.min_cluster_size = std::min(s.min_cluster_size, c.size());
        s.max_cluster_size = std::max(s.max_cluster_size, c.size());
        ++s.size_distribution[size_bucket(c.size())];
    }
    s.avg_cluster_size = round_to(static_cast<double>(s.total_entities_clustered) / s.total_clusters, 2);
    return s;
}

ClusterValidation validate_clusters(const std::vector<Cluster>& clusters, const std::vector<MatchEdge>& edges,
                                    size_t min_cluster_size) {
    ClusterValidation v;
    std::unordered_map<std::string, std::string> owner;

    for (const auto& c : clusters) {
        if (c.size() < min_cluster_size) {
            v.issues.push_back(c.id + " has " + std::to_string(c.size()) + " members, below minimum " +
                               std::to_string(min_cluster_size));
        }
        for (const auto& m : c.members) {
            auto [it, inserted] = owner.emplace(m, c.id);
            if (!inserted) {
                v.issues.push_back(m + " belongs to both " + it->second + " and " + c.id);
            }
        }
    }

    for (const auto& e : edges) {
        auto a = owner.find(e.from_id);
        auto b = owner.find(e.to_id);
        const bool a_in = a != owner.end();
        const bool b_in = b != owner.end();
        if (a_in != b_in || (a_in && a->second != b->second)) {
            v.issues.push_back("edge " + e.from_id + " -> " + e.to_id + " crosses clusters");
        }
    }

    v.valid = v.issues.empty();
    return v;
}

// ============================================================================
// WccClusteringService
// ============================================================================

WccClusteringService::WccClusteringService(Store& store, ClusteringOptions options)
    : store_(store), options_(std::move(options)), engine_(options_.min_cluster_size) {
    validate_identifier(options_.edge_collection, "edge collection");
    validate_identifier(options_.cluster_collection, "cluster collection");
    if (options_.min_similarity && (*options_.min_similarity < 0.0 || *options_.min_similarity > 1.0)) {
        throw ConfigurationError("clustering min_similarity must be in [0, 1]");
    }
}

EdgeFilter WccClusteringService::edge_filter() const {
    EdgeFilter f;
    f.method = options_.edge_method;
    f.min_similarity = options_.min_similarity;
    return f;
}

std::vector<Cluster> WccClusteringService::run(bool store_results) {
    auto edges = store_.fetch_edges(options_.edge_collection, edge_filter());
    auto clusters = engine_.cluster(edges);

    const std::string now = utc_timestamp();
    for (auto& c : clusters) {
        c.method = options_.method;
        c.timestamp = now;
    }

    if (store_results) {
        store_.replace_clusters(options_.cluster_collection, clusters);
        Logger::success("Stored " + std::to_string(clusters.size()) + " clusters in " + options_.cluster_collection);
    }
    return clusters;
}

std::optional<Cluster> WccClusteringService::cluster_of(const std::string& member) {
    for (auto& c : store_.fetch_clusters(options_.cluster_collection)) {
        if (std::binary_search(c.members.begin(), c.members.end(), member)) return c;
    }
    return std::nullopt;
}

ClusterValidation WccClusteringService::validate() {
    auto clusters = store_.fetch_clusters(options_.cluster_collection);
    auto edges = store_.fetch_edges(options_.edge_collection, edge_filter());
    auto result = validate_clusters(clusters, edges, options_.min_cluster_size);
    if (!result.valid) {
        Logger::warn("Cluster validation found " + std::to_string(result.issues.size()) + " issues");
    }
    return result;
}

} // namespace Coalesce
