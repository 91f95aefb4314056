/**
 * @file node2vec.cpp
 * @brief Random walks + co-occurrence SVD graph embeddings
 */

#include <embedding/node2vec.hpp>
#include <similarity/vector_math.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <Eigen/Dense>
#include <Eigen/SVD>
#include <algorithm>
#include <random>
#include <unordered_map>

namespace Coalesce {

nlohmann::json EmbeddingMetadata::to_json() const {
    return {
        {"method", method},
        {"dimensions", dimensions},
        {"requested_dimensions", requested_dimensions},
        {"walk_length", walk_length},
        {"num_walks", num_walks},
        {"window_size", window_size},
        {"p", p},
        {"q", q},
        {"seed", seed},
        {"directed", directed}
    };
}

// ============================================================================
// Node2VecTrainer
// ============================================================================

Node2VecTrainer::Node2VecTrainer(Node2VecParams params, Node2VecLimits limits)
    : params_(params), limits_(limits) {
    if (params_.dimensions <= 0) throw ConfigurationError("node2vec dimensions must be positive");
    if (params_.walk_length <= 0) throw ConfigurationError("node2vec walk_length must be positive");
    if (params_.num_walks <= 0) throw ConfigurationError("node2vec num_walks must be positive");
    if (params_.window_size <= 0) throw ConfigurationError("node2vec window_size must be positive");
    if (!(params_.p > 0.0) || !(params_.q > 0.0)) {
        throw ConfigurationError("node2vec p and q must be positive");
    }
    if (static_cast<size_t>(params_.dimensions) > limits_.max_dimensions) {
        throw SafetyLimitExceeded("max_dimensions",
            "requested " + std::to_string(params_.dimensions) +
            " dimensions, max_dimensions is " + std::to_string(limits_.max_dimensions));
    }
}

namespace {

using Adjacency = std::vector<std::vector<std::pair<int, double>>>;   // sorted by neighbour index

bool is_neighbour(const Adjacency& adj, int from, int to) {
    const auto& nbrs = adj[from];
    auto it = std::lower_bound(nbrs.begin(), nbrs.end(), std::make_pair(to, -1.0),
                               [](const auto& a, const auto& b) { return a.first < b.first; });
    return it != nbrs.end() && it->first == to;
}

int sample(const std::vector<double>& weights, std::mt19937_64& rng) {
    double total = 0.0;
    for (double w : weights) total += w;
    std::uniform_real_distribution<double> uniform(0.0, total);
    double r = uniform(rng);
    for (size_t i = 0; i < weights.size(); ++i) {
        r -= weights[i];
        if (r < 0.0) return static_cast<int>(i);
    }
    return static_cast<int>(weights.size()) - 1;
}

} // namespace

EmbeddingResult Node2VecTrainer::train(const std::vector<WeightedEdge>& edges) const {
    Timer timer;
    EmbeddingResult result;
    result.metadata.requested_dimensions = params_.dimensions;
    result.metadata.walk_length = params_.walk_length;
    result.metadata.num_walks = params_.num_walks;
    result.metadata.window_size = params_.window_size;
    result.metadata.p = params_.p;
    result.metadata.q = params_.q;
    result.metadata.seed = params_.seed;
    result.metadata.directed = params_.directed;

    if (edges.empty()) return result;

    // Sorted node list gives a stable index independent of edge order
    std::vector<std::string> nodes;
    nodes.reserve(edges.size() * 2);
    for (const auto& e : edges) {
        nodes.push_back(e.from);
        nodes.push_back(e.to);
    }
    std::sort(nodes.begin(), nodes.end());
    nodes.erase(std::unique(nodes.begin(), nodes.end()), nodes.end());

    const size_t n = nodes.size();
    if (n > limits_.max_nodes) {
        throw SafetyLimitExceeded("max_nodes",
            "graph has " + std::to_string(n) + " nodes, max_nodes is " + std::to_string(limits_.max_nodes));
    }
    if (n > limits_.warn_nodes_threshold) {
        Logger::warn("node2vec: " + std::to_string(n) + " nodes exceeds warn threshold " +
                     std::to_string(limits_.warn_nodes_threshold));
    }

    std::unordered_map<std::string, int> index;
    for (size_t i = 0; i < n; ++i) index[nodes[i]] = static_cast<int>(i);

    // Duplicate edges accumulate weight
    std::vector<std::map<int, double>> weights(n);
    for (const auto& e : edges) {
        if (e.from == e.to) continue;
        const double w = e.weight.value_or(1.0);
        if (!(w > 0.0)) continue;
        const int a = index[e.from];
        const int b = index[e.to];
        weights[a][b] += w;
        if (!params_.directed) weights[b][a] += w;
    }

    Adjacency adj(n);
    for (size_t i = 0; i < n; ++i) {
        adj[i].assign(weights[i].begin(), weights[i].end());
    }

    // ---- biased walks ----
    std::mt19937_64 rng(params_.seed);
    std::vector<std::vector<int>> walks;
    walks.reserve(n * static_cast<size_t>(params_.num_walks));
    std::vector<double> probs;

    for (int iter = 0; iter < params_.num_walks; ++iter) {
        for (size_t start = 0; start < n; ++start) {
            std::vector<int> walk;
            walk.reserve(params_.walk_length);
            walk.push_back(static_cast<int>(start));

            while (static_cast<int>(walk.size()) < params_.walk_length) {
                const int cur = walk.back();
                const auto& nbrs = adj[cur];
                if (nbrs.empty()) break;

                probs.clear();
                if (walk.size() == 1) {
                    for (const auto& [next, w] : nbrs) probs.push_back(w);
                } else {
                    const int prev = walk[walk.size() - 2];
                    for (const auto& [next, w] : nbrs) {
                        if (next == prev) probs.push_back(w / params_.p);
                        else if (is_neighbour(adj, prev, next)) probs.push_back(w);
                        else probs.push_back(w / params_.q);
                    }
                }
                walk.push_back(nbrs[sample(probs, rng)].first);
            }
            walks.push_back(std::move(walk));
        }
    }
    result.walk_count = walks.size();

    // ---- co-occurrence ----
    Eigen::MatrixXd cooc = Eigen::MatrixXd::Zero(n, n);
    for (const auto& walk : walks) {
        const int len = static_cast<int>(walk.size());
        for (int i = 0; i < len; ++i) {
            const int lo = std::max(0, i - params_.window_size);
            const int hi = std::min(len - 1, i + params_.window_size);
            for (int j = lo; j <= hi; ++j) {
                if (j != i) cooc(walk[i], walk[j]) += 1.0;
            }
        }
    }
    cooc = 0.5 * (cooc + cooc.transpose()).eval();

    const int dim = std::min(params_.dimensions, static_cast<int>(n));
    result.metadata.dimensions = dim;
    result.node_count = n;

    Eigen::MatrixXd embedding;
    if ((cooc.array() == 0.0).all()) {
        embedding = Eigen::MatrixXd::Zero(n, dim);
    } else {
        Eigen::BDCSVD<Eigen::MatrixXd> svd(cooc, Eigen::ComputeThinU);
        Eigen::VectorXd scale = svd.singularValues().head(dim).cwiseSqrt();
        embedding = svd.matrixU().leftCols(dim) * scale.asDiagonal();
    }

    for (size_t i = 0; i < n; ++i) {
        Eigen::VectorXd row = embedding.row(i).transpose();
        const double norm = row.norm();
        if (norm >= MIN_VECTOR_MAGNITUDE) row /= norm;
        result.vectors[nodes[i]] = std::vector<double>(row.data(), row.data() + row.size());
    }

    Logger::info("node2vec: embedded " + std::to_string(n) + " nodes into " + std::to_string(dim) +
                 " dimensions from " + std::to_string(walks.size()) + " walks in " +
                 std::to_string(static_cast<long>(timer.elapsed_ms())) + " ms");
    return result;
}

// ============================================================================
// GraphEmbeddingService
// ============================================================================

GraphEmbeddingService::GraphEmbeddingService(Store& store, Node2VecLimits limits)
    : store_(store), limits_(limits) {}

std::vector<WeightedEdge> GraphEmbeddingService::fetch_edges(const std::string& edge_collection, size_t limit,
                                                             std::optional<double> min_similarity,
                                                             std::optional<std::string> method) {
    validate_identifier(edge_collection, "edge collection");

    if (limit > limits_.max_edges_fetched) {
        throw SafetyLimitExceeded("max_edges_fetched",
            "requested " + std::to_string(limit) + " edges, max_edges_fetched is " +
            std::to_string(limits_.max_edges_fetched));
    }
    if (limit == 0) {
        limit = limits_.max_edges_fetched;
        Logger::info("node2vec: no edge limit given, capping at max_edges_fetched=" + std::to_string(limit));
    }

    EdgeFilter filter;
    filter.method = std::move(method);
    filter.min_similarity = min_similarity;

    std::vector<WeightedEdge> out;
    for (const auto& e : store_.fetch_edges(edge_collection, filter)) {
        if (e.reverse) continue;
        if (out.size() >= limit) {
            Logger::warn("node2vec: edge fetch truncated at " + std::to_string(limit) + " edges");
            break;
        }

        WeightedEdge w;
        w.from = e.from_id;
        w.to = e.to_id;
        auto wit = e.attributes.find("weight");
        if (wit != e.attributes.end() && wit->is_number()) w.weight = wit->get<double>();
        else if (e.similarity > 0.0) w.weight = e.similarity;
        out.push_back(std::move(w));
    }

    if (out.size() > limits_.warn_edges_threshold) {
        Logger::warn("node2vec: " + std::to_string(out.size()) + " edges exceeds warn threshold " +
                     std::to_string(limits_.warn_edges_threshold));
    }
    return out;
}

size_t GraphEmbeddingService::write_embeddings(const std::string& collection, const EmbeddingResult& result,
                                               const std::string& field, size_t batch_size) {
    validate_identifier(collection, "collection");
    validate_identifier(field, "embedding field");
    validate_identifier(field + "_meta", "embedding metadata field");
    if (batch_size == 0) throw ValidationError("batch_size must be positive");

    const nlohmann::json meta = result.metadata.to_json();
    size_t updated = 0;
    std::vector<RecordPatch> batch;
    batch.reserve(batch_size);

    for (const auto& [id, vec] : result.vectors) {
        batch.emplace_back(id, nlohmann::json{{field, vec}, {field + "_meta", meta}});
        if (batch.size() >= batch_size) {
            updated += store_.update_records(collection, batch);
            batch.clear();
        }
    }
    if (!batch.empty()) updated += store_.update_records(collection, batch);

    if (updated < result.vectors.size()) {
        Logger::warn("node2vec: " + std::to_string(result.vectors.size() - updated) +
                     " embedded nodes have no record in " + collection);
    }
    Logger::success("Wrote " + std::to_string(updated) + " embeddings to " + collection + "." + field);
    return updated;
}

} // namespace Coalesce
