#include <persistence/similarity_edge_service.hpp>
#include <hashing/deterministic_keys.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>

namespace Coalesce {

nlohmann::json EdgeCreationStats::to_json() const {
    return {
        {"edges_requested", edges_requested},
        {"edges_created", edges_created},
        {"batches_processed", batches_processed},
        {"batches_failed", batches_failed},
        {"edges_failed", edges_failed},
        {"avg_batch_size", avg_batch_size},
        {"execution_time_ms", execution_time_ms},
        {"edges_per_second", edges_per_second}
    };
}

SimilarityEdgeService::SimilarityEdgeService(Store& store, EdgeServiceOptions options)
    : store_(store), options_(std::move(options)) {
    validate_identifier(options_.edge_collection, "edge collection");
    if (options_.batch_size == 0) {
        throw ConfigurationError("edge batch_size must be positive");
    }
    if (options_.method.empty()) {
        throw ConfigurationError("edge method tag must not be empty");
    }
}

std::vector<MatchEdge> SimilarityEdgeService::build_edges(const std::vector<ScoredMatch>& matches,
                                                          const nlohmann::json& attributes, bool bidirectional,
                                                          const std::string& method) const {
    const std::string now = utc_timestamp();
    std::vector<MatchEdge> edges;
    edges.reserve(matches.size() * (bidirectional ? 2 : 1));

    for (const auto& m : matches) {
        if (m.first_id.empty() || m.second_id.empty() || m.first_id == m.second_id) {
            throw ValidationError("match endpoints must be two distinct non-empty ids");
        }

        MatchEdge e;
        e.key = edge_key(m.first_id, m.second_id);
        e.from_id = m.first_id;
        e.to_id = m.second_id;
        e.similarity = round_to(m.similarity, 4);
        e.method = method;
        e.timestamp = now;
        e.attributes = attributes.is_object() ? attributes : nlohmann::json::object();
        for (auto it = m.attributes.begin(); it != m.attributes.end(); ++it) {
            e.attributes[it.key()] = it.value();
        }

        if (bidirectional) {
            MatchEdge reverse = e;
            std::swap(reverse.from_id, reverse.to_id);
            reverse.reverse = true;
            edges.push_back(std::move(e));
            edges.push_back(std::move(reverse));
        } else {
            edges.push_back(std::move(e));
        }
    }
    return edges;
}

EdgeCreationStats SimilarityEdgeService::create_edges(const std::vector<ScoredMatch>& matches,
                                                      const nlohmann::json& attributes, bool bidirectional,
                                                      const std::optional<std::string>& method) {
    Timer timer;
    stats_ = EdgeCreationStats{};

    const auto edges = build_edges(matches, attributes, bidirectional, method.value_or(options_.method));
    stats_.edges_requested = edges.size();

    size_t attempted = 0;
    for (size_t start = 0; start < edges.size(); start += options_.batch_size) {
        const size_t end = std::min(edges.size(), start + options_.batch_size);
        std::vector<MatchEdge> batch(edges.begin() + start, edges.begin() + end);
        attempted += batch.size();

        try {
            stats_.edges_created += store_.insert_edges(options_.edge_collection, batch, true);
            ++stats_.batches_processed;
        } catch (const StorageError& e) {
            ++stats_.batches_failed;
            stats_.edges_failed += batch.size();
            Logger::error("Edge batch " + std::to_string(start / options_.batch_size) + " (" +
                          std::to_string(batch.size()) + " edges) failed: " + e.what());
        }
    }

    const size_t batches = stats_.batches_processed + stats_.batches_failed;
    stats_.avg_batch_size = batches > 0 ? round_to(static_cast<double>(attempted) / batches, 2) : 0.0;
    stats_.execution_time_ms = timer.elapsed_ms();
    stats_.edges_per_second = stats_.execution_time_ms > 0.0
        ? round_to(stats_.edges_created / (stats_.execution_time_ms / 1000.0), 2)
        : 0.0;

    Logger::success("Created " + std::to_string(stats_.edges_created) + " edges in " +
                    options_.edge_collection + " (" + std::to_string(stats_.batches_failed) + " batches failed)");
    return stats_;
}

size_t SimilarityEdgeService::clear_edges(const std::optional<std::string>& method,
                                          const std::optional<std::string>& older_than) {
    if (!method && !older_than) {
        throw ValidationError("clear_edges requires a method tag or an age cutoff");
    }

    EdgeFilter filter;
    filter.method = method;
    filter.older_than = older_than;

    const size_t removed = store_.remove_edges(options_.edge_collection, filter);
    Logger::info("Removed " + std::to_string(removed) + " edges from " + options_.edge_collection);
    return removed;
}

} // namespace Coalesce
