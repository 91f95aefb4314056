/**
 * @file store.hpp
 * @brief Record/graph store interface consumed by every engine component
 *
 * The engine owns no storage. Components receive a Store reference at
 * construction and only issue the reads and writes below. Implementations
 * report failures as StorageError and never retry internally.
 */

#pragma once

#include <model/entities.hpp>
#include <model/record.hpp>
#include <model/record_filter.hpp>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Coalesce {

/**
 * @brief Vector engine reported by the store ({"pgvector", "0.7.0"}).
 *
 * An empty version means the store cannot execute native vector search.
 */
struct VectorEngineInfo {
    std::string name;
    std::string version;
};

/**
 * @brief Declarative nearest-neighbour query handed to the store engine.
 */
struct VectorQuery {
    std::string collection;
    std::string embedding_field;
    std::vector<double> vector;
    double threshold = 0.0;             ///< inclusive lower bound on cosine similarity
    size_t limit = 10;
    std::optional<std::string> exclude_id;
    std::optional<std::string> blocking_field;
    nlohmann::json blocking_value;      ///< compared with blocking_field when set
    std::vector<RecordFilter> filters;
};

struct VectorMatch {
    std::string id;
    double similarity = 0.0;
    std::string method;
};

/**
 * @brief Selection of edges for fetch / remove.
 */
struct EdgeFilter {
    std::optional<std::string> method;
    std::optional<std::string> older_than;      ///< ISO-8601; strictly earlier timestamps match
    std::optional<double> min_similarity;
    size_t limit = 0;                           ///< 0 = unlimited

    bool matches(const MatchEdge& edge) const {
        if (method && edge.method != *method) return false;
        if (older_than && !(edge.timestamp < *older_than)) return false;
        if (min_similarity && edge.similarity < *min_similarity) return false;
        return true;
    }
};

using RecordPatch = std::pair<std::string, nlohmann::json>;

class Store {
public:
    virtual ~Store() = default;

    // ------------------------------------------------------------------
    // Records
    // ------------------------------------------------------------------

    virtual std::optional<Record> fetch_record(const std::string& collection, const std::string& id) = 0;

    /**
     * @brief Page of records matching all filters, ordered by id.
     */
    virtual std::vector<Record> fetch_records(const std::string& collection,
                                              const std::vector<RecordFilter>& filters,
                                              size_t offset, size_t limit) = 0;

    virtual size_t count_records(const std::string& collection) = 0;

    virtual std::optional<std::vector<double>> fetch_vector(const std::string& collection,
                                                            const std::string& id,
                                                            const std::string& field) = 0;

    /// Insert or replace whole records.
    virtual size_t upsert_records(const std::string& collection, const std::vector<Record>& records) = 0;

    /**
     * @brief Merge each JSON object patch into the named record's fields.
     * @return Number of records that existed and were updated
     */
    virtual size_t update_records(const std::string& collection, const std::vector<RecordPatch>& patches) = 0;

    // ------------------------------------------------------------------
    // Native vector search
    // ------------------------------------------------------------------

    virtual VectorEngineInfo vector_engine() = 0;

    /**
     * @brief Execute a similarity query inside the engine.
     *
     * Results are sorted by similarity descending. Throws StorageError when
     * the engine cannot run the query.
     */
    virtual std::vector<VectorMatch> native_vector_search(const VectorQuery& query) = 0;

    // ------------------------------------------------------------------
    // Edges
    // ------------------------------------------------------------------

    /**
     * @brief Batch insert. Identity is (key, reverse).
     *
     * With ignore_on_conflict an existing identity is left untouched,
     * otherwise it is overwritten.
     * @return Number of edges newly created
     */
    virtual size_t insert_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                                bool ignore_on_conflict) = 0;

    virtual std::vector<MatchEdge> fetch_edges(const std::string& collection, const EdgeFilter& filter) = 0;

    virtual size_t remove_edges(const std::string& collection, const EdgeFilter& filter) = 0;

    // ------------------------------------------------------------------
    // Clusters and golden records
    // ------------------------------------------------------------------

    /// Truncate the cluster collection and write the given clusters.
    virtual void replace_clusters(const std::string& collection, const std::vector<Cluster>& clusters) = 0;

    virtual std::vector<Cluster> fetch_clusters(const std::string& collection) = 0;

    /**
     * @brief Upsert keyed by GoldenRecord::key (update on conflict).
     * @return Number of records written
     */
    virtual size_t upsert_golden_records(const std::string& collection,
                                         const std::vector<GoldenRecord>& records) = 0;

    virtual std::vector<GoldenRecord> fetch_golden_records(const std::string& collection) = 0;
};

} // namespace Coalesce
