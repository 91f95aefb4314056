/**
 * @file postgres_store.hpp
 * @brief Store over PostgreSQL (jsonb records, pgvector for native search)
 *
 * Layout, all inside one schema (default "coalesce"):
 *   records        (collection, id)                 -> fields jsonb
 *   edges          (collection, edge_key, reverse)  -> endpoints, similarity, method, created_at, attributes
 *   clusters       (collection, cluster_id)         -> content_key, members jsonb
 *   golden_records (collection, golden_key)         -> merged document
 *
 * Batch writes go through BulkCopy (COPY into a temp table, then INSERT ...
 * ON CONFLICT). Native vector search casts the stored JSON array to
 * pgvector's vector type and ranks by cosine distance.
 */

#pragma once

#include <export.hpp>
#include <database/postgres_connection.hpp>
#include <storage/store.hpp>

namespace Coalesce {

class COALESCE_API PostgresStore : public Store {
public:
    /**
     * @param conn Must outlive the store
     * @param schema Created (with its tables) if missing
     */
    explicit PostgresStore(PostgresConnection& conn, std::string schema = "coalesce");

    std::optional<Record> fetch_record(const std::string& collection, const std::string& id) override;
    std::vector<Record> fetch_records(const std::string& collection, const std::vector<RecordFilter>& filters,
                                      size_t offset, size_t limit) override;
    size_t count_records(const std::string& collection) override;
    std::optional<std::vector<double>> fetch_vector(const std::string& collection, const std::string& id,
                                                    const std::string& field) override;
    size_t upsert_records(const std::string& collection, const std::vector<Record>& records) override;
    size_t update_records(const std::string& collection, const std::vector<RecordPatch>& patches) override;

    /// {"pgvector", extversion}, or an empty version when the extension is absent.
    VectorEngineInfo vector_engine() override;
    std::vector<VectorMatch> native_vector_search(const VectorQuery& query) override;

    size_t insert_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                        bool ignore_on_conflict) override;
    std::vector<MatchEdge> fetch_edges(const std::string& collection, const EdgeFilter& filter) override;
    size_t remove_edges(const std::string& collection, const EdgeFilter& filter) override;

    void replace_clusters(const std::string& collection, const std::vector<Cluster>& clusters) override;
    std::vector<Cluster> fetch_clusters(const std::string& collection) override;

    size_t upsert_golden_records(const std::string& collection, const std::vector<GoldenRecord>& records) override;
    std::vector<GoldenRecord> fetch_golden_records(const std::string& collection) override;

    const std::string& schema() const { return schema_; }

private:
    void ensure_schema();
    std::string table(const char* name) const;
    void copy_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                    const std::string& conflict_clause, size_t& inserted);

    PostgresConnection& conn_;
    std::string schema_;
};

} // namespace Coalesce
