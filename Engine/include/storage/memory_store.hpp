/**
 * @file memory_store.hpp
 * @brief In-process Store used by tests, tools and small runs
 */

#pragma once

#include <export.hpp>
#include <storage/store.hpp>
#include <map>
#include <mutex>

namespace Coalesce {

/**
 * @brief Store backed by ordered maps.
 *
 * native_vector_search is available only when constructed with a non-empty
 * engine version; otherwise it throws StorageError like an engine without
 * vector support would. All methods are virtual so tests can inject faults.
 */
class COALESCE_API MemoryStore : public Store {
public:
    MemoryStore() = default;
    explicit MemoryStore(VectorEngineInfo engine);

    std::optional<Record> fetch_record(const std::string& collection, const std::string& id) override;
    std::vector<Record> fetch_records(const std::string& collection, const std::vector<RecordFilter>& filters,
                                      size_t offset, size_t limit) override;
    size_t count_records(const std::string& collection) override;
    std::optional<std::vector<double>> fetch_vector(const std::string& collection, const std::string& id,
                                                    const std::string& field) override;
    size_t upsert_records(const std::string& collection, const std::vector<Record>& records) override;
    size_t update_records(const std::string& collection, const std::vector<RecordPatch>& patches) override;

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

    void set_vector_engine(VectorEngineInfo engine);

private:
    using EdgeIdentity = std::pair<std::string, bool>;

    struct EdgeCollection {
        std::vector<MatchEdge> edges;           // insertion order
        std::map<EdgeIdentity, size_t> index;   // identity -> position in edges
    };

    void reindex(EdgeCollection& ec);

    std::mutex mutex_;
    VectorEngineInfo engine_;
    std::map<std::string, std::map<std::string, Record>> records_;
    std::map<std::string, EdgeCollection> edges_;
    std::map<std::string, std::vector<Cluster>> clusters_;
    std::map<std::string, std::map<std::string, GoldenRecord>> golden_;
};

} // namespace Coalesce
