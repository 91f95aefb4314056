/**
 * @file golden_record_service.hpp
 * @brief Golden records and resolved_to edges for a cluster set
 *
 * Golden records are keyed by the hash of their sorted member ids and
 * upserted; resolved_to edges (member -> golden record) have deterministic
 * keys and are inserted with ignore-on-conflict. Re-running over the same
 * clusters therefore creates nothing new.
 */

#pragma once

#include <model/entities.hpp>
#include <persistence/merge_policy.hpp>
#include <storage/store.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace Coalesce {

struct GoldenRecordOptions {
    std::string record_collection;
    std::string golden_collection = "golden_records";
    std::string resolved_edge_collection = "resolved_to";
    std::string method = "golden_record_v1";
    size_t batch_size = 500;
};

struct GoldenRecordStats {
    size_t clusters_processed = 0;
    size_t clusters_skipped = 0;        ///< no member record found
    size_t members_missing = 0;
    size_t golden_records_upserted = 0;
    size_t resolved_edges_upserted = 0; ///< newly created edges
    double execution_time_ms = 0.0;

    nlohmann::json to_json() const;
};

class GoldenRecordService {
public:
    /**
     * @param policy Must outlive the service
     */
    GoldenRecordService(Store& store, const FieldMergePolicy& policy, GoldenRecordOptions options);

    GoldenRecordStats run(const std::vector<Cluster>& clusters, const std::string& run_id);

    /**
     * @brief Golden record for one cluster from already-fetched member records.
     */
    GoldenRecord build(const Cluster& cluster, const std::vector<Record>& members, const std::string& run_id) const;

private:
    void flush(std::vector<GoldenRecord>& golden, std::vector<MatchEdge>& edges, GoldenRecordStats& stats);

    Store& store_;
    const FieldMergePolicy& policy_;
    GoldenRecordOptions options_;
};

} // namespace Coalesce
