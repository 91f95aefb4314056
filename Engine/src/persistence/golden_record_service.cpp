#include <persistence/golden_record_service.hpp>
#include <hashing/deterministic_keys.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>

namespace Coalesce {

nlohmann::json GoldenRecordStats::to_json() const {
    return {
        {"clusters_processed", clusters_processed},
        {"clusters_skipped", clusters_skipped},
        {"members_missing", members_missing},
        {"golden_records_upserted", golden_records_upserted},
        {"resolved_edges_upserted", resolved_edges_upserted},
        {"execution_time_ms", execution_time_ms}
    };
}

GoldenRecordService::GoldenRecordService(Store& store, const FieldMergePolicy& policy, GoldenRecordOptions options)
    : store_(store), policy_(policy), options_(std::move(options)) {
    validate_identifier(options_.record_collection, "record collection");
    validate_identifier(options_.golden_collection, "golden collection");
    validate_identifier(options_.resolved_edge_collection, "resolved edge collection");
    if (options_.batch_size == 0) {
        throw ConfigurationError("golden record batch_size must be positive");
    }
}

GoldenRecord GoldenRecordService::build(const Cluster& cluster, const std::vector<Record>& members,
                                        const std::string& run_id) const {
    GoldenRecord g;
    g.member_ids = cluster.members;
    g.key = member_set_key(cluster.members);
    g.cluster_id = cluster.id;
    g.run_id = run_id;
    g.method = options_.method;
    g.timestamp = utc_timestamp();

    MergeResult merged = policy_.merge(members);
    g.fields = std::move(merged.fields);
    g.provenance = std::move(merged.provenance);
    g.merge_policy = policy_.name();
    return g;
}

void GoldenRecordService::flush(std::vector<GoldenRecord>& golden, std::vector<MatchEdge>& edges,
                                GoldenRecordStats& stats) {
    if (!golden.empty()) {
        stats.golden_records_upserted += store_.upsert_golden_records(options_.golden_collection, golden);
        golden.clear();
    }
    if (!edges.empty()) {
        stats.resolved_edges_upserted += store_.insert_edges(options_.resolved_edge_collection, edges, true);
        edges.clear();
    }
}

GoldenRecordStats GoldenRecordService::run(const std::vector<Cluster>& clusters, const std::string& run_id) {
    Timer timer;
    GoldenRecordStats stats;
    std::vector<GoldenRecord> golden;
    std::vector<MatchEdge> edges;

    for (const auto& cluster : clusters) {
        std::vector<Record> members;
        members.reserve(cluster.members.size());
        for (const auto& id : cluster.members) {
            if (auto r = store_.fetch_record(options_.record_collection, id)) {
                members.push_back(std::move(*r));
            } else {
                ++stats.members_missing;
            }
        }
        if (members.empty()) {
            ++stats.clusters_skipped;
            Logger::warn("Cluster " + cluster.id + " has no member records in " + options_.record_collection);
            continue;
        }

        GoldenRecord g = build(cluster, members, run_id);
        for (const auto& member : members) {
            MatchEdge e;
            e.key = directed_edge_key(member.id, g.key);
            e.from_id = member.id;
            e.to_id = g.key;
            e.similarity = 1.0;
            e.method = options_.method;
            e.timestamp = g.timestamp;
            e.attributes = {{"cluster_id", cluster.id}, {"run_id", run_id}};
            edges.push_back(std::move(e));
        }
        golden.push_back(std::move(g));
        ++stats.clusters_processed;

        if (golden.size() >= options_.batch_size) flush(golden, edges, stats);
    }
    flush(golden, edges, stats);

    stats.execution_time_ms = timer.elapsed_ms();
    Logger::success("Golden records: " + std::to_string(stats.golden_records_upserted) + " upserted, " +
                    std::to_string(stats.resolved_edges_upserted) + " new resolved_to edges");
    return stats;
}

} // namespace Coalesce
