/**
 * @file resolution_pipeline.hpp
 * @brief End-to-end resolution run over one Store
 *
 * Stages, in order:
 *   1. node2vec enrichment (optional) from the edges already stored
 *   2. composite blocking
 *   3. batch Fellegi-Sunter scoring
 *   4. similar_to edges for every match decision
 *   5. WCC clustering over the stored edges
 *   6. golden records and resolved_to edges
 *
 * All components are built (and validated) in the constructor, so a bad
 * configuration fails before anything is read or written.
 */

#pragma once

#include <export.hpp>
#include <blocking/composite_blocking.hpp>
#include <clustering/wcc_clustering.hpp>
#include <config/resolution_config.hpp>
#include <persistence/golden_record_service.hpp>
#include <persistence/merge_policy.hpp>
#include <persistence/similarity_edge_service.hpp>
#include <scoring/fellegi_sunter.hpp>
#include <storage/store.hpp>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace Coalesce {

struct StageTiming {
    std::string name;
    double execution_time_ms = 0.0;
};

struct PipelineReport {
    std::string run_id;
    std::string started_at;

    bool embeddings_trained = false;
    size_t embedded_nodes = 0;

    BlockingStatistics blocking;
    size_t candidates = 0;

    size_t scored_pairs = 0;
    size_t failed_pairs = 0;
    size_t matches = 0;
    size_t possible_matches = 0;
    size_t non_matches = 0;

    EdgeCreationStats edges;
    ClusterStatistics clusters;
    GoldenRecordStats golden;

    std::vector<StageTiming> stages;
    double total_time_ms = 0.0;

    nlohmann::json to_json() const;
};

class COALESCE_API ResolutionPipeline {
public:
    /**
     * @throws ConfigurationError / ValidationError / SafetyLimitExceeded for a
     * bad configuration
     */
    ResolutionPipeline(Store& store, ResolutionConfig config);

    PipelineReport run(const std::string& run_id);

    const ResolutionConfig& config() const { return config_; }

private:
    void enrich_embeddings(PipelineReport& report);

    Store& store_;
    ResolutionConfig config_;
    FellegiSunterScorer scorer_;
    MajorityMergePolicy merge_policy_;
    std::unique_ptr<CompositeBlocking> blocking_;
};

} // namespace Coalesce
