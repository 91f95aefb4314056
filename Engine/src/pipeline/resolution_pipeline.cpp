#include <pipeline/resolution_pipeline.hpp>
#include <embedding/node2vec.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <functional>

namespace Coalesce {

namespace {

ResolutionConfig checked(ResolutionConfig config) {
    if (config.golden.record_collection.empty()) config.golden.record_collection = config.record_collection;
    config.clustering.edge_collection = config.edges.edge_collection;
    validate(config);
    return config;
}

std::vector<std::string> merge_exclusions(const ResolutionConfig& config) {
    return {config.embeddings.field, config.embeddings.field + "_meta"};
}

} // namespace

nlohmann::json PipelineReport::to_json() const {
    nlohmann::json stage_list = nlohmann::json::array();
    for (const auto& s : stages) {
        stage_list.push_back({{"name", s.name}, {"execution_time_ms", s.execution_time_ms}});
    }
    return {
        {"run_id", run_id},
        {"started_at", started_at},
        {"embeddings", {{"trained", embeddings_trained}, {"nodes", embedded_nodes}}},
        {"blocking", blocking.to_json()},
        {"candidates", candidates},
        {"scoring", {
            {"scored_pairs", scored_pairs},
            {"failed_pairs", failed_pairs},
            {"matches", matches},
            {"possible_matches", possible_matches},
            {"non_matches", non_matches}
        }},
        {"edges", edges.to_json()},
        {"clusters", clusters.to_json()},
        {"golden_records", golden.to_json()},
        {"stages", stage_list},
        {"total_time_ms", total_time_ms}
    };
}

ResolutionPipeline::ResolutionPipeline(Store& store, ResolutionConfig config)
    : store_(store)
    , config_(checked(std::move(config)))
    , scorer_(config_.scoring)
    , merge_policy_({}, merge_exclusions(config_))
    , blocking_(std::make_unique<CompositeBlocking>(store, config_.blocking))
{}

void ResolutionPipeline::enrich_embeddings(PipelineReport& report) {
    const auto& opts = config_.embeddings;
    GraphEmbeddingService service(store_, opts.limits);
    Node2VecTrainer trainer(opts.params, opts.limits);

    auto edges = service.fetch_edges(config_.edges.edge_collection, opts.edge_limit);
    if (edges.empty()) {
        Logger::info("No stored edges yet; skipping embedding enrichment");
        return;
    }

    auto result = trainer.train(edges);
    service.write_embeddings(config_.record_collection, result, opts.field);
    report.embeddings_trained = true;
    report.embedded_nodes = result.node_count;
}

PipelineReport ResolutionPipeline::run(const std::string& run_id) {
    PipelineReport report;
    report.run_id = run_id;
    report.started_at = utc_timestamp();

    Timer total;
    Logger::info("Resolution run " + run_id + " on '" + config_.record_collection + "'");

    auto stage = [&report](const std::string& name, const std::function<void()>& fn) {
        Logger::step(name);
        Timer t;
        fn();
        report.stages.push_back({name, t.elapsed_ms()});
    };

    if (config_.embeddings.enabled) {
        stage("embeddings", [&] { enrich_embeddings(report); });
    }

    std::vector<CandidatePair> candidates;
    stage("blocking", [&] {
        candidates = blocking_->generate_candidates();
        report.blocking = blocking_->get_statistics();
        report.candidates = candidates.size();
    });

    BatchSimilarityResult batch;
    stage("scoring", [&] {
        batch = scorer_.score_candidates(store_, config_.record_collection, candidates);
        report.scored_pairs = batch.successful_pairs;
        report.failed_pairs = batch.failed_pairs;
        report.matches = batch.matches;
        report.possible_matches = batch.possible_matches;
        report.non_matches = batch.non_matches;
    });

    stage("edges", [&] {
        SimilarityEdgeService edges(store_, config_.edges);
        report.edges = edges.create_edges(collect_matches(batch), {{"run_id", run_id}},
                                          config_.bidirectional_edges);
    });

    std::vector<Cluster> clusters;
    stage("clustering", [&] {
        WccClusteringService clustering(store_, config_.clustering);
        clusters = clustering.run(true);
        report.clusters = clustering.statistics();
    });

    stage("golden_records", [&] {
        GoldenRecordService golden(store_, merge_policy_, config_.golden);
        report.golden = golden.run(clusters, run_id);
    });

    report.total_time_ms = total.elapsed_ms();
    Logger::success("Run " + run_id + ": " + std::to_string(report.matches) + " matches, " +
                    std::to_string(report.clusters.total_clusters) + " clusters, " +
                    std::to_string(report.golden.golden_records_upserted) + " golden records");
    return report;
}

} // namespace Coalesce
