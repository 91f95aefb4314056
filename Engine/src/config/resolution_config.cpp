#include <config/resolution_config.hpp>
#include <utils/errors.hpp>
#include <utils/identifiers.hpp>
#include <cstdint>
#include <set>
#include <type_traits>

namespace Coalesce {

namespace {

void check_keys(const nlohmann::json& j, const std::set<std::string>& allowed, const std::string& section) {
    if (!j.is_object()) throw ConfigurationError("'" + section + "' must be an object");
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (!allowed.count(it.key())) {
            throw ConfigurationError("unknown key '" + it.key() + "' in " + section);
        }
    }
}

template <typename T>
void assign(const nlohmann::json& j, const char* key, T& target) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        if (!v.is_number_integer()) {
            throw ConfigurationError(std::string("'") + key + "' must be an integer");
        }
        if (!v.is_number_unsigned() && v.get<int64_t>() < 0) {
            throw ConfigurationError(std::string("'") + key + "' must not be negative");
        }
    }
    target = v.get<T>();
}

void apply_scoring(ScoringConfig& scoring, const nlohmann::json& j) {
    check_keys(j, {"upper_threshold", "lower_threshold", "fields"}, "scoring");
    assign(j, "upper_threshold", scoring.upper_threshold);
    assign(j, "lower_threshold", scoring.lower_threshold);
    if (j.contains("fields")) {
        // Reuse the full parser for the field list; thresholds already applied
        scoring.fields = scoring_config_from_json({{"fields", j.at("fields")}}).fields;
    }
}

void apply_embeddings(EmbeddingOptions& e, const nlohmann::json& j) {
    check_keys(j, {"enabled", "field", "edge_limit", "dimensions", "walk_length", "num_walks", "window_size",
                   "p", "q", "seed", "directed", "limits"}, "embeddings");
    assign(j, "enabled", e.enabled);
    assign(j, "field", e.field);
    assign(j, "edge_limit", e.edge_limit);
    assign(j, "dimensions", e.params.dimensions);
    assign(j, "walk_length", e.params.walk_length);
    assign(j, "num_walks", e.params.num_walks);
    assign(j, "window_size", e.params.window_size);
    assign(j, "p", e.params.p);
    assign(j, "q", e.params.q);
    assign(j, "seed", e.params.seed);
    assign(j, "directed", e.params.directed);

    if (j.contains("limits")) {
        const auto& l = j.at("limits");
        check_keys(l, {"max_nodes", "warn_nodes_threshold", "max_dimensions", "max_edges_fetched",
                       "warn_edges_threshold"}, "embeddings.limits");
        assign(l, "max_nodes", e.limits.max_nodes);
        assign(l, "warn_nodes_threshold", e.limits.warn_nodes_threshold);
        assign(l, "max_dimensions", e.limits.max_dimensions);
        assign(l, "max_edges_fetched", e.limits.max_edges_fetched);
        assign(l, "warn_edges_threshold", e.limits.warn_edges_threshold);
    }
}

} // namespace

ResolutionConfig ResolutionConfig::defaults(const std::string& record_collection) {
    ResolutionConfig c;
    c.record_collection = record_collection;
    c.golden.record_collection = record_collection;

    BlockingSpec exact;
    exact.source.collection = record_collection;
    exact.params = ExactBlockingParams{{"email"}, false};

    BlockingSpec phonetic;
    phonetic.source.collection = record_collection;
    phonetic.params = PhoneticBlockingParams{{"last_name"}};

    c.blocking = {exact, phonetic};
    return c;
}

void apply_overrides(ResolutionConfig& config, const nlohmann::json& layer) {
    if (layer.is_null()) return;
    check_keys(layer, {"version", "record_collection", "blocking", "scoring", "edges", "clustering", "golden",
                       "embeddings"}, "configuration");

    try {
        if (layer.contains("version")) {
            const int v = layer.at("version").get<int>();
            if (v != ResolutionConfig::CURRENT_VERSION) {
                throw ConfigurationError("unsupported configuration version " + std::to_string(v) +
                                         " (expected " + std::to_string(ResolutionConfig::CURRENT_VERSION) + ")");
            }
        }

        if (layer.contains("record_collection")) {
            const std::string previous = config.record_collection;
            config.record_collection = layer.at("record_collection").get<std::string>();
            for (auto& spec : config.blocking) {
                if (spec.source.collection == previous) spec.source.collection = config.record_collection;
            }
            if (config.golden.record_collection == previous) config.golden.record_collection = config.record_collection;
        }

        if (layer.contains("blocking")) {
            const auto& list = layer.at("blocking");
            if (!list.is_array()) throw ConfigurationError("'blocking' must be an array");
            config.blocking.clear();
            for (const auto& item : list) {
                config.blocking.push_back(blocking_spec_from_json(item, config.record_collection));
            }
        }

        if (layer.contains("scoring")) apply_scoring(config.scoring, layer.at("scoring"));

        if (layer.contains("edges")) {
            const auto& j = layer.at("edges");
            check_keys(j, {"collection", "batch_size", "method", "bidirectional"}, "edges");
            assign(j, "collection", config.edges.edge_collection);
            assign(j, "batch_size", config.edges.batch_size);
            assign(j, "method", config.edges.method);
            assign(j, "bidirectional", config.bidirectional_edges);
        }

        if (layer.contains("clustering")) {
            const auto& j = layer.at("clustering");
            check_keys(j, {"collection", "min_cluster_size", "min_similarity"}, "clustering");
            assign(j, "collection", config.clustering.cluster_collection);
            assign(j, "min_cluster_size", config.clustering.min_cluster_size);
            if (j.contains("min_similarity")) {
                if (j.at("min_similarity").is_null()) config.clustering.min_similarity.reset();
                else config.clustering.min_similarity = j.at("min_similarity").get<double>();
            }
        }

        if (layer.contains("golden")) {
            const auto& j = layer.at("golden");
            check_keys(j, {"collection", "resolved_edge_collection", "method", "batch_size"}, "golden");
            assign(j, "collection", config.golden.golden_collection);
            assign(j, "resolved_edge_collection", config.golden.resolved_edge_collection);
            assign(j, "method", config.golden.method);
            assign(j, "batch_size", config.golden.batch_size);
        }

        if (layer.contains("embeddings")) apply_embeddings(config.embeddings, layer.at("embeddings"));
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("configuration: ") + e.what());
    }

    // Clustering always reads the edges the edge service writes
    config.clustering.edge_collection = config.edges.edge_collection;
}

ResolutionConfig layered_config(const std::string& record_collection, const std::vector<nlohmann::json>& layers) {
    ResolutionConfig config = ResolutionConfig::defaults(record_collection);
    for (const auto& layer : layers) apply_overrides(config, layer);
    validate(config);
    return config;
}

void validate(const ResolutionConfig& config) {
    if (config.version != ResolutionConfig::CURRENT_VERSION) {
        throw ConfigurationError("unsupported configuration version " + std::to_string(config.version));
    }
    validate_identifier(config.record_collection, "record collection");
    validate_identifier(config.edges.edge_collection, "edge collection");
    validate_identifier(config.clustering.cluster_collection, "cluster collection");
    validate_identifier(config.golden.golden_collection, "golden collection");
    validate_identifier(config.golden.resolved_edge_collection, "resolved edge collection");
    validate_identifier(config.embeddings.field, "embedding field");

    if (config.blocking.empty()) {
        throw ConfigurationError("at least one blocking strategy is required");
    }
    for (const auto& spec : config.blocking) {
        validate_identifier(spec.source.collection, "blocking collection");
    }
    if (config.edges.batch_size == 0) throw ConfigurationError("edges.batch_size must be positive");
    if (config.golden.batch_size == 0) throw ConfigurationError("golden.batch_size must be positive");

    // Store-free components validate their own options on construction
    FellegiSunterScorer scorer(config.scoring);
    WccClustering clustering(config.clustering.min_cluster_size);
    if (config.embeddings.enabled) {
        Node2VecTrainer trainer(config.embeddings.params, config.embeddings.limits);
    }
}

nlohmann::json to_json(const ResolutionConfig& config) {
    nlohmann::json blocking = nlohmann::json::array();
    for (const auto& spec : config.blocking) blocking.push_back(blocking_spec_to_json(spec));

    const auto& e = config.embeddings;
    nlohmann::json j = {
        {"version", config.version},
        {"record_collection", config.record_collection},
        {"blocking", blocking},
        {"scoring", scoring_config_to_json(config.scoring)},
        {"edges", {
            {"collection", config.edges.edge_collection},
            {"batch_size", config.edges.batch_size},
            {"method", config.edges.method},
            {"bidirectional", config.bidirectional_edges}
        }},
        {"clustering", {
            {"collection", config.clustering.cluster_collection},
            {"min_cluster_size", config.clustering.min_cluster_size}
        }},
        {"golden", {
            {"collection", config.golden.golden_collection},
            {"resolved_edge_collection", config.golden.resolved_edge_collection},
            {"method", config.golden.method},
            {"batch_size", config.golden.batch_size}
        }},
        {"embeddings", {
            {"enabled", e.enabled},
            {"field", e.field},
            {"edge_limit", e.edge_limit},
            {"dimensions", e.params.dimensions},
            {"walk_length", e.params.walk_length},
            {"num_walks", e.params.num_walks},
            {"window_size", e.params.window_size},
            {"p", e.params.p},
            {"q", e.params.q},
            {"seed", e.params.seed},
            {"directed", e.params.directed},
            {"limits", {
                {"max_nodes", e.limits.max_nodes},
                {"warn_nodes_threshold", e.limits.warn_nodes_threshold},
                {"max_dimensions", e.limits.max_dimensions},
                {"max_edges_fetched", e.limits.max_edges_fetched},
                {"warn_edges_threshold", e.limits.warn_edges_threshold}
            }}
        }}
    };
    j["clustering"]["min_similarity"] = config.clustering.min_similarity
        ? nlohmann::json(*config.clustering.min_similarity) : nlohmann::json(nullptr);
    return j;
}

} // namespace Coalesce
