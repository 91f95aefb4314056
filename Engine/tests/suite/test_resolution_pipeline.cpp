/**
 * @file test_resolution_pipeline.cpp
 * @brief End-to-end resolution runs against the in-memory store
 */

#include <gtest/gtest.h>
#include <config/resolution_config.hpp>
#include <hashing/deterministic_keys.hpp>
#include <pipeline/resolution_pipeline.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <algorithm>

using namespace Coalesce;

class ResolutionPipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);
        store.upsert_records("people", {
            person("r1", "John",   "Smith",  "john.smith@example.com", "Boston",  "555-0100"),
            person("r2", "Jon",    "Smith",  "john.smith@example.com", "Boston",  "555-0100"),
            person("r3", "Johnny", "Smith",  "j.smith@work.com",       "Boston",  "555-0100"),
            person("r4", "Maria",  "Garcia", "mg@example.org",         "Madrid",  "555-0199"),
            person("r5", "Mary",   "Garcia", "mg@example.org",         "Madrid",  "555-0199"),
            person("r6", "Ann",    "Lee",    "ann@lee.io",             "Seattle", "555-0142"),
        });
    }

    static Record person(const std::string& id, const std::string& first, const std::string& last,
                         const std::string& email, const std::string& city, const std::string& phone) {
        return Record(id, {{"first_name", first}, {"last_name", last}, {"email", email},
                           {"city", city}, {"phone", phone}});
    }

    MemoryStore store;
};

TEST_F(ResolutionPipelineTest, ResolvesDuplicatesIntoGoldenRecords) {
    ResolutionPipeline pipeline(store, layered_config("people", {}));
    auto report = pipeline.run("run_1");

    EXPECT_EQ(report.run_id, "run_1");
    EXPECT_EQ(report.failed_pairs, 0u);
    EXPECT_GE(report.matches, 3u);
    EXPECT_EQ(report.edges.edges_created, report.matches);
    EXPECT_EQ(report.clusters.total_clusters, 2u);
    EXPECT_EQ(report.golden.golden_records_upserted, 2u);
    EXPECT_EQ(report.golden.resolved_edges_upserted, 5u);

    auto clusters = store.fetch_clusters("entity_clusters");
    ASSERT_EQ(clusters.size(), 2u);
    EXPECT_EQ(clusters[0].members, (std::vector<std::string>{"r1", "r2", "r3"}));
    EXPECT_EQ(clusters[1].members, (std::vector<std::string>{"r4", "r5"}));

    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 2u);
    auto smith = std::find_if(golden.begin(), golden.end(),
                              [](const GoldenRecord& g) { return g.cluster_id == "cluster_000000"; });
    ASSERT_NE(smith, golden.end());
    EXPECT_EQ(smith->key, member_set_key({"r1", "r2", "r3"}));
    EXPECT_EQ(smith->fields["last_name"], "Smith");
    EXPECT_EQ(smith->fields["email"], "john.smith@example.com");

    for (const auto& e : store.fetch_edges("similar_to", {})) {
        EXPECT_EQ(e.attributes["run_id"], "run_1");
        EXPECT_EQ(e.key, edge_key(e.from_id, e.to_id));
    }

    std::vector<std::string> names;
    for (const auto& s : report.stages) names.push_back(s.name);
    EXPECT_EQ(names, (std::vector<std::string>{"blocking", "scoring", "edges", "clustering", "golden_records"}));

    auto j = report.to_json();
    EXPECT_EQ(j["clusters"]["total_clusters"], 2);
    EXPECT_EQ(j["golden_records"]["golden_records_upserted"], 2);
}

TEST_F(ResolutionPipelineTest, RerunCreatesNothingNew) {
    ResolutionPipeline pipeline(store, layered_config("people", {}));
    auto first = pipeline.run("run_1");
    auto second = pipeline.run("run_2");

    EXPECT_EQ(second.matches, first.matches);
    EXPECT_EQ(second.edges.edges_created, 0u);
    EXPECT_EQ(second.golden.resolved_edges_upserted, 0u);
    EXPECT_EQ(second.clusters.total_clusters, first.clusters.total_clusters);

    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 2u);
    for (const auto& g : golden) EXPECT_EQ(g.run_id, "run_2");
    EXPECT_EQ(store.fetch_edges("resolved_to", {}).size(), 5u);
}

TEST_F(ResolutionPipelineTest, BidirectionalEdges) {
    auto config = layered_config("people", {{{"edges", {{"bidirectional", true}}}}});
    ResolutionPipeline pipeline(store, config);
    auto report = pipeline.run("run_1");

    EXPECT_EQ(report.edges.edges_created, 2 * report.matches);
    EXPECT_EQ(report.clusters.total_clusters, 2u);
}

TEST_F(ResolutionPipelineTest, EmbeddingEnrichmentUsesStoredEdges) {
    ResolutionPipeline(store, layered_config("people", {})).run("run_1");

    auto config = layered_config("people", {{{"embeddings", {{"enabled", true}, {"dimensions", 4}}}}});
    ResolutionPipeline pipeline(store, config);
    auto report = pipeline.run("run_2");

    EXPECT_TRUE(report.embeddings_trained);
    EXPECT_EQ(report.embedded_nodes, 5u);
    EXPECT_EQ(report.stages.front().name, "embeddings");

    auto r1 = store.fetch_record("people", "r1");
    ASSERT_TRUE(r1);
    ASSERT_TRUE(r1->vector("node_embedding"));
    EXPECT_EQ(r1->vector("node_embedding")->size(), 4u);
    EXPECT_FALSE(store.fetch_record("people", "r6")->has("node_embedding"));

    for (const auto& g : store.fetch_golden_records("golden_records")) {
        EXPECT_FALSE(g.fields.contains("node_embedding_meta"));
    }
}

TEST_F(ResolutionPipelineTest, EmbeddingsSkippedWithoutEdges) {
    auto config = layered_config("people", {{{"embeddings", {{"enabled", true}}}}});
    ResolutionPipeline pipeline(store, config);
    auto report = pipeline.run("run_1");

    EXPECT_FALSE(report.embeddings_trained);
    EXPECT_EQ(report.clusters.total_clusters, 2u);
}

TEST_F(ResolutionPipelineTest, BadConfigurationFailsBeforeAnyWrite) {
    auto config = ResolutionConfig::defaults("people");
    config.clustering.min_cluster_size = 1;
    EXPECT_THROW(ResolutionPipeline(store, config), ConfigurationError);
    EXPECT_TRUE(store.fetch_edges("similar_to", {}).empty());
}
