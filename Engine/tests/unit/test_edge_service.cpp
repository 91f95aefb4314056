/**
 * @file test_edge_service.cpp
 * @brief Unit tests for deterministic, batched match edge creation
 */

#include <gtest/gtest.h>
#include <hashing/deterministic_keys.hpp>
#include <persistence/similarity_edge_service.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

using namespace Coalesce;

namespace {

ScoredMatch match(const std::string& a, const std::string& b, double similarity) {
    ScoredMatch m;
    m.first_id = a;
    m.second_id = b;
    m.similarity = similarity;
    return m;
}

// Rejects the n-th insert_edges call
class FailingInsertStore : public MemoryStore {
public:
    explicit FailingInsertStore(size_t fail_call) : fail_call_(fail_call) {}

    size_t insert_edges(const std::string& collection, const std::vector<MatchEdge>& edges,
                        bool ignore_on_conflict) override {
        if (++calls_ == fail_call_) throw StorageError("simulated write failure");
        return MemoryStore::insert_edges(collection, edges, ignore_on_conflict);
    }

private:
    size_t fail_call_;
    size_t calls_ = 0;
};

} // namespace

class EdgeServiceTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(Logger::Level::Off); }
};

TEST_F(EdgeServiceTest, EdgeKeyIsSymmetric) {
    EXPECT_EQ(edge_key("r1", "r2"), edge_key("r2", "r1"));
    EXPECT_NE(edge_key("r1", "r2"), edge_key("r1", "r3"));
    EXPECT_NE(directed_edge_key("r1", "r2"), directed_edge_key("r2", "r1"));
}

TEST_F(EdgeServiceTest, CreatesEdgesWithAttributes) {
    MemoryStore store;
    SimilarityEdgeService service(store);

    auto m = match("r1", "r2", 0.912345);
    m.attributes = {{"score", 4.2}};
    auto stats = service.create_edges({m}, {{"run_id", "run_1"}});

    EXPECT_EQ(stats.edges_requested, 1u);
    EXPECT_EQ(stats.edges_created, 1u);
    EXPECT_EQ(stats.batches_processed, 1u);

    auto edges = store.fetch_edges("similar_to", {});
    ASSERT_EQ(edges.size(), 1u);
    EXPECT_EQ(edges[0].key, edge_key("r1", "r2"));
    EXPECT_DOUBLE_EQ(edges[0].similarity, 0.9123);
    EXPECT_EQ(edges[0].method, "fellegi_sunter");
    EXPECT_EQ(edges[0].attributes["run_id"], "run_1");
    EXPECT_EQ(edges[0].attributes["score"], 4.2);
    EXPECT_FALSE(edges[0].timestamp.empty());
}

TEST_F(EdgeServiceTest, BidirectionalEdgesShareKey) {
    MemoryStore store;
    SimilarityEdgeService service(store);
    auto stats = service.create_edges({match("r1", "r2", 0.9)}, {}, true);

    EXPECT_EQ(stats.edges_created, 2u);
    auto edges = store.fetch_edges("similar_to", {});
    ASSERT_EQ(edges.size(), 2u);
    EXPECT_EQ(edges[0].key, edges[1].key);
    EXPECT_NE(edges[0].reverse, edges[1].reverse);
    EXPECT_EQ(edges[0].from_id, edges[1].to_id);
}

TEST_F(EdgeServiceTest, RerunCreatesNothing) {
    MemoryStore store;
    SimilarityEdgeService service(store);
    std::vector<ScoredMatch> matches{match("r1", "r2", 0.9), match("r3", "r2", 0.8)};

    EXPECT_EQ(service.create_edges(matches).edges_created, 2u);

    // Same pairs in the opposite orientation map onto the same keys
    std::vector<ScoredMatch> flipped{match("r2", "r1", 0.9), match("r2", "r3", 0.8)};
    auto stats = service.create_edges(flipped);
    EXPECT_EQ(stats.edges_requested, 2u);
    EXPECT_EQ(stats.edges_created, 0u);
    EXPECT_EQ(store.fetch_edges("similar_to", {}).size(), 2u);
}

TEST_F(EdgeServiceTest, FailedBatchDoesNotStopLaterBatches) {
    FailingInsertStore store(2);
    EdgeServiceOptions options;
    options.batch_size = 2;
    SimilarityEdgeService service(store, options);

    std::vector<ScoredMatch> matches;
    for (int i = 0; i < 5; ++i) matches.push_back(match("a" + std::to_string(i), "b" + std::to_string(i), 0.9));

    auto stats = service.create_edges(matches);
    EXPECT_EQ(stats.edges_requested, 5u);
    EXPECT_EQ(stats.batches_processed, 2u);
    EXPECT_EQ(stats.batches_failed, 1u);
    EXPECT_EQ(stats.edges_failed, 2u);
    EXPECT_EQ(stats.edges_created, 3u);
    EXPECT_DOUBLE_EQ(stats.avg_batch_size, 1.67);
}

TEST_F(EdgeServiceTest, RejectsBadInput) {
    MemoryStore store;
    SimilarityEdgeService service(store);
    EXPECT_THROW(service.create_edges({match("r1", "r1", 0.9)}), ValidationError);
    EXPECT_THROW(service.create_edges({match("", "r1", 0.9)}), ValidationError);

    EdgeServiceOptions options;
    options.batch_size = 0;
    EXPECT_THROW(SimilarityEdgeService(store, options), ConfigurationError);
    options = EdgeServiceOptions{};
    options.edge_collection = "similar-to";
    EXPECT_THROW(SimilarityEdgeService(store, options), ValidationError);
}

// ============================================================================
// Clearing
// ============================================================================

TEST_F(EdgeServiceTest, ClearByMethod) {
    MemoryStore store;
    SimilarityEdgeService service(store);
    service.create_edges({match("r1", "r2", 0.9)});
    service.create_edges({match("r3", "r4", 0.9)}, {}, false, std::string("manual"));

    EXPECT_EQ(service.clear_edges(std::string("manual")), 1u);
    auto left = store.fetch_edges("similar_to", {});
    ASSERT_EQ(left.size(), 1u);
    EXPECT_EQ(left[0].method, "fellegi_sunter");
}

TEST_F(EdgeServiceTest, ClearByAge) {
    MemoryStore store;
    MatchEdge old_edge;
    old_edge.key = edge_key("r1", "r2");
    old_edge.from_id = "r1";
    old_edge.to_id = "r2";
    old_edge.method = "fellegi_sunter";
    old_edge.timestamp = "2020-01-01T00:00:00Z";
    store.insert_edges("similar_to", {old_edge}, true);

    SimilarityEdgeService service(store);
    service.create_edges({match("r3", "r4", 0.9)});

    EXPECT_EQ(service.clear_edges(std::nullopt, std::string("2021-01-01T00:00:00Z")), 1u);
    EXPECT_EQ(store.fetch_edges("similar_to", {}).size(), 1u);
}

TEST_F(EdgeServiceTest, ClearRequiresCriterion) {
    MemoryStore store;
    SimilarityEdgeService service(store);
    EXPECT_THROW(service.clear_edges(std::nullopt), ValidationError);
}
