/**
 * @file test_ann_adapter.cpp
 * @brief Unit tests for native / brute-force vector search selection
 */

#include <gtest/gtest.h>
#include <similarity/ann_adapter.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

using namespace Coalesce;

namespace {

/// Advertises a capable engine but fails every native query.
class BrokenNativeStore : public MemoryStore {
public:
    BrokenNativeStore() : MemoryStore({"pgvector", "0.7.0"}) {}

    std::vector<VectorMatch> native_vector_search(const VectorQuery&) override {
        ++native_calls;
        throw StorageError("operator does not exist: vector <=> vector");
    }

    int native_calls = 0;
};

void seed(MemoryStore& store) {
    store.upsert_records("docs", {
        {"a", {{"embedding_vector", {1.0, 0.0, 0.0}}, {"lang", "en"}}},
        {"b", {{"embedding_vector", {0.9, 0.1, 0.0}}, {"lang", "en"}}},
        {"c", {{"embedding_vector", {0.8, 0.3, 0.0}}, {"lang", "de"}}},
        {"d", {{"embedding_vector", {0.0, 1.0, 0.0}}, {"lang", "en"}}},
        {"e", {{"embedding_vector", {0.0, 0.0, 0.0}}, {"lang", "en"}}},
        {"f", {{"title", "no vector"}}},
    });
}

AnnAdapterOptions options(bool force_brute = false) {
    AnnAdapterOptions o;
    o.collection = "docs";
    o.force_brute_force = force_brute;
    o.page_size = 2;
    return o;
}

} // namespace

class AnnAdapterTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(Logger::Level::Error); }
};

// ============================================================================
// Method selection
// ============================================================================

TEST_F(AnnAdapterTest, ParseVersion) {
    auto v = AnnAdapter::parse_version("pgvector 0.7.4");
    ASSERT_TRUE(v);
    EXPECT_EQ((*v)[0], 0);
    EXPECT_EQ((*v)[1], 7);
    EXPECT_EQ((*v)[2], 4);
    EXPECT_FALSE(AnnAdapter::parse_version("0.7"));
    EXPECT_FALSE(AnnAdapter::parse_version(""));
}

TEST_F(AnnAdapterTest, SelectsMethodFromProbe) {
    MemoryStore none;
    MemoryStore old_engine({"pgvector", "0.4.2"});
    MemoryStore capable({"pgvector", "0.5.0"});

    EXPECT_STREQ(AnnAdapter(none, options()).method(), METHOD_BRUTE_FORCE);
    EXPECT_STREQ(AnnAdapter(old_engine, options()).method(), METHOD_BRUTE_FORCE);
    EXPECT_STREQ(AnnAdapter(capable, options()).method(), METHOD_NATIVE_VECTOR_SEARCH);
    EXPECT_STREQ(AnnAdapter(capable, options(true)).method(), METHOD_BRUTE_FORCE);
}

TEST_F(AnnAdapterTest, RejectsBadOptions) {
    MemoryStore store;
    auto o = options();
    o.min_native_version = "latest";
    EXPECT_THROW(AnnAdapter(store, o), ConfigurationError);

    o = options();
    o.collection = "docs;";
    EXPECT_THROW(AnnAdapter(store, o), ValidationError);
}

// ============================================================================
// find_similar_vectors
// ============================================================================

TEST_F(AnnAdapterTest, BruteForceRankedDescending) {
    MemoryStore store;
    seed(store);
    AnnAdapter adapter(store, options(true));

    SimilarityQuery q;
    q.query_vector = std::vector<double>{1.0, 0.0, 0.0};
    q.threshold = 0.5;
    auto matches = adapter.find_similar_vectors(q);

    ASSERT_EQ(matches.size(), 3u);
    EXPECT_EQ(matches[0].id, "a");
    EXPECT_EQ(matches[1].id, "b");
    EXPECT_EQ(matches[2].id, "c");
    for (size_t i = 0; i + 1 < matches.size(); ++i) {
        EXPECT_GE(matches[i].similarity, matches[i + 1].similarity);
    }
    for (const auto& m : matches) {
        EXPECT_GE(m.similarity, 0.5);
        EXPECT_EQ(m.method, METHOD_BRUTE_FORCE);
    }
}

TEST_F(AnnAdapterTest, QueryByIdExcludesSelf) {
    MemoryStore store;
    seed(store);
    AnnAdapter adapter(store, options(true));

    SimilarityQuery q;
    q.query_id = "a";
    q.threshold = 0.5;
    q.limit = 1;
    auto matches = adapter.find_similar_vectors(q);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].id, "b");

    q.exclude_self = false;
    matches = adapter.find_similar_vectors(q);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].id, "a");
}

TEST_F(AnnAdapterTest, BlockingFieldRestrictsNeighbours) {
    MemoryStore store;
    seed(store);
    AnnAdapter adapter(store, options(true));

    SimilarityQuery q;
    q.query_vector = std::vector<double>{1.0, 0.0, 0.0};
    q.threshold = 0.5;
    q.blocking_field = "lang";
    q.blocking_value = "de";
    auto matches = adapter.find_similar_vectors(q);
    ASSERT_EQ(matches.size(), 1u);
    EXPECT_EQ(matches[0].id, "c");
}

TEST_F(AnnAdapterTest, UsageErrors) {
    MemoryStore store;
    seed(store);
    AnnAdapter adapter(store, options(true));

    SimilarityQuery neither;
    EXPECT_THROW(adapter.find_similar_vectors(neither), ValidationError);

    SimilarityQuery both;
    both.query_vector = std::vector<double>{1.0, 0.0, 0.0};
    both.query_id = "a";
    EXPECT_THROW(adapter.find_similar_vectors(both), ValidationError);

    SimilarityQuery bad_threshold;
    bad_threshold.query_id = "a";
    bad_threshold.threshold = 1.5;
    EXPECT_THROW(adapter.find_similar_vectors(bad_threshold), ValidationError);

    SimilarityQuery missing;
    missing.query_id = "f";
    EXPECT_TRUE(adapter.find_similar_vectors(missing).empty());
}

TEST_F(AnnAdapterTest, NativeFailureFallsBackToBruteForce) {
    BrokenNativeStore store;
    seed(store);
    AnnAdapter adapter(store, options());
    ASSERT_TRUE(adapter.uses_native());

    SimilarityQuery q;
    q.query_vector = std::vector<double>{1.0, 0.0, 0.0};
    q.threshold = 0.5;
    auto matches = adapter.find_similar_vectors(q);

    EXPECT_EQ(store.native_calls, 1);
    ASSERT_EQ(matches.size(), 3u);
    for (const auto& m : matches) EXPECT_EQ(m.method, METHOD_BRUTE_FORCE);

    auto pairs = adapter.find_all_pairs(0.5, 5);
    ASSERT_FALSE(pairs.empty());
    for (const auto& p : pairs) EXPECT_EQ(p.method, METHOD_BRUTE_FORCE);
}

TEST_F(AnnAdapterTest, NativeResultsTagged) {
    MemoryStore store({"pgvector", "0.7.0"});
    seed(store);
    AnnAdapter adapter(store, options());

    SimilarityQuery q;
    q.query_id = "a";
    q.threshold = 0.5;
    auto matches = adapter.find_similar_vectors(q);
    ASSERT_EQ(matches.size(), 2u);
    for (const auto& m : matches) EXPECT_EQ(m.method, METHOD_NATIVE_VECTOR_SEARCH);
}

// ============================================================================
// find_all_pairs
// ============================================================================

TEST_F(AnnAdapterTest, AllPairsCanonicalAndAgreeAcrossMethods) {
    MemoryStore store({"pgvector", "0.7.0"});
    seed(store);

    AnnAdapter native(store, options());
    AnnAdapter brute(store, options(true));

    auto pn = native.find_all_pairs(0.5, 10);
    auto pb = brute.find_all_pairs(0.5, 10);

    // a-b, a-c, b-c; the zero vector and the record without one never pair
    ASSERT_EQ(pb.size(), 3u);
    ASSERT_EQ(pn.size(), pb.size());
    for (size_t i = 0; i < pb.size(); ++i) {
        EXPECT_LT(pb[i].first_id, pb[i].second_id);
        EXPECT_EQ(pn[i].first_id, pb[i].first_id);
        EXPECT_EQ(pn[i].second_id, pb[i].second_id);
        EXPECT_NEAR(pn[i].similarity, pb[i].similarity, 1e-9);
    }

    auto scoped = brute.find_all_pairs(0.5, 10, std::string("lang"));
    ASSERT_EQ(scoped.size(), 1u);
    EXPECT_EQ(scoped[0].first_id, "a");
    EXPECT_EQ(scoped[0].second_id, "b");

    EXPECT_THROW(brute.find_all_pairs(0.5, 0), ValidationError);
}
