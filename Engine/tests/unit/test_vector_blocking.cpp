/**
 * @file test_vector_blocking.cpp
 * @brief Unit tests for embedding-similarity blocking and its retry path
 */

#include <gtest/gtest.h>
#include <blocking/vector_blocking.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

using namespace Coalesce;

namespace {

/// Fails the first `failures` record scans, then behaves.
class FlakyStore : public MemoryStore {
public:
    using MemoryStore::MemoryStore;

    std::vector<Record> fetch_records(const std::string& collection, const std::vector<RecordFilter>& filters,
                                      size_t offset, size_t limit) override {
        if (failures > 0) {
            --failures;
            throw StorageError("connection reset by peer");
        }
        return MemoryStore::fetch_records(collection, filters, offset, limit);
    }

    int failures = 0;
};

void seed(MemoryStore& store) {
    store.upsert_records("products", {
        {"p1", {{"embedding_vector", {1.0, 0.0}}, {"brand", "acme"}}},
        {"p2", {{"embedding_vector", {0.98, 0.05}}, {"brand", "acme"}}},
        {"p3", {{"embedding_vector", {0.95, 0.1}}, {"brand", "globex"}}},
        {"p4", {{"embedding_vector", {0.0, 1.0}}, {"brand", "acme"}}},
    });
}

BlockingSource source() {
    BlockingSource s;
    s.collection = "products";
    return s;
}

} // namespace

class VectorBlockingTest : public ::testing::Test {
protected:
    void SetUp() override { Logger::set_level(Logger::Level::Off); }
};

TEST_F(VectorBlockingTest, EmitsPairsAboveThreshold) {
    MemoryStore store;
    seed(store);

    VectorBlockingParams params;
    params.similarity_threshold = 0.9;
    VectorBlocking blocking(store, source(), params);
    auto pairs = blocking.generate_candidates();

    ASSERT_EQ(pairs.size(), 3u);   // p1-p2, p1-p3, p2-p3
    for (const auto& p : pairs) {
        EXPECT_EQ(p.strategy, "vector");
        EXPECT_EQ(p.blocking_key.rfind("cos:", 0), 0u);
    }
    EXPECT_EQ(blocking.last_method(), METHOD_BRUTE_FORCE);
    EXPECT_EQ(blocking.get_statistics().details.at("method"), METHOD_BRUTE_FORCE);
}

TEST_F(VectorBlockingTest, BlockingFieldKeepsBrandsApart) {
    MemoryStore store;
    seed(store);

    VectorBlockingParams params;
    params.similarity_threshold = 0.9;
    params.blocking_field = "brand";
    VectorBlocking blocking(store, source(), params);
    auto pairs = blocking.generate_candidates();

    ASSERT_EQ(pairs.size(), 1u);
    EXPECT_EQ(pairs[0].first_id, "p1");
    EXPECT_EQ(pairs[0].second_id, "p2");
}

TEST_F(VectorBlockingTest, UsesNativeEngineWhenAvailable) {
    MemoryStore store({"pgvector", "0.6.0"});
    seed(store);

    VectorBlockingParams params;
    params.similarity_threshold = 0.9;
    VectorBlocking blocking(store, source(), params);
    EXPECT_EQ(blocking.generate_candidates().size(), 3u);
    EXPECT_EQ(blocking.last_method(), METHOD_NATIVE_VECTOR_SEARCH);
}

TEST_F(VectorBlockingTest, RecoversFromOneOffFailure) {
    FlakyStore store;
    seed(store);
    store.failures = 1;

    VectorBlockingParams params;
    params.similarity_threshold = 0.9;
    VectorBlocking blocking(store, source(), params);
    auto pairs = blocking.generate_candidates();

    EXPECT_EQ(pairs.size(), 3u);
    EXPECT_EQ(store.failures, 0);
    EXPECT_EQ(blocking.last_method(), METHOD_BRUTE_FORCE);
}

TEST_F(VectorBlockingTest, PersistentFailureSurfaces) {
    FlakyStore store;
    seed(store);
    store.failures = 2;

    VectorBlockingParams params;
    VectorBlocking blocking(store, source(), params);
    EXPECT_THROW(blocking.generate_candidates(), StorageError);
}

TEST_F(VectorBlockingTest, RejectsInvalidParameters) {
    MemoryStore store;
    VectorBlockingParams params;
    params.similarity_threshold = -0.1;
    EXPECT_THROW(VectorBlocking(store, source(), params), ConfigurationError);

    params = VectorBlockingParams{};
    params.limit_per_entity = 0;
    EXPECT_THROW(VectorBlocking(store, source(), params), ConfigurationError);

    params = VectorBlockingParams{};
    params.min_native_version = "x";
    EXPECT_THROW(VectorBlocking(store, source(), params), ConfigurationError);
}
