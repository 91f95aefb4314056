/**
 * @file test_lsh_blocking.cpp
 * @brief Unit tests for random-hyperplane LSH blocking
 */

#include <gtest/gtest.h>
#include <blocking/lsh_blocking.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <cstdio>
#include <random>
#include <set>

using namespace Coalesce;

namespace {

std::vector<double> random_vector(std::mt19937_64& rng, size_t dim) {
    std::normal_distribution<double> normal(0.0, 1.0);
    std::vector<double> v(dim);
    for (auto& x : v) x = normal(rng);
    return v;
}

class LshBlockingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Error);
        std::mt19937_64 rng(7);
        std::vector<Record> records;
        for (int i = 0; i < 40; ++i) {
            char id[16];
            std::snprintf(id, sizeof(id), "r%02d", i);
            records.emplace_back(id, nlohmann::json{{"embedding_vector", random_vector(rng, 16)},
                                                    {"region", i % 2 == 0 ? "north" : "south"}});
        }
        // Exact duplicate of r00 must share every bucket with it
        records.emplace_back("dup", nlohmann::json{{"embedding_vector", records[0].fields["embedding_vector"]},
                                                   {"region", "north"}});
        store.upsert_records("items", records);
    }

    BlockingSource source() const {
        BlockingSource s;
        s.collection = "items";
        s.page_size = 7;
        return s;
    }

    MemoryStore store;
};

} // namespace

TEST_F(LshBlockingTest, DeterministicForFixedSeed) {
    LshBlockingParams params;
    params.num_hash_tables = 4;
    params.num_hyperplanes = 6;
    params.seed = 1234;

    LshBlocking a(store, source(), params);
    LshBlocking b(store, source(), params);
    auto pa = a.generate_candidates();
    auto pb = b.generate_candidates();

    ASSERT_EQ(pa.size(), pb.size());
    for (size_t i = 0; i < pa.size(); ++i) {
        EXPECT_EQ(pa[i].first_id, pb[i].first_id);
        EXPECT_EQ(pa[i].second_id, pb[i].second_id);
        EXPECT_EQ(pa[i].blocking_key, pb[i].blocking_key);
    }

    // Running again on the same instance reproduces the result
    EXPECT_EQ(a.generate_candidates().size(), pa.size());
}

TEST_F(LshBlockingTest, IdenticalVectorsAlwaysCollide) {
    LshBlockingParams params;
    params.num_hash_tables = 3;
    params.num_hyperplanes = 16;

    LshBlocking blocking(store, source(), params);
    auto pairs = blocking.generate_candidates();

    bool found = false;
    for (const auto& p : pairs) {
        EXPECT_LT(p.first_id, p.second_id);
        if (p.first_id == "dup" && p.second_id == "r00") found = true;
    }
    EXPECT_TRUE(found);

    const auto& stats = blocking.get_statistics();
    EXPECT_EQ(stats.details.at("vectors_indexed"), "41");
    EXPECT_EQ(stats.details.at("num_hash_tables"), "3");
}

TEST_F(LshBlockingTest, LargeBucketsAreNotCappedByDefault) {
    std::mt19937_64 rng(99);
    const auto shared = random_vector(rng, 16);
    std::vector<Record> clones;
    for (int i = 0; i < 150; ++i) {
        char id[16];
        std::snprintf(id, sizeof(id), "c%03d", i);
        clones.emplace_back(id, nlohmann::json{{"embedding_vector", shared}});
    }
    store.upsert_records("clones", clones);

    BlockingSource s;
    s.collection = "clones";
    LshBlocking blocking(store, s, LshBlockingParams{});
    auto pairs = blocking.generate_candidates();

    EXPECT_EQ(pairs.size(), 150u * 149u / 2u);
    const auto& stats = blocking.get_statistics();
    EXPECT_EQ(stats.skipped_oversized_blocks, 0u);
    EXPECT_EQ(stats.blocks_formed, LshBlockingParams{}.num_hash_tables);

    // An explicit bucket cap skips every table's single bucket
    LshBlockingParams capped;
    capped.max_bucket_size = 100;
    LshBlocking limited(store, s, capped);
    EXPECT_TRUE(limited.generate_candidates().empty());
    EXPECT_EQ(limited.get_statistics().skipped_oversized_blocks, capped.num_hash_tables);
}

TEST_F(LshBlockingTest, SignatureHasOneWordPerTable) {
    LshBlockingParams params;
    params.num_hash_tables = 5;
    params.num_hyperplanes = 10;
    LshBlocking blocking(store, source(), params);
    blocking.prepare(16);

    Eigen::VectorXd v = Eigen::VectorXd::Ones(16).normalized();
    auto sigs = blocking.signatures(v);
    ASSERT_EQ(sigs.size(), 5u);
    for (auto s : sigs) EXPECT_LT(s, uint64_t(1) << 10);

    EXPECT_THROW(blocking.signatures(Eigen::VectorXd::Ones(3)), ValidationError);
}

TEST_F(LshBlockingTest, BlockingFieldScopesBuckets) {
    LshBlockingParams params;
    params.num_hash_tables = 2;
    params.num_hyperplanes = 2;
    params.blocking_field = "region";

    LshBlocking blocking(store, source(), params);
    auto pairs = blocking.generate_candidates();
    ASSERT_FALSE(pairs.empty());

    std::set<std::string> north;
    for (const auto& r : store.fetch_records("items", {RecordFilter::equals("region", "north")}, 0, 100)) {
        north.insert(r.id);
    }
    for (const auto& p : pairs) {
        EXPECT_EQ(north.count(p.first_id), north.count(p.second_id)) << p.first_id << " / " << p.second_id;
    }
}

TEST_F(LshBlockingTest, MissingEmbeddingsYieldNoCandidates) {
    store.upsert_records("plain", {{"a", {{"name", "x"}}}, {"b", {{"name", "y"}}},
                                   {"z", {{"embedding_vector", {0.0, 0.0}}}}});
    BlockingSource s;
    s.collection = "plain";

    LshBlocking blocking(store, s, LshBlockingParams{});
    EXPECT_TRUE(blocking.generate_candidates().empty());
    EXPECT_EQ(blocking.get_statistics().records_skipped, 3u);
}

TEST_F(LshBlockingTest, RejectsInvalidParameters) {
    LshBlockingParams params;
    params.num_hash_tables = 0;
    EXPECT_THROW(LshBlocking(store, source(), params), ConfigurationError);

    params = LshBlockingParams{};
    params.num_hyperplanes = 65;
    EXPECT_THROW(LshBlocking(store, source(), params), ConfigurationError);

    params = LshBlockingParams{};
    params.max_bucket_size = 1;
    EXPECT_THROW(LshBlocking(store, source(), params), ConfigurationError);

    params = LshBlockingParams{};
    params.embedding_field = "not a field";
    EXPECT_THROW(LshBlocking(store, source(), params), ValidationError);
}
