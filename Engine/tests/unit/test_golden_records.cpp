/**
 * @file test_golden_records.cpp
 * @brief Unit tests for field merging and golden record persistence
 */

#include <gtest/gtest.h>
#include <hashing/deterministic_keys.hpp>
#include <persistence/golden_record_service.hpp>
#include <persistence/merge_policy.hpp>
#include <storage/memory_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>

using namespace Coalesce;

class GoldenRecordTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::set_level(Logger::Level::Off);
        store.upsert_records("people", {
            Record("r1", {{"name", "Jon Smith"}, {"city", "Boston"}, {"node_embedding", {0.1, 0.2}}}),
            Record("r2", {{"name", "John Smith"}, {"city", "Boston"}}),
            Record("r3", {{"name", "Jon Smith"}, {"age", 30}}),
            Record("r4", {{"name", "Ann Lee"}}),
            Record("r5", {{"name", "Anne Lee"}}),
        });
    }

    static Cluster cluster(const std::string& id, std::vector<std::string> members) {
        Cluster c;
        c.id = id;
        c.members = std::move(members);
        c.content_key = member_set_key(c.members);
        return c;
    }

    GoldenRecordOptions options() const {
        GoldenRecordOptions o;
        o.record_collection = "people";
        return o;
    }

    MemoryStore store;
};

// ============================================================================
// Merge policy
// ============================================================================

TEST_F(GoldenRecordTest, MajorityValueWins) {
    MajorityMergePolicy policy;
    std::vector<Record> members{*store.fetch_record("people", "r1"), *store.fetch_record("people", "r2"),
                                *store.fetch_record("people", "r3")};
    auto merged = policy.merge(members);

    EXPECT_EQ(merged.fields["name"], "Jon Smith");
    EXPECT_EQ(merged.fields["city"], "Boston");
    EXPECT_EQ(merged.provenance["city"], "r1");
    EXPECT_EQ(merged.fields["age"], 30);
    EXPECT_EQ(merged.provenance["age"], "r3");
    EXPECT_FALSE(merged.fields.contains("node_embedding"));
}

TEST_F(GoldenRecordTest, TiesPreferLongerStringThenFirstRecord) {
    MajorityMergePolicy policy;
    auto merged = policy.merge({Record("a", {{"name", "Jon"}, {"n", 1}}), Record("b", {{"name", "Jonathan"}, {"n", 2}})});
    EXPECT_EQ(merged.fields["name"], "Jonathan");
    EXPECT_EQ(merged.provenance["name"], "b");
    EXPECT_EQ(merged.fields["n"], 1);
    EXPECT_EQ(merged.provenance["n"], "a");
}

TEST_F(GoldenRecordTest, FieldSelectionAndExclusion) {
    MajorityMergePolicy only_city({"city"});
    auto merged = only_city.merge({*store.fetch_record("people", "r1")});
    EXPECT_EQ(merged.fields.size(), 1u);

    MajorityMergePolicy no_city({}, {"city"});
    merged = no_city.merge({*store.fetch_record("people", "r1")});
    EXPECT_FALSE(merged.fields.contains("city"));
    EXPECT_TRUE(merged.fields.contains("name"));

    EXPECT_THROW(MajorityMergePolicy(std::vector<std::string>{"bad field"}), ValidationError);
}

// ============================================================================
// Service
// ============================================================================

TEST_F(GoldenRecordTest, BuildsKeyedRecordsAndResolvedEdges) {
    MajorityMergePolicy policy;
    GoldenRecordService service(store, policy, options());
    auto stats = service.run({cluster("cluster_000000", {"r1", "r2", "r3"}), cluster("cluster_000001", {"r4", "r5"})},
                             "run_a");

    EXPECT_EQ(stats.clusters_processed, 2u);
    EXPECT_EQ(stats.golden_records_upserted, 2u);
    EXPECT_EQ(stats.resolved_edges_upserted, 5u);

    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 2u);
    for (const auto& g : golden) {
        EXPECT_EQ(g.key, member_set_key(g.member_ids));
        EXPECT_EQ(g.run_id, "run_a");
        EXPECT_EQ(g.merge_policy, "majority");
        EXPECT_FALSE(g.fields.contains("merge_policy"));
    }

    auto edges = store.fetch_edges("resolved_to", {});
    ASSERT_EQ(edges.size(), 5u);
    for (const auto& e : edges) {
        EXPECT_EQ(e.key, directed_edge_key(e.from_id, e.to_id));
        EXPECT_DOUBLE_EQ(e.similarity, 1.0);
    }
}

TEST_F(GoldenRecordTest, MemberFieldNamedMergePolicyIsKept) {
    store.upsert_records("people", {
        Record("m1", {{"name", "Acme"}, {"merge_policy", "survivorship"}}),
        Record("m2", {{"name", "Acme"}, {"merge_policy", "survivorship"}}),
    });
    MajorityMergePolicy policy;
    GoldenRecordService service(store, policy, options());
    service.run({cluster("cluster_000000", {"m1", "m2"})}, "run_a");

    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 1u);
    EXPECT_EQ(golden[0].fields["merge_policy"], "survivorship");
    EXPECT_EQ(golden[0].merge_policy, "majority");
}

TEST_F(GoldenRecordTest, RerunIsIdempotent) {
    MajorityMergePolicy policy;
    auto o = options();
    o.batch_size = 1;
    GoldenRecordService service(store, policy, o);
    std::vector<Cluster> clusters{cluster("cluster_000000", {"r1", "r2"}), cluster("cluster_000001", {"r4", "r5"})};

    service.run(clusters, "run_a");
    auto second = service.run(clusters, "run_b");

    EXPECT_EQ(second.resolved_edges_upserted, 0u);
    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 2u);
    EXPECT_EQ(golden[0].run_id, "run_b");
    EXPECT_EQ(store.fetch_edges("resolved_to", {}).size(), 4u);
}

TEST_F(GoldenRecordTest, MissingMembers) {
    MajorityMergePolicy policy;
    GoldenRecordService service(store, policy, options());
    auto stats = service.run({cluster("cluster_000000", {"r1", "zz"}), cluster("cluster_000001", {"x1", "x2"})}, "run_a");

    EXPECT_EQ(stats.clusters_processed, 1u);
    EXPECT_EQ(stats.clusters_skipped, 1u);
    EXPECT_EQ(stats.members_missing, 3u);
    EXPECT_EQ(stats.resolved_edges_upserted, 1u);

    auto golden = store.fetch_golden_records("golden_records");
    ASSERT_EQ(golden.size(), 1u);
    EXPECT_EQ(golden[0].member_ids, (std::vector<std::string>{"r1", "zz"}));
}

TEST_F(GoldenRecordTest, RejectsBadOptions) {
    MajorityMergePolicy policy;
    GoldenRecordOptions o;
    EXPECT_THROW(GoldenRecordService(store, policy, o), ValidationError);
    o = options();
    o.batch_size = 0;
    EXPECT_THROW(GoldenRecordService(store, policy, o), ConfigurationError);
}
