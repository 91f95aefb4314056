/**
 * @file test_hashing.cpp
 * @brief Unit tests for BLAKE3 hashing and the content-derived keys built on it
 */

#include <gtest/gtest.h>
#include <hashing/blake3_pipeline.hpp>
#include <hashing/deterministic_keys.hpp>
#include <utils/errors.hpp>
#include <vector>
#include <string>

using namespace Coalesce;

TEST(HashingTest, Determinism) {
    std::string data = "Coalesce record r-000123";
    auto hash1 = BLAKE3Pipeline::hash(data);
    auto hash2 = BLAKE3Pipeline::hash(data);

    EXPECT_EQ(hash1, hash2);
}

TEST(HashingTest, KnownAnswer) {
    // First 16 bytes of BLAKE3("")
    EXPECT_EQ(BLAKE3Pipeline::to_hex(BLAKE3Pipeline::hash("")), "af1349b9f5f9a1a6a0404dea36dcc949");
}

TEST(HashingTest, CollisionResistance) {
    auto hash1 = BLAKE3Pipeline::hash("test1");
    auto hash2 = BLAKE3Pipeline::hash("test2");

    EXPECT_NE(hash1, hash2);
}

TEST(HashingTest, HexConversion) {
    auto hash = BLAKE3Pipeline::hash("hex_test");
    std::string hex = BLAKE3Pipeline::to_hex(hash);

    EXPECT_EQ(hex.length(), 32u); // 16 bytes * 2
    EXPECT_EQ(BLAKE3Pipeline::from_hex(hex), hash);

    // UUID-style formatting round-trips too
    std::string dashed = hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
                         hex.substr(16, 4) + "-" + hex.substr(20);
    EXPECT_EQ(BLAKE3Pipeline::from_hex(dashed), hash);
}

TEST(HashingTest, IncrementalMatchesOneShot) {
    auto parts = BLAKE3Pipeline::Hasher().update("r1").update('|').update("r2").finalize();
    EXPECT_EQ(parts, BLAKE3Pipeline::hash("r1|r2"));
    EXPECT_EQ(BLAKE3Pipeline::hash_hex("r1|r2"), BLAKE3Pipeline::to_hex(parts));
}

TEST(HashingTest, RejectsMalformedHex) {
    EXPECT_THROW(BLAKE3Pipeline::from_hex("abc"), ValidationError);
    EXPECT_THROW(BLAKE3Pipeline::from_hex(std::string(32, 'z')), ValidationError);
}

// ============================================================================
// Deterministic keys
// ============================================================================

TEST(DeterministicKeysTest, EdgeKeyIgnoresOrientation) {
    EXPECT_EQ(edge_key("r1", "r2"), edge_key("r2", "r1"));
    EXPECT_NE(edge_key("r1", "r2"), edge_key("r1", "r3"));
    EXPECT_EQ(edge_key("r1", "r2").size(), 32u);

    // Separator keeps concatenations apart
    EXPECT_NE(edge_key("ab", "c"), edge_key("a", "bc"));
}

TEST(DeterministicKeysTest, DirectedKeyKeepsOrientation) {
    EXPECT_NE(directed_edge_key("r1", "g1"), directed_edge_key("g1", "r1"));
    EXPECT_EQ(directed_edge_key("r1", "g1"), directed_edge_key("r1", "g1"));
    EXPECT_NE(directed_edge_key("r1", "r2"), edge_key("r1", "r2"));
}

TEST(DeterministicKeysTest, MemberSetKeyIsOrderFree) {
    auto k = member_set_key({"r3", "r1", "r2"});
    EXPECT_EQ(k, member_set_key({"r1", "r2", "r3"}));
    EXPECT_EQ(k, member_set_key({"r2", "r1", "r3", "r1"}));
    EXPECT_NE(k, member_set_key({"r1", "r2"}));
}
