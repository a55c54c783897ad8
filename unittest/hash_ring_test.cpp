// ============================================================================
// HASH RING UNIT TESTS
// ============================================================================
// Shard ranges, routing hash and replica placement
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/topology/hash_ring.hpp>
#include <set>

using namespace VectorCluster;

TEST(HashRingTest, UniformRangesCoverWholeSpace) {
    auto ranges = uniformRanges(3);
    ASSERT_EQ(ranges.size(), 3u);
    EXPECT_EQ(ranges.front().first, 0u);
    EXPECT_EQ(ranges.back().last, std::numeric_limits<uint64_t>::max());
    for (size_t i = 1; i < ranges.size(); ++i) {
        EXPECT_EQ(ranges[i].first, ranges[i - 1].last + 1);
    }
    EXPECT_TRUE(uniformRanges(0).empty());
}

TEST(HashRingTest, EveryHashFallsIntoExactlyOneRange) {
    auto ranges = uniformRanges(4);
    for (uint64_t key = 0; key < 1000; ++key) {
        const uint64_t hash = routingHash(key);
        int owners = 0;
        for (const auto& range : ranges) {
            owners += range.contains(hash) ? 1 : 0;
        }
        EXPECT_EQ(owners, 1) << "key " << key;
    }
}

TEST(HashRingTest, RoutingHashIsStable) {
    EXPECT_EQ(routingHash(42), routingHash(42));
    EXPECT_NE(routingHash(1), routingHash(2));
}

TEST(HashRingTest, SplitHalvesRange) {
    HashRange range{100, 199};
    auto [lower, upper] = range.split();
    EXPECT_EQ(lower.first, 100u);
    EXPECT_EQ(lower.last, 149u);
    EXPECT_EQ(upper.first, 150u);
    EXPECT_EQ(upper.last, 199u);

    EXPECT_FALSE((HashRange{5, 5}).canSplit());
}

// ============================================================================
// DISTRIBUTION
// ============================================================================

TEST(HashRingTest, DistributionBalancesReplicas) {
    auto distribution = proposeDistribution(3, 2, {1, 2, 3}, {});
    ASSERT_EQ(distribution.size(), 3u);

    std::map<PeerId, size_t> load;
    for (const auto& [shard, peers] : distribution) {
        ASSERT_EQ(peers.size(), 2u);
        EXPECT_NE(peers[0], peers[1]);
        for (PeerId peer : peers) {
            load[peer]++;
        }
    }
    for (const auto& [peer, count] : load) {
        EXPECT_EQ(count, 2u) << "peer " << peer;
    }
}

TEST(HashRingTest, DistributionCapsAtPeerCount) {
    auto distribution = proposeDistribution(1, 5, {1, 2}, {});
    EXPECT_EQ(distribution.at(0), (std::vector<PeerId>{1, 2}));
}

TEST(HashRingTest, DistributionPrefersLeastLoaded) {
    auto distribution = proposeDistribution(1, 1, {1, 2, 3}, {{1, 4}, {2, 0}, {3, 1}});
    EXPECT_EQ(distribution.at(0), (std::vector<PeerId>{2}));
}

TEST(HashRingTest, DistributionWithoutPeersIsEmpty) {
    EXPECT_TRUE(proposeDistribution(2, 1, {}, {}).empty());
}
