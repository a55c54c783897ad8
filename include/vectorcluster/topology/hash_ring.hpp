#pragma once

#include <vectorcluster/common/types.hpp>
#include <cstdint>
#include <limits>
#include <map>
#include <utility>
#include <vector>

namespace VectorCluster {

/**
 * @brief Inclusive range of the 64-bit routing hash space owned by a shard.
 */
struct HashRange {
    uint64_t first = 0;
    uint64_t last = std::numeric_limits<uint64_t>::max();

    bool contains(uint64_t hash) const { return hash >= first && hash <= last; }
    bool canSplit() const { return last > first; }

    // Lower half stays with the parent, upper half goes to the new shard
    std::pair<HashRange, HashRange> split() const;

    bool operator==(const HashRange& other) const {
        return first == other.first && last == other.last;
    }
};

/**
 * @brief Mix a routing key (point id) onto the hash ring.
 *
 * Must stay stable across releases: committed shard ranges refer to it.
 */
uint64_t routingHash(uint64_t routing_key);

/**
 * @brief Split the full hash space into shard_count contiguous ranges.
 */
std::vector<HashRange> uniformRanges(uint32_t shard_count);

using ShardDistribution = std::map<ShardId, std::vector<PeerId>>;

/**
 * @brief Assign replicas of shard_count shards to peers.
 *
 * Every shard gets min(replication_factor, peers.size()) distinct peers,
 * always picking the least loaded peer first (ties broken by lower id).
 * Deterministic for equal inputs.
 *
 * @param current_load Number of replicas each peer already hosts
 */
ShardDistribution proposeDistribution(uint32_t shard_count,
                                      uint32_t replication_factor,
                                      const std::vector<PeerId>& peers,
                                      const std::map<PeerId, size_t>& current_load);

}  // namespace VectorCluster
