#pragma once

#include <cstdint>
#include <string>
#include <tuple>

namespace VectorCluster {

// ============================================================================
// IDENTIFIERS
// ============================================================================
// Peers and shards are referenced by stable integer ids everywhere; no
// component holds pointers into another node's state.

using PeerId = uint64_t;
using ShardId = uint32_t;
using OperationId = uint64_t;
using CollectionId = std::string;

constexpr PeerId NO_PEER = 0;  // Valid peer ids start at 1

// ============================================================================
// ROLES & STATES
// ============================================================================

enum class PeerRole : uint8_t {
    VOTER = 0,      // Counts toward election and commit majorities
    LEARNER = 1     // Receives the log, never votes
};

/**
 * Committed state of one replica in the topology. Only changed through
 * consensus entries.
 */
enum class ReplicaState : uint8_t {
    ACTIVE = 0,
    INITIALIZING = 1,
    DEAD = 2
};

/**
 * Health of a replica as seen by the replica set that owns it. Unlike
 * ReplicaState this is updated locally on every forward and probe.
 */
enum class ReplicaHealth : uint8_t {
    ACTIVE = 0,
    DEAD = 1,
    RESYNCING = 2
};

enum class UpdateStatus : uint8_t {
    ACKNOWLEDGED = 0,   // Durably logged on the primary
    COMPLETED = 1       // Applied by every required replica
};

const char* toString(PeerRole role);
const char* toString(ReplicaState state);
const char* toString(ReplicaHealth health);
const char* toString(UpdateStatus status);

// ============================================================================
// SHARD KEY
// ============================================================================

struct ShardKey {
    CollectionId collection;
    ShardId shard_id = 0;

    std::string toString() const {
        return collection + "/" + std::to_string(shard_id);
    }

    bool operator==(const ShardKey& other) const {
        return shard_id == other.shard_id && collection == other.collection;
    }

    bool operator<(const ShardKey& other) const {
        return std::tie(collection, shard_id) < std::tie(other.collection, other.shard_id);
    }
};

}  // namespace VectorCluster
