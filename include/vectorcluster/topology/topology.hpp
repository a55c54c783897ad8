#pragma once

#include <vectorcluster/common/types.hpp>
#include <vectorcluster/consensus/command.hpp>
#include <vectorcluster/topology/hash_ring.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

// ============================================================================
// TOPOLOGY ENTITIES
// ============================================================================

struct PeerInfo {
    PeerId peer_id = NO_PEER;
    std::string address;
    PeerRole role = PeerRole::VOTER;

    bool operator==(const PeerInfo& other) const = default;
};

struct ShardInfo {
    ShardId shard_id = 0;
    HashRange range;
    std::map<PeerId, ReplicaState> replicas;

    bool hasReplica(PeerId peer) const { return replicas.count(peer) > 0; }
    std::optional<ReplicaState> stateOf(PeerId peer) const;
    std::vector<PeerId> activePeers() const;

    // Lowest Active peer id sequences writes for the shard
    std::optional<PeerId> primary() const;

    bool operator==(const ShardInfo& other) const = default;
};

struct CollectionConfig {
    uint32_t shard_count = 1;
    uint32_t replication_factor = 1;
    uint32_t write_consistency_factor = 1;

    bool operator==(const CollectionConfig& other) const = default;
};

struct CollectionInfo {
    CollectionId name;
    CollectionConfig config;
    std::map<ShardId, ShardInfo> shards;
    std::vector<ShardTransfer> transfers;

    const ShardInfo* findShard(ShardId shard_id) const;
    const ShardTransfer* findTransfer(const ShardTransfer& key) const;
    const ShardTransfer* transferTo(ShardId shard_id, PeerId peer) const;
    bool hasTransfersFor(ShardId shard_id) const;
};

// ============================================================================
// TOPOLOGY SNAPSHOT
// ============================================================================

/**
 * @class Topology
 * @brief Materialized view of every applied consensus entry.
 *
 * Published as std::shared_ptr<const Topology>; a value is never modified
 * after publication. applyCommand() returns the successor value and leaves
 * this one untouched, so a rejected command cannot leave partial state.
 */
struct Topology {
    std::map<PeerId, PeerInfo> peers;
    std::map<CollectionId, CollectionInfo> collections;
    std::map<std::string, CollectionId> aliases;    // alias -> collection
    uint64_t applied_index = 0;
    uint64_t applied_term = 0;

    // ========================================================================
    // QUERIES
    // ========================================================================

    std::optional<CollectionId> resolveCollection(const std::string& name_or_alias) const;
    const CollectionInfo* findCollection(const std::string& name_or_alias) const;

    /**
     * @throws NotFoundError if neither a collection nor an alias matches
     */
    const CollectionInfo& collection(const std::string& name_or_alias) const;

    const ShardInfo* findShard(const ShardKey& key) const;
    const PeerInfo* findPeer(PeerId peer) const;

    /**
     * @brief Shard owning routing_key according to the committed hash ranges.
     * @throws NotFoundError for unknown collections
     */
    ShardId route(const std::string& name_or_alias, uint64_t routing_key) const;

    std::vector<PeerId> voters() const;
    std::vector<PeerId> learners() const;

    // Replica count per peer, every peer listed (zero included)
    std::map<PeerId, size_t> replicaLoad() const;

    std::vector<ShardKey> shardsOnPeer(PeerId peer) const;

    // ========================================================================
    // STATE TRANSITION
    // ========================================================================

    /**
     * @brief Successor topology after applying command.
     *
     * Pure and deterministic: equal inputs produce equal outputs on every node.
     * Does not touch applied_index / applied_term.
     *
     * @throws BadRequestError or NotFoundError for commands that are invalid
     *         against this topology (user errors, the entry is still consumed)
     */
    Topology applyCommand(const MetadataCommand& command) const;

    // ========================================================================
    // SERIALIZATION (consensus snapshot payload)
    // ========================================================================

    std::vector<uint8_t> encode() const;

    /**
     * @throws std::runtime_error on malformed input
     */
    static Topology decode(const std::vector<uint8_t>& data);

    /**
     * @brief Initial state of a freshly bootstrapped cluster: one voter.
     */
    static Topology bootstrap(PeerId self, const std::string& address);

    bool operator==(const Topology& other) const;
};

}  // namespace VectorCluster
