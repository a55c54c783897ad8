#pragma once

#include <vectorcluster/common/types.hpp>
#include <vectorcluster/topology/hash_ring.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace VectorCluster {

// ============================================================================
// METADATA COMMANDS
// ============================================================================
// Payload of a consensus log entry. Applying a command is a pure function of
// the previous topology, so every node derives the same state.

struct CreateCollection {
    CollectionId name;
    uint32_t shard_count = 1;
    uint32_t replication_factor = 1;
    uint32_t write_consistency_factor = 1;
    ShardDistribution distribution;     // Filled by the proposer from committed topology
};

struct UpdateCollection {
    CollectionId name;
    std::optional<uint32_t> replication_factor;
    std::optional<uint32_t> write_consistency_factor;
    std::vector<std::pair<ShardId, PeerId>> remove_replicas;   // Surplus when lowering the factor
};

struct DeleteCollection {
    CollectionId name;
};

struct AliasAction {
    enum class Kind : uint8_t {
        CREATE = 0,
        DELETE = 1,
        RENAME = 2
    };

    Kind kind = Kind::CREATE;
    CollectionId collection;    // CREATE only
    std::string alias;          // CREATE / DELETE / RENAME (old name)
    std::string new_alias;      // RENAME only
};

struct ChangeAliases {
    std::vector<AliasAction> actions;
};

struct AddPeer {
    PeerId peer_id = NO_PEER;
    std::string address;
    PeerRole role = PeerRole::VOTER;
};

struct RemovePeer {
    PeerId peer_id = NO_PEER;
    bool force = false;
};

struct PromotePeer {
    PeerId peer_id = NO_PEER;
};

struct SetShardReplicaState {
    CollectionId collection;
    ShardId shard_id = 0;
    PeerId peer_id = NO_PEER;
    ReplicaState state = ReplicaState::ACTIVE;
};

/**
 * @brief Movement of one shard replica from a source peer to a target peer.
 *
 * For split transfers split_from names the parent shard and from == to:
 * the target peer copies the moved range out of its own parent replica.
 */
struct ShardTransfer {
    CollectionId collection;
    ShardId shard_id = 0;
    PeerId from = NO_PEER;
    PeerId to = NO_PEER;
    std::optional<ShardId> split_from;

    bool sameKey(const ShardTransfer& other) const {
        return shard_id == other.shard_id && from == other.from &&
               to == other.to && collection == other.collection;
    }

    std::string toString() const;
};

struct StartTransfer {
    ShardTransfer transfer;
};

struct FinishTransfer {
    ShardTransfer transfer;
};

struct AbortTransfer {
    ShardTransfer transfer;
    std::string reason;
};

struct SplitShard {
    CollectionId collection;
    ShardId shard_id = 0;
    ShardId new_shard_id = 0;
};

struct Nop {
    uint64_t token = 0;
};

using MetadataCommand = std::variant<
    CreateCollection,
    UpdateCollection,
    DeleteCollection,
    ChangeAliases,
    AddPeer,
    RemovePeer,
    PromotePeer,
    SetShardReplicaState,
    StartTransfer,
    FinishTransfer,
    AbortTransfer,
    SplitShard,
    Nop>;

// ============================================================================
// ENCODING
// ============================================================================

std::vector<uint8_t> encodeCommand(const MetadataCommand& command);

/**
 * @throws std::runtime_error on malformed input
 */
MetadataCommand decodeCommand(const std::vector<uint8_t>& data);

/**
 * @brief Membership commands (add/remove/promote peer) must be applied one at
 * a time; consensus inspects entries with this before accepting a proposal.
 */
bool isMembershipCommand(const MetadataCommand& command);
bool isMembershipCommand(const std::vector<uint8_t>& encoded);

const char* commandName(const MetadataCommand& command);

}  // namespace VectorCluster
