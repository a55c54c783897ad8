#include <vectorcluster/topology/topology.hpp>
#include <vectorcluster/common/errors.hpp>
#include <algorithm>
#include <functional>

namespace VectorCluster {

// ============================================================================
// ENTITY HELPERS
// ============================================================================

std::optional<ReplicaState> ShardInfo::stateOf(PeerId peer) const {
    auto it = replicas.find(peer);
    if (it == replicas.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<PeerId> ShardInfo::activePeers() const {
    std::vector<PeerId> result;
    for (const auto& [peer, state] : replicas) {
        if (state == ReplicaState::ACTIVE) {
            result.push_back(peer);
        }
    }
    return result;
}

std::optional<PeerId> ShardInfo::primary() const {
    // std::map iterates in ascending peer id order
    for (const auto& [peer, state] : replicas) {
        if (state == ReplicaState::ACTIVE) {
            return peer;
        }
    }
    return std::nullopt;
}

const ShardInfo* CollectionInfo::findShard(ShardId shard_id) const {
    auto it = shards.find(shard_id);
    return it == shards.end() ? nullptr : &it->second;
}

const ShardTransfer* CollectionInfo::findTransfer(const ShardTransfer& key) const {
    for (const auto& transfer : transfers) {
        if (transfer.sameKey(key)) {
            return &transfer;
        }
    }
    return nullptr;
}

const ShardTransfer* CollectionInfo::transferTo(ShardId shard_id, PeerId peer) const {
    for (const auto& transfer : transfers) {
        if (transfer.shard_id == shard_id && transfer.to == peer) {
            return &transfer;
        }
    }
    return nullptr;
}

bool CollectionInfo::hasTransfersFor(ShardId shard_id) const {
    return std::any_of(transfers.begin(), transfers.end(), [&](const ShardTransfer& t) {
        return t.shard_id == shard_id ||
               (t.split_from.has_value() && *t.split_from == shard_id);
    });
}

// ============================================================================
// QUERIES
// ============================================================================

std::optional<CollectionId> Topology::resolveCollection(const std::string& name_or_alias) const {
    if (collections.count(name_or_alias)) {
        return name_or_alias;
    }
    auto it = aliases.find(name_or_alias);
    if (it != aliases.end()) {
        return it->second;
    }
    return std::nullopt;
}

const CollectionInfo* Topology::findCollection(const std::string& name_or_alias) const {
    auto name = resolveCollection(name_or_alias);
    if (!name) {
        return nullptr;
    }
    auto it = collections.find(*name);
    return it == collections.end() ? nullptr : &it->second;
}

const CollectionInfo& Topology::collection(const std::string& name_or_alias) const {
    const CollectionInfo* info = findCollection(name_or_alias);
    if (!info) {
        throw NotFoundError("Collection " + name_or_alias + " not found");
    }
    return *info;
}

const ShardInfo* Topology::findShard(const ShardKey& key) const {
    const CollectionInfo* info = findCollection(key.collection);
    return info ? info->findShard(key.shard_id) : nullptr;
}

const PeerInfo* Topology::findPeer(PeerId peer) const {
    auto it = peers.find(peer);
    return it == peers.end() ? nullptr : &it->second;
}

ShardId Topology::route(const std::string& name_or_alias, uint64_t routing_key) const {
    const CollectionInfo& info = collection(name_or_alias);
    const uint64_t hash = routingHash(routing_key);
    for (const auto& [shard_id, shard] : info.shards) {
        if (shard.range.contains(hash)) {
            return shard_id;
        }
    }
    // Ranges always cover the full ring; reaching here means corrupted state
    throw ServiceError("No shard of " + info.name + " covers hash " + std::to_string(hash));
}

std::vector<PeerId> Topology::voters() const {
    std::vector<PeerId> result;
    for (const auto& [id, peer] : peers) {
        if (peer.role == PeerRole::VOTER) {
            result.push_back(id);
        }
    }
    return result;
}

std::vector<PeerId> Topology::learners() const {
    std::vector<PeerId> result;
    for (const auto& [id, peer] : peers) {
        if (peer.role == PeerRole::LEARNER) {
            result.push_back(id);
        }
    }
    return result;
}

std::map<PeerId, size_t> Topology::replicaLoad() const {
    std::map<PeerId, size_t> load;
    for (const auto& [id, peer] : peers) {
        load[id] = 0;
    }
    for (const auto& [name, info] : collections) {
        for (const auto& [shard_id, shard] : info.shards) {
            for (const auto& [peer, state] : shard.replicas) {
                load[peer]++;
            }
        }
    }
    return load;
}

std::vector<ShardKey> Topology::shardsOnPeer(PeerId peer) const {
    std::vector<ShardKey> result;
    for (const auto& [name, info] : collections) {
        for (const auto& [shard_id, shard] : info.shards) {
            if (shard.hasReplica(peer)) {
                result.push_back(ShardKey{name, shard_id});
            }
        }
    }
    return result;
}

Topology Topology::bootstrap(PeerId self, const std::string& address) {
    Topology topology;
    topology.peers[self] = PeerInfo{self, address, PeerRole::VOTER};
    topology.applied_index = 1;
    topology.applied_term = 1;
    return topology;
}

bool Topology::operator==(const Topology& other) const {
    return encode() == other.encode();
}

// ============================================================================
// STATE TRANSITION
// ============================================================================

namespace {

CollectionInfo& mutableCollection(Topology& t, const std::string& name) {
    auto resolved = t.resolveCollection(name);
    if (!resolved) {
        throw NotFoundError("Collection " + name + " not found");
    }
    return t.collections.at(*resolved);
}

ShardInfo& mutableShard(CollectionInfo& info, ShardId shard_id) {
    auto it = info.shards.find(shard_id);
    if (it == info.shards.end()) {
        throw NotFoundError("Shard " + info.name + "/" + std::to_string(shard_id) + " not found");
    }
    return it->second;
}

void removeTransfersWhere(CollectionInfo& info, const std::function<bool(const ShardTransfer&)>& pred) {
    info.transfers.erase(std::remove_if(info.transfers.begin(), info.transfers.end(), pred),
                         info.transfers.end());
}

// A split child that lost every replica merges its range back into the parent
void mergeEmptySplitChild(CollectionInfo& info, ShardId child_id, ShardId parent_id) {
    auto child = info.shards.find(child_id);
    if (child == info.shards.end() || !child->second.replicas.empty()) {
        return;
    }
    auto parent = info.shards.find(parent_id);
    if (parent != info.shards.end() && parent->second.range.last + 1 == child->second.range.first) {
        parent->second.range.last = child->second.range.last;
    }
    info.shards.erase(child);
    info.config.shard_count = static_cast<uint32_t>(info.shards.size());
}

void validateTransfer(const Topology& t, const CollectionInfo& info, const ShardTransfer& transfer) {
    const ShardInfo* shard = info.findShard(transfer.shard_id);
    if (!shard) {
        throw NotFoundError("Shard " + transfer.toString() + " not found");
    }
    if (!t.findPeer(transfer.to)) {
        throw BadRequestError("Transfer target peer " + std::to_string(transfer.to) + " is unknown");
    }
    if (transfer.split_from) {
        const ShardInfo* parent = info.findShard(*transfer.split_from);
        if (!parent || parent->stateOf(transfer.from) != ReplicaState::ACTIVE) {
            throw BadRequestError("Split source " + transfer.toString() + " is not active");
        }
        return;
    }
    if (transfer.from == transfer.to) {
        throw BadRequestError("Transfer source and target are the same peer");
    }
    if (shard->stateOf(transfer.from) != ReplicaState::ACTIVE) {
        throw BadRequestError("Transfer source " + std::to_string(transfer.from) +
                              " has no active replica of " + transfer.toString());
    }
    if (shard->stateOf(transfer.to) == ReplicaState::ACTIVE) {
        throw BadRequestError("Transfer target already holds an active replica: " + transfer.toString());
    }
}

void applyCreate(Topology& t, const CreateCollection& cmd) {
    if (cmd.name.empty()) {
        throw BadRequestError("Collection name must not be empty");
    }
    if (t.collections.count(cmd.name) || t.aliases.count(cmd.name)) {
        throw BadRequestError("Collection " + cmd.name + " already exists");
    }
    if (cmd.shard_count == 0 || cmd.replication_factor == 0) {
        throw BadRequestError("shard_count and replication_factor must be positive");
    }
    if (cmd.write_consistency_factor == 0 ||
        cmd.write_consistency_factor > cmd.replication_factor) {
        throw BadRequestError("write_consistency_factor must be in [1, replication_factor]");
    }
    if (cmd.distribution.size() != cmd.shard_count) {
        throw BadRequestError("Distribution does not cover every shard");
    }

    CollectionInfo info;
    info.name = cmd.name;
    info.config = CollectionConfig{cmd.shard_count, cmd.replication_factor, cmd.write_consistency_factor};

    auto ranges = uniformRanges(cmd.shard_count);
    ShardId index = 0;
    for (const auto& [shard_id, peers] : cmd.distribution) {
        if (peers.empty()) {
            throw BadRequestError("Shard " + std::to_string(shard_id) + " has no peers");
        }
        ShardInfo shard;
        shard.shard_id = shard_id;
        shard.range = ranges[index++];
        for (PeerId peer : peers) {
            if (!t.findPeer(peer)) {
                throw BadRequestError("Peer " + std::to_string(peer) + " is not part of the cluster");
            }
            shard.replicas[peer] = ReplicaState::INITIALIZING;
        }
        info.shards[shard_id] = std::move(shard);
    }
    t.collections[cmd.name] = std::move(info);
}

void applyUpdate(Topology& t, const UpdateCollection& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.name);
    CollectionConfig config = info.config;
    if (cmd.replication_factor) {
        if (*cmd.replication_factor == 0) {
            throw BadRequestError("replication_factor must be positive");
        }
        config.replication_factor = *cmd.replication_factor;
    }
    if (cmd.write_consistency_factor) {
        config.write_consistency_factor = *cmd.write_consistency_factor;
    }
    if (config.write_consistency_factor == 0 ||
        config.write_consistency_factor > config.replication_factor) {
        throw BadRequestError("write_consistency_factor must be in [1, replication_factor]");
    }

    for (const auto& [shard_id, peer] : cmd.remove_replicas) {
        ShardInfo& shard = mutableShard(info, shard_id);
        auto state = shard.stateOf(peer);
        if (!state) {
            throw NotFoundError("Peer " + std::to_string(peer) + " has no replica of shard " +
                                std::to_string(shard_id));
        }
        if (*state == ReplicaState::ACTIVE && shard.activePeers().size() == 1) {
            throw BadRequestError("Cannot remove the last active replica of shard " +
                                  std::to_string(shard_id));
        }
        shard.replicas.erase(peer);
        removeTransfersWhere(info, [&](const ShardTransfer& tr) {
            return tr.shard_id == shard_id && (tr.to == peer || tr.from == peer);
        });
    }
    info.config = config;
}

void applyDelete(Topology& t, const DeleteCollection& cmd) {
    if (!t.collections.count(cmd.name)) {
        throw NotFoundError("Collection " + cmd.name + " not found");
    }
    t.collections.erase(cmd.name);
    for (auto it = t.aliases.begin(); it != t.aliases.end();) {
        it = (it->second == cmd.name) ? t.aliases.erase(it) : std::next(it);
    }
}

void applyAliases(Topology& t, const ChangeAliases& cmd) {
    // Work on a copy: either every action applies or none
    auto aliases = t.aliases;
    for (const auto& action : cmd.actions) {
        switch (action.kind) {
            case AliasAction::Kind::CREATE:
                if (!t.collections.count(action.collection)) {
                    throw NotFoundError("Collection " + action.collection + " not found");
                }
                if (aliases.count(action.alias) || t.collections.count(action.alias)) {
                    throw BadRequestError("Alias " + action.alias + " is already in use");
                }
                aliases[action.alias] = action.collection;
                break;
            case AliasAction::Kind::DELETE:
                if (!aliases.erase(action.alias)) {
                    throw NotFoundError("Alias " + action.alias + " not found");
                }
                break;
            case AliasAction::Kind::RENAME: {
                auto it = aliases.find(action.alias);
                if (it == aliases.end()) {
                    throw NotFoundError("Alias " + action.alias + " not found");
                }
                if (aliases.count(action.new_alias) || t.collections.count(action.new_alias)) {
                    throw BadRequestError("Alias " + action.new_alias + " is already in use");
                }
                CollectionId target = it->second;
                aliases.erase(it);
                aliases[action.new_alias] = target;
                break;
            }
        }
    }
    t.aliases = std::move(aliases);
}

void applyAddPeer(Topology& t, const AddPeer& cmd) {
    if (cmd.peer_id == NO_PEER) {
        throw BadRequestError("Peer id 0 is reserved");
    }
    auto it = t.peers.find(cmd.peer_id);
    if (it != t.peers.end()) {
        // Re-join of a known peer only refreshes its address
        it->second.address = cmd.address;
        return;
    }
    t.peers[cmd.peer_id] = PeerInfo{cmd.peer_id, cmd.address, cmd.role};
}

void applyRemovePeer(Topology& t, const RemovePeer& cmd) {
    auto it = t.peers.find(cmd.peer_id);
    if (it == t.peers.end()) {
        throw NotFoundError("Peer " + std::to_string(cmd.peer_id) + " not found");
    }
    if (it->second.role == PeerRole::VOTER && t.voters().size() == 1) {
        throw BadRequestError("Cannot remove the last voter");
    }

    for (auto& [name, info] : t.collections) {
        for (auto& [shard_id, shard] : info.shards) {
            if (!shard.hasReplica(cmd.peer_id)) {
                continue;
            }
            if (!cmd.force) {
                throw BadRequestError("Peer " + std::to_string(cmd.peer_id) +
                                      " still hosts replicas, use force to drop them");
            }
            if (shard.replicas.size() == 1) {
                throw BadRequestError("Peer " + std::to_string(cmd.peer_id) +
                                      " is the only replica of " + name + "/" + std::to_string(shard_id));
            }
            shard.replicas.erase(cmd.peer_id);
        }
        removeTransfersWhere(info, [&](const ShardTransfer& tr) {
            return tr.from == cmd.peer_id || tr.to == cmd.peer_id;
        });
    }
    t.peers.erase(it);
}

void applyPromote(Topology& t, const PromotePeer& cmd) {
    auto it = t.peers.find(cmd.peer_id);
    if (it == t.peers.end()) {
        throw NotFoundError("Peer " + std::to_string(cmd.peer_id) + " not found");
    }
    it->second.role = PeerRole::VOTER;
}

void applyReplicaState(Topology& t, const SetShardReplicaState& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.collection);
    ShardInfo& shard = mutableShard(info, cmd.shard_id);
    auto current = shard.stateOf(cmd.peer_id);
    if (!current) {
        throw NotFoundError("Peer " + std::to_string(cmd.peer_id) + " has no replica of " +
                            info.name + "/" + std::to_string(cmd.shard_id));
    }

    switch (cmd.state) {
        case ReplicaState::ACTIVE:
            if (*current == ReplicaState::DEAD) {
                throw BadRequestError("Dead replica must recover through a transfer before activation");
            }
            if (info.transferTo(cmd.shard_id, cmd.peer_id)) {
                throw BadRequestError("Replica is the target of a running transfer; finish it instead");
            }
            break;
        case ReplicaState::DEAD:
            if (*current == ReplicaState::ACTIVE && shard.activePeers().size() == 1) {
                throw BadRequestError("Cannot deactivate the last active replica of " +
                                      info.name + "/" + std::to_string(cmd.shard_id));
            }
            removeTransfersWhere(info, [&](const ShardTransfer& tr) {
                return tr.shard_id == cmd.shard_id && tr.to == cmd.peer_id;
            });
            break;
        case ReplicaState::INITIALIZING:
            break;
    }
    shard.replicas[cmd.peer_id] = cmd.state;
}

void applyStartTransfer(Topology& t, const StartTransfer& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.transfer.collection);
    validateTransfer(t, info, cmd.transfer);
    if (info.transferTo(cmd.transfer.shard_id, cmd.transfer.to)) {
        throw BadRequestError("A transfer to this replica is already running: " + cmd.transfer.toString());
    }
    ShardTransfer transfer = cmd.transfer;
    transfer.collection = info.name;
    info.shards.at(transfer.shard_id).replicas[transfer.to] = ReplicaState::INITIALIZING;
    info.transfers.push_back(std::move(transfer));
}

void applyFinishTransfer(Topology& t, const FinishTransfer& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.transfer.collection);
    ShardTransfer key = cmd.transfer;
    key.collection = info.name;
    if (!info.findTransfer(key)) {
        throw NotFoundError("Transfer " + key.toString() + " not found");
    }
    removeTransfersWhere(info, [&](const ShardTransfer& tr) { return tr.sameKey(key); });
    mutableShard(info, key.shard_id).replicas[key.to] = ReplicaState::ACTIVE;
}

void applyAbortTransfer(Topology& t, const AbortTransfer& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.transfer.collection);
    ShardTransfer key = cmd.transfer;
    key.collection = info.name;
    const ShardTransfer* found = info.findTransfer(key);
    if (!found) {
        throw NotFoundError("Transfer " + key.toString() + " not found");
    }
    std::optional<ShardId> split_from = found->split_from;
    removeTransfersWhere(info, [&](const ShardTransfer& tr) { return tr.sameKey(key); });
    mutableShard(info, key.shard_id).replicas.erase(key.to);
    if (split_from) {
        mergeEmptySplitChild(info, key.shard_id, *split_from);
    }
}

void applySplit(Topology& t, const SplitShard& cmd) {
    CollectionInfo& info = mutableCollection(t, cmd.collection);
    ShardInfo& parent = mutableShard(info, cmd.shard_id);
    if (info.shards.count(cmd.new_shard_id)) {
        throw BadRequestError("Shard id " + std::to_string(cmd.new_shard_id) + " already exists");
    }
    if (!parent.range.canSplit()) {
        throw BadRequestError("Shard range is too small to split");
    }
    if (info.hasTransfersFor(cmd.shard_id)) {
        throw BadRequestError("Shard has running transfers");
    }
    auto active = parent.activePeers();
    if (active.empty()) {
        throw BadRequestError("Shard has no active replica to split from");
    }

    auto [lower, upper] = parent.range.split();
    parent.range = lower;

    ShardInfo child;
    child.shard_id = cmd.new_shard_id;
    child.range = upper;
    for (PeerId peer : active) {
        child.replicas[peer] = ReplicaState::INITIALIZING;
        info.transfers.push_back(ShardTransfer{info.name, cmd.new_shard_id, peer, peer, cmd.shard_id});
    }
    info.shards[cmd.new_shard_id] = std::move(child);
    info.config.shard_count = static_cast<uint32_t>(info.shards.size());
}

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace

Topology Topology::applyCommand(const MetadataCommand& command) const {
    Topology next = *this;
    std::visit(Overloaded{
        [&](const CreateCollection& c) { applyCreate(next, c); },
        [&](const UpdateCollection& c) { applyUpdate(next, c); },
        [&](const DeleteCollection& c) { applyDelete(next, c); },
        [&](const ChangeAliases& c) { applyAliases(next, c); },
        [&](const AddPeer& c) { applyAddPeer(next, c); },
        [&](const RemovePeer& c) { applyRemovePeer(next, c); },
        [&](const PromotePeer& c) { applyPromote(next, c); },
        [&](const SetShardReplicaState& c) { applyReplicaState(next, c); },
        [&](const StartTransfer& c) { applyStartTransfer(next, c); },
        [&](const FinishTransfer& c) { applyFinishTransfer(next, c); },
        [&](const AbortTransfer& c) { applyAbortTransfer(next, c); },
        [&](const SplitShard& c) { applySplit(next, c); },
        [&](const Nop&) {},
    }, command);
    return next;
}

}  // namespace VectorCluster
