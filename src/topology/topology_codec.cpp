#include <vectorcluster/topology/topology.hpp>
#include <vectorcluster/common/codec.hpp>
#include <stdexcept>

namespace VectorCluster {

namespace {

constexpr uint32_t TOPOLOGY_MAGIC = 0x54504C47;  // "TPLG"
constexpr uint8_t TOPOLOGY_VERSION = 1;

void putTransfer(ByteWriter& w, const ShardTransfer& t) {
    w.putString(t.collection);
    w.putU32(t.shard_id);
    w.putU64(t.from);
    w.putU64(t.to);
    w.putBool(t.split_from.has_value());
    w.putU32(t.split_from.value_or(0));
}

ShardTransfer getTransfer(ByteReader& r) {
    ShardTransfer t;
    t.collection = r.getString();
    t.shard_id = r.getU32();
    t.from = r.getU64();
    t.to = r.getU64();
    bool has_split = r.getBool();
    ShardId split = r.getU32();
    if (has_split) {
        t.split_from = split;
    }
    return t;
}

}  // namespace

std::vector<uint8_t> Topology::encode() const {
    ByteWriter w;
    w.putU32(TOPOLOGY_MAGIC);
    w.putU8(TOPOLOGY_VERSION);
    w.putU64(applied_index);
    w.putU64(applied_term);

    w.putU32(static_cast<uint32_t>(peers.size()));
    for (const auto& [id, peer] : peers) {
        w.putU64(id);
        w.putString(peer.address);
        w.putU8(static_cast<uint8_t>(peer.role));
    }

    w.putU32(static_cast<uint32_t>(collections.size()));
    for (const auto& [name, info] : collections) {
        w.putString(name);
        w.putU32(info.config.shard_count);
        w.putU32(info.config.replication_factor);
        w.putU32(info.config.write_consistency_factor);

        w.putU32(static_cast<uint32_t>(info.shards.size()));
        for (const auto& [shard_id, shard] : info.shards) {
            w.putU32(shard_id);
            w.putU64(shard.range.first);
            w.putU64(shard.range.last);
            w.putU32(static_cast<uint32_t>(shard.replicas.size()));
            for (const auto& [peer, state] : shard.replicas) {
                w.putU64(peer);
                w.putU8(static_cast<uint8_t>(state));
            }
        }

        w.putU32(static_cast<uint32_t>(info.transfers.size()));
        for (const auto& transfer : info.transfers) {
            putTransfer(w, transfer);
        }
    }

    w.putU32(static_cast<uint32_t>(aliases.size()));
    for (const auto& [alias, target] : aliases) {
        w.putString(alias);
        w.putString(target);
    }
    return w.take();
}

Topology Topology::decode(const std::vector<uint8_t>& data) {
    ByteReader r(data);
    if (r.getU32() != TOPOLOGY_MAGIC) {
        throw std::runtime_error("Topology snapshot has invalid magic");
    }
    uint8_t version = r.getU8();
    if (version != TOPOLOGY_VERSION) {
        throw std::runtime_error("Unsupported topology snapshot version " + std::to_string(version));
    }

    Topology t;
    t.applied_index = r.getU64();
    t.applied_term = r.getU64();

    uint32_t peer_count = r.getU32();
    for (uint32_t i = 0; i < peer_count; ++i) {
        PeerInfo peer;
        peer.peer_id = r.getU64();
        peer.address = r.getString();
        uint8_t role = r.getU8();
        if (role > static_cast<uint8_t>(PeerRole::LEARNER)) {
            throw std::runtime_error("Invalid peer role in topology snapshot");
        }
        peer.role = static_cast<PeerRole>(role);
        t.peers[peer.peer_id] = std::move(peer);
    }

    uint32_t collection_count = r.getU32();
    for (uint32_t i = 0; i < collection_count; ++i) {
        CollectionInfo info;
        info.name = r.getString();
        info.config.shard_count = r.getU32();
        info.config.replication_factor = r.getU32();
        info.config.write_consistency_factor = r.getU32();

        uint32_t shard_count = r.getU32();
        for (uint32_t s = 0; s < shard_count; ++s) {
            ShardInfo shard;
            shard.shard_id = r.getU32();
            shard.range.first = r.getU64();
            shard.range.last = r.getU64();
            uint32_t replica_count = r.getU32();
            for (uint32_t k = 0; k < replica_count; ++k) {
                PeerId peer = r.getU64();
                uint8_t state = r.getU8();
                if (state > static_cast<uint8_t>(ReplicaState::DEAD)) {
                    throw std::runtime_error("Invalid replica state in topology snapshot");
                }
                shard.replicas[peer] = static_cast<ReplicaState>(state);
            }
            info.shards[shard.shard_id] = std::move(shard);
        }

        uint32_t transfer_count = r.getU32();
        for (uint32_t k = 0; k < transfer_count; ++k) {
            info.transfers.push_back(getTransfer(r));
        }
        t.collections[info.name] = std::move(info);
    }

    uint32_t alias_count = r.getU32();
    for (uint32_t i = 0; i < alias_count; ++i) {
        std::string alias = r.getString();
        t.aliases[alias] = r.getString();
    }

    if (!r.atEnd()) {
        throw std::runtime_error("Trailing bytes after topology snapshot");
    }
    return t;
}

}  // namespace VectorCluster
