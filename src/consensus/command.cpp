#include <vectorcluster/consensus/command.hpp>
#include <vectorcluster/common/codec.hpp>
#include <stdexcept>
#include <type_traits>

namespace VectorCluster {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

// Tag byte written in front of every encoded command. Values are persisted in
// consensus logs: append only, never renumber.
enum class CommandTag : uint8_t {
    CREATE_COLLECTION = 1,
    UPDATE_COLLECTION = 2,
    DELETE_COLLECTION = 3,
    CHANGE_ALIASES = 4,
    ADD_PEER = 5,
    REMOVE_PEER = 6,
    PROMOTE_PEER = 7,
    SET_SHARD_REPLICA_STATE = 8,
    START_TRANSFER = 9,
    FINISH_TRANSFER = 10,
    ABORT_TRANSFER = 11,
    SPLIT_SHARD = 12,
    NOP = 13
};

void putTransfer(ByteWriter& w, const ShardTransfer& t) {
    w.putString(t.collection);
    w.putU32(t.shard_id);
    w.putU64(t.from);
    w.putU64(t.to);
    w.putBool(t.split_from.has_value());
    if (t.split_from) {
        w.putU32(*t.split_from);
    }
}

ShardTransfer getTransfer(ByteReader& r) {
    ShardTransfer t;
    t.collection = r.getString();
    t.shard_id = r.getU32();
    t.from = r.getU64();
    t.to = r.getU64();
    if (r.getBool()) {
        t.split_from = r.getU32();
    }
    return t;
}

void putOptionalU32(ByteWriter& w, const std::optional<uint32_t>& v) {
    w.putBool(v.has_value());
    if (v) {
        w.putU32(*v);
    }
}

std::optional<uint32_t> getOptionalU32(ByteReader& r) {
    if (r.getBool()) {
        return r.getU32();
    }
    return std::nullopt;
}

template <typename E>
E checkedEnum(uint8_t raw, uint8_t max, const char* what) {
    if (raw > max) {
        throw std::runtime_error(std::string("Invalid ") + what + " value: " + std::to_string(raw));
    }
    return static_cast<E>(raw);
}

}  // namespace

std::string ShardTransfer::toString() const {
    std::string s = collection + "/" + std::to_string(shard_id) + " " +
                    std::to_string(from) + "->" + std::to_string(to);
    if (split_from) {
        s += " (split of " + std::to_string(*split_from) + ")";
    }
    return s;
}

// ============================================================================
// ENCODE
// ============================================================================

std::vector<uint8_t> encodeCommand(const MetadataCommand& command) {
    ByteWriter w;
    std::visit(Overloaded{
        [&](const CreateCollection& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::CREATE_COLLECTION));
            w.putString(c.name);
            w.putU32(c.shard_count);
            w.putU32(c.replication_factor);
            w.putU32(c.write_consistency_factor);
            w.putU32(static_cast<uint32_t>(c.distribution.size()));
            for (const auto& [shard, peers] : c.distribution) {
                w.putU32(shard);
                w.putU32(static_cast<uint32_t>(peers.size()));
                for (PeerId peer : peers) {
                    w.putU64(peer);
                }
            }
        },
        [&](const UpdateCollection& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::UPDATE_COLLECTION));
            w.putString(c.name);
            putOptionalU32(w, c.replication_factor);
            putOptionalU32(w, c.write_consistency_factor);
            w.putU32(static_cast<uint32_t>(c.remove_replicas.size()));
            for (const auto& [shard, peer] : c.remove_replicas) {
                w.putU32(shard);
                w.putU64(peer);
            }
        },
        [&](const DeleteCollection& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::DELETE_COLLECTION));
            w.putString(c.name);
        },
        [&](const ChangeAliases& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::CHANGE_ALIASES));
            w.putU32(static_cast<uint32_t>(c.actions.size()));
            for (const auto& action : c.actions) {
                w.putU8(static_cast<uint8_t>(action.kind));
                w.putString(action.collection);
                w.putString(action.alias);
                w.putString(action.new_alias);
            }
        },
        [&](const AddPeer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::ADD_PEER));
            w.putU64(c.peer_id);
            w.putString(c.address);
            w.putU8(static_cast<uint8_t>(c.role));
        },
        [&](const RemovePeer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::REMOVE_PEER));
            w.putU64(c.peer_id);
            w.putBool(c.force);
        },
        [&](const PromotePeer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::PROMOTE_PEER));
            w.putU64(c.peer_id);
        },
        [&](const SetShardReplicaState& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::SET_SHARD_REPLICA_STATE));
            w.putString(c.collection);
            w.putU32(c.shard_id);
            w.putU64(c.peer_id);
            w.putU8(static_cast<uint8_t>(c.state));
        },
        [&](const StartTransfer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::START_TRANSFER));
            putTransfer(w, c.transfer);
        },
        [&](const FinishTransfer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::FINISH_TRANSFER));
            putTransfer(w, c.transfer);
        },
        [&](const AbortTransfer& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::ABORT_TRANSFER));
            putTransfer(w, c.transfer);
            w.putString(c.reason);
        },
        [&](const SplitShard& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::SPLIT_SHARD));
            w.putString(c.collection);
            w.putU32(c.shard_id);
            w.putU32(c.new_shard_id);
        },
        [&](const Nop& c) {
            w.putU8(static_cast<uint8_t>(CommandTag::NOP));
            w.putU64(c.token);
        },
    }, command);
    return w.take();
}

// ============================================================================
// DECODE
// ============================================================================

MetadataCommand decodeCommand(const std::vector<uint8_t>& data) {
    ByteReader r(data);
    const auto tag = static_cast<CommandTag>(r.getU8());

    MetadataCommand result;
    switch (tag) {
        case CommandTag::CREATE_COLLECTION: {
            CreateCollection c;
            c.name = r.getString();
            c.shard_count = r.getU32();
            c.replication_factor = r.getU32();
            c.write_consistency_factor = r.getU32();
            uint32_t shards = r.getU32();
            for (uint32_t i = 0; i < shards; ++i) {
                ShardId shard = r.getU32();
                uint32_t count = r.getU32();
                auto& peers = c.distribution[shard];
                for (uint32_t j = 0; j < count; ++j) {
                    peers.push_back(r.getU64());
                }
            }
            result = std::move(c);
            break;
        }
        case CommandTag::UPDATE_COLLECTION: {
            UpdateCollection c;
            c.name = r.getString();
            c.replication_factor = getOptionalU32(r);
            c.write_consistency_factor = getOptionalU32(r);
            uint32_t count = r.getU32();
            for (uint32_t i = 0; i < count; ++i) {
                ShardId shard = r.getU32();
                PeerId peer = r.getU64();
                c.remove_replicas.emplace_back(shard, peer);
            }
            result = std::move(c);
            break;
        }
        case CommandTag::DELETE_COLLECTION:
            result = DeleteCollection{r.getString()};
            break;
        case CommandTag::CHANGE_ALIASES: {
            ChangeAliases c;
            uint32_t count = r.getU32();
            for (uint32_t i = 0; i < count; ++i) {
                AliasAction action;
                action.kind = checkedEnum<AliasAction::Kind>(r.getU8(), 2, "alias action");
                action.collection = r.getString();
                action.alias = r.getString();
                action.new_alias = r.getString();
                c.actions.push_back(std::move(action));
            }
            result = std::move(c);
            break;
        }
        case CommandTag::ADD_PEER: {
            AddPeer c;
            c.peer_id = r.getU64();
            c.address = r.getString();
            c.role = checkedEnum<PeerRole>(r.getU8(), 1, "peer role");
            result = std::move(c);
            break;
        }
        case CommandTag::REMOVE_PEER: {
            RemovePeer c;
            c.peer_id = r.getU64();
            c.force = r.getBool();
            result = c;
            break;
        }
        case CommandTag::PROMOTE_PEER:
            result = PromotePeer{r.getU64()};
            break;
        case CommandTag::SET_SHARD_REPLICA_STATE: {
            SetShardReplicaState c;
            c.collection = r.getString();
            c.shard_id = r.getU32();
            c.peer_id = r.getU64();
            c.state = checkedEnum<ReplicaState>(r.getU8(), 2, "replica state");
            result = std::move(c);
            break;
        }
        case CommandTag::START_TRANSFER:
            result = StartTransfer{getTransfer(r)};
            break;
        case CommandTag::FINISH_TRANSFER:
            result = FinishTransfer{getTransfer(r)};
            break;
        case CommandTag::ABORT_TRANSFER: {
            AbortTransfer c;
            c.transfer = getTransfer(r);
            c.reason = r.getString();
            result = std::move(c);
            break;
        }
        case CommandTag::SPLIT_SHARD: {
            SplitShard c;
            c.collection = r.getString();
            c.shard_id = r.getU32();
            c.new_shard_id = r.getU32();
            result = std::move(c);
            break;
        }
        case CommandTag::NOP:
            result = Nop{r.getU64()};
            break;
        default:
            throw std::runtime_error("Unknown command tag: " +
                                     std::to_string(static_cast<int>(tag)));
    }

    if (!r.atEnd()) {
        throw std::runtime_error("Trailing bytes after command");
    }
    return result;
}

// ============================================================================
// CLASSIFICATION
// ============================================================================

bool isMembershipCommand(const MetadataCommand& command) {
    return std::holds_alternative<AddPeer>(command) ||
           std::holds_alternative<RemovePeer>(command) ||
           std::holds_alternative<PromotePeer>(command);
}

bool isMembershipCommand(const std::vector<uint8_t>& encoded) {
    if (encoded.empty()) {
        return false;
    }
    auto tag = static_cast<CommandTag>(encoded[0]);
    return tag == CommandTag::ADD_PEER || tag == CommandTag::REMOVE_PEER ||
           tag == CommandTag::PROMOTE_PEER;
}

const char* commandName(const MetadataCommand& command) {
    return std::visit(Overloaded{
        [](const CreateCollection&) { return "CreateCollection"; },
        [](const UpdateCollection&) { return "UpdateCollection"; },
        [](const DeleteCollection&) { return "DeleteCollection"; },
        [](const ChangeAliases&) { return "ChangeAliases"; },
        [](const AddPeer&) { return "AddPeer"; },
        [](const RemovePeer&) { return "RemovePeer"; },
        [](const PromotePeer&) { return "PromotePeer"; },
        [](const SetShardReplicaState&) { return "SetShardReplicaState"; },
        [](const StartTransfer&) { return "StartTransfer"; },
        [](const FinishTransfer&) { return "FinishTransfer"; },
        [](const AbortTransfer&) { return "AbortTransfer"; },
        [](const SplitShard&) { return "SplitShard"; },
        [](const Nop&) { return "Nop"; },
    }, command);
}

}  // namespace VectorCluster
