#include <vectorcluster/consensus/messages.hpp>
#include <stdexcept>

namespace VectorCluster {

const char* toString(MessageType type) {
    switch (type) {
        case MessageType::REQUEST_VOTE:              return "RequestVote";
        case MessageType::REQUEST_VOTE_RESPONSE:     return "RequestVoteResponse";
        case MessageType::APPEND_ENTRIES:            return "AppendEntries";
        case MessageType::APPEND_ENTRIES_RESPONSE:   return "AppendEntriesResponse";
        case MessageType::INSTALL_SNAPSHOT:          return "InstallSnapshot";
        case MessageType::INSTALL_SNAPSHOT_RESPONSE: return "InstallSnapshotResponse";
        case MessageType::PROPOSE:                   return "Propose";
    }
    return "Unknown";
}

void encodeEntry(ByteWriter& w, const LogEntry& entry) {
    w.putU64(entry.term);
    w.putU64(entry.index);
    w.putU8(static_cast<uint8_t>(entry.type));
    w.putBytes(entry.data);
}

LogEntry decodeEntry(ByteReader& r) {
    LogEntry entry;
    entry.term = r.getU64();
    entry.index = r.getU64();
    uint8_t type = r.getU8();
    if (type > static_cast<uint8_t>(LogEntry::Type::COMMAND)) {
        throw std::runtime_error("Invalid log entry type " + std::to_string(type));
    }
    entry.type = static_cast<LogEntry::Type>(type);
    entry.data = r.getBytes();
    return entry;
}

namespace {

void putPeers(ByteWriter& w, const std::vector<PeerId>& peers) {
    w.putU32(static_cast<uint32_t>(peers.size()));
    for (PeerId peer : peers) {
        w.putU64(peer);
    }
}

std::vector<PeerId> getPeers(ByteReader& r) {
    std::vector<PeerId> peers(r.getU32());
    for (auto& peer : peers) {
        peer = r.getU64();
    }
    return peers;
}

}  // namespace

// Fixed layout: every field is written regardless of message type
std::vector<uint8_t> encodeMessage(const RaftMessage& m) {
    ByteWriter w;
    w.putU8(static_cast<uint8_t>(m.type));
    w.putU64(m.from);
    w.putU64(m.to);
    w.putU64(m.term);
    w.putU64(m.last_log_index);
    w.putU64(m.last_log_term);
    w.putBool(m.vote_granted);
    w.putU64(m.prev_log_index);
    w.putU64(m.prev_log_term);
    w.putU64(m.leader_commit);
    w.putU32(static_cast<uint32_t>(m.entries.size()));
    for (const auto& entry : m.entries) {
        encodeEntry(w, entry);
    }
    w.putBool(m.success);
    w.putU64(m.match_index);
    w.putU64(m.reject_hint);
    w.putU64(m.snapshot.index);
    w.putU64(m.snapshot.term);
    putPeers(w, m.snapshot.voters);
    putPeers(w, m.snapshot.learners);
    w.putBytes(m.snapshot_data);
    w.putBytes(m.proposal);
    w.putBool(m.forwarded);
    return w.take();
}

RaftMessage decodeMessage(const std::vector<uint8_t>& data) {
    ByteReader r(data);
    RaftMessage m;
    uint8_t type = r.getU8();
    if (type < static_cast<uint8_t>(MessageType::REQUEST_VOTE) ||
        type > static_cast<uint8_t>(MessageType::PROPOSE)) {
        throw std::runtime_error("Invalid raft message type " + std::to_string(type));
    }
    m.type = static_cast<MessageType>(type);
    m.from = r.getU64();
    m.to = r.getU64();
    m.term = r.getU64();
    m.last_log_index = r.getU64();
    m.last_log_term = r.getU64();
    m.vote_granted = r.getBool();
    m.prev_log_index = r.getU64();
    m.prev_log_term = r.getU64();
    m.leader_commit = r.getU64();
    uint32_t count = r.getU32();
    m.entries.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        m.entries.push_back(decodeEntry(r));
    }
    m.success = r.getBool();
    m.match_index = r.getU64();
    m.reject_hint = r.getU64();
    m.snapshot.index = r.getU64();
    m.snapshot.term = r.getU64();
    m.snapshot.voters = getPeers(r);
    m.snapshot.learners = getPeers(r);
    m.snapshot_data = r.getBytes();
    m.proposal = r.getBytes();
    m.forwarded = r.getBool();
    if (!r.atEnd()) {
        throw std::runtime_error("Trailing bytes after raft message");
    }
    return m;
}

}  // namespace VectorCluster
