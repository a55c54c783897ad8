// ============================================================================
// CLUSTER CONSENSUS - RAFT MESSAGES
// ============================================================================
// Log entries, snapshot metadata and the peer-to-peer messages exchanged by
// RaftNode instances. Entries carry encoded MetadataCommands; the consensus
// core itself treats them as opaque bytes.
// ============================================================================

#pragma once

#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/types.hpp>
#include <cstdint>
#include <vector>

namespace VectorCluster {

// ============================================================================
// LOG ENTRY FOR REPLICATED STATE
// ============================================================================

struct LogEntry {
    enum class Type : uint8_t {
        EMPTY = 0,          // Appended by a new leader to commit earlier terms
        COMMAND = 1         // Encoded MetadataCommand
    };

    uint64_t term = 0;      // Term when entry was received by leader
    uint64_t index = 0;     // Position in log
    Type type = Type::EMPTY;
    std::vector<uint8_t> data;

    bool operator==(const LogEntry& other) const = default;
};

/**
 * @brief Position and membership a snapshot is consistent with.
 */
struct SnapshotMeta {
    uint64_t index = 0;
    uint64_t term = 0;
    std::vector<PeerId> voters;
    std::vector<PeerId> learners;
};

/**
 * @brief Raft state that must survive restart.
 */
struct HardState {
    uint64_t term = 0;
    PeerId voted_for = NO_PEER;
    uint64_t commit = 0;
};

// ============================================================================
// PEER MESSAGES
// ============================================================================

enum class MessageType : uint8_t {
    REQUEST_VOTE = 1,
    REQUEST_VOTE_RESPONSE = 2,
    APPEND_ENTRIES = 3,
    APPEND_ENTRIES_RESPONSE = 4,
    INSTALL_SNAPSHOT = 5,
    INSTALL_SNAPSHOT_RESPONSE = 6,
    PROPOSE = 7                 // Proposal forwarded to the leader, term-less
};

const char* toString(MessageType type);

struct RaftMessage {
    MessageType type = MessageType::APPEND_ENTRIES;
    PeerId from = NO_PEER;
    PeerId to = NO_PEER;
    uint64_t term = 0;

    // REQUEST_VOTE
    uint64_t last_log_index = 0;
    uint64_t last_log_term = 0;

    // REQUEST_VOTE_RESPONSE
    bool vote_granted = false;

    // APPEND_ENTRIES
    uint64_t prev_log_index = 0;
    uint64_t prev_log_term = 0;
    uint64_t leader_commit = 0;
    std::vector<LogEntry> entries;

    // APPEND_ENTRIES_RESPONSE / INSTALL_SNAPSHOT_RESPONSE
    bool success = false;
    uint64_t match_index = 0;
    uint64_t reject_hint = 0;   // Highest index the follower may still share

    // INSTALL_SNAPSHOT
    SnapshotMeta snapshot;
    std::vector<uint8_t> snapshot_data;

    // PROPOSE
    std::vector<uint8_t> proposal;
    bool forwarded = false;     // Already relayed once by a follower
};

std::vector<uint8_t> encodeMessage(const RaftMessage& message);

/**
 * @throws std::runtime_error on malformed input
 */
RaftMessage decodeMessage(const std::vector<uint8_t>& data);

void encodeEntry(ByteWriter& writer, const LogEntry& entry);
LogEntry decodeEntry(ByteReader& reader);

}  // namespace VectorCluster
