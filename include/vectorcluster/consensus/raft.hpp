// ============================================================================
// CLUSTER CONSENSUS - RAFT PROTOCOL
// ============================================================================
// Raft Consensus Algorithm:
// - Strong leader model: at most one leader per term
// - Log replication: all metadata changes go through the leader
// - State machine: committed entries applied in index order on every node
// - Safety: if it's committed, all future leaders have it
//
// RaftNode is a deterministic state machine: it never blocks, never starts
// threads and performs no network I/O. The owner drives it with tick() and
// step(), then drains outbound messages, committed entries and received
// snapshots. It is not thread-safe; ConsensusService serializes access.
// ============================================================================

#pragma once

#include <vectorcluster/consensus/consensus_storage.hpp>
#include <vectorcluster/consensus/messages.hpp>
#include <vectorcluster/consensus/raft_log.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <utility>
#include <vector>

namespace VectorCluster {

enum class RaftState {
    FOLLOWER = 0,       // Receiving RPCs from leader or candidate
    CANDIDATE = 1,      // Competing to become leader
    LEADER = 2          // Elected leader, sending heartbeats
};

const char* toString(RaftState state);

struct RaftConfig {
    PeerId id = NO_PEER;
    uint32_t election_timeout_min_ticks = 10;
    uint32_t election_timeout_max_ticks = 20;
    uint32_t heartbeat_interval_ticks = 2;
    size_t max_entries_per_message = 64;
    bool check_quorum = true;       // Leader steps down without majority contact
    uint64_t seed = 0;              // Election timeout RNG seed, 0 = random
};

struct ProposalPosition {
    uint64_t index = 0;
    uint64_t term = 0;
};

class RaftNode {
public:
    // ========================================================================
    // PUBLIC API
    // ========================================================================

    /**
     * @param storage Durable state; nullptr keeps everything in memory.
     *        Existing state is loaded from it.
     */
    explicit RaftNode(RaftConfig config, ConsensusStorage* storage = nullptr);

    /**
     * @brief Initialize an empty node as a single-voter cluster.
     *
     * Creates a snapshot at (index 1, term 1) holding data. No-op if the
     * node already has state.
     * @return true if the node was bootstrapped
     */
    bool bootstrap(std::vector<uint8_t> data);

    // Advance logical time by one tick
    void tick();

    // Handle a message from a peer
    void step(const RaftMessage& message);

    /**
     * @brief Append a command entry on the leader.
     * @throws NotLeaderError on followers and candidates
     * @throws ConfChangeInProgressError for a membership command while an
     *         earlier one is not yet applied
     */
    ProposalPosition propose(std::vector<uint8_t> data);

    // Start an election immediately (voters only)
    void campaign();

    // Replace the voter/learner sets with the ones from the applied topology
    void setMembership(const std::vector<PeerId>& voters, const std::vector<PeerId>& learners);

    // ========================================================================
    // READY OUTPUT
    // ========================================================================

    std::vector<RaftMessage> takeMessages();

    // Entries newly committed since the last call; marks them applied
    std::vector<LogEntry> takeCommittedEntries();

    // Snapshot to install into the state machine (received or loaded)
    std::optional<std::pair<SnapshotMeta, std::vector<uint8_t>>> takePendingSnapshot();

    /**
     * @brief Record a state machine snapshot at index (<= applied) and drop
     * the log prefix it covers.
     */
    void compact(uint64_t index, std::vector<uint8_t> data);

    // ========================================================================
    // QUERIES
    // ========================================================================

    PeerId getNodeId() const { return config_.id; }
    RaftState getState() const { return state_; }
    uint64_t getCurrentTerm() const { return term_; }
    std::optional<PeerId> getLeaderId() const {
        return leader_ == NO_PEER ? std::nullopt : std::make_optional(leader_);
    }
    bool isLeader() const { return state_ == RaftState::LEADER; }
    bool isVoter() const { return voters_.count(config_.id) > 0; }
    uint64_t getCommitIndex() const { return commit_; }
    uint64_t getAppliedIndex() const { return applied_; }
    uint64_t getLastLogIndex() const { return log_.lastIndex(); }
    uint64_t getSnapshotIndex() const { return log_.snapshotIndex(); }
    const RaftLog& getLog() const { return log_; }
    std::vector<PeerId> getVoters() const { return {voters_.begin(), voters_.end()}; }
    std::vector<PeerId> getLearners() const { return {learners_.begin(), learners_.end()}; }

    // Statistics
    struct Stats {
        uint64_t log_size;
        uint64_t commit_index;
        uint64_t applied_index;
        uint64_t snapshot_index;
        uint64_t term;
        RaftState state;
        std::optional<PeerId> leader_id;
        size_t voters;
        size_t learners;
    };
    Stats getStats() const;

private:
    // Replication progress of one peer, leader only
    struct Progress {
        uint64_t next_index = 1;
        uint64_t match_index = 0;
        bool recent_active = false;
        uint32_t snapshot_wait_ticks = 0;   // > 0 while a snapshot is in flight
    };

    // ========================================================================
    // ROLE TRANSITIONS
    // ========================================================================
    void becomeFollower(uint64_t term, PeerId leader);
    void becomeCandidate();
    void becomeLeader();
    void resetElectionTimer();

    // ========================================================================
    // MESSAGE HANDLERS
    // ========================================================================
    void handleRequestVote(const RaftMessage& m);
    void handleVoteResponse(const RaftMessage& m);
    void handleAppendEntries(const RaftMessage& m);
    void handleAppendResponse(const RaftMessage& m);
    void handleInstallSnapshot(const RaftMessage& m);
    void handleSnapshotResponse(const RaftMessage& m);
    void handlePropose(const RaftMessage& m);

    // ========================================================================
    // LEADER HELPERS
    // ========================================================================
    void broadcastAppend();
    void sendAppend(PeerId peer);
    bool maybeCommit();
    bool checkQuorumActive();
    size_t quorum() const { return voters_.size() / 2 + 1; }
    void syncProgress();

    // ========================================================================
    // PERSISTENCE
    // ========================================================================
    void restoreFromStorage();
    void persistHardState();
    void persistAppend(const std::vector<LogEntry>& entries);
    void persistLogRewrite();

    void send(RaftMessage message);
    std::set<PeerId> replicationTargets() const;

    RaftConfig config_;
    ConsensusStorage* storage_;

    // ========================================================================
    // PERSISTENT STATE (on all servers)
    // ========================================================================
    uint64_t term_ = 0;
    PeerId voted_for_ = NO_PEER;
    RaftLog log_;
    SnapshotMeta snapshot_meta_;
    std::vector<uint8_t> snapshot_data_;

    // ========================================================================
    // VOLATILE STATE (on all servers)
    // ========================================================================
    RaftState state_ = RaftState::FOLLOWER;
    PeerId leader_ = NO_PEER;
    uint64_t commit_ = 0;
    uint64_t applied_ = 0;
    std::set<PeerId> voters_;
    std::set<PeerId> learners_;
    uint32_t election_elapsed_ = 0;
    uint32_t heartbeat_elapsed_ = 0;
    uint32_t randomized_timeout_ = 0;
    std::mt19937_64 rng_;

    // ========================================================================
    // VOLATILE STATE (candidates & leaders)
    // ========================================================================
    std::map<PeerId, bool> votes_;
    std::map<PeerId, Progress> progress_;
    uint64_t pending_conf_index_ = 0;

    // ========================================================================
    // READY OUTPUT
    // ========================================================================
    std::vector<RaftMessage> outbox_;
    std::optional<std::pair<SnapshotMeta, std::vector<uint8_t>>> pending_snapshot_;
};

}  // namespace VectorCluster
