#pragma once

#include <vectorcluster/consensus/command.hpp>
#include <vectorcluster/consensus/consensus_storage.hpp>
#include <vectorcluster/consensus/raft.hpp>
#include <vectorcluster/topology/registry.hpp>
#include <vectorcluster/transport/transport.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

struct ConsensusOptions {
    RaftConfig raft;
    std::chrono::milliseconds propose_timeout{5000};
    uint64_t snapshot_threshold = 1000;     // Applied entries between snapshots
    std::string data_dir;                   // Empty keeps consensus state in memory
    bool bootstrap = false;                 // Start a new cluster if there is no state
    std::string self_address;
    std::vector<PeerId> seed_peers;         // Contacted while no leader is known
};

struct ClusterStatus {
    PeerId peer_id = NO_PEER;
    RaftState role = RaftState::FOLLOWER;
    uint64_t term = 0;
    uint64_t commit = 0;
    uint64_t applied = 0;
    std::optional<PeerId> leader;
    bool is_voter = false;
    size_t peers = 0;
    size_t pending_operations = 0;
    uint64_t message_send_failures = 0;
};

/**
 * @class ConsensusService
 * @brief Drives a RaftNode and applies committed entries to the registry.
 *
 * Callers on any thread may propose; tick() and handleMessage() are expected
 * from the node's driver thread. Committed entries are applied in index order,
 * exactly once per node: after a restart, entries up to the persisted applied
 * index rebuild the registry without invoking the apply callback.
 */
class ConsensusService {
public:
    // Called after each newly applied command with the user error it produced,
    // if any. Runs on the apply path: it must not wait for another proposal.
    using ApplyCallback = std::function<void(uint64_t index, const MetadataCommand& command,
                                             std::exception_ptr error)>;

    ConsensusService(ConsensusOptions options, TopologyRegistry& registry, Transport& transport);
    ~ConsensusService();

    ConsensusService(const ConsensusService&) = delete;
    ConsensusService& operator=(const ConsensusService&) = delete;

    void setApplyCallback(ApplyCallback callback);

    /**
     * @brief Load persisted state (or bootstrap) and apply what is committed.
     * @throws StorageError if persisted state cannot be read
     */
    void start();

    void tick();
    void handleMessage(const RaftMessage& message);
    void campaign();

    /**
     * @brief Replicate a command and wait until this node applied it.
     *
     * @param with_confirmation also commit a Nop afterwards, so the caller
     *        knows every entry before it is applied by a majority
     * @return index of the applied entry
     * @throws NotLeaderError when this node is not the leader
     * @throws TimeoutError if not applied in time (outcome unknown)
     * @throws BadRequestError / NotFoundError when the committed command was rejected
     * @throws ConfChangeInProgressError for a second concurrent membership change
     */
    uint64_t propose(const MetadataCommand& command,
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt,
                     bool with_confirmation = false);

    /**
     * @brief Fire-and-forget proposal, relayed to the leader if needed.
     *
     * For idempotent internal commands that are re-issued until the committed
     * topology reflects them.
     */
    void proposeAsync(const MetadataCommand& command);

    bool isLeader() const;
    std::optional<PeerId> leaderId() const;
    bool hasFailed() const { return failed_.load(); }
    ClusterStatus status() const;

    PeerId selfId() const { return options_.raft.id; }

private:
    struct PendingProposal {
        uint64_t term = 0;
        std::promise<void> promise;
    };

    void processReady();
    void applyEntry(const LogEntry& entry);
    void resolvePending(uint64_t index, uint64_t term, std::exception_ptr error);
    void failPendingUpTo(uint64_t index);
    void sendAll(const std::vector<RaftMessage>& messages);

    ConsensusOptions options_;
    TopologyRegistry& registry_;
    Transport& transport_;
    ApplyCallback apply_callback_;

    std::unique_ptr<ConsensusStorage> storage_;
    std::unique_ptr<RaftNode> raft_;
    uint64_t replay_until_ = 0;         // Applied before the last restart
    std::atomic<bool> started_{false};
    std::atomic<bool> failed_{false};

    mutable std::mutex mutex_;          // Guards raft_
    std::mutex apply_mutex_;            // Serializes the apply path
    mutable std::mutex pending_mutex_;
    std::map<uint64_t, PendingProposal> pending_;
};

}  // namespace VectorCluster
