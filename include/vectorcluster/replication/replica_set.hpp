#pragma once

#include <vectorcluster/replication/local_replica.hpp>
#include <vectorcluster/replication/replication_types.hpp>
#include <vectorcluster/topology/topology.hpp>
#include <vectorcluster/transport/transport.hpp>
#include <vectorcluster/utils/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

struct ReplicationOptions {
    std::chrono::milliseconds forward_timeout{1000};
    std::chrono::milliseconds health_probe_interval{1000};
    size_t oplog_retention = 1000;          // Operations kept below the apply position
    uint32_t transfer_max_attempts = 10;
    std::chrono::milliseconds transfer_backoff{200};
    uint32_t fetch_batch = 256;
    size_t worker_threads = 4;
};

/**
 * @brief Replica as tracked by the set that owns the shard.
 */
struct RemoteReplicaStatus {
    PeerId peer_id = NO_PEER;
    ReplicaState committed = ReplicaState::INITIALIZING;
    ReplicaHealth health = ReplicaHealth::ACTIVE;
    OperationId last_applied = 0;
};

// ============================================================================
// SHARD REPLICA SET
// ============================================================================
// One per shard replica hosted on this node. On the primary (lowest Active
// peer in the committed topology) it assigns operation ids, applies locally,
// then fans out to the other replicas. Everywhere else it only applies what
// the primary forwards.
//
// Locking:
//   seq_mutex_    id assignment, local apply and target selection (primary)
//   send_mutex    per remote; forwards to one peer are written in order
//   state_mutex_  committed view and per-remote health
// ============================================================================

class ShardReplicaSet : public std::enable_shared_from_this<ShardReplicaSet> {
public:
    // Invoked when a replica is found unreachable; proposes it Dead
    using DeadCallback = std::function<void(const ShardKey& key, PeerId peer, const std::string& reason)>;

    ShardReplicaSet(PeerId self, std::unique_ptr<LocalReplica> local, Transport& transport,
                    ThreadPool& pool, ReplicationOptions options, DeadCallback on_dead);

    const ShardKey& key() const { return local_->key(); }
    LocalReplica& local() { return *local_; }
    const LocalReplica& local() const { return *local_; }

    // Refresh the committed view of the shard
    void updateTopology(const ShardInfo& shard, const CollectionConfig& config);

    bool isPrimary() const;
    std::optional<PeerId> primary() const;

    /**
     * @brief Sequence, apply and replicate one operation (primary only).
     *
     * wait=false returns ACKNOWLEDGED once the operation is in the local log.
     * wait=true waits for every Active replica; unreachable ones are marked
     * Dead and listed in failed_peers. COMPLETED requires the write
     * consistency factor to be met by the replicas that acknowledged. The
     * acknowledgement timeout of a forward starts when it leaves the queue;
     * a replica already marked Dead locally is skipped.
     *
     * Marking a replica Dead only proposes the change. The result can come
     * back COMPLETED with that peer in failed_peers while the committed
     * topology still lists it Active; readers of the topology see it Dead
     * once the proposal commits.
     *
     * A peer that just became primary first pulls what the other Active
     * replicas hold beyond its own log (a snapshot if their log is
     * compacted). Until that succeeds every call throws
     * ShardInitializingError.
     *
     * @throws StaleTopologyError if this peer is not the primary
     * @throws ShardInitializingError while the new primary is catching up
     * @throws StorageError if the local log rejects the operation, or after
     *         replication when local storage rejected the payload
     */
    UpdateResult submit(const std::vector<uint8_t>& payload, bool wait);

    /**
     * @brief Read points from the local replica (primary only).
     * @throws StaleTopologyError if this peer is not the primary
     * @throws ShardInitializingError while the new primary is catching up
     */
    std::vector<Point> read(const std::vector<PointId>& ids);

    // Replica side of ForwardOperation
    ApplyResult applyForwarded(const ForwardRequest& request);

    /**
     * @brief Install a snapshot of the local replica on peer.
     * @return operation id the peer is at afterwards
     */
    OperationId pushSnapshot(PeerId peer);

    /**
     * @brief Stream every operation peer is missing from the local log.
     *
     * Also enables best-effort forwarding of new operations to peer.
     * @return local apply position the peer reached
     * @throws StorageError if the peer is behind the retained log
     */
    OperationId synchronize(PeerId peer);

    // Peer's apply position, std::nullopt if it does not host the shard
    std::optional<OperationId> probePeer(PeerId peer);

    // True if peer logged the same payload under id as the local log does.
    // False when either log no longer holds id.
    bool sharesOperation(PeerId peer, OperationId id);

    // Periodic health check: the primary probes and refills Active replicas,
    // any other Active replica probes the primary
    void probe();

    // Peers marked Dead locally while still Active in the committed topology
    std::vector<PeerId> locallyDeadActive() const;

    std::vector<RemoteReplicaStatus> replicaStatus() const;

private:
    struct RemoteReplica {
        PeerId peer_id = NO_PEER;
        ReplicaState committed = ReplicaState::INITIALIZING;
        ReplicaHealth health = ReplicaHealth::ACTIVE;
        OperationId last_applied = 0;
        bool receives_writes = false;       // Initializing peer past its snapshot
        std::mutex send_mutex;
    };

    struct Target {
        std::shared_ptr<RemoteReplica> remote;
        bool required = false;
    };

    // False once the forward has run longer than its timeout
    bool awaitForward(std::future<bool>& acked, const std::atomic<int64_t>& started_at) const;
    ApplyResult forwardLocked(RemoteReplica& remote, OperationId id, const std::vector<uint8_t>& payload);
    void fillGapLocked(RemoteReplica& remote, OperationId from, OperationId up_to);
    bool isDead(const RemoteReplica& remote) const;
    void markDead(RemoteReplica& remote, const std::string& reason);
    // @throws ShardInitializingError until every Active replica's operations are here
    void catchUpAsPrimary();
    void pullSnapshot(PeerId peer);
    std::vector<Target> forwardTargets() const;
    std::shared_ptr<RemoteReplica> findRemote(PeerId peer) const;
    void setHealth(RemoteReplica& remote, ReplicaHealth health, OperationId last_applied);

    PeerId self_;
    std::unique_ptr<LocalReplica> local_;
    Transport& transport_;
    ThreadPool& pool_;
    ReplicationOptions options_;
    DeadCallback on_dead_;

    std::mutex seq_mutex_;
    std::atomic<bool> needs_catch_up_{false};   // Became primary, pull missing operations first

    mutable std::mutex state_mutex_;
    std::map<PeerId, std::shared_ptr<RemoteReplica>> remotes_;
    std::optional<PeerId> primary_;
    std::optional<ReplicaState> self_state_;
    uint32_t write_consistency_factor_ = 1;
};

}  // namespace VectorCluster
