#pragma once

#include <vectorcluster/consensus/consensus_service.hpp>
#include <vectorcluster/replication/replica_set.hpp>
#include <vectorcluster/sharding/shard_transfer.hpp>
#include <vectorcluster/storage/point_operation.hpp>
#include <vectorcluster/storage/shard_storage.hpp>
#include <vectorcluster/topology/registry.hpp>
#include <vectorcluster/transport/transport.hpp>
#include <vectorcluster/utils/thread_pool.hpp>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

struct ShardManagerOptions {
    ReplicationOptions replication;
    std::string data_dir;                   // Operation logs under <data_dir>/oplog, empty = in memory
    std::string self_address;               // Announced in AddPeer when joining
    uint32_t default_replication_factor = 1;
    uint32_t default_write_consistency_factor = 1;
    std::chrono::milliseconds reissue_interval{500};
    std::chrono::milliseconds compact_interval{5000};
};

struct TransferStatus {
    ShardTransfer transfer;
    TransferPhase phase = TransferPhase::QUEUED;
    uint32_t attempts = 0;
};

/**
 * @class ShardManager
 * @brief Executes the committed shard layout on this node.
 *
 * Metadata changes are never executed directly: they are built from the
 * committed topology and proposed to consensus. reconcile() then makes the
 * local replicas, replica states and transfers follow what was committed.
 * Point writes are routed through the committed hash ranges to the shard's
 * primary.
 */
class ShardManager {
public:
    ShardManager(PeerId self, ShardManagerOptions options, ConsensusService& consensus,
                 TopologyRegistry& registry, Transport& transport, ShardStorage& storage);
    ~ShardManager();

    ShardManager(const ShardManager&) = delete;
    ShardManager& operator=(const ShardManager&) = delete;

    // ========================================================================
    // ROUTING & WRITES
    // ========================================================================

    /**
     * @throws NotFoundError for unknown collections
     */
    ShardId route(const std::string& collection, PointId point) const;

    /**
     * @brief Split a point operation by shard and submit each part.
     *
     * @return result per shard touched
     * @throws ShardInitializingError if a target shard has no Active replica
     * @throws StaleTopologyError if the primary changed meanwhile (retry)
     */
    std::map<ShardId, UpdateResult> submitOperation(const std::string& collection,
                                                    const PointOperation& operation, bool wait);

    UpdateResult submitToShard(const ShardKey& key, const std::vector<uint8_t>& payload, bool wait);

    /**
     * @brief Read points by id from the primaries of the shards holding them.
     *
     * Missing ids are left out of the result.
     * @throws ShardInitializingError if a target shard has no Active replica
     * @throws StaleTopologyError if the primary changed meanwhile (retry)
     */
    std::vector<Point> getPoints(const std::string& collection, const std::vector<PointId>& ids);

    // ========================================================================
    // METADATA (proposed, return the committed index)
    // ========================================================================

    uint64_t createCollection(const CollectionId& name, uint32_t shard_count,
                              std::optional<uint32_t> replication_factor = std::nullopt,
                              std::optional<uint32_t> write_consistency_factor = std::nullopt);

    // Lowering the replication factor also removes surplus replicas
    uint64_t updateCollection(const std::string& name, std::optional<uint32_t> replication_factor,
                              std::optional<uint32_t> write_consistency_factor);

    uint64_t dropCollection(const std::string& name);
    uint64_t changeAliases(const std::vector<AliasAction>& actions);

    // @return id of the new shard taking the upper half of the range
    ShardId splitShard(const std::string& collection, ShardId shard_id);

    uint64_t addPeer(PeerId peer, const std::string& address, PeerRole role);
    uint64_t removePeer(PeerId peer, bool force);
    uint64_t promotePeer(PeerId peer);

    // ========================================================================
    // PEER RPC HANDLERS
    // ========================================================================

    ApplyResult onForward(const ForwardRequest& request);
    FetchResponse onFetch(const FetchRequest& request);
    ProbeResponse onProbe(const ProbeRequest& request);
    OperationId onTransferSnapshot(const SnapshotRequest& request);
    UpdateResult onSubmit(const SubmitRequest& request);
    FetchSnapshotResponse onFetchSnapshot(const FetchSnapshotRequest& request);
    GetPointsResponse onGetPoints(const GetPointsRequest& request);

    // ========================================================================
    // RECONCILE
    // ========================================================================

    // Make local state follow the committed topology; called from the node driver
    void reconcile();

    // Stop transfers and background work
    void shutdown();

    std::shared_ptr<ShardReplicaSet> replicaSet(const ShardKey& key) const;
    std::vector<ShardKey> hostedShards() const;
    std::vector<TransferStatus> transferStatus() const;

private:
    UpdateResult submitLocal(const ShardKey& key, const std::vector<uint8_t>& payload, bool wait);
    std::vector<Point> readLocal(const ShardKey& key, const std::vector<PointId>& ids);
    std::shared_ptr<ShardReplicaSet> createReplicaSet(const ShardKey& key);

    void ensureMembership(const Topology& topology);
    void syncLocalReplicas(const Topology& topology);
    void driveReplicaStates(const Topology& topology);
    void syncTransfers(const Topology& topology);
    void scheduleReplication(const Topology& topology);
    void maintain(const Topology& topology);

    // Fire-and-forget proposal, at most once per reissue_interval per action
    void issue(const std::string& action, const MetadataCommand& command);
    void onReplicaDead(const ShardKey& key, PeerId peer, const std::string& reason);

    PeerId self_;
    ShardManagerOptions options_;
    ConsensusService& consensus_;
    TopologyRegistry& registry_;
    Transport& transport_;
    ShardStorage& storage_;
    ThreadPool pool_;

    mutable std::mutex sets_mutex_;
    std::map<ShardKey, std::shared_ptr<ShardReplicaSet>> sets_;

    mutable std::mutex drivers_mutex_;
    std::map<std::string, std::unique_ptr<ShardTransferDriver>> drivers_;

    std::mutex issue_mutex_;
    std::map<std::string, std::chrono::steady_clock::time_point> last_issued_;

    bool was_member_ = false;                // Reconcile thread only
    std::chrono::steady_clock::time_point last_probe_;
    std::chrono::steady_clock::time_point last_compact_;
    std::atomic<size_t> probes_in_flight_{0};
    std::atomic<bool> stopped_{false};
};

}  // namespace VectorCluster
