#pragma once

#include <vectorcluster/config/app_config.hpp>
#include <vectorcluster/consensus/consensus_service.hpp>
#include <vectorcluster/sharding/shard_manager.hpp>
#include <vectorcluster/storage/in_memory_point_store.hpp>
#include <vectorcluster/topology/registry.hpp>
#include <vectorcluster/transport/transport.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace VectorCluster {

struct NodeOptions {
    PeerId peer_id = NO_PEER;
    std::string address;                        // host:port announced to other peers
    std::string data_dir;                       // Empty keeps everything in memory
    bool bootstrap = false;
    std::map<PeerId, std::string> seed_peers;   // Contacted before the topology lists them
    std::chrono::milliseconds tick_interval{100};

    // Identity, directories and seeds are filled in from the fields above
    ConsensusOptions consensus;
    ShardManagerOptions shards;
};

NodeOptions makeNodeOptions(const AppConfig::AppConfiguration& config);

// ============================================================================
// CLUSTER NODE
// ============================================================================
// One peer of the cluster: point storage, topology registry, consensus,
// shard manager and the transport that connects them to other peers.
//
// A driver thread owns the consensus clock. Each iteration it steps queued
// consensus messages, ticks at tick_interval and runs the shard manager's
// reconcile against the latest committed topology. Replication RPCs are
// served on the transport's threads.
// ============================================================================

class ClusterNode : public RpcHandler {
public:
    using TransportFactory = std::function<std::unique_ptr<Transport>(PeerId self, RpcHandler& handler)>;

    ClusterNode(NodeOptions options, const TransportFactory& make_transport);
    ~ClusterNode() override;

    ClusterNode(const ClusterNode&) = delete;
    ClusterNode& operator=(const ClusterNode&) = delete;

    /**
     * @brief Open persisted state, start serving peers and the driver thread.
     * @throws StorageError / std::runtime_error if state or sockets cannot be opened
     */
    void start();

    // Reverse of start(); persisted state stays for a later restart
    void stop();

    bool isRunning() const { return running_.load(); }
    PeerId id() const { return options_.peer_id; }

    // ========================================================================
    // CLIENT API
    // ========================================================================

    /**
     * @brief Propose a metadata command and wait until it is applied here.
     * @throws NotLeaderError, TimeoutError, or the user error of the entry
     */
    uint64_t proposeMetadataChange(const MetadataCommand& command,
                                   std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::map<ShardId, UpdateResult> submitOperation(const std::string& collection,
                                                    const PointOperation& operation, bool wait);

    // Served by the primaries; rejected with ShardInitializingError like writes
    std::vector<Point> getPoints(const std::string& collection, const std::vector<PointId>& ids);

    std::shared_ptr<const Topology> getTopology() const;
    ClusterStatus clusterStatus() const;

    ShardManager& shards();
    ConsensusService& consensus();
    InMemoryPointStore& storage() { return storage_; }

    // ========================================================================
    // RpcHandler
    // ========================================================================

    void onRaftMessage(RaftMessage message) override;
    ApplyResult onForward(const ForwardRequest& request) override;
    FetchResponse onFetch(const FetchRequest& request) override;
    ProbeResponse onProbe(const ProbeRequest& request) override;
    OperationId onTransferSnapshot(const SnapshotRequest& request) override;
    UpdateResult onSubmit(const SubmitRequest& request) override;
    FetchSnapshotResponse onFetchSnapshot(const FetchSnapshotRequest& request) override;
    GetPointsResponse onGetPoints(const GetPointsRequest& request) override;

private:
    void driverLoop();
    void refreshPeerAddresses(const Topology& topology);
    ShardManager& activeShards();

    NodeOptions options_;
    InMemoryPointStore storage_;
    TopologyRegistry registry_;
    std::unique_ptr<Transport> transport_;
    std::unique_ptr<ConsensusService> consensus_;
    std::unique_ptr<ShardManager> shards_;

    std::mutex inbox_mutex_;
    std::condition_variable inbox_cv_;
    std::deque<RaftMessage> inbox_;

    std::atomic<bool> running_{false};
    std::thread driver_;
    uint64_t addresses_seen_at_ = 0;    // Driver thread only
};

}  // namespace VectorCluster
