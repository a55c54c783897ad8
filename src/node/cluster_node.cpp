#include <vectorcluster/node/cluster_node.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

NodeOptions makeNodeOptions(const AppConfig::AppConfiguration& config) {
    NodeOptions options;
    options.peer_id = config.node.peer_id;
    options.address = config.node.host + ":" + std::to_string(config.node.port);
    options.data_dir = config.node.data_dir;
    options.bootstrap = config.node.bootstrap;
    for (const auto& peer : config.node.peers) {
        options.seed_peers[peer.peer_id] = peer.host + ":" + std::to_string(peer.port);
    }
    options.tick_interval = std::chrono::milliseconds(config.consensus.tick_interval_ms);

    RaftConfig& raft = options.consensus.raft;
    raft.election_timeout_min_ticks = config.consensus.election_timeout_min_ticks;
    raft.election_timeout_max_ticks = config.consensus.election_timeout_max_ticks;
    raft.heartbeat_interval_ticks = config.consensus.heartbeat_interval_ticks;
    raft.max_entries_per_message = config.consensus.max_entries_per_message;
    options.consensus.snapshot_threshold = config.consensus.snapshot_threshold;
    options.consensus.propose_timeout = std::chrono::milliseconds(config.consensus.propose_timeout_ms);

    ReplicationOptions& replication = options.shards.replication;
    replication.forward_timeout = std::chrono::milliseconds(config.replication.forward_timeout_ms);
    replication.health_probe_interval = std::chrono::milliseconds(config.replication.health_probe_interval_ms);
    replication.oplog_retention = config.replication.oplog_retention;
    replication.transfer_max_attempts = config.replication.transfer_max_attempts;
    replication.worker_threads = config.replication.worker_threads;
    options.shards.default_replication_factor = config.replication.default_replication_factor;
    options.shards.default_write_consistency_factor = config.replication.default_write_consistency_factor;
    return options;
}

namespace {

NodeOptions completeOptions(NodeOptions options) {
    options.consensus.raft.id = options.peer_id;
    options.consensus.data_dir = options.data_dir.empty() ? "" : options.data_dir + "/consensus";
    options.consensus.bootstrap = options.bootstrap;
    options.consensus.self_address = options.address;
    options.consensus.seed_peers.clear();
    for (const auto& [peer, address] : options.seed_peers) {
        options.consensus.seed_peers.push_back(peer);
    }
    options.shards.data_dir = options.data_dir;
    options.shards.self_address = options.address;
    return options;
}

}  // namespace

ClusterNode::ClusterNode(NodeOptions options, const TransportFactory& make_transport)
    : options_(completeOptions(std::move(options))),
      storage_(options_.data_dir.empty() ? "" : options_.data_dir + "/points"),
      transport_(make_transport(options_.peer_id, *this)) {}

ClusterNode::~ClusterNode() {
    stop();
    shards_.reset();
    consensus_.reset();
    transport_.reset();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void ClusterNode::start() {
    if (consensus_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " was already started; restart with a new node");
    }
    spdlog::info("[Node:{}] Starting at {} (data: {})", options_.peer_id, options_.address,
                 options_.data_dir.empty() ? "in memory" : options_.data_dir);

    consensus_ = std::make_unique<ConsensusService>(options_.consensus, registry_, *transport_);
    consensus_->setApplyCallback([id = options_.peer_id](uint64_t index, const MetadataCommand& command,
                                                          std::exception_ptr error) {
        if (!error) {
            spdlog::debug("[Node:{}] Applied {} at index {}", id, commandName(command), index);
            return;
        }
        try {
            std::rethrow_exception(error);
        } catch (const ClusterError& e) {
            spdlog::debug("[Node:{}] {} at index {} rejected: {}", id, commandName(command), index, e.what());
        }
    });
    shards_ = std::make_unique<ShardManager>(options_.peer_id, options_.shards, *consensus_, registry_,
                                             *transport_, storage_);

    for (const auto& [peer, address] : options_.seed_peers) {
        transport_->updatePeerAddress(peer, address);
    }
    transport_->start();
    try {
        consensus_->start();
    } catch (const std::exception& e) {
        spdlog::error("[Node:{}] Cannot start consensus: {}", options_.peer_id, e.what());
        transport_->stop();
        throw;
    }

    running_ = true;
    driver_ = std::thread(&ClusterNode::driverLoop, this);
    spdlog::info("[Node:{}] Started", options_.peer_id);
}

void ClusterNode::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    spdlog::info("[Node:{}] Stopping...", options_.peer_id);

    // No inbound call runs past this point
    transport_->stop();

    inbox_cv_.notify_all();
    if (driver_.joinable()) {
        driver_.join();
    }
    shards_->shutdown();
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.clear();
    }
    spdlog::info("[Node:{}] Stopped", options_.peer_id);
}

void ClusterNode::driverLoop() {
    auto next_tick = std::chrono::steady_clock::now() + options_.tick_interval;

    while (running_) {
        std::deque<RaftMessage> batch;
        {
            std::unique_lock<std::mutex> lock(inbox_mutex_);
            inbox_cv_.wait_until(lock, next_tick, [this] { return !inbox_.empty() || !running_; });
            batch.swap(inbox_);
        }
        if (!running_) {
            break;
        }

        try {
            for (const auto& message : batch) {
                consensus_->handleMessage(message);
            }

            const auto now = std::chrono::steady_clock::now();
            if (now >= next_tick) {
                next_tick = now + options_.tick_interval;
                consensus_->tick();

                auto topology = registry_.current();
                refreshPeerAddresses(*topology);
                shards_->reconcile();
            }
        } catch (const std::exception& e) {
            spdlog::error("[Node:{}] Driver iteration failed: {}", options_.peer_id, e.what());
        }
    }
}

void ClusterNode::refreshPeerAddresses(const Topology& topology) {
    if (topology.applied_index == addresses_seen_at_) {
        return;
    }
    addresses_seen_at_ = topology.applied_index;
    for (const auto& [peer, info] : topology.peers) {
        if (peer != options_.peer_id && !info.address.empty()) {
            transport_->updatePeerAddress(peer, info.address);
        }
    }
}

// ============================================================================
// CLIENT API
// ============================================================================

uint64_t ClusterNode::proposeMetadataChange(const MetadataCommand& command,
                                            std::optional<std::chrono::milliseconds> timeout) {
    if (!running_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " is not running");
    }
    return consensus_->propose(command, timeout);
}

std::map<ShardId, UpdateResult> ClusterNode::submitOperation(const std::string& collection,
                                                             const PointOperation& operation, bool wait) {
    if (!running_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " is not running");
    }
    return activeShards().submitOperation(collection, operation, wait);
}

std::vector<Point> ClusterNode::getPoints(const std::string& collection, const std::vector<PointId>& ids) {
    if (!running_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " is not running");
    }
    return activeShards().getPoints(collection, ids);
}

std::shared_ptr<const Topology> ClusterNode::getTopology() const {
    return registry_.current();
}

ClusterStatus ClusterNode::clusterStatus() const {
    if (!consensus_) {
        ClusterStatus status;
        status.peer_id = options_.peer_id;
        return status;
    }
    return consensus_->status();
}

ShardManager& ClusterNode::shards() {
    return activeShards();
}

ConsensusService& ClusterNode::consensus() {
    if (!consensus_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " is not started");
    }
    return *consensus_;
}

ShardManager& ClusterNode::activeShards() {
    if (!shards_) {
        throw ServiceError("Node " + std::to_string(options_.peer_id) + " is not started");
    }
    return *shards_;
}

// ============================================================================
// RpcHandler
// ============================================================================

void ClusterNode::onRaftMessage(RaftMessage message) {
    {
        std::lock_guard<std::mutex> lock(inbox_mutex_);
        inbox_.push_back(std::move(message));
    }
    inbox_cv_.notify_one();
}

ApplyResult ClusterNode::onForward(const ForwardRequest& request) {
    return activeShards().onForward(request);
}

FetchResponse ClusterNode::onFetch(const FetchRequest& request) {
    return activeShards().onFetch(request);
}

ProbeResponse ClusterNode::onProbe(const ProbeRequest& request) {
    return activeShards().onProbe(request);
}

OperationId ClusterNode::onTransferSnapshot(const SnapshotRequest& request) {
    return activeShards().onTransferSnapshot(request);
}

UpdateResult ClusterNode::onSubmit(const SubmitRequest& request) {
    return activeShards().onSubmit(request);
}

FetchSnapshotResponse ClusterNode::onFetchSnapshot(const FetchSnapshotRequest& request) {
    return activeShards().onFetchSnapshot(request);
}

GetPointsResponse ClusterNode::onGetPoints(const GetPointsRequest& request) {
    return activeShards().onGetPoints(request);
}

}  // namespace VectorCluster
