// ============================================================================
// REPLICA HARNESS
// ============================================================================
// Peers hosting ShardReplicaSets directly over InMemoryNetwork, without
// consensus. Each peer serves the replication RPCs for the shards it hosts.
// ============================================================================

#pragma once

#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/replication/replica_set.hpp>
#include <vectorcluster/storage/in_memory_point_store.hpp>
#include <vectorcluster/transport/in_memory_network.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace VectorCluster {
namespace test {

class ShardHostHandler : public RpcHandler {
public:
    void onRaftMessage(RaftMessage) override {}

    ApplyResult onForward(const ForwardRequest& request) override {
        const auto delay = std::chrono::milliseconds(forward_delay_ms_.load());
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return hosted(request.key)->applyForwarded(request);
    }

    FetchResponse onFetch(const FetchRequest& request) override {
        FetchResponse response;
        auto set = find(request.key);
        if (!set) {
            return response;
        }
        auto operations = set->local().operationsFrom(request.from, request.max_count);
        response.last_id = set->local().lastApplied();
        if (operations) {
            response.available = true;
            response.operations = std::move(*operations);
        }
        return response;
    }

    ProbeResponse onProbe(const ProbeRequest& request) override {
        ProbeResponse response;
        if (auto set = find(request.key)) {
            response.hosted = true;
            response.last_applied = set->local().lastApplied();
        }
        return response;
    }

    OperationId onTransferSnapshot(const SnapshotRequest& request) override {
        return hosted(request.key)->local().importSnapshot(request.data);
    }

    UpdateResult onSubmit(const SubmitRequest& request) override {
        return hosted(request.key)->submit(request.payload, request.wait);
    }

    FetchSnapshotResponse onFetchSnapshot(const FetchSnapshotRequest& request) override {
        FetchSnapshotResponse response;
        if (auto set = find(request.key)) {
            ReplicaSnapshot snapshot = set->local().exportSnapshot();
            response.hosted = true;
            response.cutoff = snapshot.cutoff;
            response.data = std::move(snapshot.data);
        }
        return response;
    }

    GetPointsResponse onGetPoints(const GetPointsRequest& request) override {
        return GetPointsResponse{hosted(request.key)->read(request.ids)};
    }

    // Every forward received sleeps this long before applying (slow peer)
    void delayForwards(std::chrono::milliseconds delay) { forward_delay_ms_ = delay.count(); }

    void host(std::shared_ptr<ShardReplicaSet> set) {
        std::lock_guard<std::mutex> lock(mutex_);
        sets_[set->key()] = std::move(set);
    }

    void drop(const ShardKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        sets_.erase(key);
    }

    std::shared_ptr<ShardReplicaSet> find(const ShardKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = sets_.find(key);
        return it == sets_.end() ? nullptr : it->second;
    }

private:
    std::shared_ptr<ShardReplicaSet> hosted(const ShardKey& key) const {
        auto set = find(key);
        if (!set) {
            throw StaleTopologyError(key.toString() + " is not hosted");
        }
        return set;
    }

    mutable std::mutex mutex_;
    std::map<ShardKey, std::shared_ptr<ShardReplicaSet>> sets_;
    std::atomic<int64_t> forward_delay_ms_{0};
};

struct DeadReport {
    PeerId reporter = NO_PEER;
    ShardKey key;
    PeerId peer = NO_PEER;
};

class ReplicaHarness {
public:
    explicit ReplicaHarness(ReplicationOptions options) : options_(std::move(options)) {}

    // Queued forwards still reference the transports
    ~ReplicaHarness() { pool_.shutdown(); }

    void addPeer(PeerId id) {
        auto peer = std::make_unique<Peer>();
        peer->transport = network_.createTransport(id, peer->handler);
        peer->transport->start();
        peers_[id] = std::move(peer);
    }

    // Create an empty replica of key on peer id
    ShardReplicaSet& host(PeerId id, const ShardKey& key, size_t retention = 1000) {
        Peer& peer = *peers_.at(id);
        auto local = std::make_unique<LocalReplica>(key, peer.store, "", retention);
        auto set = std::make_shared<ShardReplicaSet>(
            id, std::move(local), *peer.transport, pool_, options_,
            [this, id](const ShardKey& shard, PeerId dead, const std::string&) {
                std::lock_guard<std::mutex> lock(dead_mutex_);
                dead_reports_.push_back(DeadReport{id, shard, dead});
            });
        peer.handler.host(set);
        return *set;
    }

    void unhost(PeerId id, const ShardKey& key) { peers_.at(id)->handler.drop(key); }

    // Hand the same committed view of a shard to every peer hosting it
    void publish(const ShardKey& key, const std::map<PeerId, ReplicaState>& replicas,
                 uint32_t write_consistency_factor = 1, HashRange range = HashRange{}) {
        ShardInfo shard;
        shard.shard_id = key.shard_id;
        shard.range = range;
        shard.replicas = replicas;
        CollectionConfig config;
        config.replication_factor = static_cast<uint32_t>(replicas.size());
        config.write_consistency_factor = write_consistency_factor;
        for (auto& [id, peer] : peers_) {
            if (auto set = peer->handler.find(key)) {
                set->updateTopology(shard, config);
            }
        }
    }

    std::shared_ptr<ShardReplicaSet> find(PeerId id, const ShardKey& key) { return peers_.at(id)->handler.find(key); }
    ShardReplicaSet& set(PeerId id, const ShardKey& key) { return *find(id, key); }
    InMemoryPointStore& store(PeerId id) { return peers_.at(id)->store; }
    ShardHostHandler& handler(PeerId id) { return peers_.at(id)->handler; }
    InMemoryNetwork& network() { return network_; }

    std::vector<DeadReport> deadReports() {
        std::lock_guard<std::mutex> lock(dead_mutex_);
        return dead_reports_;
    }

    bool reported(PeerId reporter, PeerId peer) {
        auto reports = deadReports();
        return std::any_of(reports.begin(), reports.end(), [&](const DeadReport& r) {
            return r.reporter == reporter && r.peer == peer;
        });
    }

private:
    struct Peer {
        InMemoryPointStore store;
        ShardHostHandler handler;
        std::unique_ptr<Transport> transport;
    };

    ReplicationOptions options_;
    InMemoryNetwork network_;
    std::map<PeerId, std::unique_ptr<Peer>> peers_;
    ThreadPool pool_{4, "replica_test"};

    std::mutex dead_mutex_;
    std::vector<DeadReport> dead_reports_;
};

}  // namespace test
}  // namespace VectorCluster
