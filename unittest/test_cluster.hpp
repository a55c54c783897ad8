// ============================================================================
// TEST HELPERS
// ============================================================================
// Scratch directories, polling and an in-process cluster of ClusterNodes
// connected through InMemoryNetwork with fast timers.
// ============================================================================

#pragma once

#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/node/cluster_node.hpp>
#include <vectorcluster/transport/in_memory_network.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>

namespace VectorCluster {
namespace test {

// Unique directory under the system temp dir, removed on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "vc_test") {
        static std::atomic<uint64_t> counter{0};
        path_ = (std::filesystem::temp_directory_path() /
                 (prefix + "_" + std::to_string(::getpid()) + "_" + std::to_string(counter++))).string();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

// Poll condition every 10ms until it holds or timeout expires
inline bool waitFor(const std::function<bool()>& condition,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(10000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return condition();
}

// ============================================================================
// TEST CLUSTER
// ============================================================================

class TestCluster {
public:
    TestCluster() : dir_("vc_cluster") {}

    ~TestCluster() {
        for (auto& [id, node] : nodes_) {
            if (node) {
                node->stop();
            }
        }
    }

    NodeOptions options(PeerId id, bool bootstrap) const {
        NodeOptions options;
        options.peer_id = id;
        options.address = "mem://" + std::to_string(id);
        options.data_dir = dir_.path() + "/node" + std::to_string(id);
        options.bootstrap = bootstrap;
        if (!bootstrap) {
            options.seed_peers[1] = "mem://1";
        }
        options.tick_interval = std::chrono::milliseconds(10);

        options.consensus.raft.election_timeout_min_ticks = 10;
        options.consensus.raft.election_timeout_max_ticks = 20;
        options.consensus.raft.heartbeat_interval_ticks = 2;
        options.consensus.propose_timeout = std::chrono::milliseconds(3000);

        ReplicationOptions& replication = options.shards.replication;
        replication.forward_timeout = std::chrono::milliseconds(300);
        replication.health_probe_interval = std::chrono::milliseconds(100);
        replication.transfer_backoff = std::chrono::milliseconds(50);
        replication.worker_threads = 4;
        options.shards.reissue_interval = std::chrono::milliseconds(50);
        options.shards.compact_interval = std::chrono::milliseconds(500);
        return options;
    }

    // Start peer id; peer 1 bootstraps the cluster, everyone else joins through it
    ClusterNode& startNode(PeerId id) {
        auto factory = [this](PeerId self, RpcHandler& handler) {
            return network_.createTransport(self, handler);
        };
        auto& slot = nodes_[id];
        if (slot) {
            slot->stop();
            slot.reset();
        }
        slot = std::make_unique<ClusterNode>(options(id, id == 1), factory);
        slot->start();
        return *slot;
    }

    void stopNode(PeerId id) {
        auto it = nodes_.find(id);
        if (it != nodes_.end() && it->second) {
            it->second->stop();
            it->second.reset();
        }
    }

    // Start peers 1..count and wait until all of them are voters
    bool startCluster(size_t count) {
        startNode(1);
        for (PeerId id = 2; id <= count; ++id) {
            startNode(id);
            // Membership changes are applied one at a time
            if (!waitFor([&] { return isMemberEverywhere(id); })) {
                return false;
            }
        }
        return waitFor([&] { return isMemberEverywhere(1) && leader() != nullptr; });
    }

    ClusterNode& node(PeerId id) { return *nodes_.at(id); }
    bool isRunning(PeerId id) const {
        auto it = nodes_.find(id);
        return it != nodes_.end() && it->second && it->second->isRunning();
    }

    ClusterNode* leader() {
        for (auto& [id, node] : nodes_) {
            if (node && node->isRunning() && node->consensus().isLeader()) {
                return node.get();
            }
        }
        return nullptr;
    }

    // Run fn against the current leader, retrying while leadership moves
    template <typename F>
    auto onLeader(F&& fn) -> decltype(fn(std::declval<ClusterNode&>())) {
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(10);
        while (true) {
            ClusterNode* current = leader();
            if (current) {
                try {
                    return fn(*current);
                } catch (const ClusterError& e) {
                    if (!e.isRetryable() || std::chrono::steady_clock::now() >= deadline) {
                        throw;
                    }
                }
            } else if (std::chrono::steady_clock::now() >= deadline) {
                throw NotLeaderError(std::nullopt);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    bool isMemberEverywhere(PeerId peer) {
        for (auto& [id, node] : nodes_) {
            if (!node || !node->isRunning()) {
                continue;
            }
            if (!node->getTopology()->findPeer(peer)) {
                return false;
            }
        }
        return true;
    }

    // Every running node applied at least index
    bool appliedEverywhere(uint64_t index) {
        for (auto& [id, node] : nodes_) {
            if (node && node->isRunning() && node->getTopology()->applied_index < index) {
                return false;
            }
        }
        return true;
    }

    // Every replica of the collection is Active and there are no transfers
    bool collectionSettled(PeerId observer, const std::string& collection, size_t replicas_per_shard) {
        auto topology = node(observer).getTopology();
        const CollectionInfo* info = topology->findCollection(collection);
        if (!info || !info->transfers.empty()) {
            return false;
        }
        for (const auto& [shard_id, shard] : info->shards) {
            if (shard.activePeers().size() != replicas_per_shard ||
                shard.replicas.size() != replicas_per_shard) {
                return false;
            }
        }
        return true;
    }

    InMemoryNetwork& network() { return network_; }
    const std::string& dataDir() const { return dir_.path(); }

private:
    TempDir dir_;
    InMemoryNetwork network_;
    std::map<PeerId, std::unique_ptr<ClusterNode>> nodes_;
};

}  // namespace test
}  // namespace VectorCluster
