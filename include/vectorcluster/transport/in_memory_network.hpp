#pragma once

#include <vectorcluster/transport/transport.hpp>
#include <atomic>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <utility>

namespace VectorCluster {

/**
 * @class InMemoryNetwork
 * @brief In-process peer network used by tests.
 *
 * Calls are delivered synchronously on the caller's thread. Peers can be
 * detached (crash), isolated, or cut from each other pairwise; an
 * unreachable peer behaves like a timed-out one.
 */
class InMemoryNetwork {
public:
    InMemoryNetwork() = default;
    InMemoryNetwork(const InMemoryNetwork&) = delete;
    InMemoryNetwork& operator=(const InMemoryNetwork&) = delete;

    // Transport of self; start() attaches handler, stop() detaches it
    std::unique_ptr<Transport> createTransport(PeerId self, RpcHandler& handler);

    void attach(PeerId peer, RpcHandler* handler);

    // Stop delivering to peer; returns once calls into it have finished
    void detach(PeerId peer);

    // Cut every link of peer (both directions)
    void isolate(PeerId peer);

    void disconnect(PeerId a, PeerId b);

    // Restore every isolated peer and cut link
    void heal();

    bool isReachable(PeerId from, PeerId to) const;

private:
    friend class InMemoryTransport;

    // Handler of to if reachable from from; counted as in flight until release()
    RpcHandler* acquire(PeerId from, PeerId to);
    void release(PeerId to);

    bool reachableLocked(PeerId from, PeerId to) const;

    struct Endpoint {
        RpcHandler* handler = nullptr;
        size_t in_flight = 0;
    };

    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    std::map<PeerId, Endpoint> endpoints_;
    std::set<PeerId> isolated_;
    std::set<std::pair<PeerId, PeerId>> cut_links_;
};

class InMemoryTransport : public Transport {
public:
    InMemoryTransport(InMemoryNetwork& network, PeerId self, RpcHandler& handler);

    void start() override;
    void stop() override;

    void send(const RaftMessage& message) override;

    ApplyResult forwardOperation(PeerId peer, const ForwardRequest& request, Timeout timeout) override;
    FetchResponse fetchOperations(PeerId peer, const FetchRequest& request, Timeout timeout) override;
    ProbeResponse probeReplica(PeerId peer, const ProbeRequest& request, Timeout timeout) override;
    OperationId transferSnapshot(PeerId peer, const SnapshotRequest& request, Timeout timeout) override;
    UpdateResult submitToPrimary(PeerId peer, const SubmitRequest& request, Timeout timeout) override;
    FetchSnapshotResponse fetchSnapshot(PeerId peer, const FetchSnapshotRequest& request, Timeout timeout) override;
    GetPointsResponse getPoints(PeerId peer, const GetPointsRequest& request, Timeout timeout) override;

    uint64_t sendFailures() const override { return send_failures_.load(); }

private:
    template <typename F>
    auto call(PeerId peer, RpcType type, F&& fn) -> decltype(fn(std::declval<RpcHandler&>()));

    InMemoryNetwork& network_;
    PeerId self_;
    RpcHandler& handler_;
    std::atomic<uint64_t> send_failures_{0};
};

}  // namespace VectorCluster
