#include <vectorcluster/transport/in_memory_network.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

// ============================================================================
// NETWORK
// ============================================================================

std::unique_ptr<Transport> InMemoryNetwork::createTransport(PeerId self, RpcHandler& handler) {
    return std::make_unique<InMemoryTransport>(*this, self, handler);
}

void InMemoryNetwork::attach(PeerId peer, RpcHandler* handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    endpoints_[peer].handler = handler;
    spdlog::debug("[InMemoryNetwork] Peer {} attached", peer);
}

void InMemoryNetwork::detach(PeerId peer) {
    std::unique_lock<std::mutex> lock(mutex_);
    auto it = endpoints_.find(peer);
    if (it == endpoints_.end()) {
        return;
    }
    it->second.handler = nullptr;
    idle_cv_.wait(lock, [&] { return endpoints_[peer].in_flight == 0; });
    spdlog::debug("[InMemoryNetwork] Peer {} detached", peer);
}

void InMemoryNetwork::isolate(PeerId peer) {
    std::lock_guard<std::mutex> lock(mutex_);
    isolated_.insert(peer);
    spdlog::info("[InMemoryNetwork] Peer {} isolated", peer);
}

void InMemoryNetwork::disconnect(PeerId a, PeerId b) {
    std::lock_guard<std::mutex> lock(mutex_);
    cut_links_.insert({a, b});
    cut_links_.insert({b, a});
}

void InMemoryNetwork::heal() {
    std::lock_guard<std::mutex> lock(mutex_);
    isolated_.clear();
    cut_links_.clear();
    spdlog::info("[InMemoryNetwork] All links restored");
}

bool InMemoryNetwork::isReachable(PeerId from, PeerId to) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reachableLocked(from, to);
}

bool InMemoryNetwork::reachableLocked(PeerId from, PeerId to) const {
    if (isolated_.count(from) || isolated_.count(to) || cut_links_.count({from, to})) {
        return false;
    }
    auto it = endpoints_.find(to);
    return it != endpoints_.end() && it->second.handler != nullptr;
}

RpcHandler* InMemoryNetwork::acquire(PeerId from, PeerId to) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reachableLocked(from, to)) {
        return nullptr;
    }
    Endpoint& endpoint = endpoints_[to];
    endpoint.in_flight++;
    return endpoint.handler;
}

void InMemoryNetwork::release(PeerId to) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        endpoints_[to].in_flight--;
    }
    idle_cv_.notify_all();
}

// ============================================================================
// TRANSPORT
// ============================================================================

InMemoryTransport::InMemoryTransport(InMemoryNetwork& network, PeerId self, RpcHandler& handler)
    : network_(network), self_(self), handler_(handler) {}

void InMemoryTransport::start() {
    network_.attach(self_, &handler_);
}

void InMemoryTransport::stop() {
    network_.detach(self_);
}

template <typename F>
auto InMemoryTransport::call(PeerId peer, RpcType type, F&& fn) -> decltype(fn(std::declval<RpcHandler&>())) {
    RpcHandler* handler = network_.acquire(self_, peer);
    if (!handler) {
        throw TimeoutError(std::string(toString(type)) + " to peer " + std::to_string(peer) + ": unreachable");
    }

    struct Release {
        InMemoryNetwork& network;
        PeerId peer;
        ~Release() { network.release(peer); }
    } release{network_, peer};

    return fn(*handler);
}

void InMemoryTransport::send(const RaftMessage& message) {
    if (!network_.isReachable(self_, message.to)) {
        send_failures_++;
        return;
    }
    try {
        call(message.to, RpcType::RAFT_MESSAGE, [&](RpcHandler& h) { h.onRaftMessage(message); });
    } catch (const TimeoutError&) {
        // Detached between the reachability check and delivery
        send_failures_++;
    }
}

ApplyResult InMemoryTransport::forwardOperation(PeerId peer, const ForwardRequest& request, Timeout) {
    return call(peer, RpcType::FORWARD_OPERATION, [&](RpcHandler& h) { return h.onForward(request); });
}

FetchResponse InMemoryTransport::fetchOperations(PeerId peer, const FetchRequest& request, Timeout) {
    return call(peer, RpcType::FETCH_OPERATIONS, [&](RpcHandler& h) { return h.onFetch(request); });
}

ProbeResponse InMemoryTransport::probeReplica(PeerId peer, const ProbeRequest& request, Timeout) {
    return call(peer, RpcType::PROBE_REPLICA, [&](RpcHandler& h) { return h.onProbe(request); });
}

OperationId InMemoryTransport::transferSnapshot(PeerId peer, const SnapshotRequest& request, Timeout) {
    return call(peer, RpcType::TRANSFER_SNAPSHOT, [&](RpcHandler& h) { return h.onTransferSnapshot(request); });
}

UpdateResult InMemoryTransport::submitToPrimary(PeerId peer, const SubmitRequest& request, Timeout) {
    return call(peer, RpcType::SUBMIT_TO_PRIMARY, [&](RpcHandler& h) { return h.onSubmit(request); });
}

FetchSnapshotResponse InMemoryTransport::fetchSnapshot(PeerId peer, const FetchSnapshotRequest& request, Timeout) {
    return call(peer, RpcType::FETCH_SNAPSHOT, [&](RpcHandler& h) { return h.onFetchSnapshot(request); });
}

GetPointsResponse InMemoryTransport::getPoints(PeerId peer, const GetPointsRequest& request, Timeout) {
    return call(peer, RpcType::GET_POINTS, [&](RpcHandler& h) { return h.onGetPoints(request); });
}

}  // namespace VectorCluster
