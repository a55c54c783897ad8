#pragma once

#include <vectorcluster/consensus/messages.hpp>
#include <vectorcluster/transport/rpc.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace VectorCluster {

/**
 * @class RpcHandler
 * @brief Server side of the peer protocol, implemented by ClusterNode.
 *
 * Handlers throw ClusterError subclasses; transports carry them back to the
 * caller unchanged.
 */
class RpcHandler {
public:
    virtual ~RpcHandler() = default;

    // Queue a consensus message; must not block on consensus
    virtual void onRaftMessage(RaftMessage message) = 0;

    virtual ApplyResult onForward(const ForwardRequest& request) = 0;
    virtual FetchResponse onFetch(const FetchRequest& request) = 0;
    virtual ProbeResponse onProbe(const ProbeRequest& request) = 0;

    // Install a snapshot, returns the replica's apply position afterwards
    virtual OperationId onTransferSnapshot(const SnapshotRequest& request) = 0;

    virtual UpdateResult onSubmit(const SubmitRequest& request) = 0;

    // Export the hosted replica in full; hosted=false when it is not hosted here
    virtual FetchSnapshotResponse onFetchSnapshot(const FetchSnapshotRequest& request) = 0;

    // Served by the shard's primary only
    virtual GetPointsResponse onGetPoints(const GetPointsRequest& request) = 0;
};

/**
 * @class Transport
 * @brief Client side of the peer protocol.
 *
 * Consensus messages are fire-and-forget: a lost message is recovered by
 * the protocol itself. Replication calls are synchronous and throw
 * TimeoutError when the peer cannot be reached in time (outcome unknown).
 */
class Transport {
public:
    using Timeout = std::chrono::milliseconds;

    virtual ~Transport() = default;

    // Begin delivering inbound calls to the handler
    virtual void start() {}

    // Stop delivering; returns once no inbound call is running
    virtual void stop() {}

    virtual void send(const RaftMessage& message) = 0;

    virtual ApplyResult forwardOperation(PeerId peer, const ForwardRequest& request, Timeout timeout) = 0;
    virtual FetchResponse fetchOperations(PeerId peer, const FetchRequest& request, Timeout timeout) = 0;
    virtual ProbeResponse probeReplica(PeerId peer, const ProbeRequest& request, Timeout timeout) = 0;
    virtual OperationId transferSnapshot(PeerId peer, const SnapshotRequest& request, Timeout timeout) = 0;
    virtual UpdateResult submitToPrimary(PeerId peer, const SubmitRequest& request, Timeout timeout) = 0;
    virtual FetchSnapshotResponse fetchSnapshot(PeerId peer, const FetchSnapshotRequest& request, Timeout timeout) = 0;
    virtual GetPointsResponse getPoints(PeerId peer, const GetPointsRequest& request, Timeout timeout) = 0;

    // Learn or refresh a peer's network address (no-op for in-process transports)
    virtual void updatePeerAddress(PeerId /*peer*/, const std::string& /*address*/) {}

    // Consensus messages that could not be delivered
    virtual uint64_t sendFailures() const = 0;
};

}  // namespace VectorCluster
