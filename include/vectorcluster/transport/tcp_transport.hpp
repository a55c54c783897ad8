#pragma once

#include <vectorcluster/transport/transport.hpp>

#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

#include <atomic>
#include <condition_variable>
#include <deque>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace VectorCluster {

/**
 * @class TcpTransport
 * @brief Peer protocol over TCP.
 *
 * Frame format (both directions):
 *   [4 bytes: length (big endian)] [1 byte: RpcType] [body]
 * Responses carry a status byte in place of the type: 0 is success,
 * anything else an ErrorCode followed by the error message.
 *
 * The server side runs one thread per client connection. Consensus messages
 * are queued and written by a sender thread over one cached connection per
 * peer; replication calls open a connection per call bounded by the timeout.
 */
class TcpTransport : public Transport {
public:
    TcpTransport(PeerId self, int port, RpcHandler& handler);
    ~TcpTransport() noexcept;

    /**
     * @throws std::runtime_error if the listening socket cannot be set up
     */
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

    // address is "host:port"
    void updatePeerAddress(PeerId peer, const std::string& address) override;

    uint64_t sendFailures() const override { return sendFailures_.load(); }

private:
    // ========================================================================
    // SERVER
    // ========================================================================
    void acceptConnections();
    void handleClient(int client_fd, std::string client_address);
    void cleanupFinishedThreads();
    std::vector<uint8_t> dispatch(RpcType type, const std::vector<uint8_t>& body);

    // ========================================================================
    // CLIENT
    // ========================================================================
    void senderLoop();
    int connectTo(PeerId peer, Timeout timeout) const;
    std::vector<uint8_t> roundTrip(PeerId peer, RpcType type, const std::vector<uint8_t>& body, Timeout timeout);

    PeerId self_;
    int serverPort;
    int server_fd;
    RpcHandler& handler_;
    std::atomic<bool> isRunning{false};
    std::thread acceptThread;

    struct ClientThread {
        std::thread thread;
        std::atomic<bool> finished{false};
    };
    std::list<std::unique_ptr<ClientThread>> clientThreads_;
    std::mutex clientThreadsMutex_;

    mutable std::mutex addressMutex_;
    std::map<PeerId, std::pair<std::string, int>> addresses_;

    std::thread senderThread_;
    std::mutex outboxMutex_;
    std::condition_variable outboxCv_;
    std::deque<RaftMessage> outbox_;
    std::map<PeerId, int> raftConnections_;     // Sender thread only

    std::atomic<uint64_t> sendFailures_{0};
    std::atomic<uint64_t> totalConnectionsAccepted_{0};
};

}  // namespace VectorCluster
