#include <vectorcluster/transport/tcp_transport.hpp>
#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <netdb.h>
#include <sys/time.h>
#include <cerrno>
#include <cstring>

namespace VectorCluster {

namespace {

constexpr uint32_t kMaxFrameSize = 64 * 1024 * 1024;
constexpr std::chrono::milliseconds kRaftSendTimeout{1000};

void closeSocket(int fd) {
    if (fd == -1) return;
    shutdown(fd, SHUT_RDWR);
    close(fd);
}

void setTimeouts(int fd, std::chrono::milliseconds timeout) {
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
}

bool sendAll(int fd, const uint8_t* data, size_t len) {
    while (len > 0) {
        ssize_t sent = ::send(fd, data, len, MSG_NOSIGNAL);
        if (sent <= 0) {
            return false;
        }
        data += sent;
        len -= static_cast<size_t>(sent);
    }
    return true;
}

bool recvExact(int fd, uint8_t* out, size_t len) {
    while (len > 0) {
        ssize_t received = recv(fd, out, len, 0);
        if (received <= 0) {
            return false;
        }
        out += received;
        len -= static_cast<size_t>(received);
    }
    return true;
}

// [len BE][head byte][body]
bool writeFrame(int fd, uint8_t head, const std::vector<uint8_t>& body) {
    std::vector<uint8_t> frame(4 + 1 + body.size());
    writeUint32BE(frame.data(), static_cast<uint32_t>(1 + body.size()));
    frame[4] = head;
    std::memcpy(frame.data() + 5, body.data(), body.size());
    return sendAll(fd, frame.data(), frame.size());
}

// Returns the frame content after the length prefix
std::optional<std::vector<uint8_t>> readFrame(int fd) {
    uint8_t header[4];
    if (!recvExact(fd, header, sizeof(header))) {
        return std::nullopt;
    }
    const uint32_t len = readUint32BE(header);
    if (len == 0 || len > kMaxFrameSize) {
        return std::nullopt;
    }
    std::vector<uint8_t> content(len);
    if (!recvExact(fd, content.data(), len)) {
        return std::nullopt;
    }
    return content;
}

}  // namespace

TcpTransport::TcpTransport(PeerId self, int port, RpcHandler& handler)
    : self_(self), serverPort(port), server_fd(-1), handler_(handler) {}

TcpTransport::~TcpTransport() noexcept {
    stop();
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void TcpTransport::start() {
    server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        throw std::runtime_error("Failed to create listening socket");
    }

    int opt = 1;
    setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in server_addr{};
    server_addr.sin_family = AF_INET;
    server_addr.sin_addr.s_addr = INADDR_ANY;
    server_addr.sin_port = htons(static_cast<uint16_t>(serverPort));

    if (bind(server_fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        closeSocket(server_fd);
        server_fd = -1;
        throw std::runtime_error("Failed to bind port " + std::to_string(serverPort));
    }
    if (listen(server_fd, SOMAXCONN) < 0) {
        closeSocket(server_fd);
        server_fd = -1;
        throw std::runtime_error("Failed to listen on port " + std::to_string(serverPort));
    }

    isRunning.store(true, std::memory_order_release);
    acceptThread = std::thread(&TcpTransport::acceptConnections, this);
    senderThread_ = std::thread(&TcpTransport::senderLoop, this);
    spdlog::info("[TcpTransport:{}] Listening on port {}", self_, serverPort);
}

void TcpTransport::stop() {
    if (!isRunning.exchange(false)) {
        return;
    }

    if (server_fd != -1) {
        closeSocket(server_fd);
        server_fd = -1;
    }
    if (acceptThread.joinable()) {
        acceptThread.join();
    }

    outboxCv_.notify_all();
    if (senderThread_.joinable()) {
        senderThread_.join();
    }
    for (auto& [peer, fd] : raftConnections_) {
        closeSocket(fd);
    }
    raftConnections_.clear();

    {
        std::lock_guard<std::mutex> lock(clientThreadsMutex_);
        for (auto& ct : clientThreads_) {
            if (ct && ct->thread.joinable()) {
                ct->thread.join();
            }
        }
        clientThreads_.clear();
    }

    spdlog::info("[TcpTransport:{}] Stopped. Total connections: {}", self_, totalConnectionsAccepted_.load());
}

void TcpTransport::updatePeerAddress(PeerId peer, const std::string& address) {
    const auto colon = address.rfind(':');
    if (colon == std::string::npos) {
        spdlog::warn("[TcpTransport:{}] Ignoring malformed address '{}' for peer {}", self_, address, peer);
        return;
    }
    int port = 0;
    try {
        port = std::stoi(address.substr(colon + 1));
    } catch (const std::exception&) {
        spdlog::warn("[TcpTransport:{}] Ignoring malformed address '{}' for peer {}", self_, address, peer);
        return;
    }
    std::lock_guard<std::mutex> lock(addressMutex_);
    addresses_[peer] = {address.substr(0, colon), port};
}

// ============================================================================
// SERVER
// ============================================================================

void TcpTransport::cleanupFinishedThreads() {
    std::lock_guard<std::mutex> lock(clientThreadsMutex_);
    auto it = clientThreads_.begin();
    while (it != clientThreads_.end()) {
        if ((*it)->finished.load(std::memory_order_acquire)) {
            if ((*it)->thread.joinable()) {
                (*it)->thread.join();
            }
            it = clientThreads_.erase(it);
        } else {
            ++it;
        }
    }
}

void TcpTransport::acceptConnections() {
    constexpr int kCleanupInterval = 10;
    int connectionsSinceCleanup = 0;

    while (isRunning.load(std::memory_order_acquire)) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientFd = accept(server_fd, (struct sockaddr*)&clientAddr, &clientLen);

        if (clientFd < 0) {
            if (isRunning.load(std::memory_order_acquire)) {
                spdlog::error("[TcpTransport:{}] Failed to accept peer connection", self_);
            }
            continue;
        }

        std::string clientAddress = inet_ntoa(clientAddr.sin_addr);
        spdlog::debug("[TcpTransport:{}] Accepted connection from {}", self_, clientAddress);

        auto clientThread = std::make_unique<ClientThread>();
        ClientThread* ctPtr = clientThread.get();
        clientThread->thread = std::thread([this, clientFd, clientAddress, ctPtr]() {
            handleClient(clientFd, clientAddress);
            ctPtr->finished.store(true, std::memory_order_release);
        });

        {
            std::lock_guard<std::mutex> lock(clientThreadsMutex_);
            clientThreads_.push_back(std::move(clientThread));
        }
        totalConnectionsAccepted_.fetch_add(1, std::memory_order_relaxed);

        if (++connectionsSinceCleanup >= kCleanupInterval) {
            cleanupFinishedThreads();
            connectionsSinceCleanup = 0;
        }
    }
}

void TcpTransport::handleClient(int clientFd, std::string clientAddress) {
    // Wake up periodically to notice shutdown
    setTimeouts(clientFd, std::chrono::milliseconds(500));

    while (isRunning.load(std::memory_order_acquire)) {
        uint8_t header[4];
        ssize_t peeked = recv(clientFd, header, sizeof(header), MSG_PEEK);
        if (peeked < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            continue;
        }
        if (peeked <= 0) {
            break;
        }

        auto content = readFrame(clientFd);
        if (!content) {
            spdlog::warn("[TcpTransport:{}] Bad or truncated frame from {}, closing", self_, clientAddress);
            break;
        }

        const auto type = static_cast<RpcType>((*content)[0]);
        std::vector<uint8_t> body(content->begin() + 1, content->end());
        std::vector<uint8_t> response = dispatch(type, body);

        std::vector<uint8_t> frame(4 + response.size());
        writeUint32BE(frame.data(), static_cast<uint32_t>(response.size()));
        std::memcpy(frame.data() + 4, response.data(), response.size());
        if (!sendAll(clientFd, frame.data(), frame.size())) {
            spdlog::warn("[TcpTransport:{}] Failed to answer {}", self_, clientAddress);
            break;
        }
    }

    closeSocket(clientFd);
    spdlog::debug("[TcpTransport:{}] Closed connection with {}", self_, clientAddress);
}

std::vector<uint8_t> TcpTransport::dispatch(RpcType type, const std::vector<uint8_t>& body) {
    ByteWriter out;
    try {
        ByteReader r(body);
        switch (type) {
            case RpcType::RAFT_MESSAGE:
                handler_.onRaftMessage(decodeMessage(body));
                out.putU8(0);
                break;
            case RpcType::FORWARD_OPERATION: {
                ApplyResult result = handler_.onForward(decodeForwardRequest(r));
                out.putU8(0);
                encode(out, result);
                break;
            }
            case RpcType::FETCH_OPERATIONS: {
                FetchResponse resp = handler_.onFetch(decodeFetchRequest(r));
                out.putU8(0);
                encode(out, resp);
                break;
            }
            case RpcType::PROBE_REPLICA: {
                ProbeResponse resp = handler_.onProbe(decodeProbeRequest(r));
                out.putU8(0);
                encode(out, resp);
                break;
            }
            case RpcType::TRANSFER_SNAPSHOT: {
                OperationId last = handler_.onTransferSnapshot(decodeSnapshotRequest(r));
                out.putU8(0);
                out.putU64(last);
                break;
            }
            case RpcType::SUBMIT_TO_PRIMARY: {
                UpdateResult result = handler_.onSubmit(decodeSubmitRequest(r));
                out.putU8(0);
                encode(out, result);
                break;
            }
            case RpcType::FETCH_SNAPSHOT: {
                FetchSnapshotResponse resp = handler_.onFetchSnapshot(decodeFetchSnapshotRequest(r));
                out.putU8(0);
                encode(out, resp);
                break;
            }
            case RpcType::GET_POINTS: {
                GetPointsResponse resp = handler_.onGetPoints(decodeGetPointsRequest(r));
                out.putU8(0);
                encode(out, resp);
                break;
            }
            default:
                throw BadRequestError("Unknown request type " + std::to_string(static_cast<int>(type)));
        }
    } catch (const ClusterError& e) {
        ByteWriter err;
        encodeError(err, e);
        return err.take();
    } catch (const std::runtime_error& e) {
        spdlog::warn("[TcpTransport:{}] Malformed {} request: {}", self_, toString(type), e.what());
        ByteWriter err;
        encodeError(err, ServiceError(std::string("Malformed request: ") + e.what()));
        return err.take();
    }
    return out.take();
}

// ============================================================================
// CLIENT
// ============================================================================

int TcpTransport::connectTo(PeerId peer, Timeout timeout) const {
    std::pair<std::string, int> address;
    {
        std::lock_guard<std::mutex> lock(addressMutex_);
        auto it = addresses_.find(peer);
        if (it == addresses_.end()) {
            return -1;
        }
        address = it->second;
    }

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* result = nullptr;
    if (getaddrinfo(address.first.c_str(), std::to_string(address.second).c_str(), &hints, &result) != 0 || !result) {
        return -1;
    }

    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd >= 0) {
        setTimeouts(fd, timeout);
        if (connect(fd, result->ai_addr, result->ai_addrlen) < 0) {
            closeSocket(fd);
            fd = -1;
        }
    }
    freeaddrinfo(result);
    return fd;
}

std::vector<uint8_t> TcpTransport::roundTrip(PeerId peer, RpcType type, const std::vector<uint8_t>& body,
                                             Timeout timeout) {
    int fd = connectTo(peer, timeout);
    if (fd < 0) {
        throw TimeoutError(std::string(toString(type)) + " to peer " + std::to_string(peer) + ": unreachable");
    }
    std::optional<std::vector<uint8_t>> response;
    if (writeFrame(fd, static_cast<uint8_t>(type), body)) {
        response = readFrame(fd);
    }
    closeSocket(fd);
    if (!response) {
        throw TimeoutError(std::string(toString(type)) + " to peer " + std::to_string(peer) + ": no response");
    }
    return std::move(*response);
}

ApplyResult TcpTransport::forwardOperation(PeerId peer, const ForwardRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::FORWARD_OPERATION, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeApplyResult(r);
}

FetchResponse TcpTransport::fetchOperations(PeerId peer, const FetchRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::FETCH_OPERATIONS, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeFetchResponse(r);
}

ProbeResponse TcpTransport::probeReplica(PeerId peer, const ProbeRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::PROBE_REPLICA, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeProbeResponse(r);
}

OperationId TcpTransport::transferSnapshot(PeerId peer, const SnapshotRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::TRANSFER_SNAPSHOT, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return r.getU64();
}

UpdateResult TcpTransport::submitToPrimary(PeerId peer, const SubmitRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::SUBMIT_TO_PRIMARY, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeUpdateResult(r);
}

FetchSnapshotResponse TcpTransport::fetchSnapshot(PeerId peer, const FetchSnapshotRequest& request,
                                                  Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::FETCH_SNAPSHOT, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeFetchSnapshotResponse(r);
}

GetPointsResponse TcpTransport::getPoints(PeerId peer, const GetPointsRequest& request, Timeout timeout) {
    ByteWriter w;
    encode(w, request);
    auto response = roundTrip(peer, RpcType::GET_POINTS, w.data(), timeout);
    ByteReader r(response);
    checkResponseStatus(r);
    return decodeGetPointsResponse(r);
}

// ============================================================================
// CONSENSUS MESSAGES
// ============================================================================

void TcpTransport::send(const RaftMessage& message) {
    {
        std::lock_guard<std::mutex> lock(outboxMutex_);
        outbox_.push_back(message);
    }
    outboxCv_.notify_one();
}

void TcpTransport::senderLoop() {
    while (true) {
        RaftMessage message;
        {
            std::unique_lock<std::mutex> lock(outboxMutex_);
            outboxCv_.wait(lock, [this] { return !outbox_.empty() || !isRunning.load(); });
            if (!isRunning.load()) {
                return;
            }
            message = std::move(outbox_.front());
            outbox_.pop_front();
        }

        auto it = raftConnections_.find(message.to);
        if (it == raftConnections_.end()) {
            int fd = connectTo(message.to, kRaftSendTimeout);
            if (fd < 0) {
                sendFailures_++;
                spdlog::debug("[TcpTransport:{}] Peer {} unreachable, dropped {}", self_, message.to,
                              toString(message.type));
                continue;
            }
            it = raftConnections_.emplace(message.to, fd).first;
        }

        const bool delivered = writeFrame(it->second, static_cast<uint8_t>(RpcType::RAFT_MESSAGE),
                                          encodeMessage(message)) &&
                               readFrame(it->second).has_value();
        if (!delivered) {
            sendFailures_++;
            closeSocket(it->second);
            raftConnections_.erase(it);
        }
    }
}

}  // namespace VectorCluster
