#pragma once

#include <vectorcluster/common/types.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace VectorCluster {

/**
 * @brief Error taxonomy shared by consensus, replication and routing.
 *
 * Codes are stable: they are carried in RPC responses between peers.
 */
enum class ErrorCode : uint8_t {
    NOT_LEADER = 1,
    TIMEOUT = 2,
    STALE_TOPOLOGY = 3,
    SHARD_INITIALIZING = 4,
    STORAGE_ERROR = 5,
    BAD_REQUEST = 6,
    NOT_FOUND = 7,
    CONF_CHANGE_IN_PROGRESS = 8,
    SERVICE_ERROR = 9
};

const char* toString(ErrorCode code);

/**
 * @class ClusterError
 * @brief Base of every error raised across component boundaries.
 */
class ClusterError : public std::runtime_error {
public:
    ClusterError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

    /**
     * @brief True when the caller may retry the same request unchanged
     * (possibly after refreshing topology or leader).
     */
    bool isRetryable() const;

private:
    ErrorCode code_;
};

class NotLeaderError : public ClusterError {
public:
    explicit NotLeaderError(std::optional<PeerId> leader_hint);

    std::optional<PeerId> leaderHint() const { return leader_hint_; }

private:
    std::optional<PeerId> leader_hint_;
};

// Outcome unknown: the request may or may not have taken effect.
class TimeoutError : public ClusterError {
public:
    explicit TimeoutError(const std::string& message)
        : ClusterError(ErrorCode::TIMEOUT, message) {}
};

class StaleTopologyError : public ClusterError {
public:
    explicit StaleTopologyError(const std::string& message)
        : ClusterError(ErrorCode::STALE_TOPOLOGY, message) {}
};

class ShardInitializingError : public ClusterError {
public:
    explicit ShardInitializingError(const std::string& message)
        : ClusterError(ErrorCode::SHARD_INITIALIZING, message) {}
};

class StorageError : public ClusterError {
public:
    explicit StorageError(const std::string& message)
        : ClusterError(ErrorCode::STORAGE_ERROR, message) {}
};

class BadRequestError : public ClusterError {
public:
    explicit BadRequestError(const std::string& message)
        : ClusterError(ErrorCode::BAD_REQUEST, message) {}
};

class NotFoundError : public ClusterError {
public:
    explicit NotFoundError(const std::string& message)
        : ClusterError(ErrorCode::NOT_FOUND, message) {}
};

class ConfChangeInProgressError : public ClusterError {
public:
    explicit ConfChangeInProgressError(const std::string& message)
        : ClusterError(ErrorCode::CONF_CHANGE_IN_PROGRESS, message) {}
};

class ServiceError : public ClusterError {
public:
    explicit ServiceError(const std::string& message)
        : ClusterError(ErrorCode::SERVICE_ERROR, message) {}
};

/**
 * @brief Rebuild the typed exception for an error code received from a peer.
 */
[[noreturn]] void throwClusterError(ErrorCode code, const std::string& message,
                                    std::optional<PeerId> leader_hint = std::nullopt);

}  // namespace VectorCluster
