#include <vectorcluster/common/errors.hpp>

namespace VectorCluster {

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::NOT_LEADER:              return "NotLeader";
        case ErrorCode::TIMEOUT:                 return "Timeout";
        case ErrorCode::STALE_TOPOLOGY:          return "StaleTopology";
        case ErrorCode::SHARD_INITIALIZING:      return "ShardInitializing";
        case ErrorCode::STORAGE_ERROR:           return "StorageError";
        case ErrorCode::BAD_REQUEST:             return "BadRequest";
        case ErrorCode::NOT_FOUND:               return "NotFound";
        case ErrorCode::CONF_CHANGE_IN_PROGRESS: return "ConfChangeInProgress";
        case ErrorCode::SERVICE_ERROR:           return "ServiceError";
    }
    return "Unknown";
}

ClusterError::ClusterError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

bool ClusterError::isRetryable() const {
    switch (code_) {
        case ErrorCode::NOT_LEADER:
        case ErrorCode::TIMEOUT:
        case ErrorCode::STALE_TOPOLOGY:
        case ErrorCode::SHARD_INITIALIZING:
        case ErrorCode::CONF_CHANGE_IN_PROGRESS:
            return true;
        default:
            return false;
    }
}

static std::string notLeaderMessage(std::optional<PeerId> leader_hint) {
    if (leader_hint.has_value()) {
        return "Not a leader, current leader is peer " + std::to_string(*leader_hint);
    }
    return "Not a leader, leader is unknown";
}

NotLeaderError::NotLeaderError(std::optional<PeerId> leader_hint)
    : ClusterError(ErrorCode::NOT_LEADER, notLeaderMessage(leader_hint)),
      leader_hint_(leader_hint) {}

void throwClusterError(ErrorCode code, const std::string& message,
                       std::optional<PeerId> leader_hint) {
    switch (code) {
        case ErrorCode::NOT_LEADER:              throw NotLeaderError(leader_hint);
        case ErrorCode::TIMEOUT:                 throw TimeoutError(message);
        case ErrorCode::STALE_TOPOLOGY:          throw StaleTopologyError(message);
        case ErrorCode::SHARD_INITIALIZING:      throw ShardInitializingError(message);
        case ErrorCode::STORAGE_ERROR:           throw StorageError(message);
        case ErrorCode::BAD_REQUEST:             throw BadRequestError(message);
        case ErrorCode::NOT_FOUND:               throw NotFoundError(message);
        case ErrorCode::CONF_CHANGE_IN_PROGRESS: throw ConfChangeInProgressError(message);
        case ErrorCode::SERVICE_ERROR:           throw ServiceError(message);
    }
    throw ServiceError("Unknown error code " + std::to_string(static_cast<int>(code)) + ": " + message);
}

}  // namespace VectorCluster
