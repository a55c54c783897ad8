#pragma once

#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/types.hpp>
#include <vectorcluster/replication/operation_log.hpp>
#include <vectorcluster/replication/replication_types.hpp>
#include <vectorcluster/storage/point_operation.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

// ============================================================================
// REPLICATION RPCS
// ============================================================================
// Request/response pairs exchanged between peers next to the consensus
// messages. Every request names its shard; none carries object references.

enum class RpcType : uint8_t {
    RAFT_MESSAGE = 1,
    FORWARD_OPERATION = 2,
    FETCH_OPERATIONS = 3,
    PROBE_REPLICA = 4,
    TRANSFER_SNAPSHOT = 5,
    SUBMIT_TO_PRIMARY = 6,
    FETCH_SNAPSHOT = 7,
    GET_POINTS = 8
};

const char* toString(RpcType type);

// Primary -> replica: apply one operation (answered with ApplyResult)
struct ForwardRequest {
    ShardKey key;
    OperationId operation_id = 0;
    std::vector<uint8_t> payload;
    PeerId sender = NO_PEER;
};

// Read operations from a peer's operation log
struct FetchRequest {
    ShardKey key;
    OperationId from = 1;
    uint32_t max_count = 256;
};

struct FetchResponse {
    bool available = false;         // false: from was compacted away or shard not hosted
    std::vector<LoggedOperation> operations;
    OperationId last_id = 0;
};

struct ProbeRequest {
    ShardKey key;
};

struct ProbeResponse {
    bool hosted = false;
    OperationId last_applied = 0;
};

// Source -> target: replace the target's replica with a snapshot
struct SnapshotRequest {
    ShardKey key;
    OperationId cutoff = 0;
    std::vector<uint8_t> data;
};

// New primary -> replica whose log no longer reaches back far enough
struct FetchSnapshotRequest {
    ShardKey key;
};

struct FetchSnapshotResponse {
    bool hosted = false;
    OperationId cutoff = 0;
    std::vector<uint8_t> data;
};

// Any peer -> primary: read points by id
struct GetPointsRequest {
    ShardKey key;
    std::vector<PointId> ids;
};

struct GetPointsResponse {
    std::vector<Point> points;      // only the ids that exist
};

// Any peer -> primary: sequence and replicate a client write
struct SubmitRequest {
    ShardKey key;
    std::vector<uint8_t> payload;
    bool wait = true;
};

// ============================================================================
// ENCODING
// ============================================================================

void encodeShardKey(ByteWriter& w, const ShardKey& key);
ShardKey decodeShardKey(ByteReader& r);

void encode(ByteWriter& w, const ForwardRequest& req);
void encode(ByteWriter& w, const FetchRequest& req);
void encode(ByteWriter& w, const FetchResponse& resp);
void encode(ByteWriter& w, const ProbeRequest& req);
void encode(ByteWriter& w, const ProbeResponse& resp);
void encode(ByteWriter& w, const SnapshotRequest& req);
void encode(ByteWriter& w, const SubmitRequest& req);
void encode(ByteWriter& w, const FetchSnapshotRequest& req);
void encode(ByteWriter& w, const FetchSnapshotResponse& resp);
void encode(ByteWriter& w, const GetPointsRequest& req);
void encode(ByteWriter& w, const GetPointsResponse& resp);
void encode(ByteWriter& w, const ApplyResult& result);
void encode(ByteWriter& w, const UpdateResult& result);

ForwardRequest decodeForwardRequest(ByteReader& r);
FetchRequest decodeFetchRequest(ByteReader& r);
FetchResponse decodeFetchResponse(ByteReader& r);
ProbeRequest decodeProbeRequest(ByteReader& r);
ProbeResponse decodeProbeResponse(ByteReader& r);
SnapshotRequest decodeSnapshotRequest(ByteReader& r);
SubmitRequest decodeSubmitRequest(ByteReader& r);
FetchSnapshotRequest decodeFetchSnapshotRequest(ByteReader& r);
FetchSnapshotResponse decodeFetchSnapshotResponse(ByteReader& r);
GetPointsRequest decodeGetPointsRequest(ByteReader& r);
GetPointsResponse decodeGetPointsResponse(ByteReader& r);
ApplyResult decodeApplyResult(ByteReader& r);
UpdateResult decodeUpdateResult(ByteReader& r);

/**
 * @brief Error carried back in a response frame.
 *
 * Status byte 0 means success; otherwise it is the ErrorCode followed by the
 * message and an optional leader hint.
 */
void encodeError(ByteWriter& w, const ClusterError& error);

/**
 * @brief Read the status header of a response.
 * @throws the ClusterError subclass encoded by the peer
 */
void checkResponseStatus(ByteReader& r);

}  // namespace VectorCluster
