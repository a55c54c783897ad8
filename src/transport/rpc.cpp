#include <vectorcluster/transport/rpc.hpp>

namespace VectorCluster {

const char* toString(RpcType type) {
    switch (type) {
        case RpcType::RAFT_MESSAGE:      return "RAFT_MESSAGE";
        case RpcType::FORWARD_OPERATION: return "FORWARD_OPERATION";
        case RpcType::FETCH_OPERATIONS:  return "FETCH_OPERATIONS";
        case RpcType::PROBE_REPLICA:     return "PROBE_REPLICA";
        case RpcType::TRANSFER_SNAPSHOT: return "TRANSFER_SNAPSHOT";
        case RpcType::SUBMIT_TO_PRIMARY: return "SUBMIT_TO_PRIMARY";
        case RpcType::FETCH_SNAPSHOT:    return "FETCH_SNAPSHOT";
        case RpcType::GET_POINTS:        return "GET_POINTS";
    }
    return "UNKNOWN";
}

void encodeShardKey(ByteWriter& w, const ShardKey& key) {
    w.putString(key.collection);
    w.putU32(key.shard_id);
}

ShardKey decodeShardKey(ByteReader& r) {
    ShardKey key;
    key.collection = r.getString();
    key.shard_id = r.getU32();
    return key;
}

// ============================================================================
// REQUESTS
// ============================================================================

void encode(ByteWriter& w, const ForwardRequest& req) {
    encodeShardKey(w, req.key);
    w.putU64(req.operation_id);
    w.putBytes(req.payload);
    w.putU64(req.sender);
}

ForwardRequest decodeForwardRequest(ByteReader& r) {
    ForwardRequest req;
    req.key = decodeShardKey(r);
    req.operation_id = r.getU64();
    req.payload = r.getBytes();
    req.sender = r.getU64();
    return req;
}

void encode(ByteWriter& w, const FetchRequest& req) {
    encodeShardKey(w, req.key);
    w.putU64(req.from);
    w.putU32(req.max_count);
}

FetchRequest decodeFetchRequest(ByteReader& r) {
    FetchRequest req;
    req.key = decodeShardKey(r);
    req.from = r.getU64();
    req.max_count = r.getU32();
    return req;
}

void encode(ByteWriter& w, const ProbeRequest& req) {
    encodeShardKey(w, req.key);
}

ProbeRequest decodeProbeRequest(ByteReader& r) {
    return ProbeRequest{decodeShardKey(r)};
}

void encode(ByteWriter& w, const SnapshotRequest& req) {
    encodeShardKey(w, req.key);
    w.putU64(req.cutoff);
    w.putBytes(req.data);
}

SnapshotRequest decodeSnapshotRequest(ByteReader& r) {
    SnapshotRequest req;
    req.key = decodeShardKey(r);
    req.cutoff = r.getU64();
    req.data = r.getBytes();
    return req;
}

void encode(ByteWriter& w, const SubmitRequest& req) {
    encodeShardKey(w, req.key);
    w.putBytes(req.payload);
    w.putBool(req.wait);
}

SubmitRequest decodeSubmitRequest(ByteReader& r) {
    SubmitRequest req;
    req.key = decodeShardKey(r);
    req.payload = r.getBytes();
    req.wait = r.getBool();
    return req;
}

void encode(ByteWriter& w, const FetchSnapshotRequest& req) {
    encodeShardKey(w, req.key);
}

FetchSnapshotRequest decodeFetchSnapshotRequest(ByteReader& r) {
    return FetchSnapshotRequest{decodeShardKey(r)};
}

void encode(ByteWriter& w, const GetPointsRequest& req) {
    encodeShardKey(w, req.key);
    w.putU32(static_cast<uint32_t>(req.ids.size()));
    for (PointId id : req.ids) {
        w.putU64(id);
    }
}

GetPointsRequest decodeGetPointsRequest(ByteReader& r) {
    GetPointsRequest req;
    req.key = decodeShardKey(r);
    req.ids.resize(r.getU32());
    for (auto& id : req.ids) {
        id = r.getU64();
    }
    return req;
}

// ============================================================================
// RESPONSES
// ============================================================================

void encode(ByteWriter& w, const FetchSnapshotResponse& resp) {
    w.putBool(resp.hosted);
    w.putU64(resp.cutoff);
    w.putBytes(resp.data);
}

FetchSnapshotResponse decodeFetchSnapshotResponse(ByteReader& r) {
    FetchSnapshotResponse resp;
    resp.hosted = r.getBool();
    resp.cutoff = r.getU64();
    resp.data = r.getBytes();
    return resp;
}

// Points travel in the same layout as an upsert payload
void encode(ByteWriter& w, const GetPointsResponse& resp) {
    w.putBytes(PointOperation::upsert(resp.points).encode());
}

GetPointsResponse decodeGetPointsResponse(ByteReader& r) {
    GetPointsResponse resp;
    resp.points = PointOperation::decode(r.getBytes()).points;
    return resp;
}

void encode(ByteWriter& w, const FetchResponse& resp) {
    w.putBool(resp.available);
    w.putU64(resp.last_id);
    w.putU32(static_cast<uint32_t>(resp.operations.size()));
    for (const auto& op : resp.operations) {
        w.putU64(op.id);
        w.putBytes(op.payload);
    }
}

FetchResponse decodeFetchResponse(ByteReader& r) {
    FetchResponse resp;
    resp.available = r.getBool();
    resp.last_id = r.getU64();
    resp.operations.resize(r.getU32());
    for (auto& op : resp.operations) {
        op.id = r.getU64();
        op.payload = r.getBytes();
    }
    return resp;
}

void encode(ByteWriter& w, const ProbeResponse& resp) {
    w.putBool(resp.hosted);
    w.putU64(resp.last_applied);
}

ProbeResponse decodeProbeResponse(ByteReader& r) {
    ProbeResponse resp;
    resp.hosted = r.getBool();
    resp.last_applied = r.getU64();
    return resp;
}

void encode(ByteWriter& w, const ApplyResult& result) {
    w.putU8(static_cast<uint8_t>(result.outcome));
    w.putU64(result.last_applied);
    w.putString(result.storage_error);
}

ApplyResult decodeApplyResult(ByteReader& r) {
    ApplyResult result;
    const uint8_t outcome = r.getU8();
    if (outcome > static_cast<uint8_t>(ApplyOutcome::GAP)) {
        throw std::runtime_error("Invalid apply outcome " + std::to_string(outcome));
    }
    result.outcome = static_cast<ApplyOutcome>(outcome);
    result.last_applied = r.getU64();
    result.storage_error = r.getString();
    return result;
}

void encode(ByteWriter& w, const UpdateResult& result) {
    w.putU64(result.operation_id);
    w.putU8(static_cast<uint8_t>(result.status));
    w.putU32(static_cast<uint32_t>(result.failed_peers.size()));
    for (PeerId peer : result.failed_peers) {
        w.putU64(peer);
    }
}

UpdateResult decodeUpdateResult(ByteReader& r) {
    UpdateResult result;
    result.operation_id = r.getU64();
    result.status = r.getU8() == static_cast<uint8_t>(UpdateStatus::COMPLETED)
                        ? UpdateStatus::COMPLETED : UpdateStatus::ACKNOWLEDGED;
    result.failed_peers.resize(r.getU32());
    for (auto& peer : result.failed_peers) {
        peer = r.getU64();
    }
    return result;
}

// ============================================================================
// ERROR STATUS
// ============================================================================

void encodeError(ByteWriter& w, const ClusterError& error) {
    w.putU8(static_cast<uint8_t>(error.code()));
    w.putString(error.what());
    std::optional<PeerId> hint;
    if (const auto* not_leader = dynamic_cast<const NotLeaderError*>(&error)) {
        hint = not_leader->leaderHint();
    }
    w.putU64(hint.value_or(NO_PEER));
}

void checkResponseStatus(ByteReader& r) {
    const uint8_t status = r.getU8();
    if (status == 0) {
        return;
    }
    std::string message = r.getString();
    const PeerId hint = r.getU64();
    if (status > static_cast<uint8_t>(ErrorCode::SERVICE_ERROR)) {
        throw ServiceError("Peer returned unknown status " + std::to_string(status) + ": " + message);
    }
    throwClusterError(static_cast<ErrorCode>(status), message,
                      hint == NO_PEER ? std::nullopt : std::make_optional(hint));
}

}  // namespace VectorCluster
