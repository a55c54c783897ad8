// ============================================================================
// PEER PROTOCOL CODEC TESTS
// ============================================================================
// Consensus messages, replication requests and error frames as they travel
// between peers
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/consensus/messages.hpp>
#include <vectorcluster/transport/rpc.hpp>

using namespace VectorCluster;

// ============================================================================
// CONSENSUS MESSAGES
// ============================================================================

TEST(RpcCodecTest, AppendEntriesCarriesEntries) {
    RaftMessage m;
    m.type = MessageType::APPEND_ENTRIES;
    m.from = 1;
    m.to = 2;
    m.term = 4;
    m.prev_log_index = 10;
    m.prev_log_term = 3;
    m.leader_commit = 9;
    m.entries.push_back(LogEntry{4, 11, LogEntry::Type::EMPTY, {}});
    m.entries.push_back(LogEntry{4, 12, LogEntry::Type::COMMAND, {1, 2, 3}});

    RaftMessage decoded = decodeMessage(encodeMessage(m));
    EXPECT_EQ(decoded.type, MessageType::APPEND_ENTRIES);
    EXPECT_EQ(decoded.from, 1u);
    EXPECT_EQ(decoded.to, 2u);
    EXPECT_EQ(decoded.prev_log_term, 3u);
    EXPECT_EQ(decoded.leader_commit, 9u);
    EXPECT_EQ(decoded.entries, m.entries);
}

TEST(RpcCodecTest, SnapshotAndProposalFields) {
    RaftMessage snapshot;
    snapshot.type = MessageType::INSTALL_SNAPSHOT;
    snapshot.snapshot = SnapshotMeta{20, 3, {1, 2, 3}, {4}};
    snapshot.snapshot_data = {7, 7, 7};
    RaftMessage s = decodeMessage(encodeMessage(snapshot));
    EXPECT_EQ(s.snapshot.index, 20u);
    EXPECT_EQ(s.snapshot.learners, (std::vector<PeerId>{4}));
    EXPECT_EQ(s.snapshot_data, snapshot.snapshot_data);

    RaftMessage propose;
    propose.type = MessageType::PROPOSE;
    propose.proposal = {9};
    propose.forwarded = true;
    RaftMessage p = decodeMessage(encodeMessage(propose));
    EXPECT_TRUE(p.forwarded);
    EXPECT_EQ(p.proposal, propose.proposal);
}

TEST(RpcCodecTest, MalformedMessageThrows) {
    EXPECT_THROW(decodeMessage({}), std::runtime_error);
    auto data = encodeMessage(RaftMessage{});
    data.resize(data.size() / 2);
    EXPECT_THROW(decodeMessage(data), std::runtime_error);
}

// ============================================================================
// REPLICATION REQUESTS
// ============================================================================

TEST(RpcCodecTest, ForwardRequest) {
    ForwardRequest req{ShardKey{"vectors", 3}, 17, {1, 2}, 5};
    ByteWriter w;
    encode(w, req);
    ByteReader r(w.data());
    ForwardRequest decoded = decodeForwardRequest(r);
    EXPECT_EQ(decoded.key, req.key);
    EXPECT_EQ(decoded.operation_id, 17u);
    EXPECT_EQ(decoded.payload, req.payload);
    EXPECT_EQ(decoded.sender, 5u);
    EXPECT_TRUE(r.atEnd());
}

TEST(RpcCodecTest, FetchResponse) {
    FetchResponse resp;
    resp.available = true;
    resp.last_id = 9;
    resp.operations.push_back(LoggedOperation{8, {1}});
    resp.operations.push_back(LoggedOperation{9, {2}});
    ByteWriter w;
    encode(w, resp);
    ByteReader r(w.data());
    FetchResponse decoded = decodeFetchResponse(r);
    EXPECT_TRUE(decoded.available);
    ASSERT_EQ(decoded.operations.size(), 2u);
    EXPECT_EQ(decoded.operations[1].id, 9u);
    EXPECT_EQ(decoded.operations[1].payload, (std::vector<uint8_t>{2}));
}

TEST(RpcCodecTest, UpdateResultKeepsFailedPeers) {
    UpdateResult result{42, UpdateStatus::ACKNOWLEDGED, {2, 3}};
    ByteWriter w;
    encode(w, result);
    ByteReader r(w.data());
    UpdateResult decoded = decodeUpdateResult(r);
    EXPECT_EQ(decoded.operation_id, 42u);
    EXPECT_EQ(decoded.status, UpdateStatus::ACKNOWLEDGED);
    EXPECT_TRUE(decoded.isPartialFailure());
    EXPECT_EQ(decoded.failed_peers, (std::vector<PeerId>{2, 3}));
}

TEST(RpcCodecTest, ApplyResultWithStorageError) {
    ApplyResult result{ApplyOutcome::GAP, 6, "bad payload"};
    ByteWriter w;
    encode(w, result);
    ByteReader r(w.data());
    ApplyResult decoded = decodeApplyResult(r);
    EXPECT_EQ(decoded.outcome, ApplyOutcome::GAP);
    EXPECT_EQ(decoded.last_applied, 6u);
    EXPECT_EQ(decoded.storage_error, "bad payload");
}

// ============================================================================
// ERROR FRAMES
// ============================================================================

TEST(RpcCodecTest, SuccessStatusPassesThrough) {
    ByteWriter w;
    w.putU8(0);
    encode(w, ProbeResponse{true, 12});
    ByteReader r(w.data());
    checkResponseStatus(r);
    ProbeResponse decoded = decodeProbeResponse(r);
    EXPECT_TRUE(decoded.hosted);
    EXPECT_EQ(decoded.last_applied, 12u);
}

TEST(RpcCodecTest, NotLeaderKeepsHint) {
    ByteWriter w;
    encodeError(w, NotLeaderError(3));
    ByteReader r(w.data());
    try {
        checkResponseStatus(r);
        FAIL() << "expected NotLeaderError";
    } catch (const NotLeaderError& e) {
        EXPECT_EQ(e.leaderHint(), std::optional<PeerId>(3));
    }
}

TEST(RpcCodecTest, ErrorTypeSurvivesWire) {
    ByteWriter w;
    encodeError(w, StaleTopologyError("primary moved"));
    ByteReader r(w.data());
    try {
        checkResponseStatus(r);
        FAIL() << "expected StaleTopologyError";
    } catch (const StaleTopologyError& e) {
        EXPECT_TRUE(e.isRetryable());
        EXPECT_NE(std::string(e.what()).find("primary moved"), std::string::npos);
    }
}

TEST(RpcCodecTest, UnknownStatusIsServiceError) {
    ByteWriter w;
    w.putU8(200);
    w.putString("future error");
    w.putU64(0);
    ByteReader r(w.data());
    EXPECT_THROW(checkResponseStatus(r), ServiceError);
}
