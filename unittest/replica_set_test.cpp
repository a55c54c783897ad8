// ============================================================================
// SHARD REPLICA SET UNIT TESTS
// ============================================================================
// Three replicas of one shard wired through InMemoryNetwork: sequencing on
// the primary, fan-out, gap refill, dead detection and catch-up
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/replication/replica_set.hpp>
#include "replica_harness.hpp"
#include "test_cluster.hpp"

#include <algorithm>
#include <thread>
#include <vector>

using namespace VectorCluster;

namespace {

const ShardKey KEY{"vectors", 0};

std::vector<uint8_t> upsert(PointId id) {
    return PointOperation::upsert({Point{id, {0.5f, 1.5f}, {}}}).encode();
}

ReplicationOptions fastOptions() {
    ReplicationOptions options;
    options.forward_timeout = std::chrono::milliseconds(200);
    options.fetch_batch = 4;
    return options;
}

}  // namespace

class ReplicaSetTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (PeerId id : {1, 2, 3}) {
            harness_.addPeer(id);
            harness_.host(id, KEY);
        }
    }

    void publish(const std::map<PeerId, ReplicaState>& replicas, uint32_t write_consistency_factor = 1) {
        harness_.publish(KEY, replicas, write_consistency_factor);
    }

    void publishAllActive(uint32_t write_consistency_factor = 1) {
        publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::ACTIVE}},
                write_consistency_factor);
    }

    ShardReplicaSet& set(PeerId id) { return harness_.set(id, KEY); }
    InMemoryPointStore& store(PeerId id) { return harness_.store(id); }
    std::vector<test::DeadReport> deadReports() { return harness_.deadReports(); }
    bool reported(PeerId reporter, PeerId peer) { return harness_.reported(reporter, peer); }

    test::ReplicaHarness harness_{fastOptions()};
};

// ============================================================================
// SEQUENCING & FAN-OUT
// ============================================================================

TEST_F(ReplicaSetTest, LowestActivePeerIsPrimary) {
    publishAllActive();
    EXPECT_TRUE(set(1).isPrimary());
    EXPECT_FALSE(set(2).isPrimary());
    EXPECT_EQ(set(3).primary(), std::optional<PeerId>(1));

    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::ACTIVE}});
    EXPECT_TRUE(set(2).isPrimary());
    EXPECT_FALSE(set(1).isPrimary());
}

TEST_F(ReplicaSetTest, PrimaryAssignsSequentialIds) {
    publishAllActive();
    for (OperationId expected = 1; expected <= 5; ++expected) {
        auto result = set(1).submit(upsert(expected), true);
        EXPECT_EQ(result.operation_id, expected);
        EXPECT_EQ(result.status, UpdateStatus::COMPLETED);
        EXPECT_FALSE(result.isPartialFailure());
    }
    for (PeerId id : {1, 2, 3}) {
        EXPECT_EQ(set(id).local().lastApplied(), 5u);
        EXPECT_EQ(store(id).pointCount(KEY), 5u);
    }
    EXPECT_EQ(store(1).digest(KEY), store(2).digest(KEY));
    EXPECT_EQ(store(1).digest(KEY), store(3).digest(KEY));
}

TEST_F(ReplicaSetTest, SubmitWithoutWaitIsAcknowledged) {
    publishAllActive();
    auto result = set(1).submit(upsert(1), false);
    EXPECT_EQ(result.operation_id, 1u);
    EXPECT_EQ(result.status, UpdateStatus::ACKNOWLEDGED);
    EXPECT_EQ(set(1).local().lastApplied(), 1u);

    // Forwards still reach the other replicas in the background
    EXPECT_TRUE(test::waitFor([&] {
        return set(2).local().lastApplied() == 1 && set(3).local().lastApplied() == 1;
    }));
}

TEST_F(ReplicaSetTest, NonPrimaryRejectsSubmit) {
    publishAllActive();
    EXPECT_THROW(set(2).submit(upsert(1), true), StaleTopologyError);
    EXPECT_EQ(set(2).local().lastApplied(), 0u);
}

TEST_F(ReplicaSetTest, StorageRejectionIsReportedAfterReplication) {
    publishAllActive();
    EXPECT_THROW(set(1).submit({0xFF, 0x00}, true), StorageError);

    // The id was consumed everywhere; the next write gets id 2
    EXPECT_EQ(set(2).local().lastApplied(), 1u);
    EXPECT_EQ(set(1).submit(upsert(1), true).operation_id, 2u);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST_F(ReplicaSetTest, UnreachableReplicaIsMarkedDead) {
    publishAllActive();
    set(1).submit(upsert(1), true);

    harness_.network().isolate(3);
    auto result = set(1).submit(upsert(2), true);
    EXPECT_EQ(result.status, UpdateStatus::COMPLETED);
    ASSERT_EQ(result.failed_peers.size(), 1u);
    EXPECT_EQ(result.failed_peers[0], 3u);

    EXPECT_TRUE(reported(1, 3));
    EXPECT_EQ(set(1).locallyDeadActive(), std::vector<PeerId>{3});

    auto status = set(1).replicaStatus();
    auto dead = std::find_if(status.begin(), status.end(), [](const RemoteReplicaStatus& s) {
        return s.peer_id == 3;
    });
    ASSERT_NE(dead, status.end());
    EXPECT_EQ(dead->health, ReplicaHealth::DEAD);
    EXPECT_EQ(dead->committed, ReplicaState::ACTIVE);

    // A dead replica is no longer a forward target
    harness_.network().heal();
    set(1).submit(upsert(3), true);
    EXPECT_EQ(set(3).local().lastApplied(), 1u);
    EXPECT_EQ(set(2).local().lastApplied(), 3u);
}

TEST_F(ReplicaSetTest, WriteConsistencyFactorNotMet) {
    publishAllActive(3);
    set(1).submit(upsert(1), true);
    harness_.network().isolate(2);
    harness_.network().isolate(3);
    auto result = set(1).submit(upsert(2), true);
    EXPECT_EQ(result.status, UpdateStatus::ACKNOWLEDGED);
    EXPECT_EQ(result.failed_peers.size(), 2u);
}

TEST_F(ReplicaSetTest, SlowReplicaDoesNotStarveHealthyOnes) {
    publishAllActive();
    set(1).submit(upsert(1), true);

    // Each forward to peer 3 outlasts the acknowledgement timeout; concurrent
    // writes queue behind it on the shared workers
    harness_.handler(3).delayForwards(std::chrono::milliseconds(1000));
    constexpr int kWriters = 8;
    std::vector<UpdateResult> results(kWriters);
    std::vector<std::thread> writers;
    for (int i = 0; i < kWriters; ++i) {
        writers.emplace_back([&, i] { results[i] = set(1).submit(upsert(100 + i), true); });
    }
    for (auto& writer : writers) {
        writer.join();
    }

    EXPECT_TRUE(reported(1, 3));
    EXPECT_FALSE(reported(1, 2));
    for (const auto& result : results) {
        EXPECT_EQ(result.status, UpdateStatus::COMPLETED);
        EXPECT_EQ(std::count(result.failed_peers.begin(), result.failed_peers.end(), 2u), 0);
    }
    EXPECT_EQ(set(2).local().lastApplied(), 1u + kWriters);
    EXPECT_EQ(store(2).digest(KEY), store(1).digest(KEY));
}

TEST_F(ReplicaSetTest, CommittedDeadThenActiveRestoresForwarding) {
    publishAllActive();
    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::DEAD}});
    set(1).submit(upsert(1), true);
    EXPECT_EQ(set(3).local().lastApplied(), 0u);

    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::INITIALIZING}});
    EXPECT_EQ(set(1).synchronize(3), 1u);
    publishAllActive();

    // Peer 3 was behind by one; the next forward is applied in order
    auto result = set(1).submit(upsert(2), true);
    EXPECT_FALSE(result.isPartialFailure());
    EXPECT_EQ(set(3).local().lastApplied(), 2u);
}

// ============================================================================
// GAP REFILL & CATCH-UP
// ============================================================================

TEST_F(ReplicaSetTest, ReplicaBehindIsRefilledOnForward) {
    publishAllActive();
    // Operations the replicas never saw
    for (OperationId id = 1; id <= 6; ++id) {
        set(1).local().apply(id, upsert(id));
    }

    auto result = set(1).submit(upsert(7), true);
    EXPECT_EQ(result.operation_id, 7u);
    EXPECT_FALSE(result.isPartialFailure());
    for (PeerId id : {2, 3}) {
        EXPECT_EQ(set(id).local().lastApplied(), 7u);
        EXPECT_EQ(store(id).digest(KEY), store(1).digest(KEY));
    }
}

TEST_F(ReplicaSetTest, PrimaryProbeRefillsLaggingReplica) {
    publishAllActive();
    set(1).submit(upsert(1), true);
    set(1).local().apply(2, upsert(2));
    set(1).local().apply(3, upsert(3));

    set(1).probe();
    EXPECT_EQ(set(2).local().lastApplied(), 3u);
    EXPECT_EQ(set(3).local().lastApplied(), 3u);
    EXPECT_TRUE(deadReports().empty());
}

TEST_F(ReplicaSetTest, NewPrimaryPullsMissingOperations) {
    publishAllActive();
    for (OperationId id = 1; id <= 5; ++id) {
        set(1).submit(upsert(id), true);
    }

    // Peer 1 fails; peer 2 takes over from a position behind peer 3
    harness_.network().detach(1);
    set(3).local().apply(6, upsert(6));
    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::ACTIVE}});

    auto result = set(2).submit(upsert(7), true);
    EXPECT_EQ(result.operation_id, 7u);
    EXPECT_EQ(set(2).local().lastApplied(), 7u);
    EXPECT_EQ(set(3).local().lastApplied(), 7u);
    EXPECT_EQ(store(2).digest(KEY), store(3).digest(KEY));
}

TEST_F(ReplicaSetTest, NewPrimaryPullsSnapshotWhenPeerLogIsCompacted) {
    // Peer 3 keeps a single operation below its apply position
    harness_.host(3, KEY, 1);
    publishAllActive();
    for (OperationId id = 1; id <= 3; ++id) {
        set(1).submit(upsert(id), true);
    }
    // Operations 4 and 5 reached the old primary and peer 3 only
    for (OperationId id = 4; id <= 5; ++id) {
        set(1).local().apply(id, upsert(id));
        set(3).local().apply(id, upsert(id));
    }
    set(3).local().flushAndCompact();
    ASSERT_FALSE(set(3).local().operationsFrom(4, 1).has_value());

    harness_.network().detach(1);
    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::ACTIVE}});

    auto result = set(2).submit(upsert(100), true);
    EXPECT_EQ(result.operation_id, 6u);
    EXPECT_FALSE(result.isPartialFailure());
    EXPECT_EQ(set(3).local().lastApplied(), 6u);
    EXPECT_EQ(store(2).digest(KEY), store(3).digest(KEY));
    EXPECT_EQ(store(2).pointCount(KEY), 6u);
    EXPECT_TRUE(store(3).getPoint(KEY, 100).has_value());
}

TEST_F(ReplicaSetTest, NewPrimaryRefusesWritesUntilEveryActiveReplicaIsChecked) {
    publishAllActive();
    for (OperationId id = 1; id <= 2; ++id) {
        set(1).submit(upsert(id), true);
    }
    set(3).local().apply(3, upsert(3));

    harness_.network().detach(1);
    harness_.network().isolate(3);
    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::ACTIVE}});

    // Peer 3 may hold operations peer 2 lacks: no id is handed out yet
    try {
        set(2).submit(upsert(100), true);
        FAIL() << "expected ShardInitializingError";
    } catch (const ShardInitializingError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
    EXPECT_EQ(set(2).local().lastApplied(), 2u);
    EXPECT_TRUE(reported(2, 3));

    // Once peer 3 is Dead the retry proceeds without it
    auto result = set(2).submit(upsert(100), true);
    EXPECT_EQ(result.operation_id, 3u);
    EXPECT_FALSE(result.isPartialFailure());

    // Peer 3 logged a different operation 3; it comes back through a snapshot
    harness_.network().heal();
    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::DEAD}});
    publish({{1, ReplicaState::DEAD}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::INITIALIZING}});
    EXPECT_FALSE(set(2).sharesOperation(3, 3));
    EXPECT_TRUE(set(2).sharesOperation(3, 2));
    set(2).pushSnapshot(3);
    EXPECT_EQ(set(2).synchronize(3), 3u);
    EXPECT_EQ(store(3).digest(KEY), store(2).digest(KEY));
}

// ============================================================================
// READS
// ============================================================================

TEST_F(ReplicaSetTest, ReadsAreServedByThePrimary) {
    publishAllActive();
    set(1).submit(upsert(1), true);
    set(1).submit(upsert(2), true);

    auto points = set(1).read({2, 7, 1});
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[0].id, 2u);
    EXPECT_EQ(points[1].id, 1u);
    EXPECT_EQ(points[0].vector, (std::vector<float>{0.5f, 1.5f}));

    EXPECT_THROW(set(2).read({1}), StaleTopologyError);
}

// ============================================================================
// TRANSFERS
// ============================================================================

TEST_F(ReplicaSetTest, SynchronizeStreamsMissingOperations) {
    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}});
    for (OperationId id = 1; id <= 9; ++id) {
        set(1).submit(upsert(id), true);
    }

    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::INITIALIZING}});
    EXPECT_EQ(set(1).probePeer(3), std::optional<OperationId>(0));
    EXPECT_EQ(set(1).synchronize(3), 9u);
    EXPECT_EQ(set(3).local().lastApplied(), 9u);

    // Synchronized Initializing replicas receive new writes best-effort
    set(1).submit(upsert(10), true);
    EXPECT_TRUE(test::waitFor([&] { return set(3).local().lastApplied() == 10; }));
    EXPECT_EQ(store(3).digest(KEY), store(1).digest(KEY));
}

TEST_F(ReplicaSetTest, CompactedLogNeedsSnapshot) {
    // Peer 1 keeps only two operations below its apply position
    harness_.host(1, KEY, 2);
    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}});
    for (OperationId id = 1; id <= 10; ++id) {
        set(1).submit(upsert(id), true);
    }
    set(1).local().flushAndCompact();

    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}, {3, ReplicaState::INITIALIZING}});
    EXPECT_THROW(set(1).synchronize(3), StorageError);

    EXPECT_EQ(set(1).pushSnapshot(3), 10u);
    EXPECT_EQ(set(3).local().lastApplied(), 10u);
    EXPECT_EQ(store(3).pointCount(KEY), 10u);
    EXPECT_EQ(set(1).synchronize(3), 10u);
    EXPECT_EQ(store(3).digest(KEY), store(1).digest(KEY));
}

TEST_F(ReplicaSetTest, TransferToUnknownPeerIsStale) {
    publish({{1, ReplicaState::ACTIVE}, {2, ReplicaState::ACTIVE}});
    EXPECT_THROW(set(1).pushSnapshot(3), StaleTopologyError);
    EXPECT_THROW(set(1).synchronize(3), StaleTopologyError);
}

TEST_F(ReplicaSetTest, ProbePeerNotHostingShard) {
    publishAllActive();
    harness_.unhost(3, KEY);
    EXPECT_EQ(set(1).probePeer(3), std::nullopt);
}

// ============================================================================
// HEALTH
// ============================================================================

TEST_F(ReplicaSetTest, ReplicaReportsUnreachablePrimary) {
    publishAllActive();
    set(2).probe();
    EXPECT_TRUE(deadReports().empty());

    harness_.network().isolate(1);
    set(2).probe();
    EXPECT_TRUE(reported(2, 1));
}

TEST_F(ReplicaSetTest, PrimaryProbeMarksUnreachableReplicaDead) {
    publishAllActive();
    harness_.network().detach(2);
    set(1).probe();
    EXPECT_TRUE(reported(1, 2));
    EXPECT_EQ(set(1).locallyDeadActive(), std::vector<PeerId>{2});
}
