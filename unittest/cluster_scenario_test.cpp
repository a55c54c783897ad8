// ============================================================================
// CLUSTER SCENARIO TESTS
// ============================================================================
// Whole ClusterNodes over InMemoryNetwork: joining, replicated writes,
// replica failure and recovery, leader partition, shard split, membership
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/node/cluster_node.hpp>
#include "test_cluster.hpp"

#include <map>
#include <thread>
#include <vector>

using namespace VectorCluster;
using test::TestCluster;
using test::waitFor;

namespace {

constexpr std::chrono::milliseconds SLOW{20000};

PointOperation upsertRange(PointId first, PointId count) {
    std::vector<Point> points;
    for (PointId id = first; id < first + count; ++id) {
        points.push_back(Point{id, {static_cast<float>(id), 0.25f}, {}});
    }
    return PointOperation::upsert(std::move(points));
}

std::optional<ReplicaState> replicaState(ClusterNode& node, const ShardKey& key, PeerId peer) {
    const ShardInfo* shard = node.getTopology()->findShard(key);
    return shard ? shard->stateOf(peer) : std::nullopt;
}

}  // namespace

class ClusterScenarioTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(cluster_.startCluster(3));
    }

    void createCollection(const std::string& name, uint32_t shards, uint32_t replication_factor) {
        cluster_.onLeader([&](ClusterNode& leader) {
            return leader.shards().createCollection(name, shards, replication_factor);
        });
        ASSERT_TRUE(waitFor([&] { return cluster_.collectionSettled(1, name, replication_factor); }, SLOW));
        ASSERT_TRUE(waitFor([&] { return primariesSeeActiveReplicas(name); }, SLOW));
    }

    // Each shard primary forwards to every committed replica
    bool primariesSeeActiveReplicas(const std::string& name) {
        auto topology = cluster_.node(1).getTopology();
        const CollectionInfo* info = topology->findCollection(name);
        if (!info) {
            return false;
        }
        for (const auto& [shard_id, shard] : info->shards) {
            auto primary = shard.primary();
            if (!primary || !cluster_.isRunning(*primary)) {
                return false;
            }
            auto set = cluster_.node(*primary).shards().replicaSet(ShardKey{info->name, shard_id});
            if (!set || !set->isPrimary()) {
                return false;
            }
            for (const auto& status : set->replicaStatus()) {
                if (shard.stateOf(status.peer_id) == ReplicaState::ACTIVE &&
                    (status.committed != ReplicaState::ACTIVE || status.health == ReplicaHealth::DEAD)) {
                    return false;
                }
            }
        }
        return true;
    }

    // Submit through node via, retrying while the primary is being re-elected
    std::map<ShardId, UpdateResult> submit(PeerId via, const std::string& collection, const PointOperation& op) {
        const auto deadline = std::chrono::steady_clock::now() + SLOW;
        while (true) {
            try {
                return cluster_.node(via).submitOperation(collection, op, true);
            } catch (const ClusterError& e) {
                if (!e.isRetryable() || std::chrono::steady_clock::now() >= deadline) {
                    throw;
                }
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(20));
        }
    }

    uint64_t digestOn(PeerId peer, const ShardKey& key) { return cluster_.node(peer).storage().digest(key); }

    OperationId lastAppliedOn(PeerId peer, const ShardKey& key) {
        auto set = cluster_.node(peer).shards().replicaSet(key);
        return set ? set->local().lastApplied() : 0;
    }

    TestCluster cluster_;
};

// ============================================================================
// FORMATION
// ============================================================================

TEST_F(ClusterScenarioTest, NodesJoinAsVoters) {
    auto topology = cluster_.node(2).getTopology();
    EXPECT_EQ(topology->peers.size(), 3u);
    EXPECT_EQ(topology->voters(), (std::vector<PeerId>{1, 2, 3}));
    EXPECT_EQ(topology->findPeer(3)->address, "mem://3");

    ClusterNode* leader = cluster_.leader();
    ASSERT_NE(leader, nullptr);
    EXPECT_TRUE(waitFor([&] {
        for (PeerId id : {1, 2, 3}) {
            ClusterStatus status = cluster_.node(id).clusterStatus();
            if (status.leader != std::optional<PeerId>(leader->id()) || status.peers != 3 || !status.is_voter) {
                return false;
            }
        }
        return true;
    }));
}

// ============================================================================
// REPLICATED WRITES
// ============================================================================

TEST_F(ClusterScenarioTest, WritesReachEveryReplica) {
    createCollection("vectors", 1, 3);
    const ShardKey key{"vectors", 0};

    auto first = submit(1, "vectors", upsertRange(1, 10));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first.at(0).operation_id, 1u);
    EXPECT_EQ(first.at(0).status, UpdateStatus::COMPLETED);
    EXPECT_FALSE(first.at(0).isPartialFailure());

    // A non-primary node relays to the primary
    auto second = submit(3, "vectors", upsertRange(11, 10));
    EXPECT_EQ(second.at(0).operation_id, 2u);
    submit(2, "vectors", PointOperation::deletePoints({1, 2}));

    for (PeerId id : {1, 2, 3}) {
        ASSERT_TRUE(waitFor([&] { return lastAppliedOn(id, key) == 3; }));
        EXPECT_EQ(cluster_.node(id).storage().pointCount(key), 18u);
        EXPECT_EQ(digestOn(id, key), digestOn(1, key));
    }
    EXPECT_FALSE(cluster_.node(2).storage().getPoint(key, 1).has_value());
    ASSERT_TRUE(cluster_.node(2).storage().getPoint(key, 12).has_value());
    EXPECT_EQ(cluster_.node(2).storage().getPoint(key, 12)->vector[0], 12.0f);
}

TEST_F(ClusterScenarioTest, OperationsAreSplitAcrossShards) {
    createCollection("multi", 4, 2);

    auto results = submit(2, "multi", upsertRange(1, 100));
    EXPECT_GT(results.size(), 1u);

    size_t total = 0;
    auto topology = cluster_.node(1).getTopology();
    for (const auto& [shard_id, shard] : topology->collection("multi").shards) {
        const ShardKey key{"multi", shard_id};
        ASSERT_EQ(shard.replicas.size(), 2u);
        const PeerId holder = shard.replicas.begin()->first;
        total += cluster_.node(holder).storage().pointCount(key);
        for (const auto& [peer, state] : shard.replicas) {
            EXPECT_EQ(digestOn(peer, key), digestOn(holder, key));
        }
    }
    EXPECT_EQ(total, 100u);
}

TEST_F(ClusterScenarioTest, UnknownCollectionIsRejected) {
    EXPECT_THROW(cluster_.node(1).submitOperation("missing", upsertRange(1, 1), true), NotFoundError);
}

TEST_F(ClusterScenarioTest, InitializingShardRejectsWrites) {
    // The only replica lives on a stopped peer, so it never activates
    cluster_.stopNode(3);
    CreateCollection command;
    command.name = "pending";
    command.shard_count = 1;
    command.replication_factor = 1;
    command.distribution = {{0, {3}}};
    cluster_.onLeader([&](ClusterNode& leader) { return leader.proposeMetadataChange(command); });
    ASSERT_TRUE(waitFor([&] { return cluster_.node(1).getTopology()->findCollection("pending") != nullptr; }, SLOW));

    try {
        cluster_.node(1).submitOperation("pending", upsertRange(1, 1), true);
        FAIL() << "expected ShardInitializingError";
    } catch (const ShardInitializingError& e) {
        EXPECT_TRUE(e.isRetryable());
    }
    EXPECT_EQ(replicaState(cluster_.node(1), ShardKey{"pending", 0}, 3),
              std::optional<ReplicaState>(ReplicaState::INITIALIZING));
}

TEST_F(ClusterScenarioTest, InitializingShardRejectsReads) {
    cluster_.stopNode(3);
    CreateCollection command;
    command.name = "pending";
    command.shard_count = 1;
    command.replication_factor = 1;
    command.distribution = {{0, {3}}};
    cluster_.onLeader([&](ClusterNode& leader) { return leader.proposeMetadataChange(command); });
    ASSERT_TRUE(waitFor([&] { return cluster_.node(2).getTopology()->findCollection("pending") != nullptr; }, SLOW));

    for (PeerId via : {1, 2}) {
        try {
            cluster_.node(via).getPoints("pending", {1, 2});
            FAIL() << "expected ShardInitializingError via peer " << via;
        } catch (const ShardInitializingError& e) {
            EXPECT_TRUE(e.isRetryable());
        }
    }
}

TEST_F(ClusterScenarioTest, ReadsAreServedByThePrimary) {
    createCollection("multi", 3, 2);
    submit(1, "multi", upsertRange(1, 30));
    submit(2, "multi", PointOperation::deletePoints({5}));

    // Every node answers, whether or not it hosts the shards involved
    for (PeerId via : {1, 2, 3}) {
        auto points = cluster_.node(via).getPoints("multi", {4, 5, 6, 29, 99});
        std::map<PointId, Point> by_id;
        for (const auto& point : points) {
            by_id[point.id] = point;
        }
        EXPECT_EQ(by_id.size(), 3u) << "via peer " << via;
        EXPECT_EQ(by_id.count(5), 0u);
        EXPECT_EQ(by_id.count(99), 0u);
        ASSERT_EQ(by_id.count(29), 1u);
        EXPECT_EQ(by_id.at(29).vector, (std::vector<float>{29.0f, 0.25f}));
    }
    EXPECT_THROW(cluster_.node(1).getPoints("missing", {1}), NotFoundError);
}

// ============================================================================
// FAILURE & RECOVERY
// ============================================================================

TEST_F(ClusterScenarioTest, StoppedReplicaIsMarkedDeadAndRecovers) {
    createCollection("vectors", 1, 3);
    const ShardKey key{"vectors", 0};
    for (PointId batch = 0; batch < 3; ++batch) {
        submit(1, "vectors", upsertRange(batch * 10 + 1, 10));
    }
    ASSERT_EQ(lastAppliedOn(3, key), 3u);

    cluster_.stopNode(3);
    auto partial = submit(1, "vectors", upsertRange(31, 10));
    EXPECT_EQ(partial.at(0).failed_peers, std::vector<PeerId>{3});
    submit(2, "vectors", upsertRange(41, 10));

    ASSERT_TRUE(waitFor([&] { return replicaState(cluster_.node(1), key, 3) == ReplicaState::DEAD; }, SLOW));

    // Same data directory: the replica resumes from its own operation log.
    // It may only be Active again once it holds everything the primary has.
    cluster_.startNode(3);
    size_t active_observations = 0;
    size_t behind_while_active = 0;
    ASSERT_TRUE(waitFor([&] {
        if (replicaState(cluster_.node(1), key, 3) != ReplicaState::ACTIVE) {
            return false;
        }
        active_observations++;
        if (lastAppliedOn(3, key) != lastAppliedOn(1, key)) {
            behind_while_active++;
        }
        return cluster_.collectionSettled(1, "vectors", 3) && primariesSeeActiveReplicas("vectors");
    }, SLOW));
    EXPECT_GT(active_observations, 0u);
    EXPECT_EQ(behind_while_active, 0u);
    EXPECT_EQ(lastAppliedOn(3, key), 5u);
    EXPECT_EQ(cluster_.node(3).storage().pointCount(key), 50u);
    EXPECT_EQ(digestOn(3, key), digestOn(1, key));

    // Active again: new writes are forwarded to it directly
    auto after = submit(1, "vectors", upsertRange(51, 5));
    EXPECT_FALSE(after.at(0).isPartialFailure());
    EXPECT_TRUE(waitFor([&] { return lastAppliedOn(3, key) == 6; }));
}

TEST_F(ClusterScenarioTest, PrimaryFailureMovesWrites) {
    createCollection("vectors", 1, 3);
    const ShardKey key{"vectors", 0};
    submit(2, "vectors", upsertRange(1, 10));

    cluster_.stopNode(1);
    // Peer 2 notices the unreachable primary and proposes it Dead
    ASSERT_TRUE(waitFor([&] { return replicaState(cluster_.node(2), key, 1) == ReplicaState::DEAD; }, SLOW));

    auto result = submit(3, "vectors", upsertRange(11, 10));
    EXPECT_EQ(result.at(0).operation_id, 2u);
    EXPECT_EQ(lastAppliedOn(2, key), 2u);
    EXPECT_EQ(digestOn(2, key), digestOn(3, key));
}

TEST_F(ClusterScenarioTest, PartitionedLeaderCannotCommit) {
    ClusterNode* old_leader = cluster_.leader();
    ASSERT_NE(old_leader, nullptr);
    const PeerId isolated = old_leader->id();
    cluster_.network().isolate(isolated);

    CreateCollection command;
    command.name = "after_partition";
    command.shard_count = 1;
    command.replication_factor = 3;
    command.distribution = {{0, {1, 2, 3}}};
    try {
        old_leader->proposeMetadataChange(command, std::chrono::milliseconds(500));
        FAIL() << "an isolated leader must not commit";
    } catch (const ClusterError& e) {
        EXPECT_TRUE(e.code() == ErrorCode::NOT_LEADER || e.code() == ErrorCode::TIMEOUT) << e.what();
        EXPECT_TRUE(e.isRetryable());
    }

    // The majority side elects someone else
    ASSERT_TRUE(waitFor([&] {
        for (PeerId id : {1, 2, 3}) {
            if (id != isolated && cluster_.node(id).consensus().isLeader()) {
                return true;
            }
        }
        return false;
    }, SLOW));
    EXPECT_TRUE(waitFor([&] { return !cluster_.node(isolated).consensus().isLeader(); }, SLOW));

    EXPECT_EQ(cluster_.node(isolated).getTopology()->findCollection("after_partition"), nullptr);

    // The rejected entry never commits, so the same creation succeeds once
    cluster_.network().heal();
    cluster_.onLeader([&](ClusterNode& leader) { return leader.proposeMetadataChange(command); });
    ASSERT_TRUE(waitFor([&] { return cluster_.collectionSettled(1, "after_partition", 3); }, SLOW));
    EXPECT_TRUE(waitFor([&] {
        return cluster_.node(isolated).getTopology()->findCollection("after_partition") != nullptr;
    }, SLOW));
    EXPECT_EQ(cluster_.node(isolated).getTopology()->collection("after_partition").shards.size(), 1u);
}

// ============================================================================
// TOPOLOGY CHANGES
// ============================================================================

TEST_F(ClusterScenarioTest, SplitMovesUpperRangeToNewShard) {
    createCollection("vectors", 1, 3);
    submit(1, "vectors", upsertRange(1, 60));

    const ShardId child = cluster_.onLeader([](ClusterNode& leader) {
        return leader.shards().splitShard("vectors", 0);
    });
    EXPECT_EQ(child, 1u);

    ASSERT_TRUE(waitFor([&] { return cluster_.collectionSettled(1, "vectors", 3); }, SLOW));
    ASSERT_TRUE(waitFor([&] { return primariesSeeActiveReplicas("vectors"); }, SLOW));
    const ShardKey parent_key{"vectors", 0};
    const ShardKey child_key{"vectors", child};

    // Parents drop the moved range once the child is complete
    ASSERT_TRUE(waitFor([&] {
        for (PeerId id : {1, 2, 3}) {
            auto& storage = cluster_.node(id).storage();
            if (storage.pointCount(parent_key) + storage.pointCount(child_key) != 60) {
                return false;
            }
        }
        return true;
    }, SLOW));
    EXPECT_GT(cluster_.node(1).storage().pointCount(child_key), 0u);
    EXPECT_EQ(digestOn(2, child_key), digestOn(1, child_key));

    // New points route by the split ranges
    auto results = submit(3, "vectors", upsertRange(61, 40));
    EXPECT_EQ(results.size(), 2u);
    for (PeerId id : {1, 2, 3}) {
        auto& storage = cluster_.node(id).storage();
        EXPECT_TRUE(waitFor([&] {
            return storage.pointCount(parent_key) + storage.pointCount(child_key) == 100;
        })) << "peer " << id;
    }
}

TEST_F(ClusterScenarioTest, PeerJoinsAndLeaves) {
    cluster_.startNode(4);
    ASSERT_TRUE(waitFor([&] { return cluster_.isMemberEverywhere(4); }, SLOW));
    EXPECT_EQ(cluster_.node(1).getTopology()->findPeer(4)->role, PeerRole::VOTER);

    // The new peer takes replicas of collections created afterwards
    createCollection("spread", 4, 1);
    EXPECT_GT(cluster_.node(1).getTopology()->replicaLoad()[4], 0u);
    cluster_.onLeader([](ClusterNode& leader) { return leader.shards().dropCollection("spread"); });

    cluster_.onLeader([](ClusterNode& leader) { return leader.shards().removePeer(4, false); });
    EXPECT_TRUE(waitFor([&] { return cluster_.node(1).getTopology()->findPeer(4) == nullptr; }, SLOW));
    cluster_.stopNode(4);

    // Three voters remain and still commit
    createCollection("after_removal", 1, 3);
}

TEST_F(ClusterScenarioTest, LostReplicaIsReplacedOnAnotherPeer) {
    cluster_.startNode(4);
    ASSERT_TRUE(waitFor([&] { return cluster_.isMemberEverywhere(4); }, SLOW));

    createCollection("vectors", 1, 2);
    const ShardKey key{"vectors", 0};
    auto shard = *cluster_.node(1).getTopology()->findShard(key);
    const PeerId primary = *shard.primary();
    submit(primary, "vectors", upsertRange(1, 20));

    // Stop the secondary for good: the leader schedules a new copy elsewhere
    PeerId lost = NO_PEER;
    for (const auto& [peer, state] : shard.replicas) {
        if (peer != primary) {
            lost = peer;
        }
    }
    ASSERT_NE(lost, NO_PEER);
    cluster_.stopNode(lost);
    submit(primary, "vectors", upsertRange(21, 5));

    ASSERT_TRUE(waitFor([&] {
        auto current = cluster_.node(primary).getTopology()->findShard(key);
        return current && current->stateOf(lost) == ReplicaState::DEAD;
    }, SLOW));

    PeerId replacement = NO_PEER;
    ASSERT_TRUE(waitFor([&] {
        auto current = cluster_.node(primary).getTopology()->findShard(key);
        for (PeerId peer : current->activePeers()) {
            if (peer != primary && peer != lost) {
                replacement = peer;
                return true;
            }
        }
        return false;
    }, SLOW));
    ASSERT_TRUE(waitFor([&] { return lastAppliedOn(replacement, key) == 2; }, SLOW));
    EXPECT_EQ(digestOn(replacement, key), digestOn(primary, key));
}
