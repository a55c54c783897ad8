// ============================================================================
// CONSENSUS SERVICE UNIT TESTS
// ============================================================================
// A single bootstrapped node driven by a ticker thread: proposals, user
// errors, the apply callback and replay after restart
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/consensus/consensus_service.hpp>
#include "test_cluster.hpp"

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace VectorCluster;

namespace {

// Records consensus messages; a lone node has nobody to replicate to
class RecordingTransport : public Transport {
public:
    void send(const RaftMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        sent_.push_back(message);
    }

    ApplyResult forwardOperation(PeerId peer, const ForwardRequest&, Timeout) override { return unreachable<ApplyResult>(peer); }
    FetchResponse fetchOperations(PeerId peer, const FetchRequest&, Timeout) override { return unreachable<FetchResponse>(peer); }
    ProbeResponse probeReplica(PeerId peer, const ProbeRequest&, Timeout) override { return unreachable<ProbeResponse>(peer); }
    OperationId transferSnapshot(PeerId peer, const SnapshotRequest&, Timeout) override { return unreachable<OperationId>(peer); }
    UpdateResult submitToPrimary(PeerId peer, const SubmitRequest&, Timeout) override { return unreachable<UpdateResult>(peer); }
    FetchSnapshotResponse fetchSnapshot(PeerId peer, const FetchSnapshotRequest&, Timeout) override {
        return unreachable<FetchSnapshotResponse>(peer);
    }
    GetPointsResponse getPoints(PeerId peer, const GetPointsRequest&, Timeout) override {
        return unreachable<GetPointsResponse>(peer);
    }

    uint64_t sendFailures() const override { return 0; }

    std::vector<RaftMessage> sent(MessageType type) {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<RaftMessage> matching;
        for (const auto& m : sent_) {
            if (m.type == type) {
                matching.push_back(m);
            }
        }
        return matching;
    }

private:
    template <typename T>
    T unreachable(PeerId peer) {
        throw TimeoutError("peer " + std::to_string(peer) + " unreachable");
    }

    std::mutex mutex_;
    std::vector<RaftMessage> sent_;
};

// Drives tick() the way the node's driver thread does
class Ticker {
public:
    explicit Ticker(ConsensusService& service) : thread_([this, &service] {
        while (!stop_) {
            service.tick();
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
    }) {}

    ~Ticker() {
        stop_ = true;
        thread_.join();
    }

private:
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

ConsensusOptions singleNodeOptions(const std::string& data_dir = "") {
    ConsensusOptions options;
    options.raft.id = 1;
    options.raft.seed = 7;
    options.propose_timeout = std::chrono::milliseconds(3000);
    options.data_dir = data_dir;
    options.bootstrap = true;
    options.self_address = "mem://1";
    return options;
}

CreateCollection createVectors(const std::string& name = "vectors") {
    CreateCollection cmd;
    cmd.name = name;
    cmd.shard_count = 2;
    cmd.distribution = {{0, {1}}, {1, {1}}};
    return cmd;
}

struct AppliedRecord {
    uint64_t index;
    std::string command;
    bool rejected;
};

}  // namespace

class ConsensusServiceTest : public ::testing::Test {
protected:
    std::unique_ptr<ConsensusService> makeService(const std::string& data_dir = "") {
        auto service = std::make_unique<ConsensusService>(singleNodeOptions(data_dir), registry_, transport_);
        service->setApplyCallback([this](uint64_t index, const MetadataCommand& command, std::exception_ptr error) {
            std::lock_guard<std::mutex> lock(applied_mutex_);
            applied_.push_back(AppliedRecord{index, commandName(command), error != nullptr});
        });
        return service;
    }

    // Start a service and make it leader of its one-voter cluster
    void startLeader(ConsensusService& service) {
        service.start();
        service.campaign();
        ASSERT_TRUE(test::waitFor([&] { return service.isLeader(); }));
    }

    std::vector<AppliedRecord> applied() {
        std::lock_guard<std::mutex> lock(applied_mutex_);
        return applied_;
    }

    TopologyRegistry registry_;
    RecordingTransport transport_;
    std::mutex applied_mutex_;
    std::vector<AppliedRecord> applied_;
};

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST_F(ConsensusServiceTest, BootstrapPublishesSingleVoter) {
    auto service = makeService();
    service->start();

    auto topology = registry_.current();
    ASSERT_NE(topology->findPeer(1), nullptr);
    EXPECT_EQ(topology->findPeer(1)->role, PeerRole::VOTER);
    EXPECT_EQ(topology->findPeer(1)->address, "mem://1");
    EXPECT_EQ(topology->voters(), std::vector<PeerId>{1});
    EXPECT_GE(registry_.appliedIndex(), 1u);
}

TEST_F(ConsensusServiceTest, ProposeBeforeStartFails) {
    auto service = makeService();
    EXPECT_THROW(service->propose(createVectors()), ServiceError);
}

TEST_F(ConsensusServiceTest, FollowerRejectsPropose) {
    auto service = makeService();
    service->start();
    EXPECT_FALSE(service->isLeader());
    EXPECT_THROW(service->propose(createVectors()), NotLeaderError);
}

TEST_F(ConsensusServiceTest, StatusReportsLeadership) {
    auto service = makeService();
    startLeader(*service);

    ClusterStatus status = service->status();
    EXPECT_EQ(status.peer_id, 1u);
    EXPECT_EQ(status.role, RaftState::LEADER);
    EXPECT_EQ(status.leader, std::optional<PeerId>(1));
    EXPECT_TRUE(status.is_voter);
    EXPECT_EQ(status.peers, 1u);
    EXPECT_GE(status.term, 1u);
    EXPECT_EQ(service->leaderId(), std::optional<PeerId>(1));
}

// ============================================================================
// PROPOSALS
// ============================================================================

TEST_F(ConsensusServiceTest, ProposeAppliesToRegistry) {
    auto service = makeService();
    startLeader(*service);
    Ticker ticker(*service);

    const uint64_t index = service->propose(createVectors());
    EXPECT_GE(registry_.appliedIndex(), index);

    const CollectionInfo* info = registry_.current()->findCollection("vectors");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(info->shards.size(), 2u);
    EXPECT_EQ(info->shards.at(0).stateOf(1), std::optional<ReplicaState>(ReplicaState::INITIALIZING));
}

TEST_F(ConsensusServiceTest, RejectedCommandStillConsumesIndex) {
    auto service = makeService();
    startLeader(*service);
    Ticker ticker(*service);

    const uint64_t before = registry_.appliedIndex();
    EXPECT_THROW(service->propose(DeleteCollection{"missing"}), NotFoundError);
    EXPECT_GT(registry_.appliedIndex(), before);

    service->propose(createVectors());
    EXPECT_THROW(service->propose(createVectors()), BadRequestError);
    EXPECT_NE(registry_.current()->findCollection("vectors"), nullptr);
}

TEST_F(ConsensusServiceTest, ConfirmationCommitsFollowUpEntry) {
    auto service = makeService();
    startLeader(*service);
    Ticker ticker(*service);

    const uint64_t index = service->propose(createVectors(), std::nullopt, true);
    EXPECT_GT(registry_.appliedIndex(), index);
}

TEST_F(ConsensusServiceTest, ApplyCallbackSeesEveryCommand) {
    auto service = makeService();
    startLeader(*service);
    Ticker ticker(*service);

    const uint64_t created = service->propose(createVectors());
    EXPECT_THROW(service->propose(DeleteCollection{"missing"}), NotFoundError);

    auto records = applied();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].index, created);
    EXPECT_EQ(records[0].command, "CreateCollection");
    EXPECT_FALSE(records[0].rejected);
    EXPECT_EQ(records[1].command, "DeleteCollection");
    EXPECT_TRUE(records[1].rejected);
}

TEST_F(ConsensusServiceTest, ProposeAsyncOnLeader) {
    auto service = makeService();
    startLeader(*service);
    Ticker ticker(*service);

    service->proposeAsync(createVectors());
    EXPECT_TRUE(test::waitFor([&] { return registry_.current()->findCollection("vectors") != nullptr; }));
}

TEST_F(ConsensusServiceTest, ProposeAsyncWithoutLeaderRelaysToSeeds) {
    ConsensusOptions options;
    options.raft.id = 3;
    options.seed_peers = {1, 2};
    ConsensusService service(options, registry_, transport_);
    service.start();

    service.proposeAsync(AddPeer{3, "mem://3", PeerRole::VOTER});
    auto relayed = transport_.sent(MessageType::PROPOSE);
    ASSERT_EQ(relayed.size(), 2u);
    EXPECT_EQ(relayed[0].to, 1u);
    EXPECT_EQ(relayed[1].to, 2u);
    EXPECT_EQ(relayed[0].from, 3u);
    EXPECT_FALSE(relayed[0].proposal.empty());
}

// ============================================================================
// RESTART
// ============================================================================

TEST_F(ConsensusServiceTest, RestartReplaysWithoutCallback) {
    test::TempDir dir("vc_consensus_restart");
    uint64_t last_index = 0;
    {
        auto service = makeService(dir.path());
        startLeader(*service);
        Ticker ticker(*service);
        service->propose(createVectors("first"));
        last_index = service->propose(createVectors("second"));
    }
    ASSERT_EQ(applied().size(), 2u);

    TopologyRegistry restored;
    ConsensusService service(singleNodeOptions(dir.path()), restored, transport_);
    std::atomic<int> callbacks{0};
    service.setApplyCallback([&](uint64_t, const MetadataCommand&, std::exception_ptr) { callbacks++; });
    service.start();

    EXPECT_GE(restored.appliedIndex(), last_index);
    EXPECT_NE(restored.current()->findCollection("first"), nullptr);
    EXPECT_NE(restored.current()->findCollection("second"), nullptr);
    EXPECT_EQ(callbacks.load(), 0);

    // New entries after the restart reach the callback again
    service.campaign();
    ASSERT_TRUE(test::waitFor([&] { return service.isLeader(); }));
    Ticker ticker(service);
    service.propose(createVectors("third"));
    EXPECT_EQ(callbacks.load(), 1);
}
