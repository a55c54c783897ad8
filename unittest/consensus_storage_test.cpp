// ============================================================================
// CONSENSUS STORAGE UNIT TESTS
// ============================================================================
// Hard state, log and snapshot files survive a reopen
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/consensus/consensus_storage.hpp>
#include "test_cluster.hpp"
#include <fstream>

using namespace VectorCluster;

namespace {

LogEntry entry(uint64_t term, uint64_t index, const std::string& data = "") {
    LogEntry e;
    e.term = term;
    e.index = index;
    e.type = data.empty() ? LogEntry::Type::EMPTY : LogEntry::Type::COMMAND;
    e.data.assign(data.begin(), data.end());
    return e;
}

}  // namespace

TEST(ConsensusStorageTest, FreshDirectoryLoadsEmpty) {
    test::TempDir dir;
    ConsensusStorage storage(dir.file("consensus"));
    auto state = storage.load();
    EXPECT_EQ(state.hard_state.term, 0u);
    EXPECT_FALSE(state.snapshot_meta.has_value());
    EXPECT_TRUE(state.entries.empty());
    EXPECT_EQ(storage.appliedIndex(), 0u);
}

TEST(ConsensusStorageTest, PersistsHardStateAndEntries) {
    test::TempDir dir;
    {
        ConsensusStorage storage(dir.path());
        storage.load();
        storage.saveHardState(HardState{3, 2, 2});
        storage.appendEntries({entry(1, 1), entry(3, 2, "a")});
        storage.appendEntries({entry(3, 3, "b")});
        storage.saveApplied(2);
    }

    ConsensusStorage storage(dir.path());
    auto state = storage.load();
    EXPECT_EQ(state.hard_state.term, 3u);
    EXPECT_EQ(state.hard_state.voted_for, 2u);
    EXPECT_EQ(state.hard_state.commit, 2u);
    EXPECT_EQ(state.applied, 2u);
    EXPECT_EQ(storage.appliedIndex(), 2u);
    ASSERT_EQ(state.entries.size(), 3u);
    EXPECT_EQ(state.entries[2], entry(3, 3, "b"));
}

TEST(ConsensusStorageTest, RewriteReplacesLog) {
    test::TempDir dir;
    {
        ConsensusStorage storage(dir.path());
        storage.load();
        storage.appendEntries({entry(1, 1), entry(1, 2, "old")});
        storage.rewriteLog(std::deque<LogEntry>{entry(1, 1), entry(2, 2, "new")});
    }

    ConsensusStorage storage(dir.path());
    auto state = storage.load();
    ASSERT_EQ(state.entries.size(), 2u);
    EXPECT_EQ(state.entries[1].term, 2u);
}

TEST(ConsensusStorageTest, SnapshotSkipsCoveredEntries) {
    test::TempDir dir;
    {
        ConsensusStorage storage(dir.path());
        storage.load();
        storage.appendEntries({entry(1, 1), entry(1, 2, "x"), entry(1, 3, "y")});
        // Crash before the log is rewritten after the snapshot
        storage.saveSnapshot(SnapshotMeta{2, 1, {1, 2}, {3}}, {9, 9});
    }

    ConsensusStorage storage(dir.path());
    auto state = storage.load();
    ASSERT_TRUE(state.snapshot_meta.has_value());
    EXPECT_EQ(state.snapshot_meta->index, 2u);
    EXPECT_EQ(state.snapshot_meta->voters, (std::vector<PeerId>{1, 2}));
    EXPECT_EQ(state.snapshot_meta->learners, (std::vector<PeerId>{3}));
    EXPECT_EQ(state.snapshot_data, (std::vector<uint8_t>{9, 9}));
    ASSERT_EQ(state.entries.size(), 1u);
    EXPECT_EQ(state.entries[0].index, 3u);
}

TEST(ConsensusStorageTest, DropsTornLogTail) {
    test::TempDir dir;
    {
        ConsensusStorage storage(dir.path());
        storage.load();
        storage.appendEntries({entry(1, 1), entry(1, 2, "ok")});
    }
    {
        std::ofstream out(dir.file("raft_log.bin"), std::ios::binary | std::ios::app);
        const char partial[6] = {40, 0, 0, 0, 1, 2};
        out.write(partial, sizeof(partial));
    }

    ConsensusStorage storage(dir.path());
    auto state = storage.load();
    EXPECT_EQ(state.entries.size(), 2u);
}

TEST(ConsensusStorageTest, CorruptStateFileIsStorageError) {
    test::TempDir dir;
    {
        std::ofstream out(dir.file("raft_state.bin"), std::ios::binary);
        out << "garbage-garbage-garbage-garbage-garbage";
    }
    ConsensusStorage storage(dir.path());
    EXPECT_THROW(storage.load(), StorageError);
}
