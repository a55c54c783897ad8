#pragma once

#include <vectorcluster/consensus/messages.hpp>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

/**
 * @brief Everything ConsensusStorage::load() recovers after a restart.
 */
struct PersistedConsensusState {
    HardState hard_state;
    uint64_t applied = 0;
    std::optional<SnapshotMeta> snapshot_meta;
    std::vector<uint8_t> snapshot_data;
    std::vector<LogEntry> entries;      // Entries after the snapshot, in order
};

/**
 * @class ConsensusStorage
 * @brief Durable Raft state in one directory.
 *
 *   raft_state.bin     term, voted_for, commit, applied (rewritten by rename)
 *   raft_log.bin       length-prefixed entries after the snapshot
 *   raft_snapshot.bin  latest snapshot meta and topology payload
 *
 * All methods throw StorageError on I/O failure.
 */
class ConsensusStorage {
public:
    explicit ConsensusStorage(std::string dir);
    ~ConsensusStorage();

    ConsensusStorage(const ConsensusStorage&) = delete;
    ConsensusStorage& operator=(const ConsensusStorage&) = delete;

    PersistedConsensusState load();

    // Applied index as of the last load() or saveApplied()
    uint64_t appliedIndex() const;

    void saveHardState(const HardState& state);
    void saveApplied(uint64_t applied);

    void appendEntries(const std::vector<LogEntry>& entries);

    // Replace the log file after truncation or compaction
    void rewriteLog(const std::deque<LogEntry>& entries);

    void saveSnapshot(const SnapshotMeta& meta, const std::vector<uint8_t>& data);

    const std::string& directory() const { return dir_; }

private:
    void writeStateLocked();
    void openLogLocked();

    std::string dir_;
    std::string state_path_;
    std::string log_path_;
    std::string snapshot_path_;

    mutable std::mutex mutex_;
    std::ofstream log_file_;
    HardState hard_state_;
    uint64_t applied_ = 0;
};

}  // namespace VectorCluster
