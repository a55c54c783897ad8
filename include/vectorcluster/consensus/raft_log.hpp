#pragma once

#include <vectorcluster/consensus/messages.hpp>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

namespace VectorCluster {

/**
 * @class RaftLog
 * @brief In-memory Raft log behind a snapshot offset.
 *
 * Holds entries snapshotIndex()+1 .. lastIndex(). The entry at the snapshot
 * index itself is gone but its term is remembered for log matching.
 */
class RaftLog {
public:
    uint64_t snapshotIndex() const { return snapshot_index_; }
    uint64_t snapshotTerm() const { return snapshot_term_; }
    uint64_t firstIndex() const { return snapshot_index_ + 1; }
    uint64_t lastIndex() const { return snapshot_index_ + entries_.size(); }
    uint64_t lastTerm() const;
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Term at index; std::nullopt if compacted away or beyond the end
    std::optional<uint64_t> termAt(uint64_t index) const;

    const LogEntry& at(uint64_t index) const;

    // Entries [from, to] capped at max_count
    std::vector<LogEntry> slice(uint64_t from, uint64_t to, size_t max_count) const;

    const std::deque<LogEntry>& entries() const { return entries_; }

    /**
     * @throws std::logic_error if entry.index != lastIndex() + 1
     */
    void append(LogEntry entry);

    // Remove entries with index >= from
    void truncateFrom(uint64_t from);

    // Drop entries up to index (inclusive) and remember it as the snapshot point
    void compact(uint64_t index);

    // Discard the whole log in favour of a snapshot
    void resetToSnapshot(uint64_t index, uint64_t term);

    // Raft election restriction: is (last_index, last_term) at least as up to date?
    bool isUpToDate(uint64_t last_index, uint64_t last_term) const;

private:
    uint64_t snapshot_index_ = 0;
    uint64_t snapshot_term_ = 0;
    std::deque<LogEntry> entries_;
};

}  // namespace VectorCluster
