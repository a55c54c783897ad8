#include <vectorcluster/consensus/raft_log.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace VectorCluster {

uint64_t RaftLog::lastTerm() const {
    return entries_.empty() ? snapshot_term_ : entries_.back().term;
}

std::optional<uint64_t> RaftLog::termAt(uint64_t index) const {
    if (index == snapshot_index_) {
        return snapshot_term_;
    }
    if (index < snapshot_index_ || index > lastIndex()) {
        return std::nullopt;
    }
    return entries_[index - snapshot_index_ - 1].term;
}

const LogEntry& RaftLog::at(uint64_t index) const {
    if (index <= snapshot_index_ || index > lastIndex()) {
        throw std::out_of_range("Log index " + std::to_string(index) + " outside [" +
                                std::to_string(firstIndex()) + ", " + std::to_string(lastIndex()) + "]");
    }
    return entries_[index - snapshot_index_ - 1];
}

std::vector<LogEntry> RaftLog::slice(uint64_t from, uint64_t to, size_t max_count) const {
    std::vector<LogEntry> result;
    from = std::max(from, firstIndex());
    to = std::min(to, lastIndex());
    for (uint64_t i = from; i <= to && result.size() < max_count; ++i) {
        result.push_back(entries_[i - snapshot_index_ - 1]);
    }
    return result;
}

void RaftLog::append(LogEntry entry) {
    if (entry.index != lastIndex() + 1) {
        throw std::logic_error("Non-contiguous log append: index " + std::to_string(entry.index) +
                               " after " + std::to_string(lastIndex()));
    }
    entries_.push_back(std::move(entry));
}

void RaftLog::truncateFrom(uint64_t from) {
    if (from <= snapshot_index_) {
        throw std::logic_error("Cannot truncate committed snapshot entries");
    }
    while (!entries_.empty() && entries_.back().index >= from) {
        entries_.pop_back();
    }
}

void RaftLog::compact(uint64_t index) {
    if (index <= snapshot_index_) {
        return;
    }
    auto term = termAt(index);
    if (!term) {
        throw std::logic_error("Cannot compact beyond the last index");
    }
    snapshot_term_ = *term;
    while (!entries_.empty() && entries_.front().index <= index) {
        entries_.pop_front();
    }
    snapshot_index_ = index;
}

void RaftLog::resetToSnapshot(uint64_t index, uint64_t term) {
    entries_.clear();
    snapshot_index_ = index;
    snapshot_term_ = term;
}

bool RaftLog::isUpToDate(uint64_t last_index, uint64_t last_term) const {
    const uint64_t my_term = lastTerm();
    return last_term > my_term || (last_term == my_term && last_index >= lastIndex());
}

}  // namespace VectorCluster
