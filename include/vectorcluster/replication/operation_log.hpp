#pragma once

#include <vectorcluster/common/types.hpp>
#include <cstdint>
#include <deque>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace VectorCluster {

struct LoggedOperation {
    OperationId id = 0;
    std::vector<uint8_t> payload;
};

/**
 * @class OperationLog
 * @brief Append-only, gap-free log of one shard replica's operations.
 *
 * File layout: [magic u32][base_id u64] followed by records
 * [id u64][len u32][payload]. Entries cover ids base_id+1 .. lastId().
 * The base id survives compaction and snapshot installs, so lastId() is the
 * replica's durable apply position after restart.
 *
 * Thread-safe.
 */
class OperationLog {
public:
    /**
     * @param path Backing file; empty keeps the log in memory only
     * @throws StorageError if an existing file cannot be read
     */
    explicit OperationLog(std::string path = "");
    ~OperationLog();

    OperationLog(const OperationLog&) = delete;
    OperationLog& operator=(const OperationLog&) = delete;

    /**
     * @brief Durably append id, which must equal lastId() + 1.
     * @throws StorageError on out-of-order ids or I/O failure
     */
    void append(OperationId id, const std::vector<uint8_t>& payload);

    OperationId lastId() const;

    // Lowest id still readable (lastId() + 1 when empty)
    OperationId firstRetainedId() const;

    /**
     * @brief Up to max_count entries starting at from.
     * @return std::nullopt if from was compacted away
     */
    std::optional<std::vector<LoggedOperation>> readFrom(OperationId from, size_t max_count) const;

    // Discard everything; the next append must be base_id + 1
    void resetTo(OperationId base_id);

    // Drop entries with id <= up_to
    void compact(OperationId up_to);

    size_t size() const;

private:
    void loadLocked();
    void rewriteLocked();
    void openForAppendLocked();

    std::string path_;
    mutable std::mutex mutex_;
    std::ofstream file_;
    OperationId base_id_ = 0;
    std::deque<LoggedOperation> entries_;
};

}  // namespace VectorCluster
