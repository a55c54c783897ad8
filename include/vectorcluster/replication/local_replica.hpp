#pragma once

#include <vectorcluster/replication/operation_log.hpp>
#include <vectorcluster/replication/replication_types.hpp>
#include <vectorcluster/storage/shard_storage.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace VectorCluster {

struct ReplicaSnapshot {
    OperationId cutoff = 0;         // Last operation contained in data
    std::vector<uint8_t> data;
};

/**
 * @class LocalReplica
 * @brief The copy of one shard hosted on this node.
 *
 * Every operation is appended to the operation log before it reaches storage,
 * so the log's last id is the durable apply position. Operations are accepted
 * strictly in id order; duplicates are no-ops and gaps are refused.
 */
class LocalReplica {
public:
    /**
     * @param log_path Operation log file, empty for an in-memory log
     * @param retention Operations kept in the log below the apply position
     */
    LocalReplica(ShardKey key, ShardStorage& storage, const std::string& log_path, size_t retention);

    const ShardKey& key() const { return key_; }

    /**
     * @brief Bring storage up to the log after a restart.
     */
    void recover();

    /**
     * @brief Apply operation id if it is the next one.
     * @throws StorageError if the log append fails (nothing is applied)
     */
    ApplyResult apply(OperationId id, const std::vector<uint8_t>& payload);

    OperationId lastApplied() const;

    std::optional<std::vector<LoggedOperation>> operationsFrom(OperationId from, size_t max_count) const;

    // @throws StaleTopologyError once destroyed
    std::vector<Point> retrieve(const std::vector<PointId>& ids) const;

    // Consistent copy; operations after cutoff stay in the log for catch-up
    ReplicaSnapshot exportSnapshot(const std::optional<HashRange>& range = std::nullopt) const;

    // Replace content; the log restarts after the snapshot's operation id
    OperationId importSnapshot(const std::vector<uint8_t>& data);

    void retainRange(const HashRange& range);
    std::optional<HashRange> retainedRange() const;

    // Persist storage and drop log entries no longer needed
    void flushAndCompact();

    // Remove storage and log; later applies fail with StaleTopologyError
    void destroy();
    bool isDestroyed() const;

private:
    ShardKey key_;
    ShardStorage& storage_;
    std::string log_path_;
    size_t retention_;
    std::unique_ptr<OperationLog> log_;
    std::optional<HashRange> retained_range_;
    bool destroyed_ = false;
    mutable std::mutex mutex_;
};

}  // namespace VectorCluster
