#pragma once

#include <vectorcluster/common/types.hpp>
#include <vectorcluster/storage/point_operation.hpp>
#include <vectorcluster/topology/hash_ring.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace VectorCluster {

/**
 * @class ShardStorage
 * @brief Storage and index subsystem as seen by the replication core.
 *
 * One instance serves every shard replica hosted on a node. Implementations
 * must be safe to call concurrently for different shards; calls for the same
 * shard are serialized by the owning LocalReplica.
 */
class ShardStorage {
public:
    virtual ~ShardStorage() = default;

    /**
     * @brief Apply one operation payload.
     *
     * Re-applying an id <= lastOperationId() is a no-op.
     * @throws StorageError if the payload cannot be applied; the id still counts
     *         as consumed so later operations are not blocked
     */
    virtual void apply(const ShardKey& key, OperationId operation_id,
                       const std::vector<uint8_t>& payload) = 0;

    virtual OperationId lastOperationId(const ShardKey& key) const = 0;

    // Points with the given ids, in request order; missing ids are skipped
    virtual std::vector<Point> retrieve(const ShardKey& key, const std::vector<PointId>& ids) const = 0;

    /**
     * @brief Point-in-time copy of a shard.
     *
     * With a range, only points hashing into it are exported and the snapshot
     * describes a new shard (operation id 0). Used for splits.
     */
    virtual std::vector<uint8_t> snapshotExport(const ShardKey& key,
                                                const std::optional<HashRange>& range = std::nullopt) const = 0;

    /**
     * @brief Replace the shard's content with a snapshot.
     * @return operation id the snapshot is consistent with
     * @throws StorageError on malformed snapshots
     */
    virtual OperationId snapshotImport(const ShardKey& key, const std::vector<uint8_t>& data) = 0;

    // Drop points outside range and ignore later writes outside it
    virtual void retainRange(const ShardKey& key, const HashRange& range) = 0;

    virtual void drop(const ShardKey& key) = 0;

    // Make applied state durable (no-op for volatile stores)
    virtual void flush(const ShardKey& key) = 0;
};

}  // namespace VectorCluster
