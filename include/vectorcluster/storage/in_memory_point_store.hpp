#pragma once

#include <vectorcluster/storage/shard_storage.hpp>
#include <vectorcluster/storage/point_operation.hpp>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace VectorCluster {

/**
 * @class InMemoryPointStore
 * @brief ShardStorage keeping points in memory, optionally persisted per shard.
 *
 * With a data directory each shard is written to
 * <data_dir>/<collection>_<shard>.points on flush() and loaded lazily on
 * first access. Without one the store is volatile.
 */
class InMemoryPointStore : public ShardStorage {
public:
    explicit InMemoryPointStore(std::string data_dir = "");

    void apply(const ShardKey& key, OperationId operation_id,
               const std::vector<uint8_t>& payload) override;
    OperationId lastOperationId(const ShardKey& key) const override;
    std::vector<Point> retrieve(const ShardKey& key, const std::vector<PointId>& ids) const override;
    std::vector<uint8_t> snapshotExport(const ShardKey& key,
                                        const std::optional<HashRange>& range = std::nullopt) const override;
    OperationId snapshotImport(const ShardKey& key, const std::vector<uint8_t>& data) override;
    void retainRange(const ShardKey& key, const HashRange& range) override;
    void drop(const ShardKey& key) override;
    void flush(const ShardKey& key) override;

    // Inspection
    size_t pointCount(const ShardKey& key) const;
    std::optional<Point> getPoint(const ShardKey& key, PointId id) const;

    // FNV-1a over the shard's points in id order; equal content, equal digest
    uint64_t digest(const ShardKey& key) const;

private:
    struct ShardData {
        std::map<PointId, Point> points;
        OperationId last_operation_id = 0;
        std::optional<HashRange> range;
    };

    ShardData& shardLocked(const ShardKey& key) const;
    std::string shardPath(const ShardKey& key) const;
    void applyLocked(ShardData& shard, const PointOperation& op);

    static std::vector<uint8_t> encodeShard(const ShardData& shard, const std::optional<HashRange>& filter,
                                            OperationId operation_id);
    static ShardData decodeShard(const std::vector<uint8_t>& data);

    std::string data_dir_;
    mutable std::mutex mutex_;
    mutable std::map<ShardKey, ShardData> shards_;
};

}  // namespace VectorCluster
