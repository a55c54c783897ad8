#include <vectorcluster/storage/in_memory_point_store.hpp>
#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/file_io.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

namespace {

constexpr uint32_t SHARD_SNAPSHOT_MAGIC = 0x50545346;  // "PTSF"

bool inRange(const std::optional<HashRange>& range, PointId id) {
    return !range || range->contains(routingHash(id));
}

}  // namespace

InMemoryPointStore::InMemoryPointStore(std::string data_dir)
    : data_dir_(std::move(data_dir)) {
    if (!data_dir_.empty()) {
        ensureDirectory(data_dir_);
    }
}

// ============================================================================
// SHARD LOOKUP
// ============================================================================

std::string InMemoryPointStore::shardPath(const ShardKey& key) const {
    return data_dir_ + "/" + key.collection + "_" + std::to_string(key.shard_id) + ".points";
}

InMemoryPointStore::ShardData& InMemoryPointStore::shardLocked(const ShardKey& key) const {
    auto it = shards_.find(key);
    if (it != shards_.end()) {
        return it->second;
    }

    ShardData shard;
    if (!data_dir_.empty()) {
        auto data = readFile(shardPath(key));
        if (data) {
            try {
                shard = decodeShard(*data);
            } catch (const std::runtime_error& e) {
                throw StorageError("Corrupted shard file " + shardPath(key) + ": " + e.what());
            }
            spdlog::info("[PointStore] Loaded {} ({} points, last op {})",
                         key.toString(), shard.points.size(), shard.last_operation_id);
        }
    }
    return shards_.emplace(key, std::move(shard)).first->second;
}

// ============================================================================
// APPLY
// ============================================================================

void InMemoryPointStore::apply(const ShardKey& key, OperationId operation_id,
                               const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    ShardData& shard = shardLocked(key);
    if (operation_id <= shard.last_operation_id) {
        return;
    }

    // The id is consumed even when the payload is rejected
    shard.last_operation_id = operation_id;

    PointOperation op;
    try {
        op = PointOperation::decode(payload);
    } catch (const std::runtime_error& e) {
        throw StorageError("Operation " + std::to_string(operation_id) + " on " + key.toString() +
                           " has an invalid payload: " + e.what());
    }
    applyLocked(shard, op);
}

void InMemoryPointStore::applyLocked(ShardData& shard, const PointOperation& op) {
    switch (op.kind) {
        case PointOperation::Kind::UPSERT:
            for (const auto& point : op.points) {
                if (inRange(shard.range, point.id)) {
                    shard.points[point.id] = point;
                }
            }
            break;
        case PointOperation::Kind::DELETE_POINTS:
            for (PointId id : op.ids) {
                shard.points.erase(id);
            }
            break;
        case PointOperation::Kind::SET_PAYLOAD:
            for (PointId id : op.ids) {
                auto it = shard.points.find(id);
                if (it == shard.points.end()) {
                    continue;
                }
                for (const auto& [field, value] : op.payload) {
                    it->second.payload[field] = value;
                }
            }
            break;
        case PointOperation::Kind::DELETE_PAYLOAD:
            for (PointId id : op.ids) {
                auto it = shard.points.find(id);
                if (it == shard.points.end()) {
                    continue;
                }
                for (const auto& field : op.keys) {
                    it->second.payload.erase(field);
                }
            }
            break;
        case PointOperation::Kind::CLEAR_PAYLOAD:
            for (PointId id : op.ids) {
                auto it = shard.points.find(id);
                if (it != shard.points.end()) {
                    it->second.payload.clear();
                }
            }
            break;
    }
}

OperationId InMemoryPointStore::lastOperationId(const ShardKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shardLocked(key).last_operation_id;
}

// ============================================================================
// SNAPSHOTS
// ============================================================================

std::vector<uint8_t> InMemoryPointStore::encodeShard(const ShardData& shard,
                                                     const std::optional<HashRange>& filter,
                                                     OperationId operation_id) {
    ByteWriter w;
    w.putU32(SHARD_SNAPSHOT_MAGIC);
    w.putU64(operation_id);

    std::optional<HashRange> range = filter ? filter : shard.range;
    w.putBool(range.has_value());
    w.putU64(range ? range->first : 0);
    w.putU64(range ? range->last : 0);

    std::vector<const Point*> selected;
    for (const auto& [id, point] : shard.points) {
        if (inRange(filter, id)) {
            selected.push_back(&point);
        }
    }
    std::vector<Point> points;
    points.reserve(selected.size());
    for (const Point* point : selected) {
        points.push_back(*point);
    }
    w.putBytes(PointOperation::upsert(std::move(points)).encode());
    return w.take();
}

InMemoryPointStore::ShardData InMemoryPointStore::decodeShard(const std::vector<uint8_t>& data) {
    ByteReader r(data);
    if (r.getU32() != SHARD_SNAPSHOT_MAGIC) {
        throw std::runtime_error("invalid shard snapshot magic");
    }
    ShardData shard;
    shard.last_operation_id = r.getU64();
    bool has_range = r.getBool();
    HashRange range{r.getU64(), r.getU64()};
    if (has_range) {
        shard.range = range;
    }
    PointOperation points = PointOperation::decode(r.getBytes());
    for (auto& point : points.points) {
        PointId id = point.id;
        shard.points[id] = std::move(point);
    }
    return shard;
}

std::vector<uint8_t> InMemoryPointStore::snapshotExport(const ShardKey& key,
                                                        const std::optional<HashRange>& range) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ShardData& shard = shardLocked(key);
    return encodeShard(shard, range, range ? 0 : shard.last_operation_id);
}

OperationId InMemoryPointStore::snapshotImport(const ShardKey& key, const std::vector<uint8_t>& data) {
    ShardData imported;
    try {
        imported = decodeShard(data);
    } catch (const std::runtime_error& e) {
        throw StorageError("Invalid snapshot for " + key.toString() + ": " + e.what());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    OperationId last = imported.last_operation_id;
    spdlog::info("[PointStore] Imported snapshot into {} ({} points, last op {})",
                 key.toString(), imported.points.size(), last);
    shards_[key] = std::move(imported);
    return last;
}

void InMemoryPointStore::retainRange(const ShardKey& key, const HashRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    ShardData& shard = shardLocked(key);
    size_t removed = 0;
    for (auto it = shard.points.begin(); it != shard.points.end();) {
        if (!range.contains(routingHash(it->first))) {
            it = shard.points.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    shard.range = range;
    if (removed > 0) {
        spdlog::info("[PointStore] {} dropped {} points outside its range", key.toString(), removed);
    }
}

void InMemoryPointStore::drop(const ShardKey& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    shards_.erase(key);
    if (!data_dir_.empty()) {
        removePath(shardPath(key));
    }
}

void InMemoryPointStore::flush(const ShardKey& key) {
    if (data_dir_.empty()) {
        return;
    }
    std::vector<uint8_t> data;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const ShardData& shard = shardLocked(key);
        data = encodeShard(shard, std::nullopt, shard.last_operation_id);
    }
    writeFileAtomic(shardPath(key), data);
}

// ============================================================================
// INSPECTION
// ============================================================================

size_t InMemoryPointStore::pointCount(const ShardKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shardLocked(key).points.size();
}

std::vector<Point> InMemoryPointStore::retrieve(const ShardKey& key, const std::vector<PointId>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ShardData& shard = shardLocked(key);
    std::vector<Point> result;
    for (PointId id : ids) {
        auto it = shard.points.find(id);
        if (it != shard.points.end()) {
            result.push_back(it->second);
        }
    }
    return result;
}

std::optional<Point> InMemoryPointStore::getPoint(const ShardKey& key, PointId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ShardData& shard = shardLocked(key);
    auto it = shard.points.find(id);
    if (it == shard.points.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint64_t InMemoryPointStore::digest(const ShardKey& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ShardData& shard = shardLocked(key);

    uint64_t hash = 0xcbf29ce484222325ULL;
    auto mix = [&hash](const std::vector<uint8_t>& bytes) {
        for (uint8_t b : bytes) {
            hash ^= b;
            hash *= 0x100000001b3ULL;
        }
    };
    for (const auto& [id, point] : shard.points) {
        mix(PointOperation::upsert({point}).encode());
    }
    return hash;
}

}  // namespace VectorCluster
