#include <vectorcluster/replication/local_replica.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/file_io.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VectorCluster {

const char* toString(ApplyOutcome outcome) {
    switch (outcome) {
        case ApplyOutcome::APPLIED:   return "Applied";
        case ApplyOutcome::DUPLICATE: return "Duplicate";
        case ApplyOutcome::GAP:       return "Gap";
    }
    return "Unknown";
}

LocalReplica::LocalReplica(ShardKey key, ShardStorage& storage, const std::string& log_path, size_t retention)
    : key_(std::move(key)),
      storage_(storage),
      log_path_(log_path),
      retention_(retention),
      log_(std::make_unique<OperationLog>(log_path)) {}

// ============================================================================
// RECOVERY
// ============================================================================

void LocalReplica::recover() {
    std::lock_guard<std::mutex> lock(mutex_);
    const OperationId stored = storage_.lastOperationId(key_);
    const OperationId logged = log_->lastId();

    if (stored > logged || stored + 1 < log_->firstRetainedId()) {
        // Log and storage disagree beyond repair; trust storage and let
        // catch-up or a snapshot transfer deliver the rest
        spdlog::warn("[Replica:{}] Storage at {} cannot be reconciled with log [{}, {}], resetting log",
                     key_.toString(), stored, log_->firstRetainedId(), logged);
        log_->resetTo(stored);
        return;
    }

    auto pending = log_->readFrom(stored + 1, logged - stored);
    if (!pending || pending->empty()) {
        return;
    }
    for (const auto& op : *pending) {
        try {
            storage_.apply(key_, op.id, op.payload);
        } catch (const StorageError& e) {
            spdlog::warn("[Replica:{}] Replay of operation {} failed: {}", key_.toString(), op.id, e.what());
        }
    }
    spdlog::info("[Replica:{}] Replayed {} logged operations (now at {})",
                 key_.toString(), pending->size(), logged);
}

// ============================================================================
// APPLY
// ============================================================================

ApplyResult LocalReplica::apply(OperationId id, const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        throw StaleTopologyError("Replica " + key_.toString() + " was removed from this peer");
    }
    ApplyResult result;
    const OperationId last = log_->lastId();

    if (id <= last) {
        result.outcome = ApplyOutcome::DUPLICATE;
        result.last_applied = last;
        return result;
    }
    if (id > last + 1) {
        spdlog::debug("[Replica:{}] Gap: got operation {}, expected {}", key_.toString(), id, last + 1);
        result.outcome = ApplyOutcome::GAP;
        result.last_applied = last;
        return result;
    }

    log_->append(id, payload);
    try {
        storage_.apply(key_, id, payload);
    } catch (const StorageError& e) {
        // Fatal to this operation only; the id stays consumed on every replica
        spdlog::warn("[Replica:{}] Storage rejected operation {}: {}", key_.toString(), id, e.what());
        result.storage_error = e.what();
    }
    result.outcome = ApplyOutcome::APPLIED;
    result.last_applied = id;
    return result;
}

OperationId LocalReplica::lastApplied() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_->lastId();
}

std::optional<std::vector<LoggedOperation>> LocalReplica::operationsFrom(OperationId from, size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_->readFrom(from, max_count);
}

std::vector<Point> LocalReplica::retrieve(const std::vector<PointId>& ids) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        throw StaleTopologyError("Replica " + key_.toString() + " was removed from this peer");
    }
    return storage_.retrieve(key_, ids);
}

// ============================================================================
// SNAPSHOTS & RANGE
// ============================================================================

ReplicaSnapshot LocalReplica::exportSnapshot(const std::optional<HashRange>& range) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ReplicaSnapshot snapshot;
    snapshot.cutoff = range ? 0 : log_->lastId();
    snapshot.data = storage_.snapshotExport(key_, range);
    return snapshot;
}

OperationId LocalReplica::importSnapshot(const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        throw StaleTopologyError("Replica " + key_.toString() + " was removed from this peer");
    }
    OperationId last = storage_.snapshotImport(key_, data);
    storage_.flush(key_);
    log_->resetTo(last);
    retained_range_.reset();
    spdlog::info("[Replica:{}] Installed snapshot at operation {}", key_.toString(), last);
    return last;
}

void LocalReplica::retainRange(const HashRange& range) {
    std::lock_guard<std::mutex> lock(mutex_);
    storage_.retainRange(key_, range);
    retained_range_ = range;
}

std::optional<HashRange> LocalReplica::retainedRange() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return retained_range_;
}

void LocalReplica::flushAndCompact() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return;
    }
    storage_.flush(key_);
    const OperationId flushed = storage_.lastOperationId(key_);
    const OperationId last = log_->lastId();
    if (last <= retention_) {
        return;
    }
    log_->compact(std::min(flushed, last - retention_));
}

void LocalReplica::destroy() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (destroyed_) {
        return;
    }
    destroyed_ = true;
    storage_.drop(key_);
    log_ = std::make_unique<OperationLog>();
    if (!log_path_.empty()) {
        removePath(log_path_);
    }
    spdlog::info("[Replica:{}] Dropped local replica", key_.toString());
}

bool LocalReplica::isDestroyed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return destroyed_;
}

}  // namespace VectorCluster
