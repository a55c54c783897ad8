#include <vectorcluster/replication/operation_log.hpp>
#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/file_io.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>

namespace VectorCluster {

namespace {

constexpr uint32_t OPLOG_MAGIC = 0x4F504C47;  // "OPLG"
constexpr size_t HEADER_SIZE = 12;
constexpr size_t RECORD_HEADER_SIZE = 12;

std::vector<uint8_t> encodeRecord(OperationId id, const std::vector<uint8_t>& payload) {
    ByteWriter w;
    w.putU64(id);
    w.putBytes(payload);
    return w.take();
}

}  // namespace

OperationLog::OperationLog(std::string path) : path_(std::move(path)) {
    if (path_.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    loadLocked();
    openForAppendLocked();
}

OperationLog::~OperationLog() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

// ============================================================================
// PERSISTENCE
// ============================================================================

void OperationLog::loadLocked() {
    auto data = readFile(path_);
    if (!data) {
        rewriteLocked();
        return;
    }
    if (data->size() < HEADER_SIZE) {
        throw StorageError("Operation log " + path_ + " has a truncated header");
    }

    ByteReader r(*data);
    if (r.getU32() != OPLOG_MAGIC) {
        throw StorageError("Operation log " + path_ + " has invalid magic");
    }
    base_id_ = r.getU64();

    bool torn_tail = false;
    while (!r.atEnd()) {
        if (r.remaining() < RECORD_HEADER_SIZE) {
            torn_tail = true;
            break;
        }
        LoggedOperation op;
        try {
            op.id = r.getU64();
            op.payload = r.getBytes();
        } catch (const std::runtime_error&) {
            torn_tail = true;
            break;
        }
        if (op.id != base_id_ + entries_.size() + 1) {
            throw StorageError("Operation log " + path_ + " has a gap at id " + std::to_string(op.id));
        }
        entries_.push_back(std::move(op));
    }

    if (torn_tail) {
        // Crash during append: the partial record was never acknowledged
        spdlog::warn("[OpLog] Dropping torn tail record in {}", path_);
        rewriteLocked();
    }
    spdlog::debug("[OpLog] Loaded {} (base {}, {} entries)", path_, base_id_, entries_.size());
}

void OperationLog::rewriteLocked() {
    if (path_.empty()) {
        return;
    }
    if (file_.is_open()) {
        file_.close();
    }

    ByteWriter w;
    w.putU32(OPLOG_MAGIC);
    w.putU64(base_id_);
    for (const auto& op : entries_) {
        auto record = encodeRecord(op.id, op.payload);
        w.putRaw(record.data(), record.size());
    }
    writeFileAtomic(path_, w.data());
}

void OperationLog::openForAppendLocked() {
    file_.open(path_, std::ios::binary | std::ios::app);
    if (!file_.is_open()) {
        spdlog::error("[OpLog] Failed to open {}", path_);
        throw StorageError("Failed to open operation log " + path_);
    }
}

// ============================================================================
// APPEND & READ
// ============================================================================

void OperationLog::append(OperationId id, const std::vector<uint8_t>& payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    const OperationId expected = base_id_ + entries_.size() + 1;
    if (id != expected) {
        throw StorageError("Out of order append: expected " + std::to_string(expected) +
                           ", got " + std::to_string(id));
    }

    if (file_.is_open()) {
        auto record = encodeRecord(id, payload);
        file_.write(reinterpret_cast<const char*>(record.data()), static_cast<std::streamsize>(record.size()));
        file_.flush();
        if (!file_.good()) {
            spdlog::error("[OpLog] Failed to append operation {} to {}", id, path_);
            throw StorageError("Failed to append to operation log " + path_);
        }
    }
    entries_.push_back(LoggedOperation{id, payload});
}

OperationId OperationLog::lastId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_id_ + entries_.size();
}

OperationId OperationLog::firstRetainedId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return base_id_ + 1;
}

size_t OperationLog::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::optional<std::vector<LoggedOperation>> OperationLog::readFrom(OperationId from, size_t max_count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (from <= base_id_) {
        return std::nullopt;
    }
    std::vector<LoggedOperation> result;
    const OperationId last = base_id_ + entries_.size();
    for (OperationId id = from; id <= last && result.size() < max_count; ++id) {
        result.push_back(entries_[id - base_id_ - 1]);
    }
    return result;
}

// ============================================================================
// RESET & COMPACTION
// ============================================================================

void OperationLog::resetTo(OperationId base_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    base_id_ = base_id;
    if (!path_.empty()) {
        rewriteLocked();
        openForAppendLocked();
    }
}

void OperationLog::compact(OperationId up_to) {
    std::lock_guard<std::mutex> lock(mutex_);
    const OperationId last = base_id_ + entries_.size();
    up_to = std::min(up_to, last);
    if (up_to <= base_id_) {
        return;
    }
    entries_.erase(entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(up_to - base_id_));
    base_id_ = up_to;
    if (!path_.empty()) {
        rewriteLocked();
        openForAppendLocked();
    }
    spdlog::debug("[OpLog] Compacted {} up to {}", path_.empty() ? "<memory>" : path_, up_to);
}

}  // namespace VectorCluster
