#include <vectorcluster/consensus/consensus_storage.hpp>
#include <vectorcluster/common/codec.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/file_io.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

namespace {

constexpr uint32_t STATE_MAGIC = 0x52535454;     // "RSTT"
constexpr uint32_t SNAPSHOT_MAGIC = 0x52534E50;  // "RSNP"

std::vector<uint8_t> encodeLogRecord(const LogEntry& entry) {
    ByteWriter body;
    encodeEntry(body, entry);
    ByteWriter record;
    record.putBytes(body.data());
    return record.take();
}

}  // namespace

ConsensusStorage::ConsensusStorage(std::string dir)
    : dir_(std::move(dir)),
      state_path_(dir_ + "/raft_state.bin"),
      log_path_(dir_ + "/raft_log.bin"),
      snapshot_path_(dir_ + "/raft_snapshot.bin") {
    ensureDirectory(dir_);
}

ConsensusStorage::~ConsensusStorage() {
    if (log_file_.is_open()) {
        log_file_.flush();
        log_file_.close();
    }
}

// ============================================================================
// LOAD
// ============================================================================

PersistedConsensusState ConsensusStorage::load() {
    std::lock_guard<std::mutex> lock(mutex_);
    PersistedConsensusState state;

    try {
        if (auto data = readFile(state_path_)) {
            ByteReader r(*data);
            if (r.getU32() != STATE_MAGIC) {
                throw std::runtime_error("invalid magic");
            }
            state.hard_state.term = r.getU64();
            state.hard_state.voted_for = r.getU64();
            state.hard_state.commit = r.getU64();
            state.applied = r.getU64();
        }

        if (auto data = readFile(snapshot_path_)) {
            ByteReader r(*data);
            if (r.getU32() != SNAPSHOT_MAGIC) {
                throw std::runtime_error("invalid snapshot magic");
            }
            SnapshotMeta meta;
            meta.index = r.getU64();
            meta.term = r.getU64();
            meta.voters.resize(r.getU32());
            for (auto& peer : meta.voters) {
                peer = r.getU64();
            }
            meta.learners.resize(r.getU32());
            for (auto& peer : meta.learners) {
                peer = r.getU64();
            }
            state.snapshot_data = r.getBytes();
            state.snapshot_meta = std::move(meta);
        }
    } catch (const std::runtime_error& e) {
        throw StorageError("Corrupted consensus state in " + dir_ + ": " + e.what());
    }

    if (auto data = readFile(log_path_)) {
        ByteReader r(*data);
        const uint64_t snapshot_index = state.snapshot_meta ? state.snapshot_meta->index : 0;
        bool torn_tail = false;
        while (!r.atEnd()) {
            try {
                std::vector<uint8_t> body = r.getBytes();
                ByteReader br(body);
                LogEntry entry = decodeEntry(br);
                // Entries at or below the snapshot survive a crash between
                // saveSnapshot and rewriteLog
                if (entry.index <= snapshot_index) {
                    continue;
                }
                if (!state.entries.empty() && entry.index != state.entries.back().index + 1) {
                    throw StorageError("Consensus log in " + dir_ + " is not contiguous at " +
                                       std::to_string(entry.index));
                }
                state.entries.push_back(std::move(entry));
            } catch (const StorageError&) {
                throw;
            } catch (const std::runtime_error&) {
                torn_tail = true;
                break;
            }
        }
        if (torn_tail) {
            spdlog::warn("[ConsensusStorage] Dropping torn tail of {}", log_path_);
        }
    }

    hard_state_ = state.hard_state;
    applied_ = state.applied;

    std::deque<LogEntry> kept(state.entries.begin(), state.entries.end());
    ByteWriter w;
    for (const auto& entry : kept) {
        auto record = encodeLogRecord(entry);
        w.putRaw(record.data(), record.size());
    }
    writeFileAtomic(log_path_, w.data());
    openLogLocked();

    spdlog::info("[ConsensusStorage] Loaded {}: term={}, commit={}, applied={}, snapshot={}, entries={}",
                 dir_, state.hard_state.term, state.hard_state.commit, state.applied,
                 state.snapshot_meta ? state.snapshot_meta->index : 0, state.entries.size());
    return state;
}

// ============================================================================
// WRITES
// ============================================================================

uint64_t ConsensusStorage::appliedIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return applied_;
}

void ConsensusStorage::saveHardState(const HardState& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    hard_state_ = state;
    writeStateLocked();
}

void ConsensusStorage::saveApplied(uint64_t applied) {
    std::lock_guard<std::mutex> lock(mutex_);
    applied_ = applied;
    writeStateLocked();
}

void ConsensusStorage::writeStateLocked() {
    ByteWriter w;
    w.putU32(STATE_MAGIC);
    w.putU64(hard_state_.term);
    w.putU64(hard_state_.voted_for);
    w.putU64(hard_state_.commit);
    w.putU64(applied_);
    writeFileAtomic(state_path_, w.data());
}

void ConsensusStorage::openLogLocked() {
    if (log_file_.is_open()) {
        log_file_.close();
    }
    log_file_.open(log_path_, std::ios::binary | std::ios::app);
    if (!log_file_.is_open()) {
        spdlog::error("[ConsensusStorage] Failed to open {}", log_path_);
        throw StorageError("Failed to open consensus log " + log_path_);
    }
}

void ConsensusStorage::appendEntries(const std::vector<LogEntry>& entries) {
    if (entries.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!log_file_.is_open()) {
        openLogLocked();
    }
    ByteWriter w;
    for (const auto& entry : entries) {
        auto record = encodeLogRecord(entry);
        w.putRaw(record.data(), record.size());
    }
    log_file_.write(reinterpret_cast<const char*>(w.data().data()), static_cast<std::streamsize>(w.size()));
    log_file_.flush();
    if (!log_file_.good()) {
        spdlog::error("[ConsensusStorage] Failed to append {} entries to {}", entries.size(), log_path_);
        throw StorageError("Failed to append to consensus log " + log_path_);
    }
}

void ConsensusStorage::rewriteLog(const std::deque<LogEntry>& entries) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (log_file_.is_open()) {
        log_file_.close();
    }
    ByteWriter w;
    for (const auto& entry : entries) {
        auto record = encodeLogRecord(entry);
        w.putRaw(record.data(), record.size());
    }
    writeFileAtomic(log_path_, w.data());
    openLogLocked();
}

void ConsensusStorage::saveSnapshot(const SnapshotMeta& meta, const std::vector<uint8_t>& data) {
    ByteWriter w;
    w.putU32(SNAPSHOT_MAGIC);
    w.putU64(meta.index);
    w.putU64(meta.term);
    w.putU32(static_cast<uint32_t>(meta.voters.size()));
    for (PeerId peer : meta.voters) {
        w.putU64(peer);
    }
    w.putU32(static_cast<uint32_t>(meta.learners.size()));
    for (PeerId peer : meta.learners) {
        w.putU64(peer);
    }
    w.putBytes(data);

    std::lock_guard<std::mutex> lock(mutex_);
    writeFileAtomic(snapshot_path_, w.data());
}

}  // namespace VectorCluster
