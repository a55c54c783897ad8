#pragma once

#include <vectorcluster/consensus/command.hpp>
#include <vectorcluster/replication/replica_set.hpp>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace VectorCluster {

enum class TransferPhase : uint8_t {
    QUEUED = 0,
    SNAPSHOTTING = 1,
    CATCHING_UP = 2,
    FINISHING = 3,      // Waiting for FinishTransfer to commit
    DONE = 4,
    FAILED = 5          // Attempts exhausted, AbortTransfer proposed
};

const char* toString(TransferPhase phase);

// ============================================================================
// SHARD TRANSFER DRIVER
// ============================================================================
// Runs one committed transfer on the peer that executes it: the source for
// a replica move or recovery, the target for a split. The transfer only
// completes through a committed FinishTransfer; the driver proposes it and
// keeps re-proposing until the manager cancels it, which happens once the
// committed topology no longer lists the transfer.
//
// Move / recovery:
//   QUEUED -> SNAPSHOTTING (skipped when the target's position is still
//   covered by the source's operation log) -> CATCHING_UP -> FINISHING
//
// Split (from == to == this peer):
//   wait until the local parent replica reached the parent primary's
//   position, copy the moved range into the local child replica, FINISHING
// ============================================================================

class ShardTransferDriver {
public:
    // Fire-and-forget proposal of a transfer completion or abort
    using ProposeFn = std::function<void(const MetadataCommand& command)>;
    // Local replica set of a shard, nullptr when not hosted here
    using SetLookup = std::function<std::shared_ptr<ShardReplicaSet>(const ShardKey& key)>;
    // Committed hash range of a shard
    using RangeLookup = std::function<std::optional<HashRange>(const ShardKey& key)>;

    ShardTransferDriver(PeerId self, ShardTransfer transfer, ReplicationOptions options,
                        SetLookup find_set, RangeLookup find_range, ProposeFn propose);
    ~ShardTransferDriver();

    ShardTransferDriver(const ShardTransferDriver&) = delete;
    ShardTransferDriver& operator=(const ShardTransferDriver&) = delete;

    void start();

    // Stop retrying and join; safe to call more than once
    void cancel();

    const ShardTransfer& transfer() const { return transfer_; }
    TransferPhase phase() const { return phase_.load(); }
    uint32_t attempts() const { return attempts_.load(); }

private:
    void run();
    void runMove();
    void runSplit();
    void setPhase(TransferPhase phase);

    // Sleep unless cancelled first; returns false when cancelled
    bool waitFor(std::chrono::milliseconds duration);

    std::string logPrefix() const;

    PeerId self_;
    ShardTransfer transfer_;
    ReplicationOptions options_;
    SetLookup find_set_;
    RangeLookup find_range_;
    ProposeFn propose_;

    std::atomic<TransferPhase> phase_{TransferPhase::QUEUED};
    std::atomic<uint32_t> attempts_{0};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancelled_ = false;
    std::thread thread_;
};

}  // namespace VectorCluster
