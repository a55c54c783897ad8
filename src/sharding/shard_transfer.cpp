#include <vectorcluster/sharding/shard_transfer.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

const char* toString(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::QUEUED: return "QUEUED";
        case TransferPhase::SNAPSHOTTING: return "SNAPSHOTTING";
        case TransferPhase::CATCHING_UP: return "CATCHING_UP";
        case TransferPhase::FINISHING: return "FINISHING";
        case TransferPhase::DONE: return "DONE";
        case TransferPhase::FAILED: return "FAILED";
    }
    return "UNKNOWN";
}

ShardTransferDriver::ShardTransferDriver(PeerId self, ShardTransfer transfer, ReplicationOptions options,
                                         SetLookup find_set, RangeLookup find_range, ProposeFn propose)
    : self_(self),
      transfer_(std::move(transfer)),
      options_(std::move(options)),
      find_set_(std::move(find_set)),
      find_range_(std::move(find_range)),
      propose_(std::move(propose)) {}

ShardTransferDriver::~ShardTransferDriver() {
    cancel();
}

void ShardTransferDriver::start() {
    spdlog::info("{} Transfer scheduled", logPrefix());
    thread_ = std::thread(&ShardTransferDriver::run, this);
}

void ShardTransferDriver::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool ShardTransferDriver::waitFor(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, duration, [this] { return cancelled_; });
}

void ShardTransferDriver::setPhase(TransferPhase phase) {
    if (phase_.exchange(phase) != phase) {
        spdlog::info("{} Phase {}", logPrefix(), toString(phase));
    }
}

std::string ShardTransferDriver::logPrefix() const {
    return "[Transfer:" + transfer_.collection + "/" + std::to_string(transfer_.shard_id) + " " +
           std::to_string(transfer_.from) + "->" + std::to_string(transfer_.to) + "]";
}

// ============================================================================
// DRIVER LOOP
// ============================================================================

void ShardTransferDriver::run() {
    std::string last_error;
    bool completed = false;

    while (!completed && attempts_ < options_.transfer_max_attempts) {
        const uint32_t attempt = ++attempts_;
        setPhase(TransferPhase::QUEUED);
        try {
            if (transfer_.split_from) {
                runSplit();
            } else {
                runMove();
            }
            completed = true;
        } catch (const std::exception& e) {
            last_error = e.what();
            spdlog::warn("{} Attempt {}/{} failed: {}", logPrefix(), attempt, options_.transfer_max_attempts,
                         last_error);
            if (!waitFor(options_.transfer_backoff * attempt)) {
                return;
            }
        }
    }

    if (completed) {
        setPhase(TransferPhase::FINISHING);
        do {
            propose_(FinishTransfer{transfer_});
        } while (waitFor(options_.transfer_backoff * 5));
        setPhase(TransferPhase::DONE);
        return;
    }

    setPhase(TransferPhase::FAILED);
    spdlog::error("{} Giving up after {} attempts: {}", logPrefix(), attempts_.load(), last_error);
    do {
        propose_(AbortTransfer{transfer_, last_error});
    } while (waitFor(options_.transfer_backoff * 5));
}

void ShardTransferDriver::runMove() {
    auto source = find_set_(ShardKey{transfer_.collection, transfer_.shard_id});
    if (!source) {
        throw StaleTopologyError("Source replica " + transfer_.toString() + " is not hosted here");
    }

    auto target_last = source->probePeer(transfer_.to);
    if (!target_last) {
        throw ShardInitializingError("Target has not created its replica yet");
    }

    // Resume from the target's own position while the log still covers it and
    // the target's last operation is the one the source logged under that id
    const OperationId source_last = source->local().lastApplied();
    const bool delta = *target_last <= source_last &&
                       source->local().operationsFrom(*target_last + 1, 1).has_value() &&
                       source->sharesOperation(transfer_.to, *target_last);
    if (delta) {
        spdlog::info("{} Target at {}, source at {}: streaming log delta", logPrefix(), *target_last, source_last);
    } else {
        setPhase(TransferPhase::SNAPSHOTTING);
        source->pushSnapshot(transfer_.to);
    }

    setPhase(TransferPhase::CATCHING_UP);
    const OperationId reached = source->synchronize(transfer_.to);
    spdlog::info("{} Target caught up to operation {}", logPrefix(), reached);
}

void ShardTransferDriver::runSplit() {
    const ShardKey parent_key{transfer_.collection, *transfer_.split_from};
    const ShardKey child_key{transfer_.collection, transfer_.shard_id};
    auto parent = find_set_(parent_key);
    auto child = find_set_(child_key);
    if (!parent || !child) {
        throw StaleTopologyError("Split replicas of " + transfer_.toString() + " are not hosted here");
    }
    auto range = find_range_(child_key);
    if (!range) {
        throw StaleTopologyError("Shard " + child_key.toString() + " no longer exists");
    }

    // Writes to the moved range stop at the parent primary once it applied the split
    auto primary = parent->primary();
    if (primary && *primary != self_) {
        auto primary_last = parent->probePeer(*primary);
        if (!primary_last) {
            throw StaleTopologyError("Parent primary " + std::to_string(*primary) + " does not host " +
                                     parent_key.toString());
        }
        if (parent->local().lastApplied() < *primary_last) {
            throw ShardInitializingError("Parent replica at " + std::to_string(parent->local().lastApplied()) +
                                         ", primary at " + std::to_string(*primary_last));
        }
    }

    setPhase(TransferPhase::SNAPSHOTTING);
    ReplicaSnapshot snapshot = parent->local().exportSnapshot(*range);
    child->local().importSnapshot(snapshot.data);
    spdlog::info("{} Copied range [{}, {}] from parent at operation {}", logPrefix(), range->first, range->last,
                 snapshot.cutoff);
}

}  // namespace VectorCluster
