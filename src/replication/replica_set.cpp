#include <vectorcluster/replication/replica_set.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <future>

namespace VectorCluster {

ShardReplicaSet::ShardReplicaSet(PeerId self, std::unique_ptr<LocalReplica> local, Transport& transport,
                                 ThreadPool& pool, ReplicationOptions options, DeadCallback on_dead)
    : self_(self),
      local_(std::move(local)),
      transport_(transport),
      pool_(pool),
      options_(std::move(options)),
      on_dead_(std::move(on_dead)) {}

// ============================================================================
// COMMITTED VIEW
// ============================================================================

void ShardReplicaSet::updateTopology(const ShardInfo& shard, const CollectionConfig& config) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto previous_primary = primary_;
    primary_ = shard.primary();
    self_state_ = shard.stateOf(self_);
    write_consistency_factor_ = config.write_consistency_factor;

    for (const auto& [peer, state] : shard.replicas) {
        if (peer == self_) {
            continue;
        }
        auto& remote = remotes_[peer];
        if (!remote) {
            remote = std::make_shared<RemoteReplica>();
            remote->peer_id = peer;
            remote->committed = state;
            remote->health = state == ReplicaState::DEAD ? ReplicaHealth::DEAD : ReplicaHealth::ACTIVE;
            continue;
        }
        if (remote->committed != ReplicaState::ACTIVE && state == ReplicaState::ACTIVE) {
            // Rejoined through consensus after catching up
            remote->health = ReplicaHealth::ACTIVE;
        }
        if (state == ReplicaState::DEAD) {
            remote->health = ReplicaHealth::DEAD;
            remote->receives_writes = false;
        }
        if (remote->committed == ReplicaState::DEAD && state == ReplicaState::INITIALIZING) {
            remote->health = ReplicaHealth::ACTIVE;
        }
        remote->committed = state;
    }
    for (auto it = remotes_.begin(); it != remotes_.end();) {
        it = shard.hasReplica(it->first) ? std::next(it) : remotes_.erase(it);
    }

    if (primary_ == self_ && previous_primary != self_) {
        needs_catch_up_ = true;
        spdlog::info("[ReplicaSet:{}] This peer is now the primary", key().toString());
    }
}

bool ShardReplicaSet::isPrimary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return primary_ == self_;
}

std::optional<PeerId> ShardReplicaSet::primary() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return primary_;
}

std::shared_ptr<ShardReplicaSet::RemoteReplica> ShardReplicaSet::findRemote(PeerId peer) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = remotes_.find(peer);
    return it == remotes_.end() ? nullptr : it->second;
}

std::vector<ShardReplicaSet::Target> ShardReplicaSet::forwardTargets() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<Target> targets;
    for (const auto& [peer, remote] : remotes_) {
        if (remote->health == ReplicaHealth::DEAD) {
            continue;
        }
        if (remote->committed == ReplicaState::ACTIVE) {
            targets.push_back(Target{remote, true});
        } else if (remote->committed == ReplicaState::INITIALIZING && remote->receives_writes) {
            targets.push_back(Target{remote, false});
        }
    }
    return targets;
}

void ShardReplicaSet::setHealth(RemoteReplica& remote, ReplicaHealth health, OperationId last_applied) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (remote.health != ReplicaHealth::DEAD) {
        remote.health = health;
    }
    remote.last_applied = last_applied;
}

bool ShardReplicaSet::isDead(const RemoteReplica& remote) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return remote.health == ReplicaHealth::DEAD;
}

void ShardReplicaSet::markDead(RemoteReplica& remote, const std::string& reason) {
    ReplicaState committed;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (remote.health == ReplicaHealth::DEAD) {
            return;
        }
        remote.health = ReplicaHealth::DEAD;
        remote.receives_writes = false;
        committed = remote.committed;
    }
    spdlog::warn("[ReplicaSet:{}] Replica on peer {} marked dead: {}", key().toString(), remote.peer_id, reason);
    if (committed == ReplicaState::ACTIVE && on_dead_) {
        on_dead_(key(), remote.peer_id, reason);
    }
}

// ============================================================================
// PRIMARY WRITE PATH
// ============================================================================

UpdateResult ShardReplicaSet::submit(const std::vector<uint8_t>& payload, bool wait) {
    OperationId id = 0;
    ApplyResult local_result;
    std::vector<Target> targets;
    uint32_t write_consistency_factor = 1;
    {
        std::lock_guard<std::mutex> seq(seq_mutex_);
        if (!isPrimary()) {
            throw StaleTopologyError("Peer " + std::to_string(self_) + " is not the primary of " + key().toString());
        }
        if (needs_catch_up_) {
            catchUpAsPrimary();
        }

        id = local_->lastApplied() + 1;
        local_result = local_->apply(id, payload);
        // Chosen under the sequencing lock: a peer enabled later gets id from synchronize()
        targets = forwardTargets();

        std::lock_guard<std::mutex> lock(state_mutex_);
        write_consistency_factor = write_consistency_factor_;
    }

    UpdateResult result;
    result.operation_id = id;
    auto self_ptr = shared_from_this();

    struct Pending {
        std::shared_ptr<RemoteReplica> remote;
        std::shared_ptr<std::atomic<int64_t>> started_at;     // steady_clock ticks, 0 while queued
        std::future<bool> acked;
    };
    std::vector<Pending> required;
    for (const auto& target : targets) {
        auto remote = target.remote;
        const bool best_effort = !target.required;
        auto started_at = std::make_shared<std::atomic<int64_t>>(0);
        auto task = [self_ptr, remote, started_at, id, payload, best_effort]() -> bool {
            started_at->store(std::chrono::steady_clock::now().time_since_epoch().count());
            try {
                std::lock_guard<std::mutex> lock(remote->send_mutex);
                if (self_ptr->isDead(*remote)) {
                    return false;
                }
                self_ptr->forwardLocked(*remote, id, payload);
                return true;
            } catch (const std::exception& e) {
                if (best_effort) {
                    spdlog::debug("[ReplicaSet:{}] Best-effort forward of {} to {} failed: {}",
                                  self_ptr->key().toString(), id, remote->peer_id, e.what());
                } else {
                    self_ptr->markDead(*remote, e.what());
                }
                return false;
            }
        };

        if (wait && target.required) {
            required.push_back(Pending{remote, started_at, pool_.submitWithResult(std::move(task))});
        } else {
            pool_.submit(std::move(task));
        }
    }

    if (wait) {
        uint32_t acknowledged = 1;
        for (auto& pending : required) {
            if (!awaitForward(pending.acked, *pending.started_at)) {
                markDead(*pending.remote, "no acknowledgement for operation " + std::to_string(id));
                result.failed_peers.push_back(pending.remote->peer_id);
            } else if (pending.acked.get()) {
                acknowledged++;
            } else {
                result.failed_peers.push_back(pending.remote->peer_id);
            }
        }
        result.status = acknowledged >= write_consistency_factor ? UpdateStatus::COMPLETED
                                                                 : UpdateStatus::ACKNOWLEDGED;
    }

    spdlog::debug("[ReplicaSet:{}] Operation {} {} ({} replicas, {} failed)", key().toString(), id,
                  toString(result.status), targets.size(), result.failed_peers.size());

    if (!local_result.storage_error.empty()) {
        throw StorageError("Operation " + std::to_string(id) + " on " + key().toString() + ": " +
                           local_result.storage_error);
    }
    return result;
}

std::vector<Point> ShardReplicaSet::read(const std::vector<PointId>& ids) {
    std::lock_guard<std::mutex> seq(seq_mutex_);
    if (!isPrimary()) {
        throw StaleTopologyError("Peer " + std::to_string(self_) + " is not the primary of " + key().toString());
    }
    if (needs_catch_up_) {
        catchUpAsPrimary();
    }
    return local_->retrieve(ids);
}

bool ShardReplicaSet::awaitForward(std::future<bool>& acked, const std::atomic<int64_t>& started_at) const {
    using Clock = std::chrono::steady_clock;
    const auto limit = options_.forward_timeout * 2;
    const auto poll = std::max(std::chrono::milliseconds(1), options_.forward_timeout / 4);
    while (acked.wait_for(poll) != std::future_status::ready) {
        const int64_t started = started_at.load();
        // Time spent queued behind other forwards does not count
        if (started != 0 && Clock::now() - Clock::time_point(Clock::duration(started)) >= limit) {
            return false;
        }
    }
    return true;
}

ApplyResult ShardReplicaSet::forwardLocked(RemoteReplica& remote, OperationId id, const std::vector<uint8_t>& payload) {
    ApplyResult res = transport_.forwardOperation(remote.peer_id, ForwardRequest{key(), id, payload, self_},
                                                  options_.forward_timeout);
    if (res.outcome == ApplyOutcome::GAP) {
        spdlog::debug("[ReplicaSet:{}] Peer {} at {} missed operations before {}",
                      key().toString(), remote.peer_id, res.last_applied, id);
        setHealth(remote, ReplicaHealth::RESYNCING, res.last_applied);
        fillGapLocked(remote, res.last_applied + 1, id);
        res.outcome = ApplyOutcome::APPLIED;
        res.last_applied = id;
    }
    setHealth(remote, ReplicaHealth::ACTIVE, res.last_applied);
    return res;
}

void ShardReplicaSet::fillGapLocked(RemoteReplica& remote, OperationId from, OperationId up_to) {
    constexpr int kMaxRestarts = 3;
    int restarts = 0;
    OperationId next = from;

    while (next <= up_to) {
        auto ops = local_->operationsFrom(next, options_.fetch_batch);
        if (!ops) {
            throw StorageError("Operations from " + std::to_string(next) + " of " + key().toString() +
                               " are compacted; peer " + std::to_string(remote.peer_id) + " needs a snapshot");
        }
        if (ops->empty()) {
            break;
        }
        for (const auto& op : *ops) {
            if (op.id > up_to) {
                return;
            }
            ApplyResult res = transport_.forwardOperation(remote.peer_id, ForwardRequest{key(), op.id, op.payload, self_},
                                                          options_.forward_timeout);
            if (res.outcome == ApplyOutcome::GAP) {
                if (++restarts > kMaxRestarts) {
                    throw ServiceError("Peer " + std::to_string(remote.peer_id) + " keeps reporting gaps on " +
                                       key().toString());
                }
                next = res.last_applied + 1;
                break;
            }
            next = op.id + 1;
        }
    }
}

void ShardReplicaSet::catchUpAsPrimary() {
    std::vector<std::shared_ptr<RemoteReplica>> candidates;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& [peer, remote] : remotes_) {
            if (remote->committed == ReplicaState::ACTIVE && remote->health != ReplicaHealth::DEAD) {
                candidates.push_back(remote);
            }
        }
    }

    // No id is assigned before every Active replica's position is known
    PeerId best = NO_PEER;
    OperationId best_last = local_->lastApplied();
    for (const auto& remote : candidates) {
        try {
            ProbeResponse resp = transport_.probeReplica(remote->peer_id, ProbeRequest{key()},
                                                         options_.forward_timeout);
            if (resp.hosted && resp.last_applied > best_last) {
                best = remote->peer_id;
                best_last = resp.last_applied;
            }
        } catch (const ClusterError& e) {
            markDead(*remote, e.what());
            throw ShardInitializingError("Primary of " + key().toString() + " cannot confirm the position of peer " +
                                         std::to_string(remote->peer_id) + " yet: " + e.what());
        }
    }

    if (best != NO_PEER) {
        spdlog::info("[ReplicaSet:{}] Pulling operations {}..{} from peer {} before accepting writes",
                     key().toString(), local_->lastApplied() + 1, best_last, best);
        bool pulled_snapshot = false;
        try {
            while (local_->lastApplied() < best_last) {
                FetchResponse fetched = transport_.fetchOperations(
                    best, FetchRequest{key(), local_->lastApplied() + 1, options_.fetch_batch}, options_.forward_timeout);
                if (!fetched.available) {
                    if (pulled_snapshot) {
                        break;
                    }
                    // Peer compacted what we miss
                    pullSnapshot(best);
                    pulled_snapshot = true;
                    continue;
                }
                if (fetched.operations.empty()) {
                    break;
                }
                for (const auto& op : fetched.operations) {
                    local_->apply(op.id, op.payload);
                }
            }
        } catch (const ClusterError& e) {
            throw ShardInitializingError("Primary of " + key().toString() + " could not catch up from peer " +
                                         std::to_string(best) + ": " + e.what());
        }
        if (local_->lastApplied() < best_last) {
            throw ShardInitializingError("Primary of " + key().toString() + " reached operation " +
                                         std::to_string(local_->lastApplied()) + " of " + std::to_string(best_last) +
                                         " held by peer " + std::to_string(best));
        }
    }
    needs_catch_up_ = false;
}

void ShardReplicaSet::pullSnapshot(PeerId peer) {
    FetchSnapshotResponse resp = transport_.fetchSnapshot(peer, FetchSnapshotRequest{key()},
                                                          options_.forward_timeout * 4);
    if (!resp.hosted) {
        throw StaleTopologyError("Peer " + std::to_string(peer) + " no longer hosts " + key().toString());
    }
    const OperationId last = local_->importSnapshot(resp.data);
    spdlog::info("[ReplicaSet:{}] Installed snapshot at operation {} from peer {}", key().toString(), last, peer);
}

// ============================================================================
// REPLICA SIDE & TRANSFERS
// ============================================================================

ApplyResult ShardReplicaSet::applyForwarded(const ForwardRequest& request) {
    return local_->apply(request.operation_id, request.payload);
}

OperationId ShardReplicaSet::pushSnapshot(PeerId peer) {
    auto remote = findRemote(peer);
    if (!remote) {
        throw StaleTopologyError("Peer " + std::to_string(peer) + " has no replica of " + key().toString());
    }
    std::lock_guard<std::mutex> lock(remote->send_mutex);
    ReplicaSnapshot snapshot = local_->exportSnapshot();
    const OperationId last = transport_.transferSnapshot(
        peer, SnapshotRequest{key(), snapshot.cutoff, std::move(snapshot.data)}, options_.forward_timeout * 4);
    setHealth(*remote, ReplicaHealth::RESYNCING, last);
    spdlog::info("[ReplicaSet:{}] Snapshot at operation {} installed on peer {}", key().toString(), last, peer);
    return last;
}

OperationId ShardReplicaSet::synchronize(PeerId peer) {
    auto remote = findRemote(peer);
    if (!remote) {
        throw StaleTopologyError("Peer " + std::to_string(peer) + " has no replica of " + key().toString());
    }
    std::lock_guard<std::mutex> lock(remote->send_mutex);
    {
        // Before reading the local position: later operations are forwarded
        std::lock_guard<std::mutex> state_lock(state_mutex_);
        remote->receives_writes = true;
    }

    ProbeResponse resp = transport_.probeReplica(peer, ProbeRequest{key()}, options_.forward_timeout);
    if (!resp.hosted) {
        throw StaleTopologyError("Peer " + std::to_string(peer) + " does not host " + key().toString() + " yet");
    }
    const OperationId target = local_->lastApplied();
    if (resp.last_applied < target) {
        setHealth(*remote, ReplicaHealth::RESYNCING, resp.last_applied);
        fillGapLocked(*remote, resp.last_applied + 1, target);
    }
    setHealth(*remote, ReplicaHealth::ACTIVE, std::max(target, resp.last_applied));
    return target;
}

std::optional<OperationId> ShardReplicaSet::probePeer(PeerId peer) {
    ProbeResponse resp = transport_.probeReplica(peer, ProbeRequest{key()}, options_.forward_timeout);
    if (!resp.hosted) {
        return std::nullopt;
    }
    return resp.last_applied;
}

bool ShardReplicaSet::sharesOperation(PeerId peer, OperationId id) {
    if (id == 0) {
        return true;
    }
    auto local = local_->operationsFrom(id, 1);
    if (!local || local->empty()) {
        return false;
    }
    FetchResponse remote = transport_.fetchOperations(peer, FetchRequest{key(), id, 1}, options_.forward_timeout);
    if (!remote.available || remote.operations.empty()) {
        return false;
    }
    return remote.operations.front().id == id && remote.operations.front().payload == local->front().payload;
}

// ============================================================================
// HEALTH
// ============================================================================

void ShardReplicaSet::probe() {
    if (isPrimary()) {
        std::vector<std::shared_ptr<RemoteReplica>> active;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            for (const auto& [peer, remote] : remotes_) {
                if (remote->committed == ReplicaState::ACTIVE && remote->health != ReplicaHealth::DEAD) {
                    active.push_back(remote);
                }
            }
        }
        for (const auto& remote : active) {
            try {
                std::lock_guard<std::mutex> lock(remote->send_mutex);
                ProbeResponse resp = transport_.probeReplica(remote->peer_id, ProbeRequest{key()},
                                                             options_.forward_timeout);
                if (!resp.hosted) {
                    markDead(*remote, "replica is not hosted");
                    continue;
                }
                const OperationId last = local_->lastApplied();
                if (resp.last_applied < last) {
                    spdlog::info("[ReplicaSet:{}] Peer {} lags at {} (primary at {}), refilling",
                                 key().toString(), remote->peer_id, resp.last_applied, last);
                    setHealth(*remote, ReplicaHealth::RESYNCING, resp.last_applied);
                    fillGapLocked(*remote, resp.last_applied + 1, last);
                }
                setHealth(*remote, ReplicaHealth::ACTIVE, std::max(last, resp.last_applied));
            } catch (const ClusterError& e) {
                markDead(*remote, e.what());
            }
        }
        return;
    }

    std::optional<PeerId> primary;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (self_state_ != ReplicaState::ACTIVE) {
            return;
        }
        primary = primary_;
    }
    if (!primary || *primary == self_) {
        return;
    }
    try {
        transport_.probeReplica(*primary, ProbeRequest{key()}, options_.forward_timeout);
    } catch (const ClusterError& e) {
        spdlog::warn("[ReplicaSet:{}] Primary {} unreachable: {}", key().toString(), *primary, e.what());
        if (on_dead_) {
            on_dead_(key(), *primary, e.what());
        }
    }
}

std::vector<PeerId> ShardReplicaSet::locallyDeadActive() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<PeerId> peers;
    for (const auto& [peer, remote] : remotes_) {
        if (remote->committed == ReplicaState::ACTIVE && remote->health == ReplicaHealth::DEAD) {
            peers.push_back(peer);
        }
    }
    return peers;
}

std::vector<RemoteReplicaStatus> ShardReplicaSet::replicaStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::vector<RemoteReplicaStatus> status;
    for (const auto& [peer, remote] : remotes_) {
        status.push_back(RemoteReplicaStatus{peer, remote->committed, remote->health, remote->last_applied});
    }
    return status;
}

}  // namespace VectorCluster
