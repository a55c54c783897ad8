#include <vectorcluster/sharding/shard_manager.hpp>
#include <vectorcluster/common/errors.hpp>
#include <vectorcluster/common/file_io.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <set>

namespace VectorCluster {

ShardManager::ShardManager(PeerId self, ShardManagerOptions options, ConsensusService& consensus,
                           TopologyRegistry& registry, Transport& transport, ShardStorage& storage)
    : self_(self),
      options_(std::move(options)),
      consensus_(consensus),
      registry_(registry),
      transport_(transport),
      storage_(storage),
      pool_(options_.replication.worker_threads, "replication-" + std::to_string(self)),
      last_probe_(std::chrono::steady_clock::now()),
      last_compact_(std::chrono::steady_clock::now()) {
    if (!options_.data_dir.empty()) {
        ensureDirectory(options_.data_dir + "/oplog");
    }
}

ShardManager::~ShardManager() {
    shutdown();
}

void ShardManager::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    std::map<std::string, std::unique_ptr<ShardTransferDriver>> drivers;
    {
        std::lock_guard<std::mutex> lock(drivers_mutex_);
        drivers.swap(drivers_);
    }
    for (auto& [key, driver] : drivers) {
        driver->cancel();
    }
    pool_.shutdown();

    std::lock_guard<std::mutex> lock(sets_mutex_);
    for (auto& [key, set] : sets_) {
        set->local().flushAndCompact();
    }
    spdlog::info("[ShardManager:{}] Stopped with {} local replicas", self_, sets_.size());
}

// ============================================================================
// ROUTING & WRITES
// ============================================================================

ShardId ShardManager::route(const std::string& collection, PointId point) const {
    return registry_.current()->route(collection, point);
}

std::map<ShardId, UpdateResult> ShardManager::submitOperation(const std::string& collection,
                                                              const PointOperation& operation, bool wait) {
    if (operation.empty()) {
        throw BadRequestError("Operation does not touch any point");
    }
    auto topology = registry_.current();
    const CollectionInfo& info = topology->collection(collection);

    std::map<ShardId, std::vector<PointId>> by_shard;
    for (PointId id : operation.pointIds()) {
        by_shard[topology->route(info.name, id)].push_back(id);
    }

    std::map<ShardId, UpdateResult> results;
    for (const auto& [shard_id, ids] : by_shard) {
        const PointOperation part = by_shard.size() == 1 ? operation : operation.restrictedTo(ids);
        results[shard_id] = submitToShard(ShardKey{info.name, shard_id}, part.encode(), wait);
    }
    return results;
}

UpdateResult ShardManager::submitToShard(const ShardKey& key, const std::vector<uint8_t>& payload, bool wait) {
    auto topology = registry_.current();
    const ShardInfo* shard = topology->findShard(key);
    if (!shard) {
        throw NotFoundError("Shard " + key.toString() + " not found");
    }
    auto primary = shard->primary();
    if (!primary) {
        throw ShardInitializingError("Shard " + key.toString() + " has no active replica yet");
    }
    if (*primary == self_) {
        return submitLocal(key, payload, wait);
    }
    return transport_.submitToPrimary(*primary, SubmitRequest{key, payload, wait},
                                      options_.replication.forward_timeout * 4);
}

std::vector<Point> ShardManager::getPoints(const std::string& collection, const std::vector<PointId>& ids) {
    auto topology = registry_.current();
    const CollectionInfo& info = topology->collection(collection);

    std::map<ShardId, std::vector<PointId>> by_shard;
    for (PointId id : ids) {
        by_shard[topology->route(info.name, id)].push_back(id);
    }

    std::vector<Point> points;
    for (const auto& [shard_id, shard_ids] : by_shard) {
        const ShardKey key{info.name, shard_id};
        const ShardInfo* shard = topology->findShard(key);
        if (!shard) {
            throw NotFoundError("Shard " + key.toString() + " not found");
        }
        auto primary = shard->primary();
        if (!primary) {
            throw ShardInitializingError("Shard " + key.toString() + " has no active replica yet");
        }
        std::vector<Point> part;
        if (*primary == self_) {
            part = readLocal(key, shard_ids);
        } else {
            part = transport_.getPoints(*primary, GetPointsRequest{key, shard_ids},
                                        options_.replication.forward_timeout * 2).points;
        }
        points.insert(points.end(), std::make_move_iterator(part.begin()), std::make_move_iterator(part.end()));
    }
    return points;
}

std::vector<Point> ShardManager::readLocal(const ShardKey& key, const std::vector<PointId>& ids) {
    auto set = replicaSet(key);
    if (!set) {
        throw StaleTopologyError("Peer " + std::to_string(self_) + " does not host " + key.toString());
    }
    return set->read(ids);
}

UpdateResult ShardManager::submitLocal(const ShardKey& key, const std::vector<uint8_t>& payload, bool wait) {
    auto set = replicaSet(key);
    if (!set || !set->isPrimary()) {
        throw StaleTopologyError("Peer " + std::to_string(self_) + " is not the primary of " + key.toString());
    }

    auto topology = registry_.current();
    const ShardInfo* shard = topology->findShard(key);
    if (!shard) {
        throw StaleTopologyError("Shard " + key.toString() + " no longer exists");
    }
    PointOperation operation;
    try {
        operation = PointOperation::decode(payload);
    } catch (const std::runtime_error& e) {
        throw BadRequestError(std::string("Malformed point operation: ") + e.what());
    }
    for (PointId id : operation.pointIds()) {
        if (!shard->range.contains(routingHash(id))) {
            throw StaleTopologyError("Point " + std::to_string(id) + " no longer belongs to " + key.toString());
        }
    }
    return set->submit(payload, wait);
}

// ============================================================================
// METADATA
// ============================================================================

uint64_t ShardManager::createCollection(const CollectionId& name, uint32_t shard_count,
                                        std::optional<uint32_t> replication_factor,
                                        std::optional<uint32_t> write_consistency_factor) {
    auto topology = registry_.current();

    CreateCollection command;
    command.name = name;
    command.shard_count = shard_count;
    command.replication_factor = replication_factor.value_or(options_.default_replication_factor);
    command.write_consistency_factor =
        write_consistency_factor.value_or(std::min(options_.default_write_consistency_factor,
                                                   command.replication_factor));

    std::vector<PeerId> peers = topology->voters();
    for (PeerId learner : topology->learners()) {
        peers.push_back(learner);
    }
    std::sort(peers.begin(), peers.end());
    if (shard_count > 0 && command.replication_factor > 0) {
        command.distribution = proposeDistribution(shard_count, command.replication_factor, peers,
                                                   topology->replicaLoad());
    }
    return consensus_.propose(command);
}

uint64_t ShardManager::updateCollection(const std::string& name, std::optional<uint32_t> replication_factor,
                                        std::optional<uint32_t> write_consistency_factor) {
    auto topology = registry_.current();
    const CollectionInfo& info = topology->collection(name);

    UpdateCollection command;
    command.name = info.name;
    command.replication_factor = replication_factor;
    command.write_consistency_factor = write_consistency_factor;

    if (replication_factor && *replication_factor > 0) {
        for (const auto& [shard_id, shard] : info.shards) {
            if (shard.replicas.size() <= *replication_factor) {
                continue;
            }
            // Dead first, then Initializing, then the highest Active ids
            std::vector<std::pair<ReplicaState, PeerId>> candidates;
            for (const auto& [peer, state] : shard.replicas) {
                candidates.emplace_back(state, peer);
            }
            auto rank = [](ReplicaState s) {
                return s == ReplicaState::DEAD ? 0 : (s == ReplicaState::INITIALIZING ? 1 : 2);
            };
            std::sort(candidates.begin(), candidates.end(), [&](const auto& a, const auto& b) {
                if (rank(a.first) != rank(b.first)) {
                    return rank(a.first) < rank(b.first);
                }
                return a.second > b.second;
            });

            size_t surplus = shard.replicas.size() - *replication_factor;
            size_t active_left = shard.activePeers().size();
            for (const auto& [state, peer] : candidates) {
                if (surplus == 0) {
                    break;
                }
                if (state == ReplicaState::ACTIVE) {
                    if (active_left <= 1) {
                        break;
                    }
                    active_left--;
                }
                command.remove_replicas.emplace_back(shard_id, peer);
                surplus--;
            }
        }
    }
    return consensus_.propose(command);
}

uint64_t ShardManager::dropCollection(const std::string& name) {
    auto topology = registry_.current();
    return consensus_.propose(DeleteCollection{topology->collection(name).name});
}

uint64_t ShardManager::changeAliases(const std::vector<AliasAction>& actions) {
    if (actions.empty()) {
        throw BadRequestError("No alias action given");
    }
    return consensus_.propose(ChangeAliases{actions});
}

ShardId ShardManager::splitShard(const std::string& collection, ShardId shard_id) {
    auto topology = registry_.current();
    const CollectionInfo& info = topology->collection(collection);
    if (!info.findShard(shard_id)) {
        throw NotFoundError("Shard " + info.name + "/" + std::to_string(shard_id) + " not found");
    }
    const ShardId new_shard_id = info.shards.rbegin()->first + 1;
    consensus_.propose(SplitShard{info.name, shard_id, new_shard_id});
    return new_shard_id;
}

uint64_t ShardManager::addPeer(PeerId peer, const std::string& address, PeerRole role) {
    return consensus_.propose(AddPeer{peer, address, role});
}

uint64_t ShardManager::removePeer(PeerId peer, bool force) {
    return consensus_.propose(RemovePeer{peer, force});
}

uint64_t ShardManager::promotePeer(PeerId peer) {
    return consensus_.propose(PromotePeer{peer});
}

// ============================================================================
// PEER RPC HANDLERS
// ============================================================================

ApplyResult ShardManager::onForward(const ForwardRequest& request) {
    auto set = replicaSet(request.key);
    if (!set) {
        throw StaleTopologyError("Peer " + std::to_string(self_) + " does not host " + request.key.toString());
    }
    return set->applyForwarded(request);
}

FetchResponse ShardManager::onFetch(const FetchRequest& request) {
    FetchResponse response;
    auto set = replicaSet(request.key);
    if (!set) {
        return response;
    }
    auto operations = set->local().operationsFrom(request.from, request.max_count);
    response.last_id = set->local().lastApplied();
    if (operations) {
        response.available = true;
        response.operations = std::move(*operations);
    }
    return response;
}

ProbeResponse ShardManager::onProbe(const ProbeRequest& request) {
    ProbeResponse response;
    if (auto set = replicaSet(request.key)) {
        response.hosted = true;
        response.last_applied = set->local().lastApplied();
    }
    return response;
}

OperationId ShardManager::onTransferSnapshot(const SnapshotRequest& request) {
    auto set = replicaSet(request.key);
    if (!set) {
        throw StaleTopologyError("Peer " + std::to_string(self_) + " does not host " + request.key.toString());
    }
    const OperationId installed = set->local().importSnapshot(request.data);
    if (installed != request.cutoff) {
        spdlog::warn("[ShardManager:{}] Snapshot of {} declared cutoff {} but restored {}",
                     self_, request.key.toString(), request.cutoff, installed);
    }
    return installed;
}

UpdateResult ShardManager::onSubmit(const SubmitRequest& request) {
    return submitLocal(request.key, request.payload, request.wait);
}

FetchSnapshotResponse ShardManager::onFetchSnapshot(const FetchSnapshotRequest& request) {
    FetchSnapshotResponse response;
    auto set = replicaSet(request.key);
    if (!set) {
        return response;
    }
    ReplicaSnapshot snapshot = set->local().exportSnapshot();
    response.hosted = true;
    response.cutoff = snapshot.cutoff;
    response.data = std::move(snapshot.data);
    spdlog::info("[ShardManager:{}] Serving snapshot of {} at operation {}", self_, request.key.toString(),
                 response.cutoff);
    return response;
}

GetPointsResponse ShardManager::onGetPoints(const GetPointsRequest& request) {
    return GetPointsResponse{readLocal(request.key, request.ids)};
}

// ============================================================================
// RECONCILE
// ============================================================================

void ShardManager::reconcile() {
    if (stopped_) {
        return;
    }
    auto topology = registry_.current();
    if (topology->applied_index == 0) {
        // Nothing committed here yet: ask the seeds to add us
        ensureMembership(*topology);
        return;
    }

    ensureMembership(*topology);
    syncLocalReplicas(*topology);
    driveReplicaStates(*topology);
    syncTransfers(*topology);
    if (consensus_.isLeader()) {
        scheduleReplication(*topology);
    }
    maintain(*topology);
}

void ShardManager::ensureMembership(const Topology& topology) {
    if (topology.findPeer(self_)) {
        was_member_ = true;
        return;
    }
    if (was_member_) {
        // Removed through consensus; stay out
        return;
    }
    issue("join", AddPeer{self_, options_.self_address, PeerRole::VOTER});
}

std::shared_ptr<ShardReplicaSet> ShardManager::createReplicaSet(const ShardKey& key) {
    std::string log_path;
    if (!options_.data_dir.empty()) {
        log_path = options_.data_dir + "/oplog/" + key.collection + "_" + std::to_string(key.shard_id) + ".oplog";
    }
    auto local = std::make_unique<LocalReplica>(key, storage_, log_path, options_.replication.oplog_retention);
    local->recover();

    auto on_dead = [this](const ShardKey& k, PeerId peer, const std::string& reason) {
        onReplicaDead(k, peer, reason);
    };
    auto set = std::make_shared<ShardReplicaSet>(self_, std::move(local), transport_, pool_,
                                                 options_.replication, std::move(on_dead));
    spdlog::info("[ShardManager:{}] Hosting replica {} at operation {}", self_, key.toString(),
                 set->local().lastApplied());
    return set;
}

void ShardManager::syncLocalReplicas(const Topology& topology) {
    std::map<ShardKey, std::pair<const ShardInfo*, const CollectionInfo*>> wanted;
    for (const auto& [name, info] : topology.collections) {
        for (const auto& [shard_id, shard] : info.shards) {
            if (shard.hasReplica(self_)) {
                wanted[ShardKey{name, shard_id}] = {&shard, &info};
            }
        }
    }

    std::vector<std::shared_ptr<ShardReplicaSet>> removed;
    std::vector<std::pair<std::shared_ptr<ShardReplicaSet>, std::pair<const ShardInfo*, const CollectionInfo*>>> current;
    {
        std::lock_guard<std::mutex> lock(sets_mutex_);
        for (auto it = sets_.begin(); it != sets_.end();) {
            if (!wanted.count(it->first)) {
                removed.push_back(it->second);
                it = sets_.erase(it);
            } else {
                ++it;
            }
        }
        for (const auto& [key, refs] : wanted) {
            auto it = sets_.find(key);
            if (it == sets_.end()) {
                try {
                    it = sets_.emplace(key, createReplicaSet(key)).first;
                } catch (const ClusterError& e) {
                    spdlog::error("[ShardManager:{}] Cannot open replica {}: {}", self_, key.toString(), e.what());
                    continue;
                }
            }
            current.emplace_back(it->second, refs);
        }
    }

    for (const auto& set : removed) {
        spdlog::info("[ShardManager:{}] Dropping replica {}", self_, set->key().toString());
        set->local().destroy();
    }
    for (const auto& [set, refs] : current) {
        set->updateTopology(*refs.first, refs.second->config);
    }
}

void ShardManager::driveReplicaStates(const Topology& topology) {
    for (const auto& [name, info] : topology.collections) {
        for (const auto& [shard_id, shard] : info.shards) {
            auto state = shard.stateOf(self_);
            if (!state) {
                continue;
            }
            const std::string action_key = name + "/" + std::to_string(shard_id);

            if (*state == ReplicaState::INITIALIZING && !info.transferTo(shard_id, self_)) {
                // Created with the collection: empty and ready
                issue("activate:" + action_key,
                      SetShardReplicaState{name, shard_id, self_, ReplicaState::ACTIVE});
            } else if (*state == ReplicaState::DEAD) {
                auto primary = shard.primary();
                if (primary && *primary != self_) {
                    issue("recover:" + action_key,
                          StartTransfer{ShardTransfer{name, shard_id, *primary, self_, std::nullopt}});
                }
            }
        }
    }

    std::vector<std::shared_ptr<ShardReplicaSet>> sets;
    {
        std::lock_guard<std::mutex> lock(sets_mutex_);
        for (const auto& [key, set] : sets_) {
            sets.push_back(set);
        }
    }
    for (const auto& set : sets) {
        for (PeerId peer : set->locallyDeadActive()) {
            issue("dead:" + set->key().toString() + ":" + std::to_string(peer),
                  SetShardReplicaState{set->key().collection, set->key().shard_id, peer, ReplicaState::DEAD});
        }
    }
}

void ShardManager::syncTransfers(const Topology& topology) {
    std::set<std::string> mine;
    std::vector<std::unique_ptr<ShardTransferDriver>> finished;
    {
        std::lock_guard<std::mutex> lock(drivers_mutex_);
        for (const auto& [name, info] : topology.collections) {
            for (const auto& transfer : info.transfers) {
                const bool executes = transfer.split_from ? transfer.to == self_ : transfer.from == self_;
                if (!executes) {
                    continue;
                }
                const std::string key = transfer.toString();
                mine.insert(key);
                if (drivers_.count(key) || stopped_) {
                    continue;
                }
                auto driver = std::make_unique<ShardTransferDriver>(
                    self_, transfer, options_.replication,
                    [this](const ShardKey& k) { return replicaSet(k); },
                    [this](const ShardKey& k) -> std::optional<HashRange> {
                        const ShardInfo* s = registry_.current()->findShard(k);
                        if (!s) {
                            return std::nullopt;
                        }
                        return s->range;
                    },
                    [this](const MetadataCommand& command) { consensus_.proposeAsync(command); });
                driver->start();
                drivers_.emplace(key, std::move(driver));
            }
        }
        for (auto it = drivers_.begin(); it != drivers_.end();) {
            if (!mine.count(it->first)) {
                finished.push_back(std::move(it->second));
                it = drivers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    // Joined outside the lock: drivers look up replica sets while running
    for (auto& driver : finished) {
        driver->cancel();
        spdlog::info("[ShardManager:{}] Transfer {} left the topology ({})", self_,
                     driver->transfer().toString(), toString(driver->phase()));
    }
}

void ShardManager::scheduleReplication(const Topology& topology) {
    auto load = topology.replicaLoad();
    for (const auto& [name, info] : topology.collections) {
        if (!info.transfers.empty()) {
            continue;   // One transfer at a time per collection
        }
        for (const auto& [shard_id, shard] : info.shards) {
            size_t alive = 0;
            for (const auto& [peer, state] : shard.replicas) {
                alive += state != ReplicaState::DEAD ? 1 : 0;
            }
            auto primary = shard.primary();
            if (alive >= info.config.replication_factor || !primary) {
                continue;
            }

            PeerId target = NO_PEER;
            size_t target_load = 0;
            for (const auto& [peer, peer_load] : load) {
                if (shard.hasReplica(peer)) {
                    continue;
                }
                if (target == NO_PEER || peer_load < target_load) {
                    target = peer;
                    target_load = peer_load;
                }
            }
            if (target == NO_PEER) {
                continue;
            }
            issue("replicate:" + name + "/" + std::to_string(shard_id),
                  StartTransfer{ShardTransfer{name, shard_id, *primary, target, std::nullopt}});
            break;
        }
    }
}

void ShardManager::maintain(const Topology& topology) {
    std::vector<std::pair<std::shared_ptr<ShardReplicaSet>, HashRange>> sets;
    {
        std::lock_guard<std::mutex> lock(sets_mutex_);
        for (const auto& [key, set] : sets_) {
            const CollectionInfo* info = topology.findCollection(key.collection);
            const ShardInfo* shard = topology.findShard(key);
            if (!info || !shard) {
                continue;
            }
            if (!info->hasTransfersFor(key.shard_id)) {
                sets.emplace_back(set, shard->range);
            }
        }
    }

    // Ranges shrink after a split once the moved points reached the child
    for (const auto& [set, range] : sets) {
        auto retained = set->local().retainedRange();
        if (!retained || !(*retained == range)) {
            set->local().retainRange(range);
        }
    }

    const auto now = std::chrono::steady_clock::now();
    if (now - last_compact_ >= options_.compact_interval) {
        last_compact_ = now;
        std::vector<std::shared_ptr<ShardReplicaSet>> all;
        {
            std::lock_guard<std::mutex> lock(sets_mutex_);
            for (const auto& [key, set] : sets_) {
                all.push_back(set);
            }
        }
        for (const auto& set : all) {
            set->local().flushAndCompact();
        }

        std::lock_guard<std::mutex> lock(issue_mutex_);
        for (auto it = last_issued_.begin(); it != last_issued_.end();) {
            it = (now - it->second > options_.reissue_interval * 10) ? last_issued_.erase(it) : std::next(it);
        }
    }

    if (now - last_probe_ >= options_.replication.health_probe_interval && probes_in_flight_ == 0) {
        last_probe_ = now;
        std::vector<std::shared_ptr<ShardReplicaSet>> all;
        {
            std::lock_guard<std::mutex> lock(sets_mutex_);
            for (const auto& [key, set] : sets_) {
                all.push_back(set);
            }
        }
        for (const auto& set : all) {
            probes_in_flight_++;
            pool_.submit([this, set]() {
                try {
                    set->probe();
                } catch (const std::exception& e) {
                    spdlog::warn("[ShardManager:{}] Probe of {} failed: {}", self_, set->key().toString(), e.what());
                }
                probes_in_flight_--;
            });
        }
    }
}

void ShardManager::issue(const std::string& action, const MetadataCommand& command) {
    const auto now = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(issue_mutex_);
        auto it = last_issued_.find(action);
        if (it != last_issued_.end() && now - it->second < options_.reissue_interval) {
            return;
        }
        last_issued_[action] = now;
    }
    spdlog::debug("[ShardManager:{}] Proposing {} ({})", self_, commandName(command), action);
    consensus_.proposeAsync(command);
}

void ShardManager::onReplicaDead(const ShardKey& key, PeerId peer, const std::string& reason) {
    spdlog::warn("[ShardManager:{}] Reporting replica of {} on peer {} as dead: {}",
                 self_, key.toString(), peer, reason);
    issue("dead:" + key.toString() + ":" + std::to_string(peer),
          SetShardReplicaState{key.collection, key.shard_id, peer, ReplicaState::DEAD});
}

// ============================================================================
// INSPECTION
// ============================================================================

std::shared_ptr<ShardReplicaSet> ShardManager::replicaSet(const ShardKey& key) const {
    std::lock_guard<std::mutex> lock(sets_mutex_);
    auto it = sets_.find(key);
    return it == sets_.end() ? nullptr : it->second;
}

std::vector<ShardKey> ShardManager::hostedShards() const {
    std::lock_guard<std::mutex> lock(sets_mutex_);
    std::vector<ShardKey> keys;
    for (const auto& [key, set] : sets_) {
        keys.push_back(key);
    }
    return keys;
}

std::vector<TransferStatus> ShardManager::transferStatus() const {
    std::lock_guard<std::mutex> lock(drivers_mutex_);
    std::vector<TransferStatus> status;
    for (const auto& [key, driver] : drivers_) {
        status.push_back(TransferStatus{driver->transfer(), driver->phase(), driver->attempts()});
    }
    return status;
}

}  // namespace VectorCluster
