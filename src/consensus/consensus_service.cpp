#include <vectorcluster/consensus/consensus_service.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <limits>
#include <random>
#include <set>

namespace VectorCluster {

ConsensusService::ConsensusService(ConsensusOptions options, TopologyRegistry& registry, Transport& transport)
    : options_(std::move(options)), registry_(registry), transport_(transport) {}

ConsensusService::~ConsensusService() {
    failPendingUpTo(std::numeric_limits<uint64_t>::max());
}

void ConsensusService::setApplyCallback(ApplyCallback callback) {
    apply_callback_ = std::move(callback);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void ConsensusService::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!options_.data_dir.empty()) {
            storage_ = std::make_unique<ConsensusStorage>(options_.data_dir);
        }
        raft_ = std::make_unique<RaftNode>(options_.raft, storage_.get());
        replay_until_ = storage_ ? storage_->appliedIndex() : 0;

        if (options_.bootstrap) {
            Topology initial = Topology::bootstrap(options_.raft.id, options_.self_address);
            if (raft_->bootstrap(initial.encode())) {
                spdlog::info("[Consensus:{}] Bootstrapped new cluster at {}", options_.raft.id, options_.self_address);
            } else {
                spdlog::info("[Consensus:{}] Existing state found, bootstrap skipped", options_.raft.id);
            }
        }
        started_ = true;
    }

    processReady();
    spdlog::info("[Consensus:{}] Started: term={}, applied={}, replayed up to {}",
                 options_.raft.id, status().term, registry_.appliedIndex(), replay_until_);
}

void ConsensusService::tick() {
    if (!started_ || failed_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raft_->tick();
    }
    processReady();
}

void ConsensusService::handleMessage(const RaftMessage& message) {
    if (!started_ || failed_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raft_->step(message);
    }
    processReady();
}

void ConsensusService::campaign() {
    if (!started_ || failed_) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raft_->campaign();
    }
    processReady();
}

// ============================================================================
// PROPOSALS
// ============================================================================

uint64_t ConsensusService::propose(const MetadataCommand& command,
                                   std::optional<std::chrono::milliseconds> timeout,
                                   bool with_confirmation) {
    if (failed_) {
        throw ServiceError("Consensus stopped after an apply failure");
    }
    if (!started_) {
        throw ServiceError("Consensus not started");
    }

    const auto wait_for = timeout.value_or(options_.propose_timeout);
    ProposalPosition position;
    std::future<void> applied;
    std::vector<RaftMessage> messages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        position = raft_->propose(encodeCommand(command));
        {
            std::lock_guard<std::mutex> pending_lock(pending_mutex_);
            PendingProposal& pending = pending_[position.index];
            pending.term = position.term;
            applied = pending.promise.get_future();
        }
        messages = raft_->takeMessages();
    }
    sendAll(messages);

    spdlog::debug("[Consensus:{}] Proposed {} at index {} (term {})",
                  options_.raft.id, commandName(command), position.index, position.term);

    if (applied.wait_for(wait_for) != std::future_status::ready) {
        {
            std::lock_guard<std::mutex> pending_lock(pending_mutex_);
            pending_.erase(position.index);
        }
        throw TimeoutError(std::string(commandName(command)) + " at index " + std::to_string(position.index) +
                           " not applied within " + std::to_string(wait_for.count()) + "ms");
    }
    applied.get();

    if (with_confirmation) {
        std::random_device rd;
        propose(Nop{(static_cast<uint64_t>(rd()) << 32) | rd()}, wait_for, false);
    }
    return position.index;
}

void ConsensusService::proposeAsync(const MetadataCommand& command) {
    if (!started_ || failed_) {
        return;
    }

    std::vector<RaftMessage> messages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto data = encodeCommand(command);
        if (raft_->isLeader()) {
            try {
                raft_->propose(std::move(data));
            } catch (const ConfChangeInProgressError& e) {
                spdlog::debug("[Consensus:{}] Deferred {}: {}", options_.raft.id, commandName(command), e.what());
            }
            messages = raft_->takeMessages();
        } else {
            std::set<PeerId> targets;
            if (auto leader = raft_->getLeaderId()) {
                targets.insert(*leader);
            } else {
                for (const auto& [peer, info] : registry_.current()->peers) {
                    targets.insert(peer);
                }
                targets.insert(options_.seed_peers.begin(), options_.seed_peers.end());
            }
            targets.erase(options_.raft.id);

            for (PeerId target : targets) {
                RaftMessage m;
                m.type = MessageType::PROPOSE;
                m.from = options_.raft.id;
                m.to = target;
                m.proposal = data;
                messages.push_back(std::move(m));
            }
            if (targets.empty()) {
                spdlog::debug("[Consensus:{}] No peer to relay {} to", options_.raft.id, commandName(command));
            }
        }
    }
    sendAll(messages);
}

// ============================================================================
// APPLY PATH
// ============================================================================

void ConsensusService::processReady() {
    std::lock_guard<std::mutex> apply_lock(apply_mutex_);
    if (failed_) {
        return;
    }

    std::optional<std::pair<SnapshotMeta, std::vector<uint8_t>>> snapshot;
    std::vector<LogEntry> entries;
    std::vector<RaftMessage> messages;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        snapshot = raft_->takePendingSnapshot();
        entries = raft_->takeCommittedEntries();
        messages = raft_->takeMessages();
    }
    sendAll(messages);

    try {
        if (snapshot) {
            Topology restored = Topology::decode(snapshot->second);
            registry_.restore(std::move(restored));
            failPendingUpTo(snapshot->first.index);
            if (storage_ && snapshot->first.index > storage_->appliedIndex()) {
                storage_->saveApplied(snapshot->first.index);
            }
        }
        for (const auto& entry : entries) {
            applyEntry(entry);
        }
    } catch (const std::exception& e) {
        failed_ = true;
        spdlog::error("[Consensus:{}] Apply failed, consensus stopped on this node: {}", options_.raft.id, e.what());
        failPendingUpTo(std::numeric_limits<uint64_t>::max());
        return;
    }

    if (!snapshot && entries.empty()) {
        return;
    }

    auto topology = registry_.current();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        raft_->setMembership(topology->voters(), topology->learners());

        const uint64_t applied = topology->applied_index;
        if (options_.snapshot_threshold > 0 && applied >= raft_->getSnapshotIndex() + options_.snapshot_threshold) {
            raft_->compact(applied, topology->encode());
            spdlog::info("[Consensus:{}] Snapshot taken at index {}", options_.raft.id, applied);
        }
        messages = raft_->takeMessages();
    }
    sendAll(messages);
}

void ConsensusService::applyEntry(const LogEntry& entry) {
    if (entry.index <= registry_.appliedIndex()) {
        return;
    }

    if (entry.type == LogEntry::Type::EMPTY) {
        registry_.advance(entry.index, entry.term);
        resolvePending(entry.index, entry.term, nullptr);
    } else {
        MetadataCommand command;
        try {
            command = decodeCommand(entry.data);
        } catch (const std::runtime_error& e) {
            throw ServiceError("Undecodable entry at index " + std::to_string(entry.index) + ": " + e.what());
        }

        std::exception_ptr user_error = registry_.apply(entry.index, entry.term, command);
        if (entry.index > replay_until_) {
            if (apply_callback_) {
                apply_callback_(entry.index, command, user_error);
            }
            resolvePending(entry.index, entry.term, user_error);
        }
    }

    if (storage_ && entry.index > replay_until_) {
        storage_->saveApplied(entry.index);
    }
}

void ConsensusService::resolvePending(uint64_t index, uint64_t term, std::exception_ptr error) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto it = pending_.begin(); it != pending_.end() && it->first <= index;) {
        if (it->first == index && it->second.term == term) {
            if (error) {
                it->second.promise.set_exception(error);
            } else {
                it->second.promise.set_value();
            }
        } else {
            // Overwritten by a later leader: the proposal may or may not be re-proposed
            it->second.promise.set_exception(std::make_exception_ptr(
                TimeoutError("Entry at index " + std::to_string(it->first) + " was replaced by another leader")));
        }
        it = pending_.erase(it);
    }
}

void ConsensusService::failPendingUpTo(uint64_t index) {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    for (auto it = pending_.begin(); it != pending_.end() && it->first <= index;) {
        it->second.promise.set_exception(std::make_exception_ptr(
            TimeoutError("Outcome of entry " + std::to_string(it->first) + " unknown")));
        it = pending_.erase(it);
    }
}

void ConsensusService::sendAll(const std::vector<RaftMessage>& messages) {
    for (const auto& message : messages) {
        transport_.send(message);
    }
}

// ============================================================================
// QUERIES
// ============================================================================

bool ConsensusService::isLeader() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raft_ && raft_->isLeader();
}

std::optional<PeerId> ConsensusService::leaderId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return raft_ ? raft_->getLeaderId() : std::nullopt;
}

ClusterStatus ConsensusService::status() const {
    ClusterStatus status;
    status.peer_id = options_.raft.id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (raft_) {
            auto stats = raft_->getStats();
            status.role = stats.state;
            status.term = stats.term;
            status.commit = stats.commit_index;
            status.leader = stats.leader_id;
            status.is_voter = raft_->isVoter();
        }
    }
    status.applied = registry_.appliedIndex();
    status.peers = registry_.current()->peers.size();
    {
        std::lock_guard<std::mutex> lock(pending_mutex_);
        status.pending_operations = pending_.size();
    }
    status.message_send_failures = transport_.sendFailures();
    return status;
}

}  // namespace VectorCluster
