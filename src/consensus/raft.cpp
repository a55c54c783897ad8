// ============================================================================
// RAFT CONSENSUS IMPLEMENTATION
// ============================================================================
// Elections with randomized timeouts and check-quorum, log replication with
// conflict truncation, snapshots for lagging followers, and membership taken
// from the applied topology. Safety over liveness: when in doubt a node steps
// down rather than keep committing.
// ============================================================================

#include <vectorcluster/consensus/raft.hpp>
#include <vectorcluster/consensus/command.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <limits>

namespace VectorCluster {

const char* toString(RaftState state) {
    switch (state) {
        case RaftState::FOLLOWER:  return "FOLLOWER";
        case RaftState::CANDIDATE: return "CANDIDATE";
        case RaftState::LEADER:    return "LEADER";
    }
    return "UNKNOWN";
}

// ============================================================================
// RAFT NODE IMPLEMENTATION
// ============================================================================

RaftNode::RaftNode(RaftConfig config, ConsensusStorage* storage)
    : config_(config), storage_(storage) {
    if (config_.election_timeout_max_ticks <= config_.election_timeout_min_ticks) {
        config_.election_timeout_max_ticks = config_.election_timeout_min_ticks + 1;
    }
    uint64_t seed = config_.seed;
    if (seed == 0) {
        std::random_device rd;
        seed = (static_cast<uint64_t>(rd()) << 32) ^ rd() ^ config_.id;
    }
    rng_.seed(seed);

    if (storage_) {
        restoreFromStorage();
    }
    resetElectionTimer();

    spdlog::info("[Raft:{}] Initialized as FOLLOWER, term={}, last_index={}, voters={}",
                 config_.id, term_, log_.lastIndex(), voters_.size());
}

bool RaftNode::bootstrap(std::vector<uint8_t> data) {
    if (log_.lastIndex() != 0 || term_ != 0) {
        return false;
    }

    snapshot_meta_ = SnapshotMeta{1, 1, {config_.id}, {}};
    snapshot_data_ = std::move(data);
    log_.resetToSnapshot(1, 1);
    term_ = 1;
    commit_ = 1;
    applied_ = 1;
    voters_ = {config_.id};
    learners_.clear();

    if (storage_) {
        storage_->saveSnapshot(snapshot_meta_, snapshot_data_);
        storage_->rewriteLog(log_.entries());
        persistHardState();
    }
    pending_snapshot_ = std::make_pair(snapshot_meta_, snapshot_data_);

    spdlog::info("[Raft:{}] Bootstrapped single-voter cluster", config_.id);
    return true;
}

// ============================================================================
// TIMING
// ============================================================================

void RaftNode::tick() {
    election_elapsed_++;

    if (state_ == RaftState::LEADER) {
        heartbeat_elapsed_++;
        for (auto& [peer, pr] : progress_) {
            if (pr.snapshot_wait_ticks > 0) {
                pr.snapshot_wait_ticks--;
            }
        }

        if (config_.check_quorum && election_elapsed_ >= config_.election_timeout_min_ticks) {
            election_elapsed_ = 0;
            if (!checkQuorumActive()) {
                spdlog::warn("[Raft:{}] Lost contact with a majority of voters, stepping down at term {}",
                             config_.id, term_);
                becomeFollower(term_, NO_PEER);
                return;
            }
        }

        if (heartbeat_elapsed_ >= config_.heartbeat_interval_ticks) {
            heartbeat_elapsed_ = 0;
            broadcastAppend();
        }
        return;
    }

    if (isVoter() && election_elapsed_ >= randomized_timeout_) {
        campaign();
    }
}

void RaftNode::resetElectionTimer() {
    election_elapsed_ = 0;
    heartbeat_elapsed_ = 0;
    std::uniform_int_distribution<uint32_t> dist(config_.election_timeout_min_ticks,
                                                 config_.election_timeout_max_ticks - 1);
    randomized_timeout_ = dist(rng_);
}

bool RaftNode::checkQuorumActive() {
    size_t active = isVoter() ? 1 : 0;
    for (auto& [peer, pr] : progress_) {
        if (pr.recent_active && voters_.count(peer)) {
            active++;
        }
        pr.recent_active = false;
    }
    return active >= quorum();
}

// ============================================================================
// ROLE TRANSITIONS
// ============================================================================

void RaftNode::campaign() {
    if (!isVoter()) {
        spdlog::debug("[Raft:{}] Not a voter, ignoring campaign", config_.id);
        return;
    }
    if (state_ == RaftState::LEADER) {
        return;
    }

    becomeCandidate();
    size_t granted = std::count_if(votes_.begin(), votes_.end(), [](const auto& v) { return v.second; });
    if (granted >= quorum()) {
        becomeLeader();
        return;
    }

    for (PeerId voter : voters_) {
        if (voter == config_.id) {
            continue;
        }
        RaftMessage m;
        m.type = MessageType::REQUEST_VOTE;
        m.to = voter;
        m.term = term_;
        m.last_log_index = log_.lastIndex();
        m.last_log_term = log_.lastTerm();
        send(std::move(m));
    }
}

void RaftNode::becomeCandidate() {
    term_++;
    state_ = RaftState::CANDIDATE;
    leader_ = NO_PEER;
    voted_for_ = config_.id;
    votes_.clear();
    votes_[config_.id] = true;
    progress_.clear();
    resetElectionTimer();
    persistHardState();

    spdlog::info("[Raft:{}] Became CANDIDATE at term {}", config_.id, term_);
}

void RaftNode::becomeFollower(uint64_t term, PeerId leader) {
    const RaftState old_state = state_;
    const uint64_t old_term = term_;

    if (term > term_) {
        term_ = term;
        voted_for_ = NO_PEER;
        persistHardState();
    }
    state_ = RaftState::FOLLOWER;
    leader_ = leader;
    votes_.clear();
    progress_.clear();
    resetElectionTimer();

    if (old_state != RaftState::FOLLOWER || old_term != term_) {
        spdlog::info("[Raft:{}] Became FOLLOWER at term {} (from term {})", config_.id, term_, old_term);
    }
}

void RaftNode::becomeLeader() {
    state_ = RaftState::LEADER;
    leader_ = config_.id;
    votes_.clear();
    progress_.clear();
    syncProgress();
    resetElectionTimer();

    spdlog::info("[Raft:{}] Became LEADER at term {}", config_.id, term_);

    // Committing an entry of the new term commits every earlier entry
    LogEntry noop;
    noop.term = term_;
    noop.index = log_.lastIndex() + 1;
    noop.type = LogEntry::Type::EMPTY;
    log_.append(noop);
    persistAppend({noop});

    // Membership is only known once everything before the no-op is applied
    pending_conf_index_ = log_.lastIndex();

    maybeCommit();
    broadcastAppend();
}

// ============================================================================
// PUBLIC API
// ============================================================================

ProposalPosition RaftNode::propose(std::vector<uint8_t> data) {
    if (state_ != RaftState::LEADER) {
        throw NotLeaderError(getLeaderId());
    }

    const bool membership = isMembershipCommand(data);
    if (membership && pending_conf_index_ > applied_) {
        throw ConfChangeInProgressError("Membership change at index " + std::to_string(pending_conf_index_) +
                                        " is not applied yet");
    }

    LogEntry entry;
    entry.term = term_;
    entry.index = log_.lastIndex() + 1;
    entry.type = LogEntry::Type::COMMAND;
    entry.data = std::move(data);
    log_.append(entry);
    persistAppend({entry});

    if (membership) {
        pending_conf_index_ = entry.index;
    }

    spdlog::debug("[Raft:{}] Leader appended entry: index={}, term={}", config_.id, entry.index, entry.term);

    maybeCommit();
    broadcastAppend();
    return ProposalPosition{entry.index, entry.term};
}

void RaftNode::setMembership(const std::vector<PeerId>& voters, const std::vector<PeerId>& learners) {
    std::set<PeerId> new_voters(voters.begin(), voters.end());
    std::set<PeerId> new_learners(learners.begin(), learners.end());
    if (new_voters == voters_ && new_learners == learners_) {
        return;
    }

    voters_ = std::move(new_voters);
    learners_ = std::move(new_learners);
    spdlog::info("[Raft:{}] Membership changed: {} voters, {} learners", config_.id, voters_.size(), learners_.size());

    if (state_ != RaftState::LEADER) {
        return;
    }
    if (!isVoter()) {
        spdlog::info("[Raft:{}] Removed from voters, stepping down", config_.id);
        becomeFollower(term_, NO_PEER);
        return;
    }
    syncProgress();
    maybeCommit();
    broadcastAppend();
}

// ============================================================================
// MESSAGE DISPATCH
// ============================================================================

void RaftNode::step(const RaftMessage& m) {
    if (m.to != config_.id) {
        return;
    }
    if (m.type == MessageType::PROPOSE) {
        handlePropose(m);
        return;
    }

    if (m.term > term_) {
        // A follower that recently heard from a live leader ignores vote
        // requests, so a rejoining partitioned node cannot depose it
        if (m.type == MessageType::REQUEST_VOTE && config_.check_quorum &&
            leader_ != NO_PEER && election_elapsed_ < config_.election_timeout_min_ticks) {
            spdlog::debug("[Raft:{}] Ignoring vote request from {} at term {}: leader {} is alive",
                          config_.id, m.from, m.term, leader_);
            return;
        }
        const bool from_leader = m.type == MessageType::APPEND_ENTRIES ||
                                 m.type == MessageType::INSTALL_SNAPSHOT;
        becomeFollower(m.term, from_leader ? m.from : NO_PEER);
    } else if (m.term < term_) {
        if (m.type == MessageType::APPEND_ENTRIES || m.type == MessageType::INSTALL_SNAPSHOT) {
            // Tell the stale leader about the newer term
            RaftMessage resp;
            resp.type = MessageType::APPEND_ENTRIES_RESPONSE;
            resp.to = m.from;
            resp.term = term_;
            resp.success = false;
            send(std::move(resp));
        } else if (m.type == MessageType::REQUEST_VOTE) {
            RaftMessage resp;
            resp.type = MessageType::REQUEST_VOTE_RESPONSE;
            resp.to = m.from;
            resp.term = term_;
            resp.vote_granted = false;
            send(std::move(resp));
        }
        return;
    }

    switch (m.type) {
        case MessageType::REQUEST_VOTE:              handleRequestVote(m); break;
        case MessageType::REQUEST_VOTE_RESPONSE:     handleVoteResponse(m); break;
        case MessageType::APPEND_ENTRIES:            handleAppendEntries(m); break;
        case MessageType::APPEND_ENTRIES_RESPONSE:   handleAppendResponse(m); break;
        case MessageType::INSTALL_SNAPSHOT:          handleInstallSnapshot(m); break;
        case MessageType::INSTALL_SNAPSHOT_RESPONSE: handleSnapshotResponse(m); break;
        case MessageType::PROPOSE:                   break;
    }
}

// ============================================================================
// ELECTION HANDLERS
// ============================================================================

void RaftNode::handleRequestVote(const RaftMessage& m) {
    const bool can_vote = voted_for_ == m.from || (voted_for_ == NO_PEER && leader_ == NO_PEER);
    const bool granted = isVoter() && can_vote && log_.isUpToDate(m.last_log_index, m.last_log_term);

    if (granted) {
        voted_for_ = m.from;
        election_elapsed_ = 0;
        persistHardState();
        spdlog::debug("[Raft:{}] Granted vote to candidate {} in term {}", config_.id, m.from, term_);
    } else {
        spdlog::debug("[Raft:{}] Rejected vote for candidate {} in term {}", config_.id, m.from, term_);
    }

    RaftMessage resp;
    resp.type = MessageType::REQUEST_VOTE_RESPONSE;
    resp.to = m.from;
    resp.term = term_;
    resp.vote_granted = granted;
    send(std::move(resp));
}

void RaftNode::handleVoteResponse(const RaftMessage& m) {
    if (state_ != RaftState::CANDIDATE || !voters_.count(m.from)) {
        return;
    }
    votes_[m.from] = m.vote_granted;

    size_t granted = 0;
    size_t rejected = 0;
    for (const auto& [peer, vote] : votes_) {
        (vote ? granted : rejected)++;
    }

    if (granted >= quorum()) {
        becomeLeader();
    } else if (rejected >= quorum()) {
        becomeFollower(term_, NO_PEER);
    }
}

// ============================================================================
// REPLICATION HANDLERS (follower side)
// ============================================================================

void RaftNode::handleAppendEntries(const RaftMessage& m) {
    if (state_ != RaftState::FOLLOWER) {
        becomeFollower(term_, m.from);
    }
    leader_ = m.from;
    election_elapsed_ = 0;

    RaftMessage resp;
    resp.type = MessageType::APPEND_ENTRIES_RESPONSE;
    resp.to = m.from;
    resp.term = term_;

    // Everything up to commit is already known to match the leader
    if (m.prev_log_index < commit_) {
        resp.success = true;
        resp.match_index = commit_;
        send(std::move(resp));
        return;
    }

    auto prev_term = log_.termAt(m.prev_log_index);
    if (!prev_term || *prev_term != m.prev_log_term) {
        resp.success = false;
        resp.reject_hint = std::min(m.prev_log_index > 0 ? m.prev_log_index - 1 : 0, log_.lastIndex());
        spdlog::debug("[Raft:{}] Rejected append at prev={} (hint {})", config_.id, m.prev_log_index, resp.reject_hint);
        send(std::move(resp));
        return;
    }

    std::vector<LogEntry> appended;
    bool truncated = false;
    for (const auto& entry : m.entries) {
        if (entry.index <= log_.lastIndex()) {
            if (log_.termAt(entry.index) == entry.term) {
                continue;
            }
            if (entry.index <= commit_) {
                spdlog::error("[Raft:{}] Leader {} conflicts with committed entry {}", config_.id, m.from, entry.index);
                return;
            }
            spdlog::info("[Raft:{}] Truncating conflicting entries from index {}", config_.id, entry.index);
            log_.truncateFrom(entry.index);
            truncated = true;
        }
        log_.append(entry);
        appended.push_back(entry);
    }

    if (truncated) {
        persistLogRewrite();
    } else {
        persistAppend(appended);
    }

    const uint64_t last_new = m.prev_log_index + m.entries.size();
    if (m.leader_commit > commit_) {
        commit_ = std::min(m.leader_commit, last_new);
        persistHardState();
    }

    resp.success = true;
    resp.match_index = last_new;
    send(std::move(resp));
}

void RaftNode::handleInstallSnapshot(const RaftMessage& m) {
    if (state_ != RaftState::FOLLOWER) {
        becomeFollower(term_, m.from);
    }
    leader_ = m.from;
    election_elapsed_ = 0;

    RaftMessage resp;
    resp.type = MessageType::INSTALL_SNAPSHOT_RESPONSE;
    resp.to = m.from;
    resp.term = term_;
    resp.success = true;

    if (m.snapshot.index <= commit_) {
        resp.match_index = commit_;
        send(std::move(resp));
        return;
    }

    spdlog::info("[Raft:{}] Installing snapshot from {} at index {} (term {})",
                 config_.id, m.from, m.snapshot.index, m.snapshot.term);

    snapshot_meta_ = m.snapshot;
    snapshot_data_ = m.snapshot_data;
    log_.resetToSnapshot(m.snapshot.index, m.snapshot.term);
    commit_ = m.snapshot.index;
    applied_ = m.snapshot.index;
    voters_ = std::set<PeerId>(m.snapshot.voters.begin(), m.snapshot.voters.end());
    learners_ = std::set<PeerId>(m.snapshot.learners.begin(), m.snapshot.learners.end());

    if (storage_) {
        storage_->saveSnapshot(snapshot_meta_, snapshot_data_);
        storage_->rewriteLog(log_.entries());
        persistHardState();
    }
    pending_snapshot_ = std::make_pair(snapshot_meta_, snapshot_data_);

    resp.match_index = m.snapshot.index;
    send(std::move(resp));
}

// ============================================================================
// REPLICATION HANDLERS (leader side)
// ============================================================================

void RaftNode::handleAppendResponse(const RaftMessage& m) {
    if (state_ != RaftState::LEADER) {
        return;
    }
    auto it = progress_.find(m.from);
    if (it == progress_.end()) {
        return;
    }
    Progress& pr = it->second;
    pr.recent_active = true;

    if (m.success) {
        pr.match_index = std::max(pr.match_index, m.match_index);
        pr.next_index = std::max(pr.next_index, pr.match_index + 1);
        if (maybeCommit()) {
            broadcastAppend();
        } else if (pr.next_index <= log_.lastIndex()) {
            sendAppend(m.from);
        }
        return;
    }

    const uint64_t hinted = m.reject_hint + 1;
    uint64_t next = std::min(pr.next_index > 1 ? pr.next_index - 1 : 1, hinted);
    pr.next_index = std::max<uint64_t>({1, next, pr.match_index + 1});
    sendAppend(m.from);
}

void RaftNode::handleSnapshotResponse(const RaftMessage& m) {
    if (state_ != RaftState::LEADER) {
        return;
    }
    auto it = progress_.find(m.from);
    if (it == progress_.end()) {
        return;
    }
    Progress& pr = it->second;
    pr.recent_active = true;
    pr.snapshot_wait_ticks = 0;
    if (m.success) {
        pr.match_index = std::max(pr.match_index, m.match_index);
        pr.next_index = pr.match_index + 1;
        maybeCommit();
    }
    if (pr.next_index <= log_.lastIndex()) {
        sendAppend(m.from);
    }
}

void RaftNode::handlePropose(const RaftMessage& m) {
    if (state_ == RaftState::LEADER) {
        try {
            propose(m.proposal);
        } catch (const ClusterError& e) {
            spdlog::debug("[Raft:{}] Dropped forwarded proposal from {}: {}", config_.id, m.from, e.what());
        }
        return;
    }
    if (leader_ != NO_PEER && leader_ != config_.id && !m.forwarded) {
        RaftMessage fwd = m;
        fwd.to = leader_;
        fwd.forwarded = true;
        send(std::move(fwd));
        return;
    }
    spdlog::debug("[Raft:{}] Dropped proposal from {}: no known leader", config_.id, m.from);
}

void RaftNode::broadcastAppend() {
    for (const auto& [peer, pr] : progress_) {
        sendAppend(peer);
    }
}

void RaftNode::sendAppend(PeerId peer) {
    Progress& pr = progress_[peer];

    if (pr.next_index <= log_.snapshotIndex()) {
        if (pr.snapshot_wait_ticks > 0) {
            return;
        }
        RaftMessage m;
        m.type = MessageType::INSTALL_SNAPSHOT;
        m.to = peer;
        m.term = term_;
        m.snapshot = snapshot_meta_;
        m.snapshot_data = snapshot_data_;
        pr.snapshot_wait_ticks = config_.election_timeout_min_ticks;
        spdlog::debug("[Raft:{}] Sending snapshot at index {} to {}", config_.id, snapshot_meta_.index, peer);
        send(std::move(m));
        return;
    }

    RaftMessage m;
    m.type = MessageType::APPEND_ENTRIES;
    m.to = peer;
    m.term = term_;
    m.prev_log_index = pr.next_index - 1;
    m.prev_log_term = log_.termAt(m.prev_log_index).value_or(0);
    m.entries = log_.slice(pr.next_index, log_.lastIndex(), config_.max_entries_per_message);
    m.leader_commit = commit_;
    send(std::move(m));
}

bool RaftNode::maybeCommit() {
    if (voters_.empty()) {
        return false;
    }
    std::vector<uint64_t> matches;
    matches.reserve(voters_.size());
    for (PeerId voter : voters_) {
        if (voter == config_.id) {
            matches.push_back(log_.lastIndex());
            continue;
        }
        auto it = progress_.find(voter);
        matches.push_back(it == progress_.end() ? 0 : it->second.match_index);
    }
    std::sort(matches.begin(), matches.end(), std::greater<uint64_t>());
    const uint64_t candidate = matches[quorum() - 1];

    // Only entries of the current term are committed by counting replicas
    if (candidate > commit_ && log_.termAt(candidate) == term_) {
        commit_ = candidate;
        persistHardState();
        spdlog::debug("[Raft:{}] Commit index advanced to {}", config_.id, commit_);
        return true;
    }
    return false;
}

void RaftNode::syncProgress() {
    const auto targets = replicationTargets();
    for (auto it = progress_.begin(); it != progress_.end();) {
        it = targets.count(it->first) ? std::next(it) : progress_.erase(it);
    }
    for (PeerId peer : targets) {
        if (!progress_.count(peer)) {
            Progress pr;
            pr.next_index = log_.lastIndex() + 1;
            pr.recent_active = true;
            progress_[peer] = pr;
        }
    }
}

std::set<PeerId> RaftNode::replicationTargets() const {
    std::set<PeerId> targets = voters_;
    targets.insert(learners_.begin(), learners_.end());
    targets.erase(config_.id);
    return targets;
}

// ============================================================================
// READY OUTPUT
// ============================================================================

void RaftNode::send(RaftMessage message) {
    message.from = config_.id;
    outbox_.push_back(std::move(message));
}

std::vector<RaftMessage> RaftNode::takeMessages() {
    std::vector<RaftMessage> out;
    out.swap(outbox_);
    return out;
}

std::vector<LogEntry> RaftNode::takeCommittedEntries() {
    if (commit_ <= applied_) {
        return {};
    }
    auto entries = log_.slice(std::max(applied_ + 1, log_.firstIndex()), commit_,
                              std::numeric_limits<size_t>::max());
    applied_ = commit_;
    return entries;
}

std::optional<std::pair<SnapshotMeta, std::vector<uint8_t>>> RaftNode::takePendingSnapshot() {
    auto snapshot = std::move(pending_snapshot_);
    pending_snapshot_.reset();
    return snapshot;
}

void RaftNode::compact(uint64_t index, std::vector<uint8_t> data) {
    if (index <= log_.snapshotIndex() || index > applied_) {
        return;
    }
    SnapshotMeta meta;
    meta.index = index;
    meta.term = log_.termAt(index).value_or(0);
    meta.voters = getVoters();
    meta.learners = getLearners();

    log_.compact(index);
    snapshot_meta_ = std::move(meta);
    snapshot_data_ = std::move(data);

    if (storage_) {
        storage_->saveSnapshot(snapshot_meta_, snapshot_data_);
        storage_->rewriteLog(log_.entries());
    }
    spdlog::debug("[Raft:{}] Compacted log up to index {}", config_.id, index);
}

RaftNode::Stats RaftNode::getStats() const {
    return Stats{
        .log_size = log_.size(),
        .commit_index = commit_,
        .applied_index = applied_,
        .snapshot_index = log_.snapshotIndex(),
        .term = term_,
        .state = state_,
        .leader_id = getLeaderId(),
        .voters = voters_.size(),
        .learners = learners_.size()
    };
}

// ============================================================================
// PERSISTENCE
// ============================================================================

void RaftNode::restoreFromStorage() {
    PersistedConsensusState state = storage_->load();
    term_ = state.hard_state.term;
    voted_for_ = state.hard_state.voted_for;

    if (state.snapshot_meta) {
        snapshot_meta_ = *state.snapshot_meta;
        snapshot_data_ = std::move(state.snapshot_data);
        log_.resetToSnapshot(snapshot_meta_.index, snapshot_meta_.term);
        voters_ = std::set<PeerId>(snapshot_meta_.voters.begin(), snapshot_meta_.voters.end());
        learners_ = std::set<PeerId>(snapshot_meta_.learners.begin(), snapshot_meta_.learners.end());
        applied_ = snapshot_meta_.index;
        pending_snapshot_ = std::make_pair(snapshot_meta_, snapshot_data_);
    }

    for (auto& entry : state.entries) {
        if (entry.index != log_.lastIndex() + 1) {
            spdlog::warn("[Raft:{}] Ignoring persisted entries from index {} (expected {})",
                         config_.id, entry.index, log_.lastIndex() + 1);
            break;
        }
        log_.append(std::move(entry));
    }

    commit_ = std::min(std::max(state.hard_state.commit, log_.snapshotIndex()), log_.lastIndex());
}

void RaftNode::persistHardState() {
    if (storage_) {
        storage_->saveHardState(HardState{term_, voted_for_, commit_});
    }
}

void RaftNode::persistAppend(const std::vector<LogEntry>& entries) {
    if (storage_ && !entries.empty()) {
        storage_->appendEntries(entries);
    }
}

void RaftNode::persistLogRewrite() {
    if (storage_) {
        storage_->rewriteLog(log_.entries());
    }
}

}  // namespace VectorCluster
