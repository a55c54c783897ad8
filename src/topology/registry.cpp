#include <vectorcluster/topology/registry.hpp>
#include <vectorcluster/common/errors.hpp>
#include <spdlog/spdlog.h>

namespace VectorCluster {

TopologyRegistry::TopologyRegistry()
    : current_(std::make_shared<const Topology>()) {}

std::shared_ptr<const Topology> TopologyRegistry::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

uint64_t TopologyRegistry::appliedIndex() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_->applied_index;
}

std::exception_ptr TopologyRegistry::apply(uint64_t index, uint64_t term,
                                           const MetadataCommand& command) {
    // Only the apply path writes, so reading without holding the lock across
    // the transition is safe
    auto base = current();
    std::exception_ptr user_error;

    std::shared_ptr<Topology> next;
    try {
        next = std::make_shared<Topology>(base->applyCommand(command));
    } catch (const BadRequestError& e) {
        spdlog::warn("[Topology] Entry {} ({}) rejected: {}", index, commandName(command), e.what());
        user_error = std::current_exception();
    } catch (const NotFoundError& e) {
        spdlog::warn("[Topology] Entry {} ({}) rejected: {}", index, commandName(command), e.what());
        user_error = std::current_exception();
    }

    if (!next) {
        next = std::make_shared<Topology>(*base);
    } else {
        spdlog::debug("[Topology] Applied entry {} ({})", index, commandName(command));
    }
    next->applied_index = index;
    next->applied_term = term;
    publish(std::move(next));
    return user_error;
}

void TopologyRegistry::advance(uint64_t index, uint64_t term) {
    auto next = std::make_shared<Topology>(*current());
    next->applied_index = index;
    next->applied_term = term;
    publish(std::move(next));
}

void TopologyRegistry::restore(Topology topology) {
    spdlog::info("[Topology] Restored snapshot at index {} ({} peers, {} collections)",
                 topology.applied_index, topology.peers.size(), topology.collections.size());
    publish(std::make_shared<const Topology>(std::move(topology)));
}

bool TopologyRegistry::waitForApplied(uint64_t index, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return applied_cv_.wait_for(lock, timeout, [&] { return current_->applied_index >= index; });
}

void TopologyRegistry::publish(std::shared_ptr<const Topology> next) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(next);
    }
    applied_cv_.notify_all();
}

}  // namespace VectorCluster
