#pragma once

#include <vectorcluster/topology/topology.hpp>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>

namespace VectorCluster {

/**
 * @class TopologyRegistry
 * @brief Publishes the topology derived from applied consensus entries.
 *
 * Writers are the consensus apply path only. Readers take a shared_ptr to an
 * immutable Topology and never observe a half-applied entry.
 */
class TopologyRegistry {
public:
    TopologyRegistry();

    std::shared_ptr<const Topology> current() const;
    uint64_t appliedIndex() const;

    /**
     * @brief Apply a committed command at (index, term).
     *
     * A command rejected by the topology rules (BadRequest / NotFound) still
     * consumes its index: the topology stays unchanged and the error is
     * returned for the proposer. Any other exception propagates.
     *
     * @return nullptr on success, the user error otherwise
     */
    std::exception_ptr apply(uint64_t index, uint64_t term, const MetadataCommand& command);

    // Consume an entry without a command (leader no-op)
    void advance(uint64_t index, uint64_t term);

    // Replace everything with a snapshot
    void restore(Topology topology);

    /**
     * @brief Block until applied index >= index or timeout.
     * @return true if the index was reached
     */
    bool waitForApplied(uint64_t index, std::chrono::milliseconds timeout) const;

private:
    void publish(std::shared_ptr<const Topology> next);

    mutable std::mutex mutex_;
    mutable std::condition_variable applied_cv_;
    std::shared_ptr<const Topology> current_;
};

}  // namespace VectorCluster
