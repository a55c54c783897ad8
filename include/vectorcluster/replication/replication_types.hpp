#pragma once

#include <vectorcluster/common/types.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace VectorCluster {

enum class ApplyOutcome : uint8_t {
    APPLIED = 0,
    DUPLICATE = 1,      // id <= last applied, nothing done
    GAP = 2             // id > last applied + 1, caller must fill the gap first
};

const char* toString(ApplyOutcome outcome);

/**
 * @brief Result of offering one operation to a replica.
 */
struct ApplyResult {
    ApplyOutcome outcome = ApplyOutcome::APPLIED;
    OperationId last_applied = 0;
    std::string storage_error;      // Non-empty if storage rejected the payload

    bool ok() const { return outcome != ApplyOutcome::GAP; }
};

/**
 * @brief Outcome of a shard submission.
 *
 * A partial failure is not an exception: the best-known status is returned
 * together with the replicas that could not be reached.
 */
struct UpdateResult {
    OperationId operation_id = 0;
    UpdateStatus status = UpdateStatus::ACKNOWLEDGED;
    std::vector<PeerId> failed_peers;

    bool isPartialFailure() const { return !failed_peers.empty(); }
};

}  // namespace VectorCluster
