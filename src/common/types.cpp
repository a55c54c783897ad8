#include <vectorcluster/common/types.hpp>

namespace VectorCluster {

const char* toString(PeerRole role) {
    switch (role) {
        case PeerRole::VOTER:   return "Voter";
        case PeerRole::LEARNER: return "Learner";
    }
    return "Unknown";
}

const char* toString(ReplicaState state) {
    switch (state) {
        case ReplicaState::ACTIVE:       return "Active";
        case ReplicaState::INITIALIZING: return "Initializing";
        case ReplicaState::DEAD:         return "Dead";
    }
    return "Unknown";
}

const char* toString(ReplicaHealth health) {
    switch (health) {
        case ReplicaHealth::ACTIVE:    return "Active";
        case ReplicaHealth::DEAD:      return "Dead";
        case ReplicaHealth::RESYNCING: return "Resyncing";
    }
    return "Unknown";
}

const char* toString(UpdateStatus status) {
    switch (status) {
        case UpdateStatus::ACKNOWLEDGED: return "Acknowledged";
        case UpdateStatus::COMPLETED:    return "Completed";
    }
    return "Unknown";
}

}  // namespace VectorCluster
