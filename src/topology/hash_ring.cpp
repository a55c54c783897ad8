#include <vectorcluster/topology/hash_ring.hpp>
#include <algorithm>

namespace VectorCluster {

std::pair<HashRange, HashRange> HashRange::split() const {
    uint64_t mid = first + (last - first) / 2;
    return {HashRange{first, mid}, HashRange{mid + 1, last}};
}

uint64_t routingHash(uint64_t routing_key) {
    // splitmix64 finalizer
    uint64_t z = routing_key + 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31);
}

std::vector<HashRange> uniformRanges(uint32_t shard_count) {
    std::vector<HashRange> ranges;
    if (shard_count == 0) {
        return ranges;
    }
    ranges.reserve(shard_count);

    const uint64_t step = std::numeric_limits<uint64_t>::max() / shard_count;
    for (uint32_t i = 0; i < shard_count; ++i) {
        HashRange range;
        range.first = static_cast<uint64_t>(i) * step;
        range.last = (i + 1 == shard_count)
            ? std::numeric_limits<uint64_t>::max()
            : static_cast<uint64_t>(i + 1) * step - 1;
        ranges.push_back(range);
    }
    return ranges;
}

ShardDistribution proposeDistribution(uint32_t shard_count,
                                      uint32_t replication_factor,
                                      const std::vector<PeerId>& peers,
                                      const std::map<PeerId, size_t>& current_load) {
    ShardDistribution distribution;
    if (peers.empty()) {
        return distribution;
    }

    std::map<PeerId, size_t> load;
    for (PeerId peer : peers) {
        auto it = current_load.find(peer);
        load[peer] = (it == current_load.end()) ? 0 : it->second;
    }

    const size_t replicas = std::min<size_t>(replication_factor, peers.size());
    for (ShardId shard = 0; shard < shard_count; ++shard) {
        std::vector<std::pair<size_t, PeerId>> candidates;
        candidates.reserve(load.size());
        for (const auto& [peer, count] : load) {
            candidates.emplace_back(count, peer);
        }
        std::sort(candidates.begin(), candidates.end());

        auto& assigned = distribution[shard];
        for (size_t r = 0; r < replicas; ++r) {
            PeerId peer = candidates[r].second;
            assigned.push_back(peer);
            load[peer]++;
        }
        std::sort(assigned.begin(), assigned.end());
    }
    return distribution;
}

}  // namespace VectorCluster
