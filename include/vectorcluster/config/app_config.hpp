#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace AppConfig {

struct PeerEndpoint {
    uint64_t peer_id = 0;
    std::string host = "127.0.0.1";
    uint16_t port = 0;
};

struct NodeConfig {
    uint64_t peer_id = 0;                   // Required, > 0
    std::string host = "127.0.0.1";
    uint16_t port = 7100;
    std::string data_dir = "./data";
    bool bootstrap = false;                 // Start a new cluster when there is no state
    std::vector<PeerEndpoint> peers;        // Seeds contacted before the topology knows them
};

struct ConsensusConfig {
    uint32_t tick_interval_ms = 100;
    uint32_t election_timeout_min_ticks = 10;
    uint32_t election_timeout_max_ticks = 20;
    uint32_t heartbeat_interval_ticks = 2;
    uint64_t snapshot_threshold = 1000;
    uint32_t max_entries_per_message = 64;
    uint32_t propose_timeout_ms = 5000;
};

struct ReplicationConfig {
    uint32_t forward_timeout_ms = 1000;
    uint32_t health_probe_interval_ms = 1000;
    uint32_t oplog_retention = 1000;
    uint32_t transfer_max_attempts = 10;
    uint32_t worker_threads = 4;
    uint32_t default_replication_factor = 1;
    uint32_t default_write_consistency_factor = 1;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

struct AppConfiguration {
    std::string app_name = "VectorCluster";
    std::string version = "1.0.0";
    NodeConfig node;
    ConsensusConfig consensus;
    ReplicationConfig replication;
    LoggingConfig logging;
};

}  // namespace AppConfig
