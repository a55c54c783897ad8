#include <vectorcluster/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <set>
#include <stdexcept>

namespace {

// Missing keys keep the default; present keys must convert
template <typename T>
void readField(const YAML::Node& section, const std::string& section_name, const char* key, T& out) {
    const YAML::Node node = section[key];
    if (!node) {
        return;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::Exception& e) {
        const std::string field = section_name.empty() ? key : section_name + "." + key;
        throw std::runtime_error("Invalid type for field '" + field + "': " + e.what());
    }
}

YAML::Node section(const YAML::Node& root, const char* name) {
    const YAML::Node node = root[name];
    if (node && !node.IsMap()) {
        throw std::runtime_error(std::string("Config section '") + name + "' must be a mapping");
    }
    return node;
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::runtime_error("Invalid configuration: " + message);
    }
}

void loadNode(const YAML::Node& root, AppConfig::NodeConfig& node) {
    const YAML::Node yaml = section(root, "node");
    if (!yaml || !yaml["peer_id"]) {
        throw std::runtime_error("Missing required field 'node.peer_id'");
    }
    readField(yaml, "node", "peer_id", node.peer_id);
    readField(yaml, "node", "host", node.host);
    readField(yaml, "node", "port", node.port);
    readField(yaml, "node", "data_dir", node.data_dir);
    readField(yaml, "node", "bootstrap", node.bootstrap);

    const YAML::Node peers = yaml["peers"];
    if (peers) {
        if (!peers.IsSequence()) {
            throw std::runtime_error("Invalid type for field 'node.peers': expected a list");
        }
        for (size_t i = 0; i < peers.size(); ++i) {
            const std::string name = "node.peers[" + std::to_string(i) + "]";
            AppConfig::PeerEndpoint endpoint;
            if (!peers[i]["peer_id"]) {
                throw std::runtime_error("Missing required field '" + name + ".peer_id'");
            }
            readField(peers[i], name, "peer_id", endpoint.peer_id);
            readField(peers[i], name, "host", endpoint.host);
            readField(peers[i], name, "port", endpoint.port);
            require(endpoint.peer_id > 0, name + ".peer_id must be positive");
            require(endpoint.port > 0, name + ".port must be positive");
            node.peers.push_back(endpoint);
        }
    }

    require(node.peer_id > 0, "node.peer_id must be positive");
    require(node.port > 0, "node.port must be positive");
}

void loadConsensus(const YAML::Node& root, AppConfig::ConsensusConfig& consensus) {
    const YAML::Node yaml = section(root, "consensus");
    if (yaml) {
        readField(yaml, "consensus", "tick_interval_ms", consensus.tick_interval_ms);
        readField(yaml, "consensus", "election_timeout_min_ticks", consensus.election_timeout_min_ticks);
        readField(yaml, "consensus", "election_timeout_max_ticks", consensus.election_timeout_max_ticks);
        readField(yaml, "consensus", "heartbeat_interval_ticks", consensus.heartbeat_interval_ticks);
        readField(yaml, "consensus", "snapshot_threshold", consensus.snapshot_threshold);
        readField(yaml, "consensus", "max_entries_per_message", consensus.max_entries_per_message);
        readField(yaml, "consensus", "propose_timeout_ms", consensus.propose_timeout_ms);
    }

    require(consensus.tick_interval_ms > 0, "consensus.tick_interval_ms must be positive");
    require(consensus.election_timeout_min_ticks > 0, "consensus.election_timeout_min_ticks must be positive");
    require(consensus.election_timeout_max_ticks > consensus.election_timeout_min_ticks,
            "consensus.election_timeout_max_ticks must exceed election_timeout_min_ticks");
    require(consensus.heartbeat_interval_ticks > 0 &&
            consensus.heartbeat_interval_ticks < consensus.election_timeout_min_ticks,
            "consensus.heartbeat_interval_ticks must be in [1, election_timeout_min_ticks)");
    require(consensus.max_entries_per_message > 0, "consensus.max_entries_per_message must be positive");
    require(consensus.propose_timeout_ms > 0, "consensus.propose_timeout_ms must be positive");
}

void loadReplication(const YAML::Node& root, AppConfig::ReplicationConfig& replication) {
    const YAML::Node yaml = section(root, "replication");
    if (yaml) {
        readField(yaml, "replication", "forward_timeout_ms", replication.forward_timeout_ms);
        readField(yaml, "replication", "health_probe_interval_ms", replication.health_probe_interval_ms);
        readField(yaml, "replication", "oplog_retention", replication.oplog_retention);
        readField(yaml, "replication", "transfer_max_attempts", replication.transfer_max_attempts);
        readField(yaml, "replication", "worker_threads", replication.worker_threads);
        readField(yaml, "replication", "default_replication_factor", replication.default_replication_factor);
        readField(yaml, "replication", "default_write_consistency_factor",
                  replication.default_write_consistency_factor);
    }

    require(replication.forward_timeout_ms > 0, "replication.forward_timeout_ms must be positive");
    require(replication.health_probe_interval_ms > 0, "replication.health_probe_interval_ms must be positive");
    require(replication.transfer_max_attempts > 0, "replication.transfer_max_attempts must be positive");
    require(replication.worker_threads > 0, "replication.worker_threads must be positive");
    require(replication.default_replication_factor > 0, "replication.default_replication_factor must be positive");
    require(replication.default_write_consistency_factor > 0 &&
            replication.default_write_consistency_factor <= replication.default_replication_factor,
            "replication.default_write_consistency_factor must be in [1, default_replication_factor]");
}

void loadLogging(const YAML::Node& root, AppConfig::LoggingConfig& logging) {
    const YAML::Node yaml = section(root, "logging");
    if (yaml) {
        readField(yaml, "logging", "level", logging.level);
        readField(yaml, "logging", "pattern", logging.pattern);
    }
    static const std::set<std::string> levels = {"trace", "debug", "info", "warn", "warning",
                                                 "err", "error", "critical", "off"};
    require(levels.count(logging.level) > 0, "logging.level '" + logging.level + "' is not a log level");
}

}  // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw std::runtime_error("Cannot open config file: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw std::runtime_error("Malformed config file " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " must contain a mapping");
    }

    AppConfig::AppConfiguration config;
    readField(root, "", "app_name", config.app_name);
    readField(root, "", "version", config.version);
    loadNode(root, config.node);
    loadConsensus(root, config.consensus);
    loadReplication(root, config.replication);
    loadLogging(root, config.logging);

    spdlog::debug("Config {} loaded: peer {} at {}:{}, {} seed peers", filepath, config.node.peer_id,
                  config.node.host, config.node.port, config.node.peers.size());
    return config;
}
