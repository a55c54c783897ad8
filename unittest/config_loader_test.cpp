// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading, validation and the mapping onto
// node options
// ============================================================================

#include <gtest/gtest.h>
#include <vectorcluster/config/app_config.hpp>
#include <vectorcluster/config/loader.hpp>
#include <vectorcluster/node/cluster_node.hpp>

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    // Verify basic app info
    EXPECT_EQ(config.app_name, "VectorCluster");
    EXPECT_EQ(config.version, "1.0.0");

    // Verify node identity and seeds
    EXPECT_EQ(config.node.peer_id, 1u);
    EXPECT_EQ(config.node.host, "127.0.0.1");
    EXPECT_EQ(config.node.port, 7101);
    EXPECT_TRUE(config.node.bootstrap);
    ASSERT_EQ(config.node.peers.size(), 2u);
    EXPECT_EQ(config.node.peers[0].peer_id, 2u);
    EXPECT_EQ(config.node.peers[1].port, 7103);

    // Verify consensus and replication
    EXPECT_EQ(config.consensus.tick_interval_ms, 100u);
    EXPECT_EQ(config.consensus.election_timeout_min_ticks, 10u);
    EXPECT_EQ(config.consensus.election_timeout_max_ticks, 20u);
    EXPECT_EQ(config.replication.default_replication_factor, 3u);
    EXPECT_EQ(config.replication.default_write_consistency_factor, 1u);
    EXPECT_EQ(config.logging.level, "info");
}

TEST(ConfigLoader, MapsOntoNodeOptions) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");
    VectorCluster::NodeOptions options = VectorCluster::makeNodeOptions(config);

    EXPECT_EQ(options.peer_id, 1u);
    EXPECT_EQ(options.address, "127.0.0.1:7101");
    EXPECT_TRUE(options.bootstrap);
    ASSERT_EQ(options.seed_peers.size(), 2u);
    EXPECT_EQ(options.seed_peers.at(2), "127.0.0.1:7102");
    EXPECT_EQ(options.tick_interval, std::chrono::milliseconds(100));
    EXPECT_EQ(options.consensus.raft.heartbeat_interval_ticks, 2u);
    EXPECT_EQ(options.shards.replication.forward_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(options.shards.default_replication_factor, 3u);
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        std::runtime_error
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    try {
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("node.peer_id"), std::string::npos);
    }
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    try {
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml");
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("consensus.tick_interval_ms"), std::string::npos);
    }
}

TEST(ConfigLoader, ThrowsOnInvalidFieldValue) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_value.yaml"),
        std::runtime_error
    );
}
