#include <spdlog/spdlog.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <thread>
#include <chrono>
#include <memory>

#include <vectorcluster/config/loader.hpp>
#include <vectorcluster/node/cluster_node.hpp>
#include <vectorcluster/transport/tcp_transport.hpp>

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int signum) {
    spdlog::info("Signal {} received, initiating shutdown...", signum);
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("VectorCluster node v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void applyLoggingConfig(const AppConfig::LoggingConfig& logging) {
    spdlog::set_level(spdlog::level::from_str(logging.level));
    spdlog::set_pattern(logging.pattern);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    return ConfigLoader::loadConfig(configPath);
}

// ============================================================================
// Component Lifecycle
// ============================================================================

static std::unique_ptr<VectorCluster::ClusterNode> initializeNode(const AppConfig::AppConfiguration& config) {
    const int port = config.node.port;
    auto makeTransport = [port](VectorCluster::PeerId self, VectorCluster::RpcHandler& handler) {
        return std::make_unique<VectorCluster::TcpTransport>(self, port, handler);
    };
    return std::make_unique<VectorCluster::ClusterNode>(VectorCluster::makeNodeOptions(config), makeTransport);
}

static void logStatus(const VectorCluster::ClusterNode& node) {
    const auto status = node.clusterStatus();
    spdlog::info("Peer {}: {} term={} commit={} applied={} leader={} peers={} send_failures={}",
                 status.peer_id, VectorCluster::toString(status.role), status.term, status.commit,
                 status.applied, status.leader ? std::to_string(*status.leader) : "none", status.peers,
                 status.message_send_failures);
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        // Load configuration
        auto config = loadConfiguration(argc, argv);
        applyLoggingConfig(config.logging);
        spdlog::info("Configuration loaded successfully");

        auto node = initializeNode(config);
        node->start();

        spdlog::info("{} peer {} running on {}:{}. Press Ctrl+C to shutdown.",
                     config.app_name, config.node.peer_id, config.node.host, config.node.port);

        // Main loop
        int iterations = 0;
        while (g_running.load(std::memory_order_acquire)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
            if (++iterations % 20 == 0) {
                logStatus(*node);
            }
        }

        // Graceful shutdown
        spdlog::info("=== SHUTDOWN SEQUENCE ===");
        node->stop();
        spdlog::info("=== SHUTDOWN COMPLETE ===");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("VectorCluster node terminated gracefully");
    return EXIT_SUCCESS;
}
