#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <signal.h>
#include <string>
#include <thread>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include "gfs_common/clock.hpp"
#include "gfs_common/config.hpp"
#include "gfs_master/master.hpp"
#include "gfs_master/master_service.hpp"

using grpc::Server;
using grpc::ServerBuilder;

// ============================================================================
// Configuration
// ============================================================================
const std::string DEFAULT_HOST = "0.0.0.0";
const int DEFAULT_PORT = 50050;

static std::unique_ptr<Server> g_server;
static std::atomic<bool> g_shutdown_requested(false);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down master..." << std::endl;
        g_shutdown_requested.store(true);
        if (g_server) {
            g_server->Shutdown();
        }
    }
}

// ============================================================================
// Helper: Parse command-line arguments
// ============================================================================
struct ServerConfig {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    gfs_common::GfsConfig gfs;
};

void PrintUsage() {
    std::cout << "Usage: gfs_master [options]" << std::endl
              << "Options:" << std::endl
              << "  --host <host>                  Bind address (default: 0.0.0.0)" << std::endl
              << "  --port <port>                  Server port (default: 50050)" << std::endl
              << "  --chunk-size <bytes>           Chunk capacity (default: 64 MiB)" << std::endl
              << "  --replication <n>              Replicas per chunk (default: 3)" << std::endl
              << "  --lease-timeout <seconds>      Primary lease length (default: 60)" << std::endl
              << "  --heartbeat-interval <seconds> Liveness sweep interval (default: 10)" << std::endl
              << "  --dead-threshold <seconds>     Silence before a chunkserver is dead (default: 30)" << std::endl
              << "  --help                         Show this help message" << std::endl;
}

// Returns false (after printing the reason) if the arguments are unusable
bool ParseArgs(int argc, char* argv[], ServerConfig& config, bool& show_help) {
    show_help = false;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            show_help = true;
            return true;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            return false;
        }
        std::string value = argv[++i];

        if (arg == "--host") {
            config.host = value;
        } else if (arg == "--port") {
            try {
                config.port = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "Invalid port: " << value << std::endl;
                return false;
            }
        } else {
            bool handled = false;
            auto status = gfs_common::ApplyConfigFlag(config.gfs, arg, value, handled);
            if (!handled) {
                std::cerr << "Unknown option: " << arg << std::endl;
                return false;
            }
            if (!status.ok()) {
                std::cerr << status << std::endl;
                return false;
            }
        }
    }
    return true;
}

// ============================================================================
// Helper: Print server configuration and status
// ============================================================================
void PrintServerInfo(const ServerConfig& config) {
    std::cout << "========================================" << std::endl;
    std::cout << "  GFS Master Starting" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Host: " << config.host << std::endl;
    std::cout << "Port: " << config.port << std::endl;
    std::cout << gfs_common::DescribeConfig(config.gfs);
    std::cout << "========================================" << std::endl;
}

// ============================================================================
// Main: gRPC Server Initialization and Startup
// ============================================================================
int main(int argc, char* argv[]) {
    ServerConfig config;
    bool show_help = false;
    if (!ParseArgs(argc, argv, config, show_help)) {
        PrintUsage();
        return 1;
    }
    if (show_help) {
        PrintUsage();
        return 0;
    }

    auto valid = gfs_common::ValidateConfig(config.gfs);
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid << std::endl;
        return 1;
    }
    PrintServerInfo(config);

    // ========================================================================
    // 1. Create the Master (metadata, placement, leases, liveness)
    // ========================================================================
    auto clock = std::make_shared<gfs_common::SystemClock>();
    auto master = std::make_shared<gfs_master::Master>(config.gfs, clock);

    master->AddLivenessObserver([](const gfs_master::ChunkserverId& id,
                                   const std::vector<gfs_master::ChunkHandle>& handles) {
        std::cout << "[Master] Chunkserver " << id << " declared dead, "
                  << handles.size() << " chunk(s) under-replicated" << std::endl;
        for (auto handle : handles) {
            std::cout << "[Master]   chunk " << handle << std::endl;
        }
    });

    // ========================================================================
    // 2. Create the MasterService implementation
    // ========================================================================
    auto service = std::make_unique<gfs_master::MasterServiceImpl>(master);

    // ========================================================================
    // 3. Setup gRPC Server with Health Check
    // ========================================================================
    grpc::EnableDefaultHealthCheckService(true);

    ServerBuilder builder;
    std::string server_address = config.host + ":" + std::to_string(config.port);
    builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());

    // ========================================================================
    // 4. Build and start the server
    // ========================================================================
    g_server = builder.BuildAndStart();

    if (!g_server) {
        std::cerr << "Failed to build and start gRPC server!" << std::endl;
        return 1;
    }

    std::cout << std::endl;
    std::cout << "gRPC Server listening on " << server_address << std::endl;
    std::cout << "Ready to accept client connections..." << std::endl;
    std::cout << std::endl;

    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    // ========================================================================
    // 5. Liveness sweep: detects dead chunkservers even when no client asks
    // ========================================================================
    std::mutex monitor_mutex;
    std::condition_variable monitor_cv;
    std::thread monitor_thread([&]() {
        std::unique_lock<std::mutex> lock(monitor_mutex);
        while (!g_shutdown_requested.load()) {
            monitor_cv.wait_for(lock, config.gfs.heartbeat_interval);
            if (g_shutdown_requested.load()) {
                break;
            }
            auto alive = master->CheckLiveness();
            std::cout << "[Master] " << alive.size() << " alive chunkserver(s), "
                      << master->FileCount() << " file(s), "
                      << master->ChunkCount() << " chunk(s)" << std::endl;
        }
    });

    // ========================================================================
    // 6. Wait for server shutdown (blocking call)
    // ========================================================================
    g_server->Wait();

    {
        std::lock_guard<std::mutex> lock(monitor_mutex);
        g_shutdown_requested.store(true);
    }
    monitor_cv.notify_all();
    monitor_thread.join();

    std::cout << "gRPC Server shutdown gracefully." << std::endl;
    return 0;
}
