#include "gfs_chunkserver/chunkserver.hpp"
#include "gfs_chunkserver/chunkserver_service.hpp"
#include "gfs_common/clock.hpp"
#include "gfs_common/config.hpp"
#include "gfs_rpc/grpc_chunkserver_client.hpp"
#include "gfs_rpc/grpc_master_client.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <signal.h>
#include <thread>

static std::unique_ptr<grpc::Server> g_server;
static std::atomic<bool> g_shutdown_requested(false);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutting down chunkserver..." << std::endl;
        g_shutdown_requested.store(true);
        if (g_server) {
            g_server->Shutdown();
        }
    }
}

void PrintUsage() {
    std::cout << "Usage: gfs_chunkserver [options]" << std::endl
              << "Options:" << std::endl
              << "  --id <host:port>               Chunkserver identity, also the address peers dial"
              << " (default: localhost:<port>)" << std::endl
              << "  --port <port>                  Server port (default: 50051)" << std::endl
              << "  --master <host:port>           Master address (default: localhost:50050)" << std::endl
              << "  --chunk-size <bytes>           Chunk capacity (default: 64 MiB)" << std::endl
              << "  --heartbeat-interval <seconds> Heartbeat period (default: 10)" << std::endl
              << "  --help                         Show this help message" << std::endl;
}

int main(int argc, char* argv[]) {
    std::string chunkserver_id;
    std::string port = "50051";
    std::string master_address = "localhost:50050";
    gfs_common::GfsConfig config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            PrintUsage();
            return 0;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << std::endl;
            PrintUsage();
            return 1;
        }
        std::string value = argv[++i];

        if (arg == "--id") {
            chunkserver_id = value;
        } else if (arg == "--port") {
            port = value;
        } else if (arg == "--master") {
            master_address = value;
        } else {
            bool handled = false;
            auto status = gfs_common::ApplyConfigFlag(config, arg, value, handled);
            if (!handled) {
                std::cerr << "Unknown option: " << arg << std::endl;
                PrintUsage();
                return 1;
            }
            if (!status.ok()) {
                std::cerr << status << std::endl;
                return 1;
            }
        }
    }

    if (chunkserver_id.empty()) {
        chunkserver_id = "localhost:" + port;
    }
    auto valid = gfs_common::ValidateConfig(config);
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid << std::endl;
        return 1;
    }

    std::string server_address = "0.0.0.0:" + port;

    std::cout << "================================" << std::endl
              << "  GFS Chunkserver" << std::endl
              << "================================" << std::endl
              << "Chunkserver ID: " << chunkserver_id << std::endl
              << "Server Address: " << server_address << std::endl
              << "Master: " << master_address << std::endl
              << gfs_common::DescribeConfig(config)
              << std::endl;

    // Secondaries are dialed by id on first use
    uint64_t chunk_size = config.chunk_size;
    auto peers = std::make_shared<gfs_common::ChunkserverPool>();
    peers->SetFactory([chunk_size](const gfs_common::ChunkserverId& id) {
        return std::make_shared<gfs_rpc::GrpcChunkserverClient>(id, chunk_size);
    });

    auto master = std::make_shared<gfs_rpc::GrpcMasterClient>(master_address);
    auto clock = std::make_shared<gfs_common::SystemClock>();
    auto chunkserver = std::make_shared<gfs_chunkserver::Chunkserver>(
        chunkserver_id, config, master, peers, clock);

    auto service = std::make_unique<gfs_chunkserver::ChunkserverServiceImpl>(chunkserver);

    g_server = gfs_chunkserver::StartChunkserverServer(server_address, service.get(), chunk_size);

    if (!g_server) {
        std::cerr << "Failed to start server!" << std::endl;
        return 1;
    }

    std::cout << "Chunkserver listening on " << server_address << std::endl;
    std::cout << "Press Ctrl+C to shutdown..." << std::endl << std::endl;

    signal(SIGINT, SignalHandler);
    signal(SIGTERM, SignalHandler);

    chunkserver->Start();

    // Print statistics periodically (for monitoring)
    std::thread stats_thread([chunkserver]() {
        while (!g_shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(30));
            if (!g_shutdown_requested.load()) {
                std::cout << "\n" << chunkserver->GetStatistics() << std::endl;
            }
        }
    });
    stats_thread.detach();

    g_server->Wait();

    g_shutdown_requested.store(true);
    chunkserver->Stop();
    peers->Clear();

    std::cout << "Server shutdown complete." << std::endl;

    return 0;
}
