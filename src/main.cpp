/**
 * @file main.cpp
 * @brief filemesh_node command line entry point
 *
 * FileMesh - peer membership and file catalog node
 * Copyright © 2025 Fortified Solutions Inc.
 *
 * Configuration comes from the environment (PORT, FILEMESH_*) and is then
 * overridden by command line flags.
 */

#include "filemesh/filemesh_node.hpp"
#include "filemesh/utilities.hpp"

#include <iostream>
#include <string>
#include <vector>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>

using namespace filemesh;
using namespace filemesh::utilities;

static std::atomic<bool> g_shutdown(false);

// Signal handler for graceful shutdown
void signal_handler(int) {
    g_shutdown = true;
}

// Print usage information
void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --port <n>              HTTP port (default: PORT or 3000)\n";
    std::cout << "  --beacon-port <n>       LAN overlay UDP port (default: 10001)\n";
    std::cout << "  --data-dir <path>       Data directory (default: FILEMESH_DATA_DIR or ./filemesh-data)\n";
    std::cout << "  --log-level <level>     debug, info, warn, error or critical\n";
    std::cout << "  --log-file <path>       Also write logs to this file\n";
    std::cout << "  --bootstrap <multiaddr> Bootstrap peer (/ip4/h/tcp/p/p2p/<id>), repeatable\n";
    std::cout << "  --max-dial-retries <n>  Dial rounds per peer (default: 5)\n";
    std::cout << "  --help                  Show this help\n\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
    }

    config::NodeConfig node_config = config::NodeConfig::from_environment();

    std::string error;
    if (!node_config.apply_arguments(args, error)) {
        std::cerr << error << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    auto level = parse_log_level(node_config.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << node_config.log_level << "\n";
        return 1;
    }

    initialize_logging(node_config.log_file, *level);

    try {
        FileMeshNode node(node_config);

        std::signal(SIGINT, signal_handler);
        std::signal(SIGTERM, signal_handler);

        if (!node.start()) {
            log_critical("Failed to start FileMesh node");
            return 1;
        }

        std::cout << "Node " << node.node_id() << " serving HTTP on port " << node.http_port() << "\n";

        std::thread maintenance([&node]() {
            node.run();
        });

        while (!g_shutdown && node.is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        log_info("Shutting down FileMesh node...");
        node.stop();

        if (maintenance.joinable()) {
            maintenance.join();
        }

    } catch (const std::exception& e) {
        log_critical("Fatal error: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
