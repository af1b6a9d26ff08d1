/**
 * @file upload_server.cpp
 * @brief Chunked upload server example
 *
 * This example demonstrates how to:
 * - Configure upload and temp directories
 * - Start the HTTP upload server
 * - Report active sessions while running
 * - Gracefully shut down the server
 */

#include <upload_pipeline/server/upload_http_server.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace upload_pipeline;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        std::cout << "\nShutdown signal received..." << std::endl;
        running = false;
    }
}

int main(int argc, char* argv[]) {
    uint16_t port = 3001;
    std::string data_dir = "./upload_server_data";

    if (argc >= 2) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }
    if (argc >= 3) {
        data_dir = argv[2];
    }

    std::cout << "=== Upload Server Example ===" << std::endl;
    std::cout << "Port: " << port << std::endl;
    std::cout << "Data: " << data_dir << std::endl;
    std::cout << std::endl;

    auto server_result = upload_http_server::builder()
        .with_upload_directory(data_dir + "/uploads")
        .with_temp_directory(data_dir + "/temp")
        .with_route_prefix("/api/evidence")
        .with_max_chunk_size(10 * 1024 * 1024)  // 10MB
        .with_worker_threads(4)
        .with_session_ttl(std::chrono::hours(24))
        .build();

    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: "
                  << server_result.error().message << std::endl;
        return 1;
    }

    auto& server = server_result.value();

    auto start_result = server.start(endpoint{port});
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: "
                  << start_result.error().message << std::endl;
        return 1;
    }

    std::cout << "Server started on port " << server.port() << std::endl;
    std::cout << "Press Ctrl+C to stop..." << std::endl;
    std::cout << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running && server.is_running()) {
        auto sessions = server.sessions();
        std::cout << "\r[Stats] Active uploads: " << sessions->active_session_count()
                  << " | Completed: " << sessions->list_completed().size()
                  << std::flush;

        std::this_thread::sleep_for(std::chrono::seconds(5));
    }

    std::cout << std::endl;

    std::cout << "Stopping server..." << std::endl;
    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: "
                  << stop_result.error().message << std::endl;
    }

    std::cout << "Server stopped." << std::endl;
    return 0;
}
