/**
 * @file upload_client.cpp
 * @brief Queue several files for chunked upload
 *
 * Usage: upload_client <server_url> <queue_file> <file>...
 *
 * The queue is persisted to <queue_file>; running the example again with
 * no files resumes whatever was left unfinished.
 *
 * Uploading needs the HTTP transport, which exists only in builds
 * configured with -DBUILD_WITH_NETWORK_SYSTEM=ON. Other builds exit with
 * an error before touching the queue.
 */

#include <upload_pipeline/client/http_chunk_transport.h>
#include <upload_pipeline/client/queue_store.h>
#include <upload_pipeline/client/upload_queue.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace upload_pipeline;

static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <server_url> <queue_file> [file...]\n"
                  << "Requires a build configured with -DBUILD_WITH_NETWORK_SYSTEM=ON"
                  << std::endl;
        return 1;
    }

    http_transport_config transport_config;
    transport_config.base_url = argv[1];

    auto transport = http_chunk_transport::create(transport_config);
    if (!transport.has_value()) {
        std::cerr << "Failed to create transport: " << transport.error().message << "\n"
                  << "Reconfigure with -DBUILD_WITH_NETWORK_SYSTEM=ON to enable uploads"
                  << std::endl;
        return 1;
    }

    auto queue_result = upload_queue::builder()
        .with_transport(transport.value())
        .with_store(std::make_shared<json_file_queue_store>(argv[2]))
        .with_max_concurrent(3)
        .build();

    if (!queue_result.has_value()) {
        std::cerr << "Failed to create queue: " << queue_result.error().message << std::endl;
        return 1;
    }

    auto& queue = queue_result.value();

    queue.subscribe([](const queue_snapshot& snapshot) {
        std::cout << "\r[Queue] uploading " << snapshot.stats.uploading
                  << " | queued " << snapshot.stats.queued
                  << " | completed " << snapshot.stats.completed
                  << " | failed " << snapshot.stats.failed
                  << std::flush;
    });

    for (int i = 3; i < argc; ++i) {
        upload_metadata metadata;
        metadata.description = "uploaded by upload_client";
        metadata.tags = {"example"};

        auto item = make_upload_item(argv[i], metadata);
        if (!item.has_value()) {
            std::cerr << "Skipping " << argv[i] << ": " << item.error().message << std::endl;
            continue;
        }
        queue.enqueue(std::move(item.value()));
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running && !queue.wait_until_idle(std::chrono::milliseconds(500))) {
    }

    queue.shutdown();
    std::cout << std::endl;

    for (const auto& item : queue.snapshot().items) {
        std::cout << item.file_name << ": " << to_string(item.status);
        if (item.error) {
            std::cout << " (" << *item.error << ")";
        }
        std::cout << std::endl;
    }
    return 0;
}
