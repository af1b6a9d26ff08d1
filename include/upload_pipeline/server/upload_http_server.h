/**
 * @file upload_http_server.h
 * @brief HTTP server for chunked uploads
 */

#ifndef UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_SERVER_H
#define UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_SERVER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

#include "upload_pipeline/core/types.h"
#include "upload_pipeline/server/server_types.h"
#include "upload_pipeline/server/upload_session_manager.h"

namespace upload_pipeline {

/**
 * @brief Serves upload_http_handler over HTTP/1.1
 *
 * @code
 * auto server_result = upload_http_server::builder()
 *     .with_upload_directory("/data/uploads")
 *     .with_temp_directory("/data/temp")
 *     .build();
 *
 * if (server_result.has_value()) {
 *     auto& server = server_result.value();
 *     server.start(endpoint{3001});
 * }
 * @endcode
 */
class upload_http_server {
public:
    class builder {
    public:
        builder();

        auto with_config(const server_config& config) -> builder&;

        auto with_upload_directory(const std::filesystem::path& dir) -> builder&;

        auto with_temp_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @param prefix Path every upload route lives under (default: /api/evidence)
         */
        auto with_route_prefix(std::string prefix) -> builder&;

        /**
         * @param max_bytes Largest accepted chunk; also bounds the request body
         */
        auto with_max_chunk_size(std::size_t max_bytes) -> builder&;

        auto with_worker_threads(std::size_t count) -> builder&;

        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        auto with_session_persistence(bool enable) -> builder&;

        /**
         * @param ttl Drop uploading sessions idle for longer; 0 disables
         */
        auto with_session_ttl(std::chrono::milliseconds ttl) -> builder&;

        [[nodiscard]] auto build() -> result<upload_http_server>;

    private:
        server_config config_;
    };

    ~upload_http_server();

    upload_http_server(const upload_http_server&) = delete;
    auto operator=(const upload_http_server&) -> upload_http_server& = delete;
    upload_http_server(upload_http_server&&) noexcept;
    auto operator=(upload_http_server&&) noexcept -> upload_http_server&;

    /**
     * @brief Bind and start serving
     * @param listen_addr Port 0 picks a free port; see port()
     */
    [[nodiscard]] auto start(const endpoint& listen_addr) -> result<void>;

    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto state() const -> server_state;

    /// Port actually bound while running
    [[nodiscard]] auto port() const -> uint16_t;

    [[nodiscard]] auto sessions() const -> std::shared_ptr<upload_session_manager>;

    [[nodiscard]] auto config() const -> const server_config&;

private:
    struct impl;
    explicit upload_http_server(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_SERVER_H
