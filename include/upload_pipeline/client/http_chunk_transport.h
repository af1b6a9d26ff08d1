/**
 * @file http_chunk_transport.h
 * @brief chunk_transport over HTTP using network_system's http_client
 */

#ifndef UPLOAD_PIPELINE_CLIENT_HTTP_CHUNK_TRANSPORT_H
#define UPLOAD_PIPELINE_CLIENT_HTTP_CHUNK_TRANSPORT_H

#include <chrono>
#include <memory>
#include <string>

#include "upload_pipeline/client/chunk_transport.h"

namespace upload_pipeline {

struct http_transport_config {
    /// Scheme, host and port, e.g. "http://127.0.0.1:3001"
    std::string base_url = "http://127.0.0.1:3001";
    std::string route_prefix = "/api/evidence";
    /// Per-request timeout; expiry is a retryable transport error
    std::chrono::milliseconds request_timeout{30000};
};

/**
 * @brief Sends each chunk as one multipart POST to {prefix}/upload
 *
 * Requests run on a blocking_call_runner thread so a cancelled token
 * returns immediately; a response that arrives afterwards is discarded.
 * Destroying the transport waits for abandoned requests, each bounded by
 * request_timeout.
 */
class http_chunk_transport : public chunk_transport {
public:
    /**
     * @brief Create a transport
     * @return Error when built without network_system
     */
    [[nodiscard]] static auto create(http_transport_config config)
        -> result<std::shared_ptr<http_chunk_transport>>;

    ~http_chunk_transport() override;

    http_chunk_transport(const http_chunk_transport&) = delete;
    auto operator=(const http_chunk_transport&) -> http_chunk_transport& = delete;

    [[nodiscard]] auto send_chunk(const protocol::chunk_request& request,
                                  cancellation_token& token)
        -> result<protocol::chunk_receipt> override;

    [[nodiscard]] auto query_status(const std::string& upload_id)
        -> result<protocol::session_status> override;

    [[nodiscard]] auto cancel_session(const std::string& upload_id) -> result<void> override;

    [[nodiscard]] auto config() const -> const http_transport_config&;

private:
    struct impl;
    explicit http_chunk_transport(std::unique_ptr<impl> impl);
    std::unique_ptr<impl> impl_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_HTTP_CHUNK_TRANSPORT_H
