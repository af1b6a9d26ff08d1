/**
 * @file chunk_transport.h
 * @brief Abstraction over the per-chunk network exchange
 */

#ifndef UPLOAD_PIPELINE_CLIENT_CHUNK_TRANSPORT_H
#define UPLOAD_PIPELINE_CLIENT_CHUNK_TRANSPORT_H

#include <string>
#include <string_view>

#include "upload_pipeline/core/cancellation.h"
#include "upload_pipeline/core/types.h"
#include "upload_pipeline/protocol/wire_format.h"

namespace upload_pipeline {

/**
 * @brief One request/response exchange with the session server
 *
 * Implementations perform a single attempt; retries are applied by
 * transfer_client. A send interrupted through @p token must return
 * error_code::cancelled.
 */
class chunk_transport {
public:
    virtual ~chunk_transport() = default;

    [[nodiscard]] virtual auto send_chunk(const protocol::chunk_request& request,
                                          cancellation_token& token)
        -> result<protocol::chunk_receipt> = 0;

    [[nodiscard]] virtual auto query_status(const std::string& upload_id)
        -> result<protocol::session_status> = 0;

    /**
     * @brief Ask the server to drop a session and its temp chunks
     */
    [[nodiscard]] virtual auto cancel_session(const std::string& upload_id)
        -> result<void> = 0;
};

/**
 * @brief Map an HTTP status and body to a receipt or a typed error
 *
 * 2xx decodes the body; 404 is session_not_found; other 4xx are
 * validation failures; 5xx and anything else are retryable server errors.
 */
[[nodiscard]] auto decode_chunk_response(int status_code, std::string_view body)
    -> result<protocol::chunk_receipt>;

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_CHUNK_TRANSPORT_H
