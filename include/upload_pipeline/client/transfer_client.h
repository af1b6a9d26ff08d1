/**
 * @file transfer_client.h
 * @brief One chunk exchange with per-chunk retry and exponential backoff
 */

#ifndef UPLOAD_PIPELINE_CLIENT_TRANSFER_CLIENT_H
#define UPLOAD_PIPELINE_CLIENT_TRANSFER_CLIENT_H

#include <memory>

#include "upload_pipeline/client/chunk_transport.h"
#include "upload_pipeline/client/upload_types.h"
#include "upload_pipeline/core/cancellation.h"

namespace upload_pipeline {

/**
 * @brief Sends one chunk, retrying retryable transport failures
 *
 * Attempt n (n = 0 for the first retry) is preceded by a wait of
 * base_delay * 2^n. Retries stop after max_chunk_retries; the last error
 * is returned. Validation and session_not_found errors are returned at
 * once. Cancellation is observed before every attempt and during every
 * wait and is reported as error_code::cancelled without consuming retries.
 */
class transfer_client {
public:
    transfer_client(std::shared_ptr<chunk_transport> transport, retry_policy policy);

    /**
     * @brief Send @p request
     * @param retry_count Retries already spent on this chunk
     */
    [[nodiscard]] auto send_chunk(const protocol::chunk_request& request,
                                  cancellation_token& token,
                                  int retry_count = 0) const
        -> result<protocol::chunk_receipt>;

    [[nodiscard]] auto policy() const -> const retry_policy& { return policy_; }

private:
    std::shared_ptr<chunk_transport> transport_;
    retry_policy policy_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_TRANSFER_CLIENT_H
