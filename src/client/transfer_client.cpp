/**
 * @file transfer_client.cpp
 * @brief Chunk send with retry/backoff
 */

#include "upload_pipeline/client/transfer_client.h"

#include "upload_pipeline/core/logging.h"

namespace upload_pipeline {

namespace {

auto cancelled_error() -> unexpected {
    return unexpected(error{error_code::cancelled, "chunk transfer cancelled"});
}

}  // namespace

transfer_client::transfer_client(std::shared_ptr<chunk_transport> transport, retry_policy policy)
    : transport_(std::move(transport)), policy_(policy) {}

auto transfer_client::send_chunk(const protocol::chunk_request& request,
                                 cancellation_token& token,
                                 int retry_count) const -> result<protocol::chunk_receipt> {
    while (true) {
        if (token.is_cancelled()) {
            return cancelled_error();
        }

        auto receipt = transport_->send_chunk(request, token);
        if (token.is_cancelled()) {
            // A reply that raced the abort is dropped.
            return cancelled_error();
        }
        if (receipt) {
            return receipt;
        }

        const auto& err = receipt.error();
        if (is_cancellation(err.code)) {
            return cancelled_error();
        }
        if (!is_retryable(err.code) || retry_count >= policy_.max_chunk_retries) {
            return unexpected(err);
        }

        auto delay = policy_.backoff_delay(retry_count);

        upload_log_context ctx;
        ctx.upload_id = request.upload_id.value_or("");
        ctx.file_name = request.file_name;
        ctx.chunk_index = request.chunk_index;
        ctx.total_chunks = request.total_chunks;
        ctx.retry_count = retry_count + 1;
        ctx.error_message = err.message;
        UP_LOG_WARN_CTX(log_category::transfer,
                        "chunk send failed, retrying in " + std::to_string(delay.count()) + "ms",
                        ctx);

        if (!token.wait_for(delay)) {
            return cancelled_error();
        }
        ++retry_count;
    }
}

}  // namespace upload_pipeline
