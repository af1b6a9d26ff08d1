/**
 * @file upload_item_runner.cpp
 * @brief Chunk loop for one upload item
 */

#include "upload_pipeline/client/upload_item_runner.h"

#include "upload_pipeline/core/logging.h"

namespace upload_pipeline {

namespace {

auto outcome_for(const error& err) -> run_outcome {
    run_outcome outcome;
    outcome.err = err;
    if (is_cancellation(err.code)) {
        outcome.kind = run_result_kind::cancelled;
    } else if (err.code == error_code::session_not_found) {
        outcome.kind = run_result_kind::session_lost;
    } else if (is_validation_error(err.code) || err.code == error_code::source_unavailable ||
               err.code == error_code::file_not_found) {
        outcome.kind = run_result_kind::failed_permanently;
    } else {
        outcome.kind = run_result_kind::failed;
    }
    return outcome;
}

}  // namespace

upload_item_runner::upload_item_runner(const transfer_client& client, chunk_layout layout)
    : client_(client), layout_(layout) {}

auto upload_item_runner::send_index(const item_run_plan& plan,
                                    uint64_t index,
                                    uint64_t total,
                                    std::optional<std::string>& session,
                                    cancellation_token& token) const
    -> result<protocol::chunk_receipt> {
    auto chunk = layout_.read_chunk(*plan.file, index);
    if (!chunk) {
        return unexpected(chunk.error());
    }

    protocol::chunk_request request;
    request.upload_id = session;
    request.chunk_index = index;
    request.total_chunks = total;
    request.file_name = plan.file_name;
    request.metadata_json = plan.metadata_json;
    request.bytes = std::move(chunk.value().bytes);

    auto receipt = client_.send_chunk(request, token);
    if (receipt) {
        session = receipt.value().upload_id;
    }
    return receipt;
}

auto upload_item_runner::run(const item_run_plan& plan,
                             cancellation_token& token,
                             const confirm_callback& on_confirmed) const -> run_outcome {
    if (!plan.file) {
        return outcome_for(error{error_code::source_unavailable,
                                 "source file unavailable; select the file again"});
    }
    if (plan.file->size() != plan.file_size) {
        return outcome_for(error{error_code::source_unavailable,
                                 "source file changed size since it was queued"});
    }

    const auto total = layout_.chunk_count(plan.file_size);
    auto session = plan.server_session_id;

    uint64_t start = 0;
    if (session) {
        start = layout_.chunk_index_for_offset(plan.uploaded_bytes);
        // Everything was confirmed but completion was never seen: resend the
        // last chunk so the server reports the session state again.
        if (start >= total) {
            start = total - 1;
        }
    }

    upload_log_context ctx;
    ctx.item_id = plan.item_id;
    ctx.upload_id = session.value_or("");
    ctx.file_name = plan.file_name;
    ctx.chunk_index = start;
    ctx.total_chunks = total;
    UP_LOG_DEBUG_CTX(log_category::item, "starting chunk loop", ctx);

    std::optional<protocol::chunk_receipt> last;
    for (uint64_t index = start; index < total; ++index) {
        if (token.is_cancelled()) {
            return run_outcome{run_result_kind::cancelled, std::nullopt, std::nullopt};
        }

        auto receipt = send_index(plan, index, total, session, token);
        if (!receipt) {
            return outcome_for(receipt.error());
        }

        auto range = layout_.range(index, plan.file_size);
        on_confirmed(receipt.value(), range ? range.value().end : plan.file_size);
        last = std::move(receipt.value());
    }

    if (last && last->status != protocol::session_state::completed &&
        !last->missing_chunks.empty()) {
        auto missing = last->missing_chunks;
        ctx.upload_id = session.value_or("");
        ctx.error_message = std::to_string(missing.size()) + " chunk(s) missing on server";
        UP_LOG_WARN_CTX(log_category::item, "resending missing chunks", ctx);

        for (auto index : missing) {
            if (token.is_cancelled()) {
                return run_outcome{run_result_kind::cancelled, std::nullopt, std::nullopt};
            }
            if (index >= total) {
                continue;
            }
            auto receipt = send_index(plan, index, total, session, token);
            if (!receipt) {
                return outcome_for(receipt.error());
            }
            on_confirmed(receipt.value(), plan.file_size);
            last = std::move(receipt.value());
        }
    }

    if (!last || last->status != protocol::session_state::completed) {
        auto received = last ? last->received_chunks : 0;
        return outcome_for(error{error_code::missing_chunks,
                                 "server did not complete the upload (" +
                                     std::to_string(received) + "/" + std::to_string(total) +
                                     " chunks received)"});
    }

    run_outcome outcome;
    outcome.kind = run_result_kind::completed;
    outcome.evidence_id = last->evidence_id ? last->evidence_id : std::optional(last->upload_id);
    return outcome;
}

}  // namespace upload_pipeline
