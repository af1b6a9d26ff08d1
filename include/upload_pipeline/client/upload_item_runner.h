/**
 * @file upload_item_runner.h
 * @brief Sequential chunk loop for one upload item
 */

#ifndef UPLOAD_PIPELINE_CLIENT_UPLOAD_ITEM_RUNNER_H
#define UPLOAD_PIPELINE_CLIENT_UPLOAD_ITEM_RUNNER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "upload_pipeline/client/transfer_client.h"
#include "upload_pipeline/client/upload_types.h"
#include "upload_pipeline/core/cancellation.h"

namespace upload_pipeline {

/**
 * @brief Immutable view of an item taken when its run starts
 */
struct item_run_plan {
    std::string item_id;
    std::shared_ptr<byte_source> file;
    std::string file_name;
    uint64_t file_size = 0;
    std::string metadata_json;
    uint64_t uploaded_bytes = 0;
    std::optional<std::string> server_session_id;
};

/**
 * @brief How a run ended
 */
enum class run_result_kind {
    completed,
    cancelled,
    /// Counts against max_item_retries
    failed,
    /// Fails the item without further retries
    failed_permanently,
    /// Server no longer knows the session; restart from chunk 0
    session_lost,
};

struct run_outcome {
    run_result_kind kind = run_result_kind::completed;
    std::optional<error> err;
    std::optional<std::string> evidence_id;
};

/**
 * @brief Drives chunks [floor(uploaded_bytes / chunk_size), total) in order
 *
 * Chunks are sent strictly one at a time. The token is checked before
 * each send; a tripped token ends the run without sending. After the last
 * chunk, indices the server reports as missing are sent once more.
 */
class upload_item_runner {
public:
    /**
     * @brief Called after each confirmed chunk
     * @param receipt Server acknowledgment
     * @param uploaded_bytes Upper byte bound now confirmed
     */
    using confirm_callback =
        std::function<void(const protocol::chunk_receipt& receipt, uint64_t uploaded_bytes)>;

    upload_item_runner(const transfer_client& client, chunk_layout layout);

    [[nodiscard]] auto run(const item_run_plan& plan,
                           cancellation_token& token,
                           const confirm_callback& on_confirmed) const -> run_outcome;

private:
    [[nodiscard]] auto send_index(const item_run_plan& plan,
                                  uint64_t index,
                                  uint64_t total,
                                  std::optional<std::string>& session,
                                  cancellation_token& token) const
        -> result<protocol::chunk_receipt>;

    const transfer_client& client_;
    chunk_layout layout_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_UPLOAD_ITEM_RUNNER_H
