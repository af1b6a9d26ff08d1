/**
 * @file upload_types.h
 * @brief Client-side upload item, queue configuration and snapshots
 */

#ifndef UPLOAD_PIPELINE_CLIENT_UPLOAD_TYPES_H
#define UPLOAD_PIPELINE_CLIENT_UPLOAD_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "upload_pipeline/core/byte_source.h"
#include "upload_pipeline/core/chunk_codec.h"
#include "upload_pipeline/core/types.h"

namespace upload_pipeline {

/**
 * @brief Lifecycle state of an upload item
 */
enum class upload_status {
    queued,
    uploading,
    paused,
    completed,
    failed,
    cancelled
};

[[nodiscard]] constexpr auto to_string(upload_status status) -> const char* {
    switch (status) {
        case upload_status::queued: return "queued";
        case upload_status::uploading: return "uploading";
        case upload_status::paused: return "paused";
        case upload_status::completed: return "completed";
        case upload_status::failed: return "failed";
        case upload_status::cancelled: return "cancelled";
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_upload_status(std::string_view s) -> std::optional<upload_status>;

/**
 * @brief COMPLETED, FAILED and CANCELLED; only these may be removed
 */
[[nodiscard]] constexpr auto is_terminal(upload_status status) -> bool {
    return status == upload_status::completed ||
           status == upload_status::failed ||
           status == upload_status::cancelled;
}

struct geolocation {
    double latitude = 0.0;
    double longitude = 0.0;
    std::optional<double> accuracy;

    [[nodiscard]] auto operator==(const geolocation& other) const -> bool = default;
};

/**
 * @brief Descriptive record sent with every chunk as a JSON string
 *
 * Keys other than the known ones are preserved in @c extra.
 */
struct upload_metadata {
    std::string title;
    std::string description;
    std::vector<std::string> tags;
    std::optional<geolocation> location;
    std::string timestamp;
    nlohmann::json extra = nlohmann::json::object();
};

void to_json(nlohmann::json& j, const upload_metadata& m);
void from_json(const nlohmann::json& j, upload_metadata& m);

/**
 * @brief One file in the upload queue
 *
 * Invariants: uploaded_bytes <= file_size; status == completed implies
 * uploaded_bytes == file_size.
 */
struct upload_item {
    std::string id;
    std::shared_ptr<byte_source> file;
    std::optional<std::filesystem::path> source_path;
    std::string file_name;
    uint64_t file_size = 0;
    std::string file_type;
    upload_metadata metadata;

    upload_status status = upload_status::queued;
    int progress = 0;
    uint64_t uploaded_bytes = 0;
    int retry_count = 0;
    std::optional<std::string> error;
    std::optional<std::string> server_session_id;
    std::string created_at;
};

/**
 * @brief round(uploaded / size * 100); a zero-byte file reports 0 until done
 */
[[nodiscard]] auto compute_progress(uint64_t uploaded_bytes, uint64_t file_size) -> int;

/**
 * @brief MIME type guessed from the file extension
 */
[[nodiscard]] auto guess_file_type(std::string_view file_name) -> std::string;

/**
 * @brief Build a QUEUED item for @p source
 *
 * An empty title defaults to the file name and an empty timestamp to now.
 */
[[nodiscard]] auto make_upload_item(std::shared_ptr<byte_source> source,
                                    std::string file_name,
                                    upload_metadata metadata = {}) -> upload_item;

/**
 * @brief Build a QUEUED item for a file on disk
 */
[[nodiscard]] auto make_upload_item(const std::filesystem::path& path,
                                    upload_metadata metadata = {}) -> result<upload_item>;

/**
 * @brief Retry limits and backoff
 */
struct retry_policy {
    /// Extra attempts per chunk after the first one fails
    int max_chunk_retries = 5;
    /// Whole-item failures before the item is FAILED
    int max_item_retries = 5;
    /// Delay before chunk retry n is base_delay * 2^n
    std::chrono::milliseconds base_delay{1000};

    [[nodiscard]] auto backoff_delay(int retry_count) const -> std::chrono::milliseconds {
        return base_delay * (int64_t{1} << retry_count);
    }
};

struct queue_config {
    std::size_t max_concurrent = 3;
    chunk_layout layout;
    retry_policy retry;

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Aggregate counts over the current item list
 */
struct queue_stats {
    std::size_t total = 0;
    std::size_t queued = 0;
    std::size_t uploading = 0;
    std::size_t paused = 0;
    std::size_t completed = 0;
    std::size_t failed = 0;
    std::size_t cancelled = 0;

    [[nodiscard]] static auto from_items(const std::vector<upload_item>& items) -> queue_stats;
};

struct queue_snapshot {
    std::vector<upload_item> items;
    queue_stats stats;
    std::size_t active_count = 0;

    [[nodiscard]] auto find(std::string_view id) const -> const upload_item*;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_UPLOAD_TYPES_H
