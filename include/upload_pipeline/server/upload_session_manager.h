/**
 * @file upload_session_manager.h
 * @brief Server-side chunk receipt, completion detection and assembly
 */

#ifndef UPLOAD_PIPELINE_SERVER_UPLOAD_SESSION_MANAGER_H
#define UPLOAD_PIPELINE_SERVER_UPLOAD_SESSION_MANAGER_H

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "upload_pipeline/core/types.h"
#include "upload_pipeline/protocol/wire_format.h"
#include "upload_pipeline/server/server_types.h"

namespace upload_pipeline {

/**
 * @brief Tracks upload sessions and assembles completed ones
 *
 * A session is created by chunk 0 sent without an upload id. Every later
 * chunk must carry the id returned in the first receipt; an unknown id is
 * rejected with session_not_found instead of starting over.
 *
 * Chunks are stored as <temp>/<id>-chunk-<index>. Once every distinct index
 * has arrived they are concatenated in index order into
 * <upload>/<id>-<file name> and deleted.
 *
 * Thread-safe. Requests for different sessions run in parallel; requests
 * for the same session are serialized by a per-session mutex.
 */
class upload_session_manager {
public:
    /**
     * @brief Create the directories and reload persisted sessions
     */
    [[nodiscard]] static auto create(server_config config)
        -> result<std::shared_ptr<upload_session_manager>>;

    explicit upload_session_manager(server_config config);

    upload_session_manager(const upload_session_manager&) = delete;
    auto operator=(const upload_session_manager&) -> upload_session_manager& = delete;

    /**
     * @brief Store one chunk and assemble the file when it completes the set
     *
     * Duplicate indices are accepted and change nothing. A chunk for a
     * completed session returns the completed receipt again.
     */
    [[nodiscard]] auto receive_chunk(const chunk_upload& chunk) -> result<protocol::chunk_receipt>;

    [[nodiscard]] auto status(const std::string& upload_id) const
        -> result<protocol::session_status>;

    /**
     * @brief Drop a session and its chunk files
     *
     * The artifact of a completed session is kept.
     */
    [[nodiscard]] auto cancel(const std::string& upload_id) -> result<void>;

    [[nodiscard]] auto list_completed() const -> std::vector<protocol::evidence_record>;

    /// Sessions still receiving chunks
    [[nodiscard]] auto active_session_count() const -> std::size_t;

    /**
     * @brief Cancel uploading sessions idle for longer than @p max_age
     * @return Number of sessions removed
     */
    auto expire_sessions(std::chrono::milliseconds max_age) -> std::size_t;

    [[nodiscard]] auto config() const -> const server_config& { return config_; }

    [[nodiscard]] auto chunk_path(const std::string& upload_id, uint64_t index) const
        -> std::filesystem::path;

private:
    struct session_entry {
        std::mutex mutex;
        upload_session session;
        bool removed = false;
    };

    [[nodiscard]] auto find_entry(const std::string& upload_id) const
        -> std::shared_ptr<session_entry>;

    [[nodiscard]] auto open_session(const chunk_upload& chunk, nlohmann::json metadata,
                                    std::string file_name)
        -> result<std::shared_ptr<session_entry>>;

    [[nodiscard]] auto assemble(upload_session& session) -> result<void>;

    [[nodiscard]] auto make_receipt(const upload_session& session, uint64_t chunk_index) const
        -> protocol::chunk_receipt;

    void persist(const upload_session& session) const;

    void remove_files(const upload_session& session) const;

    [[nodiscard]] auto record_path(const std::string& upload_id) const -> std::filesystem::path;

    void load_persisted();

    server_config config_;

    mutable std::shared_mutex sessions_mutex_;
    std::unordered_map<std::string, std::shared_ptr<session_entry>> sessions_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_SERVER_UPLOAD_SESSION_MANAGER_H
