/**
 * @file server_types.h
 * @brief Server-side configuration and session types
 */

#ifndef UPLOAD_PIPELINE_SERVER_SERVER_TYPES_H
#define UPLOAD_PIPELINE_SERVER_SERVER_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "upload_pipeline/core/types.h"
#include "upload_pipeline/protocol/wire_format.h"

namespace upload_pipeline {

/**
 * @brief Server state enumeration
 */
enum class server_state {
    stopped,
    starting,
    running,
    stopping
};

[[nodiscard]] constexpr auto to_string(server_state state) -> const char* {
    switch (state) {
        case server_state::stopped: return "stopped";
        case server_state::starting: return "starting";
        case server_state::running: return "running";
        case server_state::stopping: return "stopping";
        default: return "unknown";
    }
}

/**
 * @brief Endpoint the HTTP server binds to
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : host("0.0.0.0"), port(0) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}
    explicit endpoint(uint16_t p) : host("0.0.0.0"), port(p) {}
};

/**
 * @brief Upload server configuration
 */
struct server_config {
    /// Final artifacts land here as <upload id>-<file name>
    std::filesystem::path upload_directory = "uploads";
    /// Chunk files and session records
    std::filesystem::path temp_directory = "temp";
    std::string route_prefix = "/api/evidence";
    std::size_t max_chunk_size = 10 * 1024 * 1024;  // 10MB
    bool persist_sessions = true;
    std::size_t worker_threads = 4;
    std::chrono::milliseconds request_timeout{30000};
    /// Uploading sessions idle for longer are dropped; 0 disables expiry
    std::chrono::milliseconds session_ttl{0};

    [[nodiscard]] auto validate() const -> result<void>;
};

/**
 * @brief Chunk as received from a client, after multipart decoding
 */
using chunk_upload = protocol::chunk_request;

/**
 * @brief Server-side record of one logical file upload
 *
 * @c received is a set so a duplicate resend can never complete the
 * session before every distinct index has arrived.
 */
struct upload_session {
    std::string id;
    std::string file_name;
    nlohmann::json metadata = nlohmann::json::object();
    uint64_t total_chunks = 0;
    std::set<uint64_t> received;
    protocol::session_state status = protocol::session_state::uploading;
    std::string created_at;
    std::optional<std::string> completed_at;
    std::chrono::steady_clock::time_point last_activity = std::chrono::steady_clock::now();

    std::optional<std::filesystem::path> artifact_path;
    uint64_t artifact_size = 0;
    std::string sha256;

    /// round(|received| / total * 100)
    [[nodiscard]] auto progress() const -> int;

    /// Indices in [0, total) not yet received
    [[nodiscard]] auto missing() const -> std::vector<uint64_t>;
};

void to_json(nlohmann::json& j, const upload_session& s);

/**
 * @brief Restore a record written by to_json(); received indices are kept
 *        as stored and must be checked against the chunk files by the caller
 */
[[nodiscard]] auto session_from_json(const nlohmann::json& j) -> result<upload_session>;

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_SERVER_SERVER_TYPES_H
