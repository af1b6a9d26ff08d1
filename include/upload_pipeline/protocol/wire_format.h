/**
 * @file wire_format.h
 * @brief Messages exchanged between the upload queue and the session server
 *
 * One HTTP request carries one chunk as multipart/form-data with the
 * fields chunk, chunkIndex, totalChunks, uploadId (optional), fileName and
 * metadata (a JSON-encoded string). Responses are JSON objects.
 */

#ifndef UPLOAD_PIPELINE_PROTOCOL_WIRE_FORMAT_H
#define UPLOAD_PIPELINE_PROTOCOL_WIRE_FORMAT_H

#include "upload_pipeline/core/types.h"
#include "upload_pipeline/protocol/multipart.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace upload_pipeline::protocol {

namespace field {
inline constexpr std::string_view chunk = "chunk";
inline constexpr std::string_view chunk_index = "chunkIndex";
inline constexpr std::string_view total_chunks = "totalChunks";
inline constexpr std::string_view upload_id = "uploadId";
inline constexpr std::string_view file_name = "fileName";
inline constexpr std::string_view metadata = "metadata";
}  // namespace field

/**
 * @brief Server-side session state as reported on the wire
 */
enum class session_state {
    uploading,
    completed,
};

[[nodiscard]] constexpr auto to_string(session_state s) -> const char* {
    switch (s) {
        case session_state::uploading: return "uploading";
        case session_state::completed: return "completed";
        default: return "unknown";
    }
}

[[nodiscard]] auto parse_session_state(std::string_view s) -> std::optional<session_state>;

/**
 * @brief One chunk upload request
 */
struct chunk_request {
    std::optional<std::string> upload_id;
    uint64_t chunk_index = 0;
    uint64_t total_chunks = 0;
    std::string file_name;
    std::string metadata_json;
    std::vector<std::byte> bytes;
};

/**
 * @brief Server acknowledgment of one chunk
 */
struct chunk_receipt {
    std::string upload_id;
    session_state status = session_state::uploading;
    int progress = 0;
    uint64_t received_chunks = 0;
    std::optional<uint64_t> total_chunks;
    std::string message;
    std::optional<std::string> evidence_id;
    std::optional<std::string> sha256;
    std::vector<uint64_t> missing_chunks;
};

/**
 * @brief Reply to a status query
 */
struct session_status {
    std::string upload_id;
    session_state status = session_state::uploading;
    int progress = 0;
    uint64_t received_chunks = 0;
    uint64_t total_chunks = 0;
    std::string created_at;
    std::optional<std::string> completed_at;
};

/**
 * @brief A completed upload as listed by the server
 */
struct evidence_record {
    std::string id;
    std::string file_name;
    nlohmann::json metadata = nlohmann::json::object();
    std::string uploaded_at;
    uint64_t size = 0;
    std::string sha256;
};

/**
 * @brief Structured error body: { "error": ..., "message": ... }
 */
struct error_body {
    std::string error;
    std::string message;
};

void to_json(nlohmann::json& j, const chunk_receipt& r);
void to_json(nlohmann::json& j, const session_status& s);
void to_json(nlohmann::json& j, const evidence_record& e);
void to_json(nlohmann::json& j, const error_body& e);

/**
 * @brief Decode a chunk acknowledgment
 * @return malformed_response if required fields are missing or mistyped
 */
[[nodiscard]] auto parse_chunk_receipt(std::string_view body) -> result<chunk_receipt>;

[[nodiscard]] auto parse_session_status(std::string_view body) -> result<session_status>;

/**
 * @brief Decode an error body; falls back to the raw text as message
 */
[[nodiscard]] auto parse_error_body(std::string_view body) -> error_body;

/**
 * @brief Build the multipart form for a chunk request
 */
[[nodiscard]] auto encode_chunk_request(const chunk_request& request) -> multipart_form;

/**
 * @brief Extract and validate the chunk fields of a parsed form
 *
 * Validates presence and integer syntax only; range checks belong to the
 * session manager.
 */
[[nodiscard]] auto decode_chunk_request(const multipart_form& form) -> result<chunk_request>;

}  // namespace upload_pipeline::protocol

#endif  // UPLOAD_PIPELINE_PROTOCOL_WIRE_FORMAT_H
