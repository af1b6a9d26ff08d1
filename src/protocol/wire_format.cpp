/**
 * @file wire_format.cpp
 * @brief JSON and multipart mapping of wire messages
 */

#include "upload_pipeline/protocol/wire_format.h"

#include <charconv>

namespace upload_pipeline::protocol {

namespace {

auto malformed(const std::string& msg) -> unexpected {
    return unexpected(error{error_code::malformed_response, msg});
}

auto parse_uint(std::string_view text) -> std::optional<uint64_t> {
    uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || text.empty()) {
        return std::nullopt;
    }
    return value;
}

auto parse_object(std::string_view body) -> std::optional<nlohmann::json> {
    auto j = nlohmann::json::parse(body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }
    return j;
}

auto string_or(const nlohmann::json& obj, const char* key, std::string fallback = {})
    -> std::string {
    auto it = obj.find(key);
    return it != obj.end() && it->is_string() ? it->get<std::string>() : fallback;
}

auto uint_or(const nlohmann::json& obj, const char* key, uint64_t fallback = 0) -> uint64_t {
    auto it = obj.find(key);
    return it != obj.end() && it->is_number_unsigned() ? it->get<uint64_t>() : fallback;
}

}  // namespace

auto parse_session_state(std::string_view s) -> std::optional<session_state> {
    if (s == "uploading") return session_state::uploading;
    if (s == "completed") return session_state::completed;
    return std::nullopt;
}

void to_json(nlohmann::json& j, const chunk_receipt& r) {
    j = nlohmann::json{
        {"uploadId", r.upload_id},
        {"status", to_string(r.status)},
        {"progress", r.progress},
        {"receivedChunks", r.received_chunks},
        {"message", r.message},
    };
    if (r.total_chunks) j["totalChunks"] = *r.total_chunks;
    if (r.evidence_id) j["evidenceId"] = *r.evidence_id;
    if (r.sha256) j["sha256"] = *r.sha256;
    if (!r.missing_chunks.empty()) j["missingChunks"] = r.missing_chunks;
}

void to_json(nlohmann::json& j, const session_status& s) {
    j = nlohmann::json{
        {"uploadId", s.upload_id},
        {"status", to_string(s.status)},
        {"progress", s.progress},
        {"receivedChunks", s.received_chunks},
        {"totalChunks", s.total_chunks},
        {"createdAt", s.created_at},
        {"completedAt", nullptr},
    };
    if (s.completed_at) j["completedAt"] = *s.completed_at;
}

void to_json(nlohmann::json& j, const evidence_record& e) {
    j = nlohmann::json{
        {"id", e.id},
        {"fileName", e.file_name},
        {"metadata", e.metadata},
        {"uploadedAt", e.uploaded_at},
        {"size", e.size},
        {"sha256", e.sha256},
    };
}

void to_json(nlohmann::json& j, const error_body& e) {
    j = nlohmann::json{{"error", e.error}, {"message", e.message}};
}

auto parse_chunk_receipt(std::string_view body) -> result<chunk_receipt> {
    auto j = parse_object(body);
    if (!j) {
        return malformed("chunk response is not a JSON object");
    }

    const auto& obj = *j;
    if (!obj.contains("uploadId") || !obj["uploadId"].is_string() ||
        obj["uploadId"].get<std::string>().empty()) {
        return malformed("chunk response without uploadId");
    }
    if (!obj.contains("status") || !obj["status"].is_string()) {
        return malformed("chunk response without status");
    }
    auto state = parse_session_state(obj["status"].get<std::string>());
    if (!state) {
        return malformed("unknown session status '" + obj["status"].get<std::string>() + "'");
    }
    if (!obj.contains("progress") || !obj["progress"].is_number()) {
        return malformed("chunk response without progress");
    }

    chunk_receipt r;
    r.upload_id = obj["uploadId"].get<std::string>();
    r.status = *state;
    r.progress = obj["progress"].get<int>();
    r.received_chunks = uint_or(obj, "receivedChunks");
    r.message = string_or(obj, "message");
    if (obj.contains("totalChunks") && obj["totalChunks"].is_number_unsigned()) {
        r.total_chunks = obj["totalChunks"].get<uint64_t>();
    }
    if (obj.contains("evidenceId") && obj["evidenceId"].is_string()) {
        r.evidence_id = obj["evidenceId"].get<std::string>();
    }
    if (obj.contains("sha256") && obj["sha256"].is_string()) {
        r.sha256 = obj["sha256"].get<std::string>();
    }
    if (obj.contains("missingChunks") && obj["missingChunks"].is_array()) {
        for (const auto& idx : obj["missingChunks"]) {
            if (idx.is_number_unsigned()) {
                r.missing_chunks.push_back(idx.get<uint64_t>());
            }
        }
    }
    return r;
}

auto parse_session_status(std::string_view body) -> result<session_status> {
    auto j = parse_object(body);
    if (!j) {
        return malformed("status response is not a JSON object");
    }

    const auto& obj = *j;
    if (!obj.contains("uploadId") || !obj["uploadId"].is_string() ||
        obj["uploadId"].get<std::string>().empty()) {
        return malformed("status response without uploadId");
    }
    auto state = parse_session_state(string_or(obj, "status"));
    if (!state) {
        return malformed("status response without a known status");
    }
    if (obj.contains("progress") && !obj["progress"].is_number()) {
        return malformed("status response with non-numeric progress");
    }

    session_status s;
    s.upload_id = obj["uploadId"].get<std::string>();
    s.status = *state;
    s.progress = obj.contains("progress") ? obj["progress"].get<int>() : 0;
    s.received_chunks = uint_or(obj, "receivedChunks");
    s.total_chunks = uint_or(obj, "totalChunks");
    s.created_at = string_or(obj, "createdAt");
    if (obj.contains("completedAt") && obj["completedAt"].is_string()) {
        s.completed_at = obj["completedAt"].get<std::string>();
    }
    return s;
}

auto parse_error_body(std::string_view body) -> error_body {
    auto j = parse_object(body);
    if (!j) {
        return error_body{"", std::string(body)};
    }
    return error_body{string_or(*j, "error"), string_or(*j, "message")};
}

auto encode_chunk_request(const chunk_request& request) -> multipart_form {
    multipart_form form;
    form.add_file(std::string(field::chunk), request.file_name, request.bytes);
    form.add_field(std::string(field::chunk_index), std::to_string(request.chunk_index));
    form.add_field(std::string(field::total_chunks), std::to_string(request.total_chunks));
    if (request.upload_id) {
        form.add_field(std::string(field::upload_id), *request.upload_id);
    }
    form.add_field(std::string(field::file_name), request.file_name);
    form.add_field(std::string(field::metadata),
                   request.metadata_json.empty() ? "{}" : request.metadata_json);
    return form;
}

auto decode_chunk_request(const multipart_form& form) -> result<chunk_request> {
    const auto* chunk = form.find(field::chunk);
    if (!chunk) {
        return unexpected(error{error_code::invalid_request, "missing 'chunk' part"});
    }

    auto index_text = form.field(field::chunk_index);
    auto index = index_text ? parse_uint(*index_text) : std::nullopt;
    if (!index) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunkIndex must be a non-negative integer"});
    }

    auto total_text = form.field(field::total_chunks);
    auto total = total_text ? parse_uint(*total_text) : std::nullopt;
    if (!total) {
        return unexpected(error{error_code::invalid_request,
                                "totalChunks must be a non-negative integer"});
    }

    chunk_request request;
    request.chunk_index = *index;
    request.total_chunks = *total;
    if (auto id = form.field(field::upload_id); id && !id->empty()) {
        request.upload_id = std::move(*id);
    }
    request.file_name = form.field(field::file_name).value_or("");
    request.metadata_json = form.field(field::metadata).value_or("");
    const auto* data = reinterpret_cast<const std::byte*>(chunk->data.data());
    request.bytes.assign(data, data + chunk->data.size());
    return request;
}

}  // namespace upload_pipeline::protocol
