/**
 * @file server_types.cpp
 * @brief Server configuration validation and session records
 */

#include "upload_pipeline/server/server_types.h"

#include <cmath>

namespace upload_pipeline {

auto server_config::validate() const -> result<void> {
    if (upload_directory.empty() || temp_directory.empty()) {
        return unexpected(error{error_code::invalid_configuration,
                                "upload and temp directories are required"});
    }
    if (route_prefix.empty() || route_prefix.front() != '/' || route_prefix.back() == '/') {
        return unexpected(error{error_code::invalid_configuration,
                                "route prefix must start with '/' and not end with one"});
    }
    if (max_chunk_size == 0) {
        return unexpected(error{error_code::invalid_chunk_size, "max chunk size must be positive"});
    }
    if (worker_threads == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "at least one worker thread is required"});
    }
    return {};
}

auto upload_session::progress() const -> int {
    if (total_chunks == 0) {
        return 0;
    }
    return static_cast<int>(std::lround(static_cast<double>(received.size()) * 100.0 /
                                        static_cast<double>(total_chunks)));
}

auto upload_session::missing() const -> std::vector<uint64_t> {
    std::vector<uint64_t> result;
    for (uint64_t i = 0; i < total_chunks; ++i) {
        if (received.count(i) == 0) {
            result.push_back(i);
        }
    }
    return result;
}

void to_json(nlohmann::json& j, const upload_session& s) {
    j = nlohmann::json{
        {"id", s.id},
        {"fileName", s.file_name},
        {"metadata", s.metadata},
        {"totalChunks", s.total_chunks},
        {"received", s.received},
        {"status", protocol::to_string(s.status)},
        {"createdAt", s.created_at},
        {"completedAt", nullptr},
        {"artifactPath", nullptr},
        {"artifactSize", s.artifact_size},
        {"sha256", s.sha256},
    };
    if (s.completed_at) j["completedAt"] = *s.completed_at;
    if (s.artifact_path) j["artifactPath"] = s.artifact_path->string();
}

auto session_from_json(const nlohmann::json& j) -> result<upload_session> {
    try {
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string() ||
            !j.contains("totalChunks") || !j["totalChunks"].is_number_unsigned()) {
            return unexpected(error{error_code::store_error, "incomplete session record"});
        }
        auto status = protocol::parse_session_state(j.value("status", std::string{}));
        if (!status) {
            return unexpected(
                error{error_code::store_error, "session record with unknown status"});
        }

        upload_session s;
        s.id = j["id"].get<std::string>();
        s.file_name = j.value("fileName", std::string{});
        s.metadata = j.value("metadata", nlohmann::json::object());
        s.total_chunks = j["totalChunks"].get<uint64_t>();
        if (j.contains("received") && j["received"].is_array()) {
            for (const auto& index : j["received"]) {
                if (index.is_number_unsigned() && index.get<uint64_t>() < s.total_chunks) {
                    s.received.insert(index.get<uint64_t>());
                }
            }
        }
        s.status = *status;
        s.created_at = j.value("createdAt", std::string{});
        if (j.contains("completedAt") && j["completedAt"].is_string()) {
            s.completed_at = j["completedAt"].get<std::string>();
        }
        if (j.contains("artifactPath") && j["artifactPath"].is_string()) {
            s.artifact_path = std::filesystem::path(j["artifactPath"].get<std::string>());
        }
        s.artifact_size = j.value("artifactSize", uint64_t{0});
        s.sha256 = j.value("sha256", std::string{});
        return s;
    } catch (const nlohmann::json::exception& e) {
        return unexpected(error{error_code::store_error,
                                std::string("malformed session record: ") + e.what()});
    }
}

}  // namespace upload_pipeline
