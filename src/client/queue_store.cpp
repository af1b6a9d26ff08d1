/**
 * @file queue_store.cpp
 * @brief JSON persistence of upload items
 */

#include "upload_pipeline/client/queue_store.h"

#include "upload_pipeline/core/file_io.h"
#include "upload_pipeline/core/logging.h"

#include <algorithm>

namespace upload_pipeline {

namespace {

auto items_from_array(const nlohmann::json& array) -> std::vector<upload_item> {
    std::vector<upload_item> items;
    if (!array.is_array()) {
        return items;
    }
    for (const auto& entry : array) {
        auto item = item_from_json(entry);
        if (!item) {
            UP_LOG_WARN(log_category::store, "skipping stored item: " + item.error().message);
            continue;
        }
        items.push_back(std::move(item.value()));
    }
    return items;
}

auto items_to_array(const std::vector<upload_item>& items) -> nlohmann::json {
    auto array = nlohmann::json::array();
    for (const auto& item : items) {
        array.push_back(item_to_json(item));
    }
    return array;
}

}  // namespace

auto item_to_json(const upload_item& item) -> nlohmann::json {
    nlohmann::json j{
        {"id", item.id},
        {"fileName", item.file_name},
        {"fileSize", item.file_size},
        {"fileType", item.file_type},
        {"metadata", item.metadata},
        {"status", to_string(item.status)},
        {"progress", item.progress},
        {"uploadedBytes", item.uploaded_bytes},
        {"retryCount", item.retry_count},
        {"error", nullptr},
        {"serverSessionId", nullptr},
        {"sourcePath", nullptr},
        {"createdAt", item.created_at},
    };
    if (item.error) j["error"] = *item.error;
    if (item.server_session_id) j["serverSessionId"] = *item.server_session_id;
    if (item.source_path) j["sourcePath"] = item.source_path->string();
    return j;
}

auto item_from_json(const nlohmann::json& j) -> result<upload_item> {
    try {
        if (!j.is_object() || !j.contains("id") || !j["id"].is_string()) {
            return unexpected(error{error_code::store_error, "stored item without id"});
        }

        auto status = parse_upload_status(j.value("status", std::string{}));
        if (!status) {
            return unexpected(error{error_code::store_error,
                                    "stored item " + j["id"].get<std::string>() +
                                        " has an unknown status"});
        }

        upload_item item;
        item.id = j["id"].get<std::string>();
        item.file_name = j.value("fileName", std::string{});
        item.file_size = j.value("fileSize", uint64_t{0});
        item.file_type = j.value("fileType", std::string{});
        if (j.contains("metadata")) {
            item.metadata = j["metadata"].get<upload_metadata>();
        }
        item.status = *status == upload_status::uploading ? upload_status::queued : *status;
        item.uploaded_bytes = std::min(j.value("uploadedBytes", uint64_t{0}), item.file_size);
        item.progress = item.status == upload_status::completed
                            ? 100
                            : compute_progress(item.uploaded_bytes, item.file_size);
        item.retry_count = j.value("retryCount", 0);
        item.created_at = j.value("createdAt", std::string{});
        if (j.contains("error") && j["error"].is_string()) {
            item.error = j["error"].get<std::string>();
        }
        if (j.contains("serverSessionId") && j["serverSessionId"].is_string()) {
            item.server_session_id = j["serverSessionId"].get<std::string>();
        }
        if (j.contains("sourcePath") && j["sourcePath"].is_string()) {
            item.source_path = std::filesystem::path(j["sourcePath"].get<std::string>());

            auto source = file_byte_source::open(*item.source_path);
            if (source && source.value()->size() == item.file_size) {
                item.file = std::move(source.value());
            }
        }
        return item;
    } catch (const nlohmann::json::exception& e) {
        return unexpected(error{error_code::store_error,
                                std::string("malformed stored item: ") + e.what()});
    }
}

// ============================================================================
// json_file_queue_store
// ============================================================================

json_file_queue_store::json_file_queue_store(std::filesystem::path path)
    : path_(std::move(path)) {}

void json_file_queue_store::save(const std::vector<upload_item>& items) {
    nlohmann::json document{
        {"version", format_version},
        {"items", items_to_array(items)},
    };

    std::lock_guard lock(mutex_);
    auto written = write_file_atomic(
        path_, document.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
    if (!written) {
        UP_LOG_WARN(log_category::store,
                    "failed to persist upload queue: " + written.error().message);
    }
}

auto json_file_queue_store::load() -> std::vector<upload_item> {
    std::lock_guard lock(mutex_);

    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return {};
    }

    auto content = read_file(path_);
    if (!content) {
        UP_LOG_WARN(log_category::store, "cannot read upload queue: " + content.error().message);
        return {};
    }

    auto document = nlohmann::json::parse(content.value(), nullptr, false);
    if (document.is_discarded() || !document.is_object()) {
        UP_LOG_WARN(log_category::store, "ignoring corrupt upload queue file " + path_.string());
        return {};
    }
    auto version = document.find("version");
    if (version == document.end() || !version->is_number_integer() ||
        version->get<int>() != format_version) {
        UP_LOG_WARN(log_category::store, "ignoring upload queue with unsupported version");
        return {};
    }

    auto items = items_from_array(document.contains("items") ? document["items"]
                                                             : nlohmann::json::array());
    UP_LOG_INFO(log_category::store,
                "restored " + std::to_string(items.size()) + " upload item(s)");
    return items;
}

// ============================================================================
// memory_queue_store
// ============================================================================

void memory_queue_store::save(const std::vector<upload_item>& items) {
    auto array = items_to_array(items);
    std::lock_guard lock(mutex_);
    document_ = std::move(array);
    ++save_count_;
}

auto memory_queue_store::load() -> std::vector<upload_item> {
    nlohmann::json copy;
    {
        std::lock_guard lock(mutex_);
        copy = document_;
    }
    return items_from_array(copy);
}

auto memory_queue_store::last_saved() const -> nlohmann::json {
    std::lock_guard lock(mutex_);
    return document_;
}

}  // namespace upload_pipeline
