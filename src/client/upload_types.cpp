/**
 * @file upload_types.cpp
 * @brief Upload item helpers and metadata serialization
 */

#include "upload_pipeline/client/upload_types.h"

#include "upload_pipeline/core/timestamp.h"
#include "upload_pipeline/core/unique_id.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <utility>

namespace upload_pipeline {

auto parse_upload_status(std::string_view s) -> std::optional<upload_status> {
    for (auto status : {upload_status::queued, upload_status::uploading, upload_status::paused,
                        upload_status::completed, upload_status::failed,
                        upload_status::cancelled}) {
        if (s == to_string(status)) {
            return status;
        }
    }
    return std::nullopt;
}

void to_json(nlohmann::json& j, const upload_metadata& m) {
    j = m.extra.is_object() ? m.extra : nlohmann::json::object();
    j["title"] = m.title;
    j["description"] = m.description;
    j["tags"] = m.tags;
    j["timestamp"] = m.timestamp;
    if (m.location) {
        nlohmann::json loc{{"latitude", m.location->latitude},
                           {"longitude", m.location->longitude}};
        if (m.location->accuracy) {
            loc["accuracy"] = *m.location->accuracy;
        }
        j["location"] = std::move(loc);
    } else {
        j["location"] = nullptr;
    }
}

void from_json(const nlohmann::json& j, upload_metadata& m) {
    m = upload_metadata{};
    if (!j.is_object()) {
        return;
    }

    m.title = j.value("title", std::string{});
    m.description = j.value("description", std::string{});
    m.timestamp = j.value("timestamp", std::string{});
    if (auto it = j.find("tags"); it != j.end() && it->is_array()) {
        for (const auto& tag : *it) {
            if (tag.is_string()) m.tags.push_back(tag.get<std::string>());
        }
    }
    if (auto it = j.find("location"); it != j.end() && it->is_object() &&
                                      it->contains("latitude") && (*it)["latitude"].is_number() &&
                                      it->contains("longitude") &&
                                      (*it)["longitude"].is_number()) {
        geolocation loc;
        loc.latitude = (*it)["latitude"].get<double>();
        loc.longitude = (*it)["longitude"].get<double>();
        if (it->contains("accuracy") && (*it)["accuracy"].is_number()) {
            loc.accuracy = (*it)["accuracy"].get<double>();
        }
        m.location = loc;
    }

    for (const auto& [key, value] : j.items()) {
        if (key != "title" && key != "description" && key != "tags" &&
            key != "location" && key != "timestamp") {
            m.extra[key] = value;
        }
    }
}

auto compute_progress(uint64_t uploaded_bytes, uint64_t file_size) -> int {
    if (file_size == 0) {
        return 0;
    }
    auto ratio = static_cast<double>(std::min(uploaded_bytes, file_size)) /
                 static_cast<double>(file_size);
    return static_cast<int>(std::lround(ratio * 100.0));
}

auto guess_file_type(std::string_view file_name) -> std::string {
    auto dot = file_name.find_last_of('.');
    if (dot == std::string_view::npos) {
        return "application/octet-stream";
    }

    std::string ext(file_name.substr(dot + 1));
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const std::pair<std::string_view, std::string_view> types[] = {
        {"jpg", "image/jpeg"}, {"jpeg", "image/jpeg"}, {"png", "image/png"},
        {"gif", "image/gif"},  {"webp", "image/webp"}, {"heic", "image/heic"},
        {"mp4", "video/mp4"},  {"mov", "video/quicktime"}, {"pdf", "application/pdf"},
        {"txt", "text/plain"}, {"json", "application/json"}, {"zip", "application/zip"},
    };
    for (const auto& [e, mime] : types) {
        if (ext == e) {
            return std::string(mime);
        }
    }
    return "application/octet-stream";
}

auto make_upload_item(std::shared_ptr<byte_source> source,
                      std::string file_name,
                      upload_metadata metadata) -> upload_item {
    upload_item item;
    item.id = make_item_id();
    item.file_size = source ? source->size() : 0;
    item.source_path = source ? source->persistent_path() : std::nullopt;
    item.file = std::move(source);
    item.file_type = guess_file_type(file_name);
    item.file_name = std::move(file_name);
    if (metadata.title.empty()) {
        metadata.title = item.file_name;
    }
    if (metadata.timestamp.empty()) {
        metadata.timestamp = iso8601_now();
    }
    item.metadata = std::move(metadata);
    item.created_at = iso8601_now();
    return item;
}

auto make_upload_item(const std::filesystem::path& path, upload_metadata metadata)
    -> result<upload_item> {
    auto source = file_byte_source::open(path);
    if (!source) {
        return unexpected(source.error());
    }
    return make_upload_item(std::move(source.value()), path.filename().string(),
                            std::move(metadata));
}

auto queue_config::validate() const -> result<void> {
    if (max_concurrent == 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "max_concurrent must be at least 1"});
    }
    if (retry.max_chunk_retries < 0 || retry.max_item_retries < 1) {
        return unexpected(error{error_code::invalid_configuration,
                                "retry limits must be non-negative (item limit at least 1)"});
    }
    if (retry.max_chunk_retries > 30) {
        return unexpected(error{error_code::invalid_configuration,
                                "max_chunk_retries too large for exponential backoff"});
    }
    if (retry.base_delay.count() < 0) {
        return unexpected(error{error_code::invalid_configuration,
                                "base_delay must not be negative"});
    }
    return layout.validate();
}

auto queue_stats::from_items(const std::vector<upload_item>& items) -> queue_stats {
    queue_stats stats;
    stats.total = items.size();
    for (const auto& item : items) {
        switch (item.status) {
            case upload_status::queued: ++stats.queued; break;
            case upload_status::uploading: ++stats.uploading; break;
            case upload_status::paused: ++stats.paused; break;
            case upload_status::completed: ++stats.completed; break;
            case upload_status::failed: ++stats.failed; break;
            case upload_status::cancelled: ++stats.cancelled; break;
        }
    }
    return stats;
}

auto queue_snapshot::find(std::string_view id) const -> const upload_item* {
    auto it = std::find_if(items.begin(), items.end(),
                           [&](const upload_item& item) { return item.id == id; });
    return it != items.end() ? &*it : nullptr;
}

}  // namespace upload_pipeline
