/**
 * @file queue_store.h
 * @brief Durable storage of the upload queue across restarts
 */

#ifndef UPLOAD_PIPELINE_CLIENT_QUEUE_STORE_H
#define UPLOAD_PIPELINE_CLIENT_QUEUE_STORE_H

#include <atomic>
#include <filesystem>
#include <mutex>
#include <vector>

#include <nlohmann/json.hpp>

#include "upload_pipeline/client/upload_types.h"

namespace upload_pipeline {

/**
 * @brief Persistence interface injected into upload_queue
 *
 * save() is best effort: failures are logged, never reported. load()
 * returns an empty list when nothing usable was stored.
 */
class queue_store {
public:
    virtual ~queue_store() = default;

    virtual void save(const std::vector<upload_item>& items) = 0;

    [[nodiscard]] virtual auto load() -> std::vector<upload_item> = 0;
};

/**
 * @brief Serialize every field of @p item except its byte content
 */
[[nodiscard]] auto item_to_json(const upload_item& item) -> nlohmann::json;

/**
 * @brief Rebuild an item from item_to_json() output
 *
 * The byte source is reattached when source_path still names a file of
 * the recorded size. An item that was UPLOADING comes back QUEUED.
 */
[[nodiscard]] auto item_from_json(const nlohmann::json& j) -> result<upload_item>;

/**
 * @brief JSON document on disk: { "version": 1, "items": [...] }
 */
class json_file_queue_store : public queue_store {
public:
    static constexpr int format_version = 1;

    explicit json_file_queue_store(std::filesystem::path path);

    void save(const std::vector<upload_item>& items) override;

    [[nodiscard]] auto load() -> std::vector<upload_item> override;

    [[nodiscard]] auto path() const -> const std::filesystem::path& { return path_; }

private:
    std::filesystem::path path_;
    std::mutex mutex_;
};

/**
 * @brief In-memory store, mainly for tests
 *
 * Keeps the serialized form so load() behaves like a restart.
 */
class memory_queue_store : public queue_store {
public:
    void save(const std::vector<upload_item>& items) override;

    [[nodiscard]] auto load() -> std::vector<upload_item> override;

    [[nodiscard]] auto save_count() const -> std::size_t { return save_count_.load(); }

    [[nodiscard]] auto last_saved() const -> nlohmann::json;

private:
    mutable std::mutex mutex_;
    nlohmann::json document_ = nlohmann::json::array();
    std::atomic<std::size_t> save_count_{0};
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_QUEUE_STORE_H
