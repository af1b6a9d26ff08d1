/**
 * @file upload_queue.h
 * @brief Upload queue with a global concurrency cap
 */

#ifndef UPLOAD_PIPELINE_CLIENT_UPLOAD_QUEUE_H
#define UPLOAD_PIPELINE_CLIENT_UPLOAD_QUEUE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "upload_pipeline/adapters/runner_pool.h"
#include "upload_pipeline/client/chunk_transport.h"
#include "upload_pipeline/client/queue_store.h"
#include "upload_pipeline/client/upload_types.h"

namespace upload_pipeline {

/**
 * @brief Owns the upload items and dispatches them to item runners
 *
 * At most config.max_concurrent items are UPLOADING at any time. An item
 * stays in the active set until its runner has returned, so a paused and
 * immediately resumed item is not admitted twice.
 *
 * @code
 * auto queue_result = upload_queue::builder()
 *     .with_transport(transport)
 *     .with_store(std::make_shared<json_file_queue_store>("queue.json"))
 *     .with_max_concurrent(3)
 *     .build();
 *
 * if (queue_result.has_value()) {
 *     auto& queue = queue_result.value();
 *     queue.enqueue(std::move(item));
 * }
 * @endcode
 */
class upload_queue {
public:
    using snapshot_callback = std::function<void(const queue_snapshot&)>;

    class builder {
    public:
        builder();

        /// Required
        auto with_transport(std::shared_ptr<chunk_transport> transport) -> builder&;

        /// Defaults to no persistence
        auto with_store(std::shared_ptr<queue_store> store) -> builder&;

        /// Defaults to runner_pool_factory::create(max_concurrent)
        auto with_pool(std::shared_ptr<adapters::runner_pool_interface> pool) -> builder&;

        auto with_config(const queue_config& config) -> builder&;

        auto with_max_concurrent(std::size_t max_concurrent) -> builder&;

        auto with_chunk_size(std::size_t chunk_size) -> builder&;

        auto with_retry_policy(const retry_policy& policy) -> builder&;

        /**
         * @brief Build the queue, restore stored items and start scheduling
         */
        [[nodiscard]] auto build() -> result<upload_queue>;

    private:
        std::shared_ptr<chunk_transport> transport_;
        std::shared_ptr<queue_store> store_;
        std::shared_ptr<adapters::runner_pool_interface> pool_;
        queue_config config_;
    };

    ~upload_queue();

    upload_queue(const upload_queue&) = delete;
    auto operator=(const upload_queue&) -> upload_queue& = delete;
    upload_queue(upload_queue&&) noexcept;
    auto operator=(upload_queue&&) noexcept -> upload_queue&;

    /**
     * @brief Append an item; it is forced to QUEUED with zeroed counters
     * @return Id of the item
     */
    auto enqueue(upload_item item) -> std::string;

    auto enqueue(std::vector<upload_item> items) -> std::vector<std::string>;

    // Each action returns true when the item changed state. Unknown ids and
    // states that do not allow the action are no-ops.

    /// UPLOADING -> PAUSED; aborts the in-flight chunk
    auto pause(const std::string& id) -> bool;

    /// PAUSED -> QUEUED
    auto resume(const std::string& id) -> bool;

    /// QUEUED / UPLOADING / PAUSED -> CANCELLED
    auto cancel(const std::string& id) -> bool;

    /// FAILED / CANCELLED -> QUEUED, restarting from byte 0
    auto retry(const std::string& id) -> bool;

    /// Drop a COMPLETED, FAILED or CANCELLED item
    auto remove(const std::string& id) -> bool;

    /// @return Number of COMPLETED items dropped
    auto clear_completed() -> std::size_t;

    /// Cancel everything in flight and drop every item
    void clear_all();

    [[nodiscard]] auto snapshot() const -> queue_snapshot;

    [[nodiscard]] auto find(const std::string& id) const -> std::optional<upload_item>;

    /**
     * @brief Receive a snapshot after every observable change
     *
     * Callbacks run outside the queue lock and may call back into the
     * queue, except for shutdown().
     */
    auto subscribe(snapshot_callback callback) -> uint64_t;

    void unsubscribe(uint64_t subscription);

    /**
     * @brief Block until no runner is active and nothing is QUEUED
     * @return false on timeout
     */
    [[nodiscard]] auto wait_until_idle(std::chrono::milliseconds timeout) -> bool;

    /**
     * @brief Abort every runner and wait for it to return
     *
     * Item state is kept as is and persisted, so UPLOADING items come
     * back QUEUED after a restart. Idempotent.
     */
    void shutdown();

    [[nodiscard]] auto config() const -> const queue_config&;

private:
    struct impl;
    explicit upload_queue(std::unique_ptr<impl> impl);

    std::unique_ptr<impl> impl_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CLIENT_UPLOAD_QUEUE_H
