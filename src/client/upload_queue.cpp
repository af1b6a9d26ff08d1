/**
 * @file upload_queue.cpp
 * @brief Upload queue scheduling and item state transitions
 */

#include "upload_pipeline/client/upload_queue.h"

#include <algorithm>
#include <condition_variable>
#include <exception>
#include <list>
#include <map>
#include <mutex>

#include "upload_pipeline/client/transfer_client.h"
#include "upload_pipeline/client/upload_item_runner.h"
#include "upload_pipeline/core/cancellation.h"
#include "upload_pipeline/core/logging.h"
#include "upload_pipeline/core/unique_id.h"

namespace upload_pipeline {

namespace {

auto context_for(const upload_item& item) -> upload_log_context {
    upload_log_context ctx;
    ctx.item_id = item.id;
    ctx.upload_id = item.server_session_id.value_or("");
    ctx.file_name = item.file_name;
    ctx.file_size = item.file_size;
    ctx.uploaded_bytes = item.uploaded_bytes;
    ctx.progress = item.progress;
    ctx.retry_count = item.retry_count;
    return ctx;
}

void reset_progress(upload_item& item) {
    item.uploaded_bytes = 0;
    item.progress = 0;
    item.server_session_id.reset();
}

}  // namespace

// ============================================================================
// upload_queue::impl
// ============================================================================

struct upload_queue::impl {
    /// Snapshot captured under the lock, delivered after it is released
    struct publication {
        uint64_t sequence = 0;
        queue_snapshot snapshot;
    };

    queue_config config;
    std::shared_ptr<chunk_transport> transport;
    std::shared_ptr<queue_store> store;
    std::shared_ptr<adapters::runner_pool_interface> pool;
    transfer_client client;
    upload_item_runner runner;

    mutable std::mutex mutex;
    std::condition_variable state_cv;
    std::vector<upload_item> items;
    std::map<std::string, std::shared_ptr<cancellation_token>> active;
    std::list<std::future<void>> runs;
    uint64_t sequence = 0;
    bool stopping = false;

    std::mutex store_mutex;
    uint64_t last_saved = 0;

    std::mutex subscriber_mutex;
    std::map<uint64_t, snapshot_callback> subscribers;
    uint64_t next_subscription = 1;

    std::recursive_mutex delivery_mutex;
    uint64_t last_delivered = 0;

    impl(queue_config cfg,
         std::shared_ptr<chunk_transport> t,
         std::shared_ptr<queue_store> s,
         std::shared_ptr<adapters::runner_pool_interface> p)
        : config(std::move(cfg)),
          transport(std::move(t)),
          store(std::move(s)),
          pool(std::move(p)),
          client(transport, config.retry),
          runner(client, config.layout) {}

    auto find_locked(const std::string& id) -> upload_item* {
        auto it = std::find_if(items.begin(), items.end(),
                               [&](const upload_item& item) { return item.id == id; });
        return it == items.end() ? nullptr : &*it;
    }

    auto snapshot_locked() const -> queue_snapshot {
        queue_snapshot snap;
        snap.items = items;
        snap.stats = queue_stats::from_items(items);
        snap.active_count = active.size();
        return snap;
    }

    auto capture_locked() -> publication {
        return publication{++sequence, snapshot_locked()};
    }

    auto idle_locked() const -> bool {
        if (!active.empty()) {
            return false;
        }
        if (stopping) {
            return true;
        }
        return std::none_of(items.begin(), items.end(), [](const upload_item& item) {
            return item.status == upload_status::queued;
        });
    }

    void persist(const publication& pub) {
        if (!store) {
            return;
        }
        std::lock_guard lock(store_mutex);
        if (pub.sequence <= last_saved) {
            return;
        }
        store->save(pub.snapshot.items);
        last_saved = pub.sequence;
    }

    void notify(const publication& pub) {
        std::vector<snapshot_callback> callbacks;
        {
            std::lock_guard lock(subscriber_mutex);
            callbacks.reserve(subscribers.size());
            for (const auto& [id, callback] : subscribers) {
                callbacks.push_back(callback);
            }
        }

        std::lock_guard delivery(delivery_mutex);
        if (pub.sequence < last_delivered) {
            return;
        }
        last_delivered = pub.sequence;
        for (const auto& callback : callbacks) {
            try {
                callback(pub.snapshot);
            } catch (const std::exception& e) {
                UP_LOG_WARN(log_category::queue,
                            std::string("queue subscriber threw: ") + e.what());
            }
        }
    }

    void publish(const publication& pub) {
        persist(pub);
        notify(pub);
        state_cv.notify_all();
    }

    void reap_finished_locked() {
        runs.remove_if([](std::future<void>& run) {
            return run.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
        });
    }

    /**
     * @brief Admit QUEUED items up to the concurrency cap
     */
    void schedule() {
        publication pub;
        {
            std::lock_guard lock(mutex);
            if (stopping) {
                return;
            }
            reap_finished_locked();

            bool admitted = false;
            for (auto& item : items) {
                if (active.size() >= config.max_concurrent) {
                    break;
                }
                if (item.status != upload_status::queued || active.count(item.id) != 0) {
                    continue;
                }

                item.status = upload_status::uploading;
                auto token = std::make_shared<cancellation_token>();
                active.emplace(item.id, token);
                admitted = true;

                item_run_plan plan;
                plan.item_id = item.id;
                plan.file = item.file;
                plan.file_name = item.file_name;
                plan.file_size = item.file_size;
                plan.metadata_json = nlohmann::json(item.metadata).dump(
                    -1, ' ', false, nlohmann::json::error_handler_t::replace);
                plan.uploaded_bytes = item.uploaded_bytes;
                plan.server_session_id = item.server_session_id;

                auto ctx = context_for(item);
                UP_LOG_INFO_CTX(log_category::queue, "starting upload", ctx);

                // Submitted under the lock so shutdown() always sees the future.
                runs.push_back(pool->submit(
                    [this, plan = std::move(plan), token]() { run_item(plan, token); }));
            }

            if (!admitted) {
                return;
            }
            pub = capture_locked();
        }
        publish(pub);
    }

    void run_item(const item_run_plan& plan, const std::shared_ptr<cancellation_token>& token) {
        run_outcome outcome;
        try {
            outcome = runner.run(plan, *token,
                                 [&](const protocol::chunk_receipt& receipt, uint64_t bytes) {
                                     on_chunk_confirmed(plan.item_id, token, receipt, bytes);
                                 });
        } catch (const std::exception& e) {
            outcome.kind = run_result_kind::failed;
            outcome.err = error{error_code::internal_error, e.what()};
        }
        finish_run(plan.item_id, token, outcome);
    }

    void on_chunk_confirmed(const std::string& id,
                            const std::shared_ptr<cancellation_token>& token,
                            const protocol::chunk_receipt& receipt,
                            uint64_t uploaded_bytes) {
        publication pub;
        {
            std::lock_guard lock(mutex);
            // A reply that lands after pause or cancel must not move the item.
            if (token->is_cancelled()) {
                return;
            }
            auto* item = find_locked(id);
            if (!item || item->status != upload_status::uploading) {
                return;
            }
            item->uploaded_bytes =
                std::max(item->uploaded_bytes, std::min(uploaded_bytes, item->file_size));
            item->progress = compute_progress(item->uploaded_bytes, item->file_size);
            item->server_session_id = receipt.upload_id;
            pub = capture_locked();
        }
        publish(pub);
    }

    void apply_outcome_locked(upload_item& item, const run_outcome& outcome) {
        auto ctx = context_for(item);
        const std::string message = outcome.err ? outcome.err->message : std::string{};

        switch (outcome.kind) {
            case run_result_kind::completed:
                item.status = upload_status::completed;
                item.uploaded_bytes = item.file_size;
                item.progress = 100;
                item.error.reset();
                ctx.uploaded_bytes = item.file_size;
                ctx.progress = 100;
                UP_LOG_INFO_CTX(log_category::queue, "upload completed", ctx);
                break;

            case run_result_kind::failed:
                item.retry_count += 1;
                ctx.retry_count = item.retry_count;
                ctx.error_message = message;
                if (item.retry_count < config.retry.max_item_retries) {
                    item.status = upload_status::queued;
                    item.error = message;
                    UP_LOG_WARN_CTX(log_category::queue, "upload failed, requeued", ctx);
                } else {
                    item.status = upload_status::failed;
                    item.error = "Upload failed after " + std::to_string(item.retry_count) +
                                 " attempts: " + message;
                    UP_LOG_ERROR_CTX(log_category::queue, "upload failed", ctx);
                }
                break;

            case run_result_kind::failed_permanently:
                item.status = upload_status::failed;
                item.error = message;
                ctx.error_message = message;
                UP_LOG_ERROR_CTX(log_category::queue, "upload rejected", ctx);
                break;

            case run_result_kind::session_lost:
                reset_progress(item);
                item.status = upload_status::queued;
                UP_LOG_WARN_CTX(log_category::queue,
                                "server session lost, restarting from chunk 0", ctx);
                break;

            case run_result_kind::cancelled:
                // Token tripped without a state change: only shutdown does that.
                if (!stopping) {
                    item.status = upload_status::queued;
                }
                break;
        }
    }

    void finish_run(const std::string& id,
                    const std::shared_ptr<cancellation_token>& token,
                    const run_outcome& outcome) {
        publication pub;
        {
            std::lock_guard lock(mutex);
            auto it = active.find(id);
            if (it != active.end() && it->second == token) {
                active.erase(it);
            }
            auto* item = find_locked(id);
            if (item && item->status == upload_status::uploading) {
                apply_outcome_locked(*item, outcome);
            }
            pub = capture_locked();
        }
        publish(pub);
        schedule();
    }

    /**
     * @brief Run @p mutate under the lock; publish and schedule if it changed anything
     */
    template <typename Mutation>
    auto mutate(Mutation&& mutation) -> bool {
        publication pub;
        std::shared_ptr<cancellation_token> abort;
        {
            std::lock_guard lock(mutex);
            if (!mutation(abort)) {
                return false;
            }
            pub = capture_locked();
        }
        if (abort) {
            abort->cancel();
        }
        publish(pub);
        schedule();
        return true;
    }

    auto active_token_locked(const std::string& id) -> std::shared_ptr<cancellation_token> {
        auto it = active.find(id);
        return it == active.end() ? nullptr : it->second;
    }
};

// ============================================================================
// upload_queue::builder
// ============================================================================

upload_queue::builder::builder() = default;

auto upload_queue::builder::with_transport(std::shared_ptr<chunk_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto upload_queue::builder::with_store(std::shared_ptr<queue_store> store) -> builder& {
    store_ = std::move(store);
    return *this;
}

auto upload_queue::builder::with_pool(std::shared_ptr<adapters::runner_pool_interface> pool)
    -> builder& {
    pool_ = std::move(pool);
    return *this;
}

auto upload_queue::builder::with_config(const queue_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto upload_queue::builder::with_max_concurrent(std::size_t max_concurrent) -> builder& {
    config_.max_concurrent = max_concurrent;
    return *this;
}

auto upload_queue::builder::with_chunk_size(std::size_t chunk_size) -> builder& {
    config_.layout.chunk_size = chunk_size;
    return *this;
}

auto upload_queue::builder::with_retry_policy(const retry_policy& policy) -> builder& {
    config_.retry = policy;
    return *this;
}

auto upload_queue::builder::build() -> result<upload_queue> {
    if (!transport_) {
        return unexpected(error{error_code::invalid_configuration,
                                "upload queue requires a chunk transport"});
    }
    auto valid = config_.validate();
    if (!valid) {
        return unexpected(valid.error());
    }

    auto pool = pool_ ? pool_ : adapters::runner_pool_factory::create(config_.max_concurrent);
    auto state = std::make_unique<impl>(config_, transport_, store_, std::move(pool));

    if (state->store) {
        state->items = state->store->load();
    }

    upload_queue queue(std::move(state));
    queue.impl_->schedule();
    return queue;
}

// ============================================================================
// upload_queue
// ============================================================================

upload_queue::upload_queue(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

upload_queue::~upload_queue() {
    if (impl_) {
        shutdown();
    }
}

upload_queue::upload_queue(upload_queue&&) noexcept = default;

auto upload_queue::operator=(upload_queue&& other) noexcept -> upload_queue& {
    if (this != &other) {
        if (impl_) {
            shutdown();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

auto upload_queue::enqueue(upload_item item) -> std::string {
    std::vector<upload_item> batch;
    batch.push_back(std::move(item));
    return enqueue(std::move(batch)).front();
}

auto upload_queue::enqueue(std::vector<upload_item> items) -> std::vector<std::string> {
    std::vector<std::string> ids;
    ids.reserve(items.size());

    impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        for (auto& item : items) {
            if (item.id.empty() || impl_->find_locked(item.id)) {
                item.id = make_item_id();
            }
            item.status = upload_status::queued;
            item.retry_count = 0;
            item.error.reset();
            reset_progress(item);
            ids.push_back(item.id);

            auto ctx = context_for(item);
            UP_LOG_DEBUG_CTX(log_category::queue, "item queued", ctx);
            impl_->items.push_back(std::move(item));
        }
        return !ids.empty();
    });
    return ids;
}

auto upload_queue::pause(const std::string& id) -> bool {
    return impl_->mutate([&](std::shared_ptr<cancellation_token>& abort) {
        auto* item = impl_->find_locked(id);
        if (!item || item->status != upload_status::uploading) {
            return false;
        }
        item->status = upload_status::paused;
        abort = impl_->active_token_locked(id);
        auto ctx = context_for(*item);
        UP_LOG_INFO_CTX(log_category::queue, "upload paused", ctx);
        return true;
    });
}

auto upload_queue::resume(const std::string& id) -> bool {
    return impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        auto* item = impl_->find_locked(id);
        if (!item || item->status != upload_status::paused) {
            return false;
        }
        item->status = upload_status::queued;
        auto ctx = context_for(*item);
        UP_LOG_INFO_CTX(log_category::queue, "upload resumed", ctx);
        return true;
    });
}

auto upload_queue::cancel(const std::string& id) -> bool {
    return impl_->mutate([&](std::shared_ptr<cancellation_token>& abort) {
        auto* item = impl_->find_locked(id);
        if (!item || is_terminal(item->status)) {
            return false;
        }
        item->status = upload_status::cancelled;
        abort = impl_->active_token_locked(id);
        auto ctx = context_for(*item);
        UP_LOG_INFO_CTX(log_category::queue, "upload cancelled", ctx);
        return true;
    });
}

auto upload_queue::retry(const std::string& id) -> bool {
    return impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        auto* item = impl_->find_locked(id);
        if (!item || (item->status != upload_status::failed &&
                      item->status != upload_status::cancelled)) {
            return false;
        }
        item->status = upload_status::queued;
        item->retry_count = 0;
        item->error.reset();
        reset_progress(*item);

        // A file that reappeared since the item was restored can be used again.
        if (!item->file && item->source_path) {
            auto source = file_byte_source::open(*item->source_path);
            if (source && source.value()->size() == item->file_size) {
                item->file = std::move(source.value());
            }
        }
        auto ctx = context_for(*item);
        UP_LOG_INFO_CTX(log_category::queue, "upload retried", ctx);
        return true;
    });
}

auto upload_queue::remove(const std::string& id) -> bool {
    return impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        auto& items = impl_->items;
        auto it = std::find_if(items.begin(), items.end(),
                               [&](const upload_item& item) { return item.id == id; });
        if (it == items.end() || !is_terminal(it->status)) {
            return false;
        }
        items.erase(it);
        return true;
    });
}

auto upload_queue::clear_completed() -> std::size_t {
    std::size_t removed = 0;
    impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        auto& items = impl_->items;
        auto before = items.size();
        items.erase(std::remove_if(items.begin(), items.end(),
                                   [](const upload_item& item) {
                                       return item.status == upload_status::completed;
                                   }),
                    items.end());
        removed = before - items.size();
        return removed > 0;
    });
    return removed;
}

void upload_queue::clear_all() {
    std::vector<std::shared_ptr<cancellation_token>> tokens;
    impl_->mutate([&](std::shared_ptr<cancellation_token>&) {
        for (const auto& [id, token] : impl_->active) {
            tokens.push_back(token);
        }
        auto changed = !impl_->items.empty();
        impl_->items.clear();
        return changed;
    });
    for (auto& token : tokens) {
        token->cancel();
    }
}

auto upload_queue::snapshot() const -> queue_snapshot {
    std::lock_guard lock(impl_->mutex);
    return impl_->snapshot_locked();
}

auto upload_queue::find(const std::string& id) const -> std::optional<upload_item> {
    std::lock_guard lock(impl_->mutex);
    auto* item = impl_->find_locked(id);
    if (!item) {
        return std::nullopt;
    }
    return *item;
}

auto upload_queue::subscribe(snapshot_callback callback) -> uint64_t {
    std::lock_guard lock(impl_->subscriber_mutex);
    auto id = impl_->next_subscription++;
    impl_->subscribers.emplace(id, std::move(callback));
    return id;
}

void upload_queue::unsubscribe(uint64_t subscription) {
    std::lock_guard lock(impl_->subscriber_mutex);
    impl_->subscribers.erase(subscription);
}

auto upload_queue::wait_until_idle(std::chrono::milliseconds timeout) -> bool {
    std::unique_lock lock(impl_->mutex);
    return impl_->state_cv.wait_for(lock, timeout, [this] { return impl_->idle_locked(); });
}

void upload_queue::shutdown() {
    std::vector<std::shared_ptr<cancellation_token>> tokens;
    std::list<std::future<void>> runs;
    {
        std::lock_guard lock(impl_->mutex);
        if (impl_->stopping && impl_->runs.empty()) {
            return;
        }
        impl_->stopping = true;
        for (const auto& [id, token] : impl_->active) {
            tokens.push_back(token);
        }
        runs.swap(impl_->runs);
    }

    for (auto& token : tokens) {
        token->cancel();
    }
    for (auto& run : runs) {
        run.wait();
    }

    impl::publication pub;
    {
        std::lock_guard lock(impl_->mutex);
        pub = impl_->capture_locked();
    }
    impl_->publish(pub);
    UP_LOG_DEBUG(log_category::queue, "upload queue stopped");
}

auto upload_queue::config() const -> const queue_config& {
    return impl_->config;
}

}  // namespace upload_pipeline
