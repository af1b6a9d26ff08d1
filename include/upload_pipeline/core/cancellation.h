/**
 * @file cancellation.h
 * @brief Cooperative cancellation for in-flight chunk transfers
 */

#ifndef UPLOAD_PIPELINE_CORE_CANCELLATION_H
#define UPLOAD_PIPELINE_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace upload_pipeline {

/**
 * @brief Shared cancellation flag with interruptible waits
 *
 * One token is created per item run. pause() and cancel() on the queue
 * trip it; the transfer client checks it around every exchange and wakes
 * from backoff waits as soon as it is tripped. Transports may register an
 * abort hook to interrupt a blocking request.
 */
class cancellation_token {
public:
    using abort_hook = std::function<void()>;

    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    /**
     * @brief Trip the token and run every registered abort hook once
     */
    void cancel();

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for @p delay unless cancelled first
     * @return false if the token was (or became) cancelled
     */
    [[nodiscard]] auto wait_for(std::chrono::milliseconds delay) -> bool;

    /**
     * @brief Register a hook run by cancel()
     *
     * If the token is already cancelled the hook runs immediately.
     * @return Handle for remove_abort_hook()
     */
    auto add_abort_hook(abort_hook hook) -> uint64_t;

    void remove_abort_hook(uint64_t handle);

private:
    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, abort_hook> hooks_;
    uint64_t next_hook_{1};
};

/**
 * @brief Removes an abort hook when leaving scope
 */
class scoped_abort_hook {
public:
    scoped_abort_hook(cancellation_token& token, cancellation_token::abort_hook hook)
        : token_(token), handle_(token.add_abort_hook(std::move(hook))) {}

    ~scoped_abort_hook() { token_.remove_abort_hook(handle_); }

    scoped_abort_hook(const scoped_abort_hook&) = delete;
    auto operator=(const scoped_abort_hook&) -> scoped_abort_hook& = delete;

private:
    cancellation_token& token_;
    uint64_t handle_;
};

/**
 * @brief Runs blocking calls on owned threads so a tripped token returns early
 *
 * A call abandoned by cancellation runs to completion on its thread. That
 * thread is joined by a later run() once it has finished, or by the
 * destructor.
 */
class blocking_call_runner {
public:
    blocking_call_runner() = default;
    ~blocking_call_runner();

    blocking_call_runner(const blocking_call_runner&) = delete;
    auto operator=(const blocking_call_runner&) -> blocking_call_runner& = delete;

    /**
     * @brief Run @p call and wait for it or for @p token
     * @return true if @p call finished, false if the token tripped first
     */
    auto run(std::function<void()> call, cancellation_token& token) -> bool;

    /// Threads started and not yet joined
    [[nodiscard]] auto pending() const -> std::size_t;

private:
    struct call_state {
        std::mutex mutex;
        std::condition_variable cv;
        bool finished = false;
        bool aborted = false;
    };

    struct worker {
        std::thread thread;
        std::shared_ptr<call_state> state;
    };

    void reap_finished_locked();

    mutable std::mutex mutex_;
    std::vector<worker> workers_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_CANCELLATION_H
