// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file runner_pool.h
 * @brief Worker pool used to execute upload item runners
 *
 * Uses thread_system's thread_pool when it is compiled in and falls back
 * to std::async otherwise.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "upload_pipeline/config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace upload_pipeline::adapters {

/**
 * @brief Pool abstraction injected into the upload queue
 */
class runner_pool_interface {
public:
    virtual ~runner_pool_interface() = default;

    /**
     * @brief Run @p task on a worker
     * @return Future completed when the task returns, carrying its exception
     *
     * @note Callers must keep the future alive until it is ready; futures
     *       from the std::async fallback block in their destructor.
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Adapter over thread_system::thread_pool
 */
class thread_system_runner_pool : public runner_pool_interface {
public:
    explicit thread_system_runner_pool(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                       std::string job_name);
    ~thread_system_runner_pool() override;

    thread_system_runner_pool(const thread_system_runner_pool&) = delete;
    thread_system_runner_pool& operator=(const thread_system_runner_pool&) = delete;

    /**
     * @brief Create and start a pool with @p worker_count workers
     * @param worker_count 0 = hardware concurrency
     */
    [[nodiscard]] static std::shared_ptr<thread_system_runner_pool> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback pool that runs every task with std::async
 */
class async_runner_pool : public runner_pool_interface {
public:
    async_runner_pool() = default;

    async_runner_pool(const async_runner_pool&) = delete;
    async_runner_pool& operator=(const async_runner_pool&) = delete;

    std::future<void> submit(std::function<void()> task) override;
};

/**
 * @brief Picks thread_system when available, std::async otherwise
 */
class runner_pool_factory {
public:
    [[nodiscard]] static std::shared_ptr<runner_pool_interface> create(
        size_t worker_count = 0,
        const std::string& pool_name = "upload_runner_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace upload_pipeline::adapters
