// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file runner_pool.cpp
 * @brief Worker pool adapters
 */

#include "upload_pipeline/adapters/runner_pool.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace upload_pipeline::adapters {

// ============================================================================
// thread_system_runner_pool
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

auto default_worker_count() -> size_t {
    auto count = std::thread::hardware_concurrency();
    return count > 0 ? count : 4;
}

class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name)
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

}  // namespace

struct thread_system_runner_pool::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string job_name;
};

thread_system_runner_pool::thread_system_runner_pool(
    std::shared_ptr<kcenon::thread::thread_pool> pool, std::string job_name)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->job_name = std::move(job_name);
}

thread_system_runner_pool::~thread_system_runner_pool() = default;

std::shared_ptr<thread_system_runner_pool> thread_system_runner_pool::create(
    size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = default_worker_count();
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();

    return std::make_shared<thread_system_runner_pool>(std::move(pool), pool_name + "_job");
}

std::future<void> thread_system_runner_pool::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto wrapped = [task = std::move(task), promise]() {
        try {
            task();
            promise->set_value();
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    };

    pimpl_->pool->enqueue(std::make_unique<function_job>(std::move(wrapped), pimpl_->job_name));
    return future;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_runner_pool
// ============================================================================

std::future<void> async_runner_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

// ============================================================================
// runner_pool_factory
// ============================================================================

std::shared_ptr<runner_pool_interface> runner_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_runner_pool::create(worker_count, pool_name);
#else
    (void)worker_count;
    (void)pool_name;
    return std::make_shared<async_runner_pool>();
#endif
}

}  // namespace upload_pipeline::adapters
