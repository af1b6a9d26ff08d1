/**
 * @file cancellation.cpp
 * @brief cancellation_token implementation
 */

#include "upload_pipeline/core/cancellation.h"

#include <algorithm>
#include <vector>

namespace upload_pipeline {

void cancellation_token::cancel() {
    std::vector<abort_hook> to_run;
    {
        std::lock_guard lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& [handle, hook] : hooks_) {
            to_run.push_back(std::move(hook));
        }
        hooks_.clear();
    }
    cv_.notify_all();

    // Hooks run outside the lock; they may call back into the transport.
    for (auto& hook : to_run) {
        if (hook) {
            hook();
        }
    }
}

auto cancellation_token::wait_for(std::chrono::milliseconds delay) -> bool {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, delay, [this] { return is_cancelled(); });
    return !is_cancelled();
}

auto cancellation_token::add_abort_hook(abort_hook hook) -> uint64_t {
    {
        std::lock_guard lock(mutex_);
        if (!is_cancelled()) {
            auto handle = next_hook_++;
            hooks_.emplace(handle, std::move(hook));
            return handle;
        }
    }
    if (hook) {
        hook();
    }
    return 0;
}

void cancellation_token::remove_abort_hook(uint64_t handle) {
    std::lock_guard lock(mutex_);
    hooks_.erase(handle);
}

blocking_call_runner::~blocking_call_runner() {
    std::vector<worker> workers;
    {
        std::lock_guard lock(mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) {
            w.thread.join();
        }
    }
}

auto blocking_call_runner::run(std::function<void()> call, cancellation_token& token) -> bool {
    auto state = std::make_shared<call_state>();

    scoped_abort_hook hook(token, [state] {
        {
            std::lock_guard lock(state->mutex);
            state->aborted = true;
        }
        state->cv.notify_all();
    });

    {
        std::lock_guard lock(mutex_);
        reap_finished_locked();
        workers_.push_back(worker{std::thread([state, call = std::move(call)] {
                                      call();
                                      {
                                          std::lock_guard done(state->mutex);
                                          state->finished = true;
                                      }
                                      state->cv.notify_all();
                                  }),
                                  state});
    }

    bool finished = false;
    {
        std::unique_lock lock(state->mutex);
        state->cv.wait(lock, [&] { return state->finished || state->aborted; });
        finished = state->finished;
    }

    if (finished) {
        std::lock_guard lock(mutex_);
        reap_finished_locked();
    }
    return finished;
}

auto blocking_call_runner::pending() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

void blocking_call_runner::reap_finished_locked() {
    auto done = [](worker& w) {
        std::lock_guard lock(w.state->mutex);
        return w.state->finished;
    };
    auto it = std::partition(workers_.begin(), workers_.end(),
                             [&](worker& w) { return !done(w); });
    for (auto finished = it; finished != workers_.end(); ++finished) {
        finished->thread.join();
    }
    workers_.erase(it, workers_.end());
}

}  // namespace upload_pipeline
