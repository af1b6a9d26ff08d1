/**
 * @file test_cancellation.cpp
 * @brief Unit tests for cancellation_token
 */

#include <gtest/gtest.h>

#include <upload_pipeline/core/cancellation.h>

#include <atomic>
#include <chrono>
#include <thread>

namespace upload_pipeline::test {

using namespace std::chrono_literals;

class CancellationTokenTest : public ::testing::Test {};

TEST_F(CancellationTokenTest, WaitCompletesWhenNotCancelled) {
    cancellation_token token;
    EXPECT_TRUE(token.wait_for(5ms));
    EXPECT_FALSE(token.is_cancelled());
}

TEST_F(CancellationTokenTest, CancelWakesWaiter) {
    cancellation_token token;

    auto start = std::chrono::steady_clock::now();
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    EXPECT_FALSE(token.wait_for(10s));
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
    EXPECT_TRUE(token.is_cancelled());
}

TEST_F(CancellationTokenTest, HooksRunOnceOnCancel) {
    cancellation_token token;
    std::atomic<int> calls{0};
    token.add_abort_hook([&] { ++calls; });

    token.cancel();
    token.cancel();

    EXPECT_EQ(calls.load(), 1);
}

TEST_F(CancellationTokenTest, RemovedHookDoesNotRun) {
    cancellation_token token;
    std::atomic<int> calls{0};
    {
        scoped_abort_hook hook(token, [&] { ++calls; });
    }
    token.cancel();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(CancellationTokenTest, HookAddedAfterCancelRunsImmediately) {
    cancellation_token token;
    token.cancel();

    bool ran = false;
    EXPECT_EQ(token.add_abort_hook([&] { ran = true; }), 0u);
    EXPECT_TRUE(ran);
}

class BlockingCallRunnerTest : public ::testing::Test {};

TEST_F(BlockingCallRunnerTest, FinishedCallIsJoined) {
    blocking_call_runner runner;
    cancellation_token token;
    int value = 0;

    EXPECT_TRUE(runner.run([&] { value = 7; }, token));
    EXPECT_EQ(value, 7);
    EXPECT_EQ(runner.pending(), 0u);
}

TEST_F(BlockingCallRunnerTest, CancelReturnsBeforeCallFinishes) {
    std::atomic<bool> release{false};
    std::atomic<bool> finished{false};
    cancellation_token token;
    {
        blocking_call_runner runner;
        std::thread canceller([&] {
            std::this_thread::sleep_for(20ms);
            token.cancel();
        });

        auto start = std::chrono::steady_clock::now();
        EXPECT_FALSE(runner.run(
            [&] {
                while (!release.load()) {
                    std::this_thread::sleep_for(1ms);
                }
                finished = true;
            },
            token));
        canceller.join();
        EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);

        // The abandoned call still owns a thread.
        EXPECT_EQ(runner.pending(), 1u);
        EXPECT_FALSE(finished.load());
        release = true;
    }
    // Destruction joined it.
    EXPECT_TRUE(finished.load());
}

TEST_F(BlockingCallRunnerTest, AbandonedCallsAreReapedByLaterRuns) {
    blocking_call_runner runner;
    std::atomic<bool> release{false};

    cancellation_token cancelled;
    cancelled.cancel();
    EXPECT_FALSE(runner.run(
        [&] {
            while (!release.load()) {
                std::this_thread::sleep_for(1ms);
            }
        },
        cancelled));
    EXPECT_EQ(runner.pending(), 1u);

    release = true;
    cancellation_token token;
    auto deadline = std::chrono::steady_clock::now() + 5s;
    while (runner.pending() > 0 && std::chrono::steady_clock::now() < deadline) {
        EXPECT_TRUE(runner.run([] {}, token));
    }
    EXPECT_EQ(runner.pending(), 0u);
}

}  // namespace upload_pipeline::test
