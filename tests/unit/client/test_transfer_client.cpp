/**
 * @file test_transfer_client.cpp
 * @brief Unit tests for chunk retry and backoff
 */

#include <gtest/gtest.h>

#include <upload_pipeline/client/transfer_client.h>

#include "fake_transport.h"

#include <chrono>
#include <future>
#include <thread>

namespace upload_pipeline::test {

namespace {

auto first_chunk() -> protocol::chunk_request {
    protocol::chunk_request request;
    request.chunk_index = 0;
    request.total_chunks = 2;
    request.file_name = "a.bin";
    request.bytes.resize(16);
    return request;
}

}  // namespace

class TransferClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<fake_transport>();
        policy_.base_delay = std::chrono::milliseconds(1);
    }

    std::shared_ptr<fake_transport> transport_;
    retry_policy policy_;
    cancellation_token token_;
};

TEST_F(TransferClientTest, FirstAttemptSucceeds) {
    transfer_client client(transport_, policy_);
    auto receipt = client.send_chunk(first_chunk(), token_);

    ASSERT_TRUE(receipt.has_value()) << receipt.error().message;
    EXPECT_FALSE(receipt.value().upload_id.empty());
    EXPECT_EQ(transport_->calls(), 1u);
}

TEST_F(TransferClientTest, TransientFailuresAreRetried) {
    transport_->fail_next(2, error_code::transport_failed);
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(first_chunk(), token_);
    ASSERT_TRUE(receipt.has_value()) << receipt.error().message;
    EXPECT_EQ(transport_->calls(), 3u);
    EXPECT_EQ(transport_->sent().size(), 1u);
}

TEST_F(TransferClientTest, GivesUpAfterSixAttempts) {
    transport_->fail_always(error_code::server_error);
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(first_chunk(), token_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::server_error);
    EXPECT_EQ(transport_->calls(), 6u);
}

TEST_F(TransferClientTest, SpentRetriesAreHonoured) {
    transport_->fail_always(error_code::transport_timeout);
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(first_chunk(), token_, policy_.max_chunk_retries);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(transport_->calls(), 1u);
}

TEST_F(TransferClientTest, BackoffGrowsExponentially) {
    policy_.base_delay = std::chrono::milliseconds(20);
    policy_.max_chunk_retries = 3;
    transport_->fail_always(error_code::transport_failed);
    transfer_client client(transport_, policy_);

    auto start = std::chrono::steady_clock::now();
    auto receipt = client.send_chunk(first_chunk(), token_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(transport_->calls(), 4u);
    // 20 + 40 + 80
    EXPECT_GE(elapsed, std::chrono::milliseconds(140));
}

TEST_F(TransferClientTest, ValidationErrorsAreNotRetried) {
    transport_->fail_next(1, error_code::chunk_too_large);
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(first_chunk(), token_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::chunk_too_large);
    EXPECT_EQ(transport_->calls(), 1u);
}

TEST_F(TransferClientTest, UnknownSessionIsNotRetried) {
    auto request = first_chunk();
    request.chunk_index = 1;
    request.upload_id = "gone";
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(request, token_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::session_not_found);
    EXPECT_EQ(transport_->calls(), 1u);
}

TEST_F(TransferClientTest, CancelledTokenSendsNothing) {
    token_.cancel();
    transfer_client client(transport_, policy_);

    auto receipt = client.send_chunk(first_chunk(), token_);
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::cancelled);
    EXPECT_EQ(transport_->calls(), 0u);
}

TEST_F(TransferClientTest, CancelInterruptsBackoff) {
    policy_.base_delay = std::chrono::seconds(30);
    transport_->fail_always(error_code::transport_failed);
    transfer_client client(transport_, policy_);

    auto start = std::chrono::steady_clock::now();
    auto pending = std::async(std::launch::async,
                              [&] { return client.send_chunk(first_chunk(), token_); });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    token_.cancel();

    auto receipt = pending.get();
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::cancelled);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
    EXPECT_EQ(transport_->calls(), 1u);
}

TEST_F(TransferClientTest, CancelAbortsInFlightRequest) {
    transport_->hold();
    transfer_client client(transport_, policy_);

    auto pending = std::async(std::launch::async,
                              [&] { return client.send_chunk(first_chunk(), token_); });
    ASSERT_TRUE(transport_->wait_for_held(1, std::chrono::seconds(5)));

    token_.cancel();
    auto receipt = pending.get();
    ASSERT_FALSE(receipt.has_value());
    EXPECT_EQ(receipt.error().code, error_code::cancelled);
    EXPECT_TRUE(transport_->sent().empty());
}

}  // namespace upload_pipeline::test
