/**
 * @file test_core_types.cpp
 * @brief Unit tests for error codes and result<T>
 */

#include <gtest/gtest.h>

#include <upload_pipeline/core/types.h>

#include <string>

namespace upload_pipeline::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    EXPECT_EQ(static_cast<int>(error_code::file_not_found), -100);
    EXPECT_EQ(static_cast<int>(error_code::invalid_request), -120);
    EXPECT_EQ(static_cast<int>(error_code::invalid_chunk_size), -140);
    EXPECT_EQ(static_cast<int>(error_code::transport_failed), -160);
    EXPECT_EQ(static_cast<int>(error_code::session_not_found), -180);
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::session_not_found), "session not found");
    EXPECT_STREQ(to_string(error_code::source_unavailable), "source file unavailable");
    EXPECT_STREQ(to_string(static_cast<error_code>(-999)), "unknown error");
}

TEST_F(ErrorCodeTest, RetryableCodesAreTransportFailures) {
    EXPECT_TRUE(is_retryable(error_code::transport_failed));
    EXPECT_TRUE(is_retryable(error_code::transport_timeout));
    EXPECT_TRUE(is_retryable(error_code::server_error));
    EXPECT_TRUE(is_retryable(error_code::malformed_response));

    EXPECT_FALSE(is_retryable(error_code::cancelled));
    EXPECT_FALSE(is_retryable(error_code::invalid_request));
    EXPECT_FALSE(is_retryable(error_code::session_not_found));
}

TEST_F(ErrorCodeTest, ValidationErrors) {
    EXPECT_TRUE(is_validation_error(error_code::invalid_chunk_index));
    EXPECT_TRUE(is_validation_error(error_code::chunk_count_mismatch));
    EXPECT_TRUE(is_validation_error(error_code::chunk_too_large));
    EXPECT_FALSE(is_validation_error(error_code::server_error));
    EXPECT_TRUE(is_cancellation(error_code::cancelled));
}

// =============================================================================
// result<T> Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected(error{error_code::file_not_found, "missing.bin"});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::file_not_found);
    EXPECT_EQ(r.error().message, "missing.bin");
}

TEST_F(ResultTest, ErrorWithoutMessageUsesCodeText) {
    error e(error_code::missing_chunks);
    EXPECT_TRUE(static_cast<bool>(e));
    EXPECT_EQ(e.message, "missing chunks");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> failed = unexpected(error{error_code::store_error});
    EXPECT_FALSE(failed.has_value());
    EXPECT_EQ(failed.error().code, error_code::store_error);
}

}  // namespace upload_pipeline::test
