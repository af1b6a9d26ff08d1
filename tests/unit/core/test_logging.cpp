/**
 * @file test_logging.cpp
 * @brief Unit tests for the structured upload logger
 */

#include <gtest/gtest.h>

#include <upload_pipeline/core/logging.h>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace upload_pipeline::test {

class UploadLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        saved_level_ = logger.get_level();
        logger.set_sink_enabled(false);
        logger.set_level(log_level::trace);
        logger.set_callback([this](log_level level, std::string_view category,
                                   std::string_view message, const upload_log_context* ctx) {
            records_.push_back(record{level, std::string(category), std::string(message),
                                      ctx ? std::optional(*ctx) : std::nullopt});
        });
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_output_format(log_output_format::text);
        logger.set_level(saved_level_);
        logger.set_sink_enabled(true);
    }

    struct record {
        log_level level;
        std::string category;
        std::string message;
        std::optional<upload_log_context> context;
    };

    std::vector<record> records_;
    log_level saved_level_ = log_level::info;
};

TEST_F(UploadLoggerTest, LevelNames) {
    EXPECT_EQ(log_level_to_string(log_level::trace), "TRACE");
    EXPECT_EQ(log_level_to_string(log_level::warn), "WARN");
    EXPECT_EQ(log_level_to_string(log_level::fatal), "FATAL");
}

TEST_F(UploadLoggerTest, MacroReachesCallback) {
    UP_LOG_INFO(log_category::queue, "queue started");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].level, log_level::info);
    EXPECT_EQ(records_[0].category, "upload.queue");
    EXPECT_EQ(records_[0].message, "queue started");
    EXPECT_FALSE(records_[0].context.has_value());
}

TEST_F(UploadLoggerTest, RecordsBelowLevelAreDropped) {
    get_logger().set_level(log_level::warn);

    UP_LOG_DEBUG(log_category::transfer, "ignored");
    UP_LOG_ERROR(log_category::transfer, "kept");

    ASSERT_EQ(records_.size(), 1u);
    EXPECT_EQ(records_[0].message, "kept");
}

TEST_F(UploadLoggerTest, ContextIsPassedThrough) {
    upload_log_context ctx;
    ctx.item_id = "upload-1";
    ctx.chunk_index = 2;
    ctx.total_chunks = 3;
    UP_LOG_WARN_CTX(log_category::transfer, "retrying chunk", ctx);

    ASSERT_EQ(records_.size(), 1u);
    ASSERT_TRUE(records_[0].context.has_value());
    EXPECT_EQ(records_[0].context->item_id, "upload-1");
    EXPECT_EQ(records_[0].context->chunk_index, 2u);
}

TEST_F(UploadLoggerTest, ContextRendersOnlySetFields) {
    upload_log_context ctx;
    ctx.upload_id = "session-abc";
    ctx.progress = 40;

    auto obj = ctx.to_json_object();
    EXPECT_EQ(obj["upload_id"], "session-abc");
    EXPECT_EQ(obj["progress"], 40);
    EXPECT_FALSE(obj.contains("item_id"));
    EXPECT_FALSE(obj.contains("retry_count"));
}

TEST_F(UploadLoggerTest, JsonFormatProducesStructuredEntry) {
    std::string captured;
    get_logger().set_output_format(log_output_format::json);
    get_logger().set_json_callback(
        [&](const structured_log_entry&, const std::string& json) { captured = json; });

    upload_log_context ctx;
    ctx.file_name = "photo.jpg";
    UP_LOG_INFO_CTX(log_category::session, "upload assembled", ctx);

    auto parsed = nlohmann::json::parse(captured);
    EXPECT_EQ(parsed["level"], "INFO");
    EXPECT_EQ(parsed["category"], "upload.session");
    EXPECT_EQ(parsed["message"], "upload assembled");
    EXPECT_EQ(parsed["file_name"], "photo.jpg");
    EXPECT_TRUE(parsed.contains("timestamp"));
    EXPECT_TRUE(parsed.contains("source"));
}

}  // namespace upload_pipeline::test
