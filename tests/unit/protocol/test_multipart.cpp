/**
 * @file test_multipart.cpp
 * @brief Unit tests for the multipart/form-data codec
 */

#include <gtest/gtest.h>

#include <upload_pipeline/protocol/multipart.h>

#include <cstring>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace upload_pipeline::test {

using protocol::multipart_form;

namespace {

auto make_bytes(std::size_t size) -> std::vector<std::byte> {
    std::mt19937 gen(42);
    std::uniform_int_distribution<> dis(0, 255);
    std::vector<std::byte> data(size);
    for (auto& b : data) {
        b = static_cast<std::byte>(dis(gen));
    }
    return data;
}

}  // namespace

class MultipartTest : public ::testing::Test {};

TEST_F(MultipartTest, EncodedFormParsesBack) {
    auto bytes = make_bytes(4096);

    multipart_form form;
    form.add_file("chunk", "report.pdf", bytes);
    form.add_field("chunkIndex", "2");
    form.add_field("metadata", R"({"caseId":"C-1"})");

    auto boundary = multipart_form::make_boundary();
    auto body = form.encode(boundary);

    auto parsed = multipart_form::parse(multipart_form::content_type_for(boundary), body);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_EQ(parsed.value().parts().size(), 3u);

    const auto* chunk = parsed.value().find("chunk");
    ASSERT_NE(chunk, nullptr);
    ASSERT_TRUE(chunk->filename.has_value());
    EXPECT_EQ(*chunk->filename, "report.pdf");
    EXPECT_EQ(chunk->content_type, "application/octet-stream");
    ASSERT_EQ(chunk->data.size(), bytes.size());
    EXPECT_EQ(0, std::memcmp(chunk->data.data(), bytes.data(), bytes.size()));

    EXPECT_EQ(parsed.value().field("chunkIndex").value_or(""), "2");
    EXPECT_EQ(parsed.value().field("metadata").value_or(""), R"({"caseId":"C-1"})");
    EXPECT_FALSE(parsed.value().field("uploadId").has_value());
}

TEST_F(MultipartTest, EmptyFilePartIsKept) {
    multipart_form form;
    form.add_file("chunk", "empty.bin", std::span<const std::byte>{});

    auto body = form.encode("b0undary");
    auto parsed = multipart_form::parse("multipart/form-data; boundary=b0undary", body);
    ASSERT_TRUE(parsed.has_value());
    const auto* chunk = parsed.value().find("chunk");
    ASSERT_NE(chunk, nullptr);
    EXPECT_TRUE(chunk->data.empty());
}

TEST_F(MultipartTest, QuotedBoundaryAndMixedCaseHeaders) {
    std::string body =
        "--xyz\r\n"
        "content-disposition: form-data; name=\"fileName\"\r\n"
        "\r\n"
        "notes.txt\r\n"
        "--xyz--\r\n";

    auto parsed = multipart_form::parse("Multipart/Form-Data; boundary=\"xyz\"", body);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_EQ(parsed.value().field("fileName").value_or(""), "notes.txt");
}

TEST_F(MultipartTest, BoundariesAreRandom) {
    auto a = multipart_form::make_boundary();
    auto b = multipart_form::make_boundary();
    EXPECT_NE(a, b);
    EXPECT_EQ(multipart_form::content_type_for(a), "multipart/form-data; boundary=" + a);
}

TEST_F(MultipartTest, RejectsOtherMediaTypes) {
    auto parsed = multipart_form::parse("application/json", "{}");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_request);
}

TEST_F(MultipartTest, RejectsMissingBoundary) {
    auto parsed = multipart_form::parse("multipart/form-data", "--x\r\n");
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_request);
}

TEST_F(MultipartTest, RejectsTruncatedBody) {
    multipart_form form;
    form.add_field("chunkIndex", "0");
    auto body = form.encode("cut");
    body.resize(body.size() - 10);

    auto parsed = multipart_form::parse("multipart/form-data; boundary=cut", body);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_request);
}

TEST_F(MultipartTest, RejectsPartWithoutName) {
    std::string body =
        "--b\r\n"
        "Content-Type: text/plain\r\n"
        "\r\n"
        "data\r\n"
        "--b--\r\n";

    auto parsed = multipart_form::parse("multipart/form-data; boundary=b", body);
    ASSERT_FALSE(parsed.has_value());
    EXPECT_EQ(parsed.error().code, error_code::invalid_request);
}

}  // namespace upload_pipeline::test
