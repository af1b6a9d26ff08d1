/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef UPLOAD_PIPELINE_TEST_FIXTURES_H
#define UPLOAD_PIPELINE_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <upload_pipeline/client/chunk_transport.h>
#include <upload_pipeline/core/file_io.h>
#include <upload_pipeline/protocol/multipart.h>
#include <upload_pipeline/protocol/wire_format.h>
#include <upload_pipeline/server/upload_http_handler.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <string>
#include <thread>

namespace upload_pipeline::test {

using namespace std::chrono_literals;

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("upload_pipeline_test_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        source_dir_ = test_dir_ / "sources";
        std::filesystem::create_directories(source_dir_);

        server_config_.upload_directory = test_dir_ / "uploads";
        server_config_.temp_directory = test_dir_ / "temp";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size, unsigned seed = 42)
        -> std::filesystem::path {
        auto path = source_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(seed);  // Fixed seed for reproducibility
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    /// Artifact the server assembled for @p upload_id
    auto artifact_path(const std::string& upload_id, const std::string& file_name) const
        -> std::filesystem::path {
        return server_config_.upload_directory / (upload_id + "-" + file_name);
    }

    auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b) -> bool {
        auto left = read_file(a);
        auto right = read_file(b);
        return left.has_value() && right.has_value() && left.value() == right.value();
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    server_config server_config_;
};

/**
 * @brief chunk_transport that drives upload_http_handler in process
 *
 * Every request goes through the real multipart encoding, routing and
 * response decoding; only the socket is missing.
 */
class loopback_transport : public chunk_transport {
public:
    explicit loopback_transport(std::shared_ptr<upload_http_handler> handler)
        : handler_(std::move(handler)) {}

    /// Swap the handler, as a restarted server would
    void reconnect(std::shared_ptr<upload_http_handler> handler) {
        std::lock_guard lock(mutex_);
        handler_ = std::move(handler);
    }

    /// The next @p count requests get a 503 without reaching the server
    void fail_next(int count) { failures_.store(count); }

    [[nodiscard]] auto requests() const -> std::size_t { return requests_.load(); }

    auto send_chunk(const protocol::chunk_request& request, cancellation_token& token)
        -> result<protocol::chunk_receipt> override {
        if (token.is_cancelled()) {
            return unexpected(error{error_code::cancelled, "request aborted"});
        }
        ++requests_;
        if (failures_.load() > 0) {
            --failures_;
            return decode_chunk_response(503, R"({"error":"Unavailable","message":"busy"})");
        }

        auto form = protocol::encode_chunk_request(request);
        auto boundary = protocol::multipart_form::make_boundary();
        auto reply = handler()->handle(http_request{
            "POST", prefix() + "/upload", protocol::multipart_form::content_type_for(boundary),
            form.encode(boundary)});
        return decode_chunk_response(static_cast<int>(reply.status), reply.body);
    }

    auto query_status(const std::string& upload_id) -> result<protocol::session_status> override {
        auto reply = handler()->handle(http_request{"GET", prefix() + "/status/" + upload_id,
                                                    "", ""});
        if (reply.status != 200) {
            auto body = protocol::parse_error_body(reply.body);
            return unexpected(error{error_code::session_not_found, body.message});
        }
        return protocol::parse_session_status(reply.body);
    }

    auto cancel_session(const std::string& upload_id) -> result<void> override {
        auto reply = handler()->handle(http_request{"DELETE", prefix() + "/upload/" + upload_id,
                                                    "", ""});
        if (reply.status != 200) {
            return unexpected(error{error_code::session_not_found,
                                    protocol::parse_error_body(reply.body).message});
        }
        return {};
    }

private:
    auto handler() -> std::shared_ptr<upload_http_handler> {
        std::lock_guard lock(mutex_);
        return handler_;
    }

    auto prefix() -> std::string { return handler()->sessions()->config().route_prefix; }

    std::mutex mutex_;
    std::shared_ptr<upload_http_handler> handler_;
    std::atomic<int> failures_{0};
    std::atomic<std::size_t> requests_{0};
};

}  // namespace upload_pipeline::test

#endif  // UPLOAD_PIPELINE_TEST_FIXTURES_H
