/**
 * @file test_http_server.cpp
 * @brief Integration tests for the upload server over real sockets
 */

#include "test_fixtures.h"

#include <upload_pipeline/server/upload_http_server.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <optional>
#include <vector>

namespace upload_pipeline::test {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

struct simple_response {
    unsigned status = 0;
    std::string body;
};

/**
 * @brief One blocking request on a fresh connection
 */
auto send_request(uint16_t port, http::verb method, const std::string& target,
                  const std::string& content_type = {}, const std::string& body = {})
    -> simple_response {
    net::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    return simple_response{res.result_int(), res.body()};
}

auto post_chunk(uint16_t port, const protocol::chunk_request& chunk) -> simple_response {
    auto form = protocol::encode_chunk_request(chunk);
    auto boundary = protocol::multipart_form::make_boundary();
    return send_request(port, http::verb::post, "/api/evidence/upload",
                        protocol::multipart_form::content_type_for(boundary),
                        form.encode(boundary));
}

}  // namespace

class HttpServerTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        server_config_.max_chunk_size = 4096;
        server_config_.worker_threads = 2;

        auto built = upload_http_server::builder().with_config(server_config_).build();
        ASSERT_TRUE(built.has_value()) << built.error().message;
        server_.emplace(std::move(built.value()));

        auto started = server_->start(endpoint{"127.0.0.1", 0});
        ASSERT_TRUE(started.has_value()) << started.error().message;
        port_ = server_->port();
    }

    void TearDown() override {
        if (server_ && server_->is_running()) {
            EXPECT_TRUE(server_->stop().has_value());
        }
        server_.reset();
        TempDirectoryFixture::TearDown();
    }

    std::optional<upload_http_server> server_;
    uint16_t port_ = 0;
};

TEST_F(HttpServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server_->is_running());
    EXPECT_EQ(server_->state(), server_state::running);
    EXPECT_NE(port_, 0);
}

TEST_F(HttpServerTest, BuildRejectsInvalidConfig) {
    auto built = upload_http_server::builder().with_route_prefix("no-slash").build();
    EXPECT_FALSE(built.has_value());
}

TEST_F(HttpServerTest, StartTwiceFails) {
    EXPECT_FALSE(server_->start(endpoint{"127.0.0.1", 0}).has_value());
}

TEST_F(HttpServerTest, HealthEndpoint) {
    auto res = send_request(port_, http::verb::get, "/health");
    ASSERT_EQ(res.status, 200u);
    auto body = nlohmann::json::parse(res.body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["activeUploads"], 0);
}

TEST_F(HttpServerTest, ChunkedUploadOverHttp) {
    auto path = create_test_file("scene.jpg", 10000);
    auto source = read_file(path);
    ASSERT_TRUE(source.has_value());
    const auto& content = source.value();

    std::string upload_id;
    const uint64_t total = 3;
    for (uint64_t index = 0; index < total; ++index) {
        protocol::chunk_request chunk;
        if (!upload_id.empty()) {
            chunk.upload_id = upload_id;
        }
        chunk.chunk_index = index;
        chunk.total_chunks = total;
        chunk.file_name = "scene.jpg";
        chunk.metadata_json = R"({"title":"scene"})";
        auto begin = index * 4096;
        auto end = std::min<uint64_t>(content.size(), begin + 4096);
        for (auto i = begin; i < end; ++i) {
            chunk.bytes.push_back(static_cast<std::byte>(content[i]));
        }

        auto res = post_chunk(port_, chunk);
        ASSERT_EQ(res.status, 200u) << res.body;
        auto receipt = decode_chunk_response(static_cast<int>(res.status), res.body);
        ASSERT_TRUE(receipt.has_value()) << receipt.error().message;
        upload_id = receipt.value().upload_id;
        if (index + 1 == total) {
            EXPECT_EQ(receipt.value().status, protocol::session_state::completed);
        }
    }

    EXPECT_TRUE(files_equal(path, artifact_path(upload_id, "scene.jpg")));

    auto status = send_request(port_, http::verb::get, "/api/evidence/status/" + upload_id);
    ASSERT_EQ(status.status, 200u);
    auto parsed = protocol::parse_session_status(status.body);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed.value().status, protocol::session_state::completed);
    EXPECT_TRUE(parsed.value().completed_at.has_value());

    auto list = send_request(port_, http::verb::get, "/api/evidence");
    ASSERT_EQ(list.status, 200u);
    EXPECT_EQ(nlohmann::json::parse(list.body)["total"], 1);
}

TEST_F(HttpServerTest, OversizedBodyIsRejected) {
    protocol::chunk_request chunk;
    chunk.chunk_index = 0;
    chunk.total_chunks = 1;
    chunk.file_name = "big.bin";
    chunk.bytes.assign(4097, std::byte{1});

    auto res = post_chunk(port_, chunk);
    EXPECT_EQ(res.status, 413u);
}

TEST_F(HttpServerTest, UnknownSessionIs404) {
    auto res = send_request(port_, http::verb::get, "/api/evidence/status/nope");
    EXPECT_EQ(res.status, 404u);
    EXPECT_EQ(protocol::parse_error_body(res.body).error, "Upload not found");
}

TEST_F(HttpServerTest, StopReleasesPort) {
    ASSERT_TRUE(server_->stop().has_value());
    EXPECT_FALSE(server_->is_running());
    EXPECT_EQ(server_->state(), server_state::stopped);
    EXPECT_THROW(send_request(port_, http::verb::get, "/health"), boost::system::system_error);
}

}  // namespace upload_pipeline::test
