/**
 * @file upload_http_server.cpp
 * @brief Boost.Beast front end for upload_http_handler
 */

#include "upload_pipeline/server/upload_http_server.h"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include "upload_pipeline/core/logging.h"
#include "upload_pipeline/server/upload_http_handler.h"

namespace upload_pipeline {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = net::ip::tcp;

namespace {

/// Room for multipart framing and the text fields around a chunk
constexpr std::size_t multipart_overhead = 64 * 1024;
constexpr std::chrono::milliseconds max_expiry_interval{60000};

auto to_std(beast::string_view sv) -> std::string {
    return std::string(sv.data(), sv.size());
}

/**
 * @brief One keep-alive connection
 */
class http_connection : public std::enable_shared_from_this<http_connection> {
public:
    http_connection(tcp::socket&& socket,
                    const upload_http_handler& handler,
                    std::size_t body_limit,
                    std::chrono::milliseconds timeout)
        : stream_(std::move(socket)),
          handler_(handler),
          body_limit_(body_limit),
          timeout_(timeout) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&http_connection::do_read, shared_from_this()));
    }

private:
    void do_read() {
        parser_.emplace();
        parser_->body_limit(body_limit_);
        stream_.expires_after(timeout_);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&http_connection::on_read,
                                                   shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            return close();
        }
        if (ec == http::error::body_limit) {
            http_reply reply;
            reply.status = 413;
            reply.body = R"({"error":"Chunk too large","message":"request body exceeds the limit"})";
            return send(reply, 11, false);
        }
        if (ec) {
            if (ec != beast::error::timeout && ec != net::error::operation_aborted) {
                UP_LOG_DEBUG(log_category::http, "read failed: " + ec.message());
            }
            return;
        }

        auto req = parser_->release();
        http_request request;
        request.method = to_std(req.method_string());
        request.target = to_std(req.target());
        request.content_type = to_std(req[http::field::content_type]);
        request.body = std::move(req.body());

        auto reply = handler_.handle(request);
        UP_LOG_DEBUG(log_category::http,
                     request.method + " " + request.target + " -> " + std::to_string(reply.status));
        send(reply, req.version(), req.keep_alive());
    }

    void send(const http_reply& reply, unsigned version, bool keep_alive) {
        response_ = {};
        response_.version(version);
        response_.result(reply.status);
        response_.set(http::field::server, BOOST_BEAST_VERSION_STRING);
        response_.set(http::field::content_type, reply.content_type);
        response_.keep_alive(keep_alive);
        response_.body() = reply.body;
        response_.prepare_payload();

        stream_.expires_after(timeout_);
        http::async_write(stream_, response_,
                          beast::bind_front_handler(&http_connection::on_write,
                                                    shared_from_this(), keep_alive));
    }

    void on_write(bool keep_alive, beast::error_code ec, std::size_t) {
        if (ec) {
            UP_LOG_DEBUG(log_category::http, "write failed: " + ec.message());
            return;
        }
        if (!keep_alive) {
            return close();
        }
        do_read();
    }

    void close() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    http::response<http::string_body> response_;
    const upload_http_handler& handler_;
    std::size_t body_limit_;
    std::chrono::milliseconds timeout_;
};

/**
 * @brief Accepts connections and hands each one to an http_connection
 */
class http_listener : public std::enable_shared_from_this<http_listener> {
public:
    http_listener(net::io_context& ioc,
                  const upload_http_handler& handler,
                  std::size_t body_limit,
                  std::chrono::milliseconds timeout)
        : ioc_(ioc),
          acceptor_(net::make_strand(ioc)),
          handler_(handler),
          body_limit_(body_limit),
          timeout_(timeout) {}

    auto open(const endpoint& listen_addr) -> result<uint16_t> {
        beast::error_code ec;
        auto address = net::ip::make_address(listen_addr.host, ec);
        if (ec) {
            return unexpected(error{error_code::invalid_configuration,
                                    "invalid listen address " + listen_addr.host});
        }
        tcp::endpoint ep{address, listen_addr.port};

        acceptor_.open(ep.protocol(), ec);
        if (!ec) acceptor_.set_option(net::socket_base::reuse_address(true), ec);
        if (!ec) acceptor_.bind(ep, ec);
        if (!ec) acceptor_.listen(net::socket_base::max_listen_connections, ec);
        if (ec) {
            return unexpected(error{error_code::transport_failed,
                                    "cannot listen on " + listen_addr.host + ":" +
                                        std::to_string(listen_addr.port) + ": " + ec.message()});
        }
        return acceptor_.local_endpoint().port();
    }

    void run() { do_accept(); }

    void stop() {
        net::post(acceptor_.get_executor(), [self = shared_from_this()] {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

private:
    void do_accept() {
        acceptor_.async_accept(net::make_strand(ioc_),
                               beast::bind_front_handler(&http_listener::on_accept,
                                                         shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == net::error::operation_aborted || !acceptor_.is_open()) {
            return;
        }
        if (ec) {
            UP_LOG_WARN(log_category::http, "accept failed: " + ec.message());
        } else {
            std::make_shared<http_connection>(std::move(socket), handler_, body_limit_, timeout_)
                ->run();
        }
        do_accept();
    }

    net::io_context& ioc_;
    tcp::acceptor acceptor_;
    const upload_http_handler& handler_;
    std::size_t body_limit_;
    std::chrono::milliseconds timeout_;
};

}  // namespace

// ============================================================================
// upload_http_server::impl
// ============================================================================

struct upload_http_server::impl {
    server_config config;
    std::shared_ptr<upload_session_manager> sessions;
    upload_http_handler handler;

    std::mutex lifecycle_mutex;
    std::atomic<server_state> state{server_state::stopped};
    std::atomic<uint16_t> bound_port{0};

    std::unique_ptr<net::io_context> ioc;
    std::shared_ptr<http_listener> listener;
    std::unique_ptr<net::steady_timer> expiry_timer;
    std::vector<std::thread> workers;

    impl(server_config cfg, std::shared_ptr<upload_session_manager> mgr)
        : config(std::move(cfg)), sessions(mgr), handler(std::move(mgr)) {}

    void schedule_expiry() {
        auto interval = std::min(config.session_ttl, max_expiry_interval);
        expiry_timer->expires_after(interval);
        expiry_timer->async_wait([this](beast::error_code ec) {
            if (ec) {
                return;
            }
            sessions->expire_sessions(config.session_ttl);
            schedule_expiry();
        });
    }

    void stop_locked() {
        if (listener) {
            listener->stop();
        }
        if (ioc) {
            ioc->stop();
        }
        for (auto& worker : workers) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers.clear();
        expiry_timer.reset();
        listener.reset();
        ioc.reset();
        bound_port = 0;
    }
};

// ============================================================================
// upload_http_server::builder
// ============================================================================

upload_http_server::builder::builder() = default;

auto upload_http_server::builder::with_config(const server_config& config) -> builder& {
    config_ = config;
    return *this;
}

auto upload_http_server::builder::with_upload_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.upload_directory = dir;
    return *this;
}

auto upload_http_server::builder::with_temp_directory(const std::filesystem::path& dir)
    -> builder& {
    config_.temp_directory = dir;
    return *this;
}

auto upload_http_server::builder::with_route_prefix(std::string prefix) -> builder& {
    config_.route_prefix = std::move(prefix);
    return *this;
}

auto upload_http_server::builder::with_max_chunk_size(std::size_t max_bytes) -> builder& {
    config_.max_chunk_size = max_bytes;
    return *this;
}

auto upload_http_server::builder::with_worker_threads(std::size_t count) -> builder& {
    config_.worker_threads = count;
    return *this;
}

auto upload_http_server::builder::with_request_timeout(std::chrono::milliseconds timeout)
    -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto upload_http_server::builder::with_session_persistence(bool enable) -> builder& {
    config_.persist_sessions = enable;
    return *this;
}

auto upload_http_server::builder::with_session_ttl(std::chrono::milliseconds ttl) -> builder& {
    config_.session_ttl = ttl;
    return *this;
}

auto upload_http_server::builder::build() -> result<upload_http_server> {
    auto sessions = upload_session_manager::create(config_);
    if (!sessions) {
        return unexpected(sessions.error());
    }
    return upload_http_server(std::make_unique<impl>(config_, std::move(sessions.value())));
}

// ============================================================================
// upload_http_server
// ============================================================================

upload_http_server::upload_http_server(std::unique_ptr<impl> impl) : impl_(std::move(impl)) {}

upload_http_server::~upload_http_server() {
    if (impl_) {
        std::lock_guard lock(impl_->lifecycle_mutex);
        impl_->stop_locked();
        impl_->state = server_state::stopped;
    }
}

upload_http_server::upload_http_server(upload_http_server&&) noexcept = default;

auto upload_http_server::operator=(upload_http_server&& other) noexcept -> upload_http_server& {
    if (this != &other) {
        if (impl_) {
            std::lock_guard lock(impl_->lifecycle_mutex);
            impl_->stop_locked();
        }
        impl_ = std::move(other.impl_);
    }
    return *this;
}

auto upload_http_server::start(const endpoint& listen_addr) -> result<void> {
    std::lock_guard lock(impl_->lifecycle_mutex);
    if (impl_->state != server_state::stopped) {
        return unexpected(error{error_code::invalid_configuration, "server is already running"});
    }
    impl_->state = server_state::starting;

    const auto threads = impl_->config.worker_threads;
    impl_->ioc = std::make_unique<net::io_context>(static_cast<int>(threads));
    impl_->listener = std::make_shared<http_listener>(
        *impl_->ioc, impl_->handler, impl_->config.max_chunk_size + multipart_overhead,
        impl_->config.request_timeout);

    auto port = impl_->listener->open(listen_addr);
    if (!port) {
        impl_->stop_locked();
        impl_->state = server_state::stopped;
        return unexpected(port.error());
    }
    impl_->bound_port = port.value();
    impl_->listener->run();

    if (impl_->config.session_ttl.count() > 0) {
        impl_->expiry_timer = std::make_unique<net::steady_timer>(*impl_->ioc);
        impl_->schedule_expiry();
    }

    impl_->workers.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        impl_->workers.emplace_back([ioc = impl_->ioc.get()] { ioc->run(); });
    }

    impl_->state = server_state::running;
    UP_LOG_INFO(log_category::http,
                "upload server listening on " + listen_addr.host + ":" +
                    std::to_string(port.value()) + impl_->config.route_prefix);
    return {};
}

auto upload_http_server::stop() -> result<void> {
    std::lock_guard lock(impl_->lifecycle_mutex);
    if (impl_->state != server_state::running) {
        return unexpected(error{error_code::invalid_configuration, "server is not running"});
    }
    impl_->state = server_state::stopping;
    impl_->stop_locked();
    impl_->state = server_state::stopped;
    UP_LOG_INFO(log_category::http, "upload server stopped");
    return {};
}

auto upload_http_server::is_running() const -> bool {
    return impl_->state == server_state::running;
}

auto upload_http_server::state() const -> server_state {
    return impl_->state;
}

auto upload_http_server::port() const -> uint16_t {
    return impl_->bound_port;
}

auto upload_http_server::sessions() const -> std::shared_ptr<upload_session_manager> {
    return impl_->sessions;
}

auto upload_http_server::config() const -> const server_config& {
    return impl_->config;
}

}  // namespace upload_pipeline
