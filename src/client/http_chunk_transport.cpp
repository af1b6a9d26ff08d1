/**
 * @file http_chunk_transport.cpp
 * @brief HTTP chunk transport backed by network_system
 */

#include "upload_pipeline/client/http_chunk_transport.h"

#include "upload_pipeline/config/feature_flags.h"
#include "upload_pipeline/core/logging.h"

#include <map>
#include <optional>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace upload_pipeline {

namespace {

struct raw_response {
    int status_code = 0;
    std::string body;
};

}  // namespace

struct http_chunk_transport::impl {
    http_transport_config config;
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
    // Declared after client: abandoned requests are joined before it is released.
    blocking_call_runner calls;

    static auto convert(const kcenon::network::internal::http_response& resp) -> raw_response {
        return raw_response{resp.status_code, std::string(resp.body.begin(), resp.body.end())};
    }
#endif

    [[nodiscard]] auto url(const std::string& path) const -> std::string {
        return config.base_url + config.route_prefix + path;
    }

    /**
     * @brief POST on a runner thread, returning early if @p token trips
     */
    auto post_cancellable(const std::string& target,
                          std::string body,
                          std::map<std::string, std::string> headers,
                          cancellation_token& token) -> result<raw_response> {
#if KCENON_WITH_NETWORK_SYSTEM
        auto reply = std::make_shared<std::optional<result<raw_response>>>();
        auto finished = calls.run(
            [client = client, reply, target, body = std::move(body),
             headers = std::move(headers)] {
                auto response = client->post(target, body, headers);
                if (response.is_err()) {
                    *reply = result<raw_response>(unexpected(
                        error{error_code::transport_failed, "HTTP POST " + target + " failed"}));
                } else {
                    *reply = result<raw_response>(convert(response.value()));
                }
            },
            token);
        if (!finished || token.is_cancelled()) {
            return unexpected(error{error_code::cancelled, "chunk request aborted"});
        }
        return std::move(**reply);
#else
        (void)target;
        (void)body;
        (void)headers;
        (void)token;
        return unexpected(error{error_code::internal_error,
                                "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"});
#endif
    }
};

http_chunk_transport::http_chunk_transport(std::unique_ptr<impl> impl)
    : impl_(std::move(impl)) {}

http_chunk_transport::~http_chunk_transport() = default;

auto http_chunk_transport::create(http_transport_config config)
    -> result<std::shared_ptr<http_chunk_transport>> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto state = std::make_unique<impl>();
    state->client = std::make_shared<kcenon::network::core::http_client>(config.request_timeout);
    state->config = std::move(config);
    return std::shared_ptr<http_chunk_transport>(new http_chunk_transport(std::move(state)));
#else
    (void)config;
    return unexpected(error{error_code::invalid_configuration,
                            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"});
#endif
}

auto http_chunk_transport::config() const -> const http_transport_config& {
    return impl_->config;
}

auto http_chunk_transport::send_chunk(const protocol::chunk_request& request,
                                      cancellation_token& token)
    -> result<protocol::chunk_receipt> {
    if (token.is_cancelled()) {
        return unexpected(error{error_code::cancelled, "chunk request aborted"});
    }

    auto form = protocol::encode_chunk_request(request);
    auto boundary = protocol::multipart_form::make_boundary();
    std::map<std::string, std::string> headers{
        {"Content-Type", protocol::multipart_form::content_type_for(boundary)},
        {"Accept", "application/json"},
    };

    auto reply = impl_->post_cancellable(impl_->url("/upload"), form.encode(boundary),
                                         std::move(headers), token);
    if (!reply) {
        return unexpected(reply.error());
    }
    if (token.is_cancelled()) {
        return unexpected(error{error_code::cancelled, "chunk request aborted"});
    }

    auto receipt = decode_chunk_response(reply.value().status_code, reply.value().body);
    if (!receipt && receipt.error().code == error_code::session_not_found &&
        !request.upload_id) {
        // 404 without a session id means the route itself is missing.
        return unexpected(error{error_code::server_error, receipt.error().message});
    }
    return receipt;
}

auto http_chunk_transport::query_status(const std::string& upload_id)
    -> result<protocol::session_status> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(impl_->url("/status/" + upload_id), {}, {});
    if (response.is_err()) {
        return unexpected(error{error_code::transport_failed, "HTTP GET status failed"});
    }
    auto reply = impl::convert(response.value());
    if (reply.status_code == 404) {
        return unexpected(error{error_code::session_not_found,
                                protocol::parse_error_body(reply.body).message});
    }
    if (reply.status_code < 200 || reply.status_code >= 300) {
        return unexpected(error{error_code::server_error,
                                "HTTP " + std::to_string(reply.status_code)});
    }
    return protocol::parse_session_status(reply.body);
#else
    (void)upload_id;
    return unexpected(error{error_code::internal_error,
                            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"});
#endif
}

auto http_chunk_transport::cancel_session(const std::string& upload_id) -> result<void> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->del(impl_->url("/upload/" + upload_id), {});
    if (response.is_err()) {
        return unexpected(error{error_code::transport_failed, "HTTP DELETE failed"});
    }
    auto reply = impl::convert(response.value());
    if (reply.status_code == 404) {
        return unexpected(error{error_code::session_not_found,
                                protocol::parse_error_body(reply.body).message});
    }
    if (reply.status_code < 200 || reply.status_code >= 300) {
        return unexpected(error{error_code::server_error,
                                "HTTP " + std::to_string(reply.status_code)});
    }
    UP_LOG_DEBUG(log_category::transfer, "server session " + upload_id + " cancelled");
    return {};
#else
    (void)upload_id;
    return unexpected(error{error_code::internal_error,
                            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"});
#endif
}

}  // namespace upload_pipeline
