/**
 * @file upload_http_handler.cpp
 * @brief Request routing for the upload server
 */

#include "upload_pipeline/server/upload_http_handler.h"

#include <algorithm>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "upload_pipeline/core/logging.h"
#include "upload_pipeline/core/timestamp.h"
#include "upload_pipeline/protocol/multipart.h"
#include "upload_pipeline/protocol/wire_format.h"

namespace upload_pipeline {

namespace {

auto json_reply(unsigned status, const nlohmann::json& body) -> http_reply {
    http_reply reply;
    reply.status = status;
    reply.body = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return reply;
}

auto error_reply(unsigned status, std::string title, std::string message) -> http_reply {
    return json_reply(status, protocol::error_body{std::move(title), std::move(message)});
}

auto error_title(error_code code) -> std::string {
    if (code == error_code::session_not_found) {
        return "Upload not found";
    }
    if (code == error_code::chunk_too_large) {
        return "Chunk too large";
    }
    if (is_validation_error(code)) {
        return "Invalid request";
    }
    return "Upload failed";
}

auto failure_reply(const error& err) -> http_reply {
    return error_reply(http_status_for(err.code), error_title(err.code), err.message);
}

/**
 * @brief Path segments after stripping the query string
 */
auto split_path(std::string_view target) -> std::vector<std::string> {
    auto query = target.find('?');
    if (query != std::string_view::npos) {
        target = target.substr(0, query);
    }

    std::vector<std::string> segments;
    std::size_t pos = 0;
    while (pos <= target.size()) {
        auto next = target.find('/', pos);
        if (next == std::string_view::npos) {
            next = target.size();
        }
        if (next > pos) {
            segments.emplace_back(target.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return segments;
}

auto method_not_allowed(const http_request& request) -> http_reply {
    return error_reply(405, "Method not allowed",
                       request.method + " is not supported for " + request.target);
}

}  // namespace

auto http_status_for(error_code code) -> unsigned {
    if (code == error_code::session_not_found || code == error_code::not_found) {
        return 404;
    }
    if (code == error_code::chunk_too_large) {
        return 413;
    }
    if (is_validation_error(code)) {
        return 400;
    }
    return 500;
}

upload_http_handler::upload_http_handler(std::shared_ptr<upload_session_manager> sessions)
    : sessions_(std::move(sessions)) {}

auto upload_http_handler::handle(const http_request& request) const -> http_reply {
    const auto path = split_path(request.target);
    const auto prefix = split_path(sessions_->config().route_prefix);
    const auto& method = request.method;

    if (path.size() == 1 && path[0] == "health") {
        return method == "GET" ? handle_health() : method_not_allowed(request);
    }

    const bool under_prefix =
        path.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), path.begin());
    if (!under_prefix) {
        return error_reply(404, "Not found", "no route for " + request.target);
    }

    // Segments after the prefix
    std::vector<std::string> rest(path.begin() + static_cast<std::ptrdiff_t>(prefix.size()),
                                  path.end());

    if (rest.empty()) {
        return method == "GET" ? handle_list() : method_not_allowed(request);
    }
    if (rest.size() == 1 && rest[0] == "upload") {
        return method == "POST" ? handle_upload(request) : method_not_allowed(request);
    }
    if (rest.size() == 2 && rest[0] == "status") {
        return method == "GET" ? handle_status(rest[1]) : method_not_allowed(request);
    }
    if (rest.size() == 2 && rest[0] == "upload") {
        return method == "DELETE" ? handle_cancel(rest[1]) : method_not_allowed(request);
    }
    if (rest.size() == 3 && rest[0] == "upload" && rest[2] == "status") {
        return method == "GET" ? handle_status(rest[1]) : method_not_allowed(request);
    }

    return error_reply(404, "Not found", "no route for " + request.target);
}

auto upload_http_handler::handle_upload(const http_request& request) const -> http_reply {
    auto form = protocol::multipart_form::parse(request.content_type, request.body);
    if (!form) {
        return failure_reply(form.error());
    }

    auto chunk = protocol::decode_chunk_request(form.value());
    if (!chunk) {
        return failure_reply(chunk.error());
    }

    auto receipt = sessions_->receive_chunk(chunk.value());
    if (!receipt) {
        upload_log_context ctx;
        ctx.upload_id = chunk.value().upload_id.value_or("");
        ctx.file_name = chunk.value().file_name;
        ctx.chunk_index = chunk.value().chunk_index;
        ctx.total_chunks = chunk.value().total_chunks;
        ctx.error_message = receipt.error().message;
        UP_LOG_WARN_CTX(log_category::http, "chunk rejected", ctx);
        return failure_reply(receipt.error());
    }
    return json_reply(200, receipt.value());
}

auto upload_http_handler::handle_status(const std::string& upload_id) const -> http_reply {
    auto status = sessions_->status(upload_id);
    if (!status) {
        return failure_reply(status.error());
    }
    return json_reply(200, status.value());
}

auto upload_http_handler::handle_cancel(const std::string& upload_id) const -> http_reply {
    auto cancelled = sessions_->cancel(upload_id);
    if (!cancelled) {
        return failure_reply(cancelled.error());
    }
    return json_reply(200, nlohmann::json{
                               {"message", "Upload cancelled and cleaned up"},
                               {"uploadId", upload_id},
                           });
}

auto upload_http_handler::handle_list() const -> http_reply {
    auto records = sessions_->list_completed();
    return json_reply(200, nlohmann::json{
                               {"total", records.size()},
                               {"evidence", records},
                           });
}

auto upload_http_handler::handle_health() const -> http_reply {
    return json_reply(200, nlohmann::json{
                               {"status", "ok"},
                               {"timestamp", iso8601_now()},
                               {"activeUploads", sessions_->active_session_count()},
                           });
}

}  // namespace upload_pipeline
