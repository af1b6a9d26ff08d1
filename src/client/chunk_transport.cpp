/**
 * @file chunk_transport.cpp
 * @brief HTTP status mapping for chunk responses
 */

#include "upload_pipeline/client/chunk_transport.h"

namespace upload_pipeline {

namespace {

auto describe(int status_code, std::string_view body) -> std::string {
    auto parsed = protocol::parse_error_body(body);
    std::string text = "HTTP " + std::to_string(status_code);
    if (!parsed.error.empty()) {
        text += ": " + parsed.error;
    }
    if (!parsed.message.empty()) {
        text += (parsed.error.empty() ? ": " : " - ") + parsed.message;
    }
    return text;
}

}  // namespace

auto decode_chunk_response(int status_code, std::string_view body)
    -> result<protocol::chunk_receipt> {
    if (status_code >= 200 && status_code < 300) {
        return protocol::parse_chunk_receipt(body);
    }
    if (status_code == 404) {
        return unexpected(error{error_code::session_not_found, describe(status_code, body)});
    }
    if (status_code == 408 || status_code == 429) {
        return unexpected(error{error_code::server_error, describe(status_code, body)});
    }
    if (status_code >= 400 && status_code < 500) {
        return unexpected(error{error_code::invalid_request, describe(status_code, body)});
    }
    return unexpected(error{error_code::server_error, describe(status_code, body)});
}

}  // namespace upload_pipeline
