/**
 * @file upload_http_handler.h
 * @brief Routes HTTP requests to the upload session manager
 */

#ifndef UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_HANDLER_H
#define UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_HANDLER_H

#include <memory>
#include <string>

#include "upload_pipeline/core/types.h"
#include "upload_pipeline/server/upload_session_manager.h"

namespace upload_pipeline {

/**
 * @brief Transport-neutral HTTP request
 */
struct http_request {
    std::string method;
    /// Path with optional query string
    std::string target;
    std::string content_type;
    std::string body;
};

struct http_reply {
    unsigned status = 200;
    std::string content_type = "application/json";
    std::string body;
};

/**
 * @brief HTTP status for a failed operation
 *
 * Validation errors are 400 (413 for oversized chunks), unknown sessions
 * 404, everything else 500.
 */
[[nodiscard]] auto http_status_for(error_code code) -> unsigned;

/**
 * @brief Maps requests under the route prefix to session manager calls
 *
 * Routes:
 * - POST   {prefix}/upload                 multipart chunk
 * - GET    {prefix}/status/{id}            session status
 * - GET    {prefix}/upload/{id}/status     same
 * - DELETE {prefix}/upload/{id}            cancel session
 * - GET    {prefix}                        completed uploads
 * - GET    /health
 */
class upload_http_handler {
public:
    explicit upload_http_handler(std::shared_ptr<upload_session_manager> sessions);

    [[nodiscard]] auto handle(const http_request& request) const -> http_reply;

    [[nodiscard]] auto sessions() const -> const std::shared_ptr<upload_session_manager>& {
        return sessions_;
    }

private:
    [[nodiscard]] auto handle_upload(const http_request& request) const -> http_reply;
    [[nodiscard]] auto handle_status(const std::string& upload_id) const -> http_reply;
    [[nodiscard]] auto handle_cancel(const std::string& upload_id) const -> http_reply;
    [[nodiscard]] auto handle_list() const -> http_reply;
    [[nodiscard]] auto handle_health() const -> http_reply;

    std::shared_ptr<upload_session_manager> sessions_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_SERVER_UPLOAD_HTTP_HANDLER_H
