/**
 * @file upload_pipeline.h
 * @brief Main header for the upload_pipeline library
 * @version 0.1.0
 *
 * @code
 * #include <upload_pipeline/upload_pipeline.h>
 *
 * using namespace upload_pipeline;
 *
 * // Server side
 * auto server = upload_http_server::builder()
 *     .with_upload_directory("uploads")
 *     .build();
 *
 * // Client side
 * auto transport = http_chunk_transport::create({});
 * auto queue = upload_queue::builder()
 *     .with_transport(transport.value())
 *     .build();
 * @endcode
 */

#ifndef UPLOAD_PIPELINE_UPLOAD_PIPELINE_H
#define UPLOAD_PIPELINE_UPLOAD_PIPELINE_H

#include <string>

// Core
#include "upload_pipeline/core/byte_source.h"
#include "upload_pipeline/core/checksum.h"
#include "upload_pipeline/core/chunk_codec.h"
#include "upload_pipeline/core/logging.h"
#include "upload_pipeline/core/types.h"

// Wire protocol
#include "upload_pipeline/protocol/multipart.h"
#include "upload_pipeline/protocol/wire_format.h"

// Client
#include "upload_pipeline/client/http_chunk_transport.h"
#include "upload_pipeline/client/queue_store.h"
#include "upload_pipeline/client/upload_queue.h"
#include "upload_pipeline/client/upload_types.h"

// Server
#include "upload_pipeline/server/upload_http_handler.h"
#include "upload_pipeline/server/upload_http_server.h"
#include "upload_pipeline/server/upload_session_manager.h"

namespace upload_pipeline {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_UPLOAD_PIPELINE_H
