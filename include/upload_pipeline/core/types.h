/**
 * @file types.h
 * @brief Core type definitions for upload_pipeline
 */

#ifndef UPLOAD_PIPELINE_CORE_TYPES_H
#define UPLOAD_PIPELINE_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace upload_pipeline {

/**
 * @brief Error codes for upload operations
 *
 * Error code ranges:
 * - -100 to -119: File I/O errors
 * - -120 to -139: Chunk and request validation errors
 * - -140 to -159: Configuration errors
 * - -160 to -179: Transport errors
 * - -180 to -199: Session and assembly errors
 * - -200 to -219: Internal errors
 */
enum class error_code {
    success = 0,

    // File I/O errors (-100 to -119)
    file_not_found = -100,
    file_read_error = -101,
    file_write_error = -102,
    source_unavailable = -103,

    // Validation errors (-120 to -139)
    invalid_request = -120,
    invalid_chunk_index = -121,
    invalid_metadata = -122,
    chunk_count_mismatch = -123,
    chunk_too_large = -124,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,

    // Transport errors (-160 to -179)
    transport_failed = -160,
    transport_timeout = -161,
    server_error = -162,
    malformed_response = -163,
    cancelled = -164,

    // Session and assembly errors (-180 to -199)
    session_not_found = -180,
    assembly_failed = -181,
    chunk_read_failed = -182,
    missing_chunks = -183,

    // Internal errors (-200 to -219)
    internal_error = -200,
    store_error = -201,
    not_found = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::source_unavailable:
            return "source file unavailable";
        case error_code::invalid_request:
            return "invalid request";
        case error_code::invalid_chunk_index:
            return "invalid chunk index";
        case error_code::invalid_metadata:
            return "invalid metadata";
        case error_code::chunk_count_mismatch:
            return "chunk count mismatch";
        case error_code::chunk_too_large:
            return "chunk too large";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::transport_failed:
            return "transport failed";
        case error_code::transport_timeout:
            return "transport timeout";
        case error_code::server_error:
            return "server error";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::cancelled:
            return "cancelled";
        case error_code::session_not_found:
            return "session not found";
        case error_code::assembly_failed:
            return "assembly failed";
        case error_code::chunk_read_failed:
            return "chunk read failed";
        case error_code::missing_chunks:
            return "missing chunks";
        case error_code::internal_error:
            return "internal error";
        case error_code::store_error:
            return "store error";
        case error_code::not_found:
            return "not found";
        default:
            return "unknown error";
    }
}

/**
 * @brief Transport-level failures that the transfer client may retry
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) -> bool {
    return code == error_code::transport_failed ||
           code == error_code::transport_timeout ||
           code == error_code::server_error ||
           code == error_code::malformed_response;
}

[[nodiscard]] constexpr auto is_cancellation(error_code code) -> bool {
    return code == error_code::cancelled;
}

/**
 * @brief Malformed request data; never retried
 */
[[nodiscard]] constexpr auto is_validation_error(error_code code) -> bool {
    return code == error_code::invalid_request ||
           code == error_code::invalid_chunk_index ||
           code == error_code::invalid_metadata ||
           code == error_code::chunk_count_mismatch ||
           code == error_code::chunk_too_large;
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_TYPES_H
