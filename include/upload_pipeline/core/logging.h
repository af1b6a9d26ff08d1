// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "upload_pipeline/config/feature_flags.h"

#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace upload_pipeline {

/**
 * @brief Log categories for the upload pipeline
 */
struct log_category {
    static constexpr std::string_view queue = "upload.queue";
    static constexpr std::string_view item = "upload.item";
    static constexpr std::string_view transfer = "upload.transfer";
    static constexpr std::string_view store = "upload.store";
    static constexpr std::string_view session = "upload.session";
    static constexpr std::string_view http = "upload.http";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Structured context attached to upload log records
 *
 * Only the fields that are set are rendered.
 */
struct upload_log_context {
    std::string item_id;
    std::string upload_id;
    std::string file_name;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> uploaded_bytes;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<int> progress;
    std::optional<int> retry_count;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json_object() const -> nlohmann::json {
        auto obj = nlohmann::json::object();
        if (!item_id.empty()) obj["item_id"] = item_id;
        if (!upload_id.empty()) obj["upload_id"] = upload_id;
        if (!file_name.empty()) obj["file_name"] = file_name;
        if (file_size) obj["file_size"] = *file_size;
        if (uploaded_bytes) obj["uploaded_bytes"] = *uploaded_bytes;
        if (chunk_index) obj["chunk_index"] = *chunk_index;
        if (total_chunks) obj["total_chunks"] = *total_chunks;
        if (progress) obj["progress"] = *progress;
        if (retry_count) obj["retry_count"] = *retry_count;
        if (error_message) obj["error_message"] = *error_message;
        return obj;
    }

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_object().dump();
    }
};

/**
 * @brief A complete log record, as handed to JSON sinks
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<upload_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;

    [[nodiscard]] auto to_json() const -> std::string {
        nlohmann::json obj{
            {"timestamp", timestamp},
            {"level", std::string(log_level_to_string(level))},
            {"category", category},
            {"message", message},
        };
        if (context) {
            obj.update(context->to_json_object());
        }
        if (source_file) {
            obj["source"] = {{"file", *source_file}, {"line", source_line.value_or(0)}};
        }
        return obj.dump();
    }
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide logger for the upload pipeline
 *
 * Routes to logger_system when it is compiled in, otherwise writes to
 * stderr. A callback may be installed to observe every accepted record.
 */
class upload_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const upload_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    upload_logger() = default;
    ~upload_logger() = default;

    upload_logger(const upload_logger&) = delete;
    upload_logger& operator=(const upload_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times; later calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Suppress the stderr/backend sink (callbacks still fire)
     */
    void set_sink_enabled(bool enabled) { sink_enabled_.store(enabled); }

    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const upload_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        if (get_output_format() == log_output_format::json) {
            structured_log_entry entry;
            entry.timestamp = iso8601_timestamp();
            entry.level = level;
            entry.category = std::string(category);
            entry.message = std::string(message);
            if (context) entry.context = *context;
            if (file) {
                entry.source_file = file;
                entry.source_line = line;
            }
            auto json_str = entry.to_json();

            {
                std::lock_guard<std::mutex> lock(callback_mutex_);
                if (json_callback_) {
                    json_callback_(entry, json_str);
                }
            }
            write(level, json_str);
            return;
        }

        std::ostringstream oss;
#if !UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        oss << local_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        write(level, oss.str());
    }

    void flush() {
#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void write([[maybe_unused]] log_level level, const std::string& line) {
        if (!sink_enabled_.load()) return;
#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#if UPLOAD_PIPELINE_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        gmtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
        return oss.str();
    }

    static auto local_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
        localtime_r(&time_t_val, &tm_buf);

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

/**
 * @brief Global logger instance
 */
inline upload_logger& get_logger() {
    static upload_logger instance;
    return instance;
}

#define UP_LOG(level, category, message) \
    upload_pipeline::get_logger().log(level, category, message, nullptr, __FILE__, __LINE__)

#define UP_LOG_CTX(level, category, message, context) \
    upload_pipeline::get_logger().log(level, category, message, &context, __FILE__, __LINE__)

#define UP_LOG_TRACE(category, message) \
    UP_LOG(upload_pipeline::log_level::trace, category, message)

#define UP_LOG_DEBUG(category, message) \
    UP_LOG(upload_pipeline::log_level::debug, category, message)

#define UP_LOG_INFO(category, message) \
    UP_LOG(upload_pipeline::log_level::info, category, message)

#define UP_LOG_WARN(category, message) \
    UP_LOG(upload_pipeline::log_level::warn, category, message)

#define UP_LOG_ERROR(category, message) \
    UP_LOG(upload_pipeline::log_level::error, category, message)

#define UP_LOG_DEBUG_CTX(category, message, ctx) \
    UP_LOG_CTX(upload_pipeline::log_level::debug, category, message, ctx)

#define UP_LOG_INFO_CTX(category, message, ctx) \
    UP_LOG_CTX(upload_pipeline::log_level::info, category, message, ctx)

#define UP_LOG_WARN_CTX(category, message, ctx) \
    UP_LOG_CTX(upload_pipeline::log_level::warn, category, message, ctx)

#define UP_LOG_ERROR_CTX(category, message, ctx) \
    UP_LOG_CTX(upload_pipeline::log_level::error, category, message, ctx)

}  // namespace upload_pipeline
