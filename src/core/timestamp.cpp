/**
 * @file timestamp.cpp
 * @brief ISO-8601 formatting
 */

#include "upload_pipeline/core/timestamp.h"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace upload_pipeline {

auto to_iso8601(std::chrono::system_clock::time_point tp) -> std::string {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

auto iso8601_now() -> std::string {
    return to_iso8601(std::chrono::system_clock::now());
}

}  // namespace upload_pipeline
