/**
 * @file timestamp.h
 * @brief ISO-8601 timestamps used in item records and wire responses
 */

#ifndef UPLOAD_PIPELINE_CORE_TIMESTAMP_H
#define UPLOAD_PIPELINE_CORE_TIMESTAMP_H

#include <chrono>
#include <string>

namespace upload_pipeline {

/**
 * @brief Format a time point as UTC "YYYY-MM-DDTHH:MM:SS.mmmZ"
 */
[[nodiscard]] auto to_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

[[nodiscard]] auto iso8601_now() -> std::string;

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_TIMESTAMP_H
