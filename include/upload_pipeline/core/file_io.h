/**
 * @file file_io.h
 * @brief Small whole-file helpers shared by the stores
 */

#ifndef UPLOAD_PIPELINE_CORE_FILE_IO_H
#define UPLOAD_PIPELINE_CORE_FILE_IO_H

#include "upload_pipeline/core/types.h"

#include <filesystem>
#include <string>
#include <string_view>

namespace upload_pipeline {

/**
 * @brief Write @p data to a sibling temp file, then rename over @p path
 *
 * Readers never observe a partially written file.
 */
[[nodiscard]] auto write_file_atomic(const std::filesystem::path& path, std::string_view data)
    -> result<void>;

[[nodiscard]] auto read_file(const std::filesystem::path& path) -> result<std::string>;

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_FILE_IO_H
