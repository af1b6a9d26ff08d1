/**
 * @file file_io.cpp
 * @brief Atomic file writes
 */

#include "upload_pipeline/core/file_io.h"

#include "upload_pipeline/core/unique_id.h"

#include <fstream>
#include <sstream>

namespace upload_pipeline {

auto write_file_atomic(const std::filesystem::path& path, std::string_view data)
    -> result<void> {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    auto temp_path = path;
    temp_path += ".tmp_" + unique_id::generate().to_string().substr(0, 8);

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file) {
            return unexpected(error{error_code::file_write_error,
                                    "cannot open for writing: " + temp_path.string()});
        }
        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file) {
            file.close();
            std::filesystem::remove(temp_path, ec);
            return unexpected(error{error_code::file_write_error,
                                    "write failed: " + temp_path.string()});
        }
    }

    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp_path, ignored);
        return unexpected(error{error_code::file_write_error,
                                "cannot rename temp file: " + ec.message()});
    }
    return {};
}

auto read_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::file_not_found,
                                "cannot open file: " + path.string()});
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        return unexpected(error{error_code::file_read_error, "read failed: " + path.string()});
    }
    return oss.str();
}

}  // namespace upload_pipeline
