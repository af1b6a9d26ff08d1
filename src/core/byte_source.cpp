/**
 * @file byte_source.cpp
 * @brief File and memory byte sources
 */

#include "upload_pipeline/core/byte_source.h"

#include <algorithm>
#include <fstream>

namespace upload_pipeline {

file_byte_source::file_byte_source(std::filesystem::path path, uint64_t size)
    : path_(std::move(path)), size_(size) {}

auto file_byte_source::open(const std::filesystem::path& path)
    -> result<std::shared_ptr<file_byte_source>> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected(error{error_code::file_not_found,
                                "file not found: " + path.string()});
    }

    auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return unexpected(error{error_code::file_read_error,
                                "cannot get file size: " + ec.message()});
    }

    return std::make_shared<file_byte_source>(path, size);
}

auto file_byte_source::read(uint64_t offset, std::size_t length) const
    -> result<std::vector<std::byte>> {
    if (offset > size_) {
        return unexpected(error{error_code::file_read_error,
                                "offset " + std::to_string(offset) + " beyond end of file"});
    }

    auto to_read = static_cast<std::size_t>(std::min<uint64_t>(length, size_ - offset));
    std::vector<std::byte> buffer(to_read);
    if (to_read == 0) {
        return buffer;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file) {
        return unexpected(error{error_code::source_unavailable,
                                "cannot open file: " + path_.string()});
    }

    file.seekg(static_cast<std::streamoff>(offset));
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(to_read));
    if (static_cast<std::size_t>(file.gcount()) != to_read) {
        return unexpected(error{error_code::file_read_error,
                                "short read from " + path_.string()});
    }

    return buffer;
}

memory_byte_source::memory_byte_source(std::vector<std::byte> data, std::string label)
    : data_(std::move(data)), label_(std::move(label)) {}

auto memory_byte_source::read(uint64_t offset, std::size_t length) const
    -> result<std::vector<std::byte>> {
    if (offset > data_.size()) {
        return unexpected(error{error_code::file_read_error,
                                "offset " + std::to_string(offset) + " beyond end of buffer"});
    }

    auto begin = data_.begin() + static_cast<std::ptrdiff_t>(offset);
    auto to_read = std::min<uint64_t>(length, data_.size() - offset);
    return std::vector<std::byte>(begin, begin + static_cast<std::ptrdiff_t>(to_read));
}

}  // namespace upload_pipeline
