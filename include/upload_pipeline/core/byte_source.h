/**
 * @file byte_source.h
 * @brief Random-access byte content backing an upload item
 */

#ifndef UPLOAD_PIPELINE_CORE_BYTE_SOURCE_H
#define UPLOAD_PIPELINE_CORE_BYTE_SOURCE_H

#include "upload_pipeline/core/types.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace upload_pipeline {

/**
 * @brief Read-only content of one file to upload
 *
 * Implementations must be safe to read from one thread while another
 * thread queries size() or describe().
 */
class byte_source {
public:
    virtual ~byte_source() = default;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;

    /**
     * @brief Read [offset, offset + length) clamped to size()
     */
    [[nodiscard]] virtual auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> = 0;

    /**
     * @brief Human-readable origin (path or label) for logs
     */
    [[nodiscard]] virtual auto describe() const -> std::string = 0;

    /**
     * @brief Path that can be reopened after a process restart, if any
     */
    [[nodiscard]] virtual auto persistent_path() const -> std::optional<std::filesystem::path> {
        return std::nullopt;
    }
};

/**
 * @brief Byte source backed by a file on disk
 *
 * The file is reopened for every read so a source never holds a
 * descriptor between chunks.
 */
class file_byte_source : public byte_source {
public:
    /**
     * @brief Open a file and capture its current size
     * @return Error if the file does not exist or is not a regular file
     */
    [[nodiscard]] static auto open(const std::filesystem::path& path)
        -> result<std::shared_ptr<file_byte_source>>;

    [[nodiscard]] auto size() const -> uint64_t override { return size_; }
    [[nodiscard]] auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> override;
    [[nodiscard]] auto describe() const -> std::string override { return path_.string(); }
    [[nodiscard]] auto persistent_path() const -> std::optional<std::filesystem::path> override {
        return path_;
    }

    file_byte_source(std::filesystem::path path, uint64_t size);

private:
    std::filesystem::path path_;
    uint64_t size_;
};

/**
 * @brief Byte source over an in-memory buffer
 */
class memory_byte_source : public byte_source {
public:
    memory_byte_source(std::vector<std::byte> data, std::string label = "memory");

    [[nodiscard]] auto size() const -> uint64_t override { return data_.size(); }
    [[nodiscard]] auto read(uint64_t offset, std::size_t length) const
        -> result<std::vector<std::byte>> override;
    [[nodiscard]] auto describe() const -> std::string override { return label_; }

private:
    std::vector<std::byte> data_;
    std::string label_;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_BYTE_SOURCE_H
