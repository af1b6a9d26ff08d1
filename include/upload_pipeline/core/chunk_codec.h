/**
 * @file chunk_codec.h
 * @brief Fixed-size chunk layout for a file of known size
 */

#ifndef UPLOAD_PIPELINE_CORE_CHUNK_CODEC_H
#define UPLOAD_PIPELINE_CORE_CHUNK_CODEC_H

#include "upload_pipeline/core/byte_source.h"
#include "upload_pipeline/core/types.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace upload_pipeline {

/**
 * @brief Half-open byte range [begin, end)
 */
struct byte_range {
    uint64_t begin = 0;
    uint64_t end = 0;

    [[nodiscard]] auto length() const -> uint64_t { return end - begin; }
    [[nodiscard]] auto operator==(const byte_range& other) const -> bool = default;
};

/**
 * @brief One chunk read from a source, with its position in the file
 */
struct encoded_chunk {
    uint64_t index = 0;
    uint64_t total_chunks = 0;
    uint64_t offset = 0;
    std::vector<std::byte> bytes;
};

/**
 * @brief Splits a file of size S into chunks of size C
 *
 * Chunk i covers [i*C, min((i+1)*C, S)). A zero-byte file is one empty
 * chunk so the server still creates a session and an artifact for it.
 */
struct chunk_layout {
    /// Default chunk size (5 MiB)
    static constexpr std::size_t default_chunk_size = 5 * 1024 * 1024;

    std::size_t chunk_size = default_chunk_size;

    chunk_layout() = default;
    explicit chunk_layout(std::size_t size) : chunk_size(size) {}

    [[nodiscard]] auto validate() const -> result<void> {
        if (chunk_size == 0) {
            return unexpected(error{error_code::invalid_chunk_size,
                                    "chunk size must be greater than zero"});
        }
        return {};
    }

    [[nodiscard]] auto chunk_count(uint64_t file_size) const -> uint64_t {
        if (file_size == 0) return 1;
        return (file_size + chunk_size - 1) / chunk_size;
    }

    [[nodiscard]] auto chunk_index_for_offset(uint64_t offset) const -> uint64_t {
        return offset / chunk_size;
    }

    /**
     * @brief Byte range of chunk @p index
     * @return invalid_chunk_index when index >= chunk_count(file_size)
     */
    [[nodiscard]] auto range(uint64_t index, uint64_t file_size) const -> result<byte_range>;

    /**
     * @brief Read chunk @p index from @p source
     *
     * Deterministic: the same index always yields the same bytes.
     */
    [[nodiscard]] auto read_chunk(const byte_source& source, uint64_t index) const
        -> result<encoded_chunk>;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_CHUNK_CODEC_H
