/**
 * @file chunk_codec.cpp
 * @brief Chunk range computation and chunk reads
 */

#include "upload_pipeline/core/chunk_codec.h"

#include <algorithm>

namespace upload_pipeline {

auto chunk_layout::range(uint64_t index, uint64_t file_size) const -> result<byte_range> {
    auto total = chunk_count(file_size);
    if (index >= total) {
        return unexpected(error{error_code::invalid_chunk_index,
                                "chunk index " + std::to_string(index) + " out of range (total " +
                                    std::to_string(total) + ")"});
    }

    byte_range r;
    r.begin = std::min<uint64_t>(index * chunk_size, file_size);
    r.end = std::min<uint64_t>(r.begin + chunk_size, file_size);
    return r;
}

auto chunk_layout::read_chunk(const byte_source& source, uint64_t index) const
    -> result<encoded_chunk> {
    auto file_size = source.size();
    auto r = range(index, file_size);
    if (!r) {
        return unexpected(r.error());
    }

    auto bytes = source.read(r.value().begin, static_cast<std::size_t>(r.value().length()));
    if (!bytes) {
        return unexpected(bytes.error());
    }
    if (bytes.value().size() != r.value().length()) {
        return unexpected(error{error_code::file_read_error,
                                "source changed size while reading chunk " +
                                    std::to_string(index)});
    }

    encoded_chunk c;
    c.index = index;
    c.total_chunks = chunk_count(file_size);
    c.offset = r.value().begin;
    c.bytes = std::move(bytes.value());
    return c;
}

}  // namespace upload_pipeline
