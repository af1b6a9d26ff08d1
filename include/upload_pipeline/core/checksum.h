/**
 * @file checksum.h
 * @brief SHA-256 digests for assembled artifacts
 */

#ifndef UPLOAD_PIPELINE_CORE_CHECKSUM_H
#define UPLOAD_PIPELINE_CORE_CHECKSUM_H

#include "upload_pipeline/core/types.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace upload_pipeline {

/**
 * @brief Incremental SHA-256 (OpenSSL EVP)
 *
 * Used by assembly to hash the artifact while chunks are concatenated.
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;
    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finish and return the lowercase hex digest
     *
     * The hasher cannot be updated afterwards.
     */
    [[nodiscard]] auto finish() -> result<std::string>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

class checksum {
public:
    /**
     * @brief SHA-256 of a buffer as lowercase hex
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief SHA-256 of a file as lowercase hex
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;
};

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_CHECKSUM_H
