/**
 * @file checksum.cpp
 * @brief SHA-256 via OpenSSL EVP
 */

#include "upload_pipeline/core/checksum.h"

#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace upload_pipeline {

namespace {

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

auto to_hex(const unsigned char* digest, unsigned int len) -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<int>(digest[i]);
    }
    return oss.str();
}

}  // namespace

struct sha256_hasher::impl {
    evp_md_ctx_wrapper ctx;
    bool ready = false;
    bool finished = false;
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {
    if (impl_->ctx && EVP_DigestInit_ex(impl_->ctx.get(), EVP_sha256(), nullptr) == 1) {
        impl_->ready = true;
    }
}

sha256_hasher::~sha256_hasher() = default;
sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;
auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->ready || impl_->finished) {
        return unexpected(error{error_code::internal_error, "digest context not usable"});
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return unexpected(error{error_code::internal_error, "EVP_DigestUpdate failed"});
    }
    return {};
}

auto sha256_hasher::finish() -> result<std::string> {
    if (!impl_->ready || impl_->finished) {
        return unexpected(error{error_code::internal_error, "digest context not usable"});
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    impl_->finished = true;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &len) != 1) {
        return unexpected(error{error_code::internal_error, "EVP_DigestFinal_ex failed"});
    }
    return to_hex(digest.data(), len);
}

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &len, EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(digest.data(), len);
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected(
            error{error_code::file_not_found, "cannot open file: " + path.string()});
    }

    sha256_hasher hasher;
    std::array<char, 64 * 1024> buffer{};
    while (file) {
        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto n = static_cast<std::size_t>(file.gcount());
        if (n == 0) break;
        auto updated = hasher.update(
            std::as_bytes(std::span<const char>(buffer.data(), n)));
        if (!updated) {
            return unexpected(updated.error());
        }
    }
    if (file.bad()) {
        return unexpected(
            error{error_code::file_read_error, "read failed: " + path.string()});
    }

    return hasher.finish();
}

}  // namespace upload_pipeline
