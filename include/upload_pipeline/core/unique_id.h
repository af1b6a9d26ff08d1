/**
 * @file unique_id.h
 * @brief Random identifiers for upload items and server sessions
 */

#ifndef UPLOAD_PIPELINE_CORE_UNIQUE_ID_H
#define UPLOAD_PIPELINE_CORE_UNIQUE_ID_H

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace upload_pipeline {

/**
 * @brief RFC 4122 version 4 identifier
 */
struct unique_id {
    std::array<uint8_t, 16> bytes{};

    [[nodiscard]] static auto generate() -> unique_id;

    /**
     * @brief Parse the canonical 8-4-4-4-12 form (dashes optional)
     */
    [[nodiscard]] static auto from_string(std::string_view str) -> std::optional<unique_id>;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const unique_id& other) const -> bool = default;
};

/**
 * @brief Client-side item id, "upload-<uuid>"
 */
[[nodiscard]] auto make_item_id() -> std::string;

/**
 * @brief Server-side session id, "session-<uuid>"
 */
[[nodiscard]] auto make_session_id() -> std::string;

}  // namespace upload_pipeline

#endif  // UPLOAD_PIPELINE_CORE_UNIQUE_ID_H
