/**
 * @file multipart.h
 * @brief multipart/form-data encoding and parsing for chunk requests
 */

#ifndef UPLOAD_PIPELINE_PROTOCOL_MULTIPART_H
#define UPLOAD_PIPELINE_PROTOCOL_MULTIPART_H

#include "upload_pipeline/core/types.h"

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace upload_pipeline::protocol {

/**
 * @brief One part of a multipart body
 */
struct multipart_part {
    std::string name;
    std::optional<std::string> filename;
    std::string content_type;
    std::string data;
};

/**
 * @brief An ordered set of form parts
 */
class multipart_form {
public:
    void add_field(std::string name, std::string value);

    void add_file(std::string name,
                  std::string filename,
                  std::span<const std::byte> data,
                  std::string content_type = "application/octet-stream");

    /**
     * @brief First part with the given name, or nullptr
     */
    [[nodiscard]] auto find(std::string_view name) const -> const multipart_part*;

    /**
     * @brief Value of a plain text field
     */
    [[nodiscard]] auto field(std::string_view name) const -> std::optional<std::string>;

    [[nodiscard]] auto parts() const -> const std::vector<multipart_part>& { return parts_; }

    [[nodiscard]] auto encode(const std::string& boundary) const -> std::string;

    [[nodiscard]] static auto make_boundary() -> std::string;

    [[nodiscard]] static auto content_type_for(const std::string& boundary) -> std::string;

    /**
     * @brief Parse a body using the boundary named in @p content_type
     */
    [[nodiscard]] static auto parse(std::string_view content_type, std::string_view body)
        -> result<multipart_form>;

private:
    std::vector<multipart_part> parts_;
};

}  // namespace upload_pipeline::protocol

#endif  // UPLOAD_PIPELINE_PROTOCOL_MULTIPART_H
