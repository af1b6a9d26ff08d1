/**
 * @file multipart.cpp
 * @brief multipart/form-data codec
 */

#include "upload_pipeline/protocol/multipart.h"

#include <algorithm>
#include <cctype>
#include <random>

namespace upload_pipeline::protocol {

namespace {

constexpr std::string_view crlf = "\r\n";

auto iequals(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
               return std::tolower(static_cast<unsigned char>(x)) ==
                      std::tolower(static_cast<unsigned char>(y));
           });
}

auto trim(std::string_view s) -> std::string_view {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

auto unquote(std::string_view s) -> std::string {
    s = trim(s);
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') {
        s = s.substr(1, s.size() - 2);
    }
    return std::string(s);
}

/**
 * @brief Find parameter @p key in a header value like `a; key="v"; b=c`
 */
auto header_param(std::string_view value, std::string_view key) -> std::optional<std::string> {
    std::size_t pos = 0;
    while (pos < value.size()) {
        auto semi = value.find(';', pos);
        auto token = trim(value.substr(pos, semi == std::string_view::npos ? value.size() - pos
                                                                            : semi - pos));
        auto eq = token.find('=');
        if (eq != std::string_view::npos && iequals(trim(token.substr(0, eq)), key)) {
            return unquote(token.substr(eq + 1));
        }
        if (semi == std::string_view::npos) break;
        pos = semi + 1;
    }
    return std::nullopt;
}

auto parse_error(const std::string& msg) -> unexpected {
    return unexpected(error{error_code::invalid_request, "malformed multipart body: " + msg});
}

}  // namespace

void multipart_form::add_field(std::string name, std::string value) {
    parts_.push_back(multipart_part{std::move(name), std::nullopt, {}, std::move(value)});
}

void multipart_form::add_file(std::string name,
                              std::string filename,
                              std::span<const std::byte> data,
                              std::string content_type) {
    multipart_part part;
    part.name = std::move(name);
    part.filename = std::move(filename);
    part.content_type = std::move(content_type);
    part.data.assign(reinterpret_cast<const char*>(data.data()), data.size());
    parts_.push_back(std::move(part));
}

auto multipart_form::find(std::string_view name) const -> const multipart_part* {
    auto it = std::find_if(parts_.begin(), parts_.end(),
                           [&](const multipart_part& p) { return p.name == name; });
    return it != parts_.end() ? &*it : nullptr;
}

auto multipart_form::field(std::string_view name) const -> std::optional<std::string> {
    const auto* part = find(name);
    if (!part) return std::nullopt;
    return part->data;
}

auto multipart_form::encode(const std::string& boundary) const -> std::string {
    std::string out;
    for (const auto& part : parts_) {
        out += "--";
        out += boundary;
        out += crlf;
        out += "Content-Disposition: form-data; name=\"" + part.name + "\"";
        if (part.filename) {
            out += "; filename=\"" + *part.filename + "\"";
        }
        out += crlf;
        if (!part.content_type.empty()) {
            out += "Content-Type: " + part.content_type;
            out += crlf;
        }
        out += crlf;
        out += part.data;
        out += crlf;
    }
    out += "--";
    out += boundary;
    out += "--";
    out += crlf;
    return out;
}

auto multipart_form::make_boundary() -> std::string {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    constexpr char hex_chars[] = "0123456789abcdef";

    std::string boundary = "----upload-pipeline-";
    for (int i = 0; i < 24; ++i) {
        boundary += hex_chars[dis(gen)];
    }
    return boundary;
}

auto multipart_form::content_type_for(const std::string& boundary) -> std::string {
    return "multipart/form-data; boundary=" + boundary;
}

auto multipart_form::parse(std::string_view content_type, std::string_view body)
    -> result<multipart_form> {
    auto semi = content_type.find(';');
    auto media_type = trim(content_type.substr(0, semi));
    if (!iequals(media_type, "multipart/form-data")) {
        return unexpected(error{error_code::invalid_request,
                                "expected multipart/form-data, got '" +
                                    std::string(media_type) + "'"});
    }

    auto boundary = header_param(content_type, "boundary");
    if (!boundary || boundary->empty()) {
        return parse_error("missing boundary");
    }

    const std::string delimiter = "--" + *boundary;
    const std::string separator = std::string(crlf) + delimiter;

    auto pos = body.find(delimiter);
    if (pos == std::string_view::npos) {
        return parse_error("opening boundary not found");
    }
    pos += delimiter.size();

    multipart_form form;
    while (true) {
        if (body.substr(pos, 2) == "--") {
            return form;
        }
        if (body.substr(pos, 2) != crlf) {
            return parse_error("expected CRLF after boundary");
        }
        pos += 2;

        auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string_view::npos) {
            return parse_error("unterminated part headers");
        }

        multipart_part part;
        auto headers = body.substr(pos, headers_end - pos);
        std::size_t line_start = 0;
        while (line_start <= headers.size()) {
            auto line_end = headers.find(crlf, line_start);
            auto line = headers.substr(line_start, line_end == std::string_view::npos
                                                       ? headers.size() - line_start
                                                       : line_end - line_start);
            auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                auto name = trim(line.substr(0, colon));
                auto value = trim(line.substr(colon + 1));
                if (iequals(name, "Content-Disposition")) {
                    if (auto n = header_param(value, "name")) part.name = *n;
                    part.filename = header_param(value, "filename");
                } else if (iequals(name, "Content-Type")) {
                    part.content_type = std::string(value);
                }
            }
            if (line_end == std::string_view::npos) break;
            line_start = line_end + 2;
        }

        if (part.name.empty()) {
            return parse_error("part without a name");
        }

        auto data_start = headers_end + 4;
        auto data_end = body.find(separator, data_start);
        if (data_end == std::string_view::npos) {
            return parse_error("closing boundary not found");
        }
        part.data = std::string(body.substr(data_start, data_end - data_start));
        form.parts_.push_back(std::move(part));

        pos = data_end + separator.size();
    }
}

}  // namespace upload_pipeline::protocol
