/**
 * @file unique_id.cpp
 * @brief UUID v4 generation and formatting
 */

#include "upload_pipeline/core/unique_id.h"

#include <cctype>
#include <iomanip>
#include <random>
#include <sstream>

namespace upload_pipeline {

namespace {

auto hex_value(char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    return static_cast<uint8_t>(c - 'A' + 10);
}

}  // namespace

auto unique_id::generate() -> unique_id {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    unique_id id;
    uint64_t high = dis(gen);
    uint64_t low = dis(gen);
    for (int i = 0; i < 8; ++i) {
        id.bytes[i] = static_cast<uint8_t>((high >> (i * 8)) & 0xFF);
        id.bytes[i + 8] = static_cast<uint8_t>((low >> (i * 8)) & 0xFF);
    }

    id.bytes[6] = (id.bytes[6] & 0x0F) | 0x40;
    id.bytes[8] = (id.bytes[8] & 0x3F) | 0x80;
    return id;
}

auto unique_id::from_string(std::string_view str) -> std::optional<unique_id> {
    std::string hex;
    hex.reserve(32);
    for (char c : str) {
        if (c == '-') continue;
        if (!std::isxdigit(static_cast<unsigned char>(c))) {
            return std::nullopt;
        }
        hex += c;
    }
    if (hex.size() != 32) {
        return std::nullopt;
    }

    unique_id id;
    for (std::size_t i = 0; i < 16; ++i) {
        id.bytes[i] = static_cast<uint8_t>((hex_value(hex[i * 2]) << 4) | hex_value(hex[i * 2 + 1]));
    }
    return id;
}

auto unique_id::to_string() const -> std::string {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (std::size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) {
            oss << '-';
        }
        oss << std::setw(2) << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

auto make_item_id() -> std::string {
    return "upload-" + unique_id::generate().to_string();
}

auto make_session_id() -> std::string {
    return "session-" + unique_id::generate().to_string();
}

}  // namespace upload_pipeline
