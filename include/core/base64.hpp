#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tenantdb::base64 {

inline std::string encode(const uint8_t* data, size_t len) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(const std::vector<uint8_t>& bytes) {
    return encode(bytes.data(), bytes.size());
}

/**
 * @brief Strict decode: rejects characters outside the alphabet and bad padding.
 *
 * Stored password hashes are decoded with this; a malformed hash must not
 * decode to something that happens to have the right length.
 */
[[nodiscard]] inline std::optional<std::vector<uint8_t>> decode(std::string_view encoded) {
    if (encoded.size() % 4 != 0) {
        return std::nullopt;
    }

    auto value_of = [](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == '+') return 62;
        if (c == '/') return 63;
        return -1;
    };

    std::vector<uint8_t> result;
    result.reserve(3 * encoded.size() / 4);

    for (size_t i = 0; i < encoded.size(); i += 4) {
        const bool last = (i + 4 == encoded.size());
        int v[4];
        int padding = 0;
        for (size_t j = 0; j < 4; ++j) {
            const char c = encoded[i + j];
            if (c == '=') {
                if (!last || j < 2) return std::nullopt;
                v[j] = 0;
                ++padding;
            } else {
                if (padding > 0) return std::nullopt;
                v[j] = value_of(c);
                if (v[j] < 0) return std::nullopt;
            }
        }

        const uint32_t n = (static_cast<uint32_t>(v[0]) << 18) | (static_cast<uint32_t>(v[1]) << 12) |
                           (static_cast<uint32_t>(v[2]) << 6) | static_cast<uint32_t>(v[3]);
        result.push_back(static_cast<uint8_t>((n >> 16) & 0xFF));
        if (padding < 2) result.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
        if (padding < 1) result.push_back(static_cast<uint8_t>(n & 0xFF));
    }
    return result;
}

} // namespace tenantdb::base64
