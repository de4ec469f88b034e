#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urlscope::base64 {

enum class Alphabet { STANDARD, URL_SAFE };

inline std::string encode(const uint8_t* data, size_t len, Alphabet alphabet = Alphabet::STANDARD) {
    static const char kStandard[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    static const char kUrlSafe[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";
    const char* chars = (alphabet == Alphabet::URL_SAFE) ? kUrlSafe : kStandard;

    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += chars[(n >> 18) & 0x3F];
        result += chars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? chars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? chars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(std::string_view text, Alphabet alphabet = Alphabet::STANDARD) {
    return encode(reinterpret_cast<const uint8_t*>(text.data()), text.size(), alphabet);
}

/**
 * @brief Strict padded decode.
 *
 * Rejects input whose length is not a multiple of 4, characters outside the
 * chosen alphabet, '=' anywhere but the last two positions, and non-zero
 * trailing bits. Any accepted input re-encodes to itself.
 */
inline std::optional<std::vector<uint8_t>> decode(std::string_view encoded,
                                                  Alphabet alphabet = Alphabet::STANDARD) {
    if (encoded.empty() || encoded.size() % 4 != 0) return std::nullopt;

    const char c62 = (alphabet == Alphabet::URL_SAFE) ? '-' : '+';
    const char c63 = (alphabet == Alphabet::URL_SAFE) ? '_' : '/';
    auto value_of = [c62, c63](char c) -> int {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a' + 26;
        if (c >= '0' && c <= '9') return c - '0' + 52;
        if (c == c62) return 62;
        if (c == c63) return 63;
        return -1;
    };

    size_t padding = 0;
    if (encoded.back() == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    if (padding == 1 && encoded[encoded.size() - 2] == '=') return std::nullopt;
    const size_t data_len = encoded.size() - padding;

    std::vector<uint8_t> result;
    result.reserve(3 * encoded.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (size_t i = 0; i < data_len; ++i) {
        const int val = value_of(encoded[i]);
        if (val < 0) return std::nullopt;
        buf = (buf << 6) | static_cast<uint32_t>(val);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }

    // Leftover bits must be zero (canonical encoding)
    if (bits > 0 && (buf & ((1u << bits) - 1)) != 0) return std::nullopt;
    return result;
}

} // namespace urlscope::base64
