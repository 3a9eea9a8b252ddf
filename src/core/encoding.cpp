/**
 * @file encoding.cpp
 * @brief Implementation of base64url encoding
 */

#include <kcenon/peer_transfer/core/encoding.h>

#include <cstdint>

namespace kcenon::peer_transfer::encoding {

namespace {

constexpr const char* BASE64URL_CHARS =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

constexpr auto decode_char(char c) -> int {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '-' || c == '+') return 62;
    if (c == '_' || c == '/') return 63;
    return -1;
}

}  // namespace

auto base64url_encode(std::string_view data) -> std::string {
    std::string result;
    result.reserve(((data.size() + 2) / 3) * 4);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(static_cast<unsigned char>(data[i])) << 16;
        if (i + 1 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 1])) << 8;
        }
        if (i + 2 < data.size()) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(data[i + 2]));
        }

        result += BASE64URL_CHARS[(n >> 18) & 0x3F];
        result += BASE64URL_CHARS[(n >> 12) & 0x3F];
        if (i + 1 < data.size()) result += BASE64URL_CHARS[(n >> 6) & 0x3F];
        if (i + 2 < data.size()) result += BASE64URL_CHARS[n & 0x3F];
    }

    return result;
}

auto base64url_decode(std::string_view encoded) -> std::optional<std::string> {
    while (!encoded.empty() && encoded.back() == '=') {
        encoded.remove_suffix(1);
    }

    // A single leftover sextet cannot encode a whole byte
    if (encoded.size() % 4 == 1) {
        return std::nullopt;
    }

    std::string result;
    result.reserve((encoded.size() / 4) * 3 + 2);

    uint32_t bits = 0;
    int bit_count = 0;

    for (char c : encoded) {
        int val = decode_char(c);
        if (val < 0) {
            return std::nullopt;
        }

        bits = (bits << 6) | static_cast<uint32_t>(val);
        bit_count += 6;

        if (bit_count >= 8) {
            bit_count -= 8;
            result += static_cast<char>((bits >> bit_count) & 0xFF);
        }
    }

    return result;
}

}  // namespace kcenon::peer_transfer::encoding
