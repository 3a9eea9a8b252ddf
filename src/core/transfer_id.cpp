/**
 * @file transfer_id.cpp
 * @brief Implementation of transfer id generation
 */

#include <kcenon/peer_transfer/core/transfer_id.h>

#include <array>
#include <cctype>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>

namespace kcenon::peer_transfer {

auto generate_transfer_id() -> std::string {
    std::array<uint8_t, 16> bytes{};

    // All 128 bits come from random_device
    std::random_device rd;
    for (std::size_t i = 0; i < bytes.size(); i += 4) {
        auto word = static_cast<uint32_t>(rd());
        for (std::size_t j = 0; j < 4; ++j) {
            bytes[i + j] = static_cast<uint8_t>((word >> (j * 8)) & 0xFF);
        }
    }

    // Set version to 4 (random UUID) - RFC 4122
    bytes[6] = (bytes[6] & 0x0F) | 0x40;

    // Set variant to RFC 4122
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

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

auto is_uuid_format(std::string_view text) -> bool {
    if (text.size() != 36) {
        return false;
    }

    for (std::size_t i = 0; i < text.size(); ++i) {
        bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
        if (dash_position) {
            if (text[i] != '-') return false;
        } else if (!std::isxdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace kcenon::peer_transfer
