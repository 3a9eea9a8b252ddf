/**
 * @file encoding.h
 * @brief URL-safe base64 encoding used for connection codes
 */

#ifndef KCENON_PEER_TRANSFER_CORE_ENCODING_H
#define KCENON_PEER_TRANSFER_CORE_ENCODING_H

#include <optional>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer::encoding {

/**
 * @brief Encode bytes as base64url (RFC 4648 section 5) without padding
 *
 * The output never contains '+', '/' or '='.
 */
[[nodiscard]] auto base64url_encode(std::string_view data) -> std::string;

/**
 * @brief Decode base64url text
 *
 * Trailing '=' padding is tolerated; the standard alphabet characters
 * '+' and '/' are accepted as aliases of '-' and '_'.
 *
 * @return Decoded bytes, or nullopt if the text contains characters outside
 *         the alphabet or has an impossible length
 */
[[nodiscard]] auto base64url_decode(std::string_view encoded)
    -> std::optional<std::string>;

}  // namespace kcenon::peer_transfer::encoding

#endif  // KCENON_PEER_TRANSFER_CORE_ENCODING_H
