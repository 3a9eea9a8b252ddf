/**
 * @file signal_codec.h
 * @brief Connection descriptors and their copy-pasteable text codes
 *
 * A connection code is the UTF-8 JSON object {"type":"offer"|"answer","sdp":"..."}
 * encoded as base64url without padding, so it survives chat clients and URL
 * fields unchanged. Raw JSON is accepted on input as well.
 */

#ifndef KCENON_PEER_TRANSFER_SIGNAL_SIGNAL_CODEC_H
#define KCENON_PEER_TRANSFER_SIGNAL_SIGNAL_CODEC_H

#include <kcenon/peer_transfer/core/types.h>

#include <optional>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Role of a session description
 */
enum class signal_kind {
    offer,
    answer
};

[[nodiscard]] constexpr auto to_string(signal_kind kind) -> const char* {
    switch (kind) {
        case signal_kind::offer: return "offer";
        case signal_kind::answer: return "answer";
        default: return "unknown";
    }
}

/**
 * @brief Parse the wire name of a signal kind
 */
[[nodiscard]] auto parse_signal_kind(std::string_view text) -> std::optional<signal_kind>;

/**
 * @brief Session description exchanged out-of-band
 */
struct signal_descriptor {
    signal_kind kind = signal_kind::offer;
    std::string sdp;

    [[nodiscard]] auto operator==(const signal_descriptor&) const -> bool = default;
};

/**
 * @brief Encode a descriptor as a connection code
 * @return base64url text without '+', '/' or '='
 */
[[nodiscard]] auto encode_signal(const signal_descriptor& descriptor) -> std::string;

/**
 * @brief Decode a connection code
 *
 * Surrounding whitespace is ignored. Text starting with '{' is read as raw
 * JSON; anything else is base64url-decoded first.
 *
 * @return Descriptor, or malformed_signal with a readable reason
 */
[[nodiscard]] auto decode_signal(std::string_view text) -> result<signal_descriptor>;

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_SIGNAL_SIGNAL_CODEC_H
