/**
 * @file control_message.h
 * @brief Text control frames framing each file on the data channel
 *
 * Wire format (UTF-8 JSON text frames):
 * @code
 * {"type":"meta","id":"<id>","name":"<name>","size":<bytes>,"mime":"<type>"}
 * {"type":"end","id":"<id>"}
 * @endcode
 */

#ifndef KCENON_PEER_TRANSFER_PROTOCOL_CONTROL_MESSAGE_H
#define KCENON_PEER_TRANSFER_PROTOCOL_CONTROL_MESSAGE_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace kcenon::peer_transfer {

/**
 * @brief Announces a file; followed by its binary chunks
 */
struct meta_message {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string mime;

    [[nodiscard]] auto operator==(const meta_message&) const -> bool = default;
};

/**
 * @brief Marks the end of the chunks of a file
 */
struct end_message {
    std::string id;

    [[nodiscard]] auto operator==(const end_message&) const -> bool = default;
};

using control_message = std::variant<meta_message, end_message>;

[[nodiscard]] auto serialize(const meta_message& message) -> std::string;
[[nodiscard]] auto serialize(const end_message& message) -> std::string;
[[nodiscard]] auto serialize(const control_message& message) -> std::string;

/**
 * @brief Parse a text frame
 *
 * Garbage, unknown types and frames with missing or ill-typed fields yield
 * nullopt. A meta frame without a MIME type gets application/octet-stream.
 */
[[nodiscard]] auto parse_control_message(std::string_view text)
    -> std::optional<control_message>;

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_PROTOCOL_CONTROL_MESSAGE_H
