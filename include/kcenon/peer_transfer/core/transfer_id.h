/**
 * @file transfer_id.h
 * @brief Transfer identifier generation
 */

#ifndef KCENON_PEER_TRANSFER_CORE_TRANSFER_ID_H
#define KCENON_PEER_TRANSFER_CORE_TRANSFER_ID_H

#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Generate a random transfer id (UUID version 4, lowercase text form)
 */
[[nodiscard]] auto generate_transfer_id() -> std::string;

/**
 * @brief Check whether text has the canonical 8-4-4-4-12 hex UUID layout
 *
 * Remote peers may use any id string; this is only used for diagnostics.
 */
[[nodiscard]] auto is_uuid_format(std::string_view text) -> bool;

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_TRANSFER_ID_H
