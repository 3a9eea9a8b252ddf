/**
 * @file peer_transfer.h
 * @brief Main header for peer_trans_system library
 * @version 0.1.0
 *
 * This is the primary include file for the peer_trans_system library.
 * Include this header to access all peer-to-peer transfer functionality.
 *
 * @code
 * #include <kcenon/peer_transfer/peer_transfer.h>
 *
 * using namespace kcenon::peer_transfer;
 *
 * boost::asio::io_context io;
 * auto config = peer_config_builder()
 *     .with_stun(true)
 *     .build();
 *
 * auto session = transfer_session::create(
 *     io, std::make_shared<loopback_hub>(io), config);
 * @endcode
 */

#ifndef KCENON_PEER_TRANSFER_PEER_TRANSFER_H
#define KCENON_PEER_TRANSFER_PEER_TRANSFER_H

#include <string>

#include "kcenon/peer_transfer/config/feature_flags.h"

// Core types
#include "kcenon/peer_transfer/core/types.h"
#include "kcenon/peer_transfer/core/file_source.h"
#include "kcenon/peer_transfer/core/file_utils.h"
#include "kcenon/peer_transfer/core/logging.h"
#include "kcenon/peer_transfer/core/received_file.h"
#include "kcenon/peer_transfer/core/transfer_event.h"

// Signaling
#include "kcenon/peer_transfer/signal/signal_codec.h"
#include "kcenon/peer_transfer/protocol/control_message.h"

// Backends
#include "kcenon/peer_transfer/transport/transport_config.h"
#include "kcenon/peer_transfer/transport/loopback_backend.h"
#if PEER_TRANS_HAS_DATACHANNEL
#include "kcenon/peer_transfer/transport/datachannel_backend.h"
#endif

// Session
#include "kcenon/peer_transfer/session/transfer_session.h"

namespace kcenon::peer_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_PEER_TRANSFER_H
