/**
 * @file peer_states.h
 * @brief Lifecycle states of connections, peers and data channels
 */

#ifndef KCENON_PEER_TRANSFER_CORE_PEER_STATES_H
#define KCENON_PEER_TRANSFER_CORE_PEER_STATES_H

namespace kcenon::peer_transfer {

/**
 * @brief State of a connection as seen by the connection manager
 */
enum class connection_state {
    idle,        ///< No connection
    connecting,  ///< Descriptor exchange or ICE negotiation in progress
    connected,   ///< Peer connection established
    failed       ///< Negotiation failed; teardown required before retrying
};

[[nodiscard]] constexpr auto to_string(connection_state state) -> const char* {
    switch (state) {
        case connection_state::idle: return "idle";
        case connection_state::connecting: return "connecting";
        case connection_state::connected: return "connected";
        case connection_state::failed: return "failed";
        default: return "unknown";
    }
}

/**
 * @brief Connection state reported by a peer backend
 */
enum class peer_state {
    created,
    connecting,
    connected,
    disconnected,
    failed,
    closed
};

[[nodiscard]] constexpr auto to_string(peer_state state) -> const char* {
    switch (state) {
        case peer_state::created: return "new";
        case peer_state::connecting: return "connecting";
        case peer_state::connected: return "connected";
        case peer_state::disconnected: return "disconnected";
        case peer_state::failed: return "failed";
        case peer_state::closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief ICE transport state reported by a peer backend
 */
enum class ice_state {
    created,
    checking,
    connected,
    completed,
    disconnected,
    failed,
    closed
};

[[nodiscard]] constexpr auto to_string(ice_state state) -> const char* {
    switch (state) {
        case ice_state::created: return "new";
        case ice_state::checking: return "checking";
        case ice_state::connected: return "connected";
        case ice_state::completed: return "completed";
        case ice_state::disconnected: return "disconnected";
        case ice_state::failed: return "failed";
        case ice_state::closed: return "closed";
        default: return "unknown";
    }
}

/**
 * @brief Local candidate gathering state
 */
enum class gathering_state {
    created,
    in_progress,
    complete
};

[[nodiscard]] constexpr auto to_string(gathering_state state) -> const char* {
    switch (state) {
        case gathering_state::created: return "new";
        case gathering_state::in_progress: return "gathering";
        case gathering_state::complete: return "complete";
        default: return "unknown";
    }
}

/**
 * @brief Lifecycle of a data channel
 */
enum class channel_state {
    connecting,
    open,
    closing,
    closed
};

[[nodiscard]] constexpr auto to_string(channel_state state) -> const char* {
    switch (state) {
        case channel_state::connecting: return "connecting";
        case channel_state::open: return "open";
        case channel_state::closing: return "closing";
        case channel_state::closed: return "closed";
        default: return "unknown";
    }
}

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_PEER_STATES_H
