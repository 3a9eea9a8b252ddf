/**
 * @file transfer_event.h
 * @brief Events published to observers of a transfer session
 */

#ifndef KCENON_PEER_TRANSFER_CORE_TRANSFER_EVENT_H
#define KCENON_PEER_TRANSFER_CORE_TRANSFER_EVENT_H

#include <kcenon/peer_transfer/core/peer_states.h>
#include <kcenon/peer_transfer/core/received_file.h>
#include <kcenon/peer_transfer/core/types.h>

#include <cstdint>
#include <string>
#include <variant>

namespace kcenon::peer_transfer {

/// Connection manager moved between states
struct connection_state_changed {
    connection_state previous = connection_state::idle;
    connection_state current = connection_state::idle;
};

/// ICE transport state reported by the backend
struct ice_state_changed {
    ice_state state = ice_state::created;
};

/// Data channel opened or closed
struct channel_state_changed {
    channel_state state = channel_state::connecting;
};

/// Throttled progress snapshot of an outgoing or incoming file
struct progress_event {
    transfer_progress progress;
};

/// An incoming file was reassembled
struct file_received_event {
    received_file_ptr file;
};

/// An outgoing file was fully enqueued, including its end frame
struct transfer_sent_event {
    std::string transfer_id;
    std::string file_name;
    uint64_t bytes = 0;
};

/// An outgoing file stopped before its end frame was sent
struct transfer_failed_event {
    std::string transfer_id;
    std::string file_name;
    uint64_t sent_bytes = 0;
    error reason;
};

/// An unfinished incoming file was discarded
struct transfer_abandoned_event {
    std::string transfer_id;
    std::string file_name;
    uint64_t received_bytes = 0;
    uint64_t declared_size = 0;
};

/// Error not tied to a specific transfer (negotiation, channel errors)
struct error_event {
    error reason;
};

using transfer_event = std::variant<connection_state_changed,
                                    ice_state_changed,
                                    channel_state_changed,
                                    progress_event,
                                    file_received_event,
                                    transfer_sent_event,
                                    transfer_failed_event,
                                    transfer_abandoned_event,
                                    error_event>;

/**
 * @brief Merge rule for event_queue that collapses intermediate progress
 *
 * A pending progress snapshot is replaced by a newer one for the same file
 * and direction, except the zero snapshot that opens a transfer and a
 * snapshot that already reports completion.
 */
[[nodiscard]] inline auto supersedes_progress(const transfer_event& pending,
                                              const transfer_event& incoming) -> bool {
    const auto* older = std::get_if<progress_event>(&pending);
    const auto* newer = std::get_if<progress_event>(&incoming);
    if (!older || !newer) {
        return false;
    }
    return older->progress.direction == newer->progress.direction &&
           older->progress.transfer_id == newer->progress.transfer_id &&
           older->progress.done_bytes > 0 &&
           !older->progress.is_complete();
}

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CORE_TRANSFER_EVENT_H
