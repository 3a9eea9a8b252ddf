/**
 * @file receive_handler.h
 * @brief Inbound frame handling for the receiving side of a channel
 */

#ifndef KCENON_PEER_TRANSFER_PROTOCOL_RECEIVE_HANDLER_H
#define KCENON_PEER_TRANSFER_PROTOCOL_RECEIVE_HANDLER_H

#include <kcenon/peer_transfer/core/chunk_assembler.h>
#include <kcenon/peer_transfer/core/event_queue.h>
#include <kcenon/peer_transfer/core/progress_throttle.h>
#include <kcenon/peer_transfer/core/received_file.h>
#include <kcenon/peer_transfer/core/transfer_event.h>
#include <kcenon/peer_transfer/protocol/control_message.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Routes inbound frames to the active incoming transfer
 *
 * - meta: starts a transfer (subject to the duplicate meta policy) and
 *   publishes a zero-progress snapshot
 * - binary: appended to the active transfer, dropped if none is active
 * - end: finalizes the matching transfer into a received file; an end for
 *   any other id is ignored
 *
 * Malformed and unknown text frames are dropped.
 */
class receive_handler {
public:
    using clock = progress_throttle::clock;

    receive_handler(std::shared_ptr<event_queue<transfer_event>> events,
                    std::shared_ptr<received_file_list> received,
                    duplicate_meta_policy policy = duplicate_meta_policy::replace,
                    std::chrono::milliseconds progress_interval = progress_throttle::default_interval);

    void on_text(std::string_view text, clock::time_point now = clock::now());

    void on_binary(byte_buffer data, clock::time_point now = clock::now());

    /**
     * @brief Discard the active transfer, publishing an abandoned event
     */
    void abandon();

    /**
     * @brief Snapshot of the active incoming transfer
     */
    [[nodiscard]] auto progress() const -> std::optional<transfer_progress>;

    [[nodiscard]] auto has_active_transfer() const -> bool;

    /// Frames that were discarded (garbage text, orphan binary, ignored meta)
    [[nodiscard]] auto dropped_frames() const -> uint64_t { return dropped_frames_; }

private:
    void handle_meta(meta_message meta, clock::time_point now);
    void handle_end(const end_message& end);
    void publish_abandoned(const incoming_transfer& transfer);

    std::shared_ptr<event_queue<transfer_event>> events_;
    std::shared_ptr<received_file_list> received_;
    chunk_assembler assembler_;
    progress_throttle throttle_;
    uint64_t dropped_frames_ = 0;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_PROTOCOL_RECEIVE_HANDLER_H
