/**
 * @file channel_transport.h
 * @brief Chunked file sending with backpressure over a data channel
 * @version 0.1.0
 */

#ifndef KCENON_PEER_TRANSFER_TRANSPORT_CHANNEL_TRANSPORT_H
#define KCENON_PEER_TRANSFER_TRANSPORT_CHANNEL_TRANSPORT_H

#include <kcenon/peer_transfer/core/chunk_splitter.h>
#include <kcenon/peer_transfer/core/event_queue.h>
#include <kcenon/peer_transfer/core/file_source.h>
#include <kcenon/peer_transfer/core/received_file.h>
#include <kcenon/peer_transfer/core/transfer_event.h>
#include <kcenon/peer_transfer/core/types.h>
#include <kcenon/peer_transfer/protocol/receive_handler.h>
#include <kcenon/peer_transfer/transport/peer_backend.h>
#include <kcenon/peer_transfer/transport/transport_config.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::peer_transfer {

/// Cancellation flag shared between a session and its in-flight send
using abort_flag = std::shared_ptr<std::atomic<bool>>;

/**
 * @brief Drives one data channel: outbound file framing and inbound routing
 *
 * A file is sent as a meta frame, binary chunks and an end frame. Each chunk
 * is a separate turn of the event loop. When the channel backlog exceeds the
 * configured ceiling, sending is suspended until the channel reports its
 * backlog at or below the low threshold, or fails with flow_control_timeout
 * once the bounded wait elapses.
 *
 * Inbound text and binary frames are handed to a receive_handler.
 */
class channel_transport : public std::enable_shared_from_this<channel_transport> {
public:
    using completion_handler = std::function<void(result<void>)>;

    /**
     * @brief Create a transport for a channel
     *
     * Call attach() before use.
     */
    [[nodiscard]] static auto create(boost::asio::io_context& io,
                                     std::shared_ptr<data_channel> channel,
                                     const peer_config& config,
                                     std::shared_ptr<event_queue<transfer_event>> events,
                                     std::shared_ptr<received_file_list> received)
        -> std::shared_ptr<channel_transport>;

    ~channel_transport();

    channel_transport(const channel_transport&) = delete;
    auto operator=(const channel_transport&) -> channel_transport& = delete;

    /**
     * @brief Install channel handlers and set the low-backlog threshold
     */
    void attach();

    /**
     * @brief Stop using the channel
     *
     * Removes the handlers, fails an in-flight send with channel_closed and
     * abandons the incoming transfer. The channel itself is not closed.
     */
    void detach();

    /**
     * @brief Send one file
     *
     * The handler runs on the event loop once the end frame was enqueued or
     * the send failed (channel_closed, transfer_cancelled,
     * flow_control_timeout, file_read_error, transfer_in_progress).
     *
     * @param transfer_id Id announced in the meta and end frames
     * @param source File to send
     * @param abort Checked before every chunk
     * @param handler Completion handler
     */
    void send_file(std::string transfer_id,
                   file_source_ptr source,
                   abort_flag abort,
                   completion_handler handler);

    /**
     * @brief Wake a send suspended on backpressure so it re-checks its abort flag
     */
    void interrupt();

    [[nodiscard]] auto is_open() const -> bool;
    [[nodiscard]] auto is_sending() const -> bool { return current_ != nullptr; }

    /// Snapshot of the outgoing file, if one is in flight
    [[nodiscard]] auto send_progress() const -> std::optional<transfer_progress>;

    /// Snapshot of the incoming file, if one is active
    [[nodiscard]] auto receive_progress() const -> std::optional<transfer_progress>;

    [[nodiscard]] auto channel() const -> const std::shared_ptr<data_channel>& { return channel_; }

    [[nodiscard]] auto receiver() -> receive_handler& { return receiver_; }

private:
    struct send_operation;
    using operation_ptr = std::shared_ptr<send_operation>;

    channel_transport(boost::asio::io_context& io,
                      std::shared_ptr<data_channel> channel,
                      const peer_config& config,
                      std::shared_ptr<event_queue<transfer_event>> events,
                      std::shared_ptr<received_file_list> received);

    void schedule_step(const operation_ptr& op);
    void step(const operation_ptr& op);
    void wait_for_drain(const operation_ptr& op);
    void resume_waiting_send();
    void complete(operation_ptr op, result<void> outcome);
    void publish_progress(const send_operation& op);

    void on_open();
    void on_closed();
    void on_error(const std::string& message);
    void on_buffered_amount_low();

    boost::asio::io_context& io_;
    std::shared_ptr<data_channel> channel_;
    peer_config config_;
    std::shared_ptr<event_queue<transfer_event>> events_;
    chunk_splitter splitter_;
    receive_handler receiver_;
    boost::asio::steady_timer flow_timer_;

    operation_ptr current_;
    operation_ptr drain_wait_;
    bool attached_ = false;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_TRANSPORT_CHANNEL_TRANSPORT_H
