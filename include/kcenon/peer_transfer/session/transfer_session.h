/**
 * @file transfer_session.h
 * @brief Peer-to-peer file transfer session
 * @version 0.1.0
 *
 * This file defines the transfer_session class which owns one peer
 * connection, its data channel transport, the received files and the event
 * queue observed by the front end.
 */

#ifndef KCENON_PEER_TRANSFER_SESSION_TRANSFER_SESSION_H
#define KCENON_PEER_TRANSFER_SESSION_TRANSFER_SESSION_H

#include <kcenon/peer_transfer/connection/connection_manager.h>
#include <kcenon/peer_transfer/core/event_queue.h>
#include <kcenon/peer_transfer/core/file_source.h>
#include <kcenon/peer_transfer/core/received_file.h>
#include <kcenon/peer_transfer/core/transfer_event.h>
#include <kcenon/peer_transfer/core/types.h>
#include <kcenon/peer_transfer/transport/channel_transport.h>
#include <kcenon/peer_transfer/transport/peer_backend.h>
#include <kcenon/peer_transfer/transport/transport_config.h>

#include <boost/asio/io_context.hpp>

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace kcenon::peer_transfer {

/**
 * @brief One peer connection and the transfers running over it
 *
 * All operations must be called from the thread running the io_context, and
 * all completion handlers run there. State changes, progress and completed
 * transfers are published to events() rather than through callbacks.
 *
 * @code
 * boost::asio::io_context io;
 * auto hub = std::make_shared<loopback_hub>(io);
 * auto session = transfer_session::create(io, hub).value();
 *
 * session->create_offer([](result<std::string> code) {
 *     if (code) {
 *         std::cout << code.value() << std::endl;
 *     }
 * });
 * io.run();
 * @endcode
 */
class transfer_session : public std::enable_shared_from_this<transfer_session> {
public:
    using code_handler = connection_manager::code_handler;
    using batch_handler = std::function<void(result<void>)>;

    /**
     * @brief Create a session
     * @param io Event loop all work runs on
     * @param factory Backend used to create peer connections
     * @param config Connection and transfer settings
     * @return Session, or invalid_argument if the configuration is invalid
     */
    [[nodiscard]] static auto create(boost::asio::io_context& io,
                                     std::shared_ptr<backend_factory> factory,
                                     const peer_config& config = {})
        -> result<std::shared_ptr<transfer_session>>;

    ~transfer_session();

    transfer_session(const transfer_session&) = delete;
    auto operator=(const transfer_session&) -> transfer_session& = delete;

    // Connection

    /// Start a connection as the initiator; the handler receives the offer code
    void create_offer(code_handler handler);

    /// Answer a remote offer; the handler receives the answer code
    void accept_offer(std::string_view remote_code, code_handler handler);

    /// Apply the answer to our offer
    [[nodiscard]] auto accept_answer(std::string_view remote_code) -> result<void>;

    /// Answer an offer or apply an answer, whichever the code is
    void apply_remote_code(std::string_view remote_code, code_handler handler);

    /**
     * @brief Close the connection
     *
     * The in-flight send fails with channel_closed, queued files are dropped
     * and an unfinished incoming file is abandoned.
     */
    void teardown();

    /**
     * @brief Tear down and forget everything received
     *
     * Transfer ids issued before the reset stay reserved; later files never
     * reuse them.
     */
    void reset();

    // Transfers

    /**
     * @brief Send files one after another
     *
     * Each file's end frame is enqueued before the next file's meta frame.
     * The handler receives success once every file was sent, or the first
     * failure (remaining files are not sent).
     *
     * @param files Files to send, in order
     * @param handler Batch completion handler
     */
    void send_files(std::vector<file_source_ptr> files, batch_handler handler = {});

    /**
     * @brief Stop the running batch at the next chunk boundary
     */
    void cancel();

    [[nodiscard]] auto is_sending() const -> bool { return sending_; }

    /// Number of files of the running batch not started yet
    [[nodiscard]] auto queued_files() const -> std::size_t { return queue_.size(); }

    /// Transfer ids issued over the lifetime of this object
    [[nodiscard]] auto issued_transfer_ids() const -> std::size_t { return used_ids_.size(); }

    // Observers

    [[nodiscard]] auto events() -> event_queue<transfer_event>& { return *events_; }

    [[nodiscard]] auto send_progress() const -> std::optional<transfer_progress>;
    [[nodiscard]] auto receive_progress() const -> std::optional<transfer_progress>;

    /// Received files, newest first
    [[nodiscard]] auto received_files() const -> std::vector<received_file_ptr>;

    [[nodiscard]] auto find_received(std::string_view transfer_id) const -> received_file_ptr;

    [[nodiscard]] auto state() const -> connection_state { return connection_->state(); }

    /// State of the data channel, closed when there is none
    [[nodiscard]] auto data_channel_state() const -> channel_state;

    [[nodiscard]] auto is_channel_open() const -> bool;

    [[nodiscard]] auto connection() const -> const connection_manager& { return *connection_; }

    [[nodiscard]] auto config() const -> const peer_config& { return config_; }

private:
    transfer_session(boost::asio::io_context& io,
                     std::shared_ptr<backend_factory> factory,
                     const peer_config& config);

    void on_channel(std::shared_ptr<data_channel> channel);
    void send_next();
    void on_file_sent(const std::string& transfer_id, result<void> outcome);
    void finish_batch(result<void> outcome);
    void reject(batch_handler handler, error reason);
    [[nodiscard]] auto next_transfer_id() -> std::string;

    boost::asio::io_context& io_;
    peer_config config_;
    std::shared_ptr<event_queue<transfer_event>> events_;
    std::shared_ptr<received_file_list> received_;
    std::shared_ptr<connection_manager> connection_;
    std::shared_ptr<channel_transport> transport_;

    std::deque<file_source_ptr> queue_;
    batch_handler batch_handler_;
    abort_flag abort_;
    bool sending_ = false;
    std::size_t batch_total_ = 0;
    std::unordered_set<std::string> used_ids_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_SESSION_TRANSFER_SESSION_H
