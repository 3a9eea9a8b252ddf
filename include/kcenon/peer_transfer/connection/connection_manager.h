/**
 * @file connection_manager.h
 * @brief Peer connection lifecycle and manual signaling
 * @version 0.1.0
 */

#ifndef KCENON_PEER_TRANSFER_CONNECTION_CONNECTION_MANAGER_H
#define KCENON_PEER_TRANSFER_CONNECTION_CONNECTION_MANAGER_H

#include <kcenon/peer_transfer/core/event_queue.h>
#include <kcenon/peer_transfer/core/peer_states.h>
#include <kcenon/peer_transfer/core/transfer_event.h>
#include <kcenon/peer_transfer/core/types.h>
#include <kcenon/peer_transfer/signal/signal_codec.h>
#include <kcenon/peer_transfer/transport/peer_backend.h>
#include <kcenon/peer_transfer/transport/transport_config.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Which side of the descriptor exchange this peer is on
 */
enum class connection_role {
    none,
    initiator,  ///< Created the offer and the data channel
    responder   ///< Answered a remote offer
};

[[nodiscard]] constexpr auto to_string(connection_role role) -> const char* {
    switch (role) {
        case connection_role::none: return "none";
        case connection_role::initiator: return "initiator";
        case connection_role::responder: return "responder";
        default: return "unknown";
    }
}

/**
 * @brief Owns the peer connection and drives the offer/answer exchange
 *
 * State machine:
 * @code
 * idle --create_as_initiator/create_as_responder--> connecting
 * connecting --backend connected--> connected
 * connecting|connected --backend failed--> failed
 * any --teardown()--> idle
 * @endcode
 *
 * Failures are reported once (as an error_event in the queue) and never
 * retried; retrying is the caller's decision after teardown().
 */
class connection_manager : public std::enable_shared_from_this<connection_manager> {
public:
    /// Receives the local connection code, or the reason none was produced
    using code_handler = std::function<void(result<std::string>)>;

    /// Told about the data channel when it appears, and nullptr when it goes away
    using channel_listener = std::function<void(std::shared_ptr<data_channel>)>;

    [[nodiscard]] static auto create(boost::asio::io_context& io,
                                     std::shared_ptr<backend_factory> factory,
                                     const peer_config& config,
                                     std::shared_ptr<event_queue<transfer_event>> events)
        -> std::shared_ptr<connection_manager>;

    ~connection_manager();

    connection_manager(const connection_manager&) = delete;
    auto operator=(const connection_manager&) -> connection_manager& = delete;

    /**
     * @brief Start a new connection as the initiator
     *
     * Tears down any previous connection, creates the data channel and the
     * local offer, and waits (bounded) for candidate gathering. The handler
     * receives the encoded offer, or gathering_timeout after which the
     * connection is torn down again.
     */
    void create_as_initiator(code_handler handler);

    /**
     * @brief Answer a remote offer
     *
     * The code is validated before any existing connection is touched. The
     * handler receives the encoded answer. The data channel arrives later
     * from the remote side.
     */
    void create_as_responder(std::string_view remote_offer_code, code_handler handler);

    /**
     * @brief Apply the answer to our offer
     *
     * Valid only for the initiator while connecting. Reaching connected is
     * reported through state events.
     *
     * @return Success, invalid_state, malformed_signal or backend_error
     */
    [[nodiscard]] auto apply_remote_answer(std::string_view code) -> result<void>;

    /**
     * @brief Apply whatever code the user pasted
     *
     * Offers are answered (the handler receives the answer code); answers are
     * applied to the pending offer (the handler receives an empty string).
     */
    void apply_remote_code(std::string_view code, code_handler handler);

    /**
     * @brief Close the channel and the connection and return to idle
     *
     * A pending code handler fails with invalid_state.
     */
    void teardown();

    [[nodiscard]] auto state() const -> connection_state { return state_; }
    [[nodiscard]] auto ice() const -> ice_state { return ice_; }
    [[nodiscard]] auto role() const -> connection_role { return role_; }

    /// Last connection code generated locally (empty if none)
    [[nodiscard]] auto local_code() const -> const std::string& { return local_code_; }

    /// True while waiting for candidate gathering
    [[nodiscard]] auto is_generating_code() const -> bool { return static_cast<bool>(pending_code_); }

    [[nodiscard]] auto channel() const -> const std::shared_ptr<data_channel>& { return channel_; }

    void set_channel_listener(channel_listener listener) { channel_listener_ = std::move(listener); }

    [[nodiscard]] auto config() const -> const peer_config& { return config_; }

private:
    connection_manager(boost::asio::io_context& io,
                       std::shared_ptr<backend_factory> factory,
                       const peer_config& config,
                       std::shared_ptr<event_queue<transfer_event>> events);

    [[nodiscard]] auto open_peer(connection_role role) -> result<void>;
    void install_handlers();
    void adopt_channel(std::shared_ptr<data_channel> channel);
    void wait_for_gathering(code_handler handler);
    void finish_gathering();
    void on_gathering_timeout();
    void abort_creation(code_handler handler, error reason);
    void post_result(code_handler handler, result<std::string> outcome);

    void on_peer_state(peer_state state);
    void on_ice_state(ice_state state);
    void on_gathering_state(gathering_state state);
    void on_remote_channel(std::shared_ptr<data_channel> channel);
    void fail(error reason);
    void set_state(connection_state state);

    boost::asio::io_context& io_;
    std::shared_ptr<backend_factory> factory_;
    peer_config config_;
    std::shared_ptr<event_queue<transfer_event>> events_;
    boost::asio::steady_timer gathering_timer_;

    std::unique_ptr<peer_backend> peer_;
    std::shared_ptr<data_channel> channel_;
    channel_listener channel_listener_;
    code_handler pending_code_;

    connection_state state_ = connection_state::idle;
    ice_state ice_ = ice_state::created;
    connection_role role_ = connection_role::none;
    std::string local_code_;
    uint64_t generation_ = 0;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_CONNECTION_CONNECTION_MANAGER_H
