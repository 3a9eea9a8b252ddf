/**
 * @file peer_backend.h
 * @brief Abstraction over the ICE/DTLS/SCTP machinery of a peer connection
 * @version 0.1.0
 *
 * Implementations deliver every handler on the event loop the session runs
 * on. Backends with their own threads marshal with boost::asio::post.
 */

#ifndef KCENON_PEER_TRANSFER_TRANSPORT_PEER_BACKEND_H
#define KCENON_PEER_TRANSFER_TRANSPORT_PEER_BACKEND_H

#include <kcenon/peer_transfer/core/peer_states.h>
#include <kcenon/peer_transfer/core/types.h>
#include <kcenon/peer_transfer/signal/signal_codec.h>
#include <kcenon/peer_transfer/transport/transport_config.h>

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Handlers for data channel events
 */
struct channel_handlers {
    std::function<void()> on_open;
    std::function<void()> on_closed;
    std::function<void(std::string)> on_error;
    std::function<void(std::string)> on_text;
    std::function<void(byte_buffer)> on_binary;
    /// Backlog dropped to or below the low threshold
    std::function<void()> on_buffered_amount_low;
};

/**
 * @brief Reliable, ordered message channel between the two peers
 */
class data_channel {
public:
    virtual ~data_channel() = default;

    data_channel(const data_channel&) = delete;
    auto operator=(const data_channel&) -> data_channel& = delete;

    [[nodiscard]] virtual auto label() const -> std::string = 0;

    [[nodiscard]] virtual auto state() const -> channel_state = 0;

    [[nodiscard]] auto is_open() const -> bool { return state() == channel_state::open; }

    /**
     * @brief Bytes enqueued but not yet handed to the network
     */
    [[nodiscard]] virtual auto buffered_amount() const -> uint64_t = 0;

    virtual void set_buffered_amount_low_threshold(uint64_t threshold) = 0;

    [[nodiscard]] virtual auto buffered_amount_low_threshold() const -> uint64_t = 0;

    /**
     * @brief Enqueue a text frame
     * @return Success, or channel_closed / backend_error
     */
    [[nodiscard]] virtual auto send_text(std::string_view text) -> result<void> = 0;

    /**
     * @brief Enqueue a binary frame
     * @return Success, or channel_closed / backend_error
     */
    [[nodiscard]] virtual auto send_binary(const byte_buffer& data) -> result<void> = 0;

    virtual void close() = 0;

    /**
     * @brief Replace all handlers; pass an empty struct to detach
     */
    void set_handlers(channel_handlers handlers) { handlers_ = std::move(handlers); }

protected:
    data_channel() = default;

    channel_handlers handlers_;
};

/**
 * @brief Handlers for peer connection events
 */
struct peer_handlers {
    std::function<void(peer_state)> on_state;
    std::function<void(ice_state)> on_ice_state;
    std::function<void(gathering_state)> on_gathering_state;
    /// Channel created by the remote peer
    std::function<void(std::shared_ptr<data_channel>)> on_data_channel;
};

/**
 * @brief One side of a peer connection
 */
class peer_backend {
public:
    virtual ~peer_backend() = default;

    peer_backend(const peer_backend&) = delete;
    auto operator=(const peer_backend&) -> peer_backend& = delete;

    /**
     * @brief Create the data channel (initiator only, before the offer)
     */
    [[nodiscard]] virtual auto create_data_channel(const std::string& label)
        -> result<std::shared_ptr<data_channel>> = 0;

    /**
     * @brief Generate the local offer or answer and start candidate gathering
     */
    [[nodiscard]] virtual auto set_local_description(signal_kind kind) -> result<void> = 0;

    /**
     * @brief Apply the description received from the remote peer
     */
    [[nodiscard]] virtual auto set_remote_description(const signal_descriptor& descriptor)
        -> result<void> = 0;

    /**
     * @brief Local description including the candidates gathered so far
     */
    [[nodiscard]] virtual auto local_description() const -> std::optional<signal_descriptor> = 0;

    [[nodiscard]] virtual auto state() const -> peer_state = 0;

    [[nodiscard]] virtual auto gathering() const -> gathering_state = 0;

    /**
     * @brief Close the connection; no handler is invoked afterwards
     */
    virtual void close() = 0;

    void set_handlers(peer_handlers handlers) { handlers_ = std::move(handlers); }

protected:
    peer_backend() = default;

    peer_handlers handlers_;
};

/**
 * @brief Creates peer backends
 */
class backend_factory {
public:
    virtual ~backend_factory() = default;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /**
     * @brief Create a peer connection
     * @param config ICE servers and channel configuration
     */
    [[nodiscard]] virtual auto create_peer(const peer_config& config)
        -> result<std::unique_ptr<peer_backend>> = 0;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_TRANSPORT_PEER_BACKEND_H
