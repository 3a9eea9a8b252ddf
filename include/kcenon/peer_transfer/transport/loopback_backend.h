/**
 * @file loopback_backend.h
 * @brief In-process peer backend pairing two peers on one event loop
 * @version 0.1.0
 *
 * Descriptors carry a session token instead of real ICE candidates; applying
 * an answer links the two peers through the hub. Each channel keeps a
 * simulated send buffer that drains a fixed number of bytes per tick, which
 * makes backpressure observable without a network.
 */

#ifndef KCENON_PEER_TRANSFER_TRANSPORT_LOOPBACK_BACKEND_H
#define KCENON_PEER_TRANSFER_TRANSPORT_LOOPBACK_BACKEND_H

#include <kcenon/peer_transfer/transport/peer_backend.h>
#include <kcenon/peer_transfer/transport/transport_config.h>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace kcenon::peer_transfer {

namespace detail {
class loopback_peer_core;
}  // namespace detail

/**
 * @brief Factory and rendezvous point for loopback peers
 *
 * Must be owned by a std::shared_ptr.
 *
 * @code
 * boost::asio::io_context io;
 * auto hub = std::make_shared<loopback_hub>(io);
 * auto alice = transfer_session::create(io, hub, config);
 * auto bob = transfer_session::create(io, hub, config);
 * @endcode
 */
class loopback_hub : public backend_factory,
                     public std::enable_shared_from_this<loopback_hub> {
public:
    explicit loopback_hub(boost::asio::io_context& io, loopback_options options = {});
    ~loopback_hub() override;

    [[nodiscard]] auto name() const -> std::string_view override { return "loopback"; }

    [[nodiscard]] auto create_peer(const peer_config& config)
        -> result<std::unique_ptr<peer_backend>> override;

    /**
     * @brief When disabled, candidate gathering never completes
     */
    void set_gathering_enabled(bool enabled) { gathering_enabled_ = enabled; }

    /**
     * @brief When enabled, linking two peers reports a failed connection
     */
    void set_fail_negotiation(bool fail) { fail_negotiation_ = fail; }

    [[nodiscard]] auto options() const -> const loopback_options& { return options_; }

    [[nodiscard]] auto io() -> boost::asio::io_context& { return io_; }

    /// Peers created and not yet closed
    [[nodiscard]] auto open_peers() const -> std::size_t;

private:
    friend class detail::loopback_peer_core;

    void register_peer(const std::string& token, std::weak_ptr<detail::loopback_peer_core> peer);
    void unregister_peer(const std::string& token);
    [[nodiscard]] auto find_peer(const std::string& token) const
        -> std::shared_ptr<detail::loopback_peer_core>;

    boost::asio::io_context& io_;
    loopback_options options_;
    bool gathering_enabled_ = true;
    bool fail_negotiation_ = false;
    std::unordered_map<std::string, std::weak_ptr<detail::loopback_peer_core>> peers_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_TRANSPORT_LOOPBACK_BACKEND_H
