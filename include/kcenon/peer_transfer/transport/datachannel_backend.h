/**
 * @file datachannel_backend.h
 * @brief WebRTC peer backend built on libdatachannel
 * @version 0.1.0
 *
 * Only available when the library was built with PEER_TRANS_HAS_DATACHANNEL.
 */

#ifndef KCENON_PEER_TRANSFER_TRANSPORT_DATACHANNEL_BACKEND_H
#define KCENON_PEER_TRANSFER_TRANSPORT_DATACHANNEL_BACKEND_H

#include <kcenon/peer_transfer/transport/peer_backend.h>

#include <boost/asio/io_context.hpp>

#include <memory>
#include <string_view>

namespace kcenon::peer_transfer {

/**
 * @brief Creates real WebRTC peer connections
 *
 * libdatachannel invokes its callbacks on its own threads; every callback is
 * posted to the io_context so that handlers run on the session's event loop.
 * The ordered, reliable data channel is created without automatic
 * negotiation so that the offer is only produced on request.
 */
class datachannel_factory : public backend_factory {
public:
    /**
     * @param io Event loop callbacks are delivered on
     * @param log_level libdatachannel log level ("none", "error", "warning",
     *                  "info", "debug", "verbose")
     */
    explicit datachannel_factory(boost::asio::io_context& io, std::string_view log_level = "error");

    [[nodiscard]] auto name() const -> std::string_view override { return "libdatachannel"; }

    [[nodiscard]] auto create_peer(const peer_config& config)
        -> result<std::unique_ptr<peer_backend>> override;

private:
    boost::asio::io_context& io_;
};

}  // namespace kcenon::peer_transfer

#endif  // KCENON_PEER_TRANSFER_TRANSPORT_DATACHANNEL_BACKEND_H
