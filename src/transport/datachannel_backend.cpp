/**
 * @file datachannel_backend.cpp
 * @brief libdatachannel implementation of the peer backend
 */

#include <kcenon/peer_transfer/transport/datachannel_backend.h>

#include <kcenon/peer_transfer/core/logging.h>

#include <rtc/rtc.hpp>

#include <boost/asio/post.hpp>

#include <exception>
#include <mutex>
#include <string>
#include <variant>

namespace kcenon::peer_transfer {

namespace {

auto to_rtc_log_level(std::string_view level) -> rtc::LogLevel {
    if (level == "none") return rtc::LogLevel::None;
    if (level == "warn" || level == "warning") return rtc::LogLevel::Warning;
    if (level == "info") return rtc::LogLevel::Info;
    if (level == "debug") return rtc::LogLevel::Debug;
    if (level == "trace" || level == "verbose") return rtc::LogLevel::Verbose;
    return rtc::LogLevel::Error;
}

auto to_peer_state(rtc::PeerConnection::State state) -> peer_state {
    switch (state) {
        case rtc::PeerConnection::State::New: return peer_state::created;
        case rtc::PeerConnection::State::Connecting: return peer_state::connecting;
        case rtc::PeerConnection::State::Connected: return peer_state::connected;
        case rtc::PeerConnection::State::Disconnected: return peer_state::disconnected;
        case rtc::PeerConnection::State::Failed: return peer_state::failed;
        case rtc::PeerConnection::State::Closed: return peer_state::closed;
    }
    return peer_state::failed;
}

auto to_ice_state(rtc::PeerConnection::IceState state) -> ice_state {
    switch (state) {
        case rtc::PeerConnection::IceState::New: return ice_state::created;
        case rtc::PeerConnection::IceState::Checking: return ice_state::checking;
        case rtc::PeerConnection::IceState::Connected: return ice_state::connected;
        case rtc::PeerConnection::IceState::Completed: return ice_state::completed;
        case rtc::PeerConnection::IceState::Failed: return ice_state::failed;
        case rtc::PeerConnection::IceState::Disconnected: return ice_state::disconnected;
        case rtc::PeerConnection::IceState::Closed: return ice_state::closed;
    }
    return ice_state::failed;
}

auto to_gathering_state(rtc::PeerConnection::GatheringState state) -> gathering_state {
    switch (state) {
        case rtc::PeerConnection::GatheringState::New: return gathering_state::created;
        case rtc::PeerConnection::GatheringState::InProgress: return gathering_state::in_progress;
        case rtc::PeerConnection::GatheringState::Complete: return gathering_state::complete;
    }
    return gathering_state::created;
}

auto to_description_type(signal_kind kind) -> rtc::Description::Type {
    return kind == signal_kind::offer ? rtc::Description::Type::Offer
                                      : rtc::Description::Type::Answer;
}

// "turn:host:port" with credentials becomes "turn:user:pass@host:port"
auto to_server_url(const ice_server& server) -> std::string {
    if (server.username.empty()) {
        return server.url;
    }
    auto colon = server.url.find(':');
    if (colon == std::string::npos) {
        return server.url;
    }
    return server.url.substr(0, colon + 1) + server.username + ":" + server.credential + "@"
           + server.url.substr(colon + 1);
}

auto backend_failure(const std::string& what, const std::exception& e) -> error {
    return error{error_code::backend_error, what + ": " + e.what()};
}

/**
 * @brief data_channel over rtc::DataChannel
 */
class rtc_channel : public data_channel, public std::enable_shared_from_this<rtc_channel> {
public:
    rtc_channel(boost::asio::io_context& io, std::shared_ptr<rtc::DataChannel> channel)
        : io_(io), channel_(std::move(channel)) {}

    ~rtc_channel() override {
        channel_->resetCallbacks();
    }

    void bind() {
        auto& io = io_;
        std::weak_ptr<rtc_channel> weak = weak_from_this();
        auto dispatch = [&io, weak](auto fn) {
            boost::asio::post(io, [weak, fn = std::move(fn)]() mutable {
                if (auto self = weak.lock()) {
                    fn(*self);
                }
            });
        };

        channel_->onOpen([dispatch]() {
            dispatch([](rtc_channel& self) {
                if (self.handlers_.on_open) self.handlers_.on_open();
            });
        });
        channel_->onClosed([dispatch]() {
            dispatch([](rtc_channel& self) {
                if (self.handlers_.on_closed) self.handlers_.on_closed();
            });
        });
        channel_->onError([dispatch](std::string message) {
            dispatch([message = std::move(message)](rtc_channel& self) {
                if (self.handlers_.on_error) self.handlers_.on_error(message);
            });
        });
        channel_->onBufferedAmountLow([dispatch]() {
            dispatch([](rtc_channel& self) {
                if (self.handlers_.on_buffered_amount_low) self.handlers_.on_buffered_amount_low();
            });
        });
        channel_->onMessage([dispatch](rtc::message_variant message) {
            if (auto* binary = std::get_if<rtc::binary>(&message)) {
                dispatch([data = std::move(*binary)](rtc_channel& self) mutable {
                    if (self.handlers_.on_binary) self.handlers_.on_binary(std::move(data));
                });
            } else if (auto* text = std::get_if<std::string>(&message)) {
                dispatch([data = std::move(*text)](rtc_channel& self) mutable {
                    if (self.handlers_.on_text) self.handlers_.on_text(std::move(data));
                });
            }
        });
    }

    [[nodiscard]] auto label() const -> std::string override { return channel_->label(); }

    [[nodiscard]] auto state() const -> channel_state override {
        if (channel_->isOpen()) {
            return closing_ ? channel_state::closing : channel_state::open;
        }
        if (channel_->isClosed()) {
            return channel_state::closed;
        }
        return closing_ ? channel_state::closing : channel_state::connecting;
    }

    [[nodiscard]] auto buffered_amount() const -> uint64_t override {
        return channel_->bufferedAmount();
    }

    void set_buffered_amount_low_threshold(uint64_t threshold) override {
        threshold_ = threshold;
        channel_->setBufferedAmountLowThreshold(static_cast<std::size_t>(threshold));
    }

    [[nodiscard]] auto buffered_amount_low_threshold() const -> uint64_t override {
        return threshold_;
    }

    [[nodiscard]] auto send_text(std::string_view text) -> result<void> override {
        try {
            if (!channel_->send(std::string(text))) {
                return unexpected(error{error_code::backend_error, "text frame was not sent"});
            }
        } catch (const std::exception& e) {
            return unexpected(backend_failure("send failed", e));
        }
        return {};
    }

    [[nodiscard]] auto send_binary(const byte_buffer& data) -> result<void> override {
        try {
            if (!channel_->send(data.data(), data.size())) {
                return unexpected(error{error_code::backend_error, "binary frame was not sent"});
            }
        } catch (const std::exception& e) {
            return unexpected(backend_failure("send failed", e));
        }
        return {};
    }

    void close() override {
        if (closing_) {
            return;
        }
        closing_ = true;
        try {
            channel_->close();
        } catch (const std::exception& e) {
            PT_LOG_WARN(log_category::backend, std::string("channel close failed: ") + e.what());
        }
    }

private:
    boost::asio::io_context& io_;
    std::shared_ptr<rtc::DataChannel> channel_;
    uint64_t threshold_ = 0;
    bool closing_ = false;
};

/**
 * @brief peer_backend over rtc::PeerConnection
 */
class rtc_peer : public peer_backend {
public:
    rtc_peer(boost::asio::io_context& io, std::shared_ptr<rtc::PeerConnection> connection)
        : io_(io), connection_(std::move(connection)), alive_(std::make_shared<bool>(true)) {}

    ~rtc_peer() override {
        close();
    }

    void bind() {
        auto& io = io_;
        std::weak_ptr<bool> alive = alive_;
        auto* peer = this;
        auto dispatch = [&io, alive, peer](auto fn) {
            boost::asio::post(io, [alive, peer, fn = std::move(fn)]() mutable {
                if (alive.lock()) {
                    fn(*peer);
                }
            });
        };

        connection_->onStateChange([dispatch](rtc::PeerConnection::State state) {
            dispatch([state](rtc_peer& self) {
                if (self.handlers_.on_state) self.handlers_.on_state(to_peer_state(state));
            });
        });
        connection_->onIceStateChange([dispatch](rtc::PeerConnection::IceState state) {
            dispatch([state](rtc_peer& self) {
                if (self.handlers_.on_ice_state) self.handlers_.on_ice_state(to_ice_state(state));
            });
        });
        connection_->onGatheringStateChange([dispatch](rtc::PeerConnection::GatheringState state) {
            dispatch([state](rtc_peer& self) {
                if (self.handlers_.on_gathering_state) {
                    self.handlers_.on_gathering_state(to_gathering_state(state));
                }
            });
        });
        connection_->onDataChannel([&io, dispatch](std::shared_ptr<rtc::DataChannel> incoming) {
            auto channel = std::make_shared<rtc_channel>(io, std::move(incoming));
            channel->bind();
            dispatch([channel](rtc_peer& self) {
                if (self.handlers_.on_data_channel) {
                    self.handlers_.on_data_channel(channel);
                } else {
                    channel->close();
                }
            });
        });
    }

    [[nodiscard]] auto create_data_channel(const std::string& label)
        -> result<std::shared_ptr<data_channel>> override {
        try {
            rtc::DataChannelInit init;
            auto channel = std::make_shared<rtc_channel>(io_, connection_->createDataChannel(label, init));
            channel->bind();
            return std::shared_ptr<data_channel>(std::move(channel));
        } catch (const std::exception& e) {
            return unexpected(backend_failure("cannot create data channel", e));
        }
    }

    [[nodiscard]] auto set_local_description(signal_kind kind) -> result<void> override {
        try {
            connection_->setLocalDescription(to_description_type(kind));
        } catch (const std::exception& e) {
            return unexpected(backend_failure("cannot create local description", e));
        }
        return {};
    }

    [[nodiscard]] auto set_remote_description(const signal_descriptor& descriptor)
        -> result<void> override {
        try {
            connection_->setRemoteDescription(
                rtc::Description(descriptor.sdp, to_description_type(descriptor.kind)));
        } catch (const std::exception& e) {
            return unexpected(error{error_code::negotiation_failed,
                                    std::string("remote description rejected: ") + e.what()});
        }
        return {};
    }

    [[nodiscard]] auto local_description() const -> std::optional<signal_descriptor> override {
        auto description = connection_->localDescription();
        if (!description) {
            return std::nullopt;
        }
        signal_descriptor descriptor;
        descriptor.kind = description->type() == rtc::Description::Type::Answer
                              ? signal_kind::answer
                              : signal_kind::offer;
        descriptor.sdp = std::string(*description);
        return descriptor;
    }

    [[nodiscard]] auto state() const -> peer_state override {
        return to_peer_state(connection_->state());
    }

    [[nodiscard]] auto gathering() const -> gathering_state override {
        return to_gathering_state(connection_->gatheringState());
    }

    void close() override {
        if (!alive_) {
            return;
        }
        alive_.reset();
        connection_->resetCallbacks();
        try {
            connection_->close();
        } catch (const std::exception& e) {
            PT_LOG_WARN(log_category::backend, std::string("peer close failed: ") + e.what());
        }
    }

private:
    boost::asio::io_context& io_;
    std::shared_ptr<rtc::PeerConnection> connection_;
    std::shared_ptr<bool> alive_;
};

}  // namespace

datachannel_factory::datachannel_factory(boost::asio::io_context& io, std::string_view log_level)
    : io_(io) {
    static std::once_flag init_once;
    std::call_once(init_once, [level = to_rtc_log_level(log_level)]() { rtc::InitLogger(level); });
}

auto datachannel_factory::create_peer(const peer_config& config)
    -> result<std::unique_ptr<peer_backend>> {
    rtc::Configuration rtc_config;
    rtc_config.disableAutoNegotiation = true;
    for (const auto& server : config.effective_ice_servers()) {
        rtc_config.iceServers.emplace_back(to_server_url(server));
    }

    try {
        auto peer = std::make_unique<rtc_peer>(io_, std::make_shared<rtc::PeerConnection>(rtc_config));
        peer->bind();
        PT_LOG_DEBUG(log_category::backend,
                     "peer connection created with " + std::to_string(rtc_config.iceServers.size())
                         + " ICE server(s)");
        return std::unique_ptr<peer_backend>(std::move(peer));
    } catch (const std::exception& e) {
        return unexpected(backend_failure("cannot create peer connection", e));
    }
}

}  // namespace kcenon::peer_transfer
