/**
 * @file loopback_backend.cpp
 * @brief Implementation of the in-process loopback backend
 */

#include <kcenon/peer_transfer/transport/loopback_backend.h>

#include <kcenon/peer_transfer/core/logging.h>
#include <kcenon/peer_transfer/core/transfer_id.h>

#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

#include <deque>
#include <functional>
#include <optional>
#include <sstream>
#include <variant>

namespace kcenon::peer_transfer {

namespace {

using frame = std::variant<std::string, byte_buffer>;

constexpr std::string_view token_attribute = "a=x-loopback-token:";

auto frame_size(const frame& f) -> uint64_t {
    return std::visit([](const auto& payload) -> uint64_t { return payload.size(); }, f);
}

auto extract_token(const std::string& sdp) -> std::optional<std::string> {
    auto pos = sdp.find(token_attribute);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += token_attribute.size();
    auto end = sdp.find_first_of("\r\n", pos);
    auto token = sdp.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

auto make_sdp(const std::string& token, signal_kind kind, bool with_candidates) -> std::string {
    std::ostringstream oss;
    oss << "v=0\r\n"
        << "o=- " << std::hash<std::string>{}(token) % 1000000000ULL << " 2 IN IP4 127.0.0.1\r\n"
        << "s=-\r\n"
        << "t=0 0\r\n"
        << token_attribute << token << "\r\n"
        << "m=application 9 UDP/DTLS/SCTP webrtc-datachannel\r\n"
        << "c=IN IP4 0.0.0.0\r\n"
        << "a=setup:" << (kind == signal_kind::offer ? "actpass" : "active") << "\r\n"
        << "a=mid:0\r\n"
        << "a=sctp-port:5000\r\n";
    if (with_candidates) {
        oss << "a=candidate:1 1 UDP 2122260223 127.0.0.1 9 typ host\r\n"
            << "a=end-of-candidates\r\n";
    }
    return oss.str();
}

/**
 * @brief One end of a loopback data channel
 */
class loopback_channel : public data_channel,
                         public std::enable_shared_from_this<loopback_channel> {
public:
    loopback_channel(boost::asio::io_context& io, std::string label, loopback_options options)
        : io_(io), label_(std::move(label)), options_(options), drain_timer_(io) {}

    [[nodiscard]] auto label() const -> std::string override { return label_; }
    [[nodiscard]] auto state() const -> channel_state override { return state_; }
    [[nodiscard]] auto buffered_amount() const -> uint64_t override { return buffered_; }

    void set_buffered_amount_low_threshold(uint64_t threshold) override {
        low_threshold_ = threshold;
    }

    [[nodiscard]] auto buffered_amount_low_threshold() const -> uint64_t override {
        return low_threshold_;
    }

    [[nodiscard]] auto send_text(std::string_view text) -> result<void> override {
        return enqueue(std::string(text));
    }

    [[nodiscard]] auto send_binary(const byte_buffer& data) -> result<void> override {
        return enqueue(data);
    }

    void close() override {
        if (state_ == channel_state::closed) {
            return;
        }
        shutdown();
        if (auto remote = remote_.lock()) {
            remote->remote_closed();
        }
    }

    void link(const std::shared_ptr<loopback_channel>& remote) { remote_ = remote; }

    void open() {
        if (state_ != channel_state::connecting) {
            return;
        }
        state_ = channel_state::open;
        post_event([](loopback_channel& self) {
            auto handler = self.handlers_.on_open;
            if (handler) handler();
        });
    }

    void remote_closed() {
        if (state_ == channel_state::closed) {
            return;
        }
        shutdown();
    }

    void receive(frame f) {
        if (state_ != channel_state::open) {
            return;
        }
        if (auto* text = std::get_if<std::string>(&f)) {
            auto handler = handlers_.on_text;
            if (handler) handler(std::move(*text));
        } else {
            auto handler = handlers_.on_binary;
            if (handler) handler(std::get<byte_buffer>(std::move(f)));
        }
    }

private:
    auto enqueue(frame f) -> result<void> {
        if (state_ != channel_state::open) {
            return unexpected(error{error_code::channel_closed, "loopback channel is not open"});
        }
        buffered_ += frame_size(f);
        outbound_.push_back(std::move(f));
        schedule_drain();
        return {};
    }

    void shutdown() {
        state_ = channel_state::closed;
        outbound_.clear();
        buffered_ = 0;
        draining_ = false;
        drain_timer_.cancel();
        post_event([](loopback_channel& self) {
            auto handler = self.handlers_.on_closed;
            if (handler) handler();
        });
    }

    void schedule_drain() {
        if (draining_) {
            return;
        }
        draining_ = true;
        drain_timer_.expires_after(options_.drain_interval);
        drain_timer_.async_wait([weak = weak_from_this()](const boost::system::error_code& ec) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (auto self = weak.lock()) {
                self->drain_tick();
            }
        });
    }

    void drain_tick() {
        draining_ = false;
        if (state_ != channel_state::open) {
            return;
        }

        bool was_above = buffered_ > low_threshold_;
        auto remote = remote_.lock();
        uint64_t delivered = 0;

        // At least one frame per tick, however large
        while (!outbound_.empty()) {
            auto size = frame_size(outbound_.front());
            if (delivered > 0 && delivered + size > options_.drain_bytes_per_tick) {
                break;
            }
            frame f = std::move(outbound_.front());
            outbound_.pop_front();
            buffered_ -= size;
            delivered += size;
            if (remote) {
                remote->receive(std::move(f));
            }
            if (state_ != channel_state::open) {
                return;
            }
        }

        if (was_above && buffered_ <= low_threshold_) {
            auto handler = handlers_.on_buffered_amount_low;
            if (handler) handler();
        }

        if (!outbound_.empty()) {
            schedule_drain();
        }
    }

    template <typename Fn>
    void post_event(Fn fn) {
        boost::asio::post(io_, [weak = weak_from_this(), fn = std::move(fn)]() {
            if (auto self = weak.lock()) {
                fn(*self);
            }
        });
    }

    boost::asio::io_context& io_;
    std::string label_;
    loopback_options options_;
    boost::asio::steady_timer drain_timer_;
    channel_state state_ = channel_state::connecting;
    uint64_t buffered_ = 0;
    uint64_t low_threshold_ = 0;
    bool draining_ = false;
    std::deque<frame> outbound_;
    std::weak_ptr<loopback_channel> remote_;
};

}  // namespace

namespace detail {

/**
 * @brief Shared state of a loopback peer, kept alive by pending handlers
 */
class loopback_peer_core : public std::enable_shared_from_this<loopback_peer_core> {
public:
    loopback_peer_core(std::weak_ptr<loopback_hub> hub,
                       boost::asio::io_context& io,
                       loopback_options options,
                       std::string token)
        : hub_(std::move(hub)),
          io_(io),
          options_(options),
          token_(std::move(token)),
          gathering_timer_(io) {}

    peer_handlers* handlers = nullptr;

    [[nodiscard]] auto token() const -> const std::string& { return token_; }
    [[nodiscard]] auto state() const -> peer_state { return state_; }
    [[nodiscard]] auto gathering() const -> gathering_state { return gathering_; }
    [[nodiscard]] auto local_description() const -> std::optional<signal_descriptor> {
        return local_;
    }

    auto create_data_channel(const std::string& label) -> result<std::shared_ptr<data_channel>> {
        if (state_ == peer_state::closed) {
            return unexpected(error{error_code::invalid_state, "peer connection is closed"});
        }
        if (channel_ || local_ || remote_) {
            return unexpected(error{error_code::invalid_state,
                                    "data channel must be created before negotiation"});
        }
        channel_ = std::make_shared<loopback_channel>(io_, label, options_);
        return std::shared_ptr<data_channel>(channel_);
    }

    auto set_local_description(signal_kind kind) -> result<void> {
        if (state_ == peer_state::closed) {
            return unexpected(error{error_code::invalid_state, "peer connection is closed"});
        }
        if (local_) {
            return unexpected(error{error_code::invalid_state, "local description already set"});
        }
        if (kind == signal_kind::answer && (!remote_ || remote_->kind != signal_kind::offer)) {
            return unexpected(error{error_code::invalid_state, "answer requires a remote offer"});
        }
        if (kind == signal_kind::offer && remote_) {
            return unexpected(error{error_code::invalid_state, "offer after remote description"});
        }

        local_ = signal_descriptor{kind, make_sdp(token_, kind, false)};
        set_state(peer_state::connecting);
        start_gathering();
        return {};
    }

    auto set_remote_description(const signal_descriptor& descriptor) -> result<void> {
        if (state_ == peer_state::closed) {
            return unexpected(error{error_code::invalid_state, "peer connection is closed"});
        }

        auto token = extract_token(descriptor.sdp);
        if (!token) {
            return unexpected(error{error_code::backend_error,
                                    "session description is not a loopback description"});
        }

        auto hub = hub_.lock();
        if (!hub) {
            return unexpected(error{error_code::backend_error, "loopback hub is gone"});
        }

        auto partner = hub->find_peer(*token);
        if (!partner || partner.get() == this) {
            return unexpected(error{error_code::backend_error, "unknown loopback session"});
        }

        if (descriptor.kind == signal_kind::offer) {
            if (local_ || remote_) {
                return unexpected(error{error_code::invalid_state,
                                        "offer cannot be applied in this state"});
            }
            remote_ = descriptor;
            partner_ = partner;
            set_state(peer_state::connecting);
            return {};
        }

        if (!local_ || local_->kind != signal_kind::offer || remote_) {
            return unexpected(error{error_code::invalid_state,
                                    "answer requires a pending local offer"});
        }
        if (partner->partner_.lock().get() != this) {
            return unexpected(error{error_code::backend_error,
                                    "answer does not belong to this offer"});
        }

        remote_ = descriptor;
        partner_ = partner;
        boost::asio::post(io_, [weak = weak_from_this()]() {
            if (auto self = weak.lock()) {
                self->establish();
            }
        });
        return {};
    }

    void close() {
        if (state_ == peer_state::closed) {
            return;
        }
        handlers = nullptr;
        state_ = peer_state::closed;
        gathering_timer_.cancel();

        if (channel_) {
            channel_->close();
        }
        if (auto partner = partner_.lock()) {
            partner->partner_closed();
        }
        partner_.reset();

        if (auto hub = hub_.lock()) {
            hub->unregister_peer(token_);
        }
    }

private:
    void start_gathering() {
        gathering_ = gathering_state::in_progress;
        notify([](loopback_peer_core& self) {
            auto handler = self.handlers->on_gathering_state;
            if (handler) handler(gathering_state::in_progress);
        });

        auto hub = hub_.lock();
        if (!hub || !hub->gathering_enabled_) {
            PT_LOG_DEBUG(log_category::backend, "loopback gathering stalled for " + token_);
            return;
        }

        gathering_timer_.expires_after(options_.gathering_delay);
        gathering_timer_.async_wait(
            [weak = weak_from_this()](const boost::system::error_code& ec) {
                if (ec == boost::asio::error::operation_aborted) {
                    return;
                }
                if (auto self = weak.lock()) {
                    self->complete_gathering();
                }
            });
    }

    void complete_gathering() {
        if (state_ == peer_state::closed || !local_) {
            return;
        }
        local_->sdp = make_sdp(token_, local_->kind, true);
        gathering_ = gathering_state::complete;
        notify([](loopback_peer_core& self) {
            auto handler = self.handlers->on_gathering_state;
            if (handler) handler(gathering_state::complete);
        });
    }

    void establish() {
        if (state_ == peer_state::closed) {
            return;
        }
        auto partner = partner_.lock();
        if (!partner || partner->state_ == peer_state::closed) {
            set_ice(ice_state::failed);
            set_state(peer_state::failed);
            return;
        }

        set_ice(ice_state::checking);
        partner->set_ice(ice_state::checking);

        auto hub = hub_.lock();
        bool fail = hub && hub->fail_negotiation_;
        boost::asio::post(io_, [weak = weak_from_this(), fail]() {
            if (auto self = weak.lock()) {
                self->finish_establish(fail);
            }
        });
    }

    void finish_establish(bool fail) {
        if (state_ == peer_state::closed) {
            return;
        }
        auto partner = partner_.lock();
        if (!partner || partner->state_ == peer_state::closed) {
            set_ice(ice_state::failed);
            set_state(peer_state::failed);
            return;
        }

        if (fail) {
            PT_LOG_DEBUG(log_category::backend, "loopback negotiation failure injected");
            for (auto* peer : {this, partner.get()}) {
                peer->set_ice(ice_state::failed);
                peer->set_state(peer_state::failed);
            }
            return;
        }

        for (auto* peer : {this, partner.get()}) {
            peer->set_ice(ice_state::connected);
            peer->set_state(peer_state::connected);
        }

        if (!channel_) {
            return;
        }

        auto remote_channel = std::make_shared<loopback_channel>(io_, channel_->label(), options_);
        remote_channel->link(channel_);
        channel_->link(remote_channel);
        partner->adopt_channel(remote_channel);

        boost::asio::post(io_, [local = std::weak_ptr<loopback_channel>(channel_),
                                remote = std::weak_ptr<loopback_channel>(remote_channel)]() {
            if (auto ch = local.lock()) ch->open();
            if (auto ch = remote.lock()) ch->open();
        });
    }

    void adopt_channel(std::shared_ptr<loopback_channel> channel) {
        channel_ = std::move(channel);
        notify([channel = std::weak_ptr<loopback_channel>(channel_)](loopback_peer_core& self) {
            auto handler = self.handlers->on_data_channel;
            auto ch = channel.lock();
            if (handler && ch) handler(ch);
        });
    }

    void partner_closed() {
        if (state_ == peer_state::closed) {
            return;
        }
        partner_.reset();
        set_ice(ice_state::disconnected);
        set_state(peer_state::disconnected);
    }

    void set_state(peer_state state) {
        if (state_ == state) {
            return;
        }
        state_ = state;
        notify([state](loopback_peer_core& self) {
            auto handler = self.handlers->on_state;
            if (handler) handler(state);
        });
    }

    void set_ice(ice_state state) {
        if (ice_ == state) {
            return;
        }
        ice_ = state;
        notify([state](loopback_peer_core& self) {
            auto handler = self.handlers->on_ice_state;
            if (handler) handler(state);
        });
    }

    // Handlers run on a later turn of the loop, never after close()
    template <typename Fn>
    void notify(Fn fn) {
        boost::asio::post(io_, [weak = weak_from_this(), fn = std::move(fn)]() {
            auto self = weak.lock();
            if (self && self->handlers && self->state_ != peer_state::closed) {
                fn(*self);
            }
        });
    }

    std::weak_ptr<loopback_hub> hub_;
    boost::asio::io_context& io_;
    loopback_options options_;
    std::string token_;
    boost::asio::steady_timer gathering_timer_;

    peer_state state_ = peer_state::created;
    ice_state ice_ = ice_state::created;
    gathering_state gathering_ = gathering_state::created;
    std::optional<signal_descriptor> local_;
    std::optional<signal_descriptor> remote_;
    std::shared_ptr<loopback_channel> channel_;
    std::weak_ptr<loopback_peer_core> partner_;
};

}  // namespace detail

namespace {

/**
 * @brief peer_backend facade owning a loopback peer
 */
class loopback_peer : public peer_backend {
public:
    explicit loopback_peer(std::shared_ptr<detail::loopback_peer_core> core)
        : core_(std::move(core)) {
        core_->handlers = &handlers_;
    }

    ~loopback_peer() override { core_->close(); }

    [[nodiscard]] auto create_data_channel(const std::string& label)
        -> result<std::shared_ptr<data_channel>> override {
        return core_->create_data_channel(label);
    }

    [[nodiscard]] auto set_local_description(signal_kind kind) -> result<void> override {
        return core_->set_local_description(kind);
    }

    [[nodiscard]] auto set_remote_description(const signal_descriptor& descriptor)
        -> result<void> override {
        return core_->set_remote_description(descriptor);
    }

    [[nodiscard]] auto local_description() const -> std::optional<signal_descriptor> override {
        return core_->local_description();
    }

    [[nodiscard]] auto state() const -> peer_state override { return core_->state(); }

    [[nodiscard]] auto gathering() const -> gathering_state override {
        return core_->gathering();
    }

    void close() override { core_->close(); }

private:
    std::shared_ptr<detail::loopback_peer_core> core_;
};

}  // namespace

// loopback_hub implementation

loopback_hub::loopback_hub(boost::asio::io_context& io, loopback_options options)
    : io_(io), options_(options) {}

loopback_hub::~loopback_hub() = default;

auto loopback_hub::create_peer(const peer_config& config)
    -> result<std::unique_ptr<peer_backend>> {
    auto self = weak_from_this();
    if (self.expired()) {
        return unexpected(error{error_code::internal_error,
                                "loopback_hub must be owned by a std::shared_ptr"});
    }
    if (auto valid = config.validate(); !valid) {
        return unexpected(valid.error());
    }

    auto token = generate_transfer_id();
    auto core = std::make_shared<detail::loopback_peer_core>(self, io_, options_, token);
    register_peer(token, core);

    PT_LOG_DEBUG(log_category::backend, "created loopback peer " + token);
    return std::unique_ptr<peer_backend>(std::make_unique<loopback_peer>(std::move(core)));
}

auto loopback_hub::open_peers() const -> std::size_t {
    std::size_t count = 0;
    for (const auto& [token, peer] : peers_) {
        if (!peer.expired()) ++count;
    }
    return count;
}

void loopback_hub::register_peer(const std::string& token,
                                 std::weak_ptr<detail::loopback_peer_core> peer) {
    peers_[token] = std::move(peer);
}

void loopback_hub::unregister_peer(const std::string& token) {
    peers_.erase(token);
}

auto loopback_hub::find_peer(const std::string& token) const
    -> std::shared_ptr<detail::loopback_peer_core> {
    auto it = peers_.find(token);
    if (it == peers_.end()) {
        return nullptr;
    }
    return it->second.lock();
}

}  // namespace kcenon::peer_transfer
